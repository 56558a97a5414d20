#include "whisker/whisker.h"

extern "C" {

const char * whisker_status_name(const whisker_status status) {
  switch (status) {
    case WHISKER_OK:
      return "ok";
    case WHISKER_ERR_INVALID_ARGUMENT:
      return "invalid_argument";
    case WHISKER_ERR_PARSE_FAILED:
      return "parse_failed";
    case WHISKER_ERR_LAMBDA_FAILED:
      return "lambda_failed";
    case WHISKER_ERR_CAPACITY:
      return "capacity";
    case WHISKER_ERR_DEPTH_EXCEEDED:
      return "depth_exceeded";
    case WHISKER_ERR_BACKEND:
      return "backend";
  }
  return "unknown";
}

const char * whisker_reason_name(const whisker_error_reason reason) {
  switch (reason) {
    case WHISKER_REASON_NONE:
      return "none";
    case WHISKER_REASON_UNCLOSED_TAG:
      return "unclosed_tag";
    case WHISKER_REASON_UNCLOSED_TRIPLE:
      return "unclosed_triple";
    case WHISKER_REASON_BAD_DELIMITERS:
      return "bad_delimiters";
    case WHISKER_REASON_UNMATCHED_SECTION_END:
      return "unmatched_section_end";
    case WHISKER_REASON_SECTION_MISMATCH:
      return "section_mismatch";
    case WHISKER_REASON_UNCLOSED_SECTION:
      return "unclosed_section";
    case WHISKER_REASON_LAMBDA_FAILED:
      return "lambda_failed";
    case WHISKER_REASON_DEPTH_EXCEEDED:
      return "depth_exceeded";
    case WHISKER_REASON_CAPACITY:
      return "capacity";
    case WHISKER_REASON_INVALID_REQUEST:
      return "invalid_request";
  }
  return "unknown";
}

}  // extern "C"
