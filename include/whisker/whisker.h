#ifndef WHISKER_WHISKER_H
#define WHISKER_WHISKER_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

typedef enum whisker_status {
  WHISKER_OK = 0,
  WHISKER_ERR_INVALID_ARGUMENT = 1,
  WHISKER_ERR_PARSE_FAILED = 2,
  WHISKER_ERR_LAMBDA_FAILED = 3,
  WHISKER_ERR_CAPACITY = 4,
  WHISKER_ERR_DEPTH_EXCEEDED = 5,
  WHISKER_ERR_BACKEND = 6
} whisker_status;

// Error detail domains for machine-level diagnostics.
#define WHISKER_ERROR_DOMAIN_NONE 0u
#define WHISKER_ERROR_DOMAIN_LEXER 1u
#define WHISKER_ERROR_DOMAIN_PARSER 2u
#define WHISKER_ERROR_DOMAIN_RENDERER 3u

typedef enum whisker_error_reason {
  WHISKER_REASON_NONE = 0,
  WHISKER_REASON_UNCLOSED_TAG = 1,
  WHISKER_REASON_UNCLOSED_TRIPLE = 2,
  WHISKER_REASON_BAD_DELIMITERS = 3,
  WHISKER_REASON_UNMATCHED_SECTION_END = 4,
  WHISKER_REASON_SECTION_MISMATCH = 5,
  WHISKER_REASON_UNCLOSED_SECTION = 6,
  WHISKER_REASON_LAMBDA_FAILED = 7,
  WHISKER_REASON_DEPTH_EXCEEDED = 8,
  WHISKER_REASON_CAPACITY = 9,
  WHISKER_REASON_INVALID_REQUEST = 10
} whisker_error_reason;

typedef struct whisker_error_detail {
  int32_t status;
  uint32_t domain;
  uint32_t reason;
  size_t pos;
} whisker_error_detail;

const char * whisker_status_name(whisker_status status);
const char * whisker_reason_name(whisker_error_reason reason);

#ifdef __cplusplus
}
#endif

#endif  // WHISKER_WHISKER_H
