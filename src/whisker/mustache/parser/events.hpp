#pragma once

#include <cstdint>
#include <string_view>

#include "whisker/callback.hpp"
#include "whisker/whisker.h"
#include "whisker/mustache/ast.hpp"
#include "whisker/mustache/delimiters.hpp"

namespace whisker::mustache::events {

struct parsing_done;
struct parsing_error;

}  // namespace whisker::mustache::events

namespace whisker::mustache::event {

struct parse {
  std::string_view template_text = {};
  // nullptr selects the default `{{ }}` pair.
  const whisker::mustache::delimiters * delimiters = nullptr;
  whisker::mustache::program * program_out = nullptr;
  int32_t * error_out = nullptr;
  whisker_error_detail * error_detail_out = nullptr;
  ::whisker::callback<bool(const ::whisker::mustache::events::parsing_done &)>
      dispatch_done = {};
  ::whisker::callback<bool(const ::whisker::mustache::events::parsing_error &)>
      dispatch_error = {};
};

}  // namespace whisker::mustache::event

namespace whisker::mustache::events {

struct parsing_done {
  const event::parse * request = nullptr;
  size_t node_count = 0;
};

struct parsing_error {
  const event::parse * request = nullptr;
  int32_t err = 0;
  uint32_t domain = WHISKER_ERROR_DOMAIN_NONE;
  uint32_t reason = WHISKER_REASON_NONE;
  size_t error_pos = 0;
};

}  // namespace whisker::mustache::events
