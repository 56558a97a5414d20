#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "whisker/callback.hpp"
#include "whisker/whisker.h"
#include "whisker/mustache/ast.hpp"
#include "whisker/mustache/delimiters.hpp"
#include "whisker/mustache/partials.hpp"
#include "whisker/mustache/value.hpp"

namespace whisker::mustache::events {

struct rendering_done;
struct rendering_error;

}  // namespace whisker::mustache::events

namespace whisker::mustache::event {

/**
 * Render request. Output goes to `output_text` when set, otherwise into the
 * fixed `output` buffer, which fails with `WHISKER_ERR_CAPACITY` once full.
 * `data` becomes the only frame of the initial scope chain.
 */
struct render {
  const whisker::mustache::program * program = nullptr;
  const whisker::mustache::value * data = nullptr;
  whisker::mustache::partial_resolver partials = {};
  // Pair used to parse partial bodies; nullptr selects `{{ }}`.
  const whisker::mustache::delimiters * delimiters = nullptr;
  // Nested partial/lambda render limit; 0 selects the default.
  size_t max_depth = 0;
  std::string * output_text = nullptr;
  char * output = nullptr;
  size_t output_capacity = 0;
  size_t * output_length = nullptr;
  bool * output_truncated = nullptr;
  int32_t * error_out = nullptr;
  size_t * error_pos_out = nullptr;
  whisker_error_detail * error_detail_out = nullptr;
  ::whisker::callback<bool(const ::whisker::mustache::events::rendering_done &)> dispatch_done = {};
  ::whisker::callback<bool(const ::whisker::mustache::events::rendering_error &)> dispatch_error = {};
};

}  // namespace whisker::mustache::event

namespace whisker::mustache::events {

struct rendering_done {
  const event::render * request = nullptr;
  size_t output_length = 0;
};

struct rendering_error {
  const event::render * request = nullptr;
  int32_t err = 0;
  uint32_t domain = WHISKER_ERROR_DOMAIN_NONE;
  uint32_t reason = WHISKER_REASON_NONE;
  size_t error_pos = 0;
};

}  // namespace whisker::mustache::events
