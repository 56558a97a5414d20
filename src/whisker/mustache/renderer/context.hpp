#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "whisker/whisker.h"
#include "whisker/mustache/ast.hpp"
#include "whisker/mustache/delimiters.hpp"
#include "whisker/mustache/partials.hpp"
#include "whisker/mustache/scope.hpp"
#include "whisker/mustache/value.hpp"

namespace whisker::mustache::event {
struct render;
}  // namespace whisker::mustache::event

namespace whisker::mustache::renderer::action {

inline constexpr size_t k_default_max_depth = 64;

struct writer_state {
  std::string * text = nullptr;
  char * data = nullptr;
  size_t capacity = 0;
  size_t length = 0;
};

struct context {
  int32_t phase_error = WHISKER_OK;
  int32_t last_error = WHISKER_OK;
  uint32_t error_domain = WHISKER_ERROR_DOMAIN_NONE;
  uint32_t error_reason = WHISKER_REASON_NONE;
  size_t error_pos = 0;
  const whisker::mustache::event::render * request = nullptr;
  const whisker::mustache::ast_list * nodes = nullptr;
  size_t node_index = 0;
  whisker::mustache::partial_resolver partials = {};
  whisker::mustache::delimiters partial_delims = {};
  size_t max_depth = k_default_max_depth;
  size_t depth = 0;
  whisker::mustache::scope_frame root_frame = {};
  whisker::mustache::scope_chain root_scope = {};
  writer_state out = {};
};

}  // namespace whisker::mustache::renderer::action
