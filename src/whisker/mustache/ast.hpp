#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "whisker/whisker.h"
#include "whisker/mustache/delimiters.hpp"

namespace whisker::mustache {

struct ast_node {
  size_t pos = 0;
  virtual ~ast_node() = default;
};

using ast_ptr = std::unique_ptr<ast_node>;
using ast_list = std::vector<ast_ptr>;

struct text_node : ast_node {
  std::string text;
  explicit text_node(std::string value) : text(std::move(value)) {}
};

struct variable_node : ast_node {
  std::string name;
  bool escaped = true;
  variable_node(std::string name_in, bool escape)
      : name(std::move(name_in)), escaped(escape) {}
};

/**
 * `{{#name}}...{{/name}}` or `{{^name}}...{{/name}}`.
 *
 * `raw` is the untouched source between the opening and closing tags and
 * `delims` the pair in effect at the opening tag; section lambdas receive
 * the former and have their output parsed with the latter.
 */
struct section_node : ast_node {
  std::string name;
  bool inverted = false;
  ast_list children;
  std::string raw;
  delimiters delims;
  section_node(std::string name_in, bool is_inverted, delimiters delims_in)
      : name(std::move(name_in)),
        inverted(is_inverted),
        delims(std::move(delims_in)) {}
};

// `indent` is only set when the partial tag stood alone on its line.
struct partial_node : ast_node {
  std::string name;
  std::string indent;
  partial_node(std::string name_in, std::string indent_in)
      : name(std::move(name_in)), indent(std::move(indent_in)) {}
};

struct program {
  ast_list body;
  int32_t last_error = WHISKER_OK;
  uint32_t last_error_domain = WHISKER_ERROR_DOMAIN_NONE;
  uint32_t last_error_reason = WHISKER_REASON_NONE;
  size_t last_error_pos = 0;

  void reset() noexcept {
    body.clear();
    last_error = WHISKER_OK;
    last_error_domain = WHISKER_ERROR_DOMAIN_NONE;
    last_error_reason = WHISKER_REASON_NONE;
    last_error_pos = 0;
  }
};

}  // namespace whisker::mustache
