#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "whisker/whisker.h"
#include "whisker/mustache/ast.hpp"
#include "whisker/mustache/lexer.hpp"

namespace whisker::mustache::parser::detail {

struct standalone_info {
  bool standalone = false;
  std::string_view indent = {};
  size_t remove_to = 0;
};

inline bool is_blank(const std::string_view s) noexcept {
  for (const char c : s) {
    if (c != ' ' && c != '\t' && c != '\r') {
      return false;
    }
  }
  return true;
}

/**
 * A tag is standalone when everything else on its source line is blank.
 * `remove_to` is the end of the elided region: past the line's newline when
 * there is one, otherwise the end of the source.
 */
inline standalone_info detect_standalone(const std::string_view source,
                                         const token & tok) noexcept {
  size_t line_start = tok.start;
  while (line_start > 0 && source[line_start - 1] != '\n') {
    --line_start;
  }
  const std::string_view indent = source.substr(line_start, tok.start - line_start);
  if (!is_blank(indent)) {
    return {};
  }

  size_t line_end = tok.end;
  while (line_end < source.size() && source[line_end] != '\n') {
    ++line_end;
  }
  if (!is_blank(source.substr(tok.end, line_end - tok.end))) {
    return {};
  }

  standalone_info info;
  info.standalone = true;
  info.indent = indent;
  info.remove_to = line_end < source.size() ? line_end + 1 : line_end;
  return info;
}

class template_parser {
 public:
  explicit template_parser(whisker::mustache::program & out_program)
      : program_(out_program) {}

  bool parse(const whisker::mustache::lexer_result & lexer_res) {
    source_ = lexer_res.source;
    stack_.clear();
    skip_until_ = 0;
    error_ = WHISKER_OK;
    error_reason_ = WHISKER_REASON_NONE;
    error_pos_ = 0;
    program_.reset();

    for (const auto & tok : lexer_res.tokens) {
      if (!ok()) {
        break;
      }
      consume(tok);
    }

    if (ok() && !stack_.empty()) {
      set_error(WHISKER_REASON_UNCLOSED_SECTION, stack_.back().node->pos);
    }

    if (!ok()) {
      stack_.clear();
      program_.reset();
      program_.last_error = error_;
      program_.last_error_domain = WHISKER_ERROR_DOMAIN_PARSER;
      program_.last_error_reason = error_reason_;
      program_.last_error_pos = error_pos_;
      return false;
    }
    return true;
  }

  int32_t error() const noexcept { return error_; }
  uint32_t error_reason() const noexcept { return error_reason_; }
  size_t error_pos() const noexcept { return error_pos_; }

 private:
  struct open_section {
    std::unique_ptr<whisker::mustache::section_node> node;
    size_t content_start = 0;
  };

  bool ok() const noexcept { return error_ == WHISKER_OK; }

  void set_error(const uint32_t reason, const size_t pos) noexcept {
    if (error_ != WHISKER_OK) {
      return;
    }
    error_ = WHISKER_ERR_PARSE_FAILED;
    error_reason_ = reason;
    error_pos_ = pos;
  }

  whisker::mustache::ast_list & current_list() noexcept {
    return stack_.empty() ? program_.body : stack_.back().node->children;
  }

  void append(whisker::mustache::ast_ptr node) {
    current_list().push_back(std::move(node));
  }

  // Drops the blank prefix of a standalone tag's line from the text before it.
  void truncate_line_prefix() {
    auto & list = current_list();
    if (list.empty()) {
      return;
    }
    const auto * last = dynamic_cast<const whisker::mustache::text_node *>(list.back().get());
    if (last == nullptr) {
      return;
    }
    const size_t newline = last->text.rfind('\n');
    if (newline == std::string::npos) {
      list.pop_back();
      return;
    }
    if (newline + 1 == last->text.size()) {
      return;
    }
    auto trimmed = std::make_unique<whisker::mustache::text_node>(last->text.substr(0, newline + 1));
    trimmed->pos = last->pos;
    list.back() = std::move(trimmed);
  }

  void consume_text(const whisker::mustache::token & tok) {
    size_t start = tok.start;
    if (skip_until_ > start) {
      if (tok.end <= skip_until_) {
        return;
      }
      start = skip_until_;
    }
    auto node = std::make_unique<whisker::mustache::text_node>(
      tok.value.substr(start - tok.start));
    node->pos = start;
    append(std::move(node));
  }

  void consume(const whisker::mustache::token & tok) {
    using whisker::mustache::token_type;

    switch (tok.type) {
      case token_type::text:
        consume_text(tok);
        return;
      case token_type::variable:
      case token_type::unescaped_variable: {
        auto node = std::make_unique<whisker::mustache::variable_node>(
          tok.value, tok.type == token_type::variable);
        node->pos = tok.start;
        append(std::move(node));
        return;
      }
      case token_type::section_start:
      case token_type::inverted_section_start:
      case token_type::section_end:
      case token_type::partial:
      case token_type::comment:
      case token_type::set_delimiters:
        break;
    }

    const standalone_info info = detect_standalone(source_, tok);
    if (info.standalone) {
      truncate_line_prefix();
      skip_until_ = info.remove_to;
    }

    switch (tok.type) {
      case token_type::partial: {
        auto node = std::make_unique<whisker::mustache::partial_node>(
          tok.value, info.standalone ? std::string(info.indent) : std::string());
        node->pos = tok.start;
        append(std::move(node));
        break;
      }
      case token_type::section_start:
      case token_type::inverted_section_start: {
        auto node = std::make_unique<whisker::mustache::section_node>(
          tok.value, tok.type == token_type::inverted_section_start, tok.delims);
        node->pos = tok.start;
        stack_.push_back(open_section{std::move(node), tok.end});
        break;
      }
      case token_type::section_end: {
        if (stack_.empty()) {
          set_error(WHISKER_REASON_UNMATCHED_SECTION_END, tok.start);
          return;
        }
        if (stack_.back().node->name != tok.value) {
          set_error(WHISKER_REASON_SECTION_MISMATCH, tok.start);
          return;
        }
        open_section frame = std::move(stack_.back());
        stack_.pop_back();
        frame.node->raw = std::string(
          source_.substr(frame.content_start, tok.start - frame.content_start));
        append(std::move(frame.node));
        break;
      }
      case token_type::comment:
      case token_type::set_delimiters:
      case token_type::text:
      case token_type::variable:
      case token_type::unescaped_variable:
        break;
    }
  }

  whisker::mustache::program & program_;
  std::string_view source_ = {};
  std::vector<open_section> stack_;
  size_t skip_until_ = 0;
  int32_t error_ = WHISKER_OK;
  uint32_t error_reason_ = WHISKER_REASON_NONE;
  size_t error_pos_ = 0;
};

}  // namespace whisker::mustache::parser::detail
