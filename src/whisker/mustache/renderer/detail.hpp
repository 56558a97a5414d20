#pragma once

#include <array>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <string_view>
#include <system_error>

#include "whisker/whisker.h"
#include "whisker/mustache/ast.hpp"
#include "whisker/mustache/lexer.hpp"
#include "whisker/mustache/parser/detail.hpp"
#include "whisker/mustache/renderer/context.hpp"
#include "whisker/mustache/scope.hpp"
#include "whisker/mustache/value.hpp"

namespace whisker::mustache::renderer::detail {

inline void set_error(action::context & ctx,
                      const int32_t err,
                      const uint32_t domain,
                      const uint32_t reason,
                      const size_t pos) noexcept {
  if (ctx.phase_error == WHISKER_OK) {
    ctx.phase_error = err;
    ctx.last_error = err;
    ctx.error_domain = domain;
    ctx.error_reason = reason;
    ctx.error_pos = pos;
  }
}

inline void clear_error(action::context & ctx) noexcept {
  ctx.phase_error = WHISKER_OK;
  ctx.last_error = WHISKER_OK;
  ctx.error_domain = WHISKER_ERROR_DOMAIN_NONE;
  ctx.error_reason = WHISKER_REASON_NONE;
  ctx.error_pos = 0;
}

inline action::writer_state make_capture(std::string & sink) noexcept {
  action::writer_state w;
  w.text = &sink;
  return w;
}

inline bool write_text(action::context & ctx,
                       action::writer_state & w,
                       const std::string_view text) noexcept {
  if (text.empty()) {
    return true;
  }
  if (w.text != nullptr) {
    w.text->append(text);
    w.length += text.size();
    return true;
  }
  if (w.length + text.size() > w.capacity) {
    set_error(ctx, WHISKER_ERR_CAPACITY, WHISKER_ERROR_DOMAIN_RENDERER,
              WHISKER_REASON_CAPACITY, 0);
    const size_t avail = w.capacity - w.length;
    if (avail > 0) {
      std::memcpy(w.data + w.length, text.data(), avail);
      w.length += avail;
    }
    return false;
  }
  std::memcpy(w.data + w.length, text.data(), text.size());
  w.length += text.size();
  return true;
}

inline std::string_view html_entity(const char c) noexcept {
  switch (c) {
    case '&':
      return "&amp;";
    case '<':
      return "&lt;";
    case '>':
      return "&gt;";
    case '"':
      return "&quot;";
    default:
      return {};
  }
}

inline bool write_escaped(action::context & ctx,
                          action::writer_state & w,
                          const std::string_view text) noexcept {
  size_t run = 0;
  for (size_t i = 0; i < text.size(); ++i) {
    const std::string_view entity = html_entity(text[i]);
    if (entity.empty()) {
      continue;
    }
    if (!write_text(ctx, w, text.substr(run, i - run)) || !write_text(ctx, w, entity)) {
      return false;
    }
    run = i + 1;
  }
  return write_text(ctx, w, text.substr(run));
}

// Containers and callables have no text form. Floats use the shortest text
// that reads back to the same double.
inline std::string_view value_to_string(const value & v, std::array<char, 64> & buffer) noexcept {
  int written = 0;
  switch (v.type) {
    case value_type::string:
      return v.string_v.view;
    case value_type::boolean:
      return v.bool_v ? "true" : "false";
    case value_type::integer:
      written = std::snprintf(buffer.data(), buffer.size(), "%lld",
                              static_cast<long long>(v.int_v));
      break;
    case value_type::floating: {
      const auto res = std::to_chars(buffer.data(), buffer.data() + buffer.size(), v.float_v);
      if (res.ec != std::errc{}) {
        return {};
      }
      written = static_cast<int>(res.ptr - buffer.data());
      break;
    }
    case value_type::undefined:
    case value_type::none:
    case value_type::array:
    case value_type::object:
    case value_type::lambda:
      written = 0;
      break;
  }
  if (written <= 0) {
    return {};
  }
  return std::string_view(buffer.data(), static_cast<size_t>(written));
}

/**
 * Prefixes every line of a partial body with `indent`. A trailing newline
 * ends the last line; it does not start an extra indented one.
 */
inline std::string indent_lines(const std::string_view text, const std::string_view indent) {
  if (indent.empty() || text.empty()) {
    return std::string(text);
  }
  std::string out;
  out.reserve(text.size() + indent.size() * 4);
  size_t line_start = 0;
  while (line_start < text.size()) {
    const size_t newline = text.find('\n', line_start);
    out.append(indent);
    if (newline == std::string_view::npos) {
      out.append(text.substr(line_start));
      break;
    }
    out.append(text.substr(line_start, newline - line_start + 1));
    line_start = newline + 1;
  }
  return out;
}

inline bool render_nodes(action::context & ctx,
                         const ast_list & nodes,
                         const scope_chain & scope,
                         action::writer_state & w) noexcept;

/**
 * Parses `text` with `delims` and renders it against `scope`. Used for
 * partial bodies and lambda output; each call owns the tree it builds.
 */
inline bool render_template_text(action::context & ctx,
                                 const std::string_view text,
                                 const delimiters & delims,
                                 const scope_chain & scope,
                                 action::writer_state & w,
                                 const size_t pos) noexcept {
  if (ctx.depth >= ctx.max_depth) {
    set_error(ctx, WHISKER_ERR_DEPTH_EXCEEDED, WHISKER_ERROR_DOMAIN_RENDERER,
              WHISKER_REASON_DEPTH_EXCEEDED, pos);
    return false;
  }

  lexer lex;
  const lexer_result lex_res = lex.tokenize(text, delims);
  if (lex_res.error != WHISKER_OK) {
    set_error(ctx, lex_res.error, WHISKER_ERROR_DOMAIN_LEXER, lex_res.error_reason,
              lex_res.error_pos);
    return false;
  }

  program nested{};
  parser::detail::template_parser parser{nested};
  if (!parser.parse(lex_res)) {
    set_error(ctx, parser.error(), WHISKER_ERROR_DOMAIN_PARSER, parser.error_reason(),
              parser.error_pos());
    return false;
  }

  ctx.depth += 1;
  const bool ok = render_nodes(ctx, nested.body, scope, w);
  ctx.depth -= 1;
  return ok;
}

/**
 * Render callback handed to two-argument section lambdas. Failures inside
 * the nested render are discarded and yield empty text.
 */
struct section_render_closure {
  action::context * ctx = nullptr;
  const scope_chain * scope = nullptr;
  const delimiters * delims = nullptr;
  size_t pos = 0;

  bool render(std::string_view text, std::string & out) noexcept {
    out.clear();
    action::writer_state capture = make_capture(out);
    if (!render_template_text(*ctx, text, *delims, *scope, capture, pos)) {
      clear_error(*ctx);
      out.clear();
    }
    return true;
  }
};

inline bool render_variable(action::context & ctx,
                            const variable_node & node,
                            const scope_chain & scope,
                            action::writer_state & w) noexcept {
  const value * v = lookup(scope, node.name);
  if (v == nullptr) {
    return true;
  }

  if (v->type == value_type::lambda) {
    if (v->lambda_v.kind != lambda_kind::variable) {
      return true;
    }
    std::string produced;
    if (!v->lambda_v.variable(produced)) {
      set_error(ctx, WHISKER_ERR_LAMBDA_FAILED, WHISKER_ERROR_DOMAIN_RENDERER,
                WHISKER_REASON_LAMBDA_FAILED, node.pos);
      return false;
    }
    // Lambda output never expands partials.
    std::string rendered;
    action::writer_state capture = make_capture(rendered);
    const partial_resolver partials = ctx.partials;
    ctx.partials = {};
    const bool ok = render_template_text(ctx, produced, delimiters{}, scope, capture, node.pos);
    ctx.partials = partials;
    if (!ok) {
      return false;
    }
    return node.escaped ? write_escaped(ctx, w, rendered) : write_text(ctx, w, rendered);
  }

  std::array<char, 64> buffer = {};
  const std::string_view text = value_to_string(*v, buffer);
  return node.escaped ? write_escaped(ctx, w, text) : write_text(ctx, w, text);
}

// Returns false with `handled` set when the lambda ran and failed.
inline bool render_section_lambda(action::context & ctx,
                                  const section_node & node,
                                  const lambda_value & lambda,
                                  const scope_chain & scope,
                                  action::writer_state & w,
                                  bool & handled) noexcept {
  handled = false;
  if (lambda.kind == lambda_kind::section) {
    handled = true;
    std::string produced;
    if (!lambda.section(node.raw, produced)) {
      set_error(ctx, WHISKER_ERR_LAMBDA_FAILED, WHISKER_ERROR_DOMAIN_RENDERER,
                WHISKER_REASON_LAMBDA_FAILED, node.pos);
      return false;
    }
    return render_template_text(ctx, produced, node.delims, scope, w, node.pos);
  }
  if (lambda.kind == lambda_kind::section_render) {
    handled = true;
    section_render_closure closure{&ctx, &scope, &node.delims, node.pos};
    const render_fn render =
      render_fn::from<section_render_closure, &section_render_closure::render>(&closure);
    std::string produced;
    if (!lambda.section_render(node.raw, render, produced)) {
      set_error(ctx, WHISKER_ERR_LAMBDA_FAILED, WHISKER_ERROR_DOMAIN_RENDERER,
                WHISKER_REASON_LAMBDA_FAILED, node.pos);
      return false;
    }
    return write_text(ctx, w, produced);
  }
  return true;
}

inline bool render_section(action::context & ctx,
                           const section_node & node,
                           const scope_chain & scope,
                           action::writer_state & w) noexcept {
  const value * v = lookup(scope, node.name);

  if (node.inverted) {
    return value_is_falsey(v) ? render_nodes(ctx, node.children, scope, w) : true;
  }

  if (v != nullptr && v->type == value_type::lambda) {
    bool handled = false;
    const bool ok = render_section_lambda(ctx, node, v->lambda_v, scope, w, handled);
    if (handled) {
      return ok;
    }
  }

  if (value_is_falsey(v)) {
    return true;
  }

  switch (v->type) {
    case value_type::boolean:
      return render_nodes(ctx, node.children, scope, w);
    case value_type::array:
      for (size_t i = 0; i < v->array_v.count; ++i) {
        scope_frame frame{};
        const scope_chain inner = push_scope(scope, v->array_v.items[i], frame);
        if (!render_nodes(ctx, node.children, inner, w)) {
          return false;
        }
      }
      return true;
    case value_type::undefined:
    case value_type::none:
    case value_type::integer:
    case value_type::floating:
    case value_type::string:
    case value_type::object:
    case value_type::lambda:
      break;
  }

  scope_frame frame{};
  const scope_chain inner = push_scope(scope, *v, frame);
  return render_nodes(ctx, node.children, inner, w);
}

inline bool render_partial(action::context & ctx,
                           const partial_node & node,
                           const scope_chain & scope,
                           action::writer_state & w) noexcept {
  if (!ctx.partials) {
    return true;
  }
  std::string_view text = {};
  if (!ctx.partials(node.name, text) || text.empty()) {
    return true;
  }
  if (node.indent.empty()) {
    return render_template_text(ctx, text, ctx.partial_delims, scope, w, node.pos);
  }
  const std::string indented = indent_lines(text, node.indent);
  return render_template_text(ctx, indented, ctx.partial_delims, scope, w, node.pos);
}

inline bool render_node(action::context & ctx,
                        const ast_node * node,
                        const scope_chain & scope,
                        action::writer_state & w) noexcept {
  if (node == nullptr) {
    return true;
  }
  if (auto * text = dynamic_cast<const text_node *>(node)) {
    return write_text(ctx, w, text->text);
  }
  if (auto * var = dynamic_cast<const variable_node *>(node)) {
    return render_variable(ctx, *var, scope, w);
  }
  if (auto * section = dynamic_cast<const section_node *>(node)) {
    return render_section(ctx, *section, scope, w);
  }
  if (auto * partial = dynamic_cast<const partial_node *>(node)) {
    return render_partial(ctx, *partial, scope, w);
  }
  set_error(ctx, WHISKER_ERR_BACKEND, WHISKER_ERROR_DOMAIN_RENDERER, WHISKER_REASON_NONE,
            node->pos);
  return false;
}

inline bool render_nodes(action::context & ctx,
                         const ast_list & nodes,
                         const scope_chain & scope,
                         action::writer_state & w) noexcept {
  for (const auto & node : nodes) {
    if (!render_node(ctx, node.get(), scope, w)) {
      return false;
    }
  }
  return true;
}

}  // namespace whisker::mustache::renderer::detail
