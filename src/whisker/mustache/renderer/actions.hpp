#pragma once

#include "whisker/whisker.h"
#include "whisker/mustache/renderer/context.hpp"
#include "whisker/mustache/renderer/detail.hpp"
#include "whisker/mustache/renderer/events.hpp"

namespace whisker::mustache::renderer::action {

inline void publish_result(const whisker::mustache::event::render & ev, const context & ctx) noexcept {
  if (ev.output_length != nullptr) {
    *ev.output_length = ctx.out.length;
  }
  if (ev.output_truncated != nullptr) {
    *ev.output_truncated = ctx.phase_error == WHISKER_ERR_CAPACITY;
  }
  if (ev.error_out != nullptr) {
    *ev.error_out = ctx.phase_error;
  }
  if (ev.error_pos_out != nullptr) {
    *ev.error_pos_out = ctx.error_pos;
  }
  if (ev.error_detail_out != nullptr) {
    *ev.error_detail_out =
      whisker_error_detail{ctx.phase_error, ctx.error_domain, ctx.error_reason, ctx.error_pos};
  }
}

struct reject_invalid_render {
  void operator()(const whisker::mustache::event::render & ev, context & ctx) const noexcept {
    ctx.request = nullptr;
    ctx.nodes = nullptr;
    ctx.out = {};
    detail::clear_error(ctx);
    detail::set_error(ctx, WHISKER_ERR_INVALID_ARGUMENT, WHISKER_ERROR_DOMAIN_NONE,
                      WHISKER_REASON_INVALID_REQUEST, 0);
    publish_result(ev, ctx);
    if (ev.dispatch_error) {
      ev.dispatch_error(whisker::mustache::events::rendering_error{
          &ev, WHISKER_ERR_INVALID_ARGUMENT, WHISKER_ERROR_DOMAIN_NONE,
          WHISKER_REASON_INVALID_REQUEST, 0});
    }
  }
};

struct begin_render {
  void operator()(const whisker::mustache::event::render & ev, context & ctx) const noexcept {
    ctx.request = &ev;
    ctx.nodes = &ev.program->body;
    ctx.node_index = 0;
    ctx.partials = ev.partials;
    ctx.partial_delims = ev.delimiters != nullptr ? *ev.delimiters : delimiters{};
    ctx.max_depth = ev.max_depth != 0 ? ev.max_depth : k_default_max_depth;
    ctx.depth = 0;
    ctx.root_frame = {};
    ctx.root_scope = {};

    ctx.out = {};
    if (ev.output_text != nullptr) {
      ev.output_text->clear();
      ctx.out.text = ev.output_text;
    } else {
      ctx.out.data = ev.output;
      ctx.out.capacity = ev.output_capacity;
    }

    detail::clear_error(ctx);
  }
};

struct seed_scope {
  void operator()(context & ctx) const noexcept {
    if (ctx.request == nullptr || ctx.request->data == nullptr) {
      return;
    }
    ctx.root_scope = push_scope(scope_chain{}, *ctx.request->data, ctx.root_frame);
  }
};

struct eval_next_node {
  void operator()(context & ctx) const noexcept {
    if (ctx.phase_error != WHISKER_OK) {
      return;
    }
    if (ctx.nodes == nullptr) {
      detail::set_error(ctx, WHISKER_ERR_INVALID_ARGUMENT, WHISKER_ERROR_DOMAIN_RENDERER,
                        WHISKER_REASON_INVALID_REQUEST, 0);
      return;
    }
    if (ctx.node_index >= ctx.nodes->size()) {
      return;
    }
    const ast_node * node = (*ctx.nodes)[ctx.node_index].get();
    ctx.node_index += 1;
    (void)detail::render_node(ctx, node, ctx.root_scope, ctx.out);
  }
};

struct finalize_done {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    publish_result(*ev, ctx);
    if (ev->dispatch_done) {
      ev->dispatch_done(whisker::mustache::events::rendering_done{ev, ctx.out.length});
    }
  }
};

struct finalize_error {
  void operator()(context & ctx) const noexcept {
    const auto * ev = ctx.request;
    if (ev == nullptr) {
      return;
    }
    publish_result(*ev, ctx);
    if (ev->dispatch_error) {
      ev->dispatch_error(whisker::mustache::events::rendering_error{
          ev, ctx.phase_error, ctx.error_domain, ctx.error_reason, ctx.error_pos});
    }
  }
};

struct on_unexpected {
  template <class Event>
  void operator()(const Event &, context & ctx) const noexcept {
    ctx.phase_error = WHISKER_ERR_BACKEND;
    ctx.last_error = WHISKER_ERR_BACKEND;
  }
};

inline constexpr reject_invalid_render reject_invalid_render{};
inline constexpr begin_render begin_render{};
inline constexpr seed_scope seed_scope{};
inline constexpr eval_next_node eval_next_node{};
inline constexpr finalize_done finalize_done{};
inline constexpr finalize_error finalize_error{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace whisker::mustache::renderer::action
