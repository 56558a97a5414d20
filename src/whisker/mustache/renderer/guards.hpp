#pragma once

#include "whisker/mustache/renderer/context.hpp"
#include "whisker/mustache/renderer/events.hpp"

namespace whisker::mustache::renderer::guard {

inline constexpr auto valid_render = [](const whisker::mustache::event::render & ev) noexcept {
  if (ev.program == nullptr) {
    return false;
  }
  return ev.output_text != nullptr || (ev.output != nullptr && ev.output_capacity > 0);
};

inline constexpr auto invalid_render = [](const whisker::mustache::event::render & ev) noexcept {
  return !valid_render(ev);
};

struct phase_ok {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error == WHISKER_OK;
  }
};

struct phase_failed {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.phase_error != WHISKER_OK;
  }
};

struct has_node_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.nodes != nullptr && ctx.node_index < ctx.nodes->size();
  }
};

struct no_node_work {
  bool operator()(const action::context & ctx) const noexcept {
    return ctx.nodes == nullptr || ctx.node_index >= ctx.nodes->size();
  }
};

}  // namespace whisker::mustache::renderer::guard
