#pragma once

#include "whisker/mustache/parser/context.hpp"
#include "whisker/mustache/parser/events.hpp"

namespace whisker::mustache::parser::guard {

struct valid_parse {
  bool operator()(const event::parse & ev,
                  const action::context &) const noexcept {
    if (ev.program_out == nullptr || ev.error_out == nullptr) {
      return false;
    }
    if (ev.delimiters != nullptr &&
        (ev.delimiters->open.empty() || ev.delimiters->close.empty())) {
      return false;
    }
    return true;
  }
};

struct invalid_parse {
  bool operator()(const event::parse & ev,
                  const action::context & ctx) const noexcept {
    return !valid_parse{}(ev, ctx);
  }
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

}  // namespace whisker::mustache::parser::guard
