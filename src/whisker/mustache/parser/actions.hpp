#pragma once

#include "whisker/whisker.h"
#include "whisker/mustache/lexer.hpp"
#include "whisker/mustache/parser/context.hpp"
#include "whisker/mustache/parser/detail.hpp"
#include "whisker/mustache/parser/events.hpp"

namespace whisker::mustache::parser::action {

inline void publish_error(const whisker::mustache::event::parse & ev,
                          context & ctx,
                          const int32_t err,
                          const uint32_t domain,
                          const uint32_t reason,
                          const size_t pos) noexcept {
  ctx.phase_error = err;
  ctx.last_error = err;
  ctx.error_domain = domain;
  ctx.error_reason = reason;
  ctx.error_pos = pos;
  if (ev.error_out != nullptr) {
    *ev.error_out = err;
  }
  if (ev.error_detail_out != nullptr) {
    *ev.error_detail_out = whisker_error_detail{err, domain, reason, pos};
  }
  if (ev.program_out != nullptr) {
    ev.program_out->reset();
    ev.program_out->last_error = err;
    ev.program_out->last_error_domain = domain;
    ev.program_out->last_error_reason = reason;
    ev.program_out->last_error_pos = pos;
  }
  if (ev.dispatch_error) {
    ev.dispatch_error(
        whisker::mustache::events::parsing_error{&ev, err, domain, reason, pos});
  }
}

struct reject_invalid_parse {
  void operator()(const whisker::mustache::event::parse & ev,
                  context & ctx) const noexcept {
    publish_error(ev, ctx, WHISKER_ERR_INVALID_ARGUMENT, WHISKER_ERROR_DOMAIN_NONE,
                  WHISKER_REASON_INVALID_REQUEST, 0);
  }
};

struct run_parse {
  void operator()(const whisker::mustache::event::parse & ev,
                  context & ctx) const noexcept {
    ctx.phase_error = WHISKER_OK;
    ctx.last_error = WHISKER_OK;
    ctx.error_domain = WHISKER_ERROR_DOMAIN_NONE;
    ctx.error_reason = WHISKER_REASON_NONE;
    ctx.error_pos = 0;

    if (ev.error_out != nullptr) {
      *ev.error_out = WHISKER_OK;
    }
    if (ev.error_detail_out != nullptr) {
      *ev.error_detail_out = whisker_error_detail{WHISKER_OK, WHISKER_ERROR_DOMAIN_NONE,
                                                  WHISKER_REASON_NONE, 0};
    }
    ev.program_out->reset();

    whisker::mustache::lexer lex;
    const whisker::mustache::lexer_result lex_res =
      ev.delimiters != nullptr ? lex.tokenize(ev.template_text, *ev.delimiters)
                               : lex.tokenize(ev.template_text);
    if (lex_res.error != WHISKER_OK) {
      publish_error(ev, ctx, lex_res.error, WHISKER_ERROR_DOMAIN_LEXER,
                    lex_res.error_reason, lex_res.error_pos);
      return;
    }

    detail::template_parser parser{*ev.program_out};
    if (!parser.parse(lex_res)) {
      publish_error(ev, ctx, parser.error(), WHISKER_ERROR_DOMAIN_PARSER,
                    parser.error_reason(), parser.error_pos());
      return;
    }

    if (ev.dispatch_done) {
      ev.dispatch_done(
          whisker::mustache::events::parsing_done{&ev, ev.program_out->body.size()});
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

inline constexpr reject_invalid_parse reject_invalid_parse{};
inline constexpr run_parse run_parse{};
inline constexpr on_unexpected on_unexpected{};

}  // namespace whisker::mustache::parser::action
