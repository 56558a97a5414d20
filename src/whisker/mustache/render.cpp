#include "whisker/mustache/render.hpp"

#include <glog/logging.h>

#include "whisker/mustache/ast.hpp"
#include "whisker/mustache/parser/sm.hpp"
#include "whisker/mustache/renderer/sm.hpp"

namespace whisker::mustache {

namespace {

int32_t normalize_status(const bool ok, const int32_t err) noexcept {
  if (ok && err == WHISKER_OK) {
    return WHISKER_OK;
  }
  if (err == WHISKER_OK) {
    return WHISKER_ERR_BACKEND;
  }
  return err;
}

void log_failure(const char * phase, const whisker_error_detail & detail) {
  if (detail.status == WHISKER_ERR_BACKEND) {
    LOG(ERROR) << "mustache " << phase << " machine rejected the request sequence";
    return;
  }
  VLOG(1) << "mustache " << phase << " failed: "
          << whisker_status_name(static_cast<whisker_status>(detail.status))
          << " (domain " << detail.domain << ", reason "
          << whisker_reason_name(static_cast<whisker_error_reason>(detail.reason))
          << ", pos " << detail.pos << ")";
}

}  // namespace

int32_t render(const std::string_view template_text,
               const value & data,
               const partial_resolver partials,
               std::string & out,
               whisker_error_detail * detail) {
  out.clear();

  whisker_error_detail local_detail{};
  whisker_error_detail & failure = detail != nullptr ? *detail : local_detail;
  failure = whisker_error_detail{WHISKER_OK, WHISKER_ERROR_DOMAIN_NONE, WHISKER_REASON_NONE, 0};

  program prog{};
  int32_t parse_err = WHISKER_OK;
  parser::action::context parse_ctx{};
  parser::sm parse_machine{parse_ctx};
  const bool parsed = parse_machine.process_event(event::parse{
    .template_text = template_text,
    .program_out = &prog,
    .error_out = &parse_err,
    .error_detail_out = &failure,
  });
  const int32_t parse_status = normalize_status(parsed, parse_err);
  if (parse_status != WHISKER_OK) {
    failure.status = parse_status;
    log_failure("parse", failure);
    return parse_status;
  }

  int32_t render_err = WHISKER_OK;
  size_t out_len = 0;
  renderer::action::context render_ctx{};
  renderer::sm render_machine{render_ctx};
  const bool rendered = render_machine.process_event(event::render{
    .program = &prog,
    .data = &data,
    .partials = partials,
    .output_text = &out,
    .output_length = &out_len,
    .error_out = &render_err,
    .error_detail_out = &failure,
  });
  const int32_t render_status = normalize_status(rendered, render_err);
  if (render_status != WHISKER_OK) {
    failure.status = render_status;
    log_failure("render", failure);
  }
  return render_status;
}

int32_t render(const std::string_view template_text,
               const value & data,
               std::string & out,
               whisker_error_detail * detail) {
  return render(template_text, data, partial_resolver{}, out, detail);
}

}  // namespace whisker::mustache
