#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "whisker/whisker.h"
#include "whisker/mustache/partials.hpp"
#include "whisker/mustache/value.hpp"

namespace whisker::mustache {

/**
 * Parses `template_text` with the default `{{ }}` pair and renders it against
 * `data` into `out`. Returns a `whisker_status`; `detail`, when set, receives
 * the domain, reason and byte offset of a failure. `out` holds whatever was
 * written before a render failure.
 */
int32_t render(std::string_view template_text,
               const value & data,
               partial_resolver partials,
               std::string & out,
               whisker_error_detail * detail = nullptr);

// Same as above without partials; partial tags render as empty text.
int32_t render(std::string_view template_text,
               const value & data,
               std::string & out,
               whisker_error_detail * detail = nullptr);

}  // namespace whisker::mustache
