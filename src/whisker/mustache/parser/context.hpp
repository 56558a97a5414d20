#pragma once

#include <cstddef>
#include <cstdint>

#include "whisker/whisker.h"

namespace whisker::mustache::parser::action {

struct context {
  int32_t phase_error = WHISKER_OK;
  int32_t last_error = WHISKER_OK;
  uint32_t error_domain = WHISKER_ERROR_DOMAIN_NONE;
  uint32_t error_reason = WHISKER_REASON_NONE;
  size_t error_pos = 0;
};

}  // namespace whisker::mustache::parser::action
