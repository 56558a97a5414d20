#pragma once

#include <string>
#include <string_view>

namespace whisker::mustache {

inline constexpr std::string_view k_default_open = "{{";
inline constexpr std::string_view k_default_close = "}}";

struct delimiters {
  std::string open = std::string(k_default_open);
  std::string close = std::string(k_default_close);

  bool is_default() const noexcept {
    return open == k_default_open && close == k_default_close;
  }
};

}  // namespace whisker::mustache
