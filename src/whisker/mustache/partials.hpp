#pragma once

#include <cstddef>
#include <string_view>

#include "whisker/callback.hpp"

namespace whisker::mustache {

// Returns true and sets `text_out` when a partial named `name` exists. The
// text must stay valid for the duration of the render.
using partial_resolver = ::whisker::callback<bool(std::string_view name, std::string_view & text_out)>;

struct partial_entry {
  std::string_view name = {};
  std::string_view text = {};
};

/**
 * Resolver over a caller-owned array of named partial bodies.
 * The first entry with a matching name wins.
 */
struct partial_table {
  const partial_entry * entries = nullptr;
  size_t count = 0;

  bool find(std::string_view name, std::string_view & text_out) const noexcept {
    for (size_t i = 0; i < count; ++i) {
      if (entries[i].name == name) {
        text_out = entries[i].text;
        return true;
      }
    }
    return false;
  }

  partial_resolver resolver() const noexcept {
    return partial_resolver::from<partial_table, &partial_table::find>(this);
  }
};

}  // namespace whisker::mustache
