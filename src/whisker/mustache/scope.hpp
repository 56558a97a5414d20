#pragma once

#include <cstddef>
#include <string_view>

#include "whisker/mustache/value.hpp"

namespace whisker::mustache {

/**
 * Context stack used for name resolution.
 *
 * Frames form a singly linked list from the innermost frame outwards. A push
 * links a caller-provided frame in front of an existing chain and returns a
 * new chain; the existing chain is left untouched, so sibling sections never
 * observe each other's frames. Frame storage lives on the stack of the render
 * call that pushed it.
 */
struct scope_frame {
  const value * val = nullptr;
  const scope_frame * parent = nullptr;
};

struct scope_chain {
  const scope_frame * top = nullptr;
  size_t depth = 0;

  bool empty() const noexcept { return top == nullptr; }
};

inline scope_chain push_scope(const scope_chain & chain,
                              const value & val,
                              scope_frame & storage) noexcept {
  storage.val = &val;
  storage.parent = chain.top;
  return scope_chain{&storage, chain.depth + 1};
}

inline const object_entry * find_object_entry(const object_value & object,
                                              const std::string_view key) noexcept {
  for (size_t i = 0; i < object.count; ++i) {
    if (object.entries[i].key == key) {
      return &object.entries[i];
    }
  }
  return nullptr;
}

// Objects resolve by key, arrays by a decimal zero-based index.
inline const value * resolve_segment(const value & base, const std::string_view segment) noexcept {
  if (base.type == value_type::object) {
    const object_entry * entry = find_object_entry(base.object_v, segment);
    return entry != nullptr ? &entry->val : nullptr;
  }
  if (base.type == value_type::array) {
    if (segment.empty()) {
      return nullptr;
    }
    size_t index = 0;
    for (const char c : segment) {
      if (c < '0' || c > '9') {
        return nullptr;
      }
      index = index * 10 + static_cast<size_t>(c - '0');
      if (index >= base.array_v.count) {
        return nullptr;
      }
    }
    return &base.array_v.items[index];
  }
  return nullptr;
}

/**
 * Resolves `.`, `name` or `a.b.c` against the chain, innermost first.
 *
 * Only the first segment of a dotted name walks the chain. Once a frame
 * supplies it, the remaining segments resolve against that value alone and a
 * miss there is final. Returns nullptr when nothing resolves.
 */
inline const value * lookup(const scope_chain & chain, const std::string_view name) noexcept {
  if (name == ".") {
    return chain.top != nullptr ? chain.top->val : nullptr;
  }

  const size_t dot = name.find('.');
  const std::string_view first = name.substr(0, dot);

  for (const scope_frame * frame = chain.top; frame != nullptr; frame = frame->parent) {
    if (frame->val == nullptr) {
      continue;
    }
    const value * current = resolve_segment(*frame->val, first);
    if (current == nullptr) {
      continue;
    }
    if (dot == std::string_view::npos) {
      return current;
    }
    std::string_view rest = name.substr(dot + 1);
    while (current != nullptr) {
      const size_t next = rest.find('.');
      current = resolve_segment(*current, rest.substr(0, next));
      if (next == std::string_view::npos) {
        break;
      }
      rest.remove_prefix(next + 1);
    }
    return current;
  }
  return nullptr;
}

}  // namespace whisker::mustache
