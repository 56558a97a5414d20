#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "whisker/whisker.h"
#include "whisker/mustache/delimiters.hpp"

namespace whisker::mustache {

enum class token_type : uint8_t {
  text = 0,
  variable,
  unescaped_variable,
  section_start,
  inverted_section_start,
  section_end,
  partial,
  comment,
  set_delimiters
};

/**
 * One lexed tag or text run.
 *
 * `start`/`end` are byte offsets of the whole tag (markers included) in the
 * lexed source. `value` is the trimmed tag name, or the literal text for
 * `token_type::text`. `delims` is the pair in effect once this token has been
 * lexed, so a `set_delimiters` token carries the new pair.
 */
struct token {
  token_type type = token_type::text;
  std::string value;
  size_t start = 0;
  size_t end = 0;
  delimiters delims = {};
};

struct lexer_result {
  std::vector<token> tokens;
  std::string source;
  delimiters final_delims = {};
  int32_t error = WHISKER_OK;
  uint32_t error_reason = WHISKER_REASON_NONE;
  size_t error_pos = 0;
};

struct lexer {
  lexer_result tokenize(std::string_view source) const {
    return tokenize(source, delimiters{});
  }

  lexer_result tokenize(std::string_view source, delimiters delims) const {
    lexer_result result{};
    result.source = std::string(source);
    const std::string & src = result.source;

    bool ok = true;
    auto set_error = [&](uint32_t reason, size_t pos) {
      if (!ok) {
        return;
      }
      ok = false;
      result.error = WHISKER_ERR_PARSE_FAILED;
      result.error_reason = reason;
      result.error_pos = pos;
    };

    auto trim = [](std::string_view s) -> std::string_view {
      const size_t first = s.find_first_not_of(" \t\r\n");
      if (first == std::string_view::npos) {
        return {};
      }
      const size_t last = s.find_last_not_of(" \t\r\n");
      return s.substr(first, last - first + 1);
    };

    auto starts_with = [](std::string_view s, char c) {
      return !s.empty() && s.front() == c;
    };

    auto ends_with = [](std::string_view s, char c) {
      return !s.empty() && s.back() == c;
    };

    auto push = [&](token_type type, std::string_view value, size_t start, size_t end) {
      result.tokens.push_back({type, std::string(value), start, end, delims});
    };

    if (delims.open.empty() || delims.close.empty()) {
      set_error(WHISKER_REASON_BAD_DELIMITERS, 0);
    }

    size_t pos = 0;
    while (pos < src.size() && ok) {
      const size_t open_at = src.find(delims.open, pos);
      if (open_at == std::string::npos) {
        push(token_type::text, std::string_view(src).substr(pos), pos, src.size());
        break;
      }
      if (open_at > pos) {
        push(token_type::text, std::string_view(src).substr(pos, open_at - pos), pos, open_at);
        pos = open_at;
      }

      // {{{name}}} only exists under the default pair.
      if (delims.open == k_default_open && src.compare(pos, 3, "{{{") == 0) {
        const size_t close_at = src.find("}}}", pos + 3);
        if (close_at == std::string::npos) {
          set_error(WHISKER_REASON_UNCLOSED_TRIPLE, pos);
          break;
        }
        const std::string_view name =
          trim(std::string_view(src).substr(pos + 3, close_at - pos - 3));
        push(token_type::unescaped_variable, name, pos, close_at + 3);
        pos = close_at + 3;
        continue;
      }

      const size_t body_at = pos + delims.open.size();
      const size_t close_at = src.find(delims.close, body_at);
      if (close_at == std::string::npos) {
        set_error(WHISKER_REASON_UNCLOSED_TAG, pos);
        break;
      }
      const size_t tag_end = close_at + delims.close.size();
      const std::string_view body = trim(std::string_view(src).substr(body_at, close_at - body_at));
      if (body.empty()) {
        pos = tag_end;
        continue;
      }

      switch (body.front()) {
        case '!':
          push(token_type::comment, {}, pos, tag_end);
          break;
        case '#':
          push(token_type::section_start, trim(body.substr(1)), pos, tag_end);
          break;
        case '^':
          push(token_type::inverted_section_start, trim(body.substr(1)), pos, tag_end);
          break;
        case '/':
          push(token_type::section_end, trim(body.substr(1)), pos, tag_end);
          break;
        case '>':
          push(token_type::partial, trim(body.substr(1)), pos, tag_end);
          break;
        case '&':
          push(token_type::unescaped_variable, trim(body.substr(1)), pos, tag_end);
          break;
        default:
          if (starts_with(body, '=') && ends_with(body, '=')) {
            std::string_view inner = body.size() >= 2 ? body.substr(1, body.size() - 2) : std::string_view{};
            std::vector<std::string_view> parts;
            while (true) {
              inner = trim(inner);
              if (inner.empty()) {
                break;
              }
              const size_t gap = inner.find_first_of(" \t\r\n");
              parts.push_back(inner.substr(0, gap));
              if (gap == std::string_view::npos) {
                break;
              }
              inner.remove_prefix(gap);
            }
            if (parts.size() != 2) {
              set_error(WHISKER_REASON_BAD_DELIMITERS, pos);
              break;
            }
            delims.open = std::string(parts[0]);
            delims.close = std::string(parts[1]);
            push(token_type::set_delimiters, {}, pos, tag_end);
          } else if (starts_with(body, '{') && ends_with(body, '}')) {
            push(token_type::unescaped_variable, trim(body.substr(1, body.size() - 2)), pos, tag_end);
          } else {
            push(token_type::variable, body, pos, tag_end);
          }
          break;
      }
      pos = tag_end;
    }

    result.final_delims = delims;
    return result;
  }
};

}  // namespace whisker::mustache
