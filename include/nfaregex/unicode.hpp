#pragma once

#include "common.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace nfaregex {
struct Codepoint {
  char32_t value;

  constexpr Codepoint(char32_t value) : value{value} {}

  constexpr auto operator==(Codepoint const &) const -> bool = default;
  constexpr auto operator<=>(Codepoint const &) const = default;

  static constexpr auto invalid_sentinel() -> Codepoint { return {0xfffdU}; };
};

// Decodes the codepoint at the start of `text`, `size` receives the number of
// bytes consumed (at least one for non-empty input).
constexpr auto parse_utf8_char(std::string_view text, size_t &size)
    -> Codepoint {
  size = 0;
  if (text.empty()) {
    return Codepoint::invalid_sentinel();
  }

  auto continuation = [&](size_t index) -> char32_t {
    if (index >= text.size() || (uint8_t(text[index]) & 0xc0U) != 0x80U) {
      return 0x110000U;
    }
    return uint8_t(text[index]) & 0x3fU;
  };

  char32_t first_byte = uint8_t(text[0]);
  if ((first_byte & 0x80U) == 0U) {
    // ASCII range
    size = 1;
    return {first_byte};
  }

  size_t length;
  char32_t value;
  if ((first_byte & 0xe0U) == 0xc0U) {
    length = 2;
    value = first_byte & 0x1fU;
  } else if ((first_byte & 0xf0U) == 0xe0U) {
    length = 3;
    value = first_byte & 0x0fU;
  } else if ((first_byte & 0xf8U) == 0xf0U) {
    length = 4;
    value = first_byte & 0x07U;
  } else {
    size = 1;
    return Codepoint::invalid_sentinel();
  }

  for (size_t i = 1; i < length; i += 1) {
    char32_t next = continuation(i);
    if (next > 0x3fU) {
      size = i;
      return Codepoint::invalid_sentinel();
    }
    value = (value << 6U) | next;
  }
  size = length;
  return {value};
}

constexpr auto codepoint_to_utf8(std::string &output, Codepoint codepoint)
    -> void {
  if (codepoint.value <= 0x7f) [[likely]] {
    output.push_back(char(codepoint.value));
    return;
  }

  if (codepoint.value <= 0x07ff) {
    output.push_back(char(0xc0 | ((codepoint.value >> 6) & 0x1f)));
    output.push_back(char(0x80 | (codepoint.value & 0x3f)));
    return;
  }

  if (codepoint.value <= 0xd7ff ||
      (0xe000 <= codepoint.value && codepoint.value <= 0xffff)) {
    output.push_back(char(0xe0 | ((codepoint.value >> 12) & 0x0f)));
    output.push_back(char(0x80 | ((codepoint.value >> 6) & 0x3f)));
    output.push_back(char(0x80 | (codepoint.value & 0x3f)));
    return;
  }

  if (0x10000 <= codepoint.value && codepoint.value <= 0x10ffff) {
    output.push_back(char(0xf0 | ((codepoint.value >> 18) & 0x07)));
    output.push_back(char(0x80 | ((codepoint.value >> 12) & 0x3f)));
    output.push_back(char(0x80 | ((codepoint.value >> 6) & 0x3f)));
    output.push_back(char(0x80 | (codepoint.value & 0x3f)));
    return;
  }

  throw RegexError("Cannot encode invalid codepoint {:x}",
                   uint32_t(codepoint.value));
}

inline auto to_utf8(Codepoint codepoint) -> std::string {
  std::string output;
  codepoint_to_utf8(output, codepoint);
  return output;
}

// Case folding only covers ASCII
constexpr auto to_lower(Codepoint codepoint) -> Codepoint {
  if (codepoint.value >= 'A' && codepoint.value <= 'Z') {
    return {char32_t(codepoint.value + ('a' - 'A'))};
  }
  return codepoint;
}

constexpr auto to_upper(Codepoint codepoint) -> Codepoint {
  if (codepoint.value >= 'a' && codepoint.value <= 'z') {
    return {char32_t(codepoint.value - ('a' - 'A'))};
  }
  return codepoint;
}

constexpr auto is_word_character(Codepoint codepoint) -> bool {
  auto value = codepoint.value;
  return value == '_' || (value >= '0' && value <= '9') ||
         (value >= 'A' && value <= 'Z') || (value >= 'a' && value <= 'z');
}
} // namespace nfaregex
