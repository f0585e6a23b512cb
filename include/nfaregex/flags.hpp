#pragma once

#include <cstdint>

namespace nfaregex {
enum class RegexFlags : uint8_t {
  none = 0,
  ignore_case = 1 << 0,
  dot_all = 1 << 1,
  multiline = 1 << 2,
  free_spacing = 1 << 3,
};

constexpr auto operator|(RegexFlags lhs, RegexFlags rhs) -> RegexFlags {
  return static_cast<RegexFlags>(static_cast<uint8_t>(lhs) |
                                 static_cast<uint8_t>(rhs));
}

constexpr auto operator&(RegexFlags lhs, RegexFlags rhs) -> RegexFlags {
  return static_cast<RegexFlags>(static_cast<uint8_t>(lhs) &
                                 static_cast<uint8_t>(rhs));
}

constexpr auto operator|=(RegexFlags &lhs, RegexFlags rhs) -> RegexFlags & {
  lhs = lhs | rhs;
  return lhs;
}

constexpr auto has_flag(RegexFlags flags, RegexFlags flag) -> bool {
  return (flags & flag) != RegexFlags::none;
}
} // namespace nfaregex
