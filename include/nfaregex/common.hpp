#pragma once

#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace nfaregex {
template <typename... Ts> struct Overload : Ts... {
  using Ts::operator()...;
};
template <typename... Ts> Overload(Ts...) -> Overload<Ts...>;

class RegexError : public std::runtime_error {
public:
  template <typename... T>
  explicit RegexError(std::string_view fmt_string, T const &...args)
      : std::runtime_error(
            std::vformat(fmt_string, std::make_format_args(args...))) {}
};

class ParserError : public RegexError {
public:
  enum class Kind {
    unexpected_token,
    unexpected_end_of_input,
    unable_to_parse_char,
    cant_parse_char_group,
    unrecognized_anchor,
    unrecognized_modifier,
    invalid_expression,
    invalid_start_to_character_class,
    suffix_remaining,
    unrecognized_quantifier,
    invalid_range_quantifier,
    cant_parse_range_bound,
    invalid_character_range,
  };

  // Everything but the kind is optional, each kind fills in what it knows
  struct Details {
    std::string remainder;
    std::optional<char32_t> character;
    std::optional<std::pair<uint64_t, uint64_t>> range_bounds;
    std::optional<std::pair<char32_t, char32_t>> character_range;
  };

  template <typename... T>
  ParserError(Kind kind, Details details, std::string_view fmt_string,
              T const &...args)
      : RegexError(fmt_string, args...), m_kind{kind},
        m_details{std::move(details)} {}

  auto kind() const -> Kind { return m_kind; }
  auto remainder() const -> std::string const & { return m_details.remainder; }
  auto character() const -> std::optional<char32_t> {
    return m_details.character;
  }
  auto range_bounds() const -> std::optional<std::pair<uint64_t, uint64_t>> {
    return m_details.range_bounds;
  }
  auto character_range() const
      -> std::optional<std::pair<char32_t, char32_t>> {
    return m_details.character_range;
  }

private:
  Kind m_kind;
  Details m_details;
};

auto to_string(ParserError::Kind kind) -> std::string_view;
} // namespace nfaregex
