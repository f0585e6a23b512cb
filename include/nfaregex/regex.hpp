#pragma once

#include "common.hpp"
#include "flags.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nfaregex {
namespace evaluation {
struct Context;
}

using Captures = std::vector<std::optional<size_t>>;

class Match {
  size_t m_start;
  size_t m_end;
  std::shared_ptr<evaluation::Context const> m_context;
  std::shared_ptr<Captures const> m_captures;

  auto substring(size_t start, size_t end) const -> std::string_view;

public:
  Match(size_t start, size_t end,
        std::shared_ptr<evaluation::Context const> context,
        std::shared_ptr<Captures const> captures);

  // Character offsets into the subject
  auto span() const -> std::pair<size_t, size_t> { return {m_start, m_end}; }
  auto start() const -> size_t { return m_start; }
  auto end() const -> size_t { return m_end; }

  auto group_count() const -> size_t { return m_captures->size() / 2; }

  // Group 0 is the whole match, groups 1..N are the capturing groups
  auto group(size_t index = 0) const -> std::optional<std::string_view>;
  auto group_span(size_t index) const
      -> std::optional<std::pair<size_t, size_t>>;

  // Capturing groups only, group 0 is excluded
  auto groups() const -> std::vector<std::optional<std::string_view>>;
};

struct RegexNFAImpl;
class RegexNFA;

// Single-pass sequence of the non-overlapping matches in one subject
class Matches {
  std::shared_ptr<RegexNFAImpl const> m_nfa;
  std::shared_ptr<evaluation::Context const> m_context;
  size_t m_start;

public:
  Matches(std::shared_ptr<RegexNFAImpl const> nfa,
          std::shared_ptr<evaluation::Context const> context);

  auto next() -> std::optional<Match>;

  class iterator {
    Matches *m_matches;
    std::optional<Match> m_current;

  public:
    using value_type = Match;
    using difference_type = std::ptrdiff_t;

    iterator() : m_matches{nullptr} {}
    explicit iterator(Matches &matches)
        : m_matches{&matches}, m_current{matches.next()} {}

    auto operator*() const -> Match const & { return *m_current; }
    auto operator->() const -> Match const * { return &*m_current; }
    auto operator++() -> iterator & {
      m_current = m_matches->next();
      return *this;
    }
    auto operator++(int) -> void { ++*this; }
    auto operator==(std::default_sentinel_t) const -> bool {
      return not m_current.has_value();
    }
  };

  auto begin() -> iterator { return iterator{*this}; }
  auto end() -> std::default_sentinel_t { return std::default_sentinel; }
};

class RegexNFA {
  // Shared with every Matches sequence handed out by find_iter
  std::shared_ptr<RegexNFAImpl const> impl_;

public:
  explicit RegexNFA(std::string_view pattern,
                    RegexFlags flags = RegexFlags::none);

  RegexNFA(RegexNFA &&);
  auto operator=(RegexNFA &&) -> RegexNFA &;
  ~RegexNFA();

  auto group_count() const -> size_t;
  auto get_flags() const -> RegexFlags;

  auto is_match(std::string_view text) const -> bool;
  // The leftmost match, with its groups
  auto search(std::string_view text) const -> std::optional<Match>;
  auto find(std::string_view text) const -> std::optional<std::string_view>;
  auto find_iter(std::string_view text) const -> Matches;
  auto find_all(std::string_view text) const -> std::vector<std::string_view>;

  using Replacer = std::function<std::string(Match const &)>;
  static constexpr size_t all_matches = std::numeric_limits<size_t>::max();

  auto substitute(std::string_view text, std::string_view replacement,
                  size_t count = all_matches) const -> std::string;
  auto substitute_with(std::string_view text, Replacer const &replacer,
                       size_t count = all_matches) const -> std::string;
  auto substitute_and_count(std::string_view text, Replacer const &replacer,
                            size_t count = all_matches) const
      -> std::pair<std::string, size_t>;

  auto visualize(std::ostream &) const -> void;
};

auto compile(std::string_view pattern, RegexFlags flags = RegexFlags::none)
    -> RegexNFA;
} // namespace nfaregex
