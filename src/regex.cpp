#include "nfaregex/regex.hpp"
#include "nfaregex/parser.hpp"

#include "private/evaluation.hpp"
#include "private/nfa.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace nfaregex;

Match::Match(size_t start, size_t end,
             std::shared_ptr<evaluation::Context const> context,
             std::shared_ptr<Captures const> captures)
    : m_start{start}, m_end{end}, m_context{std::move(context)},
      m_captures{std::move(captures)} {}

auto Match::substring(size_t start, size_t end) const -> std::string_view {
  auto const &offsets = m_context->byte_offsets;
  return m_context->text.substr(offsets[start], offsets[end] - offsets[start]);
}

auto Match::group_span(size_t index) const
    -> std::optional<std::pair<size_t, size_t>> {
  if (index > group_count()) {
    throw RegexError("Group index {} out of range, pattern has {} groups",
                     index, group_count());
  }
  if (index == 0) {
    return span();
  }

  auto const &entry = (*m_captures)[2 * (index - 1)];
  auto const &exit = (*m_captures)[2 * (index - 1) + 1];
  if (not entry.has_value() || not exit.has_value()) {
    return std::nullopt;
  }
  return std::pair{*entry, *exit};
}

auto Match::group(size_t index) const -> std::optional<std::string_view> {
  auto group = group_span(index);
  if (not group.has_value()) {
    return std::nullopt;
  }
  return substring(group->first, group->second);
}

auto Match::groups() const -> std::vector<std::optional<std::string_view>> {
  std::vector<std::optional<std::string_view>> result;
  for (size_t index = 1; index <= group_count(); index += 1) {
    result.push_back(group(index));
  }
  return result;
}

Matches::Matches(std::shared_ptr<RegexNFAImpl const> nfa,
                 std::shared_ptr<evaluation::Context const> context)
    : m_nfa{std::move(nfa)}, m_context{std::move(context)}, m_start{0} {}

auto Matches::next() -> std::optional<Match> {
  while (m_start <= m_context->size()) {
    auto start = m_start;
    auto result = evaluation::match_suffix(
        *m_nfa, evaluation::Cursor{start, m_nfa->group_count}, *m_context);
    if (not result.has_value()) {
      m_start += 1;
      continue;
    }

    auto end = result->position();
    // Empty matches must still make progress
    m_start = end == start ? end + 1 : end;
    return Match{start, end, m_context, result->captures()};
  }
  return std::nullopt;
}

RegexNFA::RegexNFA(std::string_view pattern, RegexFlags flags) {
  auto ast = run_parse(pattern, flags);
  impl_ =
      std::make_shared<RegexNFAImpl const>(build_nfa(std::move(ast), flags));
}

RegexNFA::RegexNFA(RegexNFA &&) = default;
auto RegexNFA::operator=(RegexNFA &&) -> RegexNFA & = default;
RegexNFA::~RegexNFA() = default;

auto RegexNFA::group_count() const -> size_t { return impl_->group_count; }

auto RegexNFA::get_flags() const -> RegexFlags { return impl_->flags; }

auto RegexNFA::find_iter(std::string_view text) const -> Matches {
  return Matches{impl_,
                 std::make_shared<evaluation::Context>(text, impl_->flags)};
}

auto RegexNFA::search(std::string_view text) const -> std::optional<Match> {
  return find_iter(text).next();
}

auto RegexNFA::is_match(std::string_view text) const -> bool {
  return search(text).has_value();
}

auto RegexNFA::find(std::string_view text) const
    -> std::optional<std::string_view> {
  auto first = search(text);
  if (not first.has_value()) {
    return std::nullopt;
  }
  return first->group(0);
}

auto RegexNFA::find_all(std::string_view text) const
    -> std::vector<std::string_view> {
  std::vector<std::string_view> result;
  for (auto const &match : find_iter(text)) {
    result.push_back(*match.group(0));
  }
  return result;
}

auto RegexNFA::substitute_and_count(std::string_view text,
                                    Replacer const &replacer,
                                    size_t count) const
    -> std::pair<std::string, size_t> {
  auto context = std::make_shared<evaluation::Context>(text, impl_->flags);
  Matches matches{impl_, context};

  std::string output;
  size_t substitutions = 0;
  size_t copied_until = 0;
  while (substitutions < count) {
    auto match = matches.next();
    if (not match.has_value()) {
      break;
    }

    size_t match_start = context->byte_offsets[match->start()];
    output += text.substr(copied_until, match_start - copied_until);
    output += replacer(*match);
    copied_until = context->byte_offsets[match->end()];
    substitutions += 1;
  }
  output += text.substr(copied_until);
  return {std::move(output), substitutions};
}

auto RegexNFA::substitute_with(std::string_view text, Replacer const &replacer,
                               size_t count) const -> std::string {
  return substitute_and_count(text, replacer, count).first;
}

auto RegexNFA::substitute(std::string_view text, std::string_view replacement,
                          size_t count) const -> std::string {
  return substitute_with(
      text, [&](Match const &) { return std::string{replacement}; }, count);
}

auto nfaregex::compile(std::string_view pattern, RegexFlags flags)
    -> RegexNFA {
  return RegexNFA{pattern, flags};
}
