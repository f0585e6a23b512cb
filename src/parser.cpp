#include "nfaregex/parser.hpp"
#include "nfaregex/ast.hpp"
#include "nfaregex/common.hpp"
#include "nfaregex/flags.hpp"
#include "nfaregex/unicode.hpp"

#include <algorithm>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

using namespace nfaregex;
using namespace std::string_view_literals;

namespace {
using Kind = ParserError::Kind;

constexpr auto escapable_characters = R"($()*+-.<=>?[\]^{|})"sv;
constexpr auto control_escapes = "nrtfv"sv;
constexpr auto class_letters = "wWsSdD"sv;
constexpr auto anchor_letters = "AzZGbB"sv;
constexpr auto metacharacters = R"(()*+?[\|^$.{)"sv;
constexpr auto modifier_letters = "imsx"sv;
constexpr auto whitespace = " \t\n\r\f\v"sv;
// Bounded repetitions are unrolled, so their counts are capped
constexpr uint64_t max_repetition_count = 65535;

struct ParserState {
  std::string_view text;
  size_t offset;
  size_t group_count;
  Ast ast;

  auto is_at_end() const -> bool { return offset >= text.size(); }

  auto remainder() const -> std::string {
    return std::string{text.substr(std::min(offset, text.size()))};
  }

  auto peek(size_t ahead = 0) const -> std::optional<char> {
    if (offset + ahead >= text.size()) {
      return std::nullopt;
    }
    return text[offset + ahead];
  }

  auto is_next(char test_char) const -> bool { return peek() == test_char; }

  auto is_next_one_of(std::string_view chars, size_t ahead = 0) const -> bool {
    auto next = peek(ahead);
    return next.has_value() && chars.contains(*next);
  }

  auto matches_several(std::string_view expected) const -> bool {
    return text.substr(std::min(offset, text.size())).starts_with(expected);
  }

  auto eat_next() -> void { offset += 1; }

  auto try_eat(char to_eat) -> bool {
    if (is_next(to_eat)) {
      eat_next();
      return true;
    }
    return false;
  }

  auto eat_or_throw(char to_eat) -> void {
    if (try_eat(to_eat)) {
      return;
    }

    if (is_at_end()) {
      throw ParserError(Kind::unexpected_end_of_input, {},
                        "Expected '{}' at offset {}, got end of pattern",
                        to_eat, offset);
    }
    throw ParserError(
        Kind::unexpected_token,
        {.remainder = remainder(), .character = char32_t(to_eat)},
        "Expected '{}' at offset {}, got '{}'", to_eat, offset, *peek());
  }

  auto eat_codepoint() -> Codepoint {
    if (is_at_end()) {
      throw ParserError(Kind::unexpected_end_of_input, {},
                        "Unexpected end of pattern at offset {}", offset);
    }
    size_t size;
    auto codepoint = parse_utf8_char(text.substr(offset), size);
    offset += size;
    return codepoint;
  }
};

auto parse_expression(ParserState &state) -> NodeIndex;

auto can_parse_group(ParserState const &state) -> bool {
  return state.is_next('(');
}

auto can_parse_anchor(ParserState const &state) -> bool {
  if (state.is_next('^') || state.is_next('$')) {
    return true;
  }
  return state.is_next('\\') && state.is_next_one_of(anchor_letters, 1);
}

auto can_parse_character_class(ParserState const &state) -> bool {
  return state.is_next('\\') && state.is_next_one_of(class_letters, 1);
}

auto can_parse_escaped(ParserState const &state) -> bool {
  return state.is_next('\\') &&
         (state.is_next_one_of(escapable_characters, 1) ||
          state.is_next_one_of(control_escapes, 1));
}

auto can_parse_character(ParserState const &state) -> bool {
  return not state.is_at_end() && not state.is_next_one_of(metacharacters);
}

auto can_parse_match(ParserState const &state) -> bool {
  return state.is_next('.') || state.is_next('[') ||
         can_parse_character_class(state) || can_parse_escaped(state) ||
         can_parse_character(state);
}

auto can_parse_sub_expression_item(ParserState const &state) -> bool {
  return can_parse_group(state) || can_parse_anchor(state) ||
         can_parse_match(state);
}

auto can_parse_quantifier(ParserState const &state) -> bool {
  return state.is_next_one_of("*+?{");
}

constexpr auto unescape(Codepoint escaped) -> Codepoint {
  switch (escaped.value) {
  case 'n':
    return {'\n'};
  case 'r':
    return {'\r'};
  case 't':
    return {'\t'};
  case 'f':
    return {'\f'};
  case 'v':
    return {'\v'};
  default:
    return escaped;
  }
}

auto parse_escaped(ParserState &state) -> Codepoint {
  state.eat_or_throw('\\');
  return unescape(state.eat_codepoint());
}

auto parse_character(ParserState &state) -> NodeIndex {
  if (can_parse_escaped(state)) {
    return state.ast.add({Node::Character{parse_escaped(state)}});
  }
  if (not can_parse_character(state)) {
    throw ParserError(Kind::unable_to_parse_char,
                      {.remainder = state.remainder()},
                      "Unable to parse a character at offset {}",
                      state.offset);
  }
  return state.ast.add({Node::Character{state.eat_codepoint()}});
}

auto parse_character_class(ParserState &state) -> NodeIndex {
  state.eat_or_throw('\\');
  auto letter = state.eat_codepoint();

  std::vector<Node> members;
  switch (letter.value) {
  default:
    throw ParserError(Kind::invalid_start_to_character_class,
                      {.remainder = state.remainder(),
                       .character = letter.value},
                      "Invalid character class '\\{}' at offset {}",
                      to_utf8(letter), state.offset);
  case 'd':
  case 'D':
    members.push_back({Node::CharacterRange{'0', '9'}});
    break;
  case 'w':
  case 'W':
    members.push_back({Node::CharacterRange{'0', '9'}});
    members.push_back({Node::CharacterRange{'A', 'Z'}});
    members.push_back({Node::CharacterRange{'a', 'z'}});
    members.push_back({Node::Character{'_'}});
    break;
  case 's':
  case 'S':
    for (char space : whitespace) {
      members.push_back({Node::Character{char32_t(space)}});
    }
    break;
  }

  Node::CharacterGroup group{.items = {},
                             .negated = to_upper(letter) == letter};
  for (auto &member : members) {
    group.items.push_back(state.ast.add(std::move(member)));
  }
  return state.ast.add({std::move(group)});
}

auto parse_group_character(ParserState &state) -> Codepoint {
  if (state.try_eat('\\')) {
    return unescape(state.eat_codepoint());
  }
  return state.eat_codepoint();
}

// A '-' starts a range unless it closes the group or precedes a class
auto is_range_next(ParserState const &state) -> bool {
  if (not state.is_next('-') || not state.peek(1).has_value()) {
    return false;
  }
  if (state.peek(1) == ']') {
    return false;
  }
  return not(state.peek(1) == '\\' && state.is_next_one_of(class_letters, 2));
}

auto parse_character_group_item(ParserState &state) -> NodeIndex {
  if (can_parse_character_class(state)) {
    return parse_character_class(state);
  }

  auto lower = parse_group_character(state);
  if (not is_range_next(state)) {
    return state.ast.add({Node::Character{lower}});
  }

  state.eat_or_throw('-');
  auto upper = parse_group_character(state);
  if (lower > upper) {
    throw ParserError(
        Kind::invalid_character_range,
        {.remainder = state.remainder(),
         .character_range = std::pair{lower.value, upper.value}},
        "Invalid character range '{}-{}'", to_utf8(lower), to_utf8(upper));
  }
  return state.ast.add({Node::CharacterRange{lower, upper}});
}

auto parse_character_group(ParserState &state) -> NodeIndex {
  state.eat_or_throw('[');
  bool negated = state.try_eat('^');

  std::vector<NodeIndex> items;
  if (state.try_eat('-')) {
    items.push_back(state.ast.add({Node::Character{'-'}}));
  }
  while (not state.is_at_end() && not state.is_next(']')) {
    items.push_back(parse_character_group_item(state));
  }
  state.eat_or_throw(']');

  if (items.empty()) {
    throw ParserError(Kind::cant_parse_char_group,
                      {.remainder = state.remainder()},
                      "Empty character group ending at offset {}",
                      state.offset);
  }
  return state.ast.add({Node::CharacterGroup{std::move(items), negated}});
}

auto parse_match_item(ParserState &state) -> NodeIndex {
  if (state.try_eat('.')) {
    return state.ast.add({Node::AnyCharacter{}});
  }
  if (can_parse_character_class(state)) {
    return parse_character_class(state);
  }
  if (state.is_next('[')) {
    return parse_character_group(state);
  }
  return parse_character(state);
}

auto parse_int(ParserState &state) -> uint64_t {
  size_t start = state.offset;
  while (state.is_next_one_of("0123456789")) {
    state.eat_next();
  }

  auto digits = state.text.substr(start, state.offset - start);
  uint64_t result = 0;
  auto [end, error] =
      std::from_chars(digits.data(), digits.data() + digits.size(), result);
  if (error != std::errc{} || end != digits.data() + digits.size()) {
    throw ParserError(Kind::cant_parse_range_bound,
                      {.remainder = state.remainder()},
                      "Cannot parse range bound '{}' at offset {}: {}",
                      digits, start, std::make_error_code(error).message());
  }
  return result;
}

auto parse_range_quantifier(ParserState &state) -> Quantifier {
  state.eat_or_throw('{');

  uint64_t lower = 0;
  if (not state.is_next(',')) {
    lower = parse_int(state);
  }

  UpperBound upper{UpperBound::Undefined{}};
  if (state.try_eat(',')) {
    upper = {UpperBound::Unbounded{}};
    if (state.is_next_one_of("0123456789")) {
      upper = {UpperBound::Bounded{parse_int(state)}};
    }
  }
  state.eat_or_throw('}');
  bool lazy = state.try_eat('?');

  auto const *bounded = std::get_if<UpperBound::Bounded>(&upper.type);
  auto largest = bounded != nullptr ? std::max(lower, bounded->value) : lower;
  if (largest > max_repetition_count) {
    throw ParserError(
        Kind::cant_parse_range_bound,
        {.remainder = state.remainder(),
         .range_bounds =
             std::pair{lower, bounded != nullptr ? bounded->value : lower}},
        "Range bound {} exceeds the maximum repetition count {}", largest,
        max_repetition_count);
  }

  if (bounded != nullptr) {
    if (bounded->value < lower) {
      throw ParserError(
          Kind::invalid_range_quantifier,
          {.remainder = state.remainder(),
           .range_bounds = std::pair{lower, bounded->value}},
          "Invalid range quantifier {{{},{}}}", lower, bounded->value);
    }
  }
  return {Quantifier::Range{lower, upper, lazy}};
}

auto parse_quantifier(ParserState &state) -> Quantifier {
  if (state.is_next('{')) {
    return parse_range_quantifier(state);
  }

  auto quantifier = state.eat_codepoint();
  switch (quantifier.value) {
  default:
    throw ParserError(Kind::unrecognized_quantifier,
                      {.remainder = state.remainder(),
                       .character = quantifier.value},
                      "Unrecognized quantifier '{}'", to_utf8(quantifier));
  case '*':
    return {Quantifier::ZeroOrMore{state.try_eat('?')}};
  case '+':
    return {Quantifier::OneOrMore{state.try_eat('?')}};
  case '?':
    return {Quantifier::ZeroOrOne{state.try_eat('?')}};
  }
}

auto parse_optional_quantifier(ParserState &state) -> Quantifier {
  if (not can_parse_quantifier(state)) {
    return {Quantifier::None{}};
  }
  return parse_quantifier(state);
}

auto parse_match(ParserState &state) -> NodeIndex {
  auto item = parse_match_item(state);
  auto quantifier = parse_optional_quantifier(state);
  return state.ast.add({Node::Match{item, quantifier}});
}

auto parse_group(ParserState &state) -> NodeIndex {
  state.eat_or_throw('(');

  std::optional<size_t> index;
  if (state.matches_several("?:")) {
    state.offset += 2;
  } else if (state.try_eat('?')) {
    // Modifiers are only allowed at the start of the pattern
    if (state.is_at_end()) {
      throw ParserError(Kind::unexpected_end_of_input, {},
                        "Unexpected end of pattern in group at offset {}",
                        state.offset);
    }
    auto modifier = state.eat_codepoint();
    throw ParserError(Kind::unrecognized_modifier,
                      {.remainder = state.remainder(),
                       .character = modifier.value},
                      "Unrecognized group modifier '{}'", to_utf8(modifier));
  } else {
    index = state.group_count++;
  }

  auto expression = parse_expression(state);
  state.eat_or_throw(')');
  auto quantifier = parse_optional_quantifier(state);
  return state.ast.add({Node::Group{expression, index, quantifier}});
}

auto parse_anchor(ParserState &state) -> NodeIndex {
  if (state.try_eat('^')) {
    return state.ast.add({Node::StartOfString{}});
  }
  if (state.try_eat('$')) {
    return state.ast.add({Node::EndOfString{}});
  }

  state.eat_or_throw('\\');
  auto letter = state.eat_codepoint();
  switch (letter.value) {
  default:
    throw ParserError(Kind::unrecognized_anchor,
                      {.remainder = state.remainder(),
                       .character = letter.value},
                      "Unrecognized anchor '\\{}'", to_utf8(letter));
  case 'A':
    return state.ast.add({Node::StartOfStringOnly{}});
  case 'b':
    return state.ast.add({Node::WordBoundary{}});
  case 'B':
    return state.ast.add({Node::NonWordBoundary{}});
  case 'z':
    return state.ast.add({Node::EndOfStringOnlyNotNewline{}});
  case 'Z':
    return state.ast.add({Node::EndOfStringOnlyMaybeNewline{}});
  }
}

auto parse_sub_expression_item(ParserState &state) -> NodeIndex {
  if (can_parse_group(state)) {
    return parse_group(state);
  }
  if (can_parse_anchor(state)) {
    return parse_anchor(state);
  }
  return parse_match(state);
}

auto parse_expression(ParserState &state) -> NodeIndex {
  std::vector<NodeIndex> items;
  while (can_parse_sub_expression_item(state)) {
    items.push_back(parse_sub_expression_item(state));
  }

  // An empty sequence is only valid as an empty alternative or group
  if (items.empty() && not(state.is_at_end() || state.is_next('|') ||
                           state.is_next(')'))) {
    throw ParserError(Kind::invalid_expression,
                      {.remainder = state.remainder()},
                      "Invalid expression at offset {}", state.offset);
  }

  std::optional<NodeIndex> alternative;
  if (state.try_eat('|')) {
    alternative = parse_expression(state);
  }
  return state.ast.add({Node::Expression{std::move(items), alternative}});
}

auto modifier_flag(char modifier) -> RegexFlags {
  switch (modifier) {
  case 'i':
    return RegexFlags::ignore_case;
  case 's':
    return RegexFlags::dot_all;
  case 'm':
    return RegexFlags::multiline;
  case 'x':
    return RegexFlags::free_spacing;
  default:
    return RegexFlags::none;
  }
}

auto parse_inline_modifiers(ParserState &state, RegexFlags &flags) -> void {
  // `(?:` and other `(?` prefixes are left for the group parser
  while (state.matches_several("(?") &&
         (state.peek(2) == ')' || state.is_next_one_of(modifier_letters, 2))) {
    state.offset += 2;

    RegexFlags modifiers = RegexFlags::none;
    while (state.is_next_one_of(modifier_letters)) {
      modifiers |= modifier_flag(*state.peek());
      state.eat_next();
    }

    if (state.try_eat(')')) {
      flags |= modifiers;
      continue;
    }
    if (state.is_at_end()) {
      throw ParserError(Kind::unexpected_end_of_input, {},
                        "Unterminated modifier group at offset {}",
                        state.offset);
    }
    size_t offset = state.offset;
    auto modifier = state.eat_codepoint();
    state.offset = offset;
    throw ParserError(Kind::unrecognized_modifier,
                      {.remainder = state.remainder(),
                       .character = modifier.value},
                      "Unrecognized modifier '{}' at offset {}",
                      to_utf8(modifier), offset);
  }
}

// Drops unescaped whitespace and `#` comments outside of character groups
auto strip_free_spacing(std::string_view pattern) -> std::string {
  std::string result;
  bool in_group = false;
  for (size_t i = 0; i < pattern.size(); i += 1) {
    char next_char = pattern[i];
    if (next_char == '\\' && i + 1 < pattern.size()) {
      char escaped = pattern[i + 1];
      // Escaped whitespace and '#' are literals outside character groups
      if (not in_group && (whitespace.contains(escaped) || escaped == '#')) {
        result.push_back(escaped);
      } else {
        result.push_back(next_char);
        result.push_back(escaped);
      }
      i += 1;
      continue;
    }

    if (in_group) {
      in_group = next_char != ']';
      result.push_back(next_char);
      continue;
    }

    if (whitespace.contains(next_char)) {
      continue;
    }
    if (next_char == '#') {
      while (i < pattern.size() && pattern[i] != '\n') {
        i += 1;
      }
      continue;
    }
    if (next_char == '[') {
      in_group = true;
    }
    result.push_back(next_char);
  }
  return result;
}
} // namespace

auto nfaregex::to_string(ParserError::Kind kind) -> std::string_view {
  switch (kind) {
  case Kind::unexpected_token:
    return "unexpected token";
  case Kind::unexpected_end_of_input:
    return "unexpected end of input";
  case Kind::unable_to_parse_char:
    return "unable to parse character";
  case Kind::cant_parse_char_group:
    return "cannot parse character group";
  case Kind::unrecognized_anchor:
    return "unrecognized anchor";
  case Kind::unrecognized_modifier:
    return "unrecognized modifier";
  case Kind::invalid_expression:
    return "invalid expression";
  case Kind::invalid_start_to_character_class:
    return "invalid start to character class";
  case Kind::suffix_remaining:
    return "suffix remaining";
  case Kind::unrecognized_quantifier:
    return "unrecognized quantifier";
  case Kind::invalid_range_quantifier:
    return "invalid range quantifier";
  case Kind::cant_parse_range_bound:
    return "cannot parse range bound";
  case Kind::invalid_character_range:
    return "invalid character range";
  }
  return "unknown parser error";
}

auto nfaregex::run_parse(std::string_view pattern, RegexFlags &flags) -> Ast {
  ParserState state{.text = pattern, .offset = 0, .group_count = 0, .ast = {}};
  if (pattern.empty()) {
    state.ast.root = state.ast.add({Node::EmptyString{}});
    return std::move(state.ast);
  }

  parse_inline_modifiers(state, flags);

  std::string stripped;
  if (has_flag(flags, RegexFlags::free_spacing)) {
    stripped = strip_free_spacing(pattern.substr(state.offset));
    state.text = stripped;
    state.offset = 0;
  }

  if (state.is_at_end()) {
    state.ast.root = state.ast.add({Node::EmptyString{}});
    return std::move(state.ast);
  }

  // A leading '^' becomes the first item of the first alternative
  if (state.try_eat('^')) {
    auto anchor = state.ast.add({Node::StartOfString{}});
    if (state.is_at_end()) {
      state.ast.root = anchor;
      return std::move(state.ast);
    }

    auto expression = parse_expression(state);
    auto &items =
        std::get<Node::Expression>(state.ast.nodes[expression].type).items;
    items.insert(items.begin(), anchor);
    state.ast.root = expression;
  } else {
    state.ast.root = parse_expression(state);
  }

  if (not state.is_at_end()) {
    throw ParserError(Kind::suffix_remaining, {.remainder = state.remainder()},
                      "Unparsed suffix '{}' at offset {}", state.remainder(),
                      state.offset);
  }
  return std::move(state.ast);
}
