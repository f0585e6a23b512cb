#include "nfaregex/ast.hpp"
#include "nfaregex/common.hpp"
#include "nfaregex/unicode.hpp"

#include <format>
#include <string>
#include <string_view>
#include <variant>

using namespace nfaregex;
using namespace std::string_view_literals;

namespace {
constexpr auto needs_escape = R"($()*+-.?[\]^{|})"sv;

auto format_character(Codepoint codepoint) -> std::string {
  switch (codepoint.value) {
  case '\n':
    return "\\n";
  case '\r':
    return "\\r";
  case '\t':
    return "\\t";
  case '\f':
    return "\\f";
  case '\v':
    return "\\v";
  default:
    break;
  }

  std::string output;
  if (codepoint.value < 0x80 && needs_escape.contains(char(codepoint.value))) {
    output += '\\';
  }
  codepoint_to_utf8(output, codepoint);
  return output;
}

auto format_upper_bound(UpperBound const &upper) -> std::string {
  return std::visit(
      Overload{
          [](UpperBound::Undefined) -> std::string { return ""; },
          [](UpperBound::Unbounded) -> std::string { return ","; },
          [](UpperBound::Bounded bounded) -> std::string {
            return std::format(",{}", bounded.value);
          },
      },
      upper.type);
}
} // namespace

auto Node::is_consuming() const -> bool {
  return std::holds_alternative<Character>(type) ||
         std::holds_alternative<CharacterRange>(type) ||
         std::holds_alternative<AnyCharacter>(type) ||
         std::holds_alternative<CharacterGroup>(type);
}

auto Node::is_compound() const -> bool {
  return std::holds_alternative<Match>(type) ||
         std::holds_alternative<Expression>(type) ||
         std::holds_alternative<Group>(type);
}

auto nfaregex::format_quantifier(Quantifier const &quantifier) -> std::string {
  auto lazy_suffix = [](bool lazy) { return lazy ? "?"sv : ""sv; };

  return std::visit(
      Overload{
          [](Quantifier::None) -> std::string { return ""; },
          [&](Quantifier::OneOrMore q) -> std::string {
            return std::format("+{}", lazy_suffix(q.lazy));
          },
          [&](Quantifier::ZeroOrMore q) -> std::string {
            return std::format("*{}", lazy_suffix(q.lazy));
          },
          [&](Quantifier::ZeroOrOne q) -> std::string {
            return std::format("?{}", lazy_suffix(q.lazy));
          },
          [&](Quantifier::Range const &q) -> std::string {
            return std::format("{{{}{}}}{}", q.lower,
                               format_upper_bound(q.upper),
                               lazy_suffix(q.lazy));
          },
      },
      quantifier.type);
}

auto nfaregex::format_node(Ast const &ast, NodeIndex index) -> std::string {
  return std::visit(
      Overload{
          [](Node::Character const &c) { return format_character(c.value); },
          [](Node::CharacterRange const &range) {
            return std::format("{}-{}", format_character(range.lower),
                               format_character(range.upper));
          },
          [](Node::AnyCharacter) -> std::string { return "."; },
          [&](Node::CharacterGroup const &group) {
            std::string output = group.negated ? "[^" : "[";
            for (auto item : group.items) {
              output += format_node(ast, item);
            }
            output += "]";
            return output;
          },
          [&](Node::Match const &match) {
            return format_node(ast, match.item) +
                   format_quantifier(match.quantifier);
          },
          [&](Node::Expression const &expression) {
            std::string output;
            for (auto item : expression.items) {
              output += format_node(ast, item);
            }
            if (expression.alternative.has_value()) {
              output += "|" + format_node(ast, *expression.alternative);
            }
            return output;
          },
          [&](Node::Group const &group) {
            return std::format("({}{}){}", group.index ? "" : "?:",
                               format_node(ast, group.expression),
                               format_quantifier(group.quantifier));
          },
          [](Node::Epsilon) -> std::string { return "ε"; },
          [](Node::GroupLink) -> std::string { return "link"; },
          [](Node::GroupEntry entry) {
            return std::format("enter({})", entry.index);
          },
          [](Node::GroupExit exit) {
            return std::format("exit({})", exit.index);
          },
          [](Node::StartOfString) -> std::string { return "^"; },
          [](Node::EndOfString) -> std::string { return "$"; },
          [](Node::StartOfStringOnly) -> std::string { return "\\A"; },
          [](Node::EndOfStringOnlyNotNewline) -> std::string { return "\\z"; },
          [](Node::EndOfStringOnlyMaybeNewline) -> std::string {
            return "\\Z";
          },
          [](Node::WordBoundary) -> std::string { return "\\b"; },
          [](Node::NonWordBoundary) -> std::string { return "\\B"; },
          [](Node::EmptyString) -> std::string { return ""; },
      },
      ast[index].type);
}
