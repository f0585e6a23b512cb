#include "regex_test_common.hpp"
#include "testing.hpp"

#include "nfaregex/ast.hpp"
#include "nfaregex/common.hpp"
#include "nfaregex/flags.hpp"
#include "nfaregex/parser.hpp"

#include <optional>
#include <string_view>
#include <utility>
#include <variant>

using namespace std::literals;
using namespace nfaregex;
using Kind = ParserError::Kind;

namespace {
auto parse(std::string_view pattern) -> Ast {
  RegexFlags flags = RegexFlags::none;
  return run_parse(pattern, flags);
}

auto root_node(Ast const &ast) -> Node const & { return ast[ast.root]; }

template <typename T> auto holds(Ast const &ast, NodeIndex index) -> bool {
  return std::holds_alternative<T>(ast[index].type);
}

auto children_precede_parents(Ast const &ast) -> bool {
  auto below = [](NodeIndex child, size_t parent) { return child < parent; };
  for (size_t index = 0; index < ast.nodes.size(); index += 1) {
    auto const &type = ast.nodes[index].type;
    if (auto const *match = std::get_if<Node::Match>(&type)) {
      if (not below(match->item, index)) {
        return false;
      }
    } else if (auto const *group = std::get_if<Node::Group>(&type)) {
      if (not below(group->expression, index)) {
        return false;
      }
    } else if (auto const *expr = std::get_if<Node::Expression>(&type)) {
      for (auto item : expr->items) {
        if (not below(item, index)) {
          return false;
        }
      }
      if (expr->alternative && not below(*expr->alternative, index)) {
        return false;
      }
    } else if (auto const *chars = std::get_if<Node::CharacterGroup>(&type)) {
      for (auto item : chars->items) {
        if (not below(item, index)) {
          return false;
        }
      }
    }
  }
  return true;
}
} // namespace

TEST_CASE(parse_sequence_shape, "[parser]") {
  auto ast = parse("ab");
  auto const *expression = std::get_if<Node::Expression>(&root_node(ast).type);
  REQUIRE(expression != nullptr);
  REQUIRE(expression->items.size() == 2);
  CHECK(not expression->alternative.has_value());

  auto const &first = std::get<Node::Match>(ast[expression->items[0]].type);
  CHECK(first.quantifier == Quantifier{Quantifier::None{}});
  CHECK(ast[first.item].type ==
        Node::NodeVariant{Node::Character{Codepoint{'a'}}});
}

TEST_CASE(parse_alternation_is_right_nested, "[parser]") {
  auto ast = parse("a|b|c");
  auto const &top = std::get<Node::Expression>(root_node(ast).type);
  REQUIRE(top.alternative.has_value());
  auto const &middle = std::get<Node::Expression>(ast[*top.alternative].type);
  REQUIRE(middle.alternative.has_value());
  auto const &last = std::get<Node::Expression>(ast[*middle.alternative].type);
  CHECK(not last.alternative.has_value());
  CHECK(last.items.size() == 1);
}

TEST_CASE(parse_quantifiers, "[parser]") {
  auto quantifier_of = [](std::string_view pattern) {
    auto ast = parse(pattern);
    auto const &expression = std::get<Node::Expression>(root_node(ast).type);
    return std::get<Node::Match>(ast[expression.items[0]].type).quantifier;
  };

  CHECK(quantifier_of("a*") == Quantifier{Quantifier::ZeroOrMore{false}});
  CHECK(quantifier_of("a*?") == Quantifier{Quantifier::ZeroOrMore{true}});
  CHECK(quantifier_of("a+") == Quantifier{Quantifier::OneOrMore{false}});
  CHECK(quantifier_of("a??") == Quantifier{Quantifier::ZeroOrOne{true}});

  Quantifier::Range exact{.lower = 3,
                          .upper = {UpperBound::Undefined{}},
                          .lazy = false};
  CHECK(quantifier_of("a{3}") == Quantifier{exact});

  Quantifier::Range open{.lower = 2,
                         .upper = {UpperBound::Unbounded{}},
                         .lazy = true};
  CHECK(quantifier_of("a{2,}?") == Quantifier{open});

  Quantifier::Range bounded{.lower = 0,
                            .upper = {UpperBound::Bounded{4}},
                            .lazy = false};
  CHECK(quantifier_of("a{,4}") == Quantifier{bounded});
}

TEST_CASE(parse_groups_are_numbered_in_order, "[parser]") {
  auto ast = parse("(a)(?:b)((c))");
  std::vector<std::optional<size_t>> indices;
  for (auto const &node : ast.nodes) {
    if (auto const *group = std::get_if<Node::Group>(&node.type)) {
      indices.push_back(group->index);
    }
  }
  // Inner groups are completed, and stored, before the enclosing group
  CHECK(indices == std::vector<std::optional<size_t>>(
                       {0, std::nullopt, 2, 1}));
}

TEST_CASE(parse_character_class_shapes, "[parser]") {
  auto ast = parse(R"(\D)");
  auto const &expression = std::get<Node::Expression>(root_node(ast).type);
  auto const &match = std::get<Node::Match>(ast[expression.items[0]].type);
  auto const &group = std::get<Node::CharacterGroup>(ast[match.item].type);
  CHECK(group.negated);
  REQUIRE(group.items.size() == 1);
  CHECK((ast[group.items[0]].type ==
         Node::NodeVariant{Node::CharacterRange{'0', '9'}}));
}

TEST_CASE(parse_anchors, "[parser]") {
  auto ast = parse(R"(^\A\b\B\z\Z$)");
  auto const &expression = std::get<Node::Expression>(root_node(ast).type);
  REQUIRE(expression.items.size() == 7);
  CHECK(holds<Node::StartOfString>(ast, expression.items[0]));
  CHECK(holds<Node::StartOfStringOnly>(ast, expression.items[1]));
  CHECK(holds<Node::WordBoundary>(ast, expression.items[2]));
  CHECK(holds<Node::NonWordBoundary>(ast, expression.items[3]));
  CHECK(holds<Node::EndOfStringOnlyNotNewline>(ast, expression.items[4]));
  CHECK(holds<Node::EndOfStringOnlyMaybeNewline>(ast, expression.items[5]));
  CHECK(holds<Node::EndOfString>(ast, expression.items[6]));
}

TEST_CASE(parse_empty_pattern, "[parser]") {
  CHECK(holds<Node::EmptyString>(parse(""), parse("").root));

  RegexFlags flags = RegexFlags::none;
  auto ast = run_parse("(?im)", flags);
  CHECK(holds<Node::EmptyString>(ast, ast.root));
  CHECK(flags == (RegexFlags::ignore_case | RegexFlags::multiline));
}

TEST_CASE(parse_inline_modifiers, "[parser]") {
  RegexFlags flags = RegexFlags::dot_all;
  auto ast = run_parse("(?i)(?x)a", flags);
  CHECK(flags == (RegexFlags::dot_all | RegexFlags::ignore_case |
                  RegexFlags::free_spacing));
  CHECK(ast == parse("a"));

  // `(?:` at the start is a group, not a modifier block
  RegexFlags group_flags = RegexFlags::none;
  auto group_ast = run_parse("(?:a)", group_flags);
  CHECK(group_flags == RegexFlags::none);
  auto const &expression = std::get<Node::Expression>(root_node(group_ast).type);
  REQUIRE(expression.items.size() == 1);
  CHECK(holds<Node::Group>(group_ast, expression.items[0]));
}

TEST_CASE(parse_is_deterministic, "[parser]") {
  for (auto pattern : {R"(a(b|c)*d{2,5}?)"sv, R"([^\w-]+\b$)"sv,
                       R"((?:x|)+|\Ay)"sv}) {
    auto first = parse(pattern);
    auto second = parse(pattern);
    CHECK(first == second);
    CHECK(children_precede_parents(first));
  }
}

TEST_CASE(format_round_trip, "[parser]") {
  for (auto pattern : {R"(a(b|c)*d{2,5}?)"sv, R"((?:x|y)+\.)"sv,
                       R"([^a-z\]]$)"sv}) {
    auto ast = parse(pattern);
    CHECK(parse(format_node(ast, ast.root)) == ast);
  }
}

TEST_CASE(parse_errors, "[parser][errors]") {
  CHECK(parse_error_kind("a)") == Kind::suffix_remaining);
  CHECK(parse_error_kind("(a") == Kind::unexpected_end_of_input);
  CHECK(parse_error_kind("[abc") == Kind::unexpected_end_of_input);
  CHECK(parse_error_kind("[]") == Kind::cant_parse_char_group);
  CHECK(parse_error_kind(R"(\G)") == Kind::unrecognized_anchor);
  CHECK(parse_error_kind("a(?Pb)") == Kind::unrecognized_modifier);
  CHECK(parse_error_kind("(?iq)") == Kind::unrecognized_modifier);
  CHECK(parse_error_kind("*a") == Kind::invalid_expression);
  CHECK(parse_error_kind("a**") == Kind::suffix_remaining);
  CHECK(parse_error_kind("a{x}") == Kind::cant_parse_range_bound);
  CHECK(parse_error_kind("a{99999999999999999999}") ==
        Kind::cant_parse_range_bound);
  CHECK(parse_error_kind("a{2") == Kind::unexpected_end_of_input);
  CHECK(parse_error_kind("a{2x}") == Kind::unexpected_token);
  CHECK(parse_error_kind("abc") == std::nullopt);
}

TEST_CASE(parse_error_details, "[parser][errors]") {
  auto range_error = parse_error("a{3,1}");
  REQUIRE(range_error.has_value());
  CHECK(range_error->kind() == Kind::invalid_range_quantifier);
  CHECK(range_error->range_bounds() ==
        std::optional(std::pair<uint64_t, uint64_t>(3, 1)));

  auto class_error = parse_error("[z-a]");
  REQUIRE(class_error.has_value());
  CHECK(class_error->kind() == Kind::invalid_character_range);
  CHECK(class_error->character_range() ==
        std::optional(std::pair<char32_t, char32_t>(U'z', U'a')));

  auto suffix_error = parse_error("ab)cd");
  REQUIRE(suffix_error.has_value());
  CHECK(suffix_error->remainder() == ")cd");

  auto anchor_error = parse_error(R"(\G)");
  REQUIRE(anchor_error.has_value());
  CHECK(anchor_error->character() == std::optional(U'G'));
}

TEST_CASE(repetition_counts_are_limited, "[parser][errors]") {
  CHECK(parse_error_kind("a{65535}") == std::nullopt);
  CHECK(parse_error_kind("a{2,65535}") == std::nullopt);
  CHECK(parse_error_kind("a{65536}") == Kind::cant_parse_range_bound);
  CHECK(parse_error_kind("a{1,70000}") == Kind::cant_parse_range_bound);
  CHECK(parse_error_kind("a{70000,}") == Kind::cant_parse_range_bound);

  auto huge = parse_error("a{4294967297}");
  REQUIRE(huge.has_value());
  CHECK(huge->kind() == Kind::cant_parse_range_bound);
  CHECK(huge->range_bounds() ==
        std::optional(std::pair<uint64_t, uint64_t>(4294967297, 4294967297)));

  auto bounded = parse_error("a{2,100000}");
  REQUIRE(bounded.has_value());
  CHECK(bounded->range_bounds() ==
        std::optional(std::pair<uint64_t, uint64_t>(2, 100000)));

  // Nested repetitions multiply once unrolled
  CHECK(parse_error_kind("(?:a{100}){100}") == std::nullopt);
  CHECK(parse_error_kind("(a{4096}){4096}") == Kind::cant_parse_range_bound);
  CHECK(parse_error_kind("((a{300}){300}){300}") ==
        Kind::cant_parse_range_bound);
  CHECK_THROWS_AS(compile("(?:x{65535}|y){65535}"), ParserError);
}

TEST_CASE(parser_error_is_regex_error, "[parser][errors]") {
  CHECK_THROWS_AS(compile("(a"), ParserError);
  CHECK_THROWS_AS(compile("(a"), RegexError);
  CHECK(to_string(Kind::suffix_remaining) == "suffix remaining"sv);
}
