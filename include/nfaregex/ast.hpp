#pragma once

#include "unicode.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace nfaregex {
using NodeIndex = uint32_t;

struct UpperBound {
  // No ',' inside the braces: `{n}`
  struct Undefined {
    auto operator==(Undefined const &) const -> bool = default;
  };
  // `{n,}`
  struct Unbounded {
    auto operator==(Unbounded const &) const -> bool = default;
  };
  struct Bounded {
    uint64_t value;
    auto operator==(Bounded const &) const -> bool = default;
  };

  using UpperBoundVariant = std::variant<Undefined, Unbounded, Bounded>;
  UpperBoundVariant type;

  auto operator==(UpperBound const &) const -> bool = default;
};

struct Quantifier {
  struct None {
    auto operator==(None const &) const -> bool = default;
  };
  struct OneOrMore {
    bool lazy;
    auto operator==(OneOrMore const &) const -> bool = default;
  };
  struct ZeroOrMore {
    bool lazy;
    auto operator==(ZeroOrMore const &) const -> bool = default;
  };
  struct ZeroOrOne {
    bool lazy;
    auto operator==(ZeroOrOne const &) const -> bool = default;
  };
  struct Range {
    uint64_t lower;
    UpperBound upper;
    bool lazy;
    auto operator==(Range const &) const -> bool = default;
  };

  using QuantifierVariant =
      std::variant<None, OneOrMore, ZeroOrMore, ZeroOrOne, Range>;
  QuantifierVariant type;

  auto operator==(Quantifier const &) const -> bool = default;
};

// The parse tree doubles as the label set of the automaton: leaf nodes are
// placed directly on transitions, compound nodes are expanded by the builder.
struct Node {
  // Consuming leaves
  struct Character {
    Codepoint value;
    auto operator==(Character const &) const -> bool = default;
  };
  struct CharacterRange {
    Codepoint lower;
    Codepoint upper;
    auto operator==(CharacterRange const &) const -> bool = default;
  };
  struct AnyCharacter {
    auto operator==(AnyCharacter const &) const -> bool = default;
  };
  struct CharacterGroup {
    std::vector<NodeIndex> items;
    bool negated;
    auto operator==(CharacterGroup const &) const -> bool = default;
  };

  // Compound nodes
  struct Match {
    NodeIndex item;
    Quantifier quantifier;
    auto operator==(Match const &) const -> bool = default;
  };
  // A sequence of items, optionally followed by `| alternative`
  struct Expression {
    std::vector<NodeIndex> items;
    std::optional<NodeIndex> alternative;
    auto operator==(Expression const &) const -> bool = default;
  };
  struct Group {
    NodeIndex expression;
    std::optional<size_t> index; // std::nullopt for `(?:...)`
    Quantifier quantifier;
    auto operator==(Group const &) const -> bool = default;
  };

  // Zero-width nodes only created by the automaton builder
  struct Epsilon {
    auto operator==(Epsilon const &) const -> bool = default;
  };
  struct GroupLink {
    auto operator==(GroupLink const &) const -> bool = default;
  };
  struct GroupEntry {
    size_t index;
    auto operator==(GroupEntry const &) const -> bool = default;
  };
  struct GroupExit {
    size_t index;
    auto operator==(GroupExit const &) const -> bool = default;
  };

  // Anchors
  struct StartOfString {
    auto operator==(StartOfString const &) const -> bool = default;
  };
  struct EndOfString {
    auto operator==(EndOfString const &) const -> bool = default;
  };
  struct StartOfStringOnly {
    auto operator==(StartOfStringOnly const &) const -> bool = default;
  };
  struct EndOfStringOnlyNotNewline {
    auto operator==(EndOfStringOnlyNotNewline const &) const -> bool = default;
  };
  struct EndOfStringOnlyMaybeNewline {
    auto operator==(EndOfStringOnlyMaybeNewline const &) const
        -> bool = default;
  };
  struct WordBoundary {
    auto operator==(WordBoundary const &) const -> bool = default;
  };
  struct NonWordBoundary {
    auto operator==(NonWordBoundary const &) const -> bool = default;
  };
  struct EmptyString {
    auto operator==(EmptyString const &) const -> bool = default;
  };

  using NodeVariant =
      std::variant<Character, CharacterRange, AnyCharacter, CharacterGroup,
                   Match, Expression, Group, Epsilon, GroupLink, GroupEntry,
                   GroupExit, StartOfString, EndOfString, StartOfStringOnly,
                   EndOfStringOnlyNotNewline, EndOfStringOnlyMaybeNewline,
                   WordBoundary, NonWordBoundary, EmptyString>;
  NodeVariant type;

  auto operator==(Node const &) const -> bool = default;

  // True for nodes which advance the input by one character when accepted
  auto is_consuming() const -> bool;
  // True for nodes which can never be a transition label
  auto is_compound() const -> bool;
};

// Nodes are stored in an arena and refer to their children by index. Every
// child index is smaller than the index of its parent.
struct Ast {
  std::vector<Node> nodes;
  NodeIndex root = 0;

  auto add(Node node) -> NodeIndex {
    nodes.push_back(std::move(node));
    return static_cast<NodeIndex>(nodes.size() - 1);
  }

  auto operator[](NodeIndex index) const -> Node const & {
    return nodes[index];
  }

  auto operator==(Ast const &) const -> bool = default;
};

// Renders the subtree at `index` back into pattern syntax
auto format_node(Ast const &ast, NodeIndex index) -> std::string;
auto format_quantifier(Quantifier const &quantifier) -> std::string;
} // namespace nfaregex
