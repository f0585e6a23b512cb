#include "private/nfa.hpp"

#include "nfaregex/ast.hpp"
#include "nfaregex/common.hpp"
#include "nfaregex/flags.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <variant>
#include <vector>

using namespace nfaregex;

namespace {
using Kind = ParserError::Kind;

// Upper limit on automaton size once repetitions are unrolled
constexpr uint64_t max_states = uint64_t{1} << 24;

// State counts saturate just above the limit
auto add_counts(uint64_t lhs, uint64_t rhs) -> uint64_t {
  return std::min(lhs + rhs, max_states + 1);
}

auto multiply_counts(uint64_t count, uint64_t repetitions) -> uint64_t {
  if (count != 0 && repetitions > max_states / count) {
    return max_states + 1;
  }
  return count * repetitions;
}

struct Fragment {
  StateIndex start;
  StateIndex end;
};

class Builder {
  RegexNFAImpl &m_nfa;
  NodeIndex m_epsilon;
  NodeIndex m_group_link;
  std::vector<NodeIndex> m_group_entries;
  std::vector<NodeIndex> m_group_exits;

  auto connect(StateIndex from, NodeIndex label, StateIndex to) -> void {
    m_nfa.states[from].transitions.push_back({
        .label = label,
        .destination = to,
        .id = m_nfa.transition_count++,
    });
  }

  auto epsilon(StateIndex from, StateIndex to) -> void {
    connect(from, m_epsilon, to);
  }

  // Greedy choices try `repeat` before `exit`, lazy choices the other way
  auto choice(StateIndex from, NodeIndex repeat_label, StateIndex repeat,
              StateIndex exit, bool lazy) -> void {
    if (lazy) {
      epsilon(from, exit);
      connect(from, repeat_label, repeat);
    } else {
      connect(from, repeat_label, repeat);
      epsilon(from, exit);
    }
  }

  auto build_leaf(NodeIndex index) -> Fragment {
    auto start = add_state();
    auto end = add_state();
    connect(start, index, end);
    return {start, end};
  }

  auto build_sequence(std::vector<NodeIndex> const &items) -> Fragment {
    if (items.empty()) {
      auto state = add_state();
      return {state, state};
    }

    auto result = build(items.front());
    for (size_t i = 1; i < items.size(); i += 1) {
      auto next = build(items[i]);
      epsilon(result.end, next.start);
      result.end = next.end;
    }
    return result;
  }

  auto build_expression(Node::Expression const &expression) -> Fragment {
    auto sequence = build_sequence(expression.items);
    if (not expression.alternative.has_value()) {
      return sequence;
    }

    // The left branch is attempted first
    auto alternative = build(*expression.alternative);
    auto start = add_state();
    auto end = add_state();
    epsilon(start, sequence.start);
    epsilon(start, alternative.start);
    epsilon(sequence.end, end);
    epsilon(alternative.end, end);
    return {start, end};
  }

  auto build_group_body(Node::Group const &group) -> Fragment {
    auto inner = build(group.expression);
    if (not group.index.has_value()) {
      return inner;
    }

    auto start = add_state();
    auto end = add_state();
    connect(start, m_group_entries[*group.index], inner.start);
    connect(inner.end, m_group_exits[*group.index], end);
    return {start, end};
  }

  // `build_once` emits a fresh copy of the quantified subgraph on every call
  template <typename BuildFn>
  auto build_quantified(Quantifier const &quantifier, BuildFn const &build_once)
      -> Fragment {
    return std::visit(
        Overload{
            [&](Quantifier::None) { return build_once(); },
            [&](Quantifier::ZeroOrOne q) {
              auto start = add_state();
              auto body = build_once();
              auto end = add_state();
              choice(start, m_epsilon, body.start, end, q.lazy);
              epsilon(body.end, end);
              return Fragment{start, end};
            },
            [&](Quantifier::ZeroOrMore q) {
              auto start = add_state();
              auto body = build_once();
              auto end = add_state();
              choice(start, m_epsilon, body.start, end, q.lazy);
              connect(body.end, m_group_link, start);
              return Fragment{start, end};
            },
            [&](Quantifier::OneOrMore q) {
              auto body = build_once();
              auto loop = add_state();
              auto end = add_state();
              epsilon(body.end, loop);
              choice(loop, m_group_link, body.start, end, q.lazy);
              return Fragment{body.start, end};
            },
            [&](Quantifier::Range const &q) {
              return build_range(q, build_once);
            },
        },
        quantifier.type);
  }

  template <typename BuildFn>
  auto build_range(Quantifier::Range const &range, BuildFn const &build_once)
      -> Fragment {
    auto start = add_state();
    auto current = start;
    for (uint64_t i = 0; i < range.lower; i += 1) {
      auto body = build_once();
      epsilon(current, body.start);
      current = body.end;
    }

    return std::visit(
        Overload{
            [&](UpperBound::Undefined) { return Fragment{start, current}; },
            [&](UpperBound::Unbounded) {
              auto star = build_quantified(
                  Quantifier{Quantifier::ZeroOrMore{range.lazy}}, build_once);
              epsilon(current, star.start);
              return Fragment{start, star.end};
            },
            [&](UpperBound::Bounded bounded) {
              // Every optional copy may bail out to the shared end state
              auto end = add_state();
              for (uint64_t i = range.lower; i < bounded.value; i += 1) {
                auto body = build_once();
                choice(current, m_epsilon, body.start, end, range.lazy);
                current = body.end;
              }
              epsilon(current, end);
              return Fragment{start, end};
            },
        },
        range.upper.type);
  }

public:
  explicit Builder(RegexNFAImpl &nfa) : m_nfa{nfa} {
    size_t group_count = 0;
    for (auto const &node : m_nfa.ast.nodes) {
      if (auto const *group = std::get_if<Node::Group>(&node.type)) {
        if (group->index.has_value()) {
          group_count = std::max(group_count, *group->index + 1);
        }
      }
    }
    m_nfa.group_count = group_count;

    // Zero-width labels are allocated up front so that building never grows
    // the node arena while a node is referenced
    m_epsilon = m_nfa.ast.add({Node::Epsilon{}});
    m_group_link = m_nfa.ast.add({Node::GroupLink{}});
    for (size_t group = 0; group < group_count; group += 1) {
      m_group_entries.push_back(m_nfa.ast.add({Node::GroupEntry{group}}));
      m_group_exits.push_back(m_nfa.ast.add({Node::GroupExit{group}}));
    }
  }

  auto add_state() -> StateIndex {
    m_nfa.states.emplace_back();
    return static_cast<StateIndex>(m_nfa.states.size() - 1);
  }

  // The number of states `build(index)` adds
  auto count_states(NodeIndex index) const -> uint64_t {
    return std::visit(
        Overload{
            [&](Node::Match const &match) {
              return count_quantified(match.quantifier,
                                      count_states(match.item));
            },
            [&](Node::Expression const &expression) {
              uint64_t count = expression.items.empty() ? 1 : 0;
              for (auto item : expression.items) {
                count = add_counts(count, count_states(item));
              }
              if (expression.alternative.has_value()) {
                count = add_counts(
                    count, count_states(*expression.alternative) + 2);
              }
              return count;
            },
            [&](Node::Group const &group) {
              auto body = count_states(group.expression);
              if (group.index.has_value()) {
                body = add_counts(body, 2);
              }
              return count_quantified(group.quantifier, body);
            },
            [](auto const &) -> uint64_t { return 2; },
        },
        m_nfa.ast[index].type);
  }

  auto count_quantified(Quantifier const &quantifier, uint64_t body) const
      -> uint64_t {
    return std::visit(
        Overload{
            [&](Quantifier::None) { return body; },
            [&](Quantifier::Range const &range) {
              auto count = add_counts(1, multiply_counts(body, range.lower));
              return std::visit(
                  Overload{
                      [&](UpperBound::Undefined) { return count; },
                      [&](UpperBound::Unbounded) {
                        return add_counts(count, add_counts(body, 2));
                      },
                      [&](UpperBound::Bounded bounded) {
                        auto optional = multiply_counts(
                            body, bounded.value - range.lower);
                        return add_counts(count, add_counts(optional, 1));
                      },
                  },
                  range.upper.type);
            },
            [&](auto const &) { return add_counts(body, 2); },
        },
        quantifier.type);
  }

  auto check_state_budget(NodeIndex root) const -> void {
    auto count = count_states(root);
    if (count > max_states) {
      throw ParserError(Kind::cant_parse_range_bound, {},
                        "Pattern needs more than {} automaton states once "
                        "repetitions are expanded",
                        max_states);
    }
  }

  auto add_epsilon(StateIndex from, StateIndex to) -> void {
    epsilon(from, to);
  }

  auto build(NodeIndex index) -> Fragment {
    return std::visit(
        Overload{
            [&](Node::Match const &match) {
              return build_quantified(match.quantifier,
                                      [&] { return build(match.item); });
            },
            [&](Node::Expression const &expression) {
              return build_expression(expression);
            },
            [&](Node::Group const &group) {
              return build_quantified(group.quantifier,
                                      [&] { return build_group_body(group); });
            },
            [&](Node::Epsilon) -> Fragment { throw_automaton_node(index); },
            [&](Node::GroupLink) -> Fragment { throw_automaton_node(index); },
            [&](Node::GroupEntry) -> Fragment { throw_automaton_node(index); },
            [&](Node::GroupExit) -> Fragment { throw_automaton_node(index); },
            [&](auto const &) { return build_leaf(index); },
        },
        m_nfa.ast[index].type);
  }

  [[noreturn]] auto throw_automaton_node(NodeIndex index) const -> void {
    throw RegexError("Automaton node '{}' found in parse tree",
                     format_node(m_nfa.ast, index));
  }
};
} // namespace

auto nfaregex::build_nfa(Ast ast, RegexFlags flags) -> RegexNFAImpl {
  RegexNFAImpl nfa{
      .ast = std::move(ast),
      .states = {},
      .start = 0,
      .accept = 0,
      .transition_count = 0,
      .group_count = 0,
      .flags = flags,
  };

  Builder builder{nfa};
  builder.check_state_budget(nfa.ast.root);
  nfa.start = builder.add_state();
  auto fragment = builder.build(nfa.ast.root);
  nfa.accept = builder.add_state();

  builder.add_epsilon(nfa.start, fragment.start);
  builder.add_epsilon(fragment.end, nfa.accept);
  return nfa;
}
