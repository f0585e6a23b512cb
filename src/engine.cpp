#include "private/evaluation.hpp"
#include "private/nfa.hpp"

#include "nfaregex/ast.hpp"
#include "nfaregex/common.hpp"
#include "nfaregex/flags.hpp"
#include "nfaregex/unicode.hpp"

#include <cstddef>
#include <optional>
#include <utility>
#include <variant>
#include <vector>

using namespace nfaregex;
using namespace nfaregex::evaluation;

namespace {
struct Thread {
  Transition const *transition;
  Cursor cursor;
  // Set for zero-width transitions which already reached the accept state
  bool is_accepting;
};

// Transitions already expanded in the level under construction. Each level
// gets a new generation instead of clearing the storage.
class VisitedSet {
  std::vector<size_t> m_generation_of;
  size_t m_generation = 1;

public:
  explicit VisitedSet(size_t transition_count)
      : m_generation_of(transition_count, 0) {}

  auto next_level() -> void { m_generation += 1; }

  auto insert(Transition const &transition) -> bool {
    if (m_generation_of[transition.id] == m_generation) {
      return false;
    }
    m_generation_of[transition.id] = m_generation;
    return true;
  }
};

auto character_at(Cursor const &cursor, Context const &context)
    -> std::optional<Codepoint> {
  if (cursor.position() >= context.size()) {
    return std::nullopt;
  }
  return context.characters[cursor.position()];
}

auto equals(Codepoint lhs, Codepoint rhs, Context const &context) -> bool {
  if (lhs == rhs) {
    return true;
  }
  return context.has_flag(RegexFlags::ignore_case) &&
         to_lower(lhs) == to_lower(rhs);
}

auto in_range(Codepoint codepoint, Node::CharacterRange const &range,
              Context const &context) -> bool {
  auto contains = [&](Codepoint c) {
    return range.lower <= c && c <= range.upper;
  };
  if (contains(codepoint)) {
    return true;
  }
  return context.has_flag(RegexFlags::ignore_case) &&
         (contains(to_lower(codepoint)) || contains(to_upper(codepoint)));
}

auto is_newline_at(Context const &context, size_t position) -> bool {
  return position < context.size() && context.characters[position] == '\n';
}

auto is_word_at(Context const &context, size_t position) -> bool {
  return position < context.size() &&
         is_word_character(context.characters[position]);
}

auto is_end_or_final_newline(Context const &context, size_t position) -> bool {
  return position == context.size() ||
         (position + 1 == context.size() && is_newline_at(context, position));
}

auto accepts_character(Ast const &ast, NodeIndex label, Codepoint codepoint,
                       Context const &context) -> bool {
  return std::visit(
      Overload{
          [&](Node::Character const &c) {
            return equals(codepoint, c.value, context);
          },
          [&](Node::CharacterRange const &range) {
            return in_range(codepoint, range, context);
          },
          [&](Node::AnyCharacter) {
            return codepoint != '\n' || context.has_flag(RegexFlags::dot_all);
          },
          [&](Node::CharacterGroup const &group) {
            bool is_member = false;
            for (auto item : group.items) {
              if (accepts_character(ast, item, codepoint, context)) {
                is_member = true;
                break;
              }
            }
            return is_member != group.negated;
          },
          [&](auto const &) -> bool {
            throw RegexError("Node '{}' cannot match a character",
                             format_node(ast, label));
          },
      },
      ast[label].type);
}

auto accepts_position(Ast const &ast, NodeIndex label, size_t position,
                      Context const &context) -> bool {
  bool const multiline = context.has_flag(RegexFlags::multiline);
  return std::visit(
      Overload{
          [](Node::Epsilon) { return true; },
          [](Node::GroupLink) { return true; },
          [](Node::GroupEntry) { return true; },
          [](Node::GroupExit) { return true; },
          [&](Node::StartOfString) {
            return position == 0 ||
                   (multiline && is_newline_at(context, position - 1));
          },
          [&](Node::EndOfString) {
            return is_end_or_final_newline(context, position) ||
                   (multiline && is_newline_at(context, position));
          },
          [&](Node::StartOfStringOnly) { return position == 0; },
          [&](Node::EndOfStringOnlyNotNewline) {
            return position == context.size();
          },
          [&](Node::EndOfStringOnlyMaybeNewline) {
            return is_end_or_final_newline(context, position);
          },
          [&](Node::WordBoundary) {
            bool before = position > 0 && is_word_at(context, position - 1);
            return before != is_word_at(context, position);
          },
          [&](Node::NonWordBoundary) {
            bool before = position > 0 && is_word_at(context, position - 1);
            return before == is_word_at(context, position);
          },
          [&](Node::EmptyString) { return position == 0; },
          [&](auto const &) -> bool {
            throw RegexError("Node '{}' is not a zero-width assertion",
                             format_node(ast, label));
          },
      },
      ast[label].type);
}

// Depth-first walk of the zero-width transitions reachable from `state`,
// appending reachable consuming transitions (and accepting ones) to `out` in
// priority order.
auto expand(RegexNFAImpl const &nfa, StateIndex state, Cursor const &cursor,
            Context const &context, VisitedSet &visited,
            std::vector<Thread> &out) -> void {
  std::vector<std::pair<Transition const *, Cursor>> stack;
  auto push_transitions = [&](StateIndex from, Cursor const &at) {
    auto const &transitions = nfa.states[from].transitions;
    for (auto it = transitions.rbegin(); it != transitions.rend(); ++it) {
      stack.emplace_back(&*it, at);
    }
  };
  push_transitions(state, cursor);

  while (not stack.empty()) {
    auto [transition, at] = std::move(stack.back());
    stack.pop_back();

    if (not visited.insert(*transition)) {
      continue;
    }

    auto const &label = nfa.ast[transition->label];
    if (label.is_consuming()) {
      out.push_back({transition, std::move(at), false});
      continue;
    }

    if (not accepts(nfa.ast, transition->label, at, context)) {
      continue;
    }

    auto next = at.update(label);
    if (transition->destination == nfa.accept) {
      out.push_back({transition, std::move(next), true});
      continue;
    }
    push_transitions(transition->destination, next);
  }
}
} // namespace

Context::Context(std::string_view text, RegexFlags flags)
    : text{text}, flags{flags} {
  size_t offset = 0;
  while (offset < text.size()) {
    size_t size;
    characters.push_back(parse_utf8_char(text.substr(offset), size));
    byte_offsets.push_back(offset);
    offset += size;
  }
  byte_offsets.push_back(text.size());
}

auto Cursor::update(Node const &node) const -> Cursor {
  return std::visit(
      Overload{
          [&](Node::GroupEntry entry) { return with_capture(2 * entry.index); },
          [&](Node::GroupExit exit) {
            return with_capture(2 * exit.index + 1);
          },
          [&](auto const &) {
            return node.is_consuming() ? advanced() : *this;
          },
      },
      node.type);
}

auto evaluation::accepts(Ast const &ast, NodeIndex label, Cursor const &cursor,
                         Context const &context) -> bool {
  auto const &node = ast[label];
  if (node.is_compound()) {
    throw RegexError("Compound node '{}' used as a transition label",
                     format_node(ast, label));
  }

  if (node.is_consuming()) {
    auto codepoint = character_at(cursor, context);
    return codepoint.has_value() &&
           accepts_character(ast, label, *codepoint, context);
  }
  return accepts_position(ast, label, cursor.position(), context);
}

auto evaluation::match_suffix(RegexNFAImpl const &nfa, Cursor const &cursor,
                              Context const &context) -> std::optional<Cursor> {
  VisitedSet visited{nfa.transition_count};
  std::vector<Thread> queue;
  std::vector<Thread> frontier;
  expand(nfa, nfa.start, cursor, context, visited, queue);

  std::optional<Cursor> result;
  while (not queue.empty()) {
    visited.next_level();
    frontier.clear();

    for (auto const &thread : queue) {
      if (thread.is_accepting) {
        // Lower priority threads of this level are dropped
        result = thread.cursor;
        break;
      }

      if (not accepts(nfa.ast, thread.transition->label, thread.cursor,
                      context)) {
        continue;
      }

      auto next = thread.cursor.advanced();
      if (thread.transition->destination == nfa.accept) {
        result = next;
        break;
      }
      expand(nfa, thread.transition->destination, next, context, visited,
             frontier);
    }
    std::swap(queue, frontier);
  }
  return result;
}
