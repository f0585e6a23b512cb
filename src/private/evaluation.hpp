#pragma once

#include "private/nfa.hpp"

#include "nfaregex/ast.hpp"
#include "nfaregex/flags.hpp"
#include "nfaregex/regex.hpp"
#include "nfaregex/unicode.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace nfaregex::evaluation {
// The subject of a scan, decoded once and shared by every thread
struct Context {
  std::string_view text;
  std::vector<Codepoint> characters;
  // byte_offsets[i] is the byte offset of characters[i] in `text`, with a
  // trailing entry for text.size()
  std::vector<size_t> byte_offsets;
  RegexFlags flags;

  Context(std::string_view text, RegexFlags flags);

  auto size() const -> size_t { return characters.size(); }
  auto has_flag(RegexFlags flag) const -> bool {
    return nfaregex::has_flag(flags, flag);
  }
};

// A position plus the capture slots of one simulation thread. Cursors are
// never modified in place, unchanged capture arrays are shared between them.
class Cursor {
  size_t m_position;
  std::shared_ptr<Captures const> m_captures;

  Cursor(size_t position, std::shared_ptr<Captures const> captures)
      : m_position{position}, m_captures{std::move(captures)} {}

public:
  Cursor(size_t position, size_t group_count)
      : m_position{position},
        m_captures{std::make_shared<Captures>(2 * group_count)} {}

  auto position() const -> size_t { return m_position; }
  auto captures() const -> std::shared_ptr<Captures const> const & {
    return m_captures;
  }

  auto advanced() const -> Cursor { return {m_position + 1, m_captures}; }

  auto with_capture(size_t slot) const -> Cursor {
    auto updated = std::make_shared<Captures>(*m_captures);
    (*updated)[slot] = m_position;
    return {m_position, std::move(updated)};
  }

  // The cursor after `node` has been accepted
  auto update(Node const &node) const -> Cursor;
};

// Acceptance test of a transition label. Consuming labels test the character
// at the cursor, zero-width labels test the position.
auto accepts(Ast const &ast, NodeIndex label, Cursor const &cursor,
             Context const &context) -> bool;

// Runs the simulation from `cursor`, returning the final cursor of the
// highest priority match starting there.
auto match_suffix(RegexNFAImpl const &nfa, Cursor const &cursor,
                  Context const &context) -> std::optional<Cursor>;
} // namespace nfaregex::evaluation
