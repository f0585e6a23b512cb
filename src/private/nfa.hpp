#pragma once

#include "nfaregex/ast.hpp"
#include "nfaregex/flags.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace nfaregex {
using StateIndex = uint32_t;

// An edge of the automaton. The label is a leaf node of `RegexNFAImpl::ast`,
// either consuming one character or zero-width.
struct Transition {
  NodeIndex label;
  StateIndex destination;
  // Dense id in [0, transition_count), used to key the per-level visited set
  size_t id;
};

struct State {
  // Ordered by priority, earlier transitions are preferred
  std::vector<Transition> transitions;
};

struct RegexNFAImpl {
  Ast ast;
  std::vector<State> states;
  StateIndex start;
  StateIndex accept;
  size_t transition_count;
  size_t group_count;
  RegexFlags flags;
};

// Compiles a parsed pattern into an automaton. `ast` is taken over by the
// automaton since transitions are labelled by its nodes.
auto build_nfa(Ast ast, RegexFlags flags) -> RegexNFAImpl;
} // namespace nfaregex
