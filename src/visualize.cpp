#include "nfaregex/regex.hpp"

#include "nfaregex/ast.hpp"
#include "private/nfa.hpp"

#include <format>
#include <ostream>
#include <print>
#include <string>
#include <string_view>

using namespace nfaregex;

namespace {
// Graphviz labels are double quoted strings
auto escape_label(std::string_view label) -> std::string {
  std::string output;
  for (char c : label) {
    if (c == '"' || c == '\\') {
      output += '\\';
    }
    output += c;
  }
  return output;
}

auto unique_state_tag(StateIndex state) -> std::string {
  return std::format("state_{}", state);
}

auto visualize(RegexNFAImpl const &nfa, std::ostream &out_stream) -> void {
  out_stream << "digraph {\n";
  out_stream << "  rankdir=LR\n";

  for (StateIndex state = 0; state < nfa.states.size(); state += 1) {
    std::string_view shape = "circle";
    if (state == nfa.accept) {
      shape = "doublecircle";
    } else if (state == nfa.start) {
      shape = "box";
    }
    std::print(out_stream, "  {} [label=\"{}\" shape={}]\n",
               unique_state_tag(state), state, shape);
  }

  for (StateIndex state = 0; state < nfa.states.size(); state += 1) {
    for (auto const &transition : nfa.states[state].transitions) {
      std::print(out_stream, "  {} -> {} [label=\"{}\"]\n",
                 unique_state_tag(state),
                 unique_state_tag(transition.destination),
                 escape_label(format_node(nfa.ast, transition.label)));
    }
  }

  out_stream << "}" << std::endl;
}
} // namespace

auto RegexNFA::visualize(std::ostream &out_stream) const -> void {
  ::visualize(*impl_, out_stream);
}
