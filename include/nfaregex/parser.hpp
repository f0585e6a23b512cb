#pragma once

#include "ast.hpp"
#include "common.hpp"
#include "flags.hpp"

#include <string_view>

namespace nfaregex {
// Parses `pattern` into an AST. Inline modifiers at the start of the pattern
// are added to `flags`. Throws ParserError on malformed input.
auto run_parse(std::string_view pattern, RegexFlags &flags) -> Ast;
} // namespace nfaregex
