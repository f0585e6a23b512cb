#include "nfaregex/regex.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <ostream>
#include <print>
#include <ranges>
#include <string_view>
#include <vector>

using namespace std::literals;

namespace {
struct Options {
  nfaregex::RegexFlags flags = nfaregex::RegexFlags::none;
  bool visualize = false;
  std::string_view pattern;
  std::string_view text;
};

auto parse_options(int argc, char *argv[]) -> std::optional<Options> {
  Options options;
  std::vector<std::string_view> positional;
  for (int i = 1; i < argc; i += 1) {
    std::string_view argument = argv[i];
    if (argument == "-i"sv) {
      options.flags |= nfaregex::RegexFlags::ignore_case;
    } else if (argument == "-s"sv) {
      options.flags |= nfaregex::RegexFlags::dot_all;
    } else if (argument == "-m"sv) {
      options.flags |= nfaregex::RegexFlags::multiline;
    } else if (argument == "-x"sv) {
      options.flags |= nfaregex::RegexFlags::free_spacing;
    } else if (argument == "--dot"sv) {
      options.visualize = true;
    } else {
      positional.push_back(argument);
    }
  }

  if (positional.size() != 2) {
    return std::nullopt;
  }
  options.pattern = positional[0];
  options.text = positional[1];
  return options;
}

auto summarize_match(nfaregex::Match const &match) -> void {
  std::println(std::cerr, "Match '{}' ({}-{})", *match.group(0), match.start(),
               match.end());
  for (auto [index, group] : std::ranges::views::enumerate(match.groups())) {
    auto span = match.group_span(index + 1);
    if (group.has_value()) {
      std::println(std::cerr, "  Group[{}]: '{}' ({}-{})", index + 1, *group,
                   span->first, span->second);
    } else {
      std::println(std::cerr, "  Group[{}]: None", index + 1);
    }
  }
}
} // namespace

int main(int argc, char *argv[]) {
  auto options = parse_options(argc, argv);
  if (not options.has_value()) {
    std::println(std::cerr,
                 "Usage: regex-match [-i] [-s] [-m] [-x] [--dot] <pattern> "
                 "<text>");
    return 2;
  }

  try {
    auto regex = nfaregex::compile(options->pattern, options->flags);
    if (options->visualize) {
      regex.visualize(std::cout);
    }

    size_t match_count = 0;
    for (auto const &match : regex.find_iter(options->text)) {
      summarize_match(match);
      match_count += 1;
    }

    if (match_count == 0) {
      std::println(std::cerr, "No match :-(");
      return EXIT_FAILURE;
    }
  } catch (nfaregex::ParserError const &error) {
    std::println(std::cerr, "Parse error ({}): {}",
                 nfaregex::to_string(error.kind()), error.what());
    return 2;
  }
  return EXIT_SUCCESS;
}
