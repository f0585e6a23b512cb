#include "regex_test_common.hpp"
#include "testing.hpp"

#include "nfaregex/regex.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace std::literals;
using nfaregex::compile;
using nfaregex::Match;

TEST_CASE(iterate_word_runs, "[regex][iteration]") {
  auto found = compile("[a-z]*").find_all("abcE");
  CHECK(found == std::vector<std::string_view>({"abc"sv, ""sv, ""sv}));
  CHECK(spans("[a-z]*", "abcE") ==
        std::vector<Span>({Span(0, 3), Span(3, 3), Span(4, 4)}));
}

TEST_CASE(iterate_greedy_run_once, "[regex][iteration]") {
  CHECK(spans("a+", "aaab") == std::vector<Span>({Span(0, 3)}));
  CHECK(spans("a+?", "aaab") ==
        std::vector<Span>({Span(0, 1), Span(1, 2), Span(2, 3)}));
}

TEST_CASE(iterate_groups_per_match, "[regex][iteration]") {
  auto regex = compile("(a)(b)?");
  std::vector<std::vector<std::optional<std::string_view>>> groups;
  for (auto const &found : regex.find_iter("a ab")) {
    groups.push_back(found.groups());
  }
  REQUIRE(groups.size() == 2);
  CHECK(groups[0][0] == "a"sv);
  CHECK(not groups[0][1].has_value());
  CHECK(groups[1][0] == "a"sv);
  CHECK(groups[1][1] == "b"sv);
}

TEST_CASE(iterate_literal_substring, "[regex][iteration]") {
  CHECK(spans("ab", "xxabyyabab") ==
        std::vector<Span>({Span(2, 4), Span(6, 8), Span(8, 10)}));
  CHECK(spans("aa", "aaaa") == std::vector<Span>({Span(0, 2), Span(2, 4)}));
  CHECK(spans("b", "aaaa").empty());
  CHECK(spans("a", "").empty());
}

TEST_CASE(iterate_matches_are_ordered_and_disjoint, "[regex][iteration]") {
  auto subjects = {"abc  de f"sv, "x1y22z333"sv, ""sv, "a\nb\n"sv};
  auto patterns = {R"(\w*)"sv, R"(\d+|[a-z])"sv, R"(\b)"sv, R"(.?)"sv,
                   R"($)"sv};
  for (auto subject : subjects) {
    for (auto pattern : patterns) {
      auto found = spans(pattern, subject);
      for (size_t i = 0; i < found.size(); i += 1) {
        CHECK(found[i].first <= found[i].second);
        if (i > 0) {
          // Each match starts at or after the previous end, and empty
          // matches always advance
          CHECK(found[i].first >= found[i - 1].second);
          CHECK(found[i].first > found[i - 1].first);
        }
      }
    }
  }
}

TEST_CASE(iterate_manually, "[regex][iteration]") {
  auto regex = compile(R"(\d)");
  auto matches = regex.find_iter("1a2");
  auto first = matches.next();
  auto second = matches.next();
  auto third = matches.next();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(first->span() == Span(0, 1));
  CHECK(second->span() == Span(2, 3));
  CHECK(not third.has_value());
  CHECK(not matches.next().has_value());
}

TEST_CASE(match_outlives_regex, "[regex][iteration]") {
  std::optional<Match> kept;
  {
    auto regex = compile("(b+)");
    std::string subject = "abbc";
    kept = regex.find_iter(subject).next();
    REQUIRE(kept.has_value());
    CHECK(kept->span() == Span(1, 3));
  }
  CHECK(kept->start() == 1);
  CHECK(kept->end() == 3);
  CHECK(kept->group_count() == 1);
}

TEST_CASE(iterate_from_temporary_regex, "[regex][iteration]") {
  auto matches = compile("a+").find_iter("baa");
  auto first = matches.next();
  REQUIRE(first.has_value());
  CHECK(first->span() == Span(1, 3));
  CHECK(not matches.next().has_value());

  std::vector<Span> found;
  for (auto const &match : compile(R"(\d)").find_iter("1b2")) {
    found.push_back(match.span());
  }
  CHECK(found == std::vector<Span>({Span(0, 1), Span(2, 3)}));
}

TEST_CASE(iteration_outlives_moved_regex, "[regex][iteration]") {
  auto regex = compile("(x)y");
  auto matches = regex.find_iter("xy xy");
  auto moved = std::move(regex);
  auto first = matches.next();
  REQUIRE(first.has_value());
  CHECK(first->group(1) == "x"sv);
  CHECK(matches.next().has_value());
  CHECK(moved.is_match("xy"));
}

TEST_CASE(search_returns_first_match, "[regex][search]") {
  auto regex = compile(R"((\w)(\d)?)");
  auto found = regex.search("  a1 b");
  REQUIRE(found.has_value());
  CHECK(found->span() == Span(2, 4));
  CHECK(found->group() == "a1"sv);
  CHECK(found->group(2) == "1"sv);
  CHECK(not regex.search("  ").has_value());

  auto last = compile("b$").search("abab");
  REQUIRE(last.has_value());
  CHECK(last->start() == 3);
  CHECK(not last->group(0)->empty());
}

TEST_CASE(find_and_is_match, "[regex][search]") {
  auto regex = compile(R"(\d+)");
  CHECK(regex.is_match("abc123"));
  CHECK(not regex.is_match("abc"));
  CHECK(regex.find("ab 42 7") == "42"sv);
  CHECK(not regex.find("none").has_value());
  CHECK(regex.find_all("1 22 333") ==
        std::vector<std::string_view>({"1"sv, "22"sv, "333"sv}));
}

TEST_CASE(substitute, "[regex][substitute]") {
  auto regex = compile(R"(\d+)");
  CHECK(regex.substitute("a1b22c", "#") == "a#b#c");
  CHECK(regex.substitute("a1b22c", "#", 1) == "a#b22c");
  CHECK(regex.substitute("abc", "#") == "abc");
  CHECK(regex.substitute("a1b22c", "", 0) == "a1b22c");

  auto empty = compile("x*");
  CHECK(empty.substitute("abc", "-") == "-a-b-c-");
  CHECK(compile("").substitute("abc", "-") == "-abc");
}

TEST_CASE(substitute_with_callback, "[regex][substitute]") {
  auto regex = compile(R"((\w)(\d))");
  auto swap = [](Match const &found) {
    return std::string{*found.group(2)} + std::string{*found.group(1)};
  };
  CHECK(regex.substitute_with("a1 b2 c", swap) == "1a 2b c");

  auto [text, count] = regex.substitute_and_count("a1 b2 c3", swap, 2);
  CHECK(text == "1a 2b c3");
  CHECK(count == 2);
}

TEST_CASE(substitute_utf8, "[regex][substitute][unicode]") {
  auto regex = compile("é+");
  CHECK(regex.substitute("aééb€é", "e") == "aeb€e");
}
