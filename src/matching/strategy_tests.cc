#include "exact.hpp"
#include "fuzzy.hpp"
#include "indentation_preserving.hpp"
#include "whitespace_insensitive.hpp"

#include <doctest.h>
#include <fmt/format.h>

#include <cmath>
#include <string>
#include <vector>

using namespace mender;

namespace {

std::vector<MatchCandidate>
run(const MatchingStrategy& strategy,
    const std::string& content,
    const std::string& search,
    std::optional<std::size_t> hint = std::nullopt) {
    std::vector<Line> content_lines;
    std::vector<Line> search_lines;
    parselines(content, content_lines);
    parselines(search, search_lines);
    MatchInput input{content, content_lines, search, search_lines, hint};
    return strategy.produce_candidates(input);
}

void
check_consistent(const std::string& content, const std::vector<MatchCandidate>& candidates) {
    for (const auto& c : candidates) {
        REQUIRE(c.matched_text == content.substr(c.start_offset, c.end_offset - c.start_offset));
    }
}

}  // namespace

TEST_CASE("strategy_names") {
    REQUIRE(strategy_from_string("exact") == StrategyId::kExact);
    REQUIRE(strategy_from_string("E") == StrategyId::kExact);
    REQUIRE(strategy_from_string("whitespace") == StrategyId::kWhitespaceInsensitive);
    REQUIRE(strategy_from_string("Whitespace_Insensitive") == StrategyId::kWhitespaceInsensitive);
    REQUIRE(strategy_from_string("indentation-preserving") == StrategyId::kIndentationPreserving);
    REQUIRE(strategy_from_string("i") == StrategyId::kIndentationPreserving);
    REQUIRE(strategy_from_string("fuzzy") == StrategyId::kFuzzy);
    REQUIRE(strategy_from_string("levenshtein") == StrategyId::kInvalid);
    REQUIRE(strategy_from_string("") == StrategyId::kInvalid);

    for (auto id : {StrategyId::kExact, StrategyId::kWhitespaceInsensitive, StrategyId::kIndentationPreserving,
                    StrategyId::kFuzzy}) {
        REQUIRE(strategy_from_string(to_string(id)) == id);
    }
}

TEST_CASE("exact_strategy") {
    ExactStrategy exact;

    SUBCASE("single_occurrence") {
        std::string content = "let a = 1;\nconst x = 1;\nlet b = 2;\n";
        auto candidates = run(exact, content, "const x = 1;");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].strategy == StrategyId::kExact);
        REQUIRE(candidates[0].start_offset == 11);
        REQUIRE(candidates[0].matched_text == "const x = 1;");
        REQUIRE(candidates[0].similarity == 1.0);
        REQUIRE(candidates[0].start_line == 2);
        REQUIRE(candidates[0].end_line == 2);
    }

    SUBCASE("overlapping_occurrences") {
        std::string content = "a b a b a";
        auto candidates = run(exact, content, "a b a");
        REQUIRE(candidates.size() == 2);
        REQUIRE(candidates[0].start_offset == 0);
        REQUIRE(candidates[1].start_offset == 4);
        check_consistent(content, candidates);
    }

    SUBCASE("span_ending_with_newline_stays_on_its_line") {
        std::string content = "one\ntwo\nthree\n";
        auto candidates = run(exact, content, "two\n");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].start_line == 2);
        REQUIRE(candidates[0].end_line == 2);
    }

    SUBCASE("empty_search_is_an_insertion_at_the_end") {
        std::string content = "one\ntwo";
        auto candidates = run(exact, content, "");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].start_offset == content.size());
        REQUIRE(candidates[0].end_offset == content.size());
        REQUIRE(candidates[0].matched_text.empty());
    }

    SUBCASE("no_match") {
        REQUIRE(run(exact, "const x = 1;", "const y = 2;").empty());
    }
}

TEST_CASE("describe_lines") {
    REQUIRE(describe_lines(3, 3) == "line 3");
    REQUIRE(describe_lines(3, 5) == "lines 3-5");
}

TEST_CASE("whitespace_insensitive_strategy") {
    WhitespaceInsensitiveStrategy strategy;

    SUBCASE("reflowed_code") {
        std::string content = "#include <x>\nint  main( ) {\n    return 0;\n}\n";
        auto candidates = run(strategy, content, "int main( ) { return 0; }");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].matched_text == "int  main( ) {\n    return 0;\n}");
        REQUIRE(candidates[0].similarity == 1.0);
        REQUIRE(candidates[0].start_line == 2);
        REQUIRE(candidates[0].end_line == 4);
        check_consistent(content, candidates);
    }

    SUBCASE("search_with_extra_line_breaks") {
        std::string content = "call(a, b, c);";
        auto candidates = run(strategy, content, "call(a,\n     b,\n     c);");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].matched_text == content);
    }

    SUBCASE("whitespace_is_not_removed_only_collapsed") {
        REQUIRE(run(strategy, "foo( 1 );", "foo(1);").empty());
    }

    SUBCASE("blank_search_matches_nothing") {
        REQUIRE(run(strategy, "a  b\n\n c", "  \n\t").empty());
    }

    SUBCASE("span_covers_whole_lines") {
        std::string content = "void f() {\n  if (a)  {\n    b();\n  }\n}\n";
        auto candidates = run(strategy, content, "  if (a) {\n    b();\n  }");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].matched_text == "  if (a)  {\n    b();\n  }");
        REQUIRE(candidates[0].start_line == 2);
        REQUIRE(candidates[0].end_line == 4);
        check_consistent(content, candidates);
    }

    SUBCASE("blank_lines_inside_the_window") {
        std::string content = "a(\n\n  1);\n";
        auto candidates = run(strategy, content, "a( 1);");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].matched_text == "a(\n\n  1);");
    }

    SUBCASE("partial_lines_are_not_matches") {
        REQUIRE(run(strategy, "int  a = b + c;", "b  + c;").empty());
        REQUIRE(run(strategy, "x = 1;  y = 2;", "x = 1;").empty());
    }

    SUBCASE("replacement_takes_the_window_indentation") {
        std::string content = "class A:\n    def f(self):\n        return  1\n";
        std::string search = "def f(self):\n    return 1";
        auto candidates = run(strategy, content, search);
        REQUIRE(candidates.size() == 1);

        std::vector<std::string> warnings;
        auto replacement =
            strategy.prepare_replacement(candidates[0], search, "def f(self):\n    return 2", warnings);
        REQUIRE(replacement == "    def f(self):\n        return 2");
        REQUIRE(warnings.size() == 1);
        REQUIRE(warnings[0] == "replacement re-indented from none to 4 spaces (lines 2-3)");

        warnings.clear();
        candidates = run(strategy, content, "    def f(self):\n        return 1");
        REQUIRE(candidates.size() == 1);
        REQUIRE(strategy.prepare_replacement(candidates[0], "    def f(self):\n        return 1", "    pass",
                                             warnings) == "    pass");
        REQUIRE(warnings.empty());
    }
}

TEST_CASE("indentation_levels") {
    std::vector<Line> lines;

    SUBCASE("two_space_and_tab_blocks_agree") {
        parselines("if x:\n  y()\n  if z:\n    w()", lines);
        auto spaces = relative_indent_levels(lines);
        parselines("\tif x:\n\t\ty()\n\t\tif z:\n\t\t\tw()", lines);
        auto tabs = relative_indent_levels(lines);
        REQUIRE(spaces == std::vector<int>{0, 1, 1, 2});
        REQUIRE(tabs == spaces);
    }

    SUBCASE("blank_lines_are_level_zero") {
        parselines("    a\n\n        b", lines);
        REQUIRE(relative_indent_levels(lines) == std::vector<int>{0, 0, 1});
    }

    SUBCASE("base_indentation") {
        parselines("        b\n    a\n\n", lines);
        REQUIRE(base_indentation(lines) == "    ");
        parselines("\n  \n", lines);
        REQUIRE(base_indentation(lines).empty());
    }

    SUBCASE("describe") {
        REQUIRE(describe_indentation("") == "none");
        REQUIRE(describe_indentation(" ") == "1 space");
        REQUIRE(describe_indentation("    ") == "4 spaces");
        REQUIRE(describe_indentation("\t") == "1 tab");
        REQUIRE(describe_indentation("\t  ") == "1 tab + 2 spaces");
    }

    SUBCASE("reindent") {
        REQUIRE(reindent("a\n  b\n\nc", "", "    ") == "    a\n      b\n\n    c");
        REQUIRE(reindent("    a\n      b", "    ", "\t") == "\ta\n\t  b");
        // Lines outdented past the base are left alone.
        REQUIRE(reindent("    a\n  b", "    ", "") == "a\n  b");
    }
}

TEST_CASE("indentation_preserving_strategy") {
    IndentationPreservingStrategy strategy;
    std::string content = "def f():\n    if x:\n        y()\n    return 1\n";

    SUBCASE("same_shape_different_base") {
        auto candidates = run(strategy, content, "if x:\n  y()");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].matched_text == "    if x:\n        y()");
        REQUIRE(candidates[0].start_line == 2);
        REQUIRE(candidates[0].end_line == 3);
        REQUIRE(candidates[0].similarity == 1.0);
        check_consistent(content, candidates);
    }

    SUBCASE("tabs_against_spaces") {
        auto candidates = run(strategy, content, "\tif x:\n\t\ty()");
        REQUIRE(candidates.size() == 1);
    }

    SUBCASE("different_shape_is_rejected") {
        REQUIRE(run(strategy, content, "if x:\ny()").empty());
    }

    SUBCASE("intra_line_spacing_must_match") {
        REQUIRE(run(strategy, content, "if  x:\n  y()").empty());
    }

    SUBCASE("blank_search_matches_nothing") {
        REQUIRE(run(strategy, content, "\n  ").empty());
    }

    SUBCASE("replacement_follows_the_window") {
        auto candidates = run(strategy, content, "if x:\n  y()");
        REQUIRE(candidates.size() == 1);

        std::vector<std::string> warnings;
        auto replacement =
            strategy.prepare_replacement(candidates[0], "if x:\n  y()", "if x:\n  z()\n\n  w()", warnings);
        REQUIRE(replacement == "    if x:\n      z()\n\n      w()");
        REQUIRE(warnings.size() == 1);
        REQUIRE(warnings[0] == "replacement re-indented from none to 4 spaces (lines 2-3)");
    }

    SUBCASE("same_base_needs_no_reindent") {
        auto candidates = run(strategy, content, "    if x:\n      y()");
        REQUIRE(candidates.size() == 1);

        std::vector<std::string> warnings;
        auto replacement = strategy.prepare_replacement(candidates[0], "    if x:\n      y()", "    pass", warnings);
        REQUIRE(replacement == "    pass");
        REQUIRE(warnings.empty());
    }
}

TEST_CASE("fuzzy_strategy") {
    SUBCASE("threshold_is_inclusive") {
        // One substitution in ten characters: similarity 0.9.
        FuzzyStrategy at(0.9, 0);
        auto candidates = run(at, "abcdefghiX", "abcdefghij");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].similarity == doctest::Approx(0.9));
        REQUIRE(candidates[0].strategy == StrategyId::kFuzzy);

        FuzzyStrategy above(std::nextafter(0.9, 1.0), 0);
        REQUIRE(run(above, "abcdefghiX", "abcdefghij").empty());
    }

    SUBCASE("line_windows") {
        FuzzyStrategy fuzzy(0.8, 0);
        std::string content = "alpha\nbeta\ngamma\ndelta";
        auto candidates = run(fuzzy, content, "beta\ngamme");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].matched_text == "beta\ngamma");
        REQUIRE(candidates[0].start_line == 2);
        REQUIRE(candidates[0].end_line == 3);
        REQUIRE(candidates[0].similarity == doctest::Approx(0.9));
    }

    SUBCASE("whitespace_is_normalized_first") {
        FuzzyStrategy fuzzy(0.8, 0);
        auto candidates = run(fuzzy, "  total  =  price *  qty;", "total = price * qty;");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].similarity == 1.0);
    }

    SUBCASE("search_longer_than_content") {
        FuzzyStrategy fuzzy(0.5, 0);
        REQUIRE(run(fuzzy, "a", "a\nb\nc").empty());
    }

    SUBCASE("one_line_search_may_change_one_word") {
        FuzzyStrategy fuzzy(0.8, 0);
        // 10 of 12 characters agree, but two words differ.
        REQUIRE(run(fuzzy, "const x = 1;", "const y = 2;").empty());
        REQUIRE(run(fuzzy, "const x = 2;", "const y = 2;").size() == 1);
        REQUIRE(run(fuzzy, "    retur 0;", "return 0;").size() == 1);
    }

    SUBCASE("word_rule_is_for_one_line_searches_only") {
        FuzzyStrategy fuzzy(0.8, 0);
        std::string content = "int total = 0;\nfor (auto v : values_a)\n    total += v;\n";
        auto candidates = run(fuzzy, content, "int total = 1;\nfor (auto v : values_b)\n    total += v;");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].start_line == 1);
    }

    SUBCASE("words") {
        REQUIRE(split_words("const y = x_1 + 2;") == std::vector<std::string_view>{"const", "y", "x_1", "2"});
        REQUIRE(split_words("  ;; ").empty());
        REQUIRE(split_words("f(\xc3\xa5r)") == std::vector<std::string_view>{"f", "\xc3\xa5r"});
        REQUIRE(count_missing_words("a b a", "a b") == 1);
        REQUIRE(count_missing_words("a b", "b a c") == 0);
    }

    SUBCASE("bounded_scan_without_hint_covers_the_first_lines") {
        std::string content = "one\ntwo\nthree\ntarget_value = 1;\nfive\nsix\nseven\n";
        FuzzyStrategy bounded(0.8, 4);
        auto candidates = run(bounded, content, "target_value = 2;");
        REQUIRE(candidates.size() == 1);
        REQUIRE(candidates[0].start_line == 4);

        FuzzyStrategy narrower(0.8, 3);
        REQUIRE(run(narrower, content, "target_value = 2;").empty());
    }

    SUBCASE("bounded_scan") {
        std::string content;
        for (int i = 1; i <= 20; i++) {
            content += i == 18 ? "target_value = 1;\n" : fmt::format("line {}\n", i);
        }
        auto target = content.find("target_value");

        FuzzyStrategy unbounded(0.8, 0);
        REQUIRE(run(unbounded, content, "target_value = 2;").size() == 1);

        FuzzyStrategy bounded(0.8, 4);
        REQUIRE(run(bounded, content, "target_value = 2;").empty());
        auto near = run(bounded, content, "target_value = 2;", target);
        REQUIRE(near.size() == 1);
        REQUIRE(near[0].start_line == 18);
    }
}
