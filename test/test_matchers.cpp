// test_matchers.cpp - Tests for edit distance and regex matching

#include <catch2/catch_all.hpp>
#include <docdiff/matchers.h>

#include <string>

using namespace docdiff;

// ============================================================
// Edit distance
// ============================================================

TEST_CASE("edit_distance", "[matchers][levenshtein]") {
    SECTION("classic examples") {
        REQUIRE(edit_distance("kitten", "sitting") == 3);
        REQUIRE(edit_distance("hello", "hallo") == 1);
        REQUIRE(edit_distance("flaw", "lawn") == 2);
    }

    SECTION("empty strings") {
        REQUIRE(edit_distance("", "") == 0);
        REQUIRE(edit_distance("", "abc") == 3);
        REQUIRE(edit_distance("abc", "") == 3);
    }

    SECTION("symmetric") {
        REQUIRE(edit_distance("Harry Potter", "Hary Poter") ==
                edit_distance("Hary Poter", "Harry Potter"));
    }

    SECTION("counts code points, not bytes") {
        // "é" is two bytes in UTF-8
        REQUIRE(edit_distance("café", "cafe") == 1);
        REQUIRE(edit_distance("日本", "日本語") == 1);
    }

    SECTION("case sensitive") {
        REQUIRE(edit_distance("ABC", "abc") == 3);
    }
}

TEST_CASE("within_edit_distance", "[matchers][levenshtein]") {
    REQUIRE(within_edit_distance(Value{"hello"}, Value{"hallo"}, 1));
    REQUIRE_FALSE(within_edit_distance(Value{"hello"}, Value{"hullu"}, 1));
    REQUIRE(within_edit_distance(Value{"same"}, Value{"same"}, 0));

    SECTION("only applies to two strings") {
        REQUIRE_FALSE(within_edit_distance(Value{"1"}, Value{1}, 5));
        REQUIRE_FALSE(within_edit_distance(Value{}, Value{"x"}, 5));
    }

    SECTION("negative threshold never matches") {
        REQUIRE_FALSE(within_edit_distance(Value{"a"}, Value{"a"}, -1));
    }
}

// ============================================================
// Regex
// ============================================================

TEST_CASE("compile_pattern", "[matchers][regex]") {
    REQUIRE(compile_pattern("^[0-9]+$").has_value());
    REQUIRE_FALSE(compile_pattern("([unclosed").has_value());
}

TEST_CASE("regex_matches searches within the text", "[matchers][regex]") {
    auto re = compile_pattern("[0-9]{3}");
    REQUIRE(re);
    REQUIRE(regex_matches(*re, "id-123-x") == true);
    REQUIRE(regex_matches(*re, "id-12-x") == false);

    auto anchored = compile_pattern("^[0-9]{3}$");
    REQUIRE(anchored);
    REQUIRE(regex_matches(*anchored, "id-123-x") == false);
    REQUIRE(regex_matches(*anchored, "123") == true);
}

TEST_CASE("RegexCache", "[matchers][regex][cache]") {
    RegexCache cache;

    SECTION("compiles each pattern once") {
        const boost::regex* first = cache.find_or_compile("^a+$");
        REQUIRE(first != nullptr);
        REQUIRE(cache.find_or_compile("^a+$") != nullptr);
        REQUIRE(cache.size() == 1);
    }

    SECTION("invalid patterns are remembered as unusable") {
        REQUIRE(cache.find_or_compile("(") == nullptr);
        REQUIRE(cache.find_or_compile("(") == nullptr);
        REQUIRE(cache.size() == 1);
    }

    SECTION("both_match") {
        const std::string uuid = "^[0-9a-f]{8}$";
        REQUIRE(cache.both_match(Value{"deadbeef"}, Value{"01234567"}, uuid) == true);
        REQUIRE(cache.both_match(Value{"deadbeef"}, Value{"xyz"}, uuid) == false);
    }

    SECTION("both_match does not apply to non-strings or bad patterns") {
        REQUIRE_FALSE(cache.both_match(Value{1}, Value{"1"}, "1").has_value());
        REQUIRE_FALSE(cache.both_match(Value{"a"}, Value{"a"}, "[").has_value());
    }

    SECTION("long inputs") {
        const std::string blob(100000, 'Q');
        REQUIRE(cache.both_match(Value{blob}, Value{blob + "=="}, "^[A-Za-z0-9+/=]+$") == true);
        REQUIRE(cache.both_match(Value{blob}, Value{blob + "!"}, "^[A-Za-z0-9+/=]+$") == false);
    }

    SECTION("runaway backtracking makes the rule inapplicable") {
        const std::string text(64, 'x');
        REQUIRE_FALSE(cache.both_match(Value{text}, Value{text}, "(x+x+)+y").has_value());
    }

    SECTION("clear") {
        (void)cache.find_or_compile("x");
        cache.clear();
        REQUIRE(cache.size() == 0);
    }
}
