// test_equivalence.cpp - Tests for coercions and rule precedence

#include <catch2/catch_all.hpp>
#include <docdiff/equivalence.h>

#include <string>

using namespace docdiff;

// ============================================================
// Coercions
// ============================================================

TEST_CASE("coerce_number", "[equivalence][coerce]") {
    SECTION("native numbers") {
        REQUIRE(coerce_number(Value{7}) == 7.0);
        REQUIRE(coerce_number(Value{2.5}) == 2.5);
    }

    SECTION("numeric strings") {
        REQUIRE(coerce_number(Value{"1"}) == 1.0);
        REQUIRE(coerce_number(Value{"1.0"}) == 1.0);
        REQUIRE(coerce_number(Value{"-3.25"}) == -3.25);
        REQUIRE(coerce_number(Value{"+4"}) == 4.0);
        REQUIRE(coerce_number(Value{"1e3"}) == 1000.0);
        REQUIRE(coerce_number(Value{"2.5E-1"}) == 0.25);
    }

    SECTION("non numeric input") {
        REQUIRE_FALSE(coerce_number(Value{""}).has_value());
        REQUIRE_FALSE(coerce_number(Value{"abc"}).has_value());
        REQUIRE_FALSE(coerce_number(Value{"12abc"}).has_value());
        REQUIRE_FALSE(coerce_number(Value{" 12"}).has_value());
        REQUIRE_FALSE(coerce_number(Value{"+-1"}).has_value());
        REQUIRE_FALSE(coerce_number(Value{"1e999"}).has_value());
        REQUIRE_FALSE(coerce_number(Value{true}).has_value());
        REQUIRE_FALSE(coerce_number(Value{}).has_value());
    }
}

TEST_CASE("coerce_bool", "[equivalence][coerce]") {
    REQUIRE(coerce_bool(Value{true}) == true);
    REQUIRE(coerce_bool(Value{"true"}) == true);
    REQUIRE(coerce_bool(Value{"TRUE"}) == true);
    REQUIRE(coerce_bool(Value{"False"}) == false);
    REQUIRE_FALSE(coerce_bool(Value{"yes"}).has_value());
    REQUIRE_FALSE(coerce_bool(Value{1}).has_value());
}

TEST_CASE("case folding", "[equivalence][case]") {
    REQUIRE(fold_case("Hello World") == "hello world");
    REQUIRE(equals_ignore_case("London", "LONDON"));
    REQUIRE_FALSE(equals_ignore_case("London", "Londo"));
}

TEST_CASE("case folding beyond ASCII", "[equivalence][case][unicode]") {
    REQUIRE(equals_ignore_case("ÉCOLE", "école"));
    REQUIRE(equals_ignore_case("ÄPFEL", "äpfel"));
    REQUIRE(equals_ignore_case("ΣΟΦΙΑ", "σοφια"));
    REQUIRE(equals_ignore_case("Привет", "ПРИВЕТ"));
    REQUIRE_FALSE(equals_ignore_case("école", "ecole"));

    REQUIRE(fold_case("Été") == "été");
    REQUIRE(fold_case("ÄBC") == "äbc");

    SECTION("invalid UTF-8 bytes are kept as they are") {
        REQUIRE(fold_case("A\xFF" "B") == "a\xFF" "b");
        REQUIRE(equals_ignore_case("\xFF", "\xFF"));
        REQUIRE_FALSE(equals_ignore_case("\xC9", "\xE9"));
    }
}

// ============================================================
// Individual rules
// ============================================================

TEST_CASE("EquivalenceEvaluator rules", "[equivalence][rules]") {
    EquivalencePolicy policy;

    SECTION("structural equality with no relaxations") {
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{"a"}, Value{"a"}, "x") == Rule::Structural);
        REQUIRE(eval.equal(Value{1}, Value{1.0}, "x"));
        REQUIRE_FALSE(eval.equal(Value{"a"}, Value{"A"}, "x"));
        REQUIRE_FALSE(eval.equal(Value{1}, Value{"1"}, "x"));
        REQUIRE_FALSE(eval.match(Value{true}, Value{"true"}, "x").has_value());
    }

    SECTION("value case") {
        policy.ignore_value_case = true;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{"London"}, Value{"LONDON"}, "city") == Rule::ValueCase);
        REQUIRE(eval.match(Value{"ÉCOLE"}, Value{"école"}, "city") == Rule::ValueCase);
        REQUIRE_FALSE(eval.equal(Value{"London"}, Value{"Paris"}, "city"));
    }

    SECTION("null wildcard") {
        policy.ignore_null = true;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{}, Value{"Harry Potter"}, "name") == Rule::NullWildcard);
        REQUIRE(eval.match(Value{5}, Value{}, "n") == Rule::NullWildcard);
        REQUIRE_FALSE(eval.equal(Value{5}, Value{6}, "n"));
    }

    SECTION("path regex applies only to its exact path") {
        policy.regex_by_path["user.id"] = "^[0-9]+$";
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{"123"}, Value{"456"}, "user.id") == Rule::PathRegex);
        REQUIRE_FALSE(eval.equal(Value{"123"}, Value{"456"}, "user.other"));
        REQUIRE_FALSE(eval.equal(Value{"123"}, Value{"abc"}, "user.id"));
        REQUIRE_FALSE(eval.equal(Value{123}, Value{456}, "user.id"));
    }

    SECTION("invalid regex is inapplicable") {
        policy.regex_by_path["id"] = "(";
        EquivalenceEvaluator eval{policy};
        REQUIRE_FALSE(eval.equal(Value{"a"}, Value{"b"}, "id"));
        REQUIRE(eval.equal(Value{"a"}, Value{"a"}, "id"));
    }

    SECTION("fuzzy path") {
        policy.fuzzy_paths.insert("name");
        policy.fuzzy_threshold = 1;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{"hello"}, Value{"hallo"}, "name") == Rule::PathFuzzy);
        REQUIRE_FALSE(eval.equal(Value{"hello"}, Value{"hullu"}, "name"));
        REQUIRE_FALSE(eval.equal(Value{"hello"}, Value{"hallo"}, "title"));
    }

    SECTION("boolean type") {
        policy.ignore_boolean_type = true;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{true}, Value{"TRUE"}, "b") == Rule::BooleanType);
        REQUIRE(eval.equal(Value{"false"}, Value{false}, "b"));
        REQUIRE_FALSE(eval.equal(Value{true}, Value{"false"}, "b"));
        REQUIRE_FALSE(eval.equal(Value{true}, Value{1}, "b"));
    }

    SECTION("numeric type") {
        policy.ignore_numeric_type = true;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{1}, Value{"1.0"}, "n") == Rule::NumericType);
        REQUIRE(eval.equal(Value{"1"}, Value{1.0}, "n"));
        REQUIRE(eval.equal(Value{"1e2"}, Value{"100"}, "n"));
        REQUIRE_FALSE(eval.equal(Value{1}, Value{"1.5"}, "n"));
        REQUIRE_FALSE(eval.equal(Value{1}, Value{"one"}, "n"));
    }

    SECTION("large integers compare exactly") {
        policy.ignore_numeric_type = true;
        EquivalenceEvaluator eval{policy};
        const int64_t big = (int64_t{1} << 53) + 1;
        REQUIRE_FALSE(eval.equal(Value{big}, Value{big - 1}, "n"));
        REQUIRE(eval.equal(Value{big}, Value{big}, "n"));
    }
}

// ============================================================
// Precedence
// ============================================================

TEST_CASE("Rule precedence", "[equivalence][precedence]") {
    SECTION("fixed order") {
        REQUIRE(kRulePrecedence.front() == Rule::ValueCase);
        REQUIRE(kRulePrecedence.back() == Rule::Structural);
        REQUIRE(rule_name(Rule::PathRegex) == "path_regex");
        REQUIRE(rule_name(Rule::NumericType) == "numeric_type");
    }

    SECTION("regex wins over numeric coercion") {
        EquivalencePolicy policy;
        policy.ignore_numeric_type = true;
        policy.regex_by_path["price"] = "^[0-9.]+$";
        EquivalenceEvaluator eval{policy};
        // Numerically different, but both match the pattern
        REQUIRE(eval.match(Value{"10"}, Value{"12.5"}, "price") == Rule::PathRegex);
    }

    SECTION("value case is tried before null") {
        EquivalencePolicy policy;
        policy.ignore_value_case = true;
        policy.ignore_null = true;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.match(Value{"A"}, Value{"a"}, "x") == Rule::ValueCase);
        REQUIRE(eval.match(Value{}, Value{"a"}, "x") == Rule::NullWildcard);
    }

    SECTION("rule_admits checks a single rule") {
        EquivalencePolicy policy;
        policy.ignore_numeric_type = true;
        EquivalenceEvaluator eval{policy};
        REQUIRE(eval.rule_admits(Rule::NumericType, Value{1}, Value{"1"}, ""));
        REQUIRE_FALSE(eval.rule_admits(Rule::Structural, Value{1}, Value{"1"}, ""));
        REQUIRE_FALSE(eval.rule_admits(Rule::BooleanType, Value{true}, Value{"true"}, ""));
    }
}

TEST_CASE("free equal()", "[equivalence]") {
    EquivalencePolicy policy;
    policy.ignore_value_case = true;
    REQUIRE(equal(Value{"abc"}, Value{"ABC"}, "", policy));
    REQUIRE_FALSE(equal(Value{"abc"}, Value{"abd"}, "", policy));
}
