// test_report.cpp - Tests for diff labels and report rendering

#include <catch2/catch_all.hpp>
#include <docdiff/comparator.h>
#include <docdiff/report.h>
#include <docdiff/serialization.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace docdiff;

// ============================================================
// Labels
// ============================================================

TEST_CASE("DiffKind labels", "[report][labels]") {
    REQUIRE(kind_label(DiffKind::ValueMismatch) == "value_mismatch");
    REQUIRE(kind_label(DiffKind::KeyOnlyInLeft) == "key_only_in_first");
    REQUIRE(kind_label(DiffKind::KeyOnlyInRight) == "key_only_in_second");
    REQUIRE(kind_label(DiffKind::ArrayLengthMismatch) == "array_length");
    REQUIRE(kind_label(DiffKind::TypeMismatch) == "type_mismatch");

    REQUIRE(kind_from_label("array_length") == DiffKind::ArrayLengthMismatch);
    REQUIRE_FALSE(kind_from_label("bogus").has_value());
}

TEST_CASE("Diff stream output", "[report]") {
    std::ostringstream oss;
    oss << Diff{"age", DiffKind::ValueMismatch, Value{30}, Value{"31"}};
    REQUIRE(oss.str() == "age [value_mismatch] 30 vs \"31\"");
}

// ============================================================
// Text report
// ============================================================

TEST_CASE("format_diff", "[report][text]") {
    SECTION("value mismatch prints both sides, strings unquoted") {
        Diff d{"address.city", DiffKind::ValueMismatch, Value{"Paris"}, Value{"London"}};
        REQUIRE(format_diff(d) == "address.city: value mismatch\n- Paris\n+ London\n");
    }

    SECTION("one-sided keys print no values") {
        REQUIRE(format_diff(Diff{"email", DiffKind::KeyOnlyInRight, Value{}, Value{"a@b.c"}}) ==
                "email: key exists only in second file\n");
        REQUIRE(format_diff(Diff{"age", DiffKind::KeyOnlyInLeft, Value{30}, Value{}}) ==
                "age: key exists only in first file\n");
    }

    SECTION("array length and type mismatch") {
        REQUIRE(format_diff(Diff{"hobbies", DiffKind::ArrayLengthMismatch, Value{2}, Value{3}}) ==
                "hobbies: array length mismatch\n- 2\n+ 3\n");
        REQUIRE(format_diff(Diff{"a", DiffKind::TypeMismatch, Value{"object"}, Value{"string"}}) ==
                "a: type mismatch\n- object\n+ string\n");
    }

    SECTION("root path and container values") {
        Diff d{"", DiffKind::ValueMismatch, Value{}, Value::array({Value{1}, Value{true}})};
        REQUIRE(format_diff(d) == "(root): value mismatch\n- null\n+ [1,true]\n");
    }
}

TEST_CASE("format_report concatenates entries", "[report][text]") {
    std::vector<Diff> diffs{
        {"a", DiffKind::ValueMismatch, Value{1}, Value{2}},
        {"b", DiffKind::KeyOnlyInLeft, Value{true}, Value{}},
    };
    REQUIRE(format_report(diffs) == "a: value mismatch\n- 1\n+ 2\nb: key exists only in first file\n");
    REQUIRE(format_report({}).empty());
}

// ============================================================
// Structured report
// ============================================================

TEST_CASE("Structured report", "[report][json]") {
    std::vector<Diff> diffs{
        {"age", DiffKind::ValueMismatch, Value{30}, Value{31}},
        {"email", DiffKind::KeyOnlyInRight, Value{}, Value{"alice@example.com"}},
    };

    SECTION("entry layout") {
        Value entry = diff_to_value(diffs[0]);
        REQUIRE(entry.at("path").as_string() == "age");
        REQUIRE(entry.at("type").as_string() == "value_mismatch");
        REQUIRE(entry.at("value1").as_int64() == 30);
        REQUIRE(entry.at("value2").as_int64() == 31);
    }

    SECTION("JSON text") {
        std::string error;
        Value parsed = from_json(diffs_to_json(diffs), &error);
        REQUIRE(error.empty());
        REQUIRE(parsed.size() == 2);
        REQUIRE(parsed.at(1).at("type").as_string() == "key_only_in_second");
        REQUIRE(parsed.at(1).at("value1").is_null());
    }

    SECTION("read back") {
        REQUIRE(diffs_from_value(diffs_to_value(diffs)) == diffs);
    }

    SECTION("malformed reports") {
        std::string error;
        REQUIRE_THROWS_AS(diffs_from_value(Value{"x"}), std::invalid_argument);
        REQUIRE_THROWS_AS(diffs_from_value(from_json(R"([{"type": "value_mismatch"}])", &error)),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(diffs_from_value(from_json(R"([{"path": "a", "type": "nope"}])", &error)),
                          std::invalid_argument);
    }
}

TEST_CASE("Report of a real comparison", "[report][json]") {
    const std::string dir = DOCDIFF_TEST_DATA_DIR;
    EquivalencePolicy policy;
    auto diffs = compare(read_json_file(dir + "/person_a.json"), read_json_file(dir + "/person_b.json"), policy);

    REQUIRE(format_report(diffs) ==
            "address.city: value mismatch\n- Paris\n+ London\n"
            "age: value mismatch\n- 30\n+ 31\n"
            "email: key exists only in second file\n"
            "hobbies: array length mismatch\n- 2\n+ 3\n");
}

// ============================================================
// Line diff
// ============================================================

TEST_CASE("diff_lines", "[report][lines]") {
    SECTION("identical texts") {
        REQUIRE(diff_lines("a\nb", "a\nb").empty());
    }

    SECTION("changed and missing lines") {
        auto diffs = diff_lines("a\nb\nc", "a\nx");
        REQUIRE(diffs.size() == 2);
        REQUIRE(diffs[0].line == 2);
        REQUIRE(diffs[0].left == "b");
        REQUIRE(diffs[0].right == "x");
        REQUIRE(diffs[1].line == 3);
        REQUIRE(diffs[1].left == "c");
        REQUIRE(diffs[1].right.empty());
    }

    SECTION("formatting") {
        REQUIRE(format_line_diffs(diff_lines("one", "two")) == "Line 1:\n  - one\n  + two\n");
    }
}
