// matchers.h - Fuzzy leaf predicates: edit distance and regex matching

#pragma once

#include <docdiff/api.h>
#include <docdiff/value.h>

#include <boost/regex.hpp>
#include <tsl/robin_map.h>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace docdiff {

// ============================================================
// Edit distance
// ============================================================

/// Levenshtein distance between two UTF-8 strings, counted in code points.
/// Insertions, deletions and substitutions cost 1 each. Bytes that are not
/// valid UTF-8 count as one unit each.
[[nodiscard]] DOCDIFF_API std::size_t edit_distance(std::string_view a, std::string_view b);

/// True iff both values are strings and their edit distance is <= threshold.
/// Non-string operands and negative thresholds yield false.
[[nodiscard]] DOCDIFF_API bool within_edit_distance(const Value& a, const Value& b, int threshold);

// ============================================================
// Regex matching
// ============================================================

/// Compile an ECMAScript pattern, std::nullopt if it is invalid
[[nodiscard]] DOCDIFF_API std::optional<boost::regex> compile_pattern(const std::string& pattern);

/// Partial-match test (regex_search).
/// @return std::nullopt if the match exceeds the engine's complexity or
///         memory bounds (catastrophic backtracking)
[[nodiscard]] DOCDIFF_API std::optional<bool> regex_matches(const boost::regex& re, std::string_view text);

// ============================================================
// RegexCache
//
// Compiles each pattern once. Invalid patterns are cached too, so a bad
// pattern is only compiled (and rejected) once per cache.
//
// A cache is not synchronized: give each thread its own (every
// Comparator owns one).
// ============================================================
class DOCDIFF_API RegexCache {
public:
    /// Compiled regex for the pattern, or nullptr if it does not compile.
    /// The pointer is valid until the next call on this cache.
    [[nodiscard]] const boost::regex* find_or_compile(const std::string& pattern);

    /// Whether both values independently match the pattern.
    /// @return std::nullopt if the rule does not apply (an operand is not a
    ///         string, the pattern is invalid, or matching exceeds the
    ///         engine's bounds)
    [[nodiscard]] std::optional<bool> both_match(const Value& a, const Value& b, const std::string& pattern);

    [[nodiscard]] std::size_t size() const { return compiled_.size(); }
    void clear() { compiled_.clear(); }

private:
    tsl::robin_map<std::string, std::optional<boost::regex>> compiled_;
};

} // namespace docdiff
