// report.h - Rendering a diff list for people and for other tools

#pragma once

#include <docdiff/api.h>
#include <docdiff/diff.h>
#include <docdiff/value.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace docdiff {

/// Leaf rendering used in text reports: strings without quotes,
/// everything else as compact JSON
[[nodiscard]] DOCDIFF_API std::string render_value(const Value& val);

/// One entry, e.g.
///   "address.city: value mismatch\n- Paris\n+ London\n"
///   "age: key exists only in first file\n"
[[nodiscard]] DOCDIFF_API std::string format_diff(const Diff& diff);

/// All entries concatenated in order
[[nodiscard]] DOCDIFF_API std::string format_report(const std::vector<Diff>& diffs);

// ============================================================
// Structured report
//
// Each diff becomes
//   { "path": "...", "type": "<kind label>", "value1": <left>, "value2": <right> }
// ============================================================

[[nodiscard]] DOCDIFF_API Value diff_to_value(const Diff& diff);
[[nodiscard]] DOCDIFF_API Value diffs_to_value(const std::vector<Diff>& diffs);

/// Pretty-printed JSON array of diff_to_value() entries
[[nodiscard]] DOCDIFF_API std::string diffs_to_json(const std::vector<Diff>& diffs);

/// Read a structured report back
/// @throws std::invalid_argument if an entry is malformed or has an unknown type label
[[nodiscard]] DOCDIFF_API std::vector<Diff> diffs_from_value(const Value& report);

// ============================================================
// Line-by-line comparison of two texts (typically pretty-printed
// documents). Lines are compared at the same line number; a missing
// line on one side compares as empty.
// ============================================================

struct LineDiff {
    std::size_t line;   ///< 1-based
    std::string left;
    std::string right;
};

[[nodiscard]] DOCDIFF_API std::vector<LineDiff> diff_lines(std::string_view left, std::string_view right);

/// "Line 3:\n  - left\n  + right\n" per entry
[[nodiscard]] DOCDIFF_API std::string format_line_diffs(const std::vector<LineDiff>& diffs);

} // namespace docdiff
