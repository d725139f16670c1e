// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text <-> Value conversion and file helpers.
///
/// Usage:
/// @code
///   #include <docdiff/serialization.h>
///
///   std::string error;
///   Value doc = from_json(R"({"name": "Alice", "age": 30})", &error);
///   if (!error.empty()) { ... }
///
///   std::string pretty = to_json(doc);         // two-space indent
///   std::string compact = to_json(doc, true);  // no whitespace
///
///   Value file_doc = read_json_file("example1.json");  // throws on failure
/// @endcode
///
/// Parsing rules:
/// - Integers that fit in int64 are stored as int64, other numbers as double
/// - Duplicate object keys: the last occurrence wins
/// - Only whitespace may follow the top-level value
/// - Nesting deeper than max_depth is an error
///
/// Output rules:
/// - Object keys are written in sorted (byte) order, so output is stable
/// - Non-finite doubles are written as null

#pragma once

#include "api.h"
#include "value.h"

#include <cstddef>
#include <string>
#include <string_view>

namespace docdiff {

/// Convert Value to JSON string
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
[[nodiscard]] DOCDIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON text to Value
/// @param json_str The JSON text
/// @param error_out If provided, receives an error message on failure and is
///                  cleared on success
/// @param max_depth Maximum container nesting
/// @return Parsed Value, or null Value on parse error. Since "null" is valid
///         JSON, check error_out to tell the two apart.
[[nodiscard]] DOCDIFF_API Value from_json(std::string_view json_str,
                                          std::string* error_out = nullptr,
                                          std::size_t max_depth = DOCDIFF_DEFAULT_MAX_DEPTH);

/// Read and parse a JSON file
/// @throws std::runtime_error "failed to read file: ..." or "invalid JSON: ..."
[[nodiscard]] DOCDIFF_API Value read_json_file(const std::string& file_path,
                                               std::size_t max_depth = DOCDIFF_DEFAULT_MAX_DEPTH);

/// Read a whole file into a string
/// @throws std::runtime_error if the file can't be opened or read
[[nodiscard]] DOCDIFF_API std::string read_text_file(const std::string& file_path);

/// Write (truncate) a file
/// @throws std::runtime_error if the file can't be written
DOCDIFF_API void write_text_file(const std::string& file_path, std::string_view content);

} // namespace docdiff
