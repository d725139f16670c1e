// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file policy.h
/// @brief EquivalencePolicy - which relaxations apply when comparing documents.
///
/// A policy is built once per invocation (from command-line flags, a JSON
/// policy file, or directly in code) and then passed by const reference to
/// the comparison. Nothing in the comparison mutates it.
///
/// Policy file format:
/// @code
///   {
///     "ignore_key_case": true,
///     "ignore_value_case": false,
///     "ignore_numeric_type": true,
///     "ignore_boolean_type": false,
///     "ignore_null": false,
///     "structure_only": false,
///     "regex": { "user.id": "^[0-9a-f-]{36}$" },
///     "fuzzy_paths": ["name", "education.university"],
///     "fuzzy_threshold": 2,
///     "max_depth": 512
///   }
/// @endcode

#pragma once

#include <docdiff/api.h>
#include <docdiff/path.h>
#include <docdiff/value.h>

#include <map>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace docdiff {

struct EquivalencePolicy {
    bool ignore_key_case     = false;  ///< Match object keys case-insensitively
    bool ignore_value_case   = false;  ///< Compare string values case-insensitively
    bool ignore_numeric_type = false;  ///< 1 == "1" == "1.0" == 1.0
    bool ignore_boolean_type = false;  ///< true == "true" == "TRUE"
    bool ignore_null         = false;  ///< null equals anything
    bool structure_only      = false;  ///< Compare keys and array shape only

    /// Exact path -> pattern; both strings must match the pattern
    std::map<Path, std::string> regex_by_path;

    /// Paths whose string values are compared by edit distance
    std::set<Path> fuzzy_paths;

    /// Maximum edit distance still considered equal
    int fuzzy_threshold = 3;

    /// Nesting limit; deeper documents are rejected with std::length_error
    std::size_t max_depth = DOCDIFF_DEFAULT_MAX_DEPTH;

    /// Pattern registered for exactly this path, or nullptr
    [[nodiscard]] const std::string* regex_for(const Path& path) const {
        auto it = regex_by_path.find(path);
        return it == regex_by_path.end() ? nullptr : &it->second;
    }

    [[nodiscard]] bool is_fuzzy_path(const Path& path) const {
        return fuzzy_paths.count(path) > 0;
    }

    /// True when every relaxation is off (strict structural comparison)
    [[nodiscard]] bool is_strict() const {
        return !ignore_key_case && !ignore_value_case && !ignore_numeric_type &&
               !ignore_boolean_type && !ignore_null && !structure_only &&
               regex_by_path.empty() && fuzzy_paths.empty();
    }

    bool operator==(const EquivalencePolicy&) const = default;
};

/// @throws std::invalid_argument if fuzzy_threshold is negative or max_depth is zero
DOCDIFF_API void require_valid(const EquivalencePolicy& policy);

/// require_valid() plus a check of every regex pattern.
/// @throws std::invalid_argument if fuzzy_threshold is negative or max_depth is zero
/// @return Paths whose regex pattern does not compile. Such rules are
///         skipped during comparison; callers may want to warn about them.
[[nodiscard]] DOCDIFF_API std::vector<Path> validate(const EquivalencePolicy& policy);

/// Split a "path:pattern" rule on its first colon.
/// @throws std::invalid_argument if there is no colon or the path is empty
[[nodiscard]] DOCDIFF_API std::pair<Path, std::string> parse_regex_rule(std::string_view rule);

/// Build a policy from a parsed policy document (see file format above).
/// Missing keys keep their defaults.
/// @throws std::invalid_argument on unknown keys or wrongly typed entries
[[nodiscard]] DOCDIFF_API EquivalencePolicy policy_from_value(const Value& config);

/// Read and parse a JSON policy file.
/// @throws std::runtime_error if the file can't be read or isn't valid JSON
/// @throws std::invalid_argument if the content is not a valid policy
[[nodiscard]] DOCDIFF_API EquivalencePolicy load_policy_file(const std::string& file_path);

/// Inverse of policy_from_value (every field is written)
[[nodiscard]] DOCDIFF_API Value policy_to_value(const EquivalencePolicy& policy);

} // namespace docdiff
