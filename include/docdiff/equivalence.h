// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file equivalence.h
/// @brief Decides whether two values are "equal enough" under a policy.
///
/// Relaxation rules are tried in a fixed order and the first rule that
/// declares the pair equal wins:
///
///   1. ValueCase     - both strings, equal ignoring case
///   2. NullWildcard  - either side is null
///   3. PathRegex     - both strings match the pattern registered for the path
///   4. PathFuzzy     - both strings within the edit-distance threshold
///   5. BooleanType   - both coerce to bool ("true"/"false" strings) and agree
///   6. NumericType   - both coerce to a number and are numerically equal
///   7. Structural    - same kind, recursively identical content
///
/// Rules 1-6 are gated by their policy switch. A rule that does not apply
/// to the pair behaves exactly like a rule that evaluated to false.

#pragma once

#include <docdiff/api.h>
#include <docdiff/matchers.h>
#include <docdiff/path.h>
#include <docdiff/policy.h>
#include <docdiff/value.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace docdiff {

enum class Rule : std::uint8_t {
    ValueCase,
    NullWildcard,
    PathRegex,
    PathFuzzy,
    BooleanType,
    NumericType,
    Structural
};

/// Evaluation order of the rules
inline constexpr std::array<Rule, 7> kRulePrecedence{
    Rule::ValueCase,
    Rule::NullWildcard,
    Rule::PathRegex,
    Rule::PathFuzzy,
    Rule::BooleanType,
    Rule::NumericType,
    Rule::Structural,
};

[[nodiscard]] DOCDIFF_API std::string_view rule_name(Rule rule) noexcept;

// ============================================================
// Coercions and case folding
// ============================================================

/// bool as-is; strings "true"/"false" in any case. Anything else: nullopt.
[[nodiscard]] DOCDIFF_API std::optional<bool> coerce_bool(const Value& val);

/// Numbers as-is; strings parsed as decimal or scientific notation,
/// independent of the current locale. The whole string must parse, and an
/// out-of-range literal does not coerce. Anything else: nullopt.
[[nodiscard]] DOCDIFF_API std::optional<double> coerce_number(const Value& val);

/// Unicode simple case folding of a UTF-8 string ("ÉCOLE" -> "école"),
/// used as the canonical spelling of keys
[[nodiscard]] DOCDIFF_API std::string fold_case(std::string_view s);

/// Equal after case folding, compared code point by code point
[[nodiscard]] DOCDIFF_API bool equals_ignore_case(std::string_view a, std::string_view b);

// ============================================================
// EquivalenceEvaluator
//
// Holds the policy by reference and a regex cache, so patterns are
// compiled once for all the comparisons made through one evaluator.
// ============================================================
class DOCDIFF_API EquivalenceEvaluator {
public:
    /// @param policy Must outlive the evaluator
    explicit EquivalenceEvaluator(const EquivalencePolicy& policy);

    /// The first rule (in precedence order) that declares the pair equal,
    /// or std::nullopt if none does
    [[nodiscard]] std::optional<Rule> match(const Value& left, const Value& right, const Path& path);

    [[nodiscard]] bool equal(const Value& left, const Value& right, const Path& path) {
        return match(left, right, path).has_value();
    }

    /// Evaluate one rule in isolation (including its policy switch)
    [[nodiscard]] bool rule_admits(Rule rule, const Value& left, const Value& right, const Path& path);

    [[nodiscard]] const EquivalencePolicy& policy() const noexcept { return policy_; }

private:
    const EquivalencePolicy& policy_;
    RegexCache regex_cache_;
};

/// One-shot convenience wrapper around EquivalenceEvaluator
[[nodiscard]] DOCDIFF_API bool equal(const Value& left, const Value& right,
                                     const Path& path, const EquivalencePolicy& policy);

} // namespace docdiff
