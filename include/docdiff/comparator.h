// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file comparator.h
/// @brief Recursive comparison of two Value trees under an EquivalencePolicy.
///
/// Walks both documents in lock-step and collects a Diff for every place
/// where they are not equivalent:
///
/// - Objects: keys are matched (case-insensitively with ignore_key_case)
///   and visited in sorted order; keys on one side only are reported
///   without descending into them.
/// - Arrays: a length difference is reported once at the array's path,
///   then the common prefix is compared index by index.
/// - A container facing a value of another kind is a type mismatch; its
///   children are not visited. This also holds in structure_only mode, so a
///   scalar on the left against a container on the right is reported too.
/// - Leaves are decided by EquivalenceEvaluator.
///
/// The output order only depends on the inputs, so reports are
/// reproducible.
///
/// Example:
/// @code
///   EquivalencePolicy policy;
///   policy.ignore_numeric_type = true;
///
///   Comparator comparator{policy};
///   comparator.compare(left, right);
///   for (const auto& d : comparator.get_diffs()) {
///       std::cout << d << "\n";
///   }
/// @endcode

#pragma once

#include <docdiff/api.h>
#include <docdiff/diff.h>
#include <docdiff/equivalence.h>
#include <docdiff/path.h>
#include <docdiff/policy.h>
#include <docdiff/value.h>

#include <vector>

namespace docdiff {

class DOCDIFF_API Comparator {
public:
    /// @param policy Must outlive the comparator
    /// @throws std::invalid_argument if the policy is invalid (see validate())
    explicit Comparator(const EquivalencePolicy& policy);

    /// Compare two documents, replacing any previously collected diffs.
    /// @param root_path Path of the two roots ("" for whole documents)
    /// @throws std::length_error if nesting exceeds policy.max_depth
    void compare(const Value& left, const Value& right, const Path& root_path = {});

    /// Stop collecting after the first difference (for "are they equal?" checks)
    void set_stop_at_first(bool stop) noexcept { stop_at_first_ = stop; }

    [[nodiscard]] const std::vector<Diff>& get_diffs() const noexcept { return diffs_; }
    [[nodiscard]] std::vector<Diff> take_diffs() noexcept { return std::move(diffs_); }
    [[nodiscard]] bool has_differences() const noexcept { return !diffs_.empty(); }
    void clear() noexcept { diffs_.clear(); }

    [[nodiscard]] const EquivalencePolicy& policy() const noexcept { return policy_; }

private:
    struct Member {
        const std::string* label;
        const Value* left;
        const Value* right;
    };

    void compare_pair(const Value& left, const Value& right, Path& path, std::size_t depth);
    void compare_node(const Value& left, const Value& right, Path& path, std::size_t depth);
    void compare_objects(const ValueMap& left, const ValueMap& right, Path& path, std::size_t depth);
    void compare_arrays(const ValueVector& left, const ValueVector& right, Path& path, std::size_t depth);

    [[nodiscard]] std::vector<Member> match_members(const ValueMap& left, const ValueMap& right) const;
    [[nodiscard]] std::vector<Member> match_members_folded(const ValueMap& left, const ValueMap& right) const;

    [[nodiscard]] bool done() const noexcept { return stop_at_first_ && !diffs_.empty(); }

    const EquivalencePolicy& policy_;
    EquivalenceEvaluator evaluator_;
    std::vector<Diff> diffs_;
    bool stop_at_first_ = false;
};

/// Compare two whole documents
/// @throws std::invalid_argument for an invalid policy
/// @throws std::length_error if nesting exceeds policy.max_depth
[[nodiscard]] DOCDIFF_API std::vector<Diff> compare(const Value& left, const Value& right,
                                                    const EquivalencePolicy& policy);

/// Compare two sub-trees located at path
[[nodiscard]] DOCDIFF_API std::vector<Diff> compare(const Value& left, const Value& right,
                                                    const Path& path, const EquivalencePolicy& policy);

/// True when compare() would report nothing; returns on the first difference
[[nodiscard]] DOCDIFF_API bool equivalent(const Value& left, const Value& right,
                                          const EquivalencePolicy& policy);

} // namespace docdiff
