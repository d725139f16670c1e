// comparator.cpp - Recursive document comparison

#include <docdiff/comparator.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <tuple>

namespace docdiff {

namespace {

struct KeyRef {
    const std::string* key;
    const Value* value;
};

struct FoldedKeyRef {
    std::string folded;
    const std::string* key;
    const Value* value;
};

std::vector<KeyRef> sorted_keys(const ValueMap& map)
{
    std::vector<KeyRef> keys;
    keys.reserve(map.size());
    for (const auto& [key, box] : map) {
        keys.push_back({&key, &box.get()});
    }
    std::sort(keys.begin(), keys.end(),
              [](const KeyRef& a, const KeyRef& b) { return *a.key < *b.key; });
    return keys;
}

std::vector<FoldedKeyRef> sorted_folded_keys(const ValueMap& map)
{
    std::vector<FoldedKeyRef> keys;
    keys.reserve(map.size());
    for (const auto& [key, box] : map) {
        keys.push_back({fold_case(key), &key, &box.get()});
    }
    std::sort(keys.begin(), keys.end(), [](const FoldedKeyRef& a, const FoldedKeyRef& b) {
        return std::tie(a.folded, *a.key) < std::tie(b.folded, *b.key);
    });
    return keys;
}

Value length_value(std::size_t n)
{
    return Value{static_cast<int64_t>(n)};
}

Value kind_value(const Value& val)
{
    return Value{kind_name(val.kind())};
}

} // anonymous namespace

Comparator::Comparator(const EquivalencePolicy& policy)
    : policy_(policy)
    , evaluator_(policy)
{
    require_valid(policy_);
}

void Comparator::compare(const Value& left, const Value& right, const Path& root_path)
{
    diffs_.clear();

    Path path = root_path;
    path.reserve(64);
    compare_pair(left, right, path, 0);
}

// Decide a member/element/root pair: equal, descend, or report.
void Comparator::compare_pair(const Value& left, const Value& right, Path& path, std::size_t depth)
{
    if (policy_.structure_only) {
        if (left.is_container() || right.is_container()) {
            compare_node(left, right, path, depth);
        }
        return;
    }

    // Containers of the same kind: the relaxations only apply to leaves,
    // so descending finds every difference the evaluator would.
    if (left.is_container() && left.kind() == right.kind()) {
        compare_node(left, right, path, depth);
        return;
    }

    if (evaluator_.equal(left, right, path)) {
        return;
    }

    if (left.is_container() || right.is_container()) {
        compare_node(left, right, path, depth);
    } else {
        diffs_.emplace_back(path, DiffKind::ValueMismatch, left, right);
    }
}

void Comparator::compare_node(const Value& left, const Value& right, Path& path, std::size_t depth)
{
    if (depth > policy_.max_depth) {
        throw std::length_error("document nesting exceeds max_depth (" +
                                std::to_string(policy_.max_depth) + ") at " + display_path(path));
    }

    if (left.kind() != right.kind()) {
        diffs_.emplace_back(path, DiffKind::TypeMismatch, kind_value(left), kind_value(right));
        return;
    }

    if (auto* lm = left.get_if<ValueMap>()) {
        compare_objects(*lm, *right.get_if<ValueMap>(), path, depth);
    } else if (auto* lv = left.get_if<ValueVector>()) {
        compare_arrays(*lv, *right.get_if<ValueVector>(), path, depth);
    } else if (!policy_.structure_only && !evaluator_.equal(left, right, path)) {
        diffs_.emplace_back(path, DiffKind::ValueMismatch, left, right);
    }
}

void Comparator::compare_objects(const ValueMap& left, const ValueMap& right, Path& path, std::size_t depth)
{
    // Shared immer node: identical content
    if (left.identity() == right.identity()) {
        return;
    }

    const auto members = policy_.ignore_key_case ? match_members_folded(left, right)
                                                 : match_members(left, right);

    for (const auto& m : members) {
        if (done()) {
            return;
        }

        PathScope scope{path, *m.label};

        if (!m.right) {
            diffs_.emplace_back(path, DiffKind::KeyOnlyInLeft, *m.left, Value{});
        } else if (!m.left) {
            diffs_.emplace_back(path, DiffKind::KeyOnlyInRight, Value{}, *m.right);
        } else {
            compare_pair(*m.left, *m.right, path, depth + 1);
        }
    }
}

void Comparator::compare_arrays(const ValueVector& left, const ValueVector& right, Path& path, std::size_t depth)
{
    if (left.identity() == right.identity()) {
        return;
    }

    if (left.size() != right.size()) {
        diffs_.emplace_back(path, DiffKind::ArrayLengthMismatch,
                            length_value(left.size()), length_value(right.size()));
    }

    const std::size_t common = std::min(left.size(), right.size());
    for (std::size_t i = 0; i < common; ++i) {
        if (done()) {
            return;
        }
        PathScope scope{path, i};
        compare_pair(left[i].get(), right[i].get(), path, depth + 1);
    }
}

// Union of both key sets in byte order. Each key appears once; a missing
// side is left null.
std::vector<Comparator::Member> Comparator::match_members(const ValueMap& left, const ValueMap& right) const
{
    const auto lk = sorted_keys(left);
    const auto rk = sorted_keys(right);

    std::vector<Member> members;
    members.reserve(std::max(lk.size(), rk.size()));

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < lk.size() || j < rk.size()) {
        if (j == rk.size() || (i < lk.size() && *lk[i].key < *rk[j].key)) {
            members.push_back({lk[i].key, lk[i].value, nullptr});
            ++i;
        } else if (i == lk.size() || *rk[j].key < *lk[i].key) {
            members.push_back({rk[j].key, nullptr, rk[j].value});
            ++j;
        } else {
            members.push_back({lk[i].key, lk[i].value, rk[j].value});
            ++i;
            ++j;
        }
    }
    return members;
}

// Keys grouped by their folded spelling and visited in folded order.
// Inside a group, keys are paired in byte order of their own
// spelling; when one side has more keys folding to the same spelling,
// the surplus is reported as one-sided. A pair is labelled with the
// left side's spelling.
std::vector<Comparator::Member> Comparator::match_members_folded(const ValueMap& left, const ValueMap& right) const
{
    const auto lk = sorted_folded_keys(left);
    const auto rk = sorted_folded_keys(right);

    std::vector<Member> members;
    members.reserve(std::max(lk.size(), rk.size()));

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < lk.size() || j < rk.size()) {
        if (j == rk.size() || (i < lk.size() && lk[i].folded < rk[j].folded)) {
            members.push_back({lk[i].key, lk[i].value, nullptr});
            ++i;
            continue;
        }
        if (i == lk.size() || rk[j].folded < lk[i].folded) {
            members.push_back({rk[j].key, nullptr, rk[j].value});
            ++j;
            continue;
        }

        const std::string& group = lk[i].folded;
        std::size_t li = i;
        std::size_t rj = j;
        while (li < lk.size() && lk[li].folded == group) ++li;
        while (rj < rk.size() && rk[rj].folded == group) ++rj;

        while (i < li || j < rj) {
            if (i < li && j < rj) {
                members.push_back({lk[i].key, lk[i].value, rk[j].value});
                ++i;
                ++j;
            } else if (i < li) {
                members.push_back({lk[i].key, lk[i].value, nullptr});
                ++i;
            } else {
                members.push_back({rk[j].key, nullptr, rk[j].value});
                ++j;
            }
        }
    }
    return members;
}

// ============================================================
// Free functions
// ============================================================

std::vector<Diff> compare(const Value& left, const Value& right, const EquivalencePolicy& policy)
{
    Comparator comparator{policy};
    comparator.compare(left, right);
    return comparator.take_diffs();
}

std::vector<Diff> compare(const Value& left, const Value& right, const Path& path, const EquivalencePolicy& policy)
{
    Comparator comparator{policy};
    comparator.compare(left, right, path);
    return comparator.take_diffs();
}

bool equivalent(const Value& left, const Value& right, const EquivalencePolicy& policy)
{
    Comparator comparator{policy};
    comparator.set_stop_at_first(true);
    comparator.compare(left, right);
    return !comparator.has_differences();
}

} // namespace docdiff
