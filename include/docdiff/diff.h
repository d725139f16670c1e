// diff.h - One reported discrepancy between two documents

#pragma once

#include <docdiff/api.h>
#include <docdiff/path.h>
#include <docdiff/value.h>

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string_view>
#include <utility>

namespace docdiff {

enum class DiffKind : std::uint8_t {
    ValueMismatch,        ///< left/right: the two raw values
    KeyOnlyInLeft,        ///< left: the member value, right: null
    KeyOnlyInRight,       ///< left: null, right: the member value
    ArrayLengthMismatch,  ///< left/right: the two lengths
    TypeMismatch          ///< left/right: the two kind names
};

/// Stable label of a kind: "value_mismatch", "key_only_in_first",
/// "key_only_in_second", "array_length", "type_mismatch"
[[nodiscard]] DOCDIFF_API std::string_view kind_label(DiffKind kind) noexcept;

/// Inverse of kind_label
[[nodiscard]] DOCDIFF_API std::optional<DiffKind> kind_from_label(std::string_view label) noexcept;

struct Diff {
    Path path;
    DiffKind kind = DiffKind::ValueMismatch;
    Value left;
    Value right;

    Diff() = default;
    Diff(Path p, DiffKind k, Value l, Value r)
        : path(std::move(p)), kind(k), left(std::move(l)), right(std::move(r)) {}

    bool operator==(const Diff& other) const {
        return path == other.path && kind == other.kind &&
               left == other.left && right == other.right;
    }
};

DOCDIFF_API std::ostream& operator<<(std::ostream& os, const Diff& diff);

} // namespace docdiff
