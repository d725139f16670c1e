// path.h - Dot/bracket path strings addressing document nodes

#pragma once

#include <docdiff/api.h>

#include <cstddef>
#include <string>
#include <string_view>

namespace docdiff {

/// Path of a node inside a document: "address.city", "hobbies[1]".
/// The root is the empty string.
using Path = std::string;

/// Append an object member: "key" at the root, "parent.key" below it
inline void append_key(Path& path, std::string_view key)
{
    if (!path.empty()) {
        path += '.';
    }
    path += key;
}

/// Append an array element: "parent[index]"
inline void append_index(Path& path, std::size_t index)
{
    path += '[';
    path += std::to_string(index);
    path += ']';
}

[[nodiscard]] inline Path child_path(const Path& parent, std::string_view key)
{
    Path result = parent;
    append_key(result, key);
    return result;
}

[[nodiscard]] inline Path child_path(const Path& parent, std::size_t index)
{
    Path result = parent;
    append_index(result, index);
    return result;
}

// ============================================================
// PathScope
//
// Extends a shared path buffer for the lifetime of the scope and
// truncates it back on exit. Lets the recursive comparison reuse one
// string instead of building a new Path per node.
// ============================================================
class PathScope {
public:
    PathScope(Path& path, std::string_view key) : path_(path), saved_size_(path.size()) {
        append_key(path_, key);
    }

    PathScope(Path& path, std::size_t index) : path_(path), saved_size_(path.size()) {
        append_index(path_, index);
    }

    ~PathScope() { path_.resize(saved_size_); }

    PathScope(const PathScope&) = delete;
    PathScope& operator=(const PathScope&) = delete;

private:
    Path& path_;
    std::size_t saved_size_;
};

/// Human-readable form of a path for reports ("(root)" for the empty path)
[[nodiscard]] inline std::string display_path(const Path& path)
{
    return path.empty() ? std::string{"(root)"} : path;
}

} // namespace docdiff
