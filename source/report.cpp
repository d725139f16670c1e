// report.cpp - Text and JSON rendering of diffs

#include <docdiff/report.h>
#include <docdiff/builders.h>
#include <docdiff/serialization.h>

#include <algorithm>
#include <ostream>
#include <stdexcept>

namespace docdiff {

namespace {

std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (true) {
        const auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

const char* description(DiffKind kind)
{
    switch (kind) {
        case DiffKind::ValueMismatch:       return "value mismatch";
        case DiffKind::KeyOnlyInLeft:       return "key exists only in first file";
        case DiffKind::KeyOnlyInRight:      return "key exists only in second file";
        case DiffKind::ArrayLengthMismatch: return "array length mismatch";
        case DiffKind::TypeMismatch:        return "type mismatch";
    }
    return "difference";
}

} // anonymous namespace

// ============================================================
// DiffKind labels
// ============================================================

std::string_view kind_label(DiffKind kind) noexcept
{
    switch (kind) {
        case DiffKind::ValueMismatch:       return "value_mismatch";
        case DiffKind::KeyOnlyInLeft:       return "key_only_in_first";
        case DiffKind::KeyOnlyInRight:      return "key_only_in_second";
        case DiffKind::ArrayLengthMismatch: return "array_length";
        case DiffKind::TypeMismatch:        return "type_mismatch";
    }
    return "unknown";
}

std::optional<DiffKind> kind_from_label(std::string_view label) noexcept
{
    for (auto kind : {DiffKind::ValueMismatch, DiffKind::KeyOnlyInLeft, DiffKind::KeyOnlyInRight,
                      DiffKind::ArrayLengthMismatch, DiffKind::TypeMismatch}) {
        if (kind_label(kind) == label) {
            return kind;
        }
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const Diff& diff)
{
    return os << display_path(diff.path) << " [" << kind_label(diff.kind) << "] "
              << value_to_string(diff.left) << " vs " << value_to_string(diff.right);
}

// ============================================================
// Text report
// ============================================================

std::string render_value(const Value& val)
{
    if (auto* s = val.get_if<std::string>()) {
        return *s;
    }
    return to_json(val, true);
}

std::string format_diff(const Diff& diff)
{
    std::string out = display_path(diff.path);
    out += ": ";
    out += description(diff.kind);
    out += '\n';

    if (diff.kind != DiffKind::KeyOnlyInLeft && diff.kind != DiffKind::KeyOnlyInRight) {
        out += "- " + render_value(diff.left) + "\n";
        out += "+ " + render_value(diff.right) + "\n";
    }
    return out;
}

std::string format_report(const std::vector<Diff>& diffs)
{
    std::string out;
    for (const auto& d : diffs) {
        out += format_diff(d);
    }
    return out;
}

// ============================================================
// Structured report
// ============================================================

Value diff_to_value(const Diff& diff)
{
    return MapBuilder()
        .set("path", diff.path)
        .set("type", kind_label(diff.kind))
        .set("value1", diff.left)
        .set("value2", diff.right)
        .finish();
}

Value diffs_to_value(const std::vector<Diff>& diffs)
{
    VectorBuilder builder;
    for (const auto& d : diffs) {
        builder.push_back(diff_to_value(d));
    }
    return builder.finish();
}

std::string diffs_to_json(const std::vector<Diff>& diffs)
{
    return to_json(diffs_to_value(diffs));
}

std::vector<Diff> diffs_from_value(const Value& report)
{
    auto* entries = report.get_if<ValueVector>();
    if (!entries) {
        throw std::invalid_argument("report: expected an array of diffs");
    }

    std::vector<Diff> diffs;
    diffs.reserve(entries->size());
    for (const auto& box : *entries) {
        const Value& entry = box.get();
        if (!entry.is_object() || !entry.at("path").is_string()) {
            throw std::invalid_argument("report: entry without a string 'path': " + value_to_string(entry));
        }
        auto kind = kind_from_label(entry.at("type").as_string_view());
        if (!kind) {
            throw std::invalid_argument("report: unknown diff type " + value_to_string(entry.at("type")));
        }
        diffs.emplace_back(entry.at("path").as_string(), *kind, entry.at("value1"), entry.at("value2"));
    }
    return diffs;
}

// ============================================================
// Line diff
// ============================================================

std::vector<LineDiff> diff_lines(std::string_view left, std::string_view right)
{
    const auto lines1 = split_lines(left);
    const auto lines2 = split_lines(right);
    const std::size_t max_lines = std::max(lines1.size(), lines2.size());

    std::vector<LineDiff> diffs;
    for (std::size_t i = 0; i < max_lines; ++i) {
        const std::string_view l = i < lines1.size() ? lines1[i] : std::string_view{};
        const std::string_view r = i < lines2.size() ? lines2[i] : std::string_view{};
        if (l != r) {
            diffs.push_back({i + 1, std::string{l}, std::string{r}});
        }
    }
    return diffs;
}

std::string format_line_diffs(const std::vector<LineDiff>& diffs)
{
    std::string out;
    for (const auto& d : diffs) {
        out += "Line " + std::to_string(d.line) + ":\n";
        out += "  - " + d.left + "\n";
        out += "  + " + d.right + "\n";
    }
    return out;
}

} // namespace docdiff
