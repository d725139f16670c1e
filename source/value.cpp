// value.cpp - Value type utilities

#include <docdiff/value.h>
#include <docdiff/builders.h>

#include <cmath>
#include <iomanip>    // for std::setprecision
#include <locale>
#include <sstream>    // for std::ostringstream

namespace docdiff {

std::string_view kind_name(ValueKind kind) noexcept
{
    switch (kind) {
        case ValueKind::Null:   return "null";
        case ValueKind::Bool:   return "bool";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Array:  return "array";
        case ValueKind::Object: return "object";
    }
    return "unknown";
}

std::string number_to_string(const Value& val)
{
    if (auto* i = val.get_if<int64_t>()) {
        return std::to_string(*i);
    }
    if (auto* d = val.get_if<double>()) {
        if (std::isnan(*d)) return "NaN";
        if (std::isinf(*d)) return *d > 0 ? "+Inf" : "-Inf";
        std::ostringstream oss;
        oss.imbue(std::locale::classic());
        oss << std::setprecision(15) << *d;
        return oss.str();
    }
    return {};
}

std::string value_to_string(const Value& val)
{
    return std::visit([&val](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            return number_to_string(val);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            return "{object:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            return "[array:" + std::to_string(arg.size()) + "]";
        } else {
            return "<unknown>";
        }
    }, val.data);
}

std::ostream& operator<<(std::ostream& os, const Value& val)
{
    return os << value_to_string(val);
}

// ============================================================
// Explicit Template Instantiations
// ============================================================

template struct BasicValue<immer::default_memory_policy>;
template class BasicMapBuilder<immer::default_memory_policy>;
template class BasicVectorBuilder<immer::default_memory_policy>;

} // namespace docdiff
