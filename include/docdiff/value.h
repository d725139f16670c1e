// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief Immutable Value type for parsed JSON-like documents.
///
/// A Value is one of:
/// - null (std::monostate)
/// - bool
/// - number (int64_t or double; both report ValueKind::Number)
/// - string
/// - array  (immer::vector of boxed values)
/// - object (immer::map from string key to boxed value, keys unique)
///
/// Values are immutable once constructed. Containers use immer's persistent
/// data structures, so copying a Value is O(1) and sub-trees are shared.
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.

#pragma once

#include <docdiff/docdiff_config.h>
#include "api.h"

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace docdiff {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if DOCDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Non-fatal diagnostics from the I/O and configuration layers
inline void log_warning(std::string_view func, std::string_view message) noexcept
{
#if DOCDIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] warning: " << message << "\n";
#else
    (void)func;
    (void)message;
#endif
}

} // namespace detail

/// The closed set of document node kinds
enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Number,
    String,
    Array,
    Object
};

/// Stable lower-case name of a kind ("null", "bool", "number", "string", "array", "object")
[[nodiscard]] DOCDIFF_API std::string_view kind_name(ValueKind kind) noexcept;

template <typename MemoryPolicy>
struct BasicValue;

template <typename MemoryPolicy>
using BasicValueBox = immer::box<BasicValue<MemoryPolicy>, MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueMap = immer::map<std::string,
                                 BasicValueBox<MemoryPolicy>,
                                 std::hash<std::string>,
                                 std::equal_to<std::string>,
                                 MemoryPolicy>;

template <typename MemoryPolicy>
using BasicValueVector = immer::vector<BasicValueBox<MemoryPolicy>,
                                       MemoryPolicy>;

template <typename MemoryPolicy = immer::default_memory_policy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 value_vector,
                 value_map>
        data;

    constexpr BasicValue() noexcept : data(std::monostate{}) {}
    constexpr BasicValue(bool v) noexcept : data(v) {}
    constexpr BasicValue(int v) noexcept : data(static_cast<int64_t>(v)) {}
    constexpr BasicValue(int64_t v) noexcept : data(v) {}
    constexpr BasicValue(double v) noexcept : data(v) {}
    BasicValue(const std::string& v) : data(v) {}
    BasicValue(std::string&& v) noexcept : data(std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::move(v)) {}
    BasicValue(value_map v) : data(std::move(v)) {}

    // Factory functions for container types
    static BasicValue object(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue array(std::initializer_list<BasicValue> init) {
        auto t = value_vector{}.transient();
        for (const auto& val : init) {
            t.push_back(value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    [[nodiscard]] ValueKind kind() const noexcept {
        switch (data.index()) {
            case 0: return ValueKind::Null;
            case 1: return ValueKind::Bool;
            case 2:
            case 3: return ValueKind::Number;
            case 4: return ValueKind::String;
            case 5: return ValueKind::Array;
            default: return ValueKind::Object;
        }
    }

    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_number() const noexcept { return is<int64_t>() || is<double>(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_array() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_object() const noexcept { return is<value_map>(); }
    [[nodiscard]] bool is_container() const noexcept { return is_array() || is_object(); }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* m = get_if<value_map>()) {
            if (auto* found = m->find(key)) return found->get();
        }
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return (*v)[index].get();
        }
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        if (auto* p = get_if<double>()) return static_cast<int64_t>(*p);
        return default_val;
    }

    [[nodiscard]] double as_number(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<int64_t>()) return static_cast<double>(*p);
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string_view as_string_view() const noexcept {
        if (auto* p = get_if<std::string>()) return *p;
        return {};
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->count(key) > 0;
        return false;
    }

    [[nodiscard]] std::size_t size() const {
        if (auto* m = get_if<value_map>()) return m->size();
        if (auto* v = get_if<value_vector>()) return v->size();
        return 0;
    }

    using size_type = std::size_t;
};

// ============================================================
// Default Value Type Aliases
//
// Value uses immer's default (thread-safe) memory policy so that
// independent comparisons may run on different threads.
// ============================================================

using Value       = BasicValue<immer::default_memory_policy>;
using ValueBox    = BasicValueBox<immer::default_memory_policy>;
using ValueMap    = BasicValueMap<immer::default_memory_policy>;
using ValueVector = BasicValueVector<immer::default_memory_policy>;

// ============================================================
// Structural equality
//
// Same kind and recursively identical content. Numbers compare by
// numeric value, so 1 == 1.0 regardless of the stored alternative.
// ============================================================

template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    if (a.is_number() && b.is_number()) {
        if (a.data.index() == b.data.index()) {
            return a.data == b.data;
        }
        return a.as_number() == b.as_number();
    }
    return a.data == b.data;
}

template <typename MemoryPolicy>
bool operator!=(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return !(a == b);
}

// ============================================================
// Utility functions
// ============================================================

/// Short human-readable rendering ("\"text\"", "42", "{object:3}", "[array:2]")
[[nodiscard]] DOCDIFF_API std::string value_to_string(const Value& val);

/// Render a number the way it appears in JSON output (integers without
/// a fraction, doubles with up to 15 significant digits)
[[nodiscard]] DOCDIFF_API std::string number_to_string(const Value& val);

DOCDIFF_API std::ostream& operator<<(std::ostream& os, const Value& val);

// ============================================================
// Extern Template Declarations
//
// The instantiation lives in value.cpp so that every translation unit
// does not instantiate BasicValue again.
// ============================================================

extern template struct BasicValue<immer::default_memory_policy>;

} // namespace docdiff
