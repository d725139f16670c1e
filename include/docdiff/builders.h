// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Builder classes for O(n) construction of immutable Value containers.
///
/// Usage:
/// @code
///   #include <docdiff/builders.h>
///
///   Value entry = MapBuilder()
///       .set("path", "address.city")
///       .set("type", "value_mismatch")
///       .finish();
///
///   Value items = VectorBuilder()
///       .push_back("item1")
///       .push_back("item2")
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace docdiff {

/// Builder for constructing value_map efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;
    using transient_type = typename value_map::transient_type;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;

    // Copy operations (disabled - transient sharing is dangerous)
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Set a key-value pair; a later set() of the same key replaces the value
    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicMapBuilder& set(const std::string& key, value_type val) {
        transient_.set(key, value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] bool contains(const std::string& key) const {
        return transient_.count(key) > 0;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    /// Finish building and return the immutable Value.
    /// The builder must not be used afterwards.
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

/// Builder for constructing value_vector efficiently - O(n) complexity
template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;
    using transient_type = typename value_vector::transient_type;

    BasicVectorBuilder() : transient_(value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;

    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        transient_.push_back(value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    BasicVectorBuilder& push_back(value_type val) {
        transient_.push_back(value_box{std::move(val)});
        return *this;
    }

    [[nodiscard]] std::size_t size() const {
        return transient_.size();
    }

    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<immer::default_memory_policy>;
using VectorBuilder = BasicVectorBuilder<immer::default_memory_policy>;

extern template class BasicMapBuilder<immer::default_memory_policy>;
extern template class BasicVectorBuilder<immer::default_memory_policy>;

} // namespace docdiff
