// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief Transient-backed builders for Value containers.
///
/// Used to assemble documents and the value form of a diff without
/// copying the persistent container on every insertion.
///
/// Usage:
/// @code
///   Value cell = MapBuilder()
///       .set("cell_type", "code")
///       .set("source", "print(1)")
///       .finish();
///
///   Value cells = VectorBuilder()
///       .push_back(cell)
///       .finish();
/// @endcode

#pragma once

#include "value.h"

namespace docdiff {

template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;

    BasicMapBuilder() : transient_(value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Insert or overwrite `key`
    template <typename T>
    BasicMapBuilder& set(const std::string& key, T&& val) {
        transient_.set(key, value_box{value_type{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// The builder must not be used after finish()
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    typename value_map::transient_type transient_;
};

template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_box = BasicValueBox<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;

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

    [[nodiscard]] std::size_t size() const { return transient_.size(); }

    /// The builder must not be used after finish()
    [[nodiscard]] value_type finish() {
        return value_type{transient_.persistent()};
    }

private:
    typename value_vector::transient_type transient_;
};

using MapBuilder    = BasicMapBuilder<immer::default_memory_policy>;
using VectorBuilder = BasicVectorBuilder<immer::default_memory_policy>;

extern template class BasicMapBuilder<immer::default_memory_policy>;
extern template class BasicVectorBuilder<immer::default_memory_policy>;

} // namespace docdiff
