// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file builders.h
/// @brief O(n) construction of object and array Values.
///
/// Both builders fill an immer transient and hand out the persistent
/// container once, so building n members costs n in-place inserts instead
/// of n path copies. from_json() builds every container this way.
///
/// @code
///   Value expected = MapBuilder()
///       .set("width", 1920)
///       .set("tags", VectorBuilder().push_back("a").push_back("b").finish())
///       .finish();
/// @endcode

#pragma once

#include <json_diff/value.h>

#include <string>
#include <utility>

namespace json_diff {

template <typename MemoryPolicy>
class BasicMapBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_map = BasicValueMap<MemoryPolicy>;

    BasicMapBuilder() : members_(value_map{}.transient()) {}

    BasicMapBuilder(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder& operator=(BasicMapBuilder&&) noexcept = default;
    BasicMapBuilder(const BasicMapBuilder&) = delete;
    BasicMapBuilder& operator=(const BasicMapBuilder&) = delete;

    /// Add or replace a member. A repeated key keeps the last value.
    template <typename T>
    BasicMapBuilder& set(std::string key, T&& val) {
        members_.set(std::move(key), BasicValueBox<MemoryPolicy>{value_type{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return members_.size(); }

    /// The builder must not be used afterwards
    [[nodiscard]] value_type finish() { return value_type{members_.persistent()}; }

private:
    typename value_map::transient_type members_;
};

template <typename MemoryPolicy>
class BasicVectorBuilder {
public:
    using value_type = BasicValue<MemoryPolicy>;
    using value_vector = BasicValueVector<MemoryPolicy>;

    BasicVectorBuilder() : items_(value_vector{}.transient()) {}

    BasicVectorBuilder(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder& operator=(BasicVectorBuilder&&) noexcept = default;
    BasicVectorBuilder(const BasicVectorBuilder&) = delete;
    BasicVectorBuilder& operator=(const BasicVectorBuilder&) = delete;

    template <typename T>
    BasicVectorBuilder& push_back(T&& val) {
        items_.push_back(BasicValueBox<MemoryPolicy>{value_type{std::forward<T>(val)}});
        return *this;
    }

    [[nodiscard]] std::size_t size() const { return items_.size(); }

    /// The builder must not be used afterwards
    [[nodiscard]] value_type finish() { return value_type{items_.persistent()}; }

private:
    typename value_vector::transient_type items_;
};

extern template class BasicMapBuilder<unsafe_memory_policy>;
extern template class BasicVectorBuilder<unsafe_memory_policy>;

} // namespace json_diff
