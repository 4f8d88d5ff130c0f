// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value.h
/// @brief JSON Value type compared by the diff engine.
///
/// The Value type represents the JSON data model:
/// - null (std::monostate)
/// - bool
/// - number, stored as int64_t, uint64_t or double
/// - string
/// - array (immer::vector of boxed values)
/// - object (immer::map from string to boxed value)
///
/// The Value type is templated on a memory policy, allowing users to
/// customize memory allocation strategies for the underlying immer containers.
/// Children are held in immer::box, so copying a Value or any of its subtrees
/// only bumps reference counts.

#pragma once

#include <json_diff/json_diff_config.h>
#include <json_diff/api.h>
#include <json_diff/value_fwd.h>

#include <immer/box.hpp>
#include <immer/map.hpp>
#include <immer/map_transient.hpp>
#include <immer/memory_policy.hpp>
#include <immer/vector.hpp>
#include <immer/vector_transient.hpp>

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace json_diff {

namespace detail {

inline void log_access_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if JSON_DIFF_VERBOSE_LOG
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
#if JSON_DIFF_VERBOSE_LOG
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
#if JSON_DIFF_VERBOSE_LOG
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

} // namespace detail

/// Largest integer magnitude that converts to double without rounding (2^53)
inline constexpr uint64_t max_safe_integer = uint64_t{1} << 53;

/// The six JSON value kinds
enum class ValueKind : uint8_t { Null, Bool, Number, String, Array, Object };

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

template <typename MemoryPolicy>
struct BasicValue
{
    using memory_policy = MemoryPolicy;
    using value_box     = BasicValueBox<MemoryPolicy>;
    using value_map     = BasicValueMap<MemoryPolicy>;
    using value_vector  = BasicValueVector<MemoryPolicy>;

    std::variant<std::monostate,
                 bool,
                 int64_t,
                 uint64_t,
                 double,
                 std::string,
                 value_vector,
                 value_map>
        data;

    BasicValue() noexcept : data(std::monostate{}) {}
    BasicValue(std::nullptr_t) noexcept : data(std::monostate{}) {}
    BasicValue(bool v) noexcept : data(std::in_place_type<bool>, v) {}

    template <std::signed_integral T>
    BasicValue(T v) noexcept : data(std::in_place_type<int64_t>, static_cast<int64_t>(v)) {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    BasicValue(T v) noexcept : data(std::in_place_type<uint64_t>, static_cast<uint64_t>(v)) {}

    template <std::floating_point T>
    BasicValue(T v) noexcept : data(std::in_place_type<double>, static_cast<double>(v)) {}

    BasicValue(const std::string& v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(std::string&& v) noexcept : data(std::in_place_type<std::string>, std::move(v)) {}
    BasicValue(std::string_view v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(const char* v) : data(std::in_place_type<std::string>, v) {}
    BasicValue(value_vector v) : data(std::in_place_type<value_vector>, std::move(v)) {}
    BasicValue(value_map v) : data(std::in_place_type<value_map>, std::move(v)) {}

    // Factory functions for container types
    static BasicValue map(std::initializer_list<std::pair<std::string, BasicValue>> init) {
        auto t = value_map{}.transient();
        for (const auto& [key, val] : init) {
            t.set(key, value_box{val});
        }
        return BasicValue{t.persistent()};
    }

    static BasicValue vector(std::initializer_list<BasicValue> init) {
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

    [[nodiscard]] std::size_t type_index() const noexcept { return data.index(); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_bool() const noexcept { return is<bool>(); }
    [[nodiscard]] bool is_integer() const noexcept { return is<int64_t>() || is<uint64_t>(); }
    [[nodiscard]] bool is_double() const noexcept { return is<double>(); }
    [[nodiscard]] bool is_number() const noexcept { return is_integer() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return is<std::string>(); }
    [[nodiscard]] bool is_vector() const noexcept { return is<value_vector>(); }
    [[nodiscard]] bool is_map() const noexcept { return is<value_map>(); }

    [[nodiscard]] ValueKind kind() const noexcept {
        return std::visit([](const auto& arg) -> ValueKind {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, std::monostate>) return ValueKind::Null;
            else if constexpr (std::is_same_v<T, bool>) return ValueKind::Bool;
            else if constexpr (std::is_same_v<T, std::string>) return ValueKind::String;
            else if constexpr (std::is_same_v<T, value_vector>) return ValueKind::Array;
            else if constexpr (std::is_same_v<T, value_map>) return ValueKind::Object;
            else return ValueKind::Number;
        }, data);
    }

    /// Look up a child without copying it. Returns nullptr when absent.
    [[nodiscard]] const value_box* find(const std::string& key) const {
        if (auto* m = get_if<value_map>()) return m->find(key);
        return nullptr;
    }

    [[nodiscard]] const value_box* find(std::size_t index) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return &(*v)[index];
        }
        return nullptr;
    }

    [[nodiscard]] BasicValue at(const std::string& key) const {
        if (auto* found = find(key)) return found->get();
        detail::log_key_error("Value::at", key, "not found or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] BasicValue at(std::size_t index) const {
        if (auto* found = find(index)) return found->get();
        detail::log_index_error("Value::at", index, "out of range or type mismatch");
        return BasicValue{};
    }

    [[nodiscard]] bool contains(const std::string& key) const { return find(key) != nullptr; }
    [[nodiscard]] bool contains(std::size_t index) const { return find(index) != nullptr; }

    [[nodiscard]] bool as_bool(bool default_val = false) const {
        if (auto* p = get_if<bool>()) return *p;
        return default_val;
    }

    [[nodiscard]] int64_t as_int64(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] uint64_t as_uint64(uint64_t default_val = 0) const {
        if (auto* p = get_if<uint64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] double as_double(double default_val = 0.0) const {
        if (auto* p = get_if<double>()) return *p;
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

    [[nodiscard]] value_map as_map(value_map default_val = {}) const {
        if (auto* p = get_if<value_map>()) return *p;
        return default_val;
    }

    [[nodiscard]] value_vector as_vector(value_vector default_val = {}) const {
        if (auto* p = get_if<value_vector>()) return *p;
        return default_val;
    }

    /// Best-effort conversion to double.
    ///
    /// Doubles convert as-is; integers only when their magnitude is at most
    /// 2^53. Non-numbers and larger integers yield std::nullopt.
    [[nodiscard]] std::optional<double> to_double() const noexcept {
        if (auto* p = get_if<double>()) return *p;
        if (auto* p = get_if<uint64_t>()) {
            if (*p <= max_safe_integer) return static_cast<double>(*p);
            return std::nullopt;
        }
        if (auto* p = get_if<int64_t>()) {
            const uint64_t magnitude = *p < 0 ? uint64_t{0} - static_cast<uint64_t>(*p)
                                              : static_cast<uint64_t>(*p);
            if (magnitude <= max_safe_integer) return static_cast<double>(*p);
            return std::nullopt;
        }
        return std::nullopt;
    }

    [[nodiscard]] BasicValue set(const std::string& key, BasicValue val) const {
        if (auto* m = get_if<value_map>()) return m->set(key, value_box{std::move(val)});
        detail::log_key_error("Value::set", key, "cannot set on non-map type");
        return *this;
    }

    [[nodiscard]] BasicValue set(std::size_t index, BasicValue val) const {
        if (auto* v = get_if<value_vector>()) {
            if (index < v->size()) return v->set(index, value_box{std::move(val)});
        }
        detail::log_index_error("Value::set", index, "cannot set on non-vector type");
        return *this;
    }

    [[nodiscard]] BasicValue push_back(BasicValue val) const {
        if (auto* v = get_if<value_vector>()) return v->push_back(value_box{std::move(val)});
        detail::log_access_error("Value::push_back", "cannot push_back on non-vector type");
        return *this;
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
// Value (declared in value_fwd.h) uses non-atomic reference counts and
// must not be shared across threads.
// ============================================================

using ValueBox    = BasicValueBox<unsafe_memory_policy>;
using ValueMap    = BasicValueMap<unsafe_memory_policy>;
using ValueVector = BasicValueVector<unsafe_memory_policy>;

// ============================================================
// Comparison
// ============================================================

/// Structural equality: same variant alternative and equal contents.
/// Numbers stored with different representations (1 vs 1.0) are not equal.
template <typename MemoryPolicy>
bool operator==(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b)
{
    return a.data == b.data;
}

/// Exact number equality.
///
/// Integers compare by mathematical value regardless of signed/unsigned
/// storage. A double is equal only to a double. Returns false if either side
/// is not a number.
template <typename MemoryPolicy>
[[nodiscard]] bool numbers_equal(const BasicValue<MemoryPolicy>& a, const BasicValue<MemoryPolicy>& b) noexcept
{
    if (auto* x = a.template get_if<double>()) {
        auto* y = b.template get_if<double>();
        return y && *x == *y;
    }
    if (!a.is_integer() || !b.is_integer()) {
        return false;
    }
    if (auto* x = a.template get_if<int64_t>()) {
        if (auto* y = b.template get_if<int64_t>()) return *x == *y;
        return *x >= 0 && static_cast<uint64_t>(*x) == *b.template get_if<uint64_t>();
    }
    const uint64_t x = *a.template get_if<uint64_t>();
    if (auto* y = b.template get_if<uint64_t>()) return x == *y;
    const int64_t y = *b.template get_if<int64_t>();
    return y >= 0 && static_cast<uint64_t>(y) == x;
}

// ============================================================
// Utility functions
// ============================================================

/// Object keys in ascending byte order (immer::map iterates in hash order)
template <typename MemoryPolicy>
[[nodiscard]] std::vector<const std::string*> sorted_keys(const BasicValueMap<MemoryPolicy>& map)
{
    std::vector<const std::string*> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) {
        keys.push_back(&k);
    }
    std::sort(keys.begin(), keys.end(),
              [](const std::string* a, const std::string* b) { return *a < *b; });
    return keys;
}

/// Name of a value kind ("null", "bool", "number", ...)
[[nodiscard]] JSON_DIFF_API std::string_view kind_name(ValueKind kind) noexcept;

/// Short one-line description of a value (e.g. "\"abc\"", "[array:3]")
[[nodiscard]] JSON_DIFF_API std::string value_to_string(const Value& val);

// ============================================================
// Extern Template Declarations
//
// The actual instantiations are in value.cpp.
// ============================================================

extern template struct BasicValue<unsafe_memory_policy>;

} // namespace json_diff
