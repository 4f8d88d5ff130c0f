// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.h
/// @brief Resolving a Path against a Value tree.
///
/// A Difference reports where two documents disagree; get_at_path() turns
/// that location back into the sub-value of either document.
///
/// ```cpp
/// for (const auto& d : compare(actual, expected, Config{CompareMode::Strict})) {
///     if (auto v = get_at_path(actual, d.path())) { ... }
/// }
/// ```

#pragma once

#include <json_diff/value.h>
#include <json_diff/path_types.h>
#include <json_diff/api.h>

#include <optional>

namespace json_diff {

namespace detail {

/// Child of a value at a single path element, or nullptr
/// @note Internal helper - prefer get_at_path() for public use
[[nodiscard]] inline const ValueBox* child_at(const Value& current, const PathElement& elem)
{
    if (auto* key = std::get_if<std::string>(&elem)) {
        return current.find(*key);
    }
    return current.find(std::get<std::size_t>(elem));
}

} // namespace detail

/// @brief Get value at a path
/// @param root The root value to traverse
/// @param path The path to follow
/// @return The value at the path, or std::nullopt if any step fails
[[nodiscard]] JSON_DIFF_API std::optional<Value> get_at_path(const Value& root, const Path& path);

} // namespace json_diff
