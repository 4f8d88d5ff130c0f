// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_core.cpp
/// @brief Implementation of path resolution.

#include <json_diff/path_core.h>

namespace json_diff {

std::optional<Value> get_at_path(const Value& root, const Path& path)
{
    const Value* current = &root;
    for (const auto& elem : path) {
        const ValueBox* child = detail::child_at(*current, elem);
        if (!child) [[unlikely]] {
            detail::log_access_error("get_at_path",
                                     "cannot resolve " + path_to_string(path) + " in " +
                                     value_to_string(*current));
            return std::nullopt;
        }
        current = &child->get();
    }
    return *current;
}

} // namespace json_diff
