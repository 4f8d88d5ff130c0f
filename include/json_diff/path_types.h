// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_types.h
/// @brief Persistent path type locating a value inside a JSON document.
///
/// A Path is an immutable sequence of PathElements, each either an object
/// field name or an array index. The empty path is the document root.
///
/// ## Usage Examples
///
/// ```cpp
/// Path root;                               // (root)
/// Path users = root.append("users");       // .users
/// Path first = users.append(0);            // .users[0]
/// Path name  = first.append("name");       // .users[0].name
/// // root, users and first are unchanged
/// ```
///
/// ## Design
///
/// Elements live in an immer::vector, so append() returns a new path that
/// shares every existing element with its parent. Sibling branches of a
/// recursive walk can extend the same parent independently, and copying a
/// Path is a reference-count increment.

#pragma once

#include <json_diff/json_diff_config.h>
#include <json_diff/api.h>
#include <json_diff/value_fwd.h>

#include <immer/vector.hpp>

#include <cstddef>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace json_diff {

/// A single path element: either an object field name or an array index
using PathElement = std::variant<std::string, std::size_t>;

class JSON_DIFF_API Path {
public:
    using value_type = PathElement;
    using container_type = immer::vector<PathElement, unsafe_memory_policy>;
    using iterator = container_type::const_iterator;
    using const_iterator = container_type::const_iterator;
    using size_type = std::size_t;

    /// Root path
    Path() = default;

    /// Construct from a literal element list, e.g. Path{"users", std::size_t{0}, "name"}
    Path(std::initializer_list<PathElement> init);

    // ============================================================
    // Append (non-destructive)
    // ============================================================

    /// Return this path extended by one element. *this is not modified.
    [[nodiscard]] Path append_element(PathElement elem) const;

    [[nodiscard]] Path append(std::size_t index) const {
        return append_element(PathElement{std::in_place_type<std::size_t>, index});
    }
    [[nodiscard]] Path append(std::string_view key) const {
        return append_element(PathElement{std::in_place_type<std::string>, key});
    }

    // ============================================================
    // Access
    // ============================================================

    [[nodiscard]] bool is_root() const noexcept { return elements_.empty(); }
    [[nodiscard]] bool empty() const noexcept { return elements_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return elements_.size(); }

    [[nodiscard]] const PathElement& operator[](std::size_t i) const { return elements_[i]; }
    [[nodiscard]] const PathElement& back() const { return elements_.back(); }

    [[nodiscard]] const_iterator begin() const { return elements_.begin(); }
    [[nodiscard]] const_iterator end() const { return elements_.end(); }

    /// Path without its last element (root stays root)
    [[nodiscard]] Path parent() const;

    // ============================================================
    // Comparison
    // ============================================================

    [[nodiscard]] bool operator==(const Path& other) const;
    [[nodiscard]] bool operator!=(const Path& other) const { return !(*this == other); }

    /// Render as "(root)" or a concatenation of ".field" and "[index]"
    [[nodiscard]] std::string to_string() const;

private:
    explicit Path(container_type elements) : elements_(std::move(elements)) {}

    container_type elements_;
};

// ============================================================
// Utility functions
// ============================================================

/// Convert a Path to a human-readable string (e.g., ".users[0].name")
[[nodiscard]] JSON_DIFF_API std::string path_to_string(const Path& path);

JSON_DIFF_API std::ostream& operator<<(std::ostream& os, const Path& path);

} // namespace json_diff
