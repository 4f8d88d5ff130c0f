// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file path_types.cpp
/// @brief Implementation of the persistent Path type.

#include <json_diff/path_types.h>

namespace json_diff {

// ============================================================
// Path - Construction
// ============================================================

Path::Path(std::initializer_list<PathElement> init) {
    auto t = elements_.transient();
    for (const auto& elem : init) {
        t.push_back(elem);
    }
    elements_ = t.persistent();
}

Path Path::append_element(PathElement elem) const {
    return Path(elements_.push_back(std::move(elem)));
}

Path Path::parent() const {
    if (elements_.empty()) {
        return *this;
    }
    return Path(elements_.take(elements_.size() - 1));
}

// ============================================================
// Path - Comparison operators
// ============================================================

bool Path::operator==(const Path& other) const {
    return elements_ == other.elements_;
}

std::string Path::to_string() const {
    return path_to_string(*this);
}

// ============================================================
// Utility functions
// ============================================================

std::string path_to_string(const Path& path) {
    if (path.empty()) {
        return "(root)";
    }

    std::string result;
    result.reserve(path.size() * 10);  // Estimate

    for (const auto& elem : path) {
        if (auto* key = std::get_if<std::string>(&elem)) {
            result += '.';
            result += *key;
        } else {
            result += '[';
            result += std::to_string(std::get<std::size_t>(elem));
            result += ']';
        }
    }

    return result;
}

std::ostream& operator<<(std::ostream& os, const Path& path) {
    return os << path_to_string(path);
}

} // namespace json_diff
