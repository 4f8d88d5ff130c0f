// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_match.h
/// @brief Report-style helpers for test code.
///
/// Each helper returns std::nullopt when the values match, and otherwise
/// every Difference rendered and separated by a blank line.
///
/// @code
///   if (auto report = json_includes(actual, expected)) {
///       FAIL(*report);
///   }
/// @endcode

#pragma once

#include <json_diff/api.h>
#include <json_diff/config.h>
#include <json_diff/value.h>
#include <json_diff/value_diff.h>

#include <optional>
#include <string>
#include <vector>

namespace json_diff {

/// Render differences joined by "\n\n"; empty string for no differences
[[nodiscard]] JSON_DIFF_API std::string format_differences(const std::vector<Difference>& diffs);

/// Report for compare(lhs, rhs, config), or std::nullopt when it is empty
[[nodiscard]] JSON_DIFF_API std::optional<std::string> json_matches(const Value& lhs, const Value& rhs,
                                                                    const Config& config);

/// actual contains everything in expected (CompareMode::Inclusive)
[[nodiscard]] JSON_DIFF_API std::optional<std::string> json_includes(const Value& actual, const Value& expected);

/// lhs and rhs are equal (CompareMode::Strict)
[[nodiscard]] JSON_DIFF_API std::optional<std::string> json_equals(const Value& lhs, const Value& rhs);

} // namespace json_diff
