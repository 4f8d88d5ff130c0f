// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file serialization.h
/// @brief JSON text conversion for Value.
///
/// Usage:
/// @code
///   #include <json_diff/serialization.h>
///
///   Value parsed = from_json(R"({"name": "Alice", "tags": [1, 2.5]})");
///   std::string pretty = to_json(parsed);        // pretty-printed
///   std::string compact = to_json(parsed, true); // no whitespace
/// @endcode
///
/// Pretty output is canonical: two-space indentation, object members sorted
/// by key, doubles always carry a decimal point or an exponent so that 1 and
/// 1.0 remain distinguishable. Difference messages embed this form.

#pragma once

#include <json_diff/api.h>
#include <json_diff/value.h>

#include <string>
#include <string_view>

namespace json_diff {

/// Convert Value to JSON string
/// @param val The Value to convert
/// @param compact If true, produce minimal output; if false, pretty-print with indentation
/// @return JSON string representation
[[nodiscard]] JSON_DIFF_API std::string to_json(const Value& val, bool compact = false);

/// Parse JSON string to Value
/// @param json_str The JSON string to parse
/// @param error_out If provided, receives error message on failure
/// @return Parsed Value, or null Value on parse error
///
/// Integer literals become int64_t when they fit, else uint64_t, else double.
/// Documents nested deeper than JSON_DIFF_MAX_PARSE_DEPTH are rejected.
[[nodiscard]] JSON_DIFF_API Value from_json(std::string_view json_str, std::string* error_out = nullptr);

/// Read and parse a JSON file
/// @throws std::runtime_error if the file cannot be read or does not parse
[[nodiscard]] JSON_DIFF_API Value from_json_file(const std::string& path);

} // namespace json_diff
