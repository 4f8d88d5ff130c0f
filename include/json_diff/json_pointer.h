// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_pointer.h
/// @brief JSON Pointer (RFC 6901) rendering of Path.
///
///   .users[0].name  ->  "/users/0/name"
///   (root)          ->  ""
///
/// Field names are escaped: "~" becomes "~0" and "/" becomes "~1".

#pragma once

#include <json_diff/api.h>
#include <json_diff/path_types.h>

#include <string>

namespace json_diff {

/// Convert Path to JSON Pointer string
[[nodiscard]] JSON_DIFF_API std::string path_to_json_pointer(const Path& path);

} // namespace json_diff
