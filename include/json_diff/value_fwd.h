// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_fwd.h
/// @brief Forward declarations for Value and Builder types
///
/// Lets headers such as config.h and path_types.h mention Value without
/// pulling in immer's container headers.

#pragma once

#include <json_diff/json_diff_config.h>

#include <immer/memory_policy.hpp>

namespace json_diff {

// ============================================================
// Memory Policy Forward Declarations
// ============================================================

using unsafe_memory_policy = immer::memory_policy<immer::unsafe_free_list_heap_policy<immer::cpp_heap>,
                                                  immer::unsafe_refcount_policy, immer::no_lock_policy>;

// ============================================================
// Value Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
struct BasicValue;

using Value = BasicValue<unsafe_memory_policy>;

// ============================================================
// Builder Type Forward Declarations
// ============================================================

template <typename MemoryPolicy>
class BasicMapBuilder;
template <typename MemoryPolicy>
class BasicVectorBuilder;

using MapBuilder = BasicMapBuilder<unsafe_memory_policy>;
using VectorBuilder = BasicVectorBuilder<unsafe_memory_policy>;

} // namespace json_diff
