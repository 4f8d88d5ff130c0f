// Copyright (c) 2024-2025 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file json_diff_config.h
/// @brief Centralized compile-time configuration for json_diff and its dependencies
///
/// This file defines the compile-time configuration for the third-party libraries
/// used by json_diff:
///   - immer: Immutable data structures backing Value and Path
///   - boost: Boost.Math for ULP distance in approximate float comparison
///
/// It MUST be included before any library headers to ensure consistent settings.
///
/// json_diff is optimized for single-threaded comparison of value trees.
/// All code using json_diff will automatically inherit these settings,
/// so users don't need to manually define any library macros.
///
/// @warning Do NOT include immer headers directly without including this file first.
///          All json_diff public headers already include this file, so users
///          who only use json_diff headers don't need to do anything special.

#pragma once

// ============================================================
// Configuration Guard
// ============================================================
// Ensure this file is included before any library headers

#if defined(IMMER_CONFIG_HPP_INCLUDED_) && !defined(JSON_DIFF_CONFIGURED)
#error "immer headers were included before json_diff/json_diff_config.h. " \
       "Please include json_diff headers before any direct immer includes."
#endif

#define JSON_DIFF_CONFIGURED 1

// ============================================================
// Immer Performance Optimization Settings
// ============================================================

/// @brief Disable thread safety for single-threaded performance
///
/// This enables:
/// - Non-atomic reference counting (faster inc/dec)
/// - Thread-unsafe free list heap (no locks)
/// - No lock policy for atoms
#ifndef IMMER_NO_THREAD_SAFETY
#define IMMER_NO_THREAD_SAFETY 1
#endif

/// @brief Disable tagged node assertions
#ifndef IMMER_TAGGED_NODE
#define IMMER_TAGGED_NODE 0
#endif

// ============================================================
// Immer Debug Settings (all disabled for performance)
// ============================================================

#ifndef IMMER_DEBUG_TRACES
#define IMMER_DEBUG_TRACES 0
#endif

#ifndef IMMER_DEBUG_PRINT
#define IMMER_DEBUG_PRINT 0
#endif

#ifndef IMMER_DEBUG_STATS
#define IMMER_DEBUG_STATS 0
#endif

#ifndef IMMER_DEBUG_DEEP_CHECK
#define IMMER_DEBUG_DEEP_CHECK 0
#endif

#ifndef IMMER_ENABLE_DEBUG_SIZE_HEAP
#define IMMER_ENABLE_DEBUG_SIZE_HEAP 0
#endif

// ============================================================
// Immer Error Handling Settings
// ============================================================

/// @brief Don't throw on invalid state (use assertions instead)
#ifndef IMMER_THROW_ON_INVALID_STATE
#define IMMER_THROW_ON_INVALID_STATE 0
#endif

// ============================================================
// Boost Library Configuration
// ============================================================

/// @brief Disable Boost auto-linking for all libraries (MSVC)
///
/// json_diff only uses header-only parts of Boost (Boost.Math).
#ifndef BOOST_ALL_NO_LIB
#define BOOST_ALL_NO_LIB 1
#endif

// ============================================================
// Verbose Logging
//
// When JSON_DIFF_VERBOSE_LOG is 1:
//   - Value/Path access failures are logged to stderr
//   - from_json parse failures are logged to stderr
//
// By default, verbose logging is DISABLED in release builds
// and ENABLED in debug builds. Invariant violations inside the
// comparator are always logged.
// ============================================================

#ifndef JSON_DIFF_VERBOSE_LOG
#  if defined(NDEBUG)
#    define JSON_DIFF_VERBOSE_LOG 0
#  else
#    define JSON_DIFF_VERBOSE_LOG 1
#  endif
#endif

// ============================================================
// Resource Limits
// ============================================================

/// @brief Maximum nesting depth accepted by from_json()
///
/// The comparator recurses once per nesting level. Parsed documents deeper
/// than this are rejected so that comparing them cannot exhaust the stack.
#ifndef JSON_DIFF_MAX_PARSE_DEPTH
#define JSON_DIFF_MAX_PARSE_DEPTH 512
#endif

// ============================================================
// Configuration Summary (compile-time message)
// ============================================================

#ifdef JSON_DIFF_CONFIG_VERBOSE
#if IMMER_NO_THREAD_SAFETY
#pragma message("json_diff: Thread safety DISABLED (optimized for single-thread)")
#else
#pragma message("json_diff: Thread safety ENABLED")
#endif

#if JSON_DIFF_VERBOSE_LOG
#pragma message("json_diff: Verbose logging ENABLED")
#endif
#endif // JSON_DIFF_CONFIG_VERBOSE
