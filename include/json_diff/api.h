// api.h - DLL export/import macros for json_diff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for json_diff library.
///
/// Usage:
/// - When building json_diff as a SHARED library:
///   - CMake automatically defines JSON_DIFF_EXPORTS (private) and JSON_DIFF_SHARED (public)
///   - Functions/classes marked with JSON_DIFF_API will be exported
///
/// - When using json_diff as a SHARED library:
///   - Link against json_diff target (CMake propagates JSON_DIFF_SHARED)
///   - Functions/classes marked with JSON_DIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, JSON_DIFF_API expands to nothing
///
/// Example:
/// @code
/// class JSON_DIFF_API MyClass { ... };           // Export entire class
/// JSON_DIFF_API void my_function();              // Export free function
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    // Windows platform (MSVC, MinGW, Clang-CL)
    #ifdef JSON_DIFF_SHARED
        #ifdef JSON_DIFF_EXPORTS
            // Building the DLL: export symbols
            #define JSON_DIFF_API __declspec(dllexport)
        #else
            // Using the DLL: import symbols
            #define JSON_DIFF_API __declspec(dllimport)
        #endif
    #else
        // Static library: no decoration needed
        #define JSON_DIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    // GCC/Clang on Unix-like platforms
    #if defined(JSON_DIFF_SHARED) && defined(JSON_DIFF_EXPORTS)
        // Building shared library: set default visibility
        #define JSON_DIFF_API __attribute__((visibility("default")))
    #else
        // Static library or using shared library
        #define JSON_DIFF_API
    #endif
#else
    // Unknown compiler: no decoration
    #define JSON_DIFF_API
#endif
