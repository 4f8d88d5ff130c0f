// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file config.h
/// @brief Comparison policy passed through every step of a diff.
///
/// A Config bundles four independent choices:
///
/// | Field              | Values                 | Default   |
/// |--------------------|------------------------|-----------|
/// | compare_mode       | Inclusive, Strict      | required  |
/// | array_sorting_mode | Exact, Ignore          | Exact     |
/// | numeric_mode       | Strict, AssumeFloat    | Strict    |
/// | float_compare_mode | exact(), epsilon(e)    | exact()   |
///
/// Usage:
/// @code
///   auto config = Config{CompareMode::Inclusive}
///                     .array_sorting_mode(ArraySortingMode::Ignore)
///                     .numeric_mode(NumericMode::AssumeFloat)
///                     .float_compare_mode(FloatCompareMode::epsilon(0.01));
/// @endcode
///
/// Setters return an updated copy; a Config is never modified in place.

#pragma once

#include <json_diff/json_diff_config.h>
#include <json_diff/api.h>

#include <cstdint>
#include <optional>
#include <string_view>

namespace json_diff {

/// Inclusive: the right-hand value is the expected subset of the left.
/// Strict: both sides must match exactly.
enum class CompareMode : uint8_t { Inclusive, Strict };

/// Exact: array order matters. Ignore: arrays are compared as multisets.
enum class ArraySortingMode : uint8_t { Exact, Ignore };

/// Strict: numbers compare by stored value and type. AssumeFloat: numbers
/// compare as doubles whenever both convert losslessly.
enum class NumericMode : uint8_t { Strict, AssumeFloat };

/// How two numbers treated as doubles are compared
class FloatCompareMode {
public:
    [[nodiscard]] static constexpr FloatCompareMode exact() noexcept { return FloatCompareMode{}; }

    /// Equal within an absolute margin @p e, or within 4 ULPs.
    /// A negative margin is accepted and never matches by the absolute test.
    [[nodiscard]] static constexpr FloatCompareMode epsilon(double e) noexcept {
        FloatCompareMode mode;
        mode.epsilon_ = e;
        return mode;
    }

    [[nodiscard]] constexpr bool is_exact() const noexcept { return !epsilon_.has_value(); }
    [[nodiscard]] constexpr bool is_epsilon() const noexcept { return epsilon_.has_value(); }

    /// The margin; 0.0 for exact()
    [[nodiscard]] constexpr double epsilon_value() const noexcept { return epsilon_.value_or(0.0); }

    [[nodiscard]] constexpr bool operator==(const FloatCompareMode&) const = default;

private:
    constexpr FloatCompareMode() noexcept = default;

    std::optional<double> epsilon_;
};

class Config {
public:
    constexpr explicit Config(CompareMode mode) noexcept : compare_mode_(mode) {}

    [[nodiscard]] constexpr CompareMode compare_mode() const noexcept { return compare_mode_; }
    [[nodiscard]] constexpr ArraySortingMode array_sorting_mode() const noexcept { return array_sorting_mode_; }
    [[nodiscard]] constexpr NumericMode numeric_mode() const noexcept { return numeric_mode_; }
    [[nodiscard]] constexpr FloatCompareMode float_compare_mode() const noexcept { return float_compare_mode_; }

    [[nodiscard]] constexpr Config array_sorting_mode(ArraySortingMode mode) const noexcept {
        Config copy = *this;
        copy.array_sorting_mode_ = mode;
        return copy;
    }

    [[nodiscard]] constexpr Config numeric_mode(NumericMode mode) const noexcept {
        Config copy = *this;
        copy.numeric_mode_ = mode;
        return copy;
    }

    [[nodiscard]] constexpr Config float_compare_mode(FloatCompareMode mode) const noexcept {
        Config copy = *this;
        copy.float_compare_mode_ = mode;
        return copy;
    }

    [[nodiscard]] constexpr bool operator==(const Config&) const = default;

private:
    CompareMode compare_mode_;
    ArraySortingMode array_sorting_mode_ = ArraySortingMode::Exact;
    NumericMode numeric_mode_ = NumericMode::Strict;
    FloatCompareMode float_compare_mode_ = FloatCompareMode::exact();
};

[[nodiscard]] JSON_DIFF_API std::string_view to_string(CompareMode mode) noexcept;
[[nodiscard]] JSON_DIFF_API std::string_view to_string(ArraySortingMode mode) noexcept;
[[nodiscard]] JSON_DIFF_API std::string_view to_string(NumericMode mode) noexcept;

} // namespace json_diff
