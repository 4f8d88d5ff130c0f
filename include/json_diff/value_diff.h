// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file value_diff.h
/// @brief Structural comparison of two Values under a Config.
///
/// Usage:
/// @code
///   Value actual = from_json(R"({"name": "Alice", "age": 30})");
///   Value expected = from_json(R"({"name": "Alice"})");
///
///   for (const auto& d : compare(actual, expected, Config{CompareMode::Inclusive})) {
///       std::cout << d << "\n";
///   }
/// @endcode
///
/// The walk dispatches on the left value. Objects are visited in ascending
/// key order and arrays in ascending index order, so the result is the same
/// on every run. Differences hold immer boxes of the compared subtrees and
/// stay valid after the inputs are released.

#pragma once

#include <json_diff/api.h>
#include <json_diff/config.h>
#include <json_diff/path_types.h>
#include <json_diff/value.h>

#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace json_diff {

/// Thrown when the comparator reaches a state it never produces on valid input
class JSON_DIFF_API InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// ============================================================
// Difference - one located discrepancy
// ============================================================

class JSON_DIFF_API Difference {
public:
    /// @throws InvariantViolation if both sides are absent, or if an
    ///         Inclusive record carries only a left side
    Difference(Path path, std::optional<ValueBox> lhs, std::optional<ValueBox> rhs, Config config);

    [[nodiscard]] const Path& path() const noexcept { return path_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }

    [[nodiscard]] bool has_lhs() const noexcept { return lhs_.has_value(); }
    [[nodiscard]] bool has_rhs() const noexcept { return rhs_.has_value(); }

    /// Left value, or nullptr when the location is missing on the left
    [[nodiscard]] const Value* lhs() const noexcept { return lhs_ ? &lhs_->get() : nullptr; }

    /// Right value, or nullptr when the location is missing on the right
    [[nodiscard]] const Value* rhs() const noexcept { return rhs_ ? &rhs_->get() : nullptr; }

    /// Multi-line message, no trailing newline:
    /// @code
    ///   json atoms at path ".a[0]" are not equal:
    ///       expected:
    ///           2
    ///       actual:
    ///           1
    /// @endcode
    [[nodiscard]] std::string to_string() const;

    [[nodiscard]] bool operator==(const Difference& other) const;

private:
    Path path_;
    std::optional<ValueBox> lhs_;
    std::optional<ValueBox> rhs_;
    Config config_;
};

JSON_DIFF_API std::ostream& operator<<(std::ostream& os, const Difference& diff);

// ============================================================
// DifferenceCollector
//
// Walks two Values in lock-step and records every discrepancy.
//
// Supports two modes:
// - Full (default): collects every difference in traversal order
// - Stop at first: returns as soon as one difference is recorded
// ============================================================

class JSON_DIFF_API DifferenceCollector {
private:
    std::vector<Difference> diffs_;
    Config config_;
    bool stop_at_first_ = false;

    void diff_value(const ValueBox& lhs, const ValueBox& rhs, const Path& path);
    void diff_number(const ValueBox& lhs, const ValueBox& rhs, const Path& path);
    void diff_vector(const ValueVector& lhs_vec, const ValueBox& lhs, const ValueBox& rhs, const Path& path);
    void diff_vector_contains(const ValueVector& lhs_vec, const ValueBox& lhs, const ValueBox& rhs, const Path& path);
    void diff_map(const ValueMap& lhs_map, const ValueBox& lhs, const ValueBox& rhs, const Path& path);

    void record(const Path& path, std::optional<ValueBox> lhs, std::optional<ValueBox> rhs);
    [[nodiscard]] bool done() const noexcept { return stop_at_first_ && !diffs_.empty(); }

public:
    explicit DifferenceCollector(Config config, bool stop_at_first = false);

    /// Compare lhs against rhs, replacing any previous results
    void diff(const Value& lhs, const Value& rhs);

    [[nodiscard]] const std::vector<Difference>& get_diffs() const;
    [[nodiscard]] std::vector<Difference> take_diffs();

    void clear();

    [[nodiscard]] bool has_changes() const;

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] bool is_stop_at_first() const noexcept { return stop_at_first_; }

    // Print diffs to stdout
    void print_diffs() const;
};

// ============================================================
// Entry points
// ============================================================

/// All differences between lhs and rhs, in traversal order
[[nodiscard]] JSON_DIFF_API std::vector<Difference> compare(const Value& lhs, const Value& rhs,
                                                           const Config& config);

/// True iff compare(lhs, rhs, config) would be non-empty. Stops at the first difference.
[[nodiscard]] JSON_DIFF_API bool has_any_difference(const Value& lhs, const Value& rhs,
                                                    const Config& config);

namespace detail {

/// Float rule: a == b, or |a - b| <= epsilon, or within 4 ULPs with the
/// same sign. Only exact equality applies under FloatCompareMode::exact().
[[nodiscard]] JSON_DIFF_API bool floats_equal(double a, double b, FloatCompareMode mode);

/// Number equality under config's numeric mode. rhs may be any kind.
[[nodiscard]] JSON_DIFF_API bool numbers_match(const Value& lhs, const Value& rhs, const Config& config);

} // namespace detail

} // namespace json_diff
