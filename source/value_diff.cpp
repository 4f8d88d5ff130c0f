// value_diff.cpp - DifferenceCollector and the comparison entry points

#include <json_diff/value_diff.h>

#include <boost/math/special_functions/next.hpp>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace json_diff {

namespace {

/// Maximum ULP distance accepted by the epsilon float rule
constexpr double max_ulps = 4.0;

[[noreturn]] void fail_invariant(std::string_view func, const std::string& message)
{
    // Always reported, independent of JSON_DIFF_VERBOSE_LOG
    std::cerr << "[" << func << "] invariant violation: " << message << "\n";
    throw InvariantViolation(std::string(func) + ": " + message);
}

} // anonymous namespace

// ============================================================
// Number comparison
// ============================================================

namespace detail {

bool floats_equal(double a, double b, FloatCompareMode mode)
{
    if (a == b) {
        return true;
    }
    if (mode.is_exact()) {
        return false;
    }
    if (std::fabs(a - b) <= mode.epsilon_value()) {
        return true;
    }
    // float_distance is only defined for finite arguments
    if (!std::isfinite(a) || !std::isfinite(b) || std::signbit(a) != std::signbit(b)) {
        return false;
    }
    return std::fabs(boost::math::float_distance(a, b)) <= max_ulps;
}

bool numbers_match(const Value& lhs, const Value& rhs, const Config& config)
{
    if (config.numeric_mode() == NumericMode::AssumeFloat) {
        const auto a = lhs.to_double();
        const auto b = rhs.to_double();
        if (!a || !b) {
            return numbers_equal(lhs, rhs);
        }
        return floats_equal(*a, *b, config.float_compare_mode());
    }

    const auto* a = lhs.get_if<double>();
    const auto* b = rhs.get_if<double>();
    if (a && b) {
        return floats_equal(*a, *b, config.float_compare_mode());
    }
    return numbers_equal(lhs, rhs);
}

} // namespace detail

// ============================================================
// DifferenceCollector Implementation
// ============================================================

DifferenceCollector::DifferenceCollector(Config config, bool stop_at_first)
    : config_(config), stop_at_first_(stop_at_first)
{
}

void DifferenceCollector::diff(const Value& lhs, const Value& rhs)
{
    diffs_.clear();
    diff_value(ValueBox{lhs}, ValueBox{rhs}, Path{});
}

const std::vector<Difference>& DifferenceCollector::get_diffs() const
{
    return diffs_;
}

std::vector<Difference> DifferenceCollector::take_diffs()
{
    return std::exchange(diffs_, {});
}

void DifferenceCollector::clear()
{
    diffs_.clear();
}

bool DifferenceCollector::has_changes() const
{
    return !diffs_.empty();
}

void DifferenceCollector::print_diffs() const
{
    std::cout << "compare_mode=" << to_string(config_.compare_mode())
              << " array_sorting_mode=" << to_string(config_.array_sorting_mode())
              << " numeric_mode=" << to_string(config_.numeric_mode());
    if (config_.float_compare_mode().is_epsilon()) {
        std::cout << " epsilon=" << config_.float_compare_mode().epsilon_value();
    }
    std::cout << "\n";

    if (diffs_.empty()) {
        std::cout << "  (no changes)\n";
        return;
    }
    for (const auto& d : diffs_) {
        std::cout << d << "\n\n";
    }
    std::cout << diffs_.size() << " difference(s)\n";
}

void DifferenceCollector::record(const Path& path, std::optional<ValueBox> lhs, std::optional<ValueBox> rhs)
{
    diffs_.emplace_back(path, std::move(lhs), std::move(rhs), config_);
}

void DifferenceCollector::diff_value(const ValueBox& lhs, const ValueBox& rhs, const Path& path)
{
    const Value& left = lhs.get();

    switch (left.kind()) {
    case ValueKind::Number:
        diff_number(lhs, rhs, path);
        return;
    case ValueKind::Array:
        if (config_.array_sorting_mode() == ArraySortingMode::Ignore) {
            diff_vector_contains(*left.get_if<ValueVector>(), lhs, rhs, path);
        } else {
            diff_vector(*left.get_if<ValueVector>(), lhs, rhs, path);
        }
        return;
    case ValueKind::Object:
        diff_map(*left.get_if<ValueMap>(), lhs, rhs, path);
        return;
    case ValueKind::Null:
    case ValueKind::Bool:
    case ValueKind::String:
        // Different alternatives never compare equal, so this also catches type mismatches
        if (left != rhs.get()) {
            record(path, lhs, rhs);
        }
        return;
    }
}

void DifferenceCollector::diff_number(const ValueBox& lhs, const ValueBox& rhs, const Path& path)
{
    if (!detail::numbers_match(lhs.get(), rhs.get(), config_)) {
        record(path, lhs, rhs);
    }
}

void DifferenceCollector::diff_vector(const ValueVector& lhs_vec, const ValueBox& lhs,
                                      const ValueBox& rhs, const Path& path)
{
    const auto* rhs_vec = rhs.get().get_if<ValueVector>();
    if (!rhs_vec) {
        record(path, lhs, rhs);
        return;
    }

    if (config_.compare_mode() == CompareMode::Inclusive) {
        // Only indices present on the right are checked
        for (std::size_t i = 0; i < rhs_vec->size() && !done(); ++i) {
            if (i < lhs_vec.size()) {
                diff_value(lhs_vec[i], (*rhs_vec)[i], path.append(i));
            } else {
                record(path.append(i), std::nullopt, (*rhs_vec)[i]);
            }
        }
        return;
    }

    const std::size_t count = std::max(lhs_vec.size(), rhs_vec->size());
    for (std::size_t i = 0; i < count && !done(); ++i) {
        const bool in_lhs = i < lhs_vec.size();
        const bool in_rhs = i < rhs_vec->size();
        if (in_lhs && in_rhs) {
            diff_value(lhs_vec[i], (*rhs_vec)[i], path.append(i));
        } else if (in_lhs) {
            record(path.append(i), lhs_vec[i], std::nullopt);
        } else if (in_rhs) {
            record(path.append(i), std::nullopt, (*rhs_vec)[i]);
        } else [[unlikely]] {
            fail_invariant("DifferenceCollector::diff_vector",
                           "index " + std::to_string(i) + " present on neither side at " + path_to_string(path));
        }
    }
}

void DifferenceCollector::diff_vector_contains(const ValueVector& lhs_vec, const ValueBox& lhs,
                                               const ValueBox& rhs, const Path& path)
{
    const auto* rhs_vec = rhs.get().get_if<ValueVector>();
    if (!rhs_vec) {
        record(path, lhs, rhs);
        return;
    }
    if (config_.compare_mode() == CompareMode::Strict && lhs_vec.size() != rhs_vec->size()) {
        record(path, lhs, rhs);
        return;
    }

    // Right-hand items already counted; identical items have identical counts
    std::vector<const Value*> checked;
    checked.reserve(rhs_vec->size());

    for (const auto& expected_box : *rhs_vec) {
        const Value& expected = expected_box.get();
        const bool seen = std::any_of(checked.begin(), checked.end(),
                                      [&](const Value* v) { return *v == expected; });
        if (seen) {
            continue;
        }
        checked.push_back(&expected);

        const auto need = std::count_if(rhs_vec->begin(), rhs_vec->end(), [&](const ValueBox& item) {
            return !has_any_difference(expected, item.get(), config_);
        });
        const auto have = std::count_if(lhs_vec.begin(), lhs_vec.end(), [&](const ValueBox& item) {
            return !has_any_difference(item.get(), expected, config_);
        });
        if (have < need) {
            // Reported once for the whole array
            record(path, lhs, rhs);
            return;
        }
    }
}

void DifferenceCollector::diff_map(const ValueMap& lhs_map, const ValueBox& lhs,
                                   const ValueBox& rhs, const Path& path)
{
    const auto* rhs_map = rhs.get().get_if<ValueMap>();
    if (!rhs_map) {
        record(path, lhs, rhs);
        return;
    }

    const auto rhs_keys = sorted_keys<unsafe_memory_policy>(*rhs_map);

    if (config_.compare_mode() == CompareMode::Inclusive) {
        // Only keys present on the right are checked
        for (const std::string* key : rhs_keys) {
            if (done()) {
                return;
            }
            const ValueBox* rhs_child = rhs_map->find(*key);
            if (const ValueBox* lhs_child = lhs_map.find(*key)) {
                diff_value(*lhs_child, *rhs_child, path.append(*key));
            } else {
                record(path.append(*key), std::nullopt, *rhs_child);
            }
        }
        return;
    }

    // Strict: merge the two sorted key lists into their union
    const auto lhs_keys = sorted_keys<unsafe_memory_policy>(lhs_map);
    auto l = lhs_keys.begin();
    auto r = rhs_keys.begin();
    while ((l != lhs_keys.end() || r != rhs_keys.end()) && !done()) {
        const std::string* key = nullptr;
        if (r == rhs_keys.end() || (l != lhs_keys.end() && **l < **r)) {
            key = *l++;
        } else if (l == lhs_keys.end() || **r < **l) {
            key = *r++;
        } else {
            key = *l++;
            ++r;
        }

        const ValueBox* lhs_child = lhs_map.find(*key);
        const ValueBox* rhs_child = rhs_map->find(*key);
        if (lhs_child && rhs_child) {
            diff_value(*lhs_child, *rhs_child, path.append(*key));
        } else if (lhs_child) {
            record(path.append(*key), *lhs_child, std::nullopt);
        } else if (rhs_child) {
            record(path.append(*key), std::nullopt, *rhs_child);
        } else [[unlikely]] {
            fail_invariant("DifferenceCollector::diff_map",
                           "key '" + *key + "' present on neither side at " + path_to_string(path));
        }
    }
}

// ============================================================
// Entry points
// ============================================================

std::vector<Difference> compare(const Value& lhs, const Value& rhs, const Config& config)
{
    DifferenceCollector collector{config};
    collector.diff(lhs, rhs);
    return collector.take_diffs();
}

bool has_any_difference(const Value& lhs, const Value& rhs, const Config& config)
{
    DifferenceCollector collector{config, true};
    collector.diff(lhs, rhs);
    return collector.has_changes();
}

} // namespace json_diff
