// difference.cpp - Difference record and its message rendering

#include <json_diff/serialization.h>
#include <json_diff/value_diff.h>

#include <iostream>

namespace json_diff {

namespace {

/// Pretty JSON with every line prefixed by eight spaces
std::string indented_json(const Value& val)
{
    const std::string json = to_json(val, false);

    std::string result;
    result.reserve(json.size() + 16);
    result += "        ";
    for (char c : json) {
        result += c;
        if (c == '\n') {
            result += "        ";
        }
    }
    return result;
}

std::string quoted_path(const Path& path)
{
    return "\"" + path_to_string(path) + "\"";
}

bool same_side(const std::optional<ValueBox>& a, const std::optional<ValueBox>& b)
{
    if (a.has_value() != b.has_value()) {
        return false;
    }
    return !a || a->get() == b->get();
}

} // anonymous namespace

std::string_view to_string(CompareMode mode) noexcept
{
    switch (mode) {
    case CompareMode::Inclusive: return "inclusive";
    case CompareMode::Strict:    return "strict";
    }
    return "unknown";
}

std::string_view to_string(ArraySortingMode mode) noexcept
{
    switch (mode) {
    case ArraySortingMode::Exact:  return "exact";
    case ArraySortingMode::Ignore: return "ignore";
    }
    return "unknown";
}

std::string_view to_string(NumericMode mode) noexcept
{
    switch (mode) {
    case NumericMode::Strict:      return "strict";
    case NumericMode::AssumeFloat: return "assume_float";
    }
    return "unknown";
}

// ============================================================
// Difference Implementation
// ============================================================

Difference::Difference(Path path, std::optional<ValueBox> lhs, std::optional<ValueBox> rhs, Config config)
    : path_(std::move(path)), lhs_(std::move(lhs)), rhs_(std::move(rhs)), config_(config)
{
    const char* problem = nullptr;
    if (!lhs_ && !rhs_) {
        problem = "both sides absent";
    } else if (config_.compare_mode() == CompareMode::Inclusive && !rhs_) {
        problem = "inclusive record without an expected value";
    }
    if (problem) [[unlikely]] {
        std::cerr << "[Difference] invariant violation at " << path_to_string(path_)
                  << ": " << problem << "\n";
        throw InvariantViolation(std::string("Difference: ") + problem);
    }
}

std::string Difference::to_string() const
{
    const bool strict = config_.compare_mode() == CompareMode::Strict;

    if (lhs_ && rhs_) {
        std::string msg = "json atoms at path " + quoted_path(path_) + " are not equal:\n";
        if (strict) {
            msg += "    lhs:\n" + indented_json(lhs_->get()) + "\n";
            msg += "    rhs:\n" + indented_json(rhs_->get());
        } else {
            msg += "    expected:\n" + indented_json(rhs_->get()) + "\n";
            msg += "    actual:\n" + indented_json(lhs_->get());
        }
        return msg;
    }

    // The constructor guarantees exactly one side here, and the right one in Inclusive mode
    const char* missing_from = !lhs_ ? (strict ? "lhs" : "actual") : "rhs";
    return "json atom at path " + quoted_path(path_) + " is missing from " + missing_from;
}

bool Difference::operator==(const Difference& other) const
{
    return path_ == other.path_
        && config_ == other.config_
        && same_side(lhs_, other.lhs_)
        && same_side(rhs_, other.rhs_);
}

std::ostream& operator<<(std::ostream& os, const Difference& diff)
{
    return os << diff.to_string();
}

} // namespace json_diff
