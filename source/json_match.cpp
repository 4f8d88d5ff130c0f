// json_match.cpp - report helpers built on compare()

#include <json_diff/json_match.h>

namespace json_diff {

std::string format_differences(const std::vector<Difference>& diffs)
{
    std::string result;
    for (const auto& d : diffs) {
        if (!result.empty()) {
            result += "\n\n";
        }
        result += d.to_string();
    }
    return result;
}

std::optional<std::string> json_matches(const Value& lhs, const Value& rhs, const Config& config)
{
    const auto diffs = compare(lhs, rhs, config);
    if (diffs.empty()) {
        return std::nullopt;
    }
    return format_differences(diffs);
}

std::optional<std::string> json_includes(const Value& actual, const Value& expected)
{
    return json_matches(actual, expected, Config{CompareMode::Inclusive});
}

std::optional<std::string> json_equals(const Value& lhs, const Value& rhs)
{
    return json_matches(lhs, rhs, Config{CompareMode::Strict});
}

} // namespace json_diff
