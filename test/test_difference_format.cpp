// test_difference_format.cpp - Tests for Difference message rendering
// Module 4: Difference::to_string() and the match report helpers

#include <catch2/catch_all.hpp>
#include <json_diff/json_match.h>
#include <json_diff/serialization.h>
#include <json_diff/value_diff.h>

#include <sstream>
#include <string>

using namespace json_diff;

namespace {

const Config strict{CompareMode::Strict};
const Config inclusive{CompareMode::Inclusive};

ValueBox box(const char* text) {
    return ValueBox{from_json(text)};
}

} // namespace

// ============================================================
// Rendering Tests
// ============================================================

TEST_CASE("Inclusive not-equal message", "[format][inclusive]") {
    Difference d{Path{"a", std::size_t{0}}, box("1"), box("2"), inclusive};
    REQUIRE(d.to_string() ==
            "json atoms at path \".a[0]\" are not equal:\n"
            "    expected:\n"
            "        2\n"
            "    actual:\n"
            "        1");
}

TEST_CASE("Inclusive missing message", "[format][inclusive]") {
    Difference d{Path{"b"}, std::nullopt, box("1"), inclusive};
    REQUIRE(d.to_string() == "json atom at path \".b\" is missing from actual");
}

TEST_CASE("Strict not-equal message", "[format][strict]") {
    Difference d{Path{}, box(R"("x")"), box("true"), strict};
    REQUIRE(d.to_string() ==
            "json atoms at path \"(root)\" are not equal:\n"
            "    lhs:\n"
            "        \"x\"\n"
            "    rhs:\n"
            "        true");
}

TEST_CASE("Strict missing messages", "[format][strict]") {
    Difference from_lhs{Path{"a"}, std::nullopt, box("1"), strict};
    REQUIRE(from_lhs.to_string() == "json atom at path \".a\" is missing from lhs");

    Difference from_rhs{Path{"a"}, box("1"), std::nullopt, strict};
    REQUIRE(from_rhs.to_string() == "json atom at path \".a\" is missing from rhs");
}

TEST_CASE("Multi-line values are indented line by line", "[format]") {
    Difference d{Path{"cfg"}, box(R"({"b": [1], "a": 1.0})"), box("{}"), strict};
    REQUIRE(d.to_string() ==
            "json atoms at path \".cfg\" are not equal:\n"
            "    lhs:\n"
            "        {\n"
            "          \"a\": 1.0,\n"
            "          \"b\": [\n"
            "            1\n"
            "          ]\n"
            "        }\n"
            "    rhs:\n"
            "        {}");
}

TEST_CASE("Difference stream output", "[format]") {
    Difference d{Path{"k"}, std::nullopt, box("null"), inclusive};
    std::ostringstream oss;
    oss << d;
    REQUIRE(oss.str() == d.to_string());
}

TEST_CASE("Rendering from compare()", "[format][compare]") {
    auto diffs = compare(from_json(R"({"a": 1})"), from_json(R"({"b": 1})"), inclusive);
    REQUIRE(diffs.size() == 1);
    REQUIRE(diffs[0].to_string() == "json atom at path \".b\" is missing from actual");
}

// ============================================================
// Match Report Tests
// ============================================================

TEST_CASE("json_includes", "[format][match]") {
    REQUIRE_FALSE(json_includes(from_json(R"({"a": 1, "b": 2})"), from_json(R"({"a": 1})")).has_value());

    auto report = json_includes(from_json(R"({"a": 1})"), from_json(R"({"a": 2, "c": 3})"));
    REQUIRE(report.has_value());
    REQUIRE(*report ==
            "json atoms at path \".a\" are not equal:\n"
            "    expected:\n"
            "        2\n"
            "    actual:\n"
            "        1"
            "\n\n"
            "json atom at path \".c\" is missing from actual");
}

TEST_CASE("json_equals", "[format][match]") {
    REQUIRE_FALSE(json_equals(from_json("[1, 2]"), from_json("[1, 2]")).has_value());

    auto report = json_equals(from_json(R"({"a": 1})"), from_json("{}"));
    REQUIRE(report.has_value());
    REQUIRE(*report == "json atom at path \".a\" is missing from rhs");
}

TEST_CASE("json_matches honours the full config", "[format][match]") {
    auto config = strict.array_sorting_mode(ArraySortingMode::Ignore);
    REQUIRE_FALSE(json_matches(from_json("[3, 1, 2]"), from_json("[1, 2, 3]"), config).has_value());
    REQUIRE(json_matches(from_json("[3, 1]"), from_json("[1, 2]"), config).has_value());
}

TEST_CASE("format_differences", "[format][match]") {
    REQUIRE(format_differences({}).empty());
}
