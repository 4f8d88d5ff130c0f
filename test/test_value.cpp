// test_value.cpp - Tests for Value construction, access, and JSON text conversion
// Module 1: Core Value functionality

#include <catch2/catch_all.hpp>
#include <json_diff/builders.h>
#include <json_diff/serialization.h>
#include <json_diff/value.h>

#include <cstdint>
#include <limits>
#include <string>

using namespace json_diff;

// ============================================================
// Construction Tests
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.kind() == ValueKind::Null);
}

TEST_CASE("Value primitive construction", "[value][construction]") {
    SECTION("bool") {
        Value v{true};
        REQUIRE(v.is_bool());
        REQUIRE(v.as_bool() == true);
    }

    SECTION("signed integers are stored as int64_t") {
        Value v{-42};
        REQUIRE(v.is<int64_t>());
        REQUIRE(v.as_int64() == -42);
    }

    SECTION("unsigned integers are stored as uint64_t") {
        Value v{uint32_t{4000000000U}};
        REQUIRE(v.is<uint64_t>());
        REQUIRE(v.as_uint64() == 4000000000U);
    }

    SECTION("floating point is stored as double") {
        Value v{1.5f};
        REQUIRE(v.is_double());
        REQUIRE(v.as_double() == 1.5);
    }

    SECTION("string") {
        Value v{"hello"};
        REQUIRE(v.is_string());
        REQUIRE(v.as_string() == "hello");
        REQUIRE(v.kind() == ValueKind::String);
    }
}

TEST_CASE("Value container construction", "[value][construction]") {
    SECTION("map factory") {
        auto v = Value::map({{"name", Value{"Alice"}}, {"age", Value{30}}});
        REQUIRE(v.is_map());
        REQUIRE(v.size() == 2);
        REQUIRE(v.at("name").as_string() == "Alice");
        REQUIRE(v.contains("age"));
        REQUIRE_FALSE(v.contains("email"));
    }

    SECTION("vector factory") {
        auto v = Value::vector({Value{1}, Value{2}, Value{3}});
        REQUIRE(v.is_vector());
        REQUIRE(v.size() == 3);
        REQUIRE(v.at(std::size_t{2}).as_int64() == 3);
        REQUIRE(v.find(std::size_t{3}) == nullptr);
    }

    SECTION("builders") {
        Value v = MapBuilder()
            .set("width", 1920)
            .set("tags", VectorBuilder().push_back("a").push_back("b").finish())
            .finish();
        REQUIRE(v.at("width").as_int64() == 1920);
        REQUIRE(v.at("tags").size() == 2);
    }

    SECTION("repeated keys keep the last value") {
        MapBuilder builder;
        builder.set("a", 1).set("a", 2);
        REQUIRE(builder.size() == 1);
        REQUIRE(builder.finish().at("a").as_int64() == 2);
        REQUIRE(from_json(R"({"a": 1, "a": 2})").at("a").as_int64() == 2);
    }
}

TEST_CASE("Value persistent updates", "[value][update]") {
    auto original = Value::map({{"a", Value{1}}});
    auto updated = original.set("a", Value{2});

    REQUIRE(original.at("a").as_int64() == 1);
    REQUIRE(updated.at("a").as_int64() == 2);

    auto vec = Value::vector({Value{1}});
    auto longer = vec.push_back(Value{2});
    REQUIRE(vec.size() == 1);
    REQUIRE(longer.size() == 2);
}

// ============================================================
// Number Semantics Tests
// ============================================================

TEST_CASE("numbers_equal", "[value][number]") {
    SECTION("integers compare by value across signedness") {
        REQUIRE(numbers_equal(Value{5}, Value{uint64_t{5}}));
        REQUIRE(numbers_equal(Value{uint64_t{5}}, Value{int64_t{5}}));
        REQUIRE_FALSE(numbers_equal(Value{-1}, Value{std::numeric_limits<uint64_t>::max()}));
    }

    SECTION("an integer never equals a double") {
        REQUIRE_FALSE(numbers_equal(Value{1}, Value{1.0}));
        REQUIRE_FALSE(numbers_equal(Value{1.0}, Value{1}));
    }

    SECTION("doubles compare by value") {
        REQUIRE(numbers_equal(Value{2.5}, Value{2.5}));
        REQUIRE_FALSE(numbers_equal(Value{2.5}, Value{2.6}));
    }

    SECTION("non-numbers never match") {
        REQUIRE_FALSE(numbers_equal(Value{"1"}, Value{1}));
        REQUIRE_FALSE(numbers_equal(Value{1}, Value{}));
    }
}

TEST_CASE("Value to_double", "[value][number]") {
    REQUIRE(Value{1.25}.to_double() == 1.25);
    REQUIRE(Value{-7}.to_double() == -7.0);
    REQUIRE(Value{int64_t{1} << 53}.to_double() == 9007199254740992.0);
    REQUIRE(Value{-(int64_t{1} << 53)}.to_double() == -9007199254740992.0);

    SECTION("integers beyond 2^53 do not convert") {
        REQUIRE_FALSE(Value{(int64_t{1} << 53) + 1}.to_double().has_value());
        REQUIRE_FALSE(Value{std::numeric_limits<uint64_t>::max()}.to_double().has_value());
        REQUIRE_FALSE(Value{std::numeric_limits<int64_t>::min()}.to_double().has_value());
    }

    SECTION("non-numbers do not convert") {
        REQUIRE_FALSE(Value{"1"}.to_double().has_value());
        REQUIRE_FALSE(Value{}.to_double().has_value());
    }
}

TEST_CASE("Value structural equality", "[value][equality]") {
    REQUIRE(Value::map({{"a", Value{1}}}) == Value::map({{"a", Value{1}}}));
    REQUIRE_FALSE(Value{1} == Value{1.0});
    REQUIRE_FALSE(Value::vector({Value{1}, Value{2}}) == Value::vector({Value{2}, Value{1}}));
}

// ============================================================
// JSON Parsing Tests
// ============================================================

TEST_CASE("from_json number storage", "[value][json]") {
    REQUIRE(from_json("42").is<int64_t>());
    REQUIRE(from_json("-42").as_int64() == -42);
    REQUIRE(from_json("18446744073709551615").is<uint64_t>());
    REQUIRE(from_json("1.0").is_double());
    REQUIRE(from_json("1e3").as_double() == 1000.0);
    REQUIRE(from_json("100000000000000000000").is_double());
}

TEST_CASE("from_json number grammar", "[value][json]") {
    REQUIRE(from_json("0").as_int64() == 0);
    REQUIRE(from_json("-0").is<int64_t>());
    REQUIRE(from_json("0.5").as_double() == 0.5);
    REQUIRE(from_json("-0.25e1").as_double() == -2.5);
    REQUIRE(from_json("1E+2").as_double() == 100.0);
    REQUIRE(from_json("[0,10]").size() == 2);
}

TEST_CASE("from_json documents", "[value][json]") {
    auto v = from_json(R"({"name": "Alice", "tags": ["a", "b"], "ok": true, "none": null})");
    REQUIRE(v.is_map());
    REQUIRE(v.at("name").as_string() == "Alice");
    REQUIRE(v.at("tags").size() == 2);
    REQUIRE(v.at("ok").as_bool());
    REQUIRE(v.at("none").is_null());

    SECTION("escapes") {
        auto s = from_json(R"("line\n\"quoted\" \u00e9 \ud83d\ude00")");
        REQUIRE(s.as_string() == "line\n\"quoted\" \xC3\xA9 \xF0\x9F\x98\x80");
    }
}

TEST_CASE("from_json errors", "[value][json][error]") {
    std::string error;

    SECTION("trailing characters") {
        auto v = from_json("[1, 2] x", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("unterminated object") {
        auto v = from_json(R"({"a": 1)", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("empty input") {
        auto v = from_json("", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("malformed numbers") {
        for (const char* text : {"01", "-01", "1.", "-.5", ".5", "1e", "1e+", "-", "+1"}) {
            INFO(text);
            error.clear();
            REQUIRE(from_json(text, &error).is_null());
            REQUIRE_FALSE(error.empty());
        }
    }

    SECTION("unpaired surrogates") {
        REQUIRE(from_json(R"("\ud800")", &error).is_null());
        REQUIRE_FALSE(error.empty());

        error.clear();
        REQUIRE(from_json(R"("\ud800x")", &error).is_null());
        REQUIRE_FALSE(error.empty());

        error.clear();
        REQUIRE(from_json(R"("\udc00")", &error).is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("nesting depth limit") {
        const std::string ok = std::string(JSON_DIFF_MAX_PARSE_DEPTH, '[') +
                               std::string(JSON_DIFF_MAX_PARSE_DEPTH, ']');
        REQUIRE(from_json(ok, &error).is_vector());
        REQUIRE(error.empty());

        const std::string too_deep = std::string(JSON_DIFF_MAX_PARSE_DEPTH + 1, '[') +
                                     std::string(JSON_DIFF_MAX_PARSE_DEPTH + 1, ']');
        REQUIRE(from_json(too_deep, &error).is_null());
        REQUIRE(error.find("depth") != std::string::npos);
    }
}

TEST_CASE("from_json_file reports missing files", "[value][json][error]") {
    REQUIRE_THROWS_AS(from_json_file("/nonexistent/json_diff_test.json"), std::runtime_error);
}

// ============================================================
// JSON Serialization Tests
// ============================================================

TEST_CASE("to_json canonical form", "[value][json]") {
    SECTION("scalars") {
        REQUIRE(to_json(Value{}) == "null");
        REQUIRE(to_json(Value{true}) == "true");
        REQUIRE(to_json(Value{-3}) == "-3");
        REQUIRE(to_json(Value{1.0}) == "1.0");
        REQUIRE(to_json(Value{1.15}) == "1.15");
        REQUIRE(to_json(Value{"a\"b"}) == R"("a\"b")");
    }

    SECTION("exponents carry no sign or padding") {
        REQUIRE(to_json(Value{1e20}) == "1e20");
        REQUIRE(to_json(Value{1e-7}) == "1e-7");
        REQUIRE(to_json(Value{-1.5e300}) == "-1.5e300");
        REQUIRE(from_json(to_json(Value{1e-7})).as_double() == 1e-7);
    }

    SECTION("objects are sorted by key") {
        auto v = from_json(R"({"b": 1, "a": [1, 2], "c": {}})");
        REQUIRE(to_json(v, true) == R"({"a":[1,2],"b":1,"c":{}})");
        REQUIRE(to_json(v) ==
                "{\n"
                "  \"a\": [\n"
                "    1,\n"
                "    2\n"
                "  ],\n"
                "  \"b\": 1,\n"
                "  \"c\": {}\n"
                "}");
    }

    SECTION("round trip keeps number representation") {
        auto v = from_json(R"([1, 1.0, -0.5, 18446744073709551615])");
        REQUIRE(from_json(to_json(v)) == v);
    }
}

TEST_CASE("value_to_string", "[value][string]") {
    REQUIRE(value_to_string(Value{"abc"}) == "\"abc\"");
    REQUIRE(value_to_string(Value::vector({Value{1}, Value{2}, Value{3}})) == "[array:3]");
    REQUIRE(value_to_string(Value::map({{"a", Value{1}}})) == "{object:1}");
    REQUIRE(kind_name(ValueKind::Object) == "object");
}
