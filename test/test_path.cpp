// test_path.cpp - Tests for Path system
// Module 2: Path, JSON Pointer and path traversal

#include <catch2/catch_all.hpp>
#include <json_diff/json_pointer.h>
#include <json_diff/path_core.h>
#include <json_diff/path_types.h>
#include <json_diff/serialization.h>
#include <json_diff/value_diff.h>

#include <sstream>
#include <string>

using namespace json_diff;

// ============================================================
// Path Construction Tests
// ============================================================

TEST_CASE("Path construction", "[path][construction]") {
    SECTION("default is root") {
        Path path;
        REQUIRE(path.is_root());
        REQUIRE(path.size() == 0);
    }

    SECTION("from initializer list") {
        Path path{"users", std::size_t{0}, "name"};
        REQUIRE(path.size() == 3);
        REQUIRE(std::get<std::string>(path[0]) == "users");
        REQUIRE(std::get<std::size_t>(path[1]) == 0);
        REQUIRE(std::get<std::string>(path.back()) == "name");
    }
}

TEST_CASE("Path append is non-destructive", "[path][append]") {
    Path root;
    Path users = root.append("users");
    Path first = users.append(std::size_t{0});
    Path second = users.append(std::size_t{1});

    REQUIRE(root.is_root());
    REQUIRE(users.size() == 1);
    REQUIRE(first.size() == 2);
    REQUIRE(second.size() == 2);
    REQUIRE(first != second);
    REQUIRE(first.parent() == users);
    REQUIRE(second.parent() == users);
    REQUIRE(root.parent() == root);
}

TEST_CASE("Path equality", "[path][comparison]") {
    REQUIRE(Path{"a", std::size_t{1}} == Path{}.append("a").append(std::size_t{1}));
    REQUIRE(Path{"a"} != Path{"b"});
    REQUIRE(Path{std::size_t{0}} != Path{"0"});
    REQUIRE(Path{"a"} != Path{"a", "b"});
}

// ============================================================
// Rendering Tests
// ============================================================

TEST_CASE("Path rendering", "[path][string]") {
    REQUIRE(path_to_string(Path{}) == "(root)");
    REQUIRE(path_to_string(Path{"a"}) == ".a");
    REQUIRE(path_to_string(Path{std::size_t{3}}) == "[3]");
    REQUIRE(Path{"users", std::size_t{0}, "name"}.to_string() == ".users[0].name");

    std::ostringstream oss;
    oss << Path{"a", std::size_t{2}};
    REQUIRE(oss.str() == ".a[2]");
}

// ============================================================
// JSON Pointer Tests
// ============================================================

TEST_CASE("path_to_json_pointer", "[path][pointer]") {
    REQUIRE(path_to_json_pointer(Path{}) == "");
    REQUIRE(path_to_json_pointer(Path{"users", std::size_t{0}, "name"}) == "/users/0/name");
    REQUIRE(path_to_json_pointer(Path{"a/b", "m~n"}) == "/a~1b/m~0n");
}

// ============================================================
// Path Traversal Tests
// ============================================================

TEST_CASE("get_at_path", "[path][traversal]") {
    auto doc = from_json(R"({"users": [{"name": "Alice"}, {"name": "Bob"}]})");

    SECTION("root") {
        auto v = get_at_path(doc, Path{});
        REQUIRE(v.has_value());
        REQUIRE(*v == doc);
    }

    SECTION("nested value") {
        auto v = get_at_path(doc, Path{"users", std::size_t{1}, "name"});
        REQUIRE(v.has_value());
        REQUIRE(v->as_string() == "Bob");
    }

    SECTION("missing key") {
        REQUIRE_FALSE(get_at_path(doc, Path{"groups"}).has_value());
    }

    SECTION("index out of range") {
        REQUIRE_FALSE(get_at_path(doc, Path{"users", std::size_t{5}}).has_value());
    }

    SECTION("type mismatch") {
        REQUIRE_FALSE(get_at_path(doc, Path{"users", "name"}).has_value());
    }

    SECTION("paths reported by compare resolve in both documents") {
        auto other = from_json(R"({"users": [{"name": "Alice"}, {"name": "Carol"}]})");
        auto diffs = compare(doc, other, Config{CompareMode::Strict});
        REQUIRE(diffs.size() == 1);
        REQUIRE(path_to_json_pointer(diffs[0].path()) == "/users/1/name");
        REQUIRE(get_at_path(doc, diffs[0].path())->as_string() == "Bob");
        REQUIRE(get_at_path(other, diffs[0].path())->as_string() == "Carol");
    }
}
