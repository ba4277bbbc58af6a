// test_path.cpp - Tests for wire paths
// Path operations, canonical rendering and parsing

#include <catch2/catch_all.hpp>
#include <ydelta/errors.h>
#include <ydelta/path.h>

#include <string>

using namespace ydelta;

// ============================================================
// Path operations
// ============================================================

TEST_CASE("Path construction", "[path]") {
    SECTION("default is empty") {
        Path p;
        REQUIRE(p.empty());
        REQUIRE(p.size() == 0);
    }

    SECTION("from initializer list") {
        Path p{"interfaces", PathElem{"interface", {{"name", "eth0"}}}, "config"};
        REQUIRE(p.size() == 3);
        REQUIRE(p[1].name == "interface");
        REQUIRE(p[1].keys.at("name") == "eth0");
        REQUIRE(p.back().name == "config");
    }

    SECTION("from schema path") {
        Path p = Path::from_schema_path({"config", "mtu"});
        REQUIRE(p == Path{"config", "mtu"});
        REQUIRE(p[0].keys.empty());
    }
}

TEST_CASE("Path join, parent and prefixes", "[path]") {
    Path base{"a", "b"};
    Path full = base.join(Path{"c", "d"});

    SECTION("join appends all elements") {
        REQUIRE(full == Path{"a", "b", "c", "d"});
    }

    SECTION("parent drops the last element") {
        REQUIRE(full.parent() == Path{"a", "b", "c"});
        REQUIRE(Path{"a"}.parent().empty());
    }

    SECTION("parent of the root path throws") {
        REQUIRE_THROWS_AS(Path{}.parent(), DiffError);
        Path p;
        REQUIRE_THROWS_AS(p.pop_back(), DiffError);
    }

    SECTION("has_prefix compares names and keys") {
        REQUIRE(full.has_prefix(base));
        REQUIRE(full.has_prefix(Path{}));
        REQUIRE_FALSE(base.has_prefix(full));
        REQUIRE_FALSE(full.has_prefix(Path{PathElem{"a", {{"k", "v"}}}}));
    }

    SECTION("strip_prefix") {
        REQUIRE(full.strip_prefix(base) == Path{"c", "d"});
        REQUIRE(full.strip_prefix(full).empty());
    }

    SECTION("strip_prefix with a foreign prefix throws InvalidPath") {
        try {
            (void)full.strip_prefix(Path{"x"});
            FAIL("expected DiffError");
        } catch (const DiffError& e) {
            REQUIRE(e.code() == DiffErrorCode::InvalidPath);
        }
    }
}

// ============================================================
// Canonical strings
// ============================================================

TEST_CASE("path_to_string", "[path][string]") {
    SECTION("root") {
        REQUIRE(path_to_string(Path{}) == "/");
    }

    SECTION("plain elements") {
        REQUIRE(path_to_string(Path{"config", "mtu"}) == "/config/mtu");
    }

    SECTION("keys are sorted by name") {
        Path p{PathElem{"list", {{"key2", "42"}, {"key1", "foo"}}}, "value"};
        REQUIRE(path_to_string(p) == "/list[key1=foo][key2=42]/value");
        REQUIRE(p.to_string() == path_to_string(p));
    }

    SECTION("escaping") {
        REQUIRE(path_elem_to_string(PathElem{"a/b"}) == "a\\/b");
        REQUIRE(path_elem_to_string(PathElem{"x", {{"k=1", "v]2"}}}) == "x[k\\=1=v\\]2]");
        REQUIRE(path_elem_to_string(PathElem{"x", {{"k", "a/b=c"}}}) == "x[k=a/b=c]");
    }

    SECTION("key predicate only") {
        REQUIRE(key_predicate_string({{"name", "eth0"}}) == "[name=eth0]");
        REQUIRE(key_predicate_string({}).empty());
    }
}

TEST_CASE("string_to_path", "[path][string]") {
    SECTION("plain path") {
        Path p = string_to_path("/interfaces/interface[name=eth0]/config/mtu");
        REQUIRE(p.size() == 4);
        REQUIRE(p[1].keys.at("name") == "eth0");
        REQUIRE(p[3].name == "mtu");
    }

    SECTION("leading slash is optional") {
        REQUIRE(string_to_path("a/b") == string_to_path("/a/b"));
    }

    SECTION("root") {
        REQUIRE(string_to_path("/").empty());
        REQUIRE(string_to_path("").empty());
    }

    SECTION("multiple keys") {
        Path p = string_to_path("/l[key1=foo][key2=42]");
        REQUIRE(p[0].keys.size() == 2);
        REQUIRE(p[0].keys.at("key2") == "42");
    }

    SECTION("canonical strings round-trip with escapes") {
        const std::vector<Path> paths = {
            Path{"a/b", "c[d]"},
            Path{PathElem{"x", {{"k=1", "v]2"}, {"back\\slash", "a\\b"}}}},
            Path{PathElem{"x", {{"k", "a/b=c[d"}}}, "y"},
            Path{PathElem{"e", {{"k", ""}}}},
        };
        for (const auto& p : paths) {
            CAPTURE(path_to_string(p));
            REQUIRE(string_to_path(path_to_string(p)) == p);
        }
    }

    SECTION("malformed input throws InvalidPath") {
        for (const char* bad : {"/a[k=v", "/a[kv]", "/a//b", "/a/", "/a\\", "/[k=v]", "/a[=v]", "/a[k=1][k=2]"}) {
            CAPTURE(bad);
            try {
                (void)string_to_path(bad);
                FAIL("expected DiffError");
            } catch (const DiffError& e) {
                REQUIRE(e.code() == DiffErrorCode::InvalidPath);
            }
        }
    }
}
