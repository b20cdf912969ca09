// test_value.cpp - Tests for Value construction, access and JSON helpers
// Module 1: Document values

#include <catch2/catch_all.hpp>
#include <docdiff/builders.h>
#include <docdiff/serialization.h>
#include <docdiff/value.h>

#include <string>

using namespace docdiff;

// ============================================================
// Construction and Kinds
// ============================================================

TEST_CASE("Value default construction", "[value][construction]") {
    Value v;
    REQUIRE(v.is_null());
    REQUIRE(v.kind() == ValueKind::Null);
}

TEST_CASE("Value kinds", "[value][kind]") {
    SECTION("scalars") {
        REQUIRE(Value{42}.kind() == ValueKind::Integer);
        REQUIRE(Value{int64_t{9999999999LL}}.kind() == ValueKind::Integer);
        REQUIRE(Value{3.5}.kind() == ValueKind::Real);
        REQUIRE(Value{true}.kind() == ValueKind::Boolean);
    }

    SECTION("text") {
        Value v{"hello"};
        REQUIRE(v.kind() == ValueKind::Text);
        REQUIRE(v.size() == 5);
    }

    SECTION("containers") {
        REQUIRE(Value::map({{"a", 1}}).kind() == ValueKind::Mapping);
        REQUIRE(Value::vector({1, 2}).kind() == ValueKind::Sequence);
    }

    SECTION("kind names") {
        REQUIRE(kind_name(ValueKind::Mapping) == "mapping");
        REQUIRE(kind_name(ValueKind::Sequence) == "sequence");
        REQUIRE(kind_name(ValueKind::Text) == "text");
    }
}

// ============================================================
// Access
// ============================================================

TEST_CASE("Value access", "[value][access]") {
    auto doc = Value::map({
        {"name", "Alice"},
        {"tags", Value::vector({"a", "b"})},
    });

    SECTION("at by key and index") {
        REQUIRE(doc.at("name").as_string() == "Alice");
        REQUIRE(doc.at("tags").at(1).as_string() == "b");
    }

    SECTION("missing key gives null") {
        REQUIRE(doc.at("missing").is_null());
        REQUIRE(doc.at("tags").at(5).is_null());
    }

    SECTION("contains") {
        REQUIRE(doc.contains("name"));
        REQUIRE_FALSE(doc.contains("age"));
        REQUIRE(doc.at("tags").contains(std::size_t{1}));
    }

    SECTION("set returns a new value") {
        auto changed = doc.set("name", Value{"Bob"});
        REQUIRE(changed.at("name").as_string() == "Bob");
        REQUIRE(doc.at("name").as_string() == "Alice");
    }
}

TEST_CASE("Value equality is structural", "[value][equality]") {
    auto a = Value::map({{"x", Value::vector({1, 2, 3})}, {"y", "text"}});
    auto b = Value::map({{"y", "text"}, {"x", Value::vector({1, 2, 3})}});
    auto c = Value::map({{"x", Value::vector({1, 2, 4})}, {"y", "text"}});

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_FALSE(Value{1} == Value{int64_t{1}});
}

// ============================================================
// Builders
// ============================================================

TEST_CASE("MapBuilder and VectorBuilder", "[value][builder]") {
    auto cell = MapBuilder()
        .set("cell_type", "code")
        .set("execution_count", 3)
        .finish();

    auto cells = VectorBuilder()
        .push_back(cell)
        .push_back(Value{"raw"})
        .finish();

    REQUIRE(cell.at("cell_type").as_string() == "code");
    REQUIRE(cell.at("execution_count").as_int() == 3);
    REQUIRE(cells.size() == 2);
    REQUIRE(cells.at(0) == cell);
}

// ============================================================
// JSON
// ============================================================

TEST_CASE("JSON parse", "[value][json]") {
    SECTION("nested document") {
        auto v = from_json(R"({"a": [1, 2.5, "x", true, null], "b": {"c": -7}})");
        REQUIRE(v.at("a").size() == 5);
        REQUIRE(v.at("a").at(0).as_int() == 1);
        REQUIRE(v.at("a").at(1) == Value{2.5});
        REQUIRE(v.at("a").at(3) == Value{true});
        REQUIRE(v.at("a").at(4).is_null());
        REQUIRE(v.at("b").at("c").as_int() == -7);
    }

    SECTION("large integers become int64") {
        auto v = from_json("12345678901");
        REQUIRE(v.is<int64_t>());
    }

    SECTION("escapes") {
        auto v = from_json(R"("a\"b\n\u0041")");
        REQUIRE(v.as_string() == "a\"b\nA");
    }

    SECTION("errors are reported") {
        std::string error;
        auto v = from_json("[1, 2", &error);
        REQUIRE(v.is_null());
        REQUIRE_FALSE(error.empty());

        error.clear();
        from_json("{} x", &error);
        REQUIRE_FALSE(error.empty());
    }
}

TEST_CASE("JSON output is sorted and stable", "[value][json]") {
    auto a = Value::map({{"b", 1}, {"a", 2}, {"c", Value::vector({})}});
    REQUIRE(to_json(a, true) == R"({"a":2,"b":1,"c":[]})");

    auto round = from_json(to_json(a));
    REQUIRE(round == a);
}
