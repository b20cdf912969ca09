// test_string_path.cpp - Tests for registry path strings
// Module 2: Path helpers

#include <catch2/catch_all.hpp>
#include <docdiff/string_path.h>

#include <string>

using namespace docdiff;

TEST_CASE("join_path", "[path]") {
    SECTION("from the root") {
        REQUIRE(join_path("", "cells") == "/cells");
    }

    SECTION("nested") {
        REQUIRE(join_path("/metadata", "kernel") == "/metadata/kernel");
    }

    SECTION("escapes slash and tilde") {
        REQUIRE(join_path("/m", "a/b") == "/m/a~1b");
        REQUIRE(join_path("/m", "x~y") == "/m/x~0y");
        REQUIRE(join_path("", "~/") == "/~0~1");
    }

    SECTION("empty key") {
        REQUIRE(join_path("/m", "") == "/m/");
    }
}

TEST_CASE("element_path", "[path]") {
    REQUIRE(element_path("") == "/*");
    REQUIRE(element_path("/cells") == "/cells/*");
    REQUIRE(element_path("/cells/*/outputs") == "/cells/*/outputs/*");
}

TEST_CASE("normalize_path", "[path]") {
    REQUIRE(normalize_path("") == "");
    REQUIRE(normalize_path("/") == "");
    REQUIRE(normalize_path("cells") == "/cells");
    REQUIRE(normalize_path("/cells/*/") == "/cells/*");
    REQUIRE(normalize_path("/cells/*") == "/cells/*");
}
