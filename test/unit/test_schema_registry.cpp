#include "tanto/core/schema_registry.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace tanto;

TEST_CASE("schema_registry bindings", "[schema_registry]") {
    schema_registry registry;
    const auto money = schema::primitive(primitive_kind::string).with_format("decimal");

    SECTION("starts empty") {
        REQUIRE(registry.empty());
        REQUIRE(registry.size() == 0);
        REQUIRE(registry.find("Money") == nullptr);
        REQUIRE_FALSE(registry.contains("Money"));
    }

    SECTION("bind and find") {
        registry.bind("Money", money);
        REQUIRE(registry.contains("Money"));
        REQUIRE(registry.size() == 1);

        const auto* found = registry.find("Money");
        REQUIRE(found != nullptr);
        REQUIRE(*found == money);
    }

    SECTION("last binding wins") {
        registry.bind("Money", money);
        registry.bind("Money", schema::primitive(primitive_kind::number));
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.find("Money")->primitive_type() == primitive_kind::number);
    }

    SECTION("erase") {
        registry.bind("Money", money);
        REQUIRE(registry.erase("Money"));
        REQUIRE_FALSE(registry.erase("Money"));
        REQUIRE(registry.empty());
    }
}
