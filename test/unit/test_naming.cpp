#include "tanto/core/naming.hpp"

#include <catch2/catch_test_macros.hpp>
#include <string>

using namespace tanto;

TEST_CASE("snake_case conversion", "[naming]") {
    SECTION("camel case words") {
        REQUIRE(to_snake_case("fruitAmount") == "fruit_amount");
        REQUIRE(to_snake_case("createdAtUtc") == "created_at_utc");
    }

    SECTION("leading capital") {
        REQUIRE(to_snake_case("Person") == "person");
        REQUIRE(to_snake_case("FruitAmount") == "fruit_amount");
    }

    SECTION("acronyms") {
        REQUIRE(to_snake_case("HTTPServer") == "http_server");
        REQUIRE(to_snake_case("userID") == "user_id");
    }

    SECTION("digits") {
        REQUIRE(to_snake_case("version2Name") == "version2_name");
    }

    SECTION("already lower case") {
        REQUIRE(to_snake_case("fruit") == "fruit");
        REQUIRE(to_snake_case("fruit_amount") == "fruit_amount");
        REQUIRE(to_snake_case("").empty());
    }
}

TEST_CASE("kebab-case conversion", "[naming]") {
    REQUIRE(to_kebab_case("fruitAmount") == "fruit-amount");
    REQUIRE(to_kebab_case("Organization") == "organization");
    REQUIRE(to_kebab_case("XMLHttpRequest") == "xml-http-request");
}

TEST_CASE("naming style parsing", "[naming]") {
    SECTION("accepted spellings") {
        REQUIRE(parse_naming_style("identity") == naming_style::identity);
        REQUIRE(parse_naming_style("snake_case") == naming_style::snake_case);
        REQUIRE(parse_naming_style("snake-case") == naming_style::snake_case);
        REQUIRE(parse_naming_style("kebab-case") == naming_style::kebab_case);
        REQUIRE(parse_naming_style("kebab_case") == naming_style::kebab_case);
    }

    SECTION("rejected spellings") {
        REQUIRE_FALSE(parse_naming_style("camelCase").has_value());
        REQUIRE_FALSE(parse_naming_style("").has_value());
        REQUIRE_FALSE(parse_naming_style("custom").has_value());
    }

    SECTION("round trip through to_string") {
        for (auto style : {naming_style::identity, naming_style::snake_case, naming_style::kebab_case}) {
            REQUIRE(parse_naming_style(to_string(style)) == style);
        }
    }
}
