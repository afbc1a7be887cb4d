#include "string_utils.hpp"

#include <catch2/catch.hpp>

#include <string_view>
using namespace std::literals;

TEST_CASE("string_utils tests") {
    SECTION("trim") {
        CHECK(trim("  Common \t") == "Common"sv);
        CHECK(trim("Common") == "Common"sv);
        CHECK(trim("   ").empty());
        CHECK(trim("").empty());
    }
    SECTION("lower case") {
        CHECK(lower_case("Sleight of Hand") == "sleight of hand");
        CHECK(lower_case("").empty());
    }
    SECTION("normalized keys") {
        CHECK(normalize_key("Sleight of Hand") == "sleightofhand");
        CHECK(normalize_key("sleight_of_hand") == "sleightofhand");
        CHECK(normalize_key("Iron-Skin") == "ironskin");
        CHECK(normalize_key("  ").empty());
    }
    SECTION("has_prefix") {
        CHECK(has_prefix("Common", "Com"));
        CHECK(has_prefix("Common", "Common"));
        CHECK(!has_prefix("Com", "Common"));
        CHECK(!has_prefix("Common", "com"));
    }
    SECTION("matches") {
        CHECK(matches("Elvish", "elvish"));
        CHECK(matches("", ""));
        CHECK(!matches("Elvish", "Elvis"));
    }
    SECTION("matches_start") {
        CHECK(matches_start("mys", "Mystic"));
        CHECK(matches_start("MYSTIC", "mystic"));
        CHECK(!matches_start("myst", "martial"));
    }
}
