#include "Experience.hpp"

#include <catch2/catch.hpp>

TEST_CASE("experience table") {
    SECTION("experience needed per level") {
        CHECK(Experience::xp_for_level(1) == 0);
        CHECK(Experience::xp_for_level(2) == 300);
        CHECK(Experience::xp_for_level(5) == 7000);
        CHECK(Experience::xp_for_level(20) == 400000);
    }
    SECTION("levels beyond the table cost a flat amount") {
        CHECK(Experience::xp_for_level(21) == 443000);
        CHECK(Experience::xp_for_level(22) == 486000);
    }
    SECTION("level supported by an experience total") {
        CHECK(Experience::level_for_xp(0) == 1);
        CHECK(Experience::level_for_xp(299) == 1);
        CHECK(Experience::level_for_xp(300) == 2);
        CHECK(Experience::level_for_xp(399999) == 19);
        CHECK(Experience::level_for_xp(400000) == 20);
        CHECK(Experience::level_for_xp(443000) == 21);
    }
    SECTION("experience to the next level") {
        CHECK(Experience::xp_to_next_level(0) == 300);
        CHECK(Experience::xp_to_next_level(1200) == 1800);
    }
    SECTION("summary") { CHECK(Experience::level_summary(1200) == "Level 3 (1200 XP, 1800 to level 4)"); }
}
