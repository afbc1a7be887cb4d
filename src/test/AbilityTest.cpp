#include "Ability.hpp"

#include <catch2/catch.hpp>

TEST_CASE("ability modifiers") {
    SECTION("ten and eleven are average") {
        CHECK(ability_modifier(10) == 0);
        CHECK(ability_modifier(11) == 0);
    }
    SECTION("round down above average") {
        CHECK(ability_modifier(12) == 1);
        CHECK(ability_modifier(15) == 2);
        CHECK(ability_modifier(20) == 5);
    }
    SECTION("round towards negative infinity below average") {
        CHECK(ability_modifier(9) == -1);
        CHECK(ability_modifier(8) == -1);
        CHECK(ability_modifier(7) == -2);
        CHECK(ability_modifier(1) == -5);
    }
}

TEST_CASE("parsing abilities") {
    CHECK(try_parse_ability("Might") == Ability::Might);
    CHECK(try_parse_ability("intellect") == Ability::Intellect);
    CHECK(try_parse_ability("CHA") == Ability::Charisma);
    CHECK(try_parse_ability("end") == Ability::Endurance);
    CHECK(!try_parse_ability("luck"));
    CHECK(!try_parse_ability(""));
}

TEST_CASE("ability score lines") {
    AbilityScore score;
    score.roll = 15;
    score.race = 1;
    score.misc = 2;
    score.recalculate();
    CHECK(score.total == 18);
    CHECK(score.modifier == 4);
    CHECK(score.saving_throw == 4);

    SECTION("recalculating again changes nothing") {
        const auto before = score;
        score.recalculate();
        CHECK(score == before);
    }
}
