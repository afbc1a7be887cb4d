#include "CoreRules.hpp"
#include "Talent.hpp"

#include <catch2/catch.hpp>

namespace {

AbilityScores scores_with(std::map<Ability, int> totals) {
    AbilityScores scores;
    for (const auto &[ability, total] : totals)
        scores[ability].roll = total;
    for (auto &score : scores)
        score.recalculate();
    return scores;
}

}

TEST_CASE("talent point costs") {
    SECTION("rank N costs N") {
        CHECK(Talent::tp_cost(0, 1) == 1);
        CHECK(Talent::tp_cost(1, 2) == 2);
        CHECK(Talent::tp_cost(2, 3) == 3);
    }
    SECTION("buying several ranks is triangular") {
        CHECK(Talent::tp_cost(0, 3) == 6);
        CHECK(Talent::tp_cost(0, 5) == 15);
        CHECK(Talent::tp_cost(2, 4) == 7);
    }
    SECTION("no ranks costs nothing") { CHECK(Talent::tp_cost(3, 3) == 0); }
}

TEST_CASE("talent prerequisites") {
    const auto &rules = core_rules();
    const std::map<std::string, int> nothing_owned;

    SECTION("all of the listed abilities") {
        const auto &keen_mind = *rules.talent("keen_mind");
        CHECK(keen_mind.prerequisites.check(scores_with({{Ability::Intellect, 13}}), 1, nothing_owned, 1).empty());
        const auto failures =
            keen_mind.prerequisites.check(scores_with({{Ability::Intellect, 12}}), 1, nothing_owned, 1);
        REQUIRE(failures.size() == 1);
        CHECK(failures.front() == "Need Intellect 13+, have 12");
    }
    SECTION("any of the listed abilities") {
        const auto &athlete = *rules.talent("athlete");
        CHECK(athlete.prerequisites.check(scores_with({{Ability::Agility, 13}}), 1, nothing_owned, 1).empty());
        CHECK(athlete.prerequisites.check(scores_with({{Ability::Might, 14}}), 1, nothing_owned, 1).empty());
        const auto failures = athlete.prerequisites.check(scores_with({}), 1, nothing_owned, 1);
        REQUIRE(failures.size() == 1);
        CHECK(failures.front() == "Need 13+ in one of: Might, Agility");
    }
    SECTION("level by rank") {
        const auto &ward = *rules.talent("ward");
        CHECK(ward.prerequisites.check(scores_with({}), 1, nothing_owned, 1).empty());
        CHECK(ward.prerequisites.check(scores_with({}), 4, nothing_owned, 2).empty());
        const auto failures = ward.prerequisites.check(scores_with({}), 3, nothing_owned, 2);
        REQUIRE(failures.size() == 1);
        CHECK(failures.front() == "Rank 2 requires level 4");
    }
    SECTION("required talents") {
        const auto &stalwart = *rules.talent("stalwart");
        const auto failures = stalwart.prerequisites.check(scores_with({}), 1, nothing_owned, 1);
        REQUIRE(failures.size() == 1);
        CHECK(failures.front() == "Requires talent: iron_skin");
        CHECK(stalwart.prerequisites.check(scores_with({}), 1, {{"iron_skin", 1}}, 1).empty());
    }
}

TEST_CASE("talent descriptions") {
    const auto &ward = *core_rules().talent("ward");
    CHECK(ward.rank_description(2) == "A ward absorbs 10 damage.");
    CHECK(ward.rank_description(4).empty());
    CHECK(ward.cumulative_description(2) == "Rank 1: A ward absorbs 5 damage.\nRank 2: A ward absorbs 10 damage.");
    CHECK(ward.has_dense_ranks());

    SECTION("gaps in rank text are detected") {
        auto broken = ward;
        broken.ranks.erase(2);
        CHECK(!broken.has_dense_ranks());
    }
}
