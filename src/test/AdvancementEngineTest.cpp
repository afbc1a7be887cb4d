#include "AdvancementEngine.hpp"
#include "CoreRules.hpp"
#include "MockRng.hpp"
#include "RulesCatalog.hpp"
#include "RulesTestSupport.hpp"

#include <catch2/catch.hpp>

#include <algorithm>
#include <set>

using test::character_with;

namespace {

bool any_contains(const std::vector<std::string> &messages, std::string_view text) {
    return std::any_of(messages.begin(), messages.end(),
                       [&text](const std::string &message) { return message.find(text) != std::string::npos; });
}

bool offers(const LevelUpOptions &options, std::string_view talent_id) {
    return std::any_of(options.purchasable_talents.begin(), options.purchasable_talents.end(),
                       [&talent_id](const Talent *talent) { return talent->id == talent_id; });
}

TalentPurchase buy(std::string talent_id, int rank, std::string choice = "") {
    return TalentPurchase{std::move(talent_id), rank, "", std::move(choice)};
}

}

TEST_CASE("level-up budgets") {
    const AdvancementEngine engine(core_rules());

    SECTION("talent points follow the path's attribute") {
        CHECK(engine.talent_points(character_with({{Ability::Intellect, 14}})) == 7);
        CHECK(engine.talent_points(character_with({{Ability::Intellect, 8}})) == 4);
        CHECK(engine.talent_points(character_with({{Ability::Intellect, 14}}, "martial", "Martial")) == 5);
    }
    SECTION("advancement points never drop below 2") {
        CHECK(AdvancementEngine::advancement_points(character_with({{Ability::Intellect, 20}})) == 5);
        CHECK(AdvancementEngine::advancement_points(character_with({{Ability::Intellect, 8}})) == 2);
    }
    SECTION("primary path minimum is capped") {
        CHECK(AdvancementEngine::min_primary_path_points(7) == 4);
        CHECK(AdvancementEngine::min_primary_path_points(3) == 3);
    }
    SECTION("milestone levels") {
        CHECK(AdvancementEngine::grants_ability_increase(4));
        CHECK(AdvancementEngine::grants_ability_increase(16));
        CHECK(!AdvancementEngine::grants_ability_increase(5));
        CHECK(AdvancementEngine::grants_extra_attack(3));
        CHECK(AdvancementEngine::grants_extra_attack(9));
        CHECK(!AdvancementEngine::grants_extra_attack(4));
    }
}

TEST_CASE("level-up options") {
    const AdvancementEngine engine(core_rules());
    auto ch = character_with({{Ability::Intellect, 14}}, "mystic", "Mystic", 3);
    ch.skills.train(Skill::Arcana);
    ch.talents.push_back({"spellcraft", "Spellcraft", 1, "mystic", ""});
    const auto options = engine.options(ch);

    CHECK(options.current_level == 3);
    CHECK(options.target_level == 4);
    CHECK(options.talent_points == 7);
    CHECK(options.advancement_points == 2);
    CHECK(options.min_primary_path_points == 4);
    CHECK(options.grants_ability_increase);
    CHECK(!options.grants_extra_attack);
    CHECK(options.spellcrafting_gain == 6);
    CHECK(options.talent_ranks.at("spellcraft") == 1);
    CHECK(options.trained_skills == std::vector<Skill>{Skill::Arcana});

    SECTION("purchasable talents") {
        CHECK(offers(options, "spellcraft"));
        CHECK(offers(options, "ward"));
        CHECK(offers(options, "keen_mind"));
        CHECK(offers(options, "fighting_style"));
        CHECK(!offers(options, "arcane_focus"));
        CHECK(!offers(options, "athlete"));
        CHECK(!offers(options, "cleave"));
        CHECK(!offers(options, "archmage"));
    }
}

TEST_CASE("a rejected level-up") {
    const AdvancementEngine engine(core_rules());
    const auto ch = character_with({{Ability::Intellect, 14}}, "mystic", "Mystic", 3);
    const auto before = ch;

    LevelUpRequest request;
    request.talents = {buy("weapon_mastery", 1), buy("weapon_mastery", 2)};
    const auto result = engine.level_up(ch, request);

    CHECK(!result.ok());
    CHECK(!result.character);
    CHECK(result.validation.has_error(RulesErrorKind::BudgetExceeded));
    CHECK(any_contains(result.validation.errors, "Must spend at least 4 TP in primary path Mystic, spent 0"));
    CHECK(any_contains(result.validation.errors, "Level 4 requires an ability increase"));
    CHECK(ch == before);
}

TEST_CASE("a successful level-up") {
    const AdvancementEngine engine(core_rules());
    const auto ch = character_with({{Ability::Intellect, 14}}, "mystic", "Mystic", 3);

    LevelUpRequest request;
    request.talents = {buy("spellcraft", 1), buy("spellcraft", 2), buy("ward", 1)};
    request.ability_increase = {{"Intellect", 2}};
    const auto result = engine.level_up(ch, request);

    REQUIRE(result.ok());
    const auto &levelled = *result.character;
    CHECK(levelled.level == 4);
    CHECK(levelled.talent_rank("spellcraft") == 2);
    CHECK(levelled.talent_rank("ward") == 1);
    REQUIRE(levelled.find_talent("ward"));
    CHECK(levelled.find_talent("ward")->path_id == "mystic");
    CHECK(levelled.abilities.total(Ability::Intellect) == 16);
    CHECK(levelled.level_hit_points == 5);
    CHECK(levelled.health.max == 11);
    CHECK(levelled.health.current == 11);
    CHECK(levelled.spellcrafting.crafting_points_max == 6);
    CHECK(levelled.spellcrafting.casting_points_max == 6);
    CHECK(levelled.stored_advance == "TP 3, AP 2");

    SECTION("the experience shortfall is only a warning") {
        CHECK(any_contains(result.validation.warnings, "0 XP is short of the 3000 needed for level 4"));
    }
    SECTION("the input is untouched") {
        CHECK(ch.level == 3);
        CHECK(ch.talents.empty());
    }
}

TEST_CASE("talent ranks cost their rank in points") {
    const AdvancementEngine engine(core_rules());
    auto ch = character_with({{Ability::Intellect, 14}}, "mystic", "Mystic", 4);
    ch.total_experience = 7000;

    SECTION("three ranks cost six") {
        LevelUpRequest request;
        request.talents = {buy("spellcraft", 1), buy("spellcraft", 2), buy("spellcraft", 3)};
        const auto result = engine.level_up(ch, request);
        CHECK(result.ok());
        CHECK(result.validation.warnings.empty());
    }
    SECTION("with one more general rank") {
        LevelUpRequest request;
        request.talents = {buy("spellcraft", 1), buy("spellcraft", 2), buy("spellcraft", 3), buy("toughness", 1)};
        CHECK(engine.level_up(ch, request).ok());
    }
    SECTION("over budget") {
        LevelUpRequest request;
        request.talents = {buy("spellcraft", 1), buy("spellcraft", 2), buy("spellcraft", 3), buy("toughness", 1),
                           buy("toughness", 2)};
        const auto result = engine.level_up(ch, request);
        CHECK(!result.ok());
        CHECK(any_contains(result.validation.errors, "Spent 9 TP but only 7 available"));
    }
    SECTION("carried talent points add to the budget") {
        ch.stored_advance = "TP 2";
        LevelUpRequest request;
        request.talents = {buy("spellcraft", 1), buy("spellcraft", 2), buy("spellcraft", 3), buy("toughness", 1),
                           buy("toughness", 2)};
        const auto result = engine.level_up(ch, request);
        REQUIRE(result.ok());
        CHECK(result.character->stored_advance == "TP 0, AP 2");
    }
    SECTION("ranks can't be skipped") {
        LevelUpRequest request;
        request.talents = {buy("spellcraft", 2), buy("ward", 1), buy("ward", 2)};
        const auto result = engine.level_up(ch, request);
        CHECK(result.validation.has_error(RulesErrorKind::PrerequisitesNotMet));
    }
}

TEST_CASE("advancement points") {
    const AdvancementEngine engine(core_rules());
    auto ch = character_with({{Ability::Intellect, 14}});
    ch.skills.train(Skill::Arcana);
    DerivedStats::recalculate_all(ch, RulesConstants{});
    REQUIRE(ch.skills[Skill::Arcana].total == 3);

    SECTION("training a trained skill is refused") {
        LevelUpRequest request;
        request.advancements = {{AdvancementType::train_skill, "Arcana"}};
        const auto result = engine.level_up(ch, request);
        CHECK(!result.ok());
        CHECK(result.validation.has_error(RulesErrorKind::AlreadyPossessed));
    }
    SECTION("raising a trained skill's rank") {
        LevelUpRequest request;
        request.advancements = {{AdvancementType::skill_rank, "Arcana"}};
        const auto result = engine.level_up(ch, request);
        REQUIRE(result.ok());
        CHECK(result.character->skills[Skill::Arcana].rank == 2);
        CHECK(result.character->skills[Skill::Arcana].total == 4);
    }
    SECTION("a new language") {
        auto scholar = character_with({{Ability::Intellect, 20}});
        LevelUpRequest request;
        request.advancements = {{AdvancementType::language, "Draconic"}};
        const auto result = engine.level_up(scholar, request);
        CHECK(!result.ok());
        CHECK(result.validation.has_error(RulesErrorKind::BudgetExceeded));
    }
}

TEST_CASE("unspent points carry over") {
    const AdvancementEngine engine(core_rules());
    auto scholar = character_with({{Ability::Intellect, 20}});
    scholar.languages = {"Common", "Elvish"};
    scholar.proficiencies = {"Simple weapons"};
    REQUIRE(engine.talent_points(scholar) == 10);
    REQUIRE(AdvancementEngine::advancement_points(scholar) == 5);

    SECTION("a level with nothing bought stores everything") {
        const auto result = engine.level_up(scholar, {});
        REQUIRE(result.ok());
        CHECK(result.character->stored_advance == "TP 10, AP 5");
        CHECK(engine.options(*result.character).carried == CarriedPoints{10, 5});
    }
    SECTION("two levels of points buy a language") {
        const auto second = engine.level_up(scholar, {});
        REQUIRE(second.ok());
        LevelUpRequest request;
        request.advancements = {{AdvancementType::language, "draconic"}};
        const auto third = engine.level_up(*second.character, request);
        REQUIRE(third.ok());
        CHECK(third.character->languages == std::set<std::string>{"Common", "Draconic", "Elvish"});
        CHECK(third.character->stored_advance == "TP 20, AP 0");
    }
    SECTION("a proficiency and a non-standard language") {
        scholar.stored_advance = "AP 15";
        LevelUpRequest request;
        request.advancements = {{AdvancementType::proficiency, "Smith's tools"},
                                {AdvancementType::language, "Thieves' Cant"}};
        const auto result = engine.level_up(scholar, request);
        REQUIRE(result.ok());
        CHECK(any_contains(result.validation.warnings, "Thieves' Cant is not a standard language"));
        const auto &levelled = *result.character;
        CHECK(levelled.proficiencies.size() == 2);
        CHECK(levelled.has_proficiency("smith's tools"));
        CHECK(levelled.languages.size() == 3);
        CHECK(levelled.has_language("Thieves' Cant"));
        CHECK(levelled.stored_advance == "TP 10, AP 0");
    }
    SECTION("a known language in another case is refused") {
        scholar.stored_advance = "AP 5";
        LevelUpRequest request;
        request.advancements = {{AdvancementType::language, "elvish"}};
        const auto result = engine.level_up(scholar, request);
        CHECK(!result.ok());
        CHECK(result.validation.has_error(RulesErrorKind::AlreadyPossessed));
    }
}

TEST_CASE("stored advancement text") {
    CHECK(parse_stored_advance("TP 2, AP 3") == CarriedPoints{2, 3});
    CHECK(parse_stored_advance(" ap 4 ") == CarriedPoints{0, 4});
    CHECK(parse_stored_advance("3") == CarriedPoints{0, 3});
    CHECK(parse_stored_advance("") == CarriedPoints{});
    CHECK(parse_stored_advance("lots") == CarriedPoints{});
    CHECK(parse_stored_advance("TP -1") == CarriedPoints{});
    CHECK(format_stored_advance({}).empty());
    CHECK(format_stored_advance({1, 0}) == "TP 1, AP 0");
}

TEST_CASE("hit points on levelling") {
    const AdvancementEngine engine(core_rules());

    SECTION("a rolled hit die adds the Endurance modifier") {
        const auto ch = character_with({{Ability::Endurance, 14}});
        LevelUpRequest request;
        request.hp_roll = 8;
        const auto result = engine.level_up(ch, request);
        REQUIRE(result.ok());
        CHECK(result.character->level_hit_points == 10);
        CHECK(result.character->health.max == 18);
    }
    SECTION("at least one hit point is gained") {
        const auto ch = character_with({{Ability::Endurance, 3}});
        LevelUpRequest request;
        request.hp_roll = 1;
        const auto result = engine.level_up(ch, request);
        REQUIRE(result.ok());
        CHECK(result.character->level_hit_points == 1);
    }
    SECTION("a roll below one is refused") {
        LevelUpRequest request;
        request.hp_roll = 0;
        CHECK(engine.level_up(character_with({}), request).validation.has_error(RulesErrorKind::InvalidInput));
    }
    SECTION("rolling the hit die") {
        test::MockRng rng;
        REQUIRE_CALL(rng, dice(1, 8)).RETURN(6);
        CHECK(AdvancementEngine::roll_level_hit_points(rng) == 6);
    }
}

TEST_CASE("level milestones") {
    const AdvancementEngine engine(core_rules());

    SECTION("first extra attack") {
        const auto result = engine.level_up(character_with({}, "martial", "Martial", 2), {});
        REQUIRE(result.ok());
        CHECK(result.character->has_feature("Extra Attack (1)"));
        CHECK(result.character->spellcrafting.crafting_points_max == 0);
    }
    SECTION("second extra attack") {
        const auto result = engine.level_up(character_with({}, "martial", "Martial", 8), {});
        REQUIRE(result.ok());
        CHECK(result.character->has_feature("Extra Attack (2)"));
    }
    SECTION("only one level at a time") {
        LevelUpRequest request;
        request.target_level = 5;
        const auto result = engine.level_up(character_with({}, "martial", "Martial", 3), request);
        CHECK(result.validation.has_error(RulesErrorKind::InvalidInput));
    }
    SECTION("an ability increase away from a milestone") {
        LevelUpRequest request;
        request.ability_increase = {{"Might", 2}};
        CHECK(!engine.level_up(character_with({}, "martial", "Martial", 1), request).ok());
    }
}
