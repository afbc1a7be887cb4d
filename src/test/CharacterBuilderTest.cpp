#include "CharacterBuilder.hpp"
#include "CoreRules.hpp"
#include "RulesCatalog.hpp"
#include "RulesTestSupport.hpp"

#include <catch2/catch.hpp>

using test::elf_mystic_scores;
using test::thrown_kind;

namespace {

// Takes every first option until nothing is pending.
void resolve_all_with_first_options(CharacterBuilder &builder) {
    while (!builder.pending_choices().empty()) {
        const auto choice = builder.pending_choices().front();
        std::vector<std::string> selections(choice.options.begin(), choice.options.begin() + choice.count);
        builder.resolve_choice(choice.type, selections, choice.source);
    }
}

CharacterBuilder elf_scholar_at_path_step() {
    CharacterBuilder builder(core_rules());
    builder.set_name("Aelar");
    builder.set_ability_scores(elf_mystic_scores());
    builder.set_race("elf");
    builder.set_ancestry("sylari");
    builder.set_profession("scholar");
    builder.resolve_choice(ChoiceType::skill, {"Arcana", "History"});
    return builder;
}

}

TEST_CASE("creating an elf mystic") {
    auto builder = elf_scholar_at_path_step();
    builder.set_path("mystic");
    builder.set_background("scholar");
    CHECK(builder.current_step() == BuilderStep::complete);
    CHECK(!builder.is_complete());

    resolve_all_with_first_options(builder);
    REQUIRE(builder.is_complete());
    const auto ch = builder.build();

    SECTION("selections") {
        CHECK(ch.name == "Aelar");
        CHECK(ch.race == "Elf");
        CHECK(ch.ancestry == "Sylari");
        CHECK(ch.profession == "Scholar");
        CHECK(ch.primary_path == "Mystic");
        CHECK(ch.background == "Scholar");
    }
    SECTION("abilities") {
        CHECK(ch.abilities.total(Ability::Intellect) == 17);
        CHECK(ch.abilities.total(Ability::Endurance) == 12);
        CHECK(ch.abilities.total(Ability::Wisdom) == 13);
    }
    SECTION("skills") {
        CHECK(ch.skills.is_trained(Skill::Perception));
        CHECK(ch.skills.is_trained(Skill::Arcana));
        CHECK(ch.skills[Skill::History].rank == 1);
        CHECK(ch.skills[Skill::Arcana].total == 4);
        CHECK(ch.skills[Skill::Nature].total == 4);
    }
    SECTION("languages") {
        CHECK(ch.has_language("Common"));
        CHECK(ch.has_language("Elvish"));
        CHECK(ch.has_language("Sylvan"));
        CHECK(ch.has_language("Dwarvish"));
    }
    SECTION("personality") {
        CHECK(ch.personality.trait == "I quote obscure texts at every opportunity.");
        CHECK(ch.alignment.modifier == 1);
        CHECK(ch.reputation.modifier == 2);
    }
    SECTION("derived stats") {
        CHECK(ch.health.max == 7);
        CHECK(ch.health.current == 7);
        CHECK(ch.defense.total == 11);
        CHECK(ch.passive_perception.total == 12);
    }
    SECTION("passes validation") {
        const auto result = CharacterValidator(core_rules()).validate_character(ch);
        CHECK(result.valid);
        CHECK(result.errors.empty());
    }
}

TEST_CASE("path prerequisites") {
    auto builder = elf_scholar_at_path_step();

    SECTION("an unqualified path is refused") {
        const auto before = builder.character();
        CHECK(thrown_kind([&] { builder.set_path("defense"); }) == RulesErrorKind::PrerequisitesNotMet);
        CHECK_THROWS_WITH(builder.set_path("defense"), Catch::Matchers::Contains("Endurance 15+"));
        CHECK(builder.character() == before);
        CHECK(builder.current_step() == BuilderStep::path);
    }
    SECTION("prerequisites may be ignored") {
        builder.set_path("defense", true);
        CHECK(builder.character().primary_path == "Defense");
    }
    SECTION("available paths report qualification") {
        const auto paths = builder.available_paths();
        REQUIRE(paths.size() == 3);
        for (const auto &availability : paths)
            CHECK(availability.prerequisites_met == (availability.path->id == "mystic"));
    }
    SECTION("unknown path") {
        CHECK(thrown_kind([&] { builder.set_path("necromancy"); }) == RulesErrorKind::NotFound);
    }
}

TEST_CASE("step ordering") {
    CharacterBuilder builder(core_rules());

    SECTION("later steps wait for earlier ones") {
        CHECK(thrown_kind([&] { builder.set_race("elf"); }) == RulesErrorKind::StepOutOfOrder);
        builder.set_ability_scores(elf_mystic_scores());
        CHECK(thrown_kind([&] { builder.set_profession("scholar"); }) == RulesErrorKind::StepOutOfOrder);
    }
    SECTION("revisiting a step rewinds to it") {
        auto complete = elf_scholar_at_path_step();
        complete.set_path("mystic");
        complete.set_background("scholar");
        resolve_all_with_first_options(complete);
        REQUIRE(complete.is_complete());

        complete.set_race("elf");
        CHECK(complete.current_step() == BuilderStep::ancestry);
        CHECK(!complete.is_complete());
    }
    SECTION("the summary shows the current step") {
        CHECK_THAT(builder.summary(), Catch::Matchers::Contains("Current Step: ability_scores"));
    }
}

TEST_CASE("ability scores") {
    CharacterBuilder builder(core_rules());

    SECTION("unknown abilities are refused") {
        CHECK(thrown_kind([&] { builder.set_ability_scores({{"Luck", 10}}); }) == RulesErrorKind::InvalidInput);
        CHECK(builder.current_step() == BuilderStep::ability_scores);
    }
    SECTION("out of range scores are refused") {
        CHECK(thrown_kind([&] { builder.set_ability_scores({{"Might", 25}}); }) == RulesErrorKind::InvalidInput);
        CHECK(thrown_kind([&] { builder.set_ability_scores({{"Might", 0}}); }) == RulesErrorKind::InvalidInput);
    }
    SECTION("every ability needs a score") {
        CHECK(thrown_kind([&] { builder.set_ability_scores({{"mgt", 16}}); }) == RulesErrorKind::InvalidInput);
        CHECK(builder.current_step() == BuilderStep::ability_scores);
        CHECK(builder.character().abilities.total(Ability::Might) == 10);
    }
    SECTION("an ability named twice is refused") {
        auto scores = elf_mystic_scores();
        scores["mgt"] = 16;
        CHECK(thrown_kind([&] { builder.set_ability_scores(scores); }) == RulesErrorKind::InvalidInput);
    }
    SECTION("short names are accepted") {
        builder.set_ability_scores({{"mgt", 16}, {"agi", 14}, {"end", 13}, {"int", 15}, {"wis", 12}, {"cha", 8}});
        CHECK(builder.character().abilities.total(Ability::Might) == 16);
        CHECK(builder.character().abilities.total(Ability::Charisma) == 8);
    }
}

TEST_CASE("race and ancestry") {
    CharacterBuilder builder(core_rules());
    builder.set_ability_scores(elf_mystic_scores());

    SECTION("unknown race") {
        CHECK(thrown_kind([&] { builder.set_race("orc"); }) == RulesErrorKind::NotFound);
    }
    SECTION("an ancestry of another race is refused") {
        builder.set_race("elf");
        CHECK(thrown_kind([&] { builder.set_ancestry("ironhold"); }) == RulesErrorKind::RaceMismatch);
        CHECK(builder.available_ancestries().size() == 2);
    }
    SECTION("dwarves") {
        builder.set_race("dwarf");
        const auto &ch = builder.character();
        CHECK(ch.speed == 25);
        CHECK(ch.physical.darkvision == 60);
        CHECK(ch.abilities.total(Ability::Endurance) == 14);
        CHECK(ch.skills[Skill::Appraisal].total == 4);
        CHECK(ch.has_feature("Stonecunning"));
        CHECK(builder.pending_choices().empty());
    }
}

TEST_CASE("human ability adjustment") {
    CharacterBuilder builder(core_rules());
    builder.set_ability_scores(elf_mystic_scores());
    builder.set_race("human");

    REQUIRE(builder.pending_choices().size() == 3);
    CHECK(builder.pending_choices()[0].type == ChoiceType::skill);
    CHECK(builder.pending_choices()[1].type == ChoiceType::language);
    CHECK(builder.pending_choices()[2].type == ChoiceType::human_ability_mode);
    CHECK(builder.pending_choices()[2].source == "Human Race - Core Ability Adjustment");

    SECTION("+2 and -1") {
        builder.resolve_choice(ChoiceType::human_ability_mode, {"+2 to one ability and -1 to another"});
        CHECK(builder.pending_choices().size() == 4);
        builder.resolve_choice(ChoiceType::ability_bonus_plus2, {"Intellect"}, "Human Race - +2 Bonus");
        builder.resolve_choice(ChoiceType::ability_penalty, {"Charisma"});
        CHECK(builder.character().abilities.total(Ability::Intellect) == 17);
        CHECK(builder.character().abilities.total(Ability::Charisma) == 7);
    }
    SECTION("+1") {
        builder.resolve_choice(ChoiceType::human_ability_mode, {"+1 to one ability"});
        builder.resolve_choice(ChoiceType::ability_bonus, {"Wisdom"});
        CHECK(builder.character().abilities.total(Ability::Wisdom) == 13);
        CHECK(builder.pending_choices().size() == 2);
    }
    SECTION("any skill may be chosen") {
        builder.resolve_choice(ChoiceType::skill, {"sleight of hand"});
        CHECK(builder.character().skills.is_trained(Skill::SleightOfHand));
    }
}

TEST_CASE("resolving choices") {
    CharacterBuilder builder(core_rules());
    builder.set_ability_scores(elf_mystic_scores());
    builder.set_race("human");
    builder.set_ancestry("heartlander");

    SECTION("choices are told apart by source") {
        builder.resolve_choice(ChoiceType::language, {"Halfling"}, "Heartlander Ancestry");
        CHECK(builder.character().has_language("Halfling"));
        REQUIRE(builder.pending_choices().size() == 3);
        CHECK(builder.pending_choices()[1].source == "Human Race");
    }
    SECTION("selections are matched case insensitively") {
        builder.resolve_choice(ChoiceType::language, {"halfling"}, "Heartlander Ancestry");
        CHECK(builder.character().has_language("Halfling"));
    }
    SECTION("the wrong number of selections") {
        CHECK(thrown_kind([&] { builder.resolve_choice(ChoiceType::language, {"Halfling", "Elvish"}); })
              == RulesErrorKind::WrongCount);
    }
    SECTION("a selection that isn't offered") {
        CHECK(thrown_kind([&] {
                  builder.resolve_choice(ChoiceType::language, {"Orcish"}, "Heartlander Ancestry");
              }) == RulesErrorKind::InvalidOption);
    }
    SECTION("nothing of that type pending") {
        CHECK(thrown_kind([&] { builder.resolve_choice(ChoiceType::tool, {"Smith's tools"}); })
              == RulesErrorKind::NoPendingChoice);
    }
    SECTION("a failed resolution leaves the choice queued") {
        const auto pending = builder.pending_choices().size();
        CHECK(thrown_kind([&] { builder.resolve_choice(ChoiceType::skill, {"Juggling"}); })
              == RulesErrorKind::InvalidOption);
        CHECK(builder.pending_choices().size() == pending);
    }
}

TEST_CASE("professions and duties") {
    CharacterBuilder builder(core_rules());
    builder.set_ability_scores(elf_mystic_scores());
    builder.set_race("elf");
    builder.set_ancestry("sylari");

    SECTION("a warrior needs a duty") {
        CHECK(thrown_kind([&] { builder.set_profession("warrior"); }) == RulesErrorKind::DutyRequired);
        CHECK(builder.current_step() == BuilderStep::profession);
    }
    SECTION("unknown duty") {
        CHECK(thrown_kind([&] { builder.set_profession("warrior", "paladin"); }) == RulesErrorKind::NotFound);
    }
    SECTION("fighter") {
        builder.set_profession("warrior", "fighter");
        const auto &ch = builder.character();
        CHECK(ch.duty == "Fighter");
        CHECK(ch.profession_hit_points == 10);
        CHECK(ch.has_proficiency("Heavy armor"));
        CHECK(ch.has_proficiency("Martial weapons"));
        REQUIRE(builder.pending_choices().size() == 2);
        CHECK(builder.pending_choices()[0].source == "Warrior Profession");
        CHECK(builder.pending_choices()[1].source == "Fighter Duty");

        SECTION("an already trained skill is not trained twice") {
            builder.resolve_choice(ChoiceType::skill, {"Athletics", "Perception"});
            CHECK(builder.character().skills[Skill::Perception].rank == 1);
            CHECK(builder.character().skills.is_trained(Skill::Athletics));
        }
        SECTION("duty tool choice") {
            builder.resolve_choice(ChoiceType::tool, {"Armorer's tools"});
            CHECK(builder.character().has_proficiency("Armorer's tools"));
        }
    }
}

TEST_CASE("starting talents") {
    auto builder = elf_scholar_at_path_step();

    SECTION("need a path first") {
        CHECK(thrown_kind([&] { builder.purchase_starting_talents({{"spellcraft", 1, "mystic", ""}}); })
              == RulesErrorKind::StepOutOfOrder);
    }

    builder.set_path("mystic");
    CHECK(builder.starting_talent_points() == 8);

    SECTION("spent in the primary path") {
        builder.purchase_starting_talents(
            {{"spellcraft", 1, "mystic", ""}, {"spellcraft", 2, "mystic", ""}, {"ward", 1, "mystic", ""}});
        CHECK(builder.starting_talents_purchased());
        CHECK(builder.character().talent_rank("spellcraft") == 2);
        CHECK(builder.character().talent_rank("ward") == 1);

        SECTION("only once") {
            CHECK(thrown_kind([&] { builder.purchase_starting_talents({{"toughness", 1, "", ""}}); })
                  == RulesErrorKind::AlreadyPossessed);
        }
    }
    SECTION("too little in the primary path") {
        CHECK(thrown_kind([&] { builder.purchase_starting_talents({{"toughness", 1, "", ""}}); })
              == RulesErrorKind::BudgetExceeded);
        CHECK(!builder.starting_talents_purchased());
        CHECK(builder.character().talents.empty());
    }
}

TEST_CASE("rebuilding is idempotent") {
    auto builder = elf_scholar_at_path_step();
    builder.set_path("mystic");
    const auto first = builder.build();
    builder.recalculate_all();
    CHECK(builder.build() == first);
    CHECK(builder.character() == first);
}
