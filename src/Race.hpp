/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Ability.hpp"
#include "ChoiceSpec.hpp"
#include "Feature.hpp"
#include "Skill.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct Character;

// A race whose ability adjustment is picked by the player rather than fixed.
struct FlexibleAdjustment {
    // Number of abilities that each get +1.
    int count{1};
    // Humans may instead take +2 to one ability and -1 to another. When set, the player first
    // chooses between the two modes.
    bool offers_trade_off{};
};

struct Race {
    std::string id;
    std::string name;
    std::string description;

    std::string creature_type{"Humanoid"};
    std::string size{"Medium"};
    int speed{30};

    std::vector<std::string> languages;
    int bonus_language_choices{};
    int darkvision{};

    std::map<Ability, int> ability_modifiers;
    std::optional<FlexibleAdjustment> flexible_adjustment;

    std::vector<Skill> skill_proficiencies;
    std::map<Skill, int> skill_bonuses; // misc bonus only, no training
    std::optional<ChoiceSpec> skill_choices;

    std::vector<Feature> features;

    // Applies everything that needs no player input. Choices are queued by the builder.
    void apply(Character &ch) const;
};
