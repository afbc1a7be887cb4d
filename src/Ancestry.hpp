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

// A sub-race. Only valid for the race named by race_id.
struct Ancestry {
    std::string id;
    std::string name;
    std::string race_id;
    std::string description;
    std::string region;

    std::map<Ability, int> ability_modifiers;
    std::vector<std::string> languages;
    std::optional<ChoiceSpec> language_choices;
    std::vector<Feature> features;
    std::vector<Skill> skill_proficiencies;
    std::map<Skill, int> skill_bonuses;
    std::vector<std::string> tool_proficiencies;
    int reputation_modifier{};

    [[nodiscard]] bool belongs_to(std::string_view race) const { return race_id == race; }
    void apply(Character &ch) const;
};
