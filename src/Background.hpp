/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Feature.hpp"
#include "Skill.hpp"

#include <optional>
#include <string>
#include <vector>

struct Character;

// One row of a personality table. Picking it shifts alignment by morality and reputation by
// reputation.
struct PersonalityEntry {
    int roll{};
    std::string text;
    int morality{};
    int reputation{};

    // The form offered to the player, e.g. "3: I quote obscure texts".
    [[nodiscard]] std::string option() const;
};

struct PersonalityTables {
    std::vector<PersonalityEntry> traits;
    std::vector<PersonalityEntry> ideals;
    std::vector<PersonalityEntry> bonds;
    std::vector<PersonalityEntry> flaws;
};

struct Background {
    std::string id;
    std::string name;
    std::string description;
    std::vector<Skill> skill_proficiencies;
    std::vector<std::string> tool_proficiencies;
    int languages_granted{}; // chosen by the player
    std::vector<std::string> equipment;
    std::optional<Feature> feature;
    PersonalityTables personality;

    void apply(Character &ch) const;
};
