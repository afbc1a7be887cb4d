/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Ability.hpp"
#include "Feature.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

struct Character;

// The ability scores a character needs to follow a path.
struct PathPrerequisite {
    Ability primary_attribute{Ability::Might};
    int primary_minimum{15};
    // As a primary path, at least one of these must also reach secondary_minimum.
    std::vector<Ability> secondary_attributes;
    int secondary_minimum{13};

    // A secondary path only needs the primary attribute.
    [[nodiscard]] bool check(const AbilityScores &scores, bool is_primary = true) const;
    // e.g. "Need Intellect 15+ and one of Wisdom, Endurance 13+"
    [[nodiscard]] std::string describe() const;
};

struct Path {
    std::string id;
    std::string name;
    std::string description;
    std::optional<PathPrerequisite> prerequisites;
    std::map<Ability, int> primary_bonus; // goes to misc, not race
    std::optional<Ability> talent_points_attribute;
    int attack_bonus_melee{};
    int attack_bonus_ranged{};
    std::string role;
    bool spellcasting{};
    std::vector<Feature> features;
    std::vector<std::string> talents;

    [[nodiscard]] bool check_prerequisites(const AbilityScores &scores, bool is_primary = true) const;
    // Talent points earned per level: the talent attribute's modifier plus five.
    [[nodiscard]] int talent_points(const AbilityScores &scores) const;
    // Applies the path as the character's primary path.
    void apply(Character &ch) const;
};
