/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Ability.hpp"
#include "Feature.hpp"
#include "Skill.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

// One purchased talent. Rank only ever goes up.
struct CharacterTalent {
    std::string talent_id;
    std::string name;
    int rank{};
    std::string path_id; // "general" for talents outside any path
    std::string choice_data;

    bool operator==(const CharacterTalent &rhs) const = default;
};

struct AttackModifier {
    int attr{};
    int misc{};
    int total{};
    bool operator==(const AttackModifier &rhs) const = default;
};

struct Defense {
    int shield{};
    int misc{};
    int total{};
    bool operator==(const Defense &rhs) const = default;
};

struct PassiveStat {
    int misc{};
    int total{};
    bool operator==(const PassiveStat &rhs) const = default;
};

// Hit points, life points and armour hit points all share this shape.
struct Resource {
    int current{};
    int max{};
    bool operator==(const Resource &rhs) const = default;
};

// Alignment and reputation: a value chosen in play plus the accumulated bonuses from rules entries.
struct Standing {
    int value{};
    int modifier{};
    bool operator==(const Standing &rhs) const = default;
};

struct PhysicalTraits {
    std::string creature_type{"Humanoid"};
    std::string size{"Medium"};
    int darkvision{};
    bool operator==(const PhysicalTraits &rhs) const = default;
};

struct Personality {
    std::string trait;
    std::string ideal;
    std::string bond;
    std::string flaw;
    bool operator==(const Personality &rhs) const = default;
};

struct Spellcrafting {
    int crafting_points_max{};
    int casting_points_max{};
    bool operator==(const Spellcrafting &rhs) const = default;
};

// The complete character record. Everything below the "derived" marker is recomputed by
// DerivedStats::recalculate_all() and should not be set directly.
struct Character {
    std::string name;

    std::string race_id;
    std::string race;
    std::string ancestry_id;
    std::string ancestry;
    std::string profession_id;
    std::string profession;
    std::string duty_id;
    std::string duty;
    std::string primary_path_id;
    std::string primary_path;
    std::string background_id;
    std::string background;

    int level{1};
    int total_experience{};
    std::string stored_advance;

    AbilityScores abilities;
    SkillEntries skills;
    std::set<std::string> languages;
    std::set<std::string> proficiencies;
    std::vector<CharacterTalent> talents;
    std::vector<Feature> features;

    PhysicalTraits physical;
    int speed{30};
    Personality personality;
    Standing alignment;
    Standing reputation;

    int profession_hit_points{};
    int level_hit_points{};
    Spellcrafting spellcrafting;

    // derived
    AttackModifier attack_melee;
    AttackModifier attack_ranged;
    Defense defense;
    int initiative{};
    PassiveStat passive_perception;
    PassiveStat passive_insight;
    Resource health;
    Resource life_points;
    Resource armor_hp;

    [[nodiscard]] const CharacterTalent *find_talent(std::string_view talent_id) const;
    [[nodiscard]] int talent_rank(std::string_view talent_id) const;
    // Talent id to current rank, for prerequisite checks.
    [[nodiscard]] std::map<std::string, int> talent_ranks() const;
    // Languages and proficiencies are compared case insensitively.
    [[nodiscard]] bool has_language(std::string_view language) const;
    [[nodiscard]] bool has_proficiency(std::string_view proficiency) const;
    [[nodiscard]] bool has_feature(std::string_view feature_name) const;
    void add_feature(std::string name, std::string text);

    bool operator==(const Character &rhs) const = default;
};
