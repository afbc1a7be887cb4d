/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Ability.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class Skill {
    Acrobatics,
    AnimalHandling,
    Appraisal,
    Arcana,
    Athletics,
    Crafting,
    Deception,
    Diplomacy,
    History,
    Insight,
    Intimidation,
    Investigation,
    Medicine,
    Nature,
    Perception,
    Performance,
    Persuasion,
    SleightOfHand,
    Stealth,
    Streetwise,
    Survival
};
static constexpr inline auto MAX_SKILLS = 21;

struct SkillInfo {
    Skill skill;
    std::string_view name;
    Ability ability; // the ability whose modifier feeds the skill total
};

[[nodiscard]] const SkillInfo &skill_info(Skill skill);
[[nodiscard]] inline std::string_view to_string(Skill skill) { return skill_info(skill).name; }
[[nodiscard]] inline Ability linked_ability(Skill skill) { return skill_info(skill).ability; }
[[nodiscard]] const std::array<SkillInfo, MAX_SKILLS> &skill_table();
// All skill names in sheet order. Used as the option list for "any skill" choices.
[[nodiscard]] std::vector<std::string> skill_names();

// Case insensitive; tolerates the spellings found in older character files.
std::optional<Skill> try_parse_skill(std::string_view skill_name);

// One line of the skills block. modifier and total are derived.
struct SkillEntry {
    bool trained{};
    int rank{};
    int misc{};
    int modifier{};
    int total{};
    bool operator==(const SkillEntry &rhs) const = default;
};

class SkillEntries {
    std::array<SkillEntry, MAX_SKILLS> entries_{};

public:
    SkillEntry &operator[](Skill skill) { return entries_[static_cast<size_t>(skill)]; }
    const SkillEntry &operator[](Skill skill) const { return entries_[static_cast<size_t>(skill)]; }
    // Marks the skill trained. An untrained skill gets rank 1; training twice never grants a second rank.
    void train(Skill skill) {
        auto &entry = (*this)[skill];
        entry.trained = true;
        if (entry.rank == 0)
            entry.rank = 1;
    }
    [[nodiscard]] bool is_trained(Skill skill) const { return (*this)[skill].trained; }
    [[nodiscard]] std::vector<Skill> trained() const;
    bool operator==(const SkillEntries &rhs) const = default;
};
