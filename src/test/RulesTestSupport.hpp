#pragma once

#include "Character.hpp"
#include "DerivedStats.hpp"
#include "RulesError.hpp"

#include <map>
#include <optional>
#include <string>

namespace test {

// The kind of RulesError thrown by f, or nullopt if it didn't throw one.
template <typename F>
std::optional<RulesErrorKind> thrown_kind(F &&f) {
    try {
        f();
    } catch (const RulesError &e) {
        return e.kind();
    }
    return std::nullopt;
}

// A character with every ability at 10 except those given, following the given primary path.
inline Character character_with(std::map<Ability, int> rolls, std::string path_id = "mystic",
                                 std::string path_name = "Mystic", int level = 1) {
    Character ch;
    for (const auto &[ability, roll] : rolls)
        ch.abilities[ability].roll = roll;
    ch.primary_path_id = std::move(path_id);
    ch.primary_path = std::move(path_name);
    ch.level = level;
    ch.profession_hit_points = 6;
    DerivedStats::recalculate_all(ch, RulesConstants{});
    return ch;
}

// The scores used throughout the elf mystic examples.
inline const std::map<std::string, int> &elf_mystic_scores() {
    static const std::map<std::string, int> scores{{"Might", 10},    {"Agility", 14}, {"Endurance", 13},
                                                   {"Intellect", 15}, {"Wisdom", 12},  {"Charisma", 8}};
    return scores;
}

}
