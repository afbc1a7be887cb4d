#include "DerivedStats.hpp"
#include "Character.hpp"

#include <algorithm>

namespace DerivedStats {

void recalculate_abilities(Character &ch) {
    for (auto &score : ch.abilities)
        score.recalculate();
}

void recalculate_skills(Character &ch) {
    for (const auto &info : skill_table()) {
        auto &entry = ch.skills[info.skill];
        entry.modifier = ch.abilities.modifier(info.ability);
        entry.total = entry.modifier + entry.rank + entry.misc;
    }
}

void recalculate_combat(Character &ch, const RulesConstants &constants) {
    const auto agility = ch.abilities.modifier(Ability::Agility);
    ch.attack_melee.attr = ch.abilities.modifier(Ability::Might);
    ch.attack_melee.total = ch.attack_melee.attr + ch.attack_melee.misc;
    ch.attack_ranged.attr = agility;
    ch.attack_ranged.total = ch.attack_ranged.attr + ch.attack_ranged.misc;
    ch.defense.total = constants.defense_base + agility + ch.defense.shield + ch.defense.misc;
    ch.initiative = agility;
    ch.passive_perception.total =
        constants.passive_base + ch.skills[Skill::Perception].total + ch.passive_perception.misc;
    ch.passive_insight.total = constants.passive_base + ch.skills[Skill::Insight].total + ch.passive_insight.misc;
}

int max_life_points(int endurance_total) noexcept { return std::max(1, (endurance_total / 2) * 2); }

int max_hit_points(const Character &ch) noexcept {
    return std::max(1, ch.profession_hit_points + ch.abilities.modifier(Ability::Endurance) + ch.level_hit_points);
}

void recalculate_resources(Character &ch) {
    ch.health.max = max_hit_points(ch);
    if (ch.health.current <= 0 || ch.health.current > ch.health.max)
        ch.health.current = ch.health.max;
    ch.life_points.max = max_life_points(ch.abilities.total(Ability::Endurance));
    if (ch.life_points.current <= 0 || ch.life_points.current > ch.life_points.max)
        ch.life_points.current = ch.life_points.max;
}

void recalculate_all(Character &ch, const RulesConstants &constants) {
    recalculate_abilities(ch);
    recalculate_skills(ch);
    recalculate_combat(ch, constants);
    recalculate_resources(ch);
}

}
