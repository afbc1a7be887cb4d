#include "Race.hpp"
#include "Character.hpp"

void Race::apply(Character &ch) const {
    ch.physical.creature_type = creature_type;
    ch.physical.size = size;
    ch.physical.darkvision = darkvision;
    ch.speed = speed;
    ch.languages.insert(languages.begin(), languages.end());
    for (const auto &[ability, modifier] : ability_modifiers) {
        ch.abilities[ability].race += modifier;
        ch.abilities[ability].recalculate();
    }
    for (auto skill : skill_proficiencies)
        ch.skills.train(skill);
    for (const auto &[skill, bonus] : skill_bonuses)
        ch.skills[skill].misc += bonus;
    ch.features.insert(ch.features.end(), features.begin(), features.end());
    ch.race_id = id;
    ch.race = name;
}
