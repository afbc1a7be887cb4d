#include "Ancestry.hpp"
#include "Character.hpp"

void Ancestry::apply(Character &ch) const {
    for (const auto &[ability, modifier] : ability_modifiers) {
        ch.abilities[ability].race += modifier;
        ch.abilities[ability].recalculate();
    }
    ch.languages.insert(languages.begin(), languages.end());
    for (auto skill : skill_proficiencies)
        ch.skills.train(skill);
    for (const auto &[skill, bonus] : skill_bonuses)
        ch.skills[skill].misc += bonus;
    ch.proficiencies.insert(tool_proficiencies.begin(), tool_proficiencies.end());
    ch.features.insert(ch.features.end(), features.begin(), features.end());
    ch.reputation.modifier += reputation_modifier;
    ch.ancestry_id = id;
    ch.ancestry = name;
}
