#include "Profession.hpp"
#include "Character.hpp"
#include "string_utils.hpp"

#include <range/v3/algorithm/find_if.hpp>

const Duty *Profession::duty(std::string_view duty_id) const {
    auto it = ranges::find_if(duties, [&duty_id](const Duty &duty) {
        return duty.id == duty_id || matches(duty.name, duty_id);
    });
    return it != duties.end() ? &*it : nullptr;
}

void Profession::apply(Character &ch, const Duty *duty) const {
    ch.profession_hit_points = base_hp;
    ch.proficiencies.insert(armor_proficiencies.begin(), armor_proficiencies.end());
    ch.proficiencies.insert(weapon_proficiencies.begin(), weapon_proficiencies.end());
    ch.proficiencies.insert(tool_proficiencies.begin(), tool_proficiencies.end());
    if (feature)
        ch.features.push_back(*feature);
    ch.profession_id = id;
    ch.profession = name;
    if (duty) {
        ch.proficiencies.insert(duty->armor_proficiencies.begin(), duty->armor_proficiencies.end());
        ch.proficiencies.insert(duty->weapon_proficiencies.begin(), duty->weapon_proficiencies.end());
        ch.duty_id = duty->id;
        ch.duty = duty->name;
    } else {
        ch.duty_id.clear();
        ch.duty.clear();
    }
}
