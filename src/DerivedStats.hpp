#pragma once

#include "RulesConstants.hpp"

struct Character;

// Recomputes every derived value on a character from its core fields. Each function is
// idempotent.
namespace DerivedStats {

void recalculate_abilities(Character &ch);
void recalculate_skills(Character &ch);
void recalculate_combat(Character &ch, const RulesConstants &constants);
void recalculate_resources(Character &ch);
void recalculate_all(Character &ch, const RulesConstants &constants);

// Life points are the Endurance total rounded down to an even number, never below 1.
[[nodiscard]] int max_life_points(int endurance_total) noexcept;
[[nodiscard]] int max_hit_points(const Character &ch) noexcept;

}
