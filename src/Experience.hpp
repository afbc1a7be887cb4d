#pragma once

#include <string>

// The cumulative experience table.
namespace Experience {

// Experience needed to reach the given level. Levels beyond 20 cost a flat amount each.
[[nodiscard]] int xp_for_level(int level) noexcept;
// The highest level the experience total supports.
[[nodiscard]] int level_for_xp(int total_experience) noexcept;
// How much more is needed to reach the level after the one the experience supports.
[[nodiscard]] int xp_to_next_level(int total_experience) noexcept;
// e.g. "Level 3 (1200 XP, 1800 to level 4)"
[[nodiscard]] std::string level_summary(int total_experience);

}
