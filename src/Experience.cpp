#include "Experience.hpp"
#include "RulesConstants.hpp"

#include <fmt/format.h>

#include <array>

namespace {

constexpr std::array<int, Advancement::MaxLevel> xp_table = {
    // clang-format off
    0, 300, 900, 3000, 7000,
    13000, 22000, 34000, 49000, 67000,
    88000, 112000, 139000, 169000, 202000,
    238000, 277000, 317000, 358000, 400000
    // clang-format on
};
constexpr auto XpPerLevelBeyondTable = 43000;

}

namespace Experience {

int xp_for_level(int level) noexcept {
    if (level <= 1)
        return 0;
    if (level <= Advancement::MaxLevel)
        return xp_table[static_cast<size_t>(level - 1)];
    return xp_table.back() + (level - Advancement::MaxLevel) * XpPerLevelBeyondTable;
}

int level_for_xp(int total_experience) noexcept {
    if (total_experience >= xp_table.back())
        return Advancement::MaxLevel + (total_experience - xp_table.back()) / XpPerLevelBeyondTable;
    auto level = 1;
    while (level < Advancement::MaxLevel && total_experience >= xp_for_level(level + 1))
        ++level;
    return level;
}

int xp_to_next_level(int total_experience) noexcept {
    return xp_for_level(level_for_xp(total_experience) + 1) - total_experience;
}

std::string level_summary(int total_experience) {
    const auto level = level_for_xp(total_experience);
    return fmt::format("Level {} ({} XP, {} to level {})", level, total_experience,
                       xp_to_next_level(total_experience), level + 1);
}

}
