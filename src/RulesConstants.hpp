#pragma once

#include <array>

// Tunable numbers used by the derived stat and advancement rules. A copy is handed to each
// component that needs one; see Configuration::rules_constants().
struct RulesConstants {
    int defense_base{9};
    int passive_base{10};
    int point_buy_budget{30};
    int level_hp_average{5};

    bool operator==(const RulesConstants &rhs) const = default;
};

// Fixed parts of the advancement rules.
namespace Advancement {
inline constexpr auto BaseTalentPoints = 5;
inline constexpr auto MinAdvancementPoints = 2;
inline constexpr auto PrimaryPathPointsCap = 4;
inline constexpr auto MaxLevel = 20;
inline constexpr std::array AbilityIncreaseLevels = {4, 8, 12, 16};
inline constexpr std::array ExtraAttackLevels = {3, 9};
}
