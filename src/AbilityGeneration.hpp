/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Ability.hpp"

#include <array>
#include <map>
#include <optional>
#include <string>
#include <string_view>

class Rng;

// How a player arrived at their six base scores. snake_case as these are wire names.
enum class AbilityScoreMethod { point_buy, standard_array, roll, quick_test, manual };

[[nodiscard]] std::optional<AbilityScoreMethod> try_parse_method(std::string_view name);

namespace AbilityGeneration {

inline constexpr std::array StandardArray = {15, 14, 13, 12, 11, 10, 8};
inline constexpr auto QuickTestScore = 12;
inline constexpr auto PointBuyMinimum = 8;
inline constexpr auto PointBuyMaximum = 16;

// Point cost of buying a score, or nullopt if it can't be bought.
[[nodiscard]] std::optional<int> point_buy_cost(int score) noexcept;

// Four six-sided dice with the lowest discarded.
[[nodiscard]] int roll_4d6_drop_lowest(Rng &rng);
// One rolled score per ability, in sheet order.
[[nodiscard]] std::array<int, MAX_ABILITIES> roll_ability_scores(Rng &rng);
[[nodiscard]] std::array<int, MAX_ABILITIES> quick_test_scores() noexcept;

// Keys the scores by long ability name, ready for CharacterBuilder::set_ability_scores().
[[nodiscard]] std::map<std::string, int> to_score_map(const std::array<int, MAX_ABILITIES> &scores);

}
