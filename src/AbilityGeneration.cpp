#include "AbilityGeneration.hpp"
#include "Rng.hpp"

#include <magic_enum.hpp>

#include <algorithm>

std::optional<AbilityScoreMethod> try_parse_method(std::string_view name) {
    return magic_enum::enum_cast<AbilityScoreMethod>(name);
}

namespace AbilityGeneration {

namespace {

constexpr std::array<int, PointBuyMaximum - PointBuyMinimum + 1> point_buy_costs = {
    // 8   9  10  11  12  13  14  15  16
    0, 1, 2, 3, 4, 5, 7, 9, 11};

}

std::optional<int> point_buy_cost(int score) noexcept {
    if (score < PointBuyMinimum || score > PointBuyMaximum)
        return std::nullopt;
    return point_buy_costs[static_cast<size_t>(score - PointBuyMinimum)];
}

int roll_4d6_drop_lowest(Rng &rng) {
    std::array<int, 4> dice{};
    for (auto &die : dice)
        die = rng.number_range(1, 6);
    std::sort(dice.begin(), dice.end());
    return dice[1] + dice[2] + dice[3];
}

std::array<int, MAX_ABILITIES> roll_ability_scores(Rng &rng) {
    std::array<int, MAX_ABILITIES> scores{};
    for (auto &score : scores)
        score = roll_4d6_drop_lowest(rng);
    return scores;
}

std::array<int, MAX_ABILITIES> quick_test_scores() noexcept {
    std::array<int, MAX_ABILITIES> scores{};
    scores.fill(QuickTestScore);
    return scores;
}

std::map<std::string, int> to_score_map(const std::array<int, MAX_ABILITIES> &scores) {
    std::map<std::string, int> values;
    for (auto ability : all_abilities)
        values.emplace(to_long_string(ability), scores[static_cast<size_t>(ability)]);
    return values;
}

}
