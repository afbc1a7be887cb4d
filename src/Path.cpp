#include "Path.hpp"
#include "Character.hpp"
#include "RulesConstants.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

bool PathPrerequisite::check(const AbilityScores &scores, bool is_primary) const {
    if (scores.total(primary_attribute) < primary_minimum)
        return false;
    if (!is_primary || secondary_attributes.empty())
        return true;
    return ranges::any_of(secondary_attributes,
                          [&](Ability ability) { return scores.total(ability) >= secondary_minimum; });
}

std::string PathPrerequisite::describe() const {
    auto description = fmt::format("Need {} {}+", to_long_string(primary_attribute), primary_minimum);
    if (!secondary_attributes.empty()) {
        const auto names = secondary_attributes | ranges::views::transform(to_long_string)
                           | ranges::to<std::vector<std::string_view>>;
        description += fmt::format(" and one of {} {}+", fmt::join(names, ", "), secondary_minimum);
    }
    return description;
}

bool Path::check_prerequisites(const AbilityScores &scores, bool is_primary) const {
    return !prerequisites || prerequisites->check(scores, is_primary);
}

int Path::talent_points(const AbilityScores &scores) const {
    if (!talent_points_attribute)
        return Advancement::BaseTalentPoints;
    return scores.modifier(*talent_points_attribute) + Advancement::BaseTalentPoints;
}

void Path::apply(Character &ch) const {
    for (const auto &[ability, bonus] : primary_bonus) {
        ch.abilities[ability].misc += bonus;
        ch.abilities[ability].recalculate();
    }
    ch.attack_melee.misc += attack_bonus_melee;
    ch.attack_melee.total = ch.attack_melee.attr + ch.attack_melee.misc;
    ch.attack_ranged.misc += attack_bonus_ranged;
    ch.attack_ranged.total = ch.attack_ranged.attr + ch.attack_ranged.misc;
    ch.features.insert(ch.features.end(), features.begin(), features.end());
    ch.primary_path_id = id;
    ch.primary_path = name;
}
