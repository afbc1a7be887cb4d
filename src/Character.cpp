#include "Character.hpp"
#include "string_utils.hpp"

#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/algorithm/find_if.hpp>

const CharacterTalent *Character::find_talent(std::string_view talent_id) const {
    auto it = ranges::find_if(talents, [&talent_id](const auto &talent) { return talent.talent_id == talent_id; });
    return it != talents.end() ? &*it : nullptr;
}

int Character::talent_rank(std::string_view talent_id) const {
    const auto *talent = find_talent(talent_id);
    return talent ? talent->rank : 0;
}

std::map<std::string, int> Character::talent_ranks() const {
    std::map<std::string, int> ranks;
    for (const auto &talent : talents)
        ranks[talent.talent_id] = talent.rank;
    return ranks;
}

bool Character::has_language(std::string_view language) const {
    return ranges::any_of(languages, [&language](const auto &known) { return matches(known, language); });
}

bool Character::has_proficiency(std::string_view proficiency) const {
    return ranges::any_of(proficiencies, [&proficiency](const auto &known) { return matches(known, proficiency); });
}

bool Character::has_feature(std::string_view feature_name) const {
    return ranges::any_of(features, [&feature_name](const auto &feature) { return feature.name == feature_name; });
}

void Character::add_feature(std::string name, std::string text) {
    features.push_back(Feature{std::move(name), std::move(text)});
}
