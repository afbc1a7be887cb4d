#include "Ability.hpp"

#include "string_utils.hpp"

std::optional<Ability> try_parse_ability(std::string_view ability_name) {
    for (auto ability : all_abilities)
        if (matches(ability_name, to_short_string(ability)) || matches(ability_name, to_long_string(ability)))
            return ability;
    return std::nullopt;
}
