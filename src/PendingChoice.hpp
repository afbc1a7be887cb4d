#pragma once

#include <magic_enum.hpp>

#include <string>
#include <string_view>
#include <vector>

// Enumerator names are the wire names used by callers, hence snake_case.
enum class ChoiceType {
    skill,
    language,
    tool,
    ability_bonus,
    human_ability_mode,
    ability_bonus_plus2,
    ability_penalty,
    personality_trait,
    personality_ideal,
    personality_bond,
    personality_flaw
};

[[nodiscard]] inline std::string_view to_string(ChoiceType type) { return magic_enum::enum_name(type); }

// A decision the builder needs from the player before the character is complete: pick exactly
// count of the options. source names the rules entry that asked, e.g. "Elf Race".
struct PendingChoice {
    ChoiceType type{ChoiceType::skill};
    int count{1};
    std::vector<std::string> options;
    std::string source;

    bool operator==(const PendingChoice &rhs) const = default;
};
