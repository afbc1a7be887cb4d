/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include <array>
#include <optional>
#include <string_view>

enum class Ability {
    // Order is important: it's the order abilities appear on the character sheet.
    Might = 0,
    Agility = 1,
    Endurance = 2,
    Intellect = 3,
    Wisdom = 4,
    Charisma = 5
};
static constexpr inline auto MAX_ABILITIES = 6;
static constexpr inline auto MinAbilityScore = 1;
static constexpr inline auto MaxAbilityScore = 20;

inline std::string_view to_short_string(Ability ability) {
    using namespace std::literals;
    switch (ability) {
    case Ability::Might: return "mgt"sv;
    case Ability::Agility: return "agi"sv;
    case Ability::Endurance: return "end"sv;
    case Ability::Intellect: return "int"sv;
    case Ability::Wisdom: return "wis"sv;
    case Ability::Charisma: return "cha"sv;
    }
    return "(unknown)"sv;
}
inline std::string_view to_long_string(Ability ability) {
    using namespace std::literals;
    switch (ability) {
    case Ability::Might: return "Might"sv;
    case Ability::Agility: return "Agility"sv;
    case Ability::Endurance: return "Endurance"sv;
    case Ability::Intellect: return "Intellect"sv;
    case Ability::Wisdom: return "Wisdom"sv;
    case Ability::Charisma: return "Charisma"sv;
    }
    return "(unknown)"sv;
}
inline constexpr std::array all_abilities = {Ability::Might,     Ability::Agility, Ability::Endurance,
                                             Ability::Intellect, Ability::Wisdom,  Ability::Charisma};

// Accepts either the full ability name or its three letter abbreviation, case insensitively.
std::optional<Ability> try_parse_ability(std::string_view ability_name);

// The bonus an ability total contributes to everything derived from it: floor((total - 10) / 2).
[[nodiscard]] constexpr int ability_modifier(int total) noexcept {
    const auto diff = total - 10;
    return diff >= 0 ? diff / 2 : -((1 - diff) / 2);
}

// One line of the ability block. total and modifier are derived: see recalculate().
struct AbilityScore {
    int roll{10};
    int race{};
    int misc{};
    int total{10};
    int modifier{};
    int saving_throw{};

    void recalculate() noexcept {
        total = roll + race + misc;
        modifier = ability_modifier(total);
        saving_throw = modifier;
    }
    bool operator==(const AbilityScore &rhs) const = default;
};

class AbilityScores {
    std::array<AbilityScore, MAX_ABILITIES> scores_{};

public:
    AbilityScore &operator[](Ability ability) { return scores_[static_cast<size_t>(ability)]; }
    const AbilityScore &operator[](Ability ability) const { return scores_[static_cast<size_t>(ability)]; }
    [[nodiscard]] int total(Ability ability) const { return (*this)[ability].total; }
    [[nodiscard]] int modifier(Ability ability) const { return (*this)[ability].modifier; }
    friend auto begin(AbilityScores &scores) { return scores.scores_.begin(); }
    friend auto end(AbilityScores &scores) { return scores.scores_.end(); }
    bool operator==(const AbilityScores &rhs) const = default;
};
