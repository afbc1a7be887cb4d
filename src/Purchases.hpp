#pragma once

#include <string>
#include <string_view>
#include <vector>

class RulesCatalog;
struct Character;

// The path id recorded for talents that belong to no path.
inline constexpr auto GeneralPathId = "general";

// Buying the next rank of a talent. path_id is informational; the catalog's own path for the
// talent decides whether it counts towards the primary path.
struct TalentPurchase {
    std::string talent_id;
    int new_rank{1};
    std::string path_id;
    std::string choice_data;
};

// snake_case: these are wire names.
enum class AdvancementType { skill_rank, train_skill, proficiency, language };

// Spending advancement points on a skill, proficiency or language named by target.
struct AdvancementPurchase {
    AdvancementType type{AdvancementType::skill_rank};
    std::string target;
};

[[nodiscard]] constexpr int advancement_cost(AdvancementType type) noexcept {
    switch (type) {
    case AdvancementType::skill_rank: return 1;
    case AdvancementType::train_skill: return 4;
    case AdvancementType::proficiency: return 10;
    case AdvancementType::language: return 10;
    }
    return 0;
}

// Talent and advancement points left unspent by a level-up, carried into the next one.
struct CarriedPoints {
    int talent_points{};
    int advancement_points{};

    bool operator==(const CarriedPoints &rhs) const = default;
};

// Reads a character's stored_advance: "TP 2, AP 3", either half alone, or a bare number of
// advancement points. Anything unrecognised carries nothing.
[[nodiscard]] CarriedPoints parse_stored_advance(std::string_view text);
// The stored_advance text for the given points, empty when nothing is carried.
[[nodiscard]] std::string format_stored_advance(const CarriedPoints &points);

// Adds or upgrades the purchased talent ranks. Purchases must already have been validated.
void apply_talent_purchases(Character &ch, const RulesCatalog &catalog, const std::vector<TalentPurchase> &purchases);
// Applies validated advancement point purchases. Known languages are recorded with the catalog's spelling.
void apply_advancement_purchases(Character &ch, const RulesCatalog &catalog,
                                 const std::vector<AdvancementPurchase> &purchases);
