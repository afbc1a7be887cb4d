/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Character.hpp"
#include "CharacterValidator.hpp"
#include "Logging.hpp"
#include "Purchases.hpp"
#include "RulesConstants.hpp"
#include "ValidationResult.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

class Rng;
class RulesCatalog;
struct Talent;

// Everything the player chooses when levelling up.
struct LevelUpRequest {
    // Defaults to one more than the current level, the only level accepted.
    std::optional<int> target_level;
    std::vector<TalentPurchase> talents;
    std::vector<AdvancementPurchase> advancements;
    // Ability name to increase, only at levels that grant one.
    std::map<std::string, int> ability_increase;
    // The hit point die roll. Absent means take the average.
    std::optional<int> hp_roll;
};

// What a level-up to target_level offers: budgets, flags and what could be bought right now.
struct LevelUpOptions {
    int current_level{};
    int target_level{};
    // Granted by this level; points carried from earlier levels are added on top.
    int talent_points{};
    int advancement_points{};
    CarriedPoints carried;
    int min_primary_path_points{};
    bool grants_ability_increase{};
    bool grants_extra_attack{};
    int spellcrafting_gain{};
    std::map<std::string, int> talent_ranks;
    std::vector<Skill> trained_skills;
    // Talents whose next rank passes every prerequisite at the target level and fits the budget.
    std::vector<const Talent *> purchasable_talents;
};

struct LevelUpResult {
    ValidationResult validation;
    // The levelled character; only present when validation passed.
    std::optional<Character> character;

    [[nodiscard]] bool ok() const noexcept { return validation.valid && character.has_value(); }
};

// Applies level-ups. level_up() never touches its input: it validates the whole request and
// then returns either a new character with everything applied, or the full list of problems.
// Points left unspent are written to stored_advance and may be spent at any later level-up.
class AdvancementEngine {
public:
    explicit AdvancementEngine(const RulesCatalog &catalog, RulesConstants constants = {});

    [[nodiscard]] int talent_points(const Character &ch) const;
    [[nodiscard]] static int advancement_points(const Character &ch);
    [[nodiscard]] static int min_primary_path_points(int talent_points);
    [[nodiscard]] static bool grants_ability_increase(int level);
    [[nodiscard]] static bool grants_extra_attack(int level);
    // Spellcrafting points gained at the level, zero unless the primary path casts spells.
    [[nodiscard]] int spellcrafting_gain(const Character &ch, int level) const;

    [[nodiscard]] LevelUpOptions options(const Character &ch) const;
    [[nodiscard]] LevelUpResult level_up(const Character &ch, const LevelUpRequest &request) const;

    // One hit die, for callers who roll rather than take the average.
    [[nodiscard]] static int roll_level_hit_points(Rng &rng);

private:
    [[nodiscard]] ValidationResult validate(const Character &ch, const LevelUpRequest &request, int target_level) const;
    void apply(Character &ch, const LevelUpRequest &request, int target_level) const;

    const RulesCatalog &catalog_;
    RulesConstants constants_;
    CharacterValidator validator_;
    mutable Logger logger_;
};
