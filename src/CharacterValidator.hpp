/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "AbilityGeneration.hpp"
#include "Purchases.hpp"
#include "RulesConstants.hpp"
#include "ValidationResult.hpp"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

class RulesCatalog;
struct Character;
class AbilityScores;

// Stateless rule checks shared by the character builder and the advancement engine. Nothing
// here mutates a character; every check reports problems through a ValidationResult.
class CharacterValidator {
public:
    explicit CharacterValidator(const RulesCatalog &catalog, RulesConstants constants = {});

    // All six abilities present, each within range, plus the budget rules of the chosen method.
    [[nodiscard]] ValidationResult validate_ability_scores(const std::map<std::string, int> &scores,
                                                           AbilityScoreMethod method) const;

    [[nodiscard]] ValidationResult validate_race(std::string_view race_id) const;
    [[nodiscard]] ValidationResult validate_ancestry(std::string_view ancestry_id, std::string_view race_id) const;
    [[nodiscard]] ValidationResult validate_profession(std::string_view profession_id,
                                                       std::optional<std::string_view> duty_id) const;
    [[nodiscard]] ValidationResult validate_path(std::string_view path_id, const AbilityScores &scores,
                                                 bool is_primary = true) const;
    [[nodiscard]] ValidationResult validate_background(std::string_view background_id) const;
    [[nodiscard]] ValidationResult validate_talent(std::string_view talent_id) const;

    // Exactly count distinct selections, all among options (an empty option list accepts
    // anything). When possessed is given, selecting something already in it is an error.
    [[nodiscard]] static ValidationResult validate_choice_set(const std::vector<std::string> &selections, int count,
                                                              const std::vector<std::string> &options,
                                                              const std::set<std::string> *possessed = nullptr);

    // Rank sequencing, prerequisites, required choices and talent point budgets for a batch
    // of purchases made at target_level.
    [[nodiscard]] ValidationResult validate_talent_purchases(const Character &ch,
                                                             const std::vector<TalentPurchase> &purchases,
                                                             int target_level, int talent_points,
                                                             int min_primary_path_points) const;
    [[nodiscard]] ValidationResult
    validate_advancement_purchases(const Character &ch, const std::vector<AdvancementPurchase> &purchases,
                                   int advancement_points) const;
    // Either {X: +2} or {X: +1, Y: +1}, and only at a level that grants one.
    [[nodiscard]] static ValidationResult validate_ability_increase(const std::map<std::string, int> &increase,
                                                                    int target_level);

    // Completeness and consistency of a finished character.
    [[nodiscard]] ValidationResult validate_character(const Character &ch) const;

private:
    const RulesCatalog &catalog_;
    RulesConstants constants_;
};
