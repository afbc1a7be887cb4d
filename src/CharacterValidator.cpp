/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#include "CharacterValidator.hpp"
#include "Character.hpp"
#include "RulesCatalog.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>
#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/numeric/accumulate.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>

namespace {

bool is_ability_increase_level(int level) {
    return ranges::find(Advancement::AbilityIncreaseLevels, level) != Advancement::AbilityIncreaseLevels.end();
}

void check_point_buy(ValidationResult &result, const std::map<Ability, int> &scores, int budget) {
    auto total = 0;
    for (const auto &[ability, score] : scores) {
        if (const auto cost = AbilityGeneration::point_buy_cost(score)) {
            total += *cost;
        } else {
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("Point-buy scores must be between {} and {}: {} is {}",
                                         AbilityGeneration::PointBuyMinimum, AbilityGeneration::PointBuyMaximum,
                                         to_long_string(ability), score));
        }
    }
    if (total > budget)
        result.add_error(RulesErrorKind::BudgetExceeded,
                         fmt::format("Point-buy cost {} exceeds the budget of {}", total, budget));
    else if (total < budget)
        result.add_warning(fmt::format("Point-buy budget underspent: {} of {} points used", total, budget));
}

void check_standard_array(ValidationResult &result, const std::map<Ability, int> &scores) {
    std::vector<int> unused(AbilityGeneration::StandardArray.begin(), AbilityGeneration::StandardArray.end());
    for (const auto &[ability, score] : scores) {
        if (auto it = std::find(unused.begin(), unused.end(), score); it != unused.end()) {
            unused.erase(it);
        } else {
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("{} of {} is not an unused value from the standard array {}",
                                         to_long_string(ability), score,
                                         fmt::join(AbilityGeneration::StandardArray, ", ")));
        }
    }
    if (result.valid && unused.size() == 1 && unused.front() != AbilityGeneration::StandardArray.back())
        result.add_warning(fmt::format("Standard array underspent: {} was left unassigned", unused.front()));
}

void check_quick_test(ValidationResult &result, const std::map<Ability, int> &scores) {
    for (const auto &[ability, score] : scores)
        if (score != AbilityGeneration::QuickTestScore)
            result.add_warning(fmt::format("Quick test scores are all {}, but {} is {}",
                                           AbilityGeneration::QuickTestScore, to_long_string(ability), score));
}

bool in_options(const std::vector<std::string> &options, std::string_view selection) {
    return ranges::find_if(options, [&selection](const auto &option) { return matches(option, selection); })
           != options.end();
}

}

CharacterValidator::CharacterValidator(const RulesCatalog &catalog, RulesConstants constants)
    : catalog_(catalog), constants_(constants) {}

ValidationResult CharacterValidator::validate_ability_scores(const std::map<std::string, int> &scores,
                                                             AbilityScoreMethod method) const {
    ValidationResult result;
    std::map<Ability, int> parsed;
    for (const auto &[name, score] : scores) {
        const auto ability = try_parse_ability(name);
        if (!ability) {
            result.add_error(RulesErrorKind::InvalidInput, fmt::format("Unknown ability: {}", name));
            continue;
        }
        parsed[*ability] = score;
        if (score < MinAbilityScore || score > MaxAbilityScore)
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("{} score {} is outside {}-{}", to_long_string(*ability), score,
                                         MinAbilityScore, MaxAbilityScore));
        else if (score < 3)
            result.add_warning(fmt::format("{} score {} is unusually low", to_long_string(*ability), score));
    }
    for (auto ability : all_abilities)
        if (!parsed.contains(ability))
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("Missing ability score: {}", to_long_string(ability)));
    if (!result.valid)
        return result;

    switch (method) {
    case AbilityScoreMethod::point_buy: check_point_buy(result, parsed, constants_.point_buy_budget); break;
    case AbilityScoreMethod::standard_array: check_standard_array(result, parsed); break;
    case AbilityScoreMethod::quick_test: check_quick_test(result, parsed); break;
    case AbilityScoreMethod::roll:
    case AbilityScoreMethod::manual: break;
    }
    return result;
}

ValidationResult CharacterValidator::validate_race(std::string_view race_id) const {
    if (!catalog_.race(race_id))
        return ValidationResult::failure(RulesErrorKind::NotFound, fmt::format("Unknown race: {}", race_id));
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_ancestry(std::string_view ancestry_id, std::string_view race_id) const {
    const auto *ancestry = catalog_.ancestry(ancestry_id);
    if (!ancestry)
        return ValidationResult::failure(RulesErrorKind::NotFound, fmt::format("Unknown ancestry: {}", ancestry_id));
    const auto *race = catalog_.race(race_id);
    if (!race || !ancestry->belongs_to(race->id))
        return ValidationResult::failure(RulesErrorKind::RaceMismatch,
                                         fmt::format("Ancestry {} belongs to race {}, not {}", ancestry->name,
                                                     ancestry->race_id, race_id.empty() ? "(none)" : race_id));
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_profession(std::string_view profession_id,
                                                         std::optional<std::string_view> duty_id) const {
    const auto *profession = catalog_.profession(profession_id);
    if (!profession)
        return ValidationResult::failure(RulesErrorKind::NotFound,
                                         fmt::format("Unknown profession: {}", profession_id));
    if (profession->requires_duty() && (!duty_id || duty_id->empty())) {
        const auto names = profession->duties | ranges::views::transform(&Duty::name)
                           | ranges::to<std::vector<std::string>>;
        return ValidationResult::failure(
            RulesErrorKind::DutyRequired,
            fmt::format("Profession {} requires a duty: {}", profession->name, fmt::join(names, ", ")));
    }
    if (duty_id && !duty_id->empty() && !profession->duty(*duty_id))
        return ValidationResult::failure(RulesErrorKind::NotFound,
                                         fmt::format("Profession {} has no duty {}", profession->name, *duty_id));
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_path(std::string_view path_id, const AbilityScores &scores,
                                                   bool is_primary) const {
    const auto *path = catalog_.path(path_id);
    if (!path)
        return ValidationResult::failure(RulesErrorKind::NotFound, fmt::format("Unknown path: {}", path_id));
    if (!path->check_prerequisites(scores, is_primary))
        return ValidationResult::failure(
            RulesErrorKind::PrerequisitesNotMet,
            fmt::format("Prerequisites not met for {}: {}", path->name, path->prerequisites->describe()));
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_background(std::string_view background_id) const {
    if (!catalog_.background(background_id))
        return ValidationResult::failure(RulesErrorKind::NotFound,
                                         fmt::format("Unknown background: {}", background_id));
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_talent(std::string_view talent_id) const {
    if (!catalog_.talent(talent_id))
        return ValidationResult::failure(RulesErrorKind::NotFound, fmt::format("Unknown talent: {}", talent_id));
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_choice_set(const std::vector<std::string> &selections, int count,
                                                         const std::vector<std::string> &options,
                                                         const std::set<std::string> *possessed) {
    ValidationResult result;
    if (static_cast<int>(selections.size()) != count)
        result.add_error(RulesErrorKind::WrongCount,
                         fmt::format("Expected {} selection{}, got {}", count, count == 1 ? "" : "s",
                                     selections.size()));
    std::set<std::string> seen;
    for (const auto &selection : selections) {
        if (!seen.insert(lower_case(selection)).second)
            result.add_error(RulesErrorKind::InvalidOption, fmt::format("Duplicate selection: {}", selection));
        else if (!options.empty() && !in_options(options, selection))
            result.add_error(RulesErrorKind::InvalidOption,
                             fmt::format("'{}' is not one of the offered options", selection));
        else if (possessed && possessed->contains(selection))
            result.add_error(RulesErrorKind::AlreadyPossessed, fmt::format("Already have {}", selection));
    }
    return result;
}

ValidationResult CharacterValidator::validate_talent_purchases(const Character &ch,
                                                               const std::vector<TalentPurchase> &purchases,
                                                               int target_level, int talent_points,
                                                               int min_primary_path_points) const {
    ValidationResult result;
    auto running = ch.talent_ranks();
    auto spent = 0;
    auto primary_spent = 0;
    for (const auto &purchase : purchases) {
        const auto *talent = catalog_.talent(purchase.talent_id);
        if (!talent) {
            result.add_error(RulesErrorKind::NotFound, fmt::format("Unknown talent: {}", purchase.talent_id));
            continue;
        }
        const auto current_rank = running.contains(talent->id) ? running[talent->id] : 0;
        if (purchase.new_rank != current_rank + 1) {
            result.add_error(RulesErrorKind::PrerequisitesNotMet,
                             fmt::format("{}: cannot buy rank {} while at rank {}; ranks must be bought in order",
                                         talent->name, purchase.new_rank, current_rank));
            continue;
        }
        if (purchase.new_rank > talent->max_rank) {
            result.add_error(RulesErrorKind::AlreadyPossessed,
                             fmt::format("{} is already at its maximum rank of {}", talent->name, talent->max_rank));
            continue;
        }
        for (const auto &failure : talent->prerequisites.check(ch.abilities, target_level, running, purchase.new_rank))
            result.add_error(RulesErrorKind::PrerequisitesNotMet, fmt::format("{}: {}", talent->name, failure));
        if (talent->is_capstone || talent->prerequisites.all_path_talents) {
            for (const auto *other : catalog_.talents_for_path(talent->path_id))
                if (other != talent && !(running.contains(other->id) && running[other->id] >= 1))
                    result.add_error(RulesErrorKind::PrerequisitesNotMet,
                                     fmt::format("{}: requires every other {} talent, missing {}", talent->name,
                                                 talent->path_id, other->name));
        }
        if (talent->requires_choice) {
            const auto *owned = ch.find_talent(talent->id);
            const auto has_prior_choice = owned && !owned->choice_data.empty();
            if (purchase.choice_data.empty() && !has_prior_choice)
                result.add_error(RulesErrorKind::InvalidInput,
                                 fmt::format("{} requires a choice of {}", talent->name,
                                             talent->choice_type.empty() ? "option" : talent->choice_type));
            else if (!purchase.choice_data.empty() && !talent->choice_options.empty()
                     && !in_options(talent->choice_options, purchase.choice_data))
                result.add_error(RulesErrorKind::InvalidOption,
                                 fmt::format("{}: '{}' is not one of {}", talent->name, purchase.choice_data,
                                             fmt::join(talent->choice_options, ", ")));
        }
        const auto cost = Talent::tp_cost(current_rank, purchase.new_rank);
        spent += cost;
        if (talent->category == TalentCategory::path && !ch.primary_path_id.empty()
            && talent->path_id == ch.primary_path_id)
            primary_spent += cost;
        running[talent->id] = purchase.new_rank;
    }
    if (spent > talent_points)
        result.add_error(RulesErrorKind::BudgetExceeded,
                         fmt::format("Spent {} TP but only {} available", spent, talent_points));
    if (!purchases.empty() && primary_spent < min_primary_path_points)
        result.add_error(RulesErrorKind::BudgetExceeded,
                         fmt::format("Must spend at least {} TP in primary path {}, spent {}",
                                     min_primary_path_points,
                                     ch.primary_path.empty() ? "(none)" : ch.primary_path, primary_spent));
    return result;
}

ValidationResult
CharacterValidator::validate_advancement_purchases(const Character &ch,
                                                   const std::vector<AdvancementPurchase> &purchases,
                                                   int advancement_points) const {
    ValidationResult result;
    std::set<std::pair<AdvancementType, std::string>> seen;
    std::set<Skill> newly_trained;
    auto spent = 0;
    for (const auto &purchase : purchases) {
        const auto type_name = magic_enum::enum_name(purchase.type);
        if (!seen.emplace(purchase.type, lower_case(trim(purchase.target))).second) {
            result.add_error(RulesErrorKind::AlreadyPossessed,
                             fmt::format("Duplicate purchase: {} {}", type_name, purchase.target));
            continue;
        }
        spent += advancement_cost(purchase.type);
        switch (purchase.type) {
        case AdvancementType::skill_rank:
        case AdvancementType::train_skill: {
            const auto skill = try_parse_skill(purchase.target);
            if (!skill) {
                result.add_error(RulesErrorKind::InvalidInput, fmt::format("Unknown skill: {}", purchase.target));
                break;
            }
            const auto trained = ch.skills.is_trained(*skill);
            if (purchase.type == AdvancementType::train_skill) {
                if (trained || newly_trained.contains(*skill))
                    result.add_error(RulesErrorKind::AlreadyPossessed,
                                     fmt::format("Already trained in {}", to_string(*skill)));
                newly_trained.insert(*skill);
            } else if (!trained && !newly_trained.contains(*skill)) {
                result.add_error(RulesErrorKind::InvalidInput,
                                 fmt::format("Can only raise the rank of a trained skill, not {}", to_string(*skill)));
            }
            break;
        }
        case AdvancementType::proficiency:
            if (trim(purchase.target).empty())
                result.add_error(RulesErrorKind::InvalidInput, "A proficiency purchase needs a target");
            else if (ch.has_proficiency(trim(purchase.target)))
                result.add_error(RulesErrorKind::AlreadyPossessed,
                                 fmt::format("Already proficient with {}", purchase.target));
            break;
        case AdvancementType::language:
            if (trim(purchase.target).empty())
                result.add_error(RulesErrorKind::InvalidInput, "A language purchase needs a target");
            else if (ch.has_language(trim(purchase.target)))
                result.add_error(RulesErrorKind::AlreadyPossessed, fmt::format("Already speak {}", purchase.target));
            else if (!catalog_.is_language(trim(purchase.target)))
                result.add_warning(fmt::format("{} is not a standard language", purchase.target));
            break;
        }
    }
    if (spent > advancement_points)
        result.add_error(RulesErrorKind::BudgetExceeded,
                         fmt::format("Spent {} AP but only {} available", spent, advancement_points));
    return result;
}

ValidationResult CharacterValidator::validate_ability_increase(const std::map<std::string, int> &increase,
                                                               int target_level) {
    if (!is_ability_increase_level(target_level)) {
        if (!increase.empty())
            return ValidationResult::failure(RulesErrorKind::InvalidInput,
                                             fmt::format("Level {} does not grant an ability increase", target_level));
        return ValidationResult::success();
    }
    constexpr auto shape = "Ability increase must be +2 to one ability or +1 to two different abilities";
    if (increase.empty())
        return ValidationResult::failure(RulesErrorKind::InvalidInput,
                                         fmt::format("Level {} requires an ability increase. {}", target_level, shape));
    std::set<Ability> abilities;
    for (const auto &[name, amount] : increase) {
        const auto ability = try_parse_ability(name);
        if (!ability)
            return ValidationResult::failure(RulesErrorKind::InvalidInput, fmt::format("Unknown ability: {}", name));
        abilities.insert(*ability);
    }
    const auto total = ranges::accumulate(increase, 0, [](int sum, const auto &entry) { return sum + entry.second; });
    const auto one_by_two = increase.size() == 1 && increase.begin()->second == 2;
    const auto two_by_one = increase.size() == 2 && abilities.size() == 2
                            && ranges::all_of(increase, [](const auto &entry) { return entry.second == 1; });
    if (total != 2 || !(one_by_two || two_by_one))
        return ValidationResult::failure(RulesErrorKind::InvalidInput, shape);
    return ValidationResult::success();
}

ValidationResult CharacterValidator::validate_character(const Character &ch) const {
    ValidationResult result;
    const auto require = [&result](const std::string &value, std::string_view what) {
        if (value.empty())
            result.add_error(RulesErrorKind::InvalidInput, fmt::format("No {} selected", what));
    };
    require(ch.race_id, "race");
    require(ch.ancestry_id, "ancestry");
    require(ch.profession_id, "profession");
    require(ch.primary_path_id, "primary path");
    require(ch.background_id, "background");

    for (auto ability : all_abilities) {
        const auto &score = ch.abilities[ability];
        if (score.roll < MinAbilityScore || score.roll > MaxAbilityScore)
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("{} base score {} is outside {}-{}", to_long_string(ability), score.roll,
                                         MinAbilityScore, MaxAbilityScore));
        if (score.total < MinAbilityScore)
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("{} total {} is below {}", to_long_string(ability), score.total,
                                         MinAbilityScore));
        else if (score.total > MaxAbilityScore)
            result.add_warning(fmt::format("{} total {} is above {}", to_long_string(ability), score.total,
                                           MaxAbilityScore));
    }

    if (!ch.ancestry_id.empty() && !ch.race_id.empty())
        result.merge(validate_ancestry(ch.ancestry_id, ch.race_id));
    if (!ch.primary_path_id.empty())
        result.merge(validate_path(ch.primary_path_id, ch.abilities));

    if (ch.level < 1)
        result.add_error(RulesErrorKind::InvalidInput, fmt::format("Level {} is below 1", ch.level));
    else if (ch.level > Advancement::MaxLevel)
        result.add_warning(fmt::format("Level {} is beyond the experience table", ch.level));
    if (ch.health.max < 1)
        result.add_error(RulesErrorKind::InvalidInput, fmt::format("Maximum hit points {} is below 1", ch.health.max));

    std::set<std::string> seen;
    for (const auto &owned : ch.talents) {
        if (!seen.insert(owned.talent_id).second)
            result.add_error(RulesErrorKind::AlreadyPossessed,
                             fmt::format("Talent {} appears more than once", owned.talent_id));
        const auto *talent = catalog_.talent(owned.talent_id);
        if (!talent) {
            result.add_error(RulesErrorKind::NotFound, fmt::format("Unknown talent: {}", owned.talent_id));
            continue;
        }
        if (owned.rank < 1 || owned.rank > talent->max_rank)
            result.add_error(RulesErrorKind::InvalidInput,
                             fmt::format("{} rank {} is outside 1-{}", talent->name, owned.rank, talent->max_rank));
    }
    return result;
}
