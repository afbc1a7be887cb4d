/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#include "AdvancementEngine.hpp"
#include "DerivedStats.hpp"
#include "Experience.hpp"
#include "RulesCatalog.hpp"
#include "Rng.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/find.hpp>
#include <range/v3/numeric/accumulate.hpp>

#include <algorithm>
#include <limits>

namespace {

constexpr auto HitDie = 8;

std::string_view display_name(const Character &ch) { return ch.name.empty() ? "Unnamed character" : ch.name; }

}

AdvancementEngine::AdvancementEngine(const RulesCatalog &catalog, RulesConstants constants)
    : catalog_(catalog), constants_(constants), validator_(catalog, constants), logger_(logger_for("advancement")) {}

int AdvancementEngine::talent_points(const Character &ch) const {
    const auto *path = catalog_.path(ch.primary_path_id);
    return path ? path->talent_points(ch.abilities) : Advancement::BaseTalentPoints;
}

int AdvancementEngine::advancement_points(const Character &ch) {
    return std::max(Advancement::MinAdvancementPoints, ch.abilities.modifier(Ability::Intellect));
}

int AdvancementEngine::min_primary_path_points(int talent_points) {
    return std::min(Advancement::PrimaryPathPointsCap, talent_points);
}

bool AdvancementEngine::grants_ability_increase(int level) {
    return ranges::find(Advancement::AbilityIncreaseLevels, level) != Advancement::AbilityIncreaseLevels.end();
}

bool AdvancementEngine::grants_extra_attack(int level) {
    return ranges::find(Advancement::ExtraAttackLevels, level) != Advancement::ExtraAttackLevels.end();
}

int AdvancementEngine::spellcrafting_gain(const Character &ch, int level) const {
    const auto *path = catalog_.path(ch.primary_path_id);
    if (!path || !path->spellcasting)
        return 0;
    return ch.abilities.modifier(Ability::Intellect) + level;
}

int AdvancementEngine::roll_level_hit_points(Rng &rng) { return rng.dice(1, HitDie); }

LevelUpOptions AdvancementEngine::options(const Character &ch) const {
    LevelUpOptions options;
    options.current_level = ch.level;
    options.target_level = ch.level + 1;
    options.talent_points = talent_points(ch);
    options.advancement_points = advancement_points(ch);
    options.carried = parse_stored_advance(ch.stored_advance);
    options.min_primary_path_points = min_primary_path_points(options.talent_points);
    options.grants_ability_increase = grants_ability_increase(options.target_level);
    options.grants_extra_attack = grants_extra_attack(options.target_level);
    options.spellcrafting_gain = spellcrafting_gain(ch, options.target_level);
    options.talent_ranks = ch.talent_ranks();
    options.trained_skills = ch.skills.trained();
    for (const auto &talent : catalog_.talents()) {
        const auto next_rank = ch.talent_rank(talent.id) + 1;
        if (next_rank > talent.max_rank || next_rank > options.talent_points + options.carried.talent_points)
            continue;
        const auto check = validator_.validate_talent_purchases(ch, {TalentPurchase{talent.id, next_rank, "", ""}},
                                                                options.target_level,
                                                                std::numeric_limits<int>::max(), 0);
        if (!check.has_error(RulesErrorKind::PrerequisitesNotMet) && !check.has_error(RulesErrorKind::AlreadyPossessed))
            options.purchasable_talents.push_back(&talent);
    }
    return options;
}

ValidationResult AdvancementEngine::validate(const Character &ch, const LevelUpRequest &request,
                                             int target_level) const {
    ValidationResult result;
    if (target_level != ch.level + 1)
        result.add_error(RulesErrorKind::InvalidInput,
                         fmt::format("Can only advance one level at a time: level {} cannot go to {}", ch.level,
                                     target_level));
    if (target_level > Advancement::MaxLevel)
        result.add_warning(fmt::format("Level {} is beyond the experience table", target_level));
    if (const auto needed = Experience::xp_for_level(target_level); ch.total_experience < needed)
        result.add_warning(fmt::format("{} XP is short of the {} needed for level {}", ch.total_experience, needed,
                                       target_level));
    if (request.hp_roll && *request.hp_roll < 1)
        result.add_error(RulesErrorKind::InvalidInput,
                         fmt::format("Hit point roll must be at least 1, not {}", *request.hp_roll));

    const auto tp = talent_points(ch);
    const auto carried = parse_stored_advance(ch.stored_advance);
    result.merge(validator_.validate_talent_purchases(ch, request.talents, target_level, tp + carried.talent_points,
                                                      min_primary_path_points(tp)));
    result.merge(validator_.validate_advancement_purchases(ch, request.advancements,
                                                           advancement_points(ch) + carried.advancement_points));
    result.merge(CharacterValidator::validate_ability_increase(request.ability_increase, target_level));
    return result;
}

void AdvancementEngine::apply(Character &ch, const LevelUpRequest &request, int target_level) const {
    const auto spell_gain = spellcrafting_gain(ch, target_level);
    const auto carried = parse_stored_advance(ch.stored_advance);
    // Ranks are bought one at a time, so each purchase costs its new rank.
    const auto spent_tp =
        ranges::accumulate(request.talents, 0, [](int sum, const auto &purchase) { return sum + purchase.new_rank; });
    const auto spent_ap = ranges::accumulate(request.advancements, 0, [](int sum, const auto &purchase) {
        return sum + advancement_cost(purchase.type);
    });
    const CarriedPoints unspent{std::max(0, talent_points(ch) + carried.talent_points - spent_tp),
                                std::max(0, advancement_points(ch) + carried.advancement_points - spent_ap)};

    ch.level = target_level;
    ch.stored_advance = format_stored_advance(unspent);
    apply_talent_purchases(ch, catalog_, request.talents);
    apply_advancement_purchases(ch, catalog_, request.advancements);
    for (const auto &[name, amount] : request.ability_increase)
        if (const auto ability = try_parse_ability(name))
            ch.abilities[*ability].misc += amount;
    DerivedStats::recalculate_abilities(ch);

    const auto hp_gain = std::max(1, request.hp_roll.value_or(constants_.level_hp_average)
                                         + ch.abilities.modifier(Ability::Endurance));
    ch.level_hit_points += hp_gain;

    if (grants_extra_attack(target_level)) {
        const auto extra_attacks = static_cast<int>(
            ranges::find(Advancement::ExtraAttackLevels, target_level) - Advancement::ExtraAttackLevels.begin() + 1);
        ch.add_feature(fmt::format("Extra Attack ({})", extra_attacks),
                       fmt::format("You can attack {} times when you take the Attack action.", extra_attacks + 1));
    }
    ch.spellcrafting.crafting_points_max += spell_gain;
    ch.spellcrafting.casting_points_max += spell_gain;

    DerivedStats::recalculate_all(ch, constants_);
    ch.health.current = ch.health.max;
}

LevelUpResult AdvancementEngine::level_up(const Character &ch, const LevelUpRequest &request) const {
    const auto target_level = request.target_level.value_or(ch.level + 1);
    auto validation = validate(ch, request, target_level);
    if (!validation.valid) {
        logger_.warn("Level-up of {} to level {} rejected with {} error(s)", display_name(ch), target_level,
                     validation.errors.size());
        log_each(logger_, spdlog::level::debug, validation.errors);
        return {std::move(validation), std::nullopt};
    }
    auto levelled = ch;
    apply(levelled, request, target_level);
    logger_.info("{} advanced to level {} with {} talent rank(s) and {} advancement(s), max HP now {}",
                 display_name(levelled), target_level, request.talents.size(), request.advancements.size(),
                 levelled.health.max);
    if (!levelled.stored_advance.empty())
        logger_.debug("Carrying {} to the next level", levelled.stored_advance);
    return {std::move(validation), std::move(levelled)};
}
