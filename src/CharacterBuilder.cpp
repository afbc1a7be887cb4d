/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#include "CharacterBuilder.hpp"
#include "DerivedStats.hpp"
#include "RulesCatalog.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

#include <algorithm>

namespace {

constexpr auto PlusOneMode = "+1 to one ability";
constexpr auto TradeOffMode = "+2 to one ability and -1 to another";

std::vector<std::string> ability_options() {
    return all_abilities | ranges::views::transform([](Ability a) { return std::string(to_long_string(a)); })
           | ranges::to<std::vector<std::string>>;
}

std::vector<std::string> skill_options(const ChoiceSpec &spec) {
    return spec.options.empty() ? skill_names() : spec.options;
}

BuilderStep step_after(BuilderStep step) {
    return step == BuilderStep::complete ? step : static_cast<BuilderStep>(static_cast<int>(step) + 1);
}

bool is_ability_choice(ChoiceType type) {
    return type == ChoiceType::ability_bonus || type == ChoiceType::ability_bonus_plus2
           || type == ChoiceType::ability_penalty;
}

int ability_adjustment(ChoiceType type) {
    switch (type) {
    case ChoiceType::ability_bonus_plus2: return 2;
    case ChoiceType::ability_penalty: return -1;
    default: return 1;
    }
}

// The option text a case-insensitive selection refers to.
std::string canonical(const std::vector<std::string> &options, const std::string &selection) {
    auto it = ranges::find_if(options, [&selection](const auto &option) { return matches(option, selection); });
    return it != options.end() ? *it : selection;
}

}

CharacterBuilder::CharacterBuilder(const RulesCatalog &catalog, RulesConstants constants)
    : catalog_(catalog), constants_(constants), validator_(catalog, constants), logger_(logger_for("builder")) {
    DerivedStats::recalculate_all(character_, constants_);
}

void CharacterBuilder::set_name(std::string name) { character_.name = std::move(name); }

void CharacterBuilder::require_step(BuilderStep step) const {
    if (step > step_)
        throw RulesError(RulesErrorKind::StepOutOfOrder, "Cannot choose {} yet: the current step is {}",
                         magic_enum::enum_name(step), magic_enum::enum_name(step_));
}

void CharacterBuilder::advance_past(BuilderStep step) { step_ = step_after(step); }

void CharacterBuilder::queue(ChoiceType type, int count, std::vector<std::string> options, std::string source) {
    if (count <= 0)
        return;
    logger_.debug("Queued {} {} choice from {}", count, to_string(type), source);
    pending_.push_back(PendingChoice{type, count, std::move(options), std::move(source)});
}

void CharacterBuilder::queue_personality(ChoiceType type, const std::vector<PersonalityEntry> &table,
                                         std::string_view source) {
    if (table.empty())
        return;
    queue(type, 1,
          table | ranges::views::transform(&PersonalityEntry::option) | ranges::to<std::vector<std::string>>,
          std::string(source));
}

// Languages on offer the character doesn't already speak. Falls back to the full list when
// filtering would leave nothing to pick.
std::vector<std::string> CharacterBuilder::unknown_languages(const std::vector<std::string> &options) const {
    const auto &offered = options.empty() ? catalog_.languages() : options;
    auto unknown = offered | ranges::views::filter([this](const auto &l) { return !character_.has_language(l); })
                   | ranges::to<std::vector<std::string>>;
    return unknown.empty() ? offered : unknown;
}

void CharacterBuilder::set_ability_scores(const std::map<std::string, int> &values) {
    require_step(BuilderStep::ability_scores);
    std::map<Ability, int> parsed;
    for (const auto &[name, value] : values) {
        const auto ability = try_parse_ability(name);
        if (!ability)
            throw RulesError(RulesErrorKind::InvalidInput, "Unknown ability: {}", name);
        if (value < MinAbilityScore || value > MaxAbilityScore)
            throw RulesError(RulesErrorKind::InvalidInput, "{} score {} is outside {}-{}", to_long_string(*ability),
                             value, MinAbilityScore, MaxAbilityScore);
        if (!parsed.emplace(*ability, value).second)
            throw RulesError(RulesErrorKind::InvalidInput, "{} is given more than once", to_long_string(*ability));
    }
    for (auto ability : all_abilities)
        if (!parsed.contains(ability))
            throw RulesError(RulesErrorKind::InvalidInput, "Missing a score for {}", to_long_string(ability));
    for (const auto &[ability, value] : parsed)
        character_.abilities[ability].roll = value;
    DerivedStats::recalculate_all(character_, constants_);
    advance_past(BuilderStep::ability_scores);
    logger_.debug("Ability scores set");
}

void CharacterBuilder::set_race(std::string_view race_id) {
    require_step(BuilderStep::race);
    validator_.validate_race(race_id).throw_if_invalid();
    const auto &race = *catalog_.race(race_id);
    race.apply(character_);
    const auto source = fmt::format("{} Race", race.name);
    if (race.skill_choices)
        queue(ChoiceType::skill, race.skill_choices->count, skill_options(*race.skill_choices), source);
    queue(ChoiceType::language, race.bonus_language_choices, unknown_languages({}), source);
    if (race.flexible_adjustment) {
        if (race.flexible_adjustment->offers_trade_off)
            queue(ChoiceType::human_ability_mode, 1, {PlusOneMode, TradeOffMode},
                  fmt::format("{} - Core Ability Adjustment", source));
        else
            queue(ChoiceType::ability_bonus, race.flexible_adjustment->count, ability_options(),
                  fmt::format("{} - Ability Adjustment", source));
    }
    DerivedStats::recalculate_all(character_, constants_);
    advance_past(BuilderStep::race);
    logger_.debug("Race set to {}", race.name);
}

void CharacterBuilder::set_ancestry(std::string_view ancestry_id) {
    require_step(BuilderStep::ancestry);
    validator_.validate_ancestry(ancestry_id, character_.race_id).throw_if_invalid();
    const auto &ancestry = *catalog_.ancestry(ancestry_id);
    ancestry.apply(character_);
    if (ancestry.language_choices)
        queue(ChoiceType::language, ancestry.language_choices->count,
              unknown_languages(ancestry.language_choices->options), fmt::format("{} Ancestry", ancestry.name));
    DerivedStats::recalculate_all(character_, constants_);
    advance_past(BuilderStep::ancestry);
    logger_.debug("Ancestry set to {}", ancestry.name);
}

void CharacterBuilder::set_profession(std::string_view profession_id, std::optional<std::string_view> duty_id) {
    require_step(BuilderStep::profession);
    validator_.validate_profession(profession_id, duty_id).throw_if_invalid();
    const auto &profession = *catalog_.profession(profession_id);
    const auto *duty = duty_id && !duty_id->empty() ? profession.duty(*duty_id) : nullptr;
    profession.apply(character_, duty);
    const auto source = fmt::format("{} Profession", profession.name);
    if (profession.skill_choices)
        queue(ChoiceType::skill, profession.skill_choices->count, skill_options(*profession.skill_choices), source);
    if (profession.tool_choices)
        queue(ChoiceType::tool, profession.tool_choices->count, profession.tool_choices->options, source);
    if (duty) {
        const auto duty_source = fmt::format("{} Duty", duty->name);
        if (duty->skill_choices)
            queue(ChoiceType::skill, duty->skill_choices->count, skill_options(*duty->skill_choices), duty_source);
        if (duty->tool_choices)
            queue(ChoiceType::tool, duty->tool_choices->count, duty->tool_choices->options, duty_source);
    }
    DerivedStats::recalculate_all(character_, constants_);
    advance_past(BuilderStep::profession);
    logger_.debug("Profession set to {}{}", profession.name, duty ? fmt::format(" ({})", duty->name) : "");
}

std::vector<PathAvailability> CharacterBuilder::available_paths() const {
    return catalog_.paths() | ranges::views::transform([this](const Path &path) {
               return PathAvailability{&path, path.check_prerequisites(character_.abilities)};
           })
           | ranges::to<std::vector<PathAvailability>>;
}

void CharacterBuilder::set_path(std::string_view path_id, bool ignore_prerequisites) {
    require_step(BuilderStep::path);
    const auto *path = catalog_.path(path_id);
    if (!path)
        throw RulesError(RulesErrorKind::NotFound, "Unknown path: {}", path_id);
    if (!ignore_prerequisites)
        validator_.validate_path(path_id, character_.abilities).throw_if_invalid();
    path->apply(character_);
    DerivedStats::recalculate_all(character_, constants_);
    advance_past(BuilderStep::path);
    logger_.debug("Primary path set to {}{}", path->name, ignore_prerequisites ? " ignoring prerequisites" : "");
}

void CharacterBuilder::set_background(std::string_view background_id) {
    require_step(BuilderStep::background);
    validator_.validate_background(background_id).throw_if_invalid();
    const auto &background = *catalog_.background(background_id);
    background.apply(character_);
    const auto source = fmt::format("{} Background", background.name);
    queue(ChoiceType::language, background.languages_granted, unknown_languages({}), source);
    queue_personality(ChoiceType::personality_trait, background.personality.traits, source);
    queue_personality(ChoiceType::personality_ideal, background.personality.ideals, source);
    queue_personality(ChoiceType::personality_bond, background.personality.bonds, source);
    queue_personality(ChoiceType::personality_flaw, background.personality.flaws, source);
    background_ = &background;
    DerivedStats::recalculate_all(character_, constants_);
    advance_past(BuilderStep::background);
    logger_.debug("Background set to {}", background.name);
}

int CharacterBuilder::starting_talent_points() const {
    const auto *path = catalog_.path(character_.primary_path_id);
    return path ? path->talent_points(character_.abilities) : Advancement::BaseTalentPoints;
}

void CharacterBuilder::purchase_starting_talents(const std::vector<TalentPurchase> &purchases) {
    if (character_.primary_path_id.empty())
        throw RulesError(RulesErrorKind::StepOutOfOrder, "Choose a path before buying starting talents");
    if (starting_talents_purchased_)
        throw RulesError(RulesErrorKind::AlreadyPossessed, "Starting talents have already been bought");
    const auto talent_points = starting_talent_points();
    const auto min_primary = std::min(Advancement::PrimaryPathPointsCap, talent_points);
    validator_.validate_talent_purchases(character_, purchases, character_.level, talent_points, min_primary)
        .throw_if_invalid();
    apply_talent_purchases(character_, catalog_, purchases);
    starting_talents_purchased_ = true;
    DerivedStats::recalculate_all(character_, constants_);
    logger_.debug("Bought {} starting talent rank(s) with {} TP", purchases.size(), talent_points);
}

void CharacterBuilder::resolve_choice(ChoiceType type, const std::vector<std::string> &selections,
                                      std::optional<std::string_view> source) {
    auto it = ranges::find_if(pending_, [&](const PendingChoice &choice) {
        return choice.type == type && (!source || choice.source == *source);
    });
    if (it == pending_.end())
        throw RulesError(RulesErrorKind::NoPendingChoice, "No pending {} choice{}", to_string(type),
                         source ? fmt::format(" from {}", *source) : "");
    CharacterValidator::validate_choice_set(selections, it->count, it->options).throw_if_invalid();
    for (const auto &selection : selections) {
        if (type == ChoiceType::skill && !try_parse_skill(selection))
            throw RulesError(RulesErrorKind::InvalidOption, "Unknown skill: {}", selection);
        if (is_ability_choice(type) && !try_parse_ability(selection))
            throw RulesError(RulesErrorKind::InvalidOption, "Unknown ability: {}", selection);
    }
    const auto choice = *it;
    pending_.erase(it);
    apply_choice(choice, selections | ranges::views::transform([&choice](const auto &s) {
                             return canonical(choice.options, s);
                         })
                             | ranges::to<std::vector<std::string>>);
    DerivedStats::recalculate_all(character_, constants_);
    logger_.debug("Resolved {} choice from {}: {}", to_string(type), choice.source, fmt::join(selections, ", "));
}

void CharacterBuilder::apply_choice(const PendingChoice &choice, const std::vector<std::string> &selections) {
    switch (choice.type) {
    case ChoiceType::skill:
        for (const auto &selection : selections)
            character_.skills.train(*try_parse_skill(selection));
        break;
    case ChoiceType::language: character_.languages.insert(selections.begin(), selections.end()); break;
    case ChoiceType::tool: character_.proficiencies.insert(selections.begin(), selections.end()); break;
    case ChoiceType::ability_bonus:
    case ChoiceType::ability_bonus_plus2:
    case ChoiceType::ability_penalty:
        for (const auto &selection : selections)
            character_.abilities[*try_parse_ability(selection)].misc += ability_adjustment(choice.type);
        break;
    case ChoiceType::human_ability_mode: {
        const auto race_source = fmt::format("{} Race", character_.race);
        if (selections.front() == TradeOffMode) {
            queue(ChoiceType::ability_bonus_plus2, 1, ability_options(), fmt::format("{} - +2 Bonus", race_source));
            queue(ChoiceType::ability_penalty, 1, ability_options(), fmt::format("{} - -1 Penalty", race_source));
        } else {
            queue(ChoiceType::ability_bonus, 1, ability_options(), fmt::format("{} - +1 Bonus", race_source));
        }
        break;
    }
    case ChoiceType::personality_trait:
    case ChoiceType::personality_ideal:
    case ChoiceType::personality_bond:
    case ChoiceType::personality_flaw:
        for (const auto &selection : selections)
            apply_personality(choice.type, selection);
        break;
    }
}

void CharacterBuilder::apply_personality(ChoiceType type, const std::string &selection) {
    if (!background_)
        return;
    const auto &tables = background_->personality;
    const auto &table = type == ChoiceType::personality_trait   ? tables.traits
                        : type == ChoiceType::personality_ideal ? tables.ideals
                        : type == ChoiceType::personality_bond  ? tables.bonds
                                                                : tables.flaws;
    auto entry = ranges::find_if(table, [&selection](const auto &e) { return e.option() == selection; });
    if (entry == table.end())
        return;
    auto &field = type == ChoiceType::personality_trait   ? character_.personality.trait
                  : type == ChoiceType::personality_ideal ? character_.personality.ideal
                  : type == ChoiceType::personality_bond  ? character_.personality.bond
                                                          : character_.personality.flaw;
    field = entry->text;
    character_.alignment.modifier += entry->morality;
    character_.reputation.modifier += entry->reputation;
}

bool CharacterBuilder::is_complete() const noexcept { return step_ == BuilderStep::complete && pending_.empty(); }

void CharacterBuilder::recalculate_all() { DerivedStats::recalculate_all(character_, constants_); }

Character CharacterBuilder::build() const {
    auto ch = character_;
    DerivedStats::recalculate_all(ch, constants_);
    return ch;
}

const std::vector<Race> &CharacterBuilder::available_races() const { return catalog_.races(); }

std::vector<const Ancestry *> CharacterBuilder::available_ancestries() const {
    if (character_.race_id.empty())
        return {};
    return catalog_.ancestries_for_race(character_.race_id);
}

const std::vector<Profession> &CharacterBuilder::available_professions() const { return catalog_.professions(); }

const std::vector<Background> &CharacterBuilder::available_backgrounds() const { return catalog_.backgrounds(); }

std::string CharacterBuilder::summary() const {
    const auto or_none = [](const std::string &value) { return value.empty() ? std::string("(not chosen)") : value; };
    auto text = fmt::format("Character: {}\nCurrent Step: {}\n\n", character_.name.empty() ? "(unnamed)" : character_.name,
                            magic_enum::enum_name(step_));
    text += fmt::format("Race: {}\nAncestry: {}\nProfession: {}\n", or_none(character_.race),
                        or_none(character_.ancestry), or_none(character_.profession));
    if (!character_.duty.empty())
        text += fmt::format("  Duty: {}\n", character_.duty);
    text += fmt::format("Path: {}\nBackground: {}\n\nPending Choices: {}\n", or_none(character_.primary_path),
                        or_none(character_.background), pending_.size());
    for (const auto &choice : pending_)
        text += fmt::format("  - {}: Choose {} {}\n", choice.source, choice.count, to_string(choice.type));
    return text;
}
