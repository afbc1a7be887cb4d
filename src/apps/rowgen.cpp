/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#include "AbilityGeneration.hpp"
#include "AdvancementEngine.hpp"
#include "CharacterBuilder.hpp"
#include "CharacterValidator.hpp"
#include "CoreRules.hpp"
#include "Logging.hpp"
#include "RulesCatalog.hpp"
#include "Rng.hpp"
#include "common/Configuration.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <fmt/ranges.h>
#include <lyra/lyra.hpp>
#include <magic_enum.hpp>

#include <algorithm>
#include <chrono>
#include <optional>
#include <sstream>

// rowgen - builds a character with the core rules from command line choices, taking the first
// option for every choice the rules leave open, then optionally levels it up. Intended for
// exercising the rules end to end, not for play.

template <>
struct fmt::formatter<lyra::cli> : ostream_formatter {};

namespace {

std::optional<std::array<int, MAX_ABILITIES>> parse_scores(std::string_view text) {
    std::array<int, MAX_ABILITIES> scores{};
    std::istringstream stream{std::string(text)};
    std::string token;
    size_t index = 0;
    while (std::getline(stream, token, ',')) {
        if (index == scores.size())
            return std::nullopt;
        try {
            scores[index++] = std::stoi(std::string(trim(token)));
        } catch (const std::logic_error &) {
            return std::nullopt;
        }
    }
    if (index != scores.size())
        return std::nullopt;
    return scores;
}

void resolve_with_first_options(CharacterBuilder &builder, Logger &logger) {
    while (!builder.pending_choices().empty()) {
        const auto choice = builder.pending_choices().front();
        const auto picks = std::min(choice.options.size(), static_cast<size_t>(choice.count));
        std::vector<std::string> selections(choice.options.begin(), choice.options.begin() + picks);
        logger.debug("{}: picking {}", choice.source, fmt::join(selections, ", "));
        builder.resolve_choice(choice.type, selections, choice.source);
    }
}

// Spends talent points on the primary path first, as the rules require, then on anything else.
std::vector<TalentPurchase> choose_talents(const LevelUpOptions &options, const Character &ch) {
    std::vector<TalentPurchase> purchases;
    auto spent = 0;
    auto primary_spent = 0;
    for (auto primary_pass : {true, false}) {
        for (const auto *talent : options.purchasable_talents) {
            const auto on_primary = talent->category == TalentCategory::path && talent->path_id == ch.primary_path_id;
            if (on_primary != primary_pass)
                continue;
            const auto rank = ch.talent_rank(talent->id) + 1;
            if (spent + rank > options.talent_points + options.carried.talent_points)
                continue;
            purchases.push_back(TalentPurchase{talent->id, rank, talent->path_id,
                                               talent->choice_options.empty() ? "" : talent->choice_options.front()});
            spent += rank;
            if (on_primary)
                primary_spent += rank;
        }
    }
    if (primary_spent < options.min_primary_path_points)
        return {};
    return purchases;
}

}

int main(int argc, const char **argv) {
    auto &config = Configuration::singleton();
    set_log_level(config.log_level());
    auto logger = logger_for("rowgen");

    bool help{};
    bool verbose{};
    bool ignore_prerequisites{};
    std::string name;
    std::string race{"human"};
    std::string ancestry{"heartlander"};
    std::string profession{"warrior"};
    std::string duty{"fighter"};
    std::string path{"martial"};
    std::string background{"soldier"};
    std::string method_name{"standard_array"};
    std::string scores_text;
    int seed = static_cast<int>(std::chrono::system_clock::now().time_since_epoch().count());
    int levels{};
    auto cli = lyra::cli() | lyra::help(help).description("Build a Realm of Warriors character from the core rules")
               | lyra::opt(verbose)["-V"]["--verbose"]("verbose logging")
               | lyra::opt(name, "name")["-n"]["--name"]("character name")
               | lyra::opt(race, "id")["--race"]("race id")
               | lyra::opt(ancestry, "id")["--ancestry"]("ancestry id")
               | lyra::opt(profession, "id")["--profession"]("profession id")
               | lyra::opt(duty, "id")["--duty"]("duty id, for professions that have them")
               | lyra::opt(path, "id")["--path"]("primary path id")
               | lyra::opt(ignore_prerequisites)["--ignore-prerequisites"]("take the path even if unqualified")
               | lyra::opt(background, "id")["--background"]("background id")
               | lyra::opt(method_name, "method")["-m"]["--method"](
                   "ability score method: standard_array, roll, quick_test, point_buy or manual")
               | lyra::opt(scores_text, "scores")["-s"]["--scores"](
                   "six comma separated scores in sheet order, for point_buy and manual")
               | lyra::opt(seed, "seed")["--seed"]("random seed for the roll method")
               | lyra::opt(levels, "levels")["-l"]["--levels"]("number of level-ups to apply");

    auto result = cli.parse({argc, argv});
    if (!result) {
        fmt::print("Error in command line: {}\n", result.message());
        return 1;
    } else if (help) {
        fmt::print("{}", cli);
        return 0;
    }
    if (verbose) {
        set_log_level(spdlog::level::debug);
        logger.set_level(spdlog::level::debug);
    }

    const auto method = try_parse_method(method_name);
    if (!method) {
        logger.critical("Unknown ability score method '{}'", method_name);
        return 1;
    }
    std::array<int, MAX_ABILITIES> scores{};
    switch (*method) {
    case AbilityScoreMethod::standard_array:
        std::copy_n(AbilityGeneration::StandardArray.begin(), MAX_ABILITIES, scores.begin());
        break;
    case AbilityScoreMethod::roll: {
        KnuthRng rng(seed);
        scores = AbilityGeneration::roll_ability_scores(rng);
        break;
    }
    case AbilityScoreMethod::quick_test: scores = AbilityGeneration::quick_test_scores(); break;
    case AbilityScoreMethod::manual:
    case AbilityScoreMethod::point_buy: {
        const auto parsed = parse_scores(scores_text);
        if (!parsed) {
            logger.critical("--scores must list six comma separated numbers");
            return 1;
        }
        scores = *parsed;
        break;
    }
    }

    const auto &catalog = core_rules();
    const auto constants = config.rules_constants();
    const CharacterValidator validator(catalog, constants);
    const auto score_map = AbilityGeneration::to_score_map(scores);
    const auto score_check = validator.validate_ability_scores(score_map, *method);
    log_each(logger, spdlog::level::warn, score_check.warnings);
    if (!score_check.valid) {
        log_each(logger, spdlog::level::err, score_check.errors);
        return 1;
    }

    CharacterBuilder builder(catalog, constants);
    try {
        builder.set_name(name);
        builder.set_ability_scores(score_map);
        builder.set_race(race);
        builder.set_ancestry(ancestry);
        // --duty defaults to a warrior's duty, so only pass it on to professions that have duties.
        const auto *chosen_profession = catalog.profession(profession);
        const auto takes_duty = chosen_profession && chosen_profession->requires_duty() && !duty.empty();
        builder.set_profession(profession, takes_duty ? std::optional<std::string_view>(duty) : std::nullopt);
        builder.set_path(path, ignore_prerequisites);
        builder.set_background(background);
        resolve_with_first_options(builder, logger);
    } catch (const RulesError &e) {
        logger.error("{}: {}", magic_enum::enum_name(e.kind()), e.what());
        return 1;
    }
    auto character = builder.build();
    const auto check = validator.validate_character(character);
    log_each(logger, spdlog::level::warn, check.warnings);
    log_each(logger, spdlog::level::err, check.errors);
    fmt::print("{}", builder.summary());

    const AdvancementEngine engine(catalog, constants);
    for (auto i = 0; i < levels; ++i) {
        const auto options = engine.options(character);
        LevelUpRequest request;
        request.talents = choose_talents(options, character);
        if (options.grants_ability_increase) {
            const auto *chosen = catalog.path(character.primary_path_id);
            const auto ability = chosen && chosen->talent_points_attribute ? *chosen->talent_points_attribute
                                                                           : Ability::Might;
            request.ability_increase = {{std::string(to_long_string(ability)), 2}};
        }
        auto levelled = engine.level_up(character, request);
        if (!levelled.ok()) {
            log_each(logger, spdlog::level::err, levelled.validation.errors);
            return 1;
        }
        character = std::move(*levelled.character);
        logger.info("Level {}: HP {}, Defense {}, melee {:+}, ranged {:+}, {} talent(s)", character.level,
                    character.health.max, character.defense.total, character.attack_melee.total,
                    character.attack_ranged.total, character.talents.size());
    }
    return check.valid ? 0 : 1;
}
