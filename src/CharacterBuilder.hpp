/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Character.hpp"
#include "CharacterValidator.hpp"
#include "Logging.hpp"
#include "PendingChoice.hpp"
#include "Purchases.hpp"
#include "RulesConstants.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class RulesCatalog;
struct Ancestry;
struct Background;
struct Path;
struct Race;

// Creation steps, in the order they must be taken. snake_case as these are wire names.
enum class BuilderStep { ability_scores, race, ancestry, profession, path, background, complete };

struct PathAvailability {
    const Path *path;
    bool prerequisites_met;
};

// Walks a new character through creation one step at a time, applying each rules entry and
// queueing the choices it leaves open.
//
// A step may be taken once every earlier step has been. Revisiting an earlier step is allowed
// and rewinds the current step to just after it, but effects already applied stay applied:
// choosing a second race adds its bonuses on top of the first.
//
// Every operation validates before it mutates and reports failure by throwing RulesError, so
// a failed call leaves the character as it was.
class CharacterBuilder {
public:
    explicit CharacterBuilder(const RulesCatalog &catalog, RulesConstants constants = {});

    void set_name(std::string name);
    // Keys are ability names, long or short. Abilities not mentioned keep their current score.
    void set_ability_scores(const std::map<std::string, int> &values);
    void set_race(std::string_view race_id);
    void set_ancestry(std::string_view ancestry_id);
    void set_profession(std::string_view profession_id, std::optional<std::string_view> duty_id = std::nullopt);
    // Every path with whether the current ability totals qualify for it as a primary path.
    [[nodiscard]] std::vector<PathAvailability> available_paths() const;
    void set_path(std::string_view path_id, bool ignore_prerequisites = false);
    void set_background(std::string_view background_id);
    // Spends the first level's talent points. Allowed once, after the path is chosen.
    void purchase_starting_talents(const std::vector<TalentPurchase> &purchases);
    // Resolves the first queued choice of the type (and source, when given).
    void resolve_choice(ChoiceType type, const std::vector<std::string> &selections,
                        std::optional<std::string_view> source = std::nullopt);
    [[nodiscard]] bool is_complete() const noexcept;
    void recalculate_all();

    [[nodiscard]] const Character &character() const noexcept { return character_; }
    // A recalculated copy of the character.
    [[nodiscard]] Character build() const;
    [[nodiscard]] BuilderStep current_step() const noexcept { return step_; }
    [[nodiscard]] const std::vector<PendingChoice> &pending_choices() const noexcept { return pending_; }
    [[nodiscard]] const std::vector<Race> &available_races() const;
    // Ancestries of the chosen race; empty until a race is chosen.
    [[nodiscard]] std::vector<const Ancestry *> available_ancestries() const;
    [[nodiscard]] const std::vector<Profession> &available_professions() const;
    [[nodiscard]] const std::vector<Background> &available_backgrounds() const;
    [[nodiscard]] int starting_talent_points() const;
    [[nodiscard]] bool starting_talents_purchased() const noexcept { return starting_talents_purchased_; }
    [[nodiscard]] std::string summary() const;

private:
    void require_step(BuilderStep step) const;
    void advance_past(BuilderStep step);
    void queue(ChoiceType type, int count, std::vector<std::string> options, std::string source);
    void queue_personality(ChoiceType type, const std::vector<PersonalityEntry> &table, std::string_view source);
    [[nodiscard]] std::vector<std::string> unknown_languages(const std::vector<std::string> &options) const;
    void apply_choice(const PendingChoice &choice, const std::vector<std::string> &selections);
    void apply_personality(ChoiceType type, const std::string &selection);

    const RulesCatalog &catalog_;
    RulesConstants constants_;
    CharacterValidator validator_;
    Logger logger_;
    Character character_;
    BuilderStep step_{BuilderStep::ability_scores};
    std::vector<PendingChoice> pending_;
    const Background *background_{};
    bool starting_talents_purchased_{};
};
