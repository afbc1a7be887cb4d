/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "ChoiceSpec.hpp"
#include "Feature.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct Character;

// A specialisation within a profession, e.g. fighter or ranger for a warrior.
struct Duty {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::string> suggested_paths;
    std::vector<std::string> armor_proficiencies;
    std::vector<std::string> weapon_proficiencies;
    std::optional<ChoiceSpec> tool_choices;
    std::optional<ChoiceSpec> skill_choices;
    std::string equipment_pack;
};

struct Profession {
    std::string id;
    std::string name;
    std::string description;
    int base_hp{8};
    std::optional<Feature> feature;

    std::vector<std::string> armor_proficiencies;
    std::vector<std::string> weapon_proficiencies;
    std::vector<std::string> tool_proficiencies;
    std::optional<ChoiceSpec> tool_choices;
    std::optional<ChoiceSpec> skill_choices;
    std::vector<std::string> suggested_paths;
    // When non-empty, exactly one duty must be picked with the profession.
    std::vector<Duty> duties;
    std::string equipment_pack;

    [[nodiscard]] bool requires_duty() const noexcept { return !duties.empty(); }
    [[nodiscard]] const Duty *duty(std::string_view duty_id) const;
    // Applies the profession and, when given, its duty. Choices are queued by the builder.
    void apply(Character &ch, const Duty *duty) const;
};
