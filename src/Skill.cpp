#include "Skill.hpp"

#include "string_utils.hpp"

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>

namespace {

using namespace std::literals;

constexpr std::array<SkillInfo, MAX_SKILLS> skills = {{
    // clang-format off
    {Skill::Acrobatics, "Acrobatics"sv, Ability::Agility},
    {Skill::AnimalHandling, "Animal Handling"sv, Ability::Wisdom},
    {Skill::Appraisal, "Appraisal"sv, Ability::Intellect},
    {Skill::Arcana, "Arcana"sv, Ability::Intellect},
    {Skill::Athletics, "Athletics"sv, Ability::Might},
    {Skill::Crafting, "Crafting"sv, Ability::Intellect},
    {Skill::Deception, "Deception"sv, Ability::Charisma},
    {Skill::Diplomacy, "Diplomacy"sv, Ability::Charisma},
    {Skill::History, "History"sv, Ability::Intellect},
    {Skill::Insight, "Insight"sv, Ability::Wisdom},
    {Skill::Intimidation, "Intimidation"sv, Ability::Charisma},
    {Skill::Investigation, "Investigation"sv, Ability::Intellect},
    {Skill::Medicine, "Medicine"sv, Ability::Wisdom},
    {Skill::Nature, "Nature"sv, Ability::Intellect},
    {Skill::Perception, "Perception"sv, Ability::Wisdom},
    {Skill::Performance, "Performance"sv, Ability::Charisma},
    {Skill::Persuasion, "Persuasion"sv, Ability::Charisma},
    {Skill::SleightOfHand, "Sleight of Hand"sv, Ability::Agility},
    {Skill::Stealth, "Stealth"sv, Ability::Agility},
    {Skill::Streetwise, "Streetwise"sv, Ability::Charisma},
    {Skill::Survival, "Survival"sv, Ability::Wisdom},
    // clang-format on
}};

struct SkillAlias {
    std::string_view alias;
    Skill skill;
};

constexpr std::array<SkillAlias, 2> aliases = {{
    {"Slight of Hand"sv, Skill::SleightOfHand},
    {"Desception"sv, Skill::Deception},
}};

}

const SkillInfo &skill_info(Skill skill) { return skills[static_cast<size_t>(skill)]; }

const std::array<SkillInfo, MAX_SKILLS> &skill_table() { return skills; }

std::vector<std::string> skill_names() {
    return skills | ranges::views::transform([](const auto &info) { return std::string(info.name); })
           | ranges::to<std::vector<std::string>>;
}

std::optional<Skill> try_parse_skill(std::string_view skill_name) {
    const auto name_matches = [&skill_name](const auto &info) { return matches(skill_name, info.name); };
    if (const auto it = ranges::find_if(skills, name_matches); it != skills.end())
        return it->skill;
    const auto alias_matches = [&skill_name](const auto &alias) { return matches(skill_name, alias.alias); };
    if (const auto it = ranges::find_if(aliases, alias_matches); it != aliases.end())
        return it->skill;
    return std::nullopt;
}

std::vector<Skill> SkillEntries::trained() const {
    return skills | ranges::views::filter([this](const auto &info) { return is_trained(info.skill); })
           | ranges::views::transform(&SkillInfo::skill) | ranges::to<std::vector<Skill>>;
}
