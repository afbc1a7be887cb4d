#include "Background.hpp"
#include "Character.hpp"

#include <fmt/format.h>

std::string PersonalityEntry::option() const { return fmt::format("{}: {}", roll, text); }

void Background::apply(Character &ch) const {
    for (auto skill : skill_proficiencies)
        ch.skills.train(skill);
    ch.proficiencies.insert(tool_proficiencies.begin(), tool_proficiencies.end());
    if (feature)
        ch.add_feature(fmt::format("{} ({})", feature->name, name), feature->text);
    ch.background_id = id;
    ch.background = name;
}
