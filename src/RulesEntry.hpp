#pragma once

#include "Ancestry.hpp"
#include "Background.hpp"
#include "Path.hpp"
#include "Profession.hpp"
#include "Race.hpp"
#include "Talent.hpp"

#include <string>
#include <variant>

enum class RulesKind { race, ancestry, profession, path, background, talent };

// Any one record of the rules catalog.
using RulesEntry = std::variant<Race, Ancestry, Profession, Path, Background, Talent>;

[[nodiscard]] inline RulesKind kind_of(const RulesEntry &entry) { return static_cast<RulesKind>(entry.index()); }
[[nodiscard]] inline const std::string &id_of(const RulesEntry &entry) {
    return std::visit([](const auto &e) -> const std::string & { return e.id; }, entry);
}
[[nodiscard]] inline const std::string &name_of(const RulesEntry &entry) {
    return std::visit([](const auto &e) -> const std::string & { return e.name; }, entry);
}
