#pragma once

#include "RulesCatalog.hpp"

// The core rulebook: three races with their ancestries, two professions, three paths, two
// backgrounds and their talents. Built once, on first use.
[[nodiscard]] const RulesCatalog &core_rules();

// The same data as loose entries, for building catalogs that extend or replace parts of it.
[[nodiscard]] std::vector<RulesEntry> core_rules_entries();
[[nodiscard]] std::vector<std::string> core_languages();
