/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "RulesEntry.hpp"

#include <string>
#include <string_view>
#include <vector>

// The immutable rules data: races, ancestries, professions, paths, backgrounds and talents,
// plus the list of languages a character may learn. Build it once and pass it by reference to
// whatever needs it.
//
// Lookups take an id, but also accept an entry's display name or any spelling that normalizes
// to the same key ("Mystic", "mystic"). They return nullptr when nothing matches.
class RulesCatalog {
public:
    // Throws std::invalid_argument for duplicate ids, talents with gaps in their rank text,
    // ancestries of unknown races, and path talents of unknown paths.
    RulesCatalog(std::vector<RulesEntry> entries, std::vector<std::string> languages);

    [[nodiscard]] const Race *race(std::string_view id) const;
    [[nodiscard]] const Ancestry *ancestry(std::string_view id) const;
    [[nodiscard]] const Profession *profession(std::string_view id) const;
    [[nodiscard]] const Path *path(std::string_view id) const;
    [[nodiscard]] const Background *background(std::string_view id) const;
    [[nodiscard]] const Talent *talent(std::string_view id) const;

    [[nodiscard]] const std::vector<Race> &races() const noexcept { return races_; }
    [[nodiscard]] const std::vector<Ancestry> &ancestries() const noexcept { return ancestries_; }
    [[nodiscard]] const std::vector<Profession> &professions() const noexcept { return professions_; }
    [[nodiscard]] const std::vector<Path> &paths() const noexcept { return paths_; }
    [[nodiscard]] const std::vector<Background> &backgrounds() const noexcept { return backgrounds_; }
    [[nodiscard]] const std::vector<Talent> &talents() const noexcept { return talents_; }
    [[nodiscard]] const std::vector<std::string> &languages() const noexcept { return languages_; }

    [[nodiscard]] std::vector<const Ancestry *> ancestries_for_race(std::string_view race_id) const;
    [[nodiscard]] std::vector<const Talent *> talents_for_path(std::string_view path_id) const;
    [[nodiscard]] std::vector<const Talent *> general_talents() const;
    [[nodiscard]] const Talent *primary_talent(std::string_view path_id) const;
    [[nodiscard]] const Talent *capstone(std::string_view path_id) const;
    // The catalog's spelling of a language, matched case insensitively.
    [[nodiscard]] const std::string *language(std::string_view language) const;
    [[nodiscard]] bool is_language(std::string_view language) const { return this->language(language) != nullptr; }

    [[nodiscard]] size_t size(RulesKind kind) const noexcept;

private:
    void check_consistency() const;

    std::vector<Race> races_;
    std::vector<Ancestry> ancestries_;
    std::vector<Profession> professions_;
    std::vector<Path> paths_;
    std::vector<Background> backgrounds_;
    std::vector<Talent> talents_;
    std::vector<std::string> languages_;
};
