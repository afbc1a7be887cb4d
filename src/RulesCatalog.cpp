/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#include "RulesCatalog.hpp"
#include "Logging.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <magic_enum.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/addressof.hpp>
#include <range/v3/view/filter.hpp>

#include <set>
#include <stdexcept>

namespace {

template <typename Entry>
const Entry *find_entry(const std::vector<Entry> &entries, std::string_view id) {
    if (auto it = ranges::find_if(entries, [&id](const Entry &e) { return e.id == id; }); it != entries.end())
        return &*it;
    const auto key = normalize_key(id);
    if (key.empty())
        return nullptr;
    auto it = ranges::find_if(
        entries, [&key](const Entry &e) { return normalize_key(e.id) == key || normalize_key(e.name) == key; });
    return it != entries.end() ? &*it : nullptr;
}

template <typename Entry>
void check_unique_ids(const std::vector<Entry> &entries, RulesKind kind) {
    std::set<std::string> seen;
    for (const auto &entry : entries) {
        if (entry.id.empty())
            throw std::invalid_argument(fmt::format("A {} entry named '{}' has no id", magic_enum::enum_name(kind),
                                                    entry.name));
        if (!seen.insert(entry.id).second)
            throw std::invalid_argument(fmt::format("Duplicate {} id '{}'", magic_enum::enum_name(kind), entry.id));
    }
}

}

RulesCatalog::RulesCatalog(std::vector<RulesEntry> entries, std::vector<std::string> languages)
    : languages_(std::move(languages)) {
    auto logger = logger_for("catalog");
    for (auto &entry : entries) {
        logger.trace("Loading {} '{}' ({})", magic_enum::enum_name(kind_of(entry)), name_of(entry), id_of(entry));
        std::visit(
            [this](auto &&e) {
                using T = std::decay_t<decltype(e)>;
                if constexpr (std::is_same_v<T, Race>)
                    races_.emplace_back(std::move(e));
                else if constexpr (std::is_same_v<T, Ancestry>)
                    ancestries_.emplace_back(std::move(e));
                else if constexpr (std::is_same_v<T, Profession>)
                    professions_.emplace_back(std::move(e));
                else if constexpr (std::is_same_v<T, Path>)
                    paths_.emplace_back(std::move(e));
                else if constexpr (std::is_same_v<T, Background>)
                    backgrounds_.emplace_back(std::move(e));
                else
                    talents_.emplace_back(std::move(e));
            },
            entry);
    }
    check_consistency();
    logger.debug("Loaded {} races, {} ancestries, {} professions, {} paths, {} backgrounds, {} talents, {} languages",
                 races_.size(), ancestries_.size(), professions_.size(), paths_.size(), backgrounds_.size(),
                 talents_.size(), languages_.size());
}

void RulesCatalog::check_consistency() const {
    check_unique_ids(races_, RulesKind::race);
    check_unique_ids(ancestries_, RulesKind::ancestry);
    check_unique_ids(professions_, RulesKind::profession);
    check_unique_ids(paths_, RulesKind::path);
    check_unique_ids(backgrounds_, RulesKind::background);
    check_unique_ids(talents_, RulesKind::talent);
    for (const auto &ancestry : ancestries_)
        if (!race(ancestry.race_id))
            throw std::invalid_argument(
                fmt::format("Ancestry '{}' belongs to unknown race '{}'", ancestry.id, ancestry.race_id));
    for (const auto &talent : talents_) {
        if (!talent.has_dense_ranks())
            throw std::invalid_argument(
                fmt::format("Talent '{}' must describe every rank from 1 to {}", talent.id, talent.max_rank));
        if (talent.category == TalentCategory::path && !path(talent.path_id))
            throw std::invalid_argument(
                fmt::format("Talent '{}' belongs to unknown path '{}'", talent.id, talent.path_id));
    }
    for (const auto &path : paths_)
        for (const auto &talent_id : path.talents)
            if (!talent(talent_id))
                throw std::invalid_argument(fmt::format("Path '{}' lists unknown talent '{}'", path.id, talent_id));
}

const Race *RulesCatalog::race(std::string_view id) const { return find_entry(races_, id); }
const Ancestry *RulesCatalog::ancestry(std::string_view id) const { return find_entry(ancestries_, id); }
const Profession *RulesCatalog::profession(std::string_view id) const { return find_entry(professions_, id); }
const Path *RulesCatalog::path(std::string_view id) const { return find_entry(paths_, id); }
const Background *RulesCatalog::background(std::string_view id) const { return find_entry(backgrounds_, id); }
const Talent *RulesCatalog::talent(std::string_view id) const { return find_entry(talents_, id); }

std::vector<const Ancestry *> RulesCatalog::ancestries_for_race(std::string_view race_id) const {
    return ancestries_ | ranges::views::filter([&race_id](const Ancestry &a) { return a.belongs_to(race_id); })
           | ranges::views::addressof | ranges::to<std::vector<const Ancestry *>>;
}

std::vector<const Talent *> RulesCatalog::talents_for_path(std::string_view path_id) const {
    return talents_ | ranges::views::filter([&path_id](const Talent &t) {
               return t.category == TalentCategory::path && t.path_id == path_id;
           })
           | ranges::views::addressof | ranges::to<std::vector<const Talent *>>;
}

std::vector<const Talent *> RulesCatalog::general_talents() const {
    return talents_ | ranges::views::filter([](const Talent &t) { return t.category == TalentCategory::general; })
           | ranges::views::addressof | ranges::to<std::vector<const Talent *>>;
}

const Talent *RulesCatalog::primary_talent(std::string_view path_id) const {
    for (const auto *talent : talents_for_path(path_id))
        if (talent->is_primary)
            return talent;
    return nullptr;
}

const Talent *RulesCatalog::capstone(std::string_view path_id) const {
    for (const auto *talent : talents_for_path(path_id))
        if (talent->is_capstone)
            return talent;
    return nullptr;
}

const std::string *RulesCatalog::language(std::string_view language) const {
    auto it = ranges::find_if(languages_, [&language](const auto &l) { return matches(l, language); });
    return it != languages_.end() ? &*it : nullptr;
}

size_t RulesCatalog::size(RulesKind kind) const noexcept {
    switch (kind) {
    case RulesKind::race: return races_.size();
    case RulesKind::ancestry: return ancestries_.size();
    case RulesKind::profession: return professions_.size();
    case RulesKind::path: return paths_.size();
    case RulesKind::background: return backgrounds_.size();
    case RulesKind::talent: return talents_.size();
    }
    return 0;
}
