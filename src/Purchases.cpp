#include "Purchases.hpp"
#include "Character.hpp"
#include "RulesCatalog.hpp"
#include "string_utils.hpp"

#include <fmt/format.h>
#include <range/v3/algorithm/find_if.hpp>

#include <charconv>
#include <optional>

namespace {

std::optional<int> parse_points(std::string_view text) {
    int value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size() || value < 0)
        return std::nullopt;
    return value;
}

}

CarriedPoints parse_stored_advance(std::string_view text) {
    CarriedPoints points;
    text = trim(text);
    if (const auto bare = parse_points(text)) {
        points.advancement_points = *bare;
        return points;
    }
    while (!text.empty()) {
        const auto comma = text.find(',');
        const auto part = trim(text.substr(0, comma));
        text = comma == std::string_view::npos ? std::string_view{} : text.substr(comma + 1);
        if (part.size() < 3)
            continue;
        const auto value = parse_points(trim(part.substr(2)));
        if (!value)
            continue;
        if (matches(part.substr(0, 2), "TP"))
            points.talent_points = *value;
        else if (matches(part.substr(0, 2), "AP"))
            points.advancement_points = *value;
    }
    return points;
}

std::string format_stored_advance(const CarriedPoints &points) {
    if (points.talent_points == 0 && points.advancement_points == 0)
        return {};
    return fmt::format("TP {}, AP {}", points.talent_points, points.advancement_points);
}

void apply_talent_purchases(Character &ch, const RulesCatalog &catalog, const std::vector<TalentPurchase> &purchases) {
    for (const auto &purchase : purchases) {
        const auto *talent = catalog.talent(purchase.talent_id);
        if (!talent)
            continue;
        auto it = ranges::find_if(ch.talents, [talent](const auto &owned) { return owned.talent_id == talent->id; });
        if (it != ch.talents.end()) {
            it->rank = purchase.new_rank;
            if (!purchase.choice_data.empty())
                it->choice_data = purchase.choice_data;
        } else {
            ch.talents.push_back(CharacterTalent{talent->id, talent->name, purchase.new_rank,
                                                 talent->category == TalentCategory::path ? talent->path_id
                                                                                           : std::string(GeneralPathId),
                                                 purchase.choice_data});
        }
    }
}

void apply_advancement_purchases(Character &ch, const RulesCatalog &catalog,
                                 const std::vector<AdvancementPurchase> &purchases) {
    for (const auto &purchase : purchases) {
        switch (purchase.type) {
        case AdvancementType::skill_rank:
            if (const auto skill = try_parse_skill(purchase.target))
                ch.skills[*skill].rank += 1;
            break;
        case AdvancementType::train_skill:
            if (const auto skill = try_parse_skill(purchase.target))
                ch.skills.train(*skill);
            break;
        case AdvancementType::proficiency: ch.proficiencies.emplace(trim(purchase.target)); break;
        case AdvancementType::language: {
            const auto *known = catalog.language(trim(purchase.target));
            ch.languages.emplace(known ? std::string_view(*known) : trim(purchase.target));
            break;
        }
        }
    }
}
