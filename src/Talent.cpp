#include "Talent.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <range/v3/algorithm/any_of.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/map.hpp>
#include <range/v3/view/transform.hpp>

std::vector<std::string> TalentPrerequisites::check(const AbilityScores &scores, int level,
                                                    const std::map<std::string, int> &owned,
                                                    int target_rank) const {
    std::vector<std::string> failures;
    if (!abilities.empty()) {
        if (logic == PrerequisiteLogic::any_of) {
            const auto meets_any = ranges::any_of(
                abilities, [&scores](const auto &req) { return scores.total(req.first) >= req.second; });
            if (!meets_any) {
                const auto names =
                    abilities | ranges::views::keys | ranges::views::transform(to_long_string)
                    | ranges::to<std::vector<std::string_view>>;
                failures.push_back(
                    fmt::format("Need {}+ in one of: {}", abilities.begin()->second, fmt::join(names, ", ")));
            }
        } else {
            for (const auto &[ability, minimum] : abilities)
                if (const auto score = scores.total(ability); score < minimum)
                    failures.push_back(fmt::format("Need {} {}+, have {}", to_long_string(ability), minimum, score));
        }
    }
    if (auto it = level_by_rank.find(target_rank); it != level_by_rank.end() && level < it->second)
        failures.push_back(fmt::format("Rank {} requires level {}", target_rank, it->second));
    for (const auto &talent_id : required_talents)
        if (!owned.contains(talent_id))
            failures.push_back(fmt::format("Requires talent: {}", talent_id));
    return failures;
}

std::string Talent::rank_description(int rank) const {
    auto it = ranks.find(rank);
    return it != ranks.end() ? it->second : std::string{};
}

std::string Talent::cumulative_description(int up_to_rank) const {
    std::vector<std::string> lines;
    for (auto rank = 1; rank <= up_to_rank; ++rank)
        if (auto it = ranks.find(rank); it != ranks.end())
            lines.push_back(fmt::format("Rank {}: {}", rank, it->second));
    return fmt::format("{}", fmt::join(lines, "\n"));
}

bool Talent::has_dense_ranks() const {
    if (max_rank < 1 || static_cast<int>(ranks.size()) != max_rank)
        return false;
    for (auto rank = 1; rank <= max_rank; ++rank)
        if (!ranks.contains(rank))
            return false;
    return true;
}
