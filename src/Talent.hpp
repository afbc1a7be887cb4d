/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include "Ability.hpp"

#include <map>
#include <string>
#include <vector>

enum class PrerequisiteLogic { all_of, any_of };

struct TalentPrerequisites {
    std::map<Ability, int> abilities;
    PrerequisiteLogic logic{PrerequisiteLogic::all_of};
    // Character level needed before buying a given rank.
    std::map<int, int> level_by_rank;
    std::vector<std::string> required_talents;
    // Needs every other talent of the same path. Checked by the validator, which knows the path.
    bool all_path_talents{};

    // Returns a reason for each unmet prerequisite; empty means the rank may be bought.
    [[nodiscard]] std::vector<std::string> check(const AbilityScores &scores, int level,
                                                 const std::map<std::string, int> &owned, int target_rank) const;
};

enum class TalentCategory { general, path };

struct Talent {
    std::string id;
    std::string name;
    std::string description;
    int max_rank{3};
    std::map<int, std::string> ranks; // dense from 1 to max_rank
    TalentPrerequisites prerequisites;
    TalentCategory category{TalentCategory::general};
    std::string path_id;
    bool is_primary{};
    bool is_capstone{};
    bool requires_choice{};
    std::string choice_type;
    std::vector<std::string> choice_options;
    std::string weapon_requirement;

    [[nodiscard]] std::string rank_description(int rank) const;
    // "Rank 1: ...\nRank 2: ..." up to and including the given rank.
    [[nodiscard]] std::string cumulative_description(int up_to_rank) const;
    [[nodiscard]] bool has_dense_ranks() const;

    // Buying rank N costs N talent points.
    [[nodiscard]] static constexpr int tp_cost(int from_rank, int to_rank) noexcept {
        auto total = 0;
        for (auto rank = from_rank + 1; rank <= to_rank; ++rank)
            total += rank;
        return total;
    }
};
