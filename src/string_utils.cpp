#include "string_utils.hpp"

#include <range/v3/algorithm/all_of.hpp>
#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
#include <range/v3/view/zip.hpp>

#include <cctype>

namespace {

bool not_space(char c) { return !std::isspace(static_cast<unsigned char>(c)); }
char to_lower(char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); }

}

std::string_view trim(std::string_view str) {
    const auto begin = std::find_if(str.begin(), str.end(), not_space);
    const auto rit = std::find_if(str.rbegin(), std::make_reverse_iterator(begin), not_space);
    return {begin, static_cast<size_t>(rit.base() - begin)};
}

std::string lower_case(std::string_view str) { return str | ranges::views::transform(to_lower) | ranges::to<std::string>; }

std::string normalize_key(std::string_view str) {
    return str | ranges::views::filter([](char c) { return std::isalnum(static_cast<unsigned char>(c)) != 0; })
           | ranges::views::transform(to_lower) | ranges::to<std::string>;
}

bool has_prefix(std::string_view haystack, std::string_view needle) {
    if (needle.size() > haystack.size())
        return false;
    return needle == haystack.substr(0, needle.size());
}

bool matches(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() != rhs.size())
        return false;
    return ranges::all_of(ranges::views::zip(lhs, rhs),
                          [](auto pr) { return to_lower(pr.first) == to_lower(pr.second); });
}

bool matches_start(std::string_view lhs, std::string_view rhs) {
    if (lhs.size() > rhs.size() || lhs.empty())
        return false;
    return matches(lhs, rhs.substr(0, lhs.size()));
}
