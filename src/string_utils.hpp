#pragma once

#include <string>
#include <string_view>

// Trims leading and trailing whitespace, referencing the original string.
[[nodiscard]] std::string_view trim(std::string_view str);

// Returns the string, lower-cased.
[[nodiscard]] std::string lower_case(std::string_view str);

// Lower-cases and drops everything that isn't a letter or digit, so "Sleight of Hand" and
// "sleight_of_hand" produce the same key.
[[nodiscard]] std::string normalize_key(std::string_view str);

// Returns true iff the second string is a prefix of the first (or the two strings are
// identical).
[[nodiscard]] bool has_prefix(std::string_view haystack, std::string_view needle);

// Compares two strings: are they referring to the same thing. That currently means "case insensitive comparison".
[[nodiscard]] bool matches(std::string_view lhs, std::string_view rhs);

// Similar to matches() but checks if rhs starts with lhs, case insensitively.
// lhs must be at least one character long and must not be longer than rhs.
[[nodiscard]] bool matches_start(std::string_view lhs, std::string_view rhs);
