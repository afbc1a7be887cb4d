#pragma once

#include <string>

// A named narrative ability shown on the character sheet.
struct Feature {
    std::string name;
    std::string text;

    bool operator==(const Feature &rhs) const = default;
};
