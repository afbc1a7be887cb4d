#pragma once

#include <string>
#include <vector>

// A "pick count from options" offer declared by a rules entry. An empty option list means the
// offer is open: any skill, or any language the catalog knows.
struct ChoiceSpec {
    int count{};
    std::vector<std::string> options;
};
