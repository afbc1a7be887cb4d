#pragma once

#include "RulesError.hpp"

#include <string>
#include <vector>

// The outcome of a rules check. errors and error_kinds run in parallel. Warnings are advisory
// and never affect validity.
struct ValidationResult {
    bool valid{true};
    std::vector<std::string> errors;
    std::vector<RulesErrorKind> error_kinds;
    std::vector<std::string> warnings;

    void add_error(RulesErrorKind kind, std::string error);
    void add_warning(std::string warning);
    // Folds another result's errors and warnings into this one.
    void merge(const ValidationResult &other);
    [[nodiscard]] bool has_error(RulesErrorKind kind) const;
    // Throws the first error as a RulesError. Does nothing if valid.
    void throw_if_invalid() const;

    [[nodiscard]] static ValidationResult success() { return {}; }
    [[nodiscard]] static ValidationResult failure(RulesErrorKind kind, std::string error);
};
