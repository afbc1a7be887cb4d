/*************************************************************************/
/*  Realm of Warriors character engine source code                       */
/*  (C) 2026 Realm of Warriors Development Team                          */
/*************************************************************************/
#pragma once

#include <fmt/format.h>

#include <stdexcept>
#include <string>

enum class RulesErrorKind {
    NotFound,
    InvalidInput,
    PrerequisitesNotMet,
    DutyRequired,
    RaceMismatch,
    BudgetExceeded,
    AlreadyPossessed,
    StepOutOfOrder,
    NoPendingChoice,
    WrongCount,
    InvalidOption
};

// Thrown by the character builder when a step or choice can't be applied. The builder validates
// before mutating, so the character is unchanged whenever one of these escapes.
class RulesError : public std::runtime_error {
    RulesErrorKind kind_;

public:
    RulesError(RulesErrorKind kind, const std::string &message) : std::runtime_error(message), kind_(kind) {}
    template <typename... Args>
    RulesError(RulesErrorKind kind, fmt::format_string<Args...> format, Args &&...args)
        : std::runtime_error(fmt::format(format, std::forward<Args>(args)...)), kind_(kind) {}

    [[nodiscard]] RulesErrorKind kind() const noexcept { return kind_; }
};
