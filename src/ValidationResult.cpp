#include "ValidationResult.hpp"

#include <range/v3/algorithm/find.hpp>

void ValidationResult::add_error(RulesErrorKind kind, std::string error) {
    errors.emplace_back(std::move(error));
    error_kinds.push_back(kind);
    valid = false;
}

void ValidationResult::add_warning(std::string warning) { warnings.emplace_back(std::move(warning)); }

void ValidationResult::merge(const ValidationResult &other) {
    errors.insert(errors.end(), other.errors.begin(), other.errors.end());
    error_kinds.insert(error_kinds.end(), other.error_kinds.begin(), other.error_kinds.end());
    warnings.insert(warnings.end(), other.warnings.begin(), other.warnings.end());
    valid = valid && other.valid;
}

bool ValidationResult::has_error(RulesErrorKind kind) const { return ranges::find(error_kinds, kind) != error_kinds.end(); }

void ValidationResult::throw_if_invalid() const {
    if (!valid && !errors.empty())
        throw RulesError(error_kinds.front(), errors.front());
}

ValidationResult ValidationResult::failure(RulesErrorKind kind, std::string error) {
    ValidationResult result;
    result.add_error(kind, std::move(error));
    return result;
}
