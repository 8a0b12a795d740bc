#pragma once

#include "PL/AST.hpp"
#include "PL/PolicyError.hpp"

#include <vector>

namespace pl {

class RuleTheory;

/**
 * @brief Validates a changeset against a theory without applying it
 *
 * The one capability that differs between theory flavours; storage and
 * mutation are shared by RuleTheory itself.
 */
class ChangeValidator {
public:
    virtual ~ChangeValidator() = default;

    virtual std::vector<PolicyError> errors(const std::vector<Event>& events,
                                            const RuleTheory& theory) const = 0;
};

/**
 * @brief Full checks: malformed formulas, fact errors and rule errors
 *
 * Recursion is not checked here; the runtime does that on the dependency
 * graph.
 */
class NonrecursiveValidator final : public ChangeValidator {
public:
    std::vector<PolicyError> errors(const std::vector<Event>& events,
                                    const RuleTheory& theory) const override;
};

/**
 * @brief Relaxed checks for action theories
 *
 * Rule heads may name another theory only when they are update tables.
 * Negation safety of rules is not checked.
 */
class ActionValidator final : public ChangeValidator {
public:
    std::vector<PolicyError> errors(const std::vector<Event>& events,
                                    const RuleTheory& theory) const override;
};

// Trusted bulk loading: never reports anything
class UnsafeValidator final : public ChangeValidator {
public:
    std::vector<PolicyError> errors(const std::vector<Event>&,
                                    const RuleTheory&) const override { return {}; }
};

} // namespace pl
