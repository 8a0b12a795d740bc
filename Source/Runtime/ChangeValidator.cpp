#include "PL/Runtime/ChangeValidator.hpp"
#include "PL/Runtime/RuleTheory.hpp"

#include <iterator>

namespace pl {

namespace {

PolicyError nonFormula(const Formula& formula) {
    return PolicyError{"Non-formula found: " + toString(formula), headOf(formula).loc};
}

void append(std::vector<PolicyError>& into, std::vector<PolicyError> more) {
    into.insert(into.end(), std::make_move_iterator(more.begin()), std::make_move_iterator(more.end()));
}

} // namespace

std::vector<PolicyError> NonrecursiveValidator::errors(const std::vector<Event>& events,
                                                       const RuleTheory& theory) const {
    const RuleCompiler& compiler = theory.compiler();
    std::vector<PolicyError> errors;
    for (const auto& event : events) {
        if (!compiler.isDatalog(event.formula)) {
            errors.push_back(nonFormula(event.formula));
        } else if (compiler.isAtom(event.formula)) {
            append(errors, compiler.factErrors(std::get<Atom>(event.formula), theory.theories(), theory.name()));
        } else {
            append(errors, compiler.ruleErrors(std::get<Rule>(event.formula), theory.theories(), theory.name()));
        }
    }
    return errors;
}

std::vector<PolicyError> ActionValidator::errors(const std::vector<Event>& events,
                                                 const RuleTheory& theory) const {
    const RuleCompiler& compiler = theory.compiler();
    std::vector<PolicyError> errors;
    for (const auto& event : events) {
        if (!compiler.isDatalog(event.formula)) {
            errors.push_back(nonFormula(event.formula));
        } else if (compiler.isAtom(event.formula)) {
            append(errors, compiler.factErrors(std::get<Atom>(event.formula), theory.theories(), theory.name()));
        } else {
            // negation safety is not checked for action rules
            append(errors, compiler.ruleHeadHasNoTheory(std::get<Rule>(event.formula),
                                                        [](const Atom& head) { return head.isUpdate(); }));
        }
    }
    return errors;
}

} // namespace pl
