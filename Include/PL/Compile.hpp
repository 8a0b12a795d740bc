#pragma once

#include "PL/AST.hpp"
#include "PL/PolicyError.hpp"

#include <functional>
#include <map>
#include <string>
#include <vector>

namespace pl {

class RuleTheory;

// Sibling theories by name, used only for cross-theory error checking
using TheoryRegistry = std::map<std::string, const RuleTheory*>;

/**
 * @brief Parser/validator collaborator consumed by rule theories
 *
 * Theories never derive argument safety themselves: they ask the compiler to
 * reorder each rule and report whatever errors come back.
 */
class RuleCompiler {
public:
    using HeadPredicate = std::function<bool(const Atom&)>;

    virtual ~RuleCompiler() = default;

    /**
     * @brief Reorder a rule body so every variable is bound before it is negated
     * @throws PolicyException if no safe ordering exists
     */
    virtual Rule reorderForSafety(const Formula& formula) const = 0;

    virtual bool isAtom(const Formula& formula) const = 0;

    // Well-formedness check: every table and variable has a usable name
    virtual bool isDatalog(const Formula& formula) const = 0;

    virtual std::vector<PolicyError> factErrors(const Atom& fact,
                                                const TheoryRegistry* theories,
                                                const std::string& theoryName) const = 0;

    virtual std::vector<PolicyError> ruleErrors(const Rule& rule,
                                                const TheoryRegistry* theories,
                                                const std::string& theoryName) const = 0;

    // Error unless the head has no theory prefix or permitHead accepts it
    virtual std::vector<PolicyError> ruleHeadHasNoTheory(const Rule& rule,
                                                         const HeadPredicate& permitHead) const = 0;
};

/**
 * @brief Default compiler for plain datalog rules and facts
 */
class DatalogCompiler final : public RuleCompiler {
public:
    Rule reorderForSafety(const Formula& formula) const override;
    bool isAtom(const Formula& formula) const override;
    bool isDatalog(const Formula& formula) const override;
    std::vector<PolicyError> factErrors(const Atom& fact,
                                        const TheoryRegistry* theories,
                                        const std::string& theoryName) const override;
    std::vector<PolicyError> ruleErrors(const Rule& rule,
                                        const TheoryRegistry* theories,
                                        const std::string& theoryName) const override;
    std::vector<PolicyError> ruleHeadHasNoTheory(const Rule& rule,
                                                 const HeadPredicate& permitHead) const override;
};

} // namespace pl
