#pragma once

#include "PL/AST.hpp"
#include "PL/Runtime/Graph.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pl {

/**
 * @brief Table dependency graph fed from rules
 *
 * Each rule adds an edge from its head table to every body table, labeled
 * kNegationLabel for negated literals. Nodes are `theory:table` when a
 * theory prefix is present. Bag semantics let the same edge come from
 * several rules.
 */
class RuleDependencyGraph : public BagGraph {
public:
    static constexpr const char* kNegationLabel = "-";

    RuleDependencyGraph() = default;
    explicit RuleDependencyGraph(const std::vector<Rule>& rules);

    void formulaInsert(const Formula& formula);
    // Only for formulas previously passed to formulaInsert()
    void formulaDelete(const Formula& formula);

    // Feed the effective changes returned by RuleTheory::update()
    void apply(const std::vector<Event>& changes);

    bool isRecursive() const { return hasCycle(); }

    // Strata over negated dependencies, std::nullopt when negation is recursive
    std::optional<Stratification> stratify() const;
    bool isStratified() const { return stratify().has_value(); }

    static std::string nodeName(const Atom& atom) { return atom.qualifiedTable(); }
};

} // namespace pl
