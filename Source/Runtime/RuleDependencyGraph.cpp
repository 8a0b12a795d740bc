#include "PL/Runtime/RuleDependencyGraph.hpp"

namespace pl {

namespace {

Graph::Label labelFor(const Literal& lit) {
    if (lit.negated) return std::string(RuleDependencyGraph::kNegationLabel);
    return std::nullopt;
}

} // namespace

RuleDependencyGraph::RuleDependencyGraph(const std::vector<Rule>& rules) {
    for (const auto& r : rules) formulaInsert(r);
}

void RuleDependencyGraph::formulaInsert(const Formula& formula) {
    const Rule rule = asRule(formula);
    const std::string head = nodeName(rule.head);
    addNode(head);
    for (const auto& lit : rule.body) addEdge(head, nodeName(lit.atom), labelFor(lit));
}

void RuleDependencyGraph::formulaDelete(const Formula& formula) {
    const Rule rule = asRule(formula);
    const std::string head = nodeName(rule.head);
    for (const auto& lit : rule.body) deleteEdge(head, nodeName(lit.atom), labelFor(lit));
    deleteNode(head);
}

void RuleDependencyGraph::apply(const std::vector<Event>& changes) {
    for (const auto& event : changes) {
        if (event.insert) formulaInsert(event.formula);
        else formulaDelete(event.formula);
    }
}

std::optional<Graph::Stratification> RuleDependencyGraph::stratify() const {
    return stratification({kNegationLabel});
}

} // namespace pl
