#include "PL/Runtime/RuleSet.hpp"

#include <algorithm>

namespace pl {

bool RuleSet::addRule(const std::string& table, const Rule& rule) {
    auto it = rules_.find(table);
    if (it == rules_.end()) {
        it = rules_.emplace(table, Rules{}).first;
        tables_.insert(table);
    }
    return it->second.insert(rule);
}

bool RuleSet::discardRule(const std::string& table, const Rule& rule) {
    auto it = rules_.find(table);
    if (it == rules_.end()) return false;
    const bool changed = it->second.erase(rule);
    if (it->second.empty()) {
        rules_.erase(it);
        tables_.erase(table);
    }
    return changed;
}

void RuleSet::clearTable(const std::string& table) {
    rules_.erase(table);
    tables_.erase(table);
}

void RuleSet::clear() {
    rules_.clear();
    tables_.clear();
}

bool RuleSet::contains(const std::string& table, const Rule& rule) const {
    auto it = rules_.find(table);
    return it != rules_.end() && it->second.contains(rule);
}

bool RuleSet::contains(const std::string& table) const { return tables_.contains(table); }

bool RuleSet::mayMatch(const Atom& head, const Atom& literal) {
    const size_t n = std::min(head.arguments.size(), literal.arguments.size());
    for (size_t i = 0; i < n; ++i) {
        const auto* a = std::get_if<Constant>(&head.arguments[i]);
        const auto* b = std::get_if<Constant>(&literal.arguments[i]);
        if (a && b && !(*a == *b)) return false;
    }
    return true;
}

std::vector<Rule> RuleSet::getRules(const std::string& table, const Atom* matchLiteral) const {
    auto it = rules_.find(table);
    if (it == rules_.end()) return {};
    if (matchLiteral == nullptr) return it->second.toVector();
    std::vector<Rule> out;
    for (const auto& rule : it->second) {
        if (mayMatch(rule.head, *matchLiteral)) out.push_back(rule);
    }
    return out;
}

size_t RuleSet::size() const {
    size_t total = 0;
    for (const auto& [table, rules] : rules_) total += rules.size();
    return total;
}

} // namespace pl
