#pragma once

#include "PL/AST.hpp"
#include "PL/Runtime/OrderedSet.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace pl {

/**
 * @brief Index from table name to the rules whose head targets that table
 *
 * Membership uses structural equality, so inserting an identical rule twice
 * is a no-op. A table with no rules left is dropped from the index.
 */
class RuleSet {
public:
    using Rules = OrderedSet<Rule, RuleHash>;

    /**
     * @brief Add rule under table
     * @return true if the set changed
     */
    bool addRule(const std::string& table, const Rule& rule);

    /**
     * @brief Remove rule from table
     * @return true if the set changed
     */
    bool discardRule(const std::string& table, const Rule& rule);

    void clearTable(const std::string& table);
    void clear();

    bool contains(const std::string& table, const Rule& rule) const;
    // True iff table has at least one rule
    bool contains(const std::string& table) const;

    /**
     * @brief Rules stored under table
     *
     * With matchLiteral, only rules whose head could unify with it are
     * returned: constants in the same argument position must agree. Arity is
     * left to the caller.
     */
    std::vector<Rule> getRules(const std::string& table, const Atom* matchLiteral = nullptr) const;

    // Tables with at least one rule, in first-insertion order
    std::vector<std::string> keys() const { return tables_.toVector(); }

    size_t size() const;
    bool empty() const { return tables_.empty(); }

private:
    static bool mayMatch(const Atom& head, const Atom& literal);

    OrderedSet<std::string> tables_;
    std::unordered_map<std::string, Rules> rules_;
};

} // namespace pl
