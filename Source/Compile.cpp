#include "PL/Compile.hpp"
#include "PL/Runtime/RuleTheory.hpp"

#include <sstream>
#include <unordered_set>

namespace pl {

namespace {

bool validName(const std::string& s) { return !s.empty(); }

bool wellFormed(const Atom& a) {
    if (!validName(a.table)) return false;
    if (a.theory && !validName(*a.theory)) return false;
    for (const auto& t : a.arguments) {
        if (const auto* v = std::get_if<Variable>(&t)) {
            if (!validName(v->name)) return false;
        }
    }
    return true;
}

std::unordered_set<std::string> positiveVariables(const Rule& rule) {
    std::unordered_set<std::string> bound;
    for (const auto& lit : rule.body) {
        if (lit.negated) continue;
        for (const auto& v : lit.atom.variables()) bound.insert(v);
    }
    return bound;
}

// Arity of table in the named theory, if that theory is registered and defines it
std::optional<size_t> registeredArity(const TheoryRegistry* theories,
                                      const std::string& theoryName,
                                      const std::string& table) {
    if (theories == nullptr) return std::nullopt;
    auto it = theories->find(theoryName);
    if (it == theories->end() || it->second == nullptr) return std::nullopt;
    return it->second->arity(table);
}

void checkArity(const Atom& atom, const TheoryRegistry* theories, const std::string& theoryName,
                std::vector<PolicyError>& errors) {
    const std::string owner = atom.theory ? *atom.theory : theoryName;
    const auto expected = registeredArity(theories, owner, atom.table);
    if (expected && *expected != atom.arity()) {
        std::ostringstream oss;
        oss << "Arity mismatch for " << atom.qualifiedTable() << ": expected " << *expected
            << " argument(s), found " << atom.arity() << " in " << toString(atom);
        errors.push_back({oss.str(), atom.loc});
    }
}

} // namespace

Rule DatalogCompiler::reorderForSafety(const Formula& formula) const {
    Rule rule = asRule(formula);
    if (rule.body.empty()) return rule;

    std::vector<Literal> ordered;
    std::vector<const Literal*> pending;
    std::unordered_set<std::string> bound;
    ordered.reserve(rule.body.size());

    auto flushReady = [&]() {
        std::vector<const Literal*> waiting;
        for (const Literal* lit : pending) {
            bool ready = true;
            for (const auto& v : lit->atom.variables()) {
                if (!bound.count(v)) { ready = false; break; }
            }
            if (ready) ordered.push_back(*lit);
            else waiting.push_back(lit);
        }
        pending.swap(waiting);
    };

    for (const auto& lit : rule.body) {
        if (lit.negated) pending.push_back(&lit);
    }
    flushReady();
    for (const auto& lit : rule.body) {
        if (lit.negated) continue;
        ordered.push_back(lit);
        for (const auto& v : lit.atom.variables()) bound.insert(v);
        flushReady();
    }

    if (!pending.empty()) {
        std::ostringstream oss;
        oss << "Could not reorder rule for safety: variables in " << toString(*pending.front())
            << " never appear in a positive literal of " << toString(rule);
        throw PolicyException(oss.str());
    }
    rule.body = std::move(ordered);
    return rule;
}

bool DatalogCompiler::isAtom(const Formula& formula) const {
    return std::holds_alternative<Atom>(formula);
}

bool DatalogCompiler::isDatalog(const Formula& formula) const {
    if (const auto* a = std::get_if<Atom>(&formula)) return wellFormed(*a);
    const auto& r = std::get<Rule>(formula);
    if (!wellFormed(r.head)) return false;
    for (const auto& lit : r.body) {
        if (!wellFormed(lit.atom)) return false;
    }
    return true;
}

std::vector<PolicyError> DatalogCompiler::factErrors(const Atom& fact,
                                                     const TheoryRegistry* theories,
                                                     const std::string& theoryName) const {
    std::vector<PolicyError> errors;
    if (fact.theory) {
        errors.push_back({"Fact " + toString(fact) + " may not reference another theory", fact.loc});
    }
    if (!fact.isGround()) {
        errors.push_back({"Fact " + toString(fact) + " contains a variable", fact.loc});
    }
    if (!fact.theory) checkArity(fact, theories, theoryName, errors);
    return errors;
}

std::vector<PolicyError> DatalogCompiler::ruleErrors(const Rule& rule,
                                                     const TheoryRegistry* theories,
                                                     const std::string& theoryName) const {
    std::vector<PolicyError> errors;
    const auto bound = positiveVariables(rule);

    for (const auto& v : rule.head.variables()) {
        if (!bound.count(v)) {
            errors.push_back({"Unsafe rule " + toString(rule) + ": head variable " + v +
                                  " does not appear in a positive body literal",
                              rule.loc});
        }
    }

    for (const auto& lit : rule.body) {
        if (!lit.negated) continue;
        for (const auto& v : lit.atom.variables()) {
            if (!bound.count(v)) {
                errors.push_back({"Unsafe negation in " + toString(rule) + ": variable " + v + " in " +
                                      toString(lit) + " does not appear in a positive body literal",
                                  lit.atom.loc});
            }
        }
    }

    auto headErrors = ruleHeadHasNoTheory(rule, nullptr);
    errors.insert(errors.end(), headErrors.begin(), headErrors.end());

    if (!rule.head.theory) checkArity(rule.head, theories, theoryName, errors);
    for (const auto& lit : rule.body) {
        if (lit.atom.theory && theories != nullptr && !theories->count(*lit.atom.theory)) {
            errors.push_back({"Rule " + toString(rule) + " references unknown theory " + *lit.atom.theory,
                              lit.atom.loc});
            continue;
        }
        checkArity(lit.atom, theories, theoryName, errors);
    }
    return errors;
}

std::vector<PolicyError> DatalogCompiler::ruleHeadHasNoTheory(const Rule& rule,
                                                              const HeadPredicate& permitHead) const {
    if (!rule.head.theory) return {};
    if (permitHead && permitHead(rule.head)) return {};
    return {PolicyError{"Rule head " + toString(rule.head) + " may not reference another theory",
                        rule.head.loc}};
}

} // namespace pl
