#include "PL/Runtime/RuleTheory.hpp"

#include <iterator>
#include <set>
#include <sstream>
#include <unordered_set>

namespace pl {

std::string toString(TheoryKind kind) {
    switch (kind) {
        case TheoryKind::Nonrecursive: return "nonrecursive";
        case TheoryKind::Action: return "action";
    }
    return "unknown";
}

RuleTheory::RuleTheory(TheoryKind kind,
                       std::unique_ptr<ChangeValidator> validator,
                       std::string name,
                       std::string abbr,
                       const TheoryRegistry* theories,
                       std::shared_ptr<const RuleCompiler> compiler)
    : kind_(kind)
    , validator_(std::move(validator))
    , name_(std::move(name))
    , abbr_(std::move(abbr))
    , theories_(theories)
    , compiler_(compiler ? std::move(compiler)
                        : std::shared_ptr<const RuleCompiler>(std::make_shared<DatalogCompiler>()))
{
    if (!validator_) validator_ = std::make_unique<UnsafeValidator>();
}

std::vector<Event> RuleTheory::update(const std::vector<Event>& events) {
    std::vector<Event> changes;
    if (debug_) debugLog("Update " + toString(events));
    try {
        for (const auto& event : events) {
            const Rule rule = compiler_->reorderForSafety(event.formula);
            const bool changed = event.insert ? insertActual(rule) : deleteActual(rule);
            if (changed) changes.push_back(event);
        }
    } catch (const std::exception& e) {
        // Already-applied events stay applied
        if (debug_) debugLog(std::string("update aborted: ") + e.what());
        throw;
    }
    return changes;
}

std::vector<Formula> RuleTheory::insert(const Formula& formula) {
    std::vector<Formula> out;
    for (auto& event : update({Event{formula, true}})) out.push_back(std::move(event.formula));
    return out;
}

std::vector<Formula> RuleTheory::remove(const Formula& formula) {
    std::vector<Formula> out;
    for (auto& event : update({Event{formula, false}})) out.push_back(std::move(event.formula));
    return out;
}

std::vector<PolicyError> RuleTheory::updateWouldCauseErrors(const std::vector<Event>& events) const {
    if (debug_) debugLog("updateWouldCauseErrors " + toString(events));
    return validator_->errors(events, *this);
}

std::vector<Event> RuleTheory::define(const std::vector<Formula>& rules) {
    clear();
    std::vector<Event> events;
    events.reserve(rules.size());
    for (const auto& r : rules) events.push_back(Event{r, true});
    return update(events);
}

void RuleTheory::clear() { rules_.clear(); }

void RuleTheory::clear(const std::vector<std::string>& tablenames, bool invert) {
    if (!invert) {
        for (const auto& table : tablenames) rules_.clearTable(table);
        return;
    }
    const std::unordered_set<std::string> keep(tablenames.begin(), tablenames.end());
    for (const auto& table : rules_.keys()) {
        if (!keep.count(table)) rules_.clearTable(table);
    }
}

void RuleTheory::initializeTables(const std::vector<std::string>& tablenames, const std::vector<Atom>& facts) {
    if (debug_) debugLog("initializeTables");
    std::set<std::string> cleared(tablenames.begin(), tablenames.end());
    for (const auto& table : tablenames) rules_.clearTable(table);

    size_t count = 0;
    for (const auto& fact : facts) {
        if (cleared.insert(fact.table).second) rules_.clearTable(fact.table);
        rules_.addRule(fact.table, asRule(fact));
        ++count;
    }

    if (debug_) {
        std::ostringstream oss;
        oss << "initialized " << cleared.size() << " tables with " << count << " facts";
        debugLog(oss.str());
    }
}

std::vector<Rule> RuleTheory::policy() const {
    std::vector<Rule> out;
    for (auto& rule : content()) {
        if (!rule.isFact()) out.push_back(std::move(rule));
    }
    return out;
}

std::vector<Rule> RuleTheory::content() const { return content(rules_.keys()); }

std::vector<Rule> RuleTheory::content(const std::vector<std::string>& tablenames) const {
    std::vector<Rule> out;
    for (const auto& table : tablenames) {
        auto rules = rules_.getRules(table);
        out.insert(out.end(), std::make_move_iterator(rules.begin()), std::make_move_iterator(rules.end()));
    }
    return out;
}

std::vector<Rule> RuleTheory::headIndex(const std::string& table, const Atom* matchLiteral) const {
    if (!rules_.contains(table)) return {};
    return rules_.getRules(table, matchLiteral);
}

std::optional<size_t> RuleTheory::arity(const std::string& table) const {
    const auto formulas = headIndex(table);
    if (formulas.empty()) return std::nullopt;
    return head(formulas.front()).arity();
}

std::optional<size_t> RuleTheory::getAritySelf(const std::string& table,
                                               const std::optional<std::string>& theory) const {
    for (const auto& rule : rules_.getRules(table)) {
        if (rule.head.theory == theory) return rule.head.arity();
    }
    return std::nullopt;
}

bool RuleTheory::contains(const Formula& formula) const {
    const Atom& h = headOf(formula);
    return rules_.contains(h.table, asRule(formula));
}

bool RuleTheory::insertActual(const Rule& rule) {
    if (debug_) debugLog("Insert: " + toString(rule));
    return rules_.addRule(rule.head.table, rule);
}

bool RuleTheory::deleteActual(const Rule& rule) {
    if (debug_) debugLog("Delete: " + toString(rule));
    return rules_.discardRule(rule.head.table, rule);
}

void RuleTheory::debugLog(const std::string& msg) const {
    if (debug_ && log_stream_ != nullptr) {
        (*log_stream_) << "[RuleTheory" << (name_.empty() ? "" : ":" + name_) << "] " << msg << std::endl;
    }
}

void registerTheory(TheoryRegistry& registry, RuleTheory& theory) {
    registry[theory.name()] = &theory;
    theory.setTheories(&registry);
}

RuleTheory makeNonrecursiveTheory(std::string name, std::string abbr,
                                  const TheoryRegistry* theories,
                                  std::shared_ptr<const RuleCompiler> compiler) {
    return RuleTheory(TheoryKind::Nonrecursive, std::make_unique<NonrecursiveValidator>(),
                      std::move(name), std::move(abbr), theories, std::move(compiler));
}

RuleTheory makeActionTheory(std::string name, std::string abbr,
                            const TheoryRegistry* theories,
                            std::shared_ptr<const RuleCompiler> compiler) {
    return RuleTheory(TheoryKind::Action, std::make_unique<ActionValidator>(),
                      std::move(name), std::move(abbr), theories, std::move(compiler));
}

RuleTheory makeUnsafeTheory(std::string name, std::string abbr,
                            const TheoryRegistry* theories,
                            std::shared_ptr<const RuleCompiler> compiler) {
    return RuleTheory(TheoryKind::Nonrecursive, std::make_unique<UnsafeValidator>(),
                      std::move(name), std::move(abbr), theories, std::move(compiler));
}

} // namespace pl
