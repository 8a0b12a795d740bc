#pragma once

#include "PL/AST.hpp"
#include "PL/Compile.hpp"
#include "PL/PolicyError.hpp"
#include "PL/Runtime/ChangeValidator.hpp"
#include "PL/Runtime/RuleSet.hpp"

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pl {

enum class TheoryKind { Nonrecursive, Action };

std::string toString(TheoryKind kind);

/**
 * @brief Transactional, table-indexed store of rules and facts
 *
 * Handles:
 * - Insert/delete changesets, reporting the events that changed anything
 * - Advisory validation of changesets (delegated to a ChangeValidator)
 * - Bulk (re)initialization of tables from a fact stream
 * - The lookup contract used by a top-down evaluator
 *   (headIndex, head, body, arity)
 *
 * Calls must be serialized by the caller; nothing here locks.
 */
class RuleTheory {
public:
    /**
     * @brief Construct an empty theory
     * @param kind Theory kind tag
     * @param validator Changeset validation policy
     * @param name Theory name, used for cross-theory checks and logging
     * @param abbr Optional abbreviation
     * @param theories Sibling theories (not owned, may be null)
     * @param compiler Parser/validator collaborator (defaults to DatalogCompiler)
     */
    RuleTheory(TheoryKind kind,
               std::unique_ptr<ChangeValidator> validator,
               std::string name = {},
               std::string abbr = {},
               const TheoryRegistry* theories = nullptr,
               std::shared_ptr<const RuleCompiler> compiler = nullptr);

    const std::string& name() const { return name_; }
    const std::string& abbr() const { return abbr_; }
    TheoryKind kind() const { return kind_; }

    const TheoryRegistry* theories() const { return theories_; }
    void setTheories(const TheoryRegistry* theories) { theories_ = theories; }

    const RuleCompiler& compiler() const { return *compiler_; }

    /**
     * @brief Apply a changeset
     * @return The events that actually changed the theory, in order
     *
     * Each formula is first reordered for safety by the compiler. An
     * exception aborts the rest of the batch and propagates; events applied
     * before it stay applied.
     */
    std::vector<Event> update(const std::vector<Event>& events);

    // Single-event wrappers over update(); return the changed formulas
    std::vector<Formula> insert(const Formula& formula);
    std::vector<Formula> remove(const Formula& formula);

    /**
     * @brief Errors the changeset would cause; nothing is modified
     */
    std::vector<PolicyError> updateWouldCauseErrors(const std::vector<Event>& events) const;

    /**
     * @brief Replace the whole content with rules (one insert batch)
     */
    std::vector<Event> define(const std::vector<Formula>& rules);

    // Remove every rule
    void clear();

    /**
     * @brief Remove the rules defining tablenames
     * @param invert Remove every table except tablenames instead
     */
    void clear(const std::vector<std::string>& tablenames, bool invert = false);

    /**
     * @brief Clear tablenames, then insert facts
     *
     * A fact whose table was not cleared yet clears that table first.
     */
    void initializeTables(const std::vector<std::string>& tablenames, const std::vector<Atom>& facts);

    // Every stored rule except facts
    std::vector<Rule> policy() const;

    std::vector<Rule> content() const;
    std::vector<Rule> content(const std::vector<std::string>& tablenames) const;

    std::vector<std::string> definedTablenames() const { return rules_.keys(); }

    /**
     * @brief Rules relevant when a literal on table is on top of the evaluation stack
     * @return Empty if table is not defined here
     */
    std::vector<Rule> headIndex(const std::string& table, const Atom* matchLiteral = nullptr) const;

    /**
     * @brief Number of arguments table takes
     *
     * Read from one stored rule; rules of one table are assumed (not
     * checked) to agree.
     */
    std::optional<size_t> arity(const std::string& table) const;

    // Like arity(), but only from rules whose head theory prefix equals theory
    std::optional<size_t> getAritySelf(const std::string& table,
                                       const std::optional<std::string>& theory) const;

    static const Atom& head(const Rule& rule) { return rule.head; }
    static const std::vector<Literal>& body(const Rule& rule) { return rule.body; }

    // Membership by head table and structure
    bool contains(const Formula& formula) const;

    size_t size() const { return rules_.size(); }

    void setDebug(bool enabled) { debug_ = enabled; }
    bool debug() const { return debug_; }
    void setLogStream(std::ostream* out) { log_stream_ = out; }

private:
    bool insertActual(const Rule& rule);
    bool deleteActual(const Rule& rule);

    void debugLog(const std::string& msg) const;

    RuleSet rules_;
    TheoryKind kind_;
    std::unique_ptr<ChangeValidator> validator_;
    std::string name_;
    std::string abbr_;
    const TheoryRegistry* theories_{nullptr};
    std::shared_ptr<const RuleCompiler> compiler_;
    std::ostream* log_stream_{&std::cerr};
    bool debug_{false};
};

// Add theory to registry under its name and point the theory at registry
void registerTheory(TheoryRegistry& registry, RuleTheory& theory);

// Nonrecursive theory with full validation
RuleTheory makeNonrecursiveTheory(std::string name = {}, std::string abbr = {},
                                  const TheoryRegistry* theories = nullptr,
                                  std::shared_ptr<const RuleCompiler> compiler = nullptr);

// Action theory with relaxed validation
RuleTheory makeActionTheory(std::string name = {}, std::string abbr = {},
                            const TheoryRegistry* theories = nullptr,
                            std::shared_ptr<const RuleCompiler> compiler = nullptr);

// Nonrecursive theory that skips validation entirely
RuleTheory makeUnsafeTheory(std::string name = {}, std::string abbr = {},
                            const TheoryRegistry* theories = nullptr,
                            std::shared_ptr<const RuleCompiler> compiler = nullptr);

} // namespace pl
