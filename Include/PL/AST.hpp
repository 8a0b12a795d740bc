#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pl {

struct SourceLocation {
    size_t line{1};
    size_t column{1};
};

struct Variable {
    std::string name;
};

struct Constant {
    enum class Kind { Symbol, Number, String };
    std::string text; // unescaped content for strings
    Kind kind{Kind::Symbol};
};

using Term = std::variant<Variable, Constant>;

bool operator==(const Variable& a, const Variable& b);
bool operator==(const Constant& a, const Constant& b);

/**
 * @brief A table reference with its arguments
 *
 * `theory` holds the optional owning-theory prefix, e.g. `nova` in
 * `nova:servers(x)`. Tables ending in '+' or '-' are update tables.
 */
struct Atom {
    std::string table;
    std::optional<std::string> theory;
    std::vector<Term> arguments;
    SourceLocation loc{};

    size_t arity() const { return arguments.size(); }
    bool isUpdate() const;
    bool isGround() const;
    // Names of all variables in argument order (with repeats removed)
    std::vector<std::string> variables() const;
    // `theory:table`, or just `table` without a theory prefix
    std::string qualifiedTable() const;
};

// Body element: an atom with polarity
struct Literal {
    Atom atom;
    bool negated{false};
};

struct Rule {
    Atom head;
    std::vector<Literal> body;
    SourceLocation loc{};

    bool isFact() const { return body.empty(); }
};

using Formula = std::variant<Atom, Rule>;

// A single requested mutation of a theory
struct Event {
    Formula formula;
    bool insert{true};
};

// Structural equality; source locations are ignored
bool operator==(const Atom& a, const Atom& b);
bool operator==(const Literal& a, const Literal& b);
bool operator==(const Rule& a, const Rule& b);
bool operator==(const Event& a, const Event& b);
inline bool operator!=(const Atom& a, const Atom& b) { return !(a == b); }
inline bool operator!=(const Rule& a, const Rule& b) { return !(a == b); }

struct AtomHash {
    size_t operator()(const Atom& a) const;
};

struct RuleHash {
    size_t operator()(const Rule& r) const;
};

// Wrap a bare atom as a rule with an empty body
Rule asRule(const Formula& f);
// Head of a rule, or the atom itself
const Atom& headOf(const Formula& f);

std::string toString(const Term& t);
std::string toString(const Atom& a);
std::string toString(const Literal& l);
std::string toString(const Rule& r);
std::string toString(const Formula& f);
std::string toString(const Event& e);
std::string toString(const std::vector<Event>& events);

} // namespace pl
