#include "PL/AST.hpp"

#include <sstream>
#include <unordered_set>

namespace pl {

namespace {

void hashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t hashTerm(const Term& t) {
    size_t seed = t.index();
    if (const auto* v = std::get_if<Variable>(&t)) {
        hashCombine(seed, std::hash<std::string>{}(v->name));
    } else {
        const auto& c = std::get<Constant>(t);
        hashCombine(seed, std::hash<std::string>{}(c.text));
        hashCombine(seed, static_cast<size_t>(c.kind));
    }
    return seed;
}

std::string quote(const std::string& s) {
    std::string res = "\"";
    for (char c : s) {
        switch (c) {
            case '"': res += "\\\""; break;
            case '\\': res += "\\\\"; break;
            case '\n': res += "\\n"; break;
            case '\t': res += "\\t"; break;
            default: res.push_back(c); break;
        }
    }
    res.push_back('"');
    return res;
}

} // namespace

bool operator==(const Variable& a, const Variable& b) { return a.name == b.name; }

bool operator==(const Constant& a, const Constant& b) {
    return a.kind == b.kind && a.text == b.text;
}

bool Atom::isUpdate() const {
    if (table.empty()) return false;
    const char last = table.back();
    return last == '+' || last == '-';
}

bool Atom::isGround() const {
    for (const auto& t : arguments) {
        if (std::holds_alternative<Variable>(t)) return false;
    }
    return true;
}

std::vector<std::string> Atom::variables() const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& t : arguments) {
        if (const auto* v = std::get_if<Variable>(&t)) {
            if (seen.insert(v->name).second) out.push_back(v->name);
        }
    }
    return out;
}

std::string Atom::qualifiedTable() const {
    if (theory) return *theory + ":" + table;
    return table;
}

bool operator==(const Atom& a, const Atom& b) {
    return a.table == b.table && a.theory == b.theory && a.arguments == b.arguments;
}

bool operator==(const Literal& a, const Literal& b) {
    return a.negated == b.negated && a.atom == b.atom;
}

bool operator==(const Rule& a, const Rule& b) {
    return a.head == b.head && a.body == b.body;
}

bool operator==(const Event& a, const Event& b) {
    return a.insert == b.insert && a.formula == b.formula;
}

size_t AtomHash::operator()(const Atom& a) const {
    size_t seed = std::hash<std::string>{}(a.table);
    if (a.theory) hashCombine(seed, std::hash<std::string>{}(*a.theory));
    for (const auto& t : a.arguments) hashCombine(seed, hashTerm(t));
    return seed;
}

size_t RuleHash::operator()(const Rule& r) const {
    AtomHash atomHash;
    size_t seed = atomHash(r.head);
    for (const auto& lit : r.body) {
        hashCombine(seed, atomHash(lit.atom));
        hashCombine(seed, lit.negated ? 1U : 0U);
    }
    return seed;
}

Rule asRule(const Formula& f) {
    if (const auto* r = std::get_if<Rule>(&f)) return *r;
    const auto& a = std::get<Atom>(f);
    return Rule{a, {}, a.loc};
}

const Atom& headOf(const Formula& f) {
    if (const auto* r = std::get_if<Rule>(&f)) return r->head;
    return std::get<Atom>(f);
}

std::string toString(const Term& t) {
    if (const auto* v = std::get_if<Variable>(&t)) return v->name;
    const auto& c = std::get<Constant>(t);
    if (c.kind == Constant::Kind::String) return quote(c.text);
    return c.text;
}

std::string toString(const Atom& a) {
    std::ostringstream oss;
    oss << a.qualifiedTable() << '(';
    for (size_t i = 0; i < a.arguments.size(); ++i) {
        if (i) oss << ", ";
        oss << toString(a.arguments[i]);
    }
    oss << ')';
    return oss.str();
}

std::string toString(const Literal& l) {
    if (l.negated) return "not " + toString(l.atom);
    return toString(l.atom);
}

std::string toString(const Rule& r) {
    if (r.body.empty()) return toString(r.head);
    std::ostringstream oss;
    oss << toString(r.head) << " :- ";
    for (size_t i = 0; i < r.body.size(); ++i) {
        if (i) oss << ", ";
        oss << toString(r.body[i]);
    }
    return oss.str();
}

std::string toString(const Formula& f) {
    return std::visit([](const auto& x) { return toString(x); }, f);
}

std::string toString(const Event& e) {
    return (e.insert ? "+" : "-") + toString(e.formula);
}

std::string toString(const std::vector<Event>& events) {
    std::ostringstream oss;
    oss << '[';
    for (size_t i = 0; i < events.size(); ++i) {
        if (i) oss << ';';
        oss << toString(events[i]);
    }
    oss << ']';
    return oss.str();
}

} // namespace pl
