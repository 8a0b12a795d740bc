#include <catch2/catch_test_macros.hpp>
#include "PL/Compile.hpp"
#include "PL/Parser.hpp"
#include "PL/Runtime/RuleTheory.hpp"
#include <string>

using namespace pl;

TEST_CASE("reorderForSafety moves negation after its binders", "[compile][safety]") {
    DatalogCompiler c;

    SECTION("Negated literal first") {
        const Rule r = c.reorderForSafety(parseFormula("p(x) :- not q(x), r(x)"));
        REQUIRE(toString(r) == "p(x) :- r(x), not q(x)");
    }

    SECTION("Negation waits for the last binder only") {
        const Rule r = c.reorderForSafety(parseFormula("p(x, y) :- not s(x, y), a(x), b(y), c(x)"));
        REQUIRE(toString(r) == "p(x, y) :- a(x), b(y), not s(x, y), c(x)");
    }

    SECTION("Ground negation goes first") {
        const Rule r = c.reorderForSafety(parseFormula("p(x) :- q(x), not r(1)"));
        REQUIRE(toString(r) == "p(x) :- not r(1), q(x)");
    }

    SECTION("Already safe rules are unchanged") {
        const Formula f = parseFormula("p(x) :- q(x), not r(x)");
        REQUIRE(c.reorderForSafety(f) == std::get<Rule>(f));
    }

    SECTION("Atoms become facts") {
        const Rule r = c.reorderForSafety(parseFormula("p(1)"));
        REQUIRE(r.isFact());
        REQUIRE(toString(r) == "p(1)");
    }

    SECTION("Unsafe negation cannot be reordered") {
        REQUIRE_THROWS_AS(c.reorderForSafety(parseFormula("p(x) :- q(x), not r(y)")), PolicyException);
    }
}

TEST_CASE("isDatalog rejects empty names", "[compile]") {
    DatalogCompiler c;
    REQUIRE(c.isDatalog(parseFormula("p(x) :- q(x)")));
    Atom bad;
    REQUIRE_FALSE(c.isDatalog(Formula{bad}));

    Rule r = parseRule("p(x) :- q(x)");
    r.body[0].atom.arguments.push_back(Variable{""});
    REQUIRE_FALSE(c.isDatalog(Formula{r}));
    REQUIRE(c.isAtom(parseFormula("p(1)")));
    REQUIRE_FALSE(c.isAtom(parseFormula("p(x) :- q(x)")));
}

TEST_CASE("factErrors", "[compile]") {
    DatalogCompiler c;
    REQUIRE(c.factErrors(parseAtom("p(1)"), nullptr, "classification").empty());
    REQUIRE(c.factErrors(parseAtom("p(x)"), nullptr, "classification").size() == 1);
    REQUIRE(c.factErrors(parseAtom("nova:p(1)"), nullptr, "classification").size() == 1);

    SECTION("Arity must agree with the table in the registry") {
        TheoryRegistry registry;
        RuleTheory theory = makeNonrecursiveTheory("classification", "", &registry);
        registry["classification"] = &theory;
        theory.insert(parseFormula("p(1, 2)"));

        REQUIRE(c.factErrors(parseAtom("p(3, 4)"), &registry, "classification").empty());
        REQUIRE(c.factErrors(parseAtom("p(3)"), &registry, "classification").size() == 1);
    }
}

TEST_CASE("ruleErrors", "[compile]") {
    DatalogCompiler c;

    REQUIRE(c.ruleErrors(parseRule("p(x) :- q(x), not r(x)"), nullptr, "t").empty());
    // head variable y unbound
    REQUIRE(c.ruleErrors(parseRule("p(x, y) :- q(x)"), nullptr, "t").size() == 1);
    // variable only under negation: unsafe head and unsafe negation
    REQUIRE(c.ruleErrors(parseRule("p(x) :- not q(x)"), nullptr, "t").size() == 2);
    // head may not name a theory
    REQUIRE(c.ruleErrors(parseRule("nova:p(x) :- q(x)"), nullptr, "t").size() == 1);

    SECTION("Body references are checked against the registry") {
        TheoryRegistry registry;
        RuleTheory nova = makeNonrecursiveTheory("nova");
        nova.insert(parseFormula("servers(1, 2)"));
        registry["nova"] = &nova;

        REQUIRE(c.ruleErrors(parseRule("p(x) :- nova:servers(x, y)"), &registry, "t").empty());
        REQUIRE(c.ruleErrors(parseRule("p(x) :- nova:servers(x)"), &registry, "t").size() == 1);
        REQUIRE(c.ruleErrors(parseRule("p(x) :- glance:images(x)"), &registry, "t").size() == 1);
    }
}

TEST_CASE("ruleHeadHasNoTheory honours the head predicate", "[compile]") {
    DatalogCompiler c;
    auto isUpdate = [](const Atom& head) { return head.isUpdate(); };
    REQUIRE(c.ruleHeadHasNoTheory(parseRule("p(x) :- q(x)"), nullptr).empty());
    REQUIRE(c.ruleHeadHasNoTheory(parseRule("nova:p(x) :- q(x)"), nullptr).size() == 1);
    REQUIRE(c.ruleHeadHasNoTheory(parseRule("nova:p+(x) :- q(x)"), isUpdate).empty());
    REQUIRE(c.ruleHeadHasNoTheory(parseRule("nova:p(x) :- q(x)"), isUpdate).size() == 1);
}
