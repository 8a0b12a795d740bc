#include <catch2/catch_test_macros.hpp>
#include "PL/Parser.hpp"
#include "PL/Runtime/RuleDependencyGraph.hpp"
#include "PL/Runtime/RuleTheory.hpp"
#include <string>
#include <vector>

using namespace pl;

static std::vector<Rule> rulesOf(const std::string& src) {
    std::vector<Rule> out;
    for (const auto& f : parseProgram(src)) out.push_back(asRule(f));
    return out;
}

TEST_CASE("Rules become table edges", "[rdg]") {
    RuleDependencyGraph g(rulesOf(R"(
        p(x) :- q(x), not r(x)
        q(x) :- nova:servers(x)
        s(1)
    )"));

    REQUIRE(g.nodeIn("p"));
    REQUIRE(g.nodeIn("s"));
    REQUIRE(g.nodeIn("nova:servers"));
    REQUIRE(g.edgeIn("p", "q"));
    REQUIRE(g.edgeIn("p", "r", std::string(RuleDependencyGraph::kNegationLabel)));
    REQUIRE_FALSE(g.edgeIn("p", "r"));
    REQUIRE(g.edgeIn("q", "nova:servers"));

    const auto deps = g.dependencies("p");
    REQUIRE(deps.has_value());
    REQUIRE(deps->count("nova:servers") == 1);
    REQUIRE(deps->count("s") == 0);
    REQUIRE_FALSE(g.isRecursive());
}

TEST_CASE("Stratification through negation", "[rdg][strata]") {
    SECTION("Negation raises the stratum") {
        RuleDependencyGraph g(rulesOf(R"(
            p(x) :- q(x), not r(x)
            r(x) :- s(x)
        )"));
        const auto strata = g.stratify();
        REQUIRE(strata.has_value());
        REQUIRE(strata->at("s") == 1);
        REQUIRE(strata->at("r") == 1);
        REQUIRE(strata->at("q") == 1);
        REQUIRE(strata->at("p") == 2);
    }

    SECTION("Positive recursion is stratified") {
        RuleDependencyGraph g(rulesOf(R"(
            path(x, y) :- edge(x, y)
            path(x, z) :- path(x, y), edge(y, z)
        )"));
        REQUIRE(g.isRecursive());
        REQUIRE(g.isStratified());
    }

    SECTION("Recursion through negation is not") {
        RuleDependencyGraph g(rulesOf(R"(
            p(x) :- q(x), not r(x)
            r(x) :- q(x), not p(x)
        )"));
        REQUIRE(g.isRecursive());
        REQUIRE_FALSE(g.isStratified());
    }
}

TEST_CASE("Applying theory changes keeps the graph in step", "[rdg][update]") {
    RuleTheory th = makeNonrecursiveTheory("test");
    RuleDependencyGraph g;

    const Formula rule = parseFormula("p(x) :- q(x), not r(x)");
    const Formula other = parseFormula("t(x) :- q(x)");

    g.apply(th.update({{rule, true}, {other, true}, {rule, true}}));
    REQUIRE(g.edgeCount("p", "q") == 1);
    REQUIRE(g.edgeCount("t", "q") == 1);
    REQUIRE(g.nodeCount("q") == 2);

    // the duplicate delete changes nothing, so the graph sees one deletion
    g.apply(th.update({{rule, false}, {rule, false}}));
    REQUIRE_FALSE(g.nodeIn("p"));
    REQUIRE_FALSE(g.nodeIn("r"));
    REQUIRE(g.nodeIn("q"));
    REQUIRE(g.edgeIn("t", "q"));

    g.apply(th.update({{other, false}}));
    REQUIRE(g.empty());
}

TEST_CASE("A table defined by several rules stays until the last goes", "[rdg][update]") {
    RuleDependencyGraph g;
    const Formula a = parseFormula("p(x) :- q(x)");
    const Formula b = parseFormula("p(x) :- r(x)");
    g.formulaInsert(a);
    g.formulaInsert(b);
    REQUIRE(g.nodeCount("p") == 4);

    g.formulaDelete(a);
    REQUIRE(g.nodeIn("p"));
    REQUIRE_FALSE(g.nodeIn("q"));
    REQUIRE(g.edgeIn("p", "r"));

    g.formulaDelete(b);
    REQUIRE(g.empty());
}

TEST_CASE("Facts only add their table", "[rdg]") {
    RuleDependencyGraph g;
    g.formulaInsert(parseFormula("p(1)"));
    g.formulaInsert(parseFormula("p(2)"));
    REQUIRE(g.nodeCount("p") == 2);
    REQUIRE(g.roots() == std::unordered_set<std::string>{"p"});

    g.formulaDelete(parseFormula("p(1)"));
    REQUIRE(g.nodeIn("p"));
    g.formulaDelete(parseFormula("p(2)"));
    REQUIRE(g.empty());
}
