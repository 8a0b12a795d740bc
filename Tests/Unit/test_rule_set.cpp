#include <catch2/catch_test_macros.hpp>
#include "PL/Parser.hpp"
#include "PL/Runtime/RuleSet.hpp"
#include <string>
#include <vector>

using namespace pl;

TEST_CASE("RuleSet add and discard report changes", "[ruleset]") {
    RuleSet rs;
    const Rule r = parseRule("p(x) :- q(x)");

    REQUIRE(rs.addRule("p", r));
    REQUIRE_FALSE(rs.addRule("p", parseRule("p(x) :- q(x)")));
    REQUIRE(rs.size() == 1);
    REQUIRE(rs.contains("p", r));
    REQUIRE(rs.contains("p"));

    REQUIRE(rs.discardRule("p", r));
    REQUIRE_FALSE(rs.discardRule("p", r));
    REQUIRE_FALSE(rs.contains("p"));
    REQUIRE(rs.keys().empty());
}

TEST_CASE("RuleSet equality is structural", "[ruleset]") {
    RuleSet rs;
    rs.addRule("p", parseRule("p(x) :- q(x), not r(x)"));
    REQUIRE(rs.contains("p", parseRule("p(x)   :-   q(x),\n not r(x)")));
    REQUIRE_FALSE(rs.contains("p", parseRule("p(x) :- q(x), r(x)")));
    REQUIRE_FALSE(rs.contains("p", parseRule("p(y) :- q(y), not r(y)")));
}

TEST_CASE("RuleSet keys skip empty tables", "[ruleset]") {
    RuleSet rs;
    rs.addRule("p", parseRule("p(1)"));
    rs.addRule("q", parseRule("q(1)"));
    rs.addRule("r", parseRule("r(1)"));

    REQUIRE(rs.keys() == std::vector<std::string>{"p", "q", "r"});

    rs.clearTable("q");
    REQUIRE(rs.keys() == std::vector<std::string>{"p", "r"});
    REQUIRE(rs.getRules("q").empty());

    rs.discardRule("p", parseRule("p(1)"));
    REQUIRE(rs.keys() == std::vector<std::string>{"r"});

    rs.clear();
    REQUIRE(rs.empty());
}

TEST_CASE("RuleSet lookup filtered by a matching literal", "[ruleset]") {
    RuleSet rs;
    rs.addRule("p", parseRule("p(1, A)"));
    rs.addRule("p", parseRule("p(2, B)"));
    rs.addRule("p", parseRule("p(x, A) :- q(x)"));

    SECTION("Without a literal every rule comes back in insertion order") {
        const auto rules = rs.getRules("p");
        REQUIRE(rules.size() == 3);
        REQUIRE(toString(rules[0]) == "p(1, A)");
        REQUIRE(toString(rules[2]) == "p(x, A) :- q(x)");
    }

    SECTION("Constants in the literal must agree with head constants") {
        const Atom lit = parseAtom("p(1, y)");
        const auto rules = rs.getRules("p", &lit);
        REQUIRE(rules.size() == 2);
        REQUIRE(toString(rules[0]) == "p(1, A)");
        REQUIRE(toString(rules[1]) == "p(x, A) :- q(x)");
    }

    SECTION("Variables in the literal match anything") {
        const Atom lit = parseAtom("p(y, z)");
        REQUIRE(rs.getRules("p", &lit).size() == 3);
    }

    SECTION("Arity is not filtered") {
        const Atom lit = parseAtom("p(2)");
        const auto rules = rs.getRules("p", &lit);
        REQUIRE(rules.size() == 2);
    }

    SECTION("Unknown table") {
        const Atom lit = parseAtom("z(1)");
        REQUIRE(rs.getRules("z", &lit).empty());
    }
}
