#include <catch2/catch_test_macros.hpp>
#include "PL/Runtime/Graph.hpp"
#include <string>

using namespace pl;

TEST_CASE("BagGraph node refcounts", "[graph][bag]") {
    BagGraph g;
    g.addNode("a");
    g.addNode("a");
    REQUIRE(g.nodeCount("a") == 2);

    g.deleteNode("a");
    REQUIRE(g.nodeIn("a"));
    REQUIRE(g.nodeCount("a") == 1);

    g.deleteNode("a");
    REQUIRE_FALSE(g.nodeIn("a"));
    REQUIRE(g.nodeCount("a") == 0);
    REQUIRE(g.nodes().empty());

    SECTION("Deleting past zero is ignored") {
        g.deleteNode("a");
        REQUIRE(g.nodeCount("a") == 0);
        REQUIRE(g.size() == 0);
    }
}

TEST_CASE("BagGraph edge refcounts", "[graph][bag]") {
    BagGraph g;
    const Graph::Label lbl = std::string("lbl");
    g.addEdge("A", "B", lbl);
    g.addEdge("A", "B", lbl);
    REQUIRE(g.edgeCount("A", "B", lbl) == 2);
    REQUIRE(g.nodeCount("A") == 2);
    REQUIRE(g.nodeCount("B") == 2);
    REQUIRE(g.size() == 6);

    g.deleteEdge("A", "B", lbl);
    REQUIRE(g.edgeIn("A", "B", lbl));
    REQUIRE(g.edgeCount("A", "B", lbl) == 1);
    REQUIRE(g.nodeCount("A") == 1);

    g.deleteEdge("A", "B", lbl);
    REQUIRE_FALSE(g.edgeIn("A", "B", lbl));
    REQUIRE_FALSE(g.nodeIn("A"));
    REQUIRE_FALSE(g.nodeIn("B"));
    REQUIRE(g.empty());
}

TEST_CASE("BagGraph endpoints survive while referenced elsewhere", "[graph][bag]") {
    BagGraph g;
    g.addNode("A");
    g.addEdge("A", "B");
    g.deleteEdge("A", "B");

    REQUIRE(g.nodeIn("A"));
    REQUIRE(g.nodeCount("A") == 1);
    REQUIRE_FALSE(g.nodeIn("B"));
}

TEST_CASE("BagGraph edge deletion needs the exact label", "[graph][bag]") {
    BagGraph g;
    g.addEdge("A", "B");
    g.deleteEdge("A", "B", std::string("neg"));
    REQUIRE(g.edgeCount("A", "B") == 1);
    REQUIRE(g.nodeCount("A") == 1);

    g.deleteEdge("X", "Y");
    REQUIRE(g.size() == 3);
}

TEST_CASE("BagGraph node removal keeps edge counts", "[graph][bag]") {
    BagGraph g;
    g.addEdge("A", "B");
    g.deleteNode("B");

    REQUIRE_FALSE(g.nodeIn("B"));
    REQUIRE(g.edgesFrom("A").empty());
    REQUIRE_FALSE(g.hasCycle());
    REQUIRE(g.edgeCount("A", "B") == 1);
    REQUIRE(g.nodeIn("A"));

    // the counted edge still releases A
    g.deleteEdge("A", "B");
    REQUIRE(g.edgeCount("A", "B") == 0);
    REQUIRE_FALSE(g.nodeIn("A"));
    REQUIRE(g.empty());
    REQUIRE(g.size() == 0);
}

TEST_CASE("BagGraph edge deletion after its source is gone", "[graph][bag]") {
    BagGraph g;
    g.addEdge("a", "b");
    g.deleteNode("a");
    REQUIRE_FALSE(g.nodeIn("a"));
    REQUIRE(g.nodeCount("b") == 1);

    g.deleteEdge("a", "b");
    REQUIRE_FALSE(g.nodeIn("b"));
    REQUIRE(g.nodeCount("b") == 0);
    REQUIRE_FALSE(g.edgeIn("a", "b"));
    REQUIRE(g.size() == 0);
}

TEST_CASE("BagGraph cycles follow physical presence", "[graph][bag][cycles]") {
    BagGraph g;
    g.addEdge("p", "q");
    g.addEdge("q", "p");
    g.addEdge("q", "p");
    REQUIRE(g.hasCycle());

    g.deleteEdge("q", "p");
    REQUIRE(g.hasCycle());

    g.deleteEdge("q", "p");
    REQUIRE_FALSE(g.hasCycle());
}

TEST_CASE("BagGraph union sums counts", "[graph][bag]") {
    BagGraph a;
    a.addEdge("x", "y");
    BagGraph b;
    b.addEdge("x", "y");
    b.addNode("z");

    const BagGraph u = a | b;
    REQUIRE(u.edgeCount("x", "y") == 2);
    REQUIRE(u.nodeCount("x") == 2);
    REQUIRE(u.nodeCount("z") == 1);
    REQUIRE(a.edgeCount("x", "y") == 1);

    a |= b;
    REQUIRE(a.size() == u.size());

    SECTION("Merging a plain graph counts each addition") {
        Graph plain;
        plain.addEdge("y", "w");
        a |= plain;
        REQUIRE(a.edgeCount("y", "w") == 1);
        REQUIRE(a.nodeCount("w") == 2);
    }
}
