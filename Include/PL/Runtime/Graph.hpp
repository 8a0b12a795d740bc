#pragma once

#include "PL/Runtime/OrderedSet.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pl {

/**
 * @brief Outgoing edge as stored on its source node
 *
 * The label is part of the edge identity, and "no label" is a label of its own.
 */
struct Edge {
    std::string node;
    std::optional<std::string> label;
};

bool operator==(const Edge& a, const Edge& b);

struct EdgeHash {
    size_t operator()(const Edge& e) const;
};

// Discovery/finish timestamps of one node during a depth-first search
struct DfsInterval {
    std::optional<size_t> begin;
    std::optional<size_t> end;

    bool finished() const { return begin.has_value() && end.has_value(); }
};

/**
 * @brief Working set of one depth-first search
 *
 * Intervals of a completed search are either disjoint or nested.
 */
struct SearchResult {
    std::unordered_map<std::string, DfsInterval> intervals;
    std::vector<std::vector<std::string>> cycles;
    // node -> node it was discovered from
    std::unordered_map<std::string, std::string> backpath;
    size_t counter{0};
};

/**
 * @brief Directed, labeled multigraph over string node identifiers
 *
 * Supports cycle detection, stratification, root finding and reachability.
 * The result of the whole-graph depth-first search is cached and dropped by
 * every mutation; queries recompute it lazily.
 */
class Graph {
public:
    using Node = std::string;
    using Label = std::optional<std::string>;
    using Stratification = std::unordered_map<Node, int>;

    Graph() = default;
    Graph(const Graph&) = default;
    Graph& operator=(const Graph&) = default;
    Graph(Graph&&) = default;
    Graph& operator=(Graph&&) = default;
    virtual ~Graph() = default;

    // Returns true if the node was not present before
    virtual bool addNode(const Node& node);
    // Removes the node together with every edge touching it
    virtual void deleteNode(const Node& node);
    // Also adds both endpoints
    virtual void addEdge(const Node& from, const Node& to, const Label& label = std::nullopt);
    // Label must match exactly; deleting an absent edge is a no-op
    virtual void deleteEdge(const Node& from, const Node& to, const Label& label = std::nullopt);

    virtual bool nodeIn(const Node& node) const;
    virtual bool edgeIn(const Node& from, const Node& to, const Label& label = std::nullopt) const;

    // Number of nodes plus number of edges
    virtual size_t size() const;
    bool empty() const { return size() == 0; }

    const OrderedSet<Node>& nodes() const { return nodes_; }
    std::vector<Edge> edgesFrom(const Node& node) const;

    /**
     * @brief Depth-first search over every node (cached until the next mutation)
     */
    const SearchResult& depthFirstSearch() const;

    /**
     * @brief Depth-first search over the nodes reachable from root
     *
     * Runs into a fresh result and leaves the cached whole-graph search alone.
     * An unknown root yields an empty result.
     */
    SearchResult depthFirstSearch(const Node& root) const;

    bool hasCycle() const;
    const std::vector<std::vector<Node>>& cycles() const;

    /**
     * @brief All nodes reachable from node, node included
     * @return std::nullopt if node is not in the graph
     */
    std::optional<std::unordered_set<Node>> dependencies(const Node& node) const;

    // Nodes with no incoming edge
    std::unordered_set<Node> roots() const;

    /**
     * @brief Assign a stratum to every node
     *
     * For every edge u -> v, stratum[u] >= stratum[v], strictly greater when
     * the edge label is in labels.
     * @return std::nullopt if no assignment exists (a cycle runs through a
     *         stratifying edge)
     */
    std::optional<Stratification> stratification(const std::unordered_set<std::string>& labels) const;

    Graph operator|(const Graph& other) const;
    Graph& operator|=(const Graph& other);

    virtual std::string toString() const;

protected:
    // Merge other's nodes and edges into this graph
    virtual void absorb(const Graph& other);
    void invalidate() const { search_.reset(); }

    OrderedSet<Node> nodes_;
    std::unordered_map<Node, OrderedSet<Edge, EdgeHash>> edges_;

private:
    void visit(const Node& node, SearchResult& state) const;

    mutable std::optional<SearchResult> search_;
};

/**
 * @brief Graph with bag semantics for nodes and edges
 *
 * Every node and (from, to, label) triple carries a reference count. It is
 * physically removed only once deleted as many times as it was added.
 * Deleting something absent is ignored.
 */
class BagGraph : public Graph {
public:
    bool addNode(const Node& node) override;
    // Decrements; at zero the node and its adjacency go, edge counts stay
    void deleteNode(const Node& node) override;
    void addEdge(const Node& from, const Node& to, const Label& label = std::nullopt) override;
    // Decrements the edge and both of its endpoints
    void deleteEdge(const Node& from, const Node& to, const Label& label = std::nullopt) override;

    bool nodeIn(const Node& node) const override;
    bool edgeIn(const Node& from, const Node& to, const Label& label = std::nullopt) const override;

    size_t nodeCount(const Node& node) const;
    size_t edgeCount(const Node& from, const Node& to, const Label& label = std::nullopt) const;

    // Sum of all node and edge counts
    size_t size() const override;

    BagGraph operator|(const Graph& other) const;

    std::string toString() const override;

protected:
    void absorb(const Graph& other) override;

private:
    struct EdgeKey {
        Node from;
        Node to;
        Label label;

        bool operator==(const EdgeKey& o) const {
            return from == o.from && to == o.to && label == o.label;
        }
    };

    struct EdgeKeyHash {
        size_t operator()(const EdgeKey& k) const;
    };

    std::unordered_map<Node, size_t> nodeRefcounts_;
    std::unordered_map<EdgeKey, size_t, EdgeKeyHash> edgeRefcounts_;
};

} // namespace pl
