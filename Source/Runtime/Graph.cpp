#include "PL/Runtime/Graph.hpp"

#include <algorithm>
#include <sstream>

namespace pl {

namespace {

void hashCombine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

size_t hashLabel(const std::optional<std::string>& label) {
    return label ? std::hash<std::string>{}(*label) + 1 : 0;
}

std::string labelString(const std::optional<std::string>& label) {
    return label ? *label : "None";
}

} // namespace

bool operator==(const Edge& a, const Edge& b) {
    return a.node == b.node && a.label == b.label;
}

size_t EdgeHash::operator()(const Edge& e) const {
    size_t seed = std::hash<std::string>{}(e.node);
    hashCombine(seed, hashLabel(e.label));
    return seed;
}

// -------- Graph --------

bool Graph::addNode(const Node& node) {
    invalidate();
    return nodes_.insert(node);
}

void Graph::deleteNode(const Node& node) {
    if (!nodes_.contains(node)) return;
    invalidate();
    nodes_.erase(node);
    edges_.erase(node);
    for (auto& [from, targets] : edges_) {
        std::vector<Edge> incoming;
        for (const auto& e : targets) {
            if (e.node == node) incoming.push_back(e);
        }
        for (const auto& e : incoming) targets.erase(e);
    }
}

void Graph::addEdge(const Node& from, const Node& to, const Label& label) {
    invalidate();
    addNode(from);
    addNode(to);
    edges_[from].insert(Edge{to, label});
}

void Graph::deleteEdge(const Node& from, const Node& to, const Label& label) {
    auto it = edges_.find(from);
    if (it == edges_.end()) return;
    if (!it->second.erase(Edge{to, label})) return;
    if (it->second.empty()) edges_.erase(it);
    invalidate();
}

bool Graph::nodeIn(const Node& node) const { return nodes_.contains(node); }

bool Graph::edgeIn(const Node& from, const Node& to, const Label& label) const {
    auto it = edges_.find(from);
    return it != edges_.end() && it->second.contains(Edge{to, label});
}

size_t Graph::size() const {
    size_t total = nodes_.size();
    for (const auto& [from, targets] : edges_) total += targets.size();
    return total;
}

std::vector<Edge> Graph::edgesFrom(const Node& node) const {
    auto it = edges_.find(node);
    if (it == edges_.end()) return {};
    return it->second.toVector();
}

void Graph::visit(const Node& node, SearchResult& state) const {
    state.intervals[node].begin = state.counter++;
    auto it = edges_.find(node);
    if (it != edges_.end()) {
        for (const auto& e : it->second) {
            DfsInterval& target = state.intervals[e.node];
            if (!target.begin) {
                state.backpath[e.node] = node;
                visit(e.node, state);
            } else if (!target.end) {
                // e.node is still open: walk the discovery path back to it
                std::vector<Node> cycle{node};
                Node cur = node;
                while (cur != e.node) {
                    cur = state.backpath.at(cur);
                    cycle.push_back(cur);
                }
                std::reverse(cycle.begin(), cycle.end());
                state.cycles.push_back(std::move(cycle));
            }
        }
    }
    state.intervals[node].end = state.counter++;
}

const SearchResult& Graph::depthFirstSearch() const {
    if (search_) return *search_;
    SearchResult state;
    for (const auto& node : nodes_) state.intervals[node] = DfsInterval{};
    for (const auto& node : nodes_) {
        if (!state.intervals[node].begin) visit(node, state);
    }
    search_ = std::move(state);
    return *search_;
}

SearchResult Graph::depthFirstSearch(const Node& root) const {
    SearchResult state;
    if (!nodes_.contains(root)) return state;
    for (const auto& node : nodes_) state.intervals[node] = DfsInterval{};
    visit(root, state);
    return state;
}

bool Graph::hasCycle() const { return !depthFirstSearch().cycles.empty(); }

const std::vector<std::vector<Graph::Node>>& Graph::cycles() const {
    return depthFirstSearch().cycles;
}

std::optional<std::unordered_set<Graph::Node>> Graph::dependencies(const Node& node) const {
    if (!nodes_.contains(node)) return std::nullopt;

    auto collect = [&node](const SearchResult& state) {
        std::unordered_set<Node> out;
        const DfsInterval& root = state.intervals.at(node);
        for (const auto& [name, iv] : state.intervals) {
            if (iv.finished() && *root.begin <= *iv.begin && *iv.end <= *root.end) {
                out.insert(name);
            }
        }
        return out;
    };

    // The cached search only covers everything reachable from its very first root
    if (search_) {
        auto it = search_->intervals.find(node);
        if (it != search_->intervals.end() && it->second.begin && *it->second.begin == 0) {
            return collect(*search_);
        }
    }
    return collect(depthFirstSearch(node));
}

std::unordered_set<Graph::Node> Graph::roots() const {
    std::unordered_set<Node> possible(nodes_.begin(), nodes_.end());
    for (const auto& [from, targets] : edges_) {
        for (const auto& e : targets) possible.erase(e.node);
    }
    return possible;
}

std::optional<Graph::Stratification> Graph::stratification(const std::unordered_set<std::string>& labels) const {
    Stratification stratum;
    for (const auto& node : nodes_) stratum[node] = 1;
    const int bound = static_cast<int>(nodes_.size());

    bool changes = true;
    while (changes) {
        changes = false;
        for (const auto& node : nodes_) {
            auto it = edges_.find(node);
            if (it == edges_.end()) continue;
            for (const auto& e : it->second) {
                const bool raises = e.label && labels.count(*e.label) > 0;
                const int needed = stratum[e.node] + (raises ? 1 : 0);
                if (needed > stratum[node]) {
                    stratum[node] = needed;
                    changes = true;
                }
                if (stratum[node] > bound) return std::nullopt;
            }
        }
    }
    return stratum;
}

Graph Graph::operator|(const Graph& other) const {
    Graph g;
    g |= *this;
    g |= other;
    return g;
}

Graph& Graph::operator|=(const Graph& other) {
    if (other.empty()) return *this;
    invalidate();
    absorb(other);
    return *this;
}

void Graph::absorb(const Graph& other) {
    const std::vector<Node> nodes = other.nodes_.toVector();
    for (const auto& node : nodes) addNode(node);
    for (const auto& node : nodes) {
        for (const auto& e : other.edgesFrom(node)) addEdge(node, e.node, e.label);
    }
}

std::string Graph::toString() const {
    std::ostringstream oss;
    oss << '{';
    for (const auto& node : nodes_) {
        oss << '(' << node << " : [";
        const auto targets = edgesFrom(node);
        for (size_t i = 0; i < targets.size(); ++i) {
            if (i) oss << ", ";
            oss << "<Label:" << labelString(targets[i].label) << ", Node:" << targets[i].node << '>';
        }
        oss << "],\n";
    }
    oss << '}';
    return oss.str();
}

// -------- BagGraph --------

size_t BagGraph::EdgeKeyHash::operator()(const EdgeKey& k) const {
    size_t seed = std::hash<std::string>{}(k.from);
    hashCombine(seed, std::hash<std::string>{}(k.to));
    hashCombine(seed, hashLabel(k.label));
    return seed;
}

bool BagGraph::addNode(const Node& node) {
    const bool added = Graph::addNode(node);
    ++nodeRefcounts_[node];
    return added;
}

void BagGraph::deleteNode(const Node& node) {
    auto it = nodeRefcounts_.find(node);
    if (it == nodeRefcounts_.end()) return;
    invalidate();
    if (--it->second > 0) return;
    nodeRefcounts_.erase(it);
    // edge refcounts are kept
    Graph::deleteNode(node);
}

void BagGraph::addEdge(const Node& from, const Node& to, const Label& label) {
    Graph::addEdge(from, to, label);
    ++edgeRefcounts_[EdgeKey{from, to, label}];
}

void BagGraph::deleteEdge(const Node& from, const Node& to, const Label& label) {
    auto it = edgeRefcounts_.find(EdgeKey{from, to, label});
    if (it == edgeRefcounts_.end()) return;
    invalidate();
    if (--it->second == 0) {
        edgeRefcounts_.erase(it);
        Graph::deleteEdge(from, to, label);
    }
    deleteNode(from);
    deleteNode(to);
}

bool BagGraph::nodeIn(const Node& node) const { return nodeRefcounts_.count(node) > 0; }

bool BagGraph::edgeIn(const Node& from, const Node& to, const Label& label) const {
    return edgeRefcounts_.count(EdgeKey{from, to, label}) > 0;
}

size_t BagGraph::nodeCount(const Node& node) const {
    auto it = nodeRefcounts_.find(node);
    return it == nodeRefcounts_.end() ? 0 : it->second;
}

size_t BagGraph::edgeCount(const Node& from, const Node& to, const Label& label) const {
    auto it = edgeRefcounts_.find(EdgeKey{from, to, label});
    return it == edgeRefcounts_.end() ? 0 : it->second;
}

size_t BagGraph::size() const {
    size_t total = 0;
    for (const auto& [node, count] : nodeRefcounts_) total += count;
    for (const auto& [edge, count] : edgeRefcounts_) total += count;
    return total;
}

BagGraph BagGraph::operator|(const Graph& other) const {
    BagGraph g;
    g |= *this;
    g |= other;
    return g;
}

void BagGraph::absorb(const Graph& other) {
    const auto* bag = dynamic_cast<const BagGraph*>(&other);
    if (bag == nullptr) {
        Graph::absorb(other);
        return;
    }
    // Copies so that a graph can be merged into itself
    const auto nodeCounts = bag->nodeRefcounts_;
    const auto edgeCounts = bag->edgeRefcounts_;
    for (const auto& node : bag->nodes_.toVector()) {
        nodes_.insert(node);
        nodeRefcounts_[node] += nodeCounts.at(node);
    }
    for (const auto& [key, count] : edgeCounts) {
        edges_[key.from].insert(Edge{key.to, key.label});
        edgeRefcounts_[key] += count;
    }
}

std::string BagGraph::toString() const {
    std::ostringstream oss;
    oss << '{';
    for (const auto& node : nodes_) {
        oss << '(' << node << " *" << nodeCount(node) << ": [";
        const auto targets = edgesFrom(node);
        for (size_t i = 0; i < targets.size(); ++i) {
            if (i) oss << ", ";
            oss << "<Label:" << labelString(targets[i].label) << ", Node:" << targets[i].node << "> *"
                << edgeCount(node, targets[i].node, targets[i].label);
        }
        oss << "],\n";
    }
    oss << '}';
    return oss.str();
}

} // namespace pl
