// ===============================================
// AlgorithmFactory.cpp
// Text strategies over a fuzzy graph (Strategy pattern):
//   * ALPHA      alpha / strong alpha cut to a crisp graph
//   * PATH       shortest path source -> target (Dijkstra, cost 1/mu)
//   * FLOYD      all-pairs distances (Floyd-Warshall)
//   * MST        minimum spanning tree (Kruskal; undirected only)
//   * SPS        shortest path subgraph
//   * CONNECTED  reachability source -> target (BFS)
//   * NORMALIZE  degrees after normalization
// Exposes AlgorithmFactory::create(name, opts) to instantiate a strategy.
// ===============================================

#include "fuzz/algo/GraphAlgorithm.hpp"   // interface and factory declaration
#include "fuzz/algo/Connectivity.hpp"     // connected()
#include "fuzz/algo/GraphText.hpp"        // format helpers
#include "fuzz/algo/ShortestPath.hpp"     // shortest_path(), floyd_warshall()
#include "fuzz/algo/Spanning.hpp"         // minimum_spanning_tree(), shortest_path_subgraph()
#include "fuzz/graph/Errors.hpp"          // GraphError, UnsupportedError

#include <algorithm>     // std::sort
#include <cctype>        // std::tolower for case-insensitive names
#include <memory>        // std::make_unique for factory
#include <sstream>       // std::ostringstream to build responses
#include <string>        // std::string
#include <utility>       // std::move
#include <vector>        // sorted vertex lists

namespace fuzz {

namespace {

// ---------- helper: to-lower a string (safe cast to unsigned char) ----------
std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

// ---------- helper: vertices in sorted order for stable output ----------
std::vector<std::string> sortedVertices(const TextGraph& g) {
    const auto vs = g.vertices();
    std::vector<std::string> out(vs.begin(), vs.end());
    std::sort(out.begin(), out.end());
    return out;
}

// ---------- helper: "{A:1, B:0.5}" for a fuzzy set of strings ----------
std::string formatDegrees(const FuzzySet<std::string>& set) {
    std::vector<std::pair<std::string, double>> items;
    for (const auto& e : set) items.emplace_back(e.obj(), e.mu);
    std::sort(items.begin(), items.end());
    std::ostringstream oss;
    oss << '{';
    for (std::size_t i = 0; i < items.size(); ++i) {
        oss << items[i].first << ':' << formatNumber(items[i].second);
        if (i + 1 < items.size()) oss << ", ";
    }
    oss << '}';
    return oss.str();
}

// ---------- helper: same for edge degrees ----------
std::string formatDegrees(const FuzzySet<GraphEdge<std::string>>& set) {
    std::vector<std::pair<std::pair<std::string, std::string>, double>> items;
    for (const auto& e : set) items.push_back({{e.obj().tail(), e.obj().head()}, e.mu});
    std::sort(items.begin(), items.end());
    std::ostringstream oss;
    oss << '{';
    for (std::size_t i = 0; i < items.size(); ++i) {
        oss << '(' << items[i].first.first << ", " << items[i].first.second << "):"
            << formatNumber(items[i].second);
        if (i + 1 < items.size()) oss << ", ";
    }
    oss << '}';
    return oss.str();
}

// =====================================================
// 1) Alpha cut
// =====================================================
struct AlgoAlphaCut final : IGraphAlgorithm {
    explicit AlgoAlphaCut(AlgorithmOptions o) : opts(std::move(o)) {}
    std::string run(const TextGraph& g) override {
        const auto cut = opts.strong ? g.strong_alpha(opts.alpha) : g.alpha(opts.alpha);
        std::ostringstream oss;
        oss << (opts.strong ? "Strong alpha cut (> " : "Alpha cut (>= ")
            << formatNumber(opts.alpha) << "): " << cut.label()
            << " V: " << formatVertices(cut.vertices())
            << " E: " << formatEdges(cut.edges());
        return oss.str();
    }
    AlgorithmOptions opts;
};

// =====================================================
// 2) Shortest path (Dijkstra)
// =====================================================
struct AlgoShortestPath final : IGraphAlgorithm {
    explicit AlgoShortestPath(AlgorithmOptions o) : opts(std::move(o)) {}
    std::string run(const TextGraph& g) override {
        if (opts.source.empty() || opts.target.empty())
            return "PATH needs a source and a target vertex.";
        try {
            const auto path = shortest_path(g, opts.source, opts.target);
            if (!path.found())
                return "No path from " + opts.source + " to " + opts.target + ".";
            return "Shortest path " + opts.source + " -> " + opts.target + ": " + formatPath(path);
        } catch (const NotFoundError& e) {                          // unknown source or target
            return std::string("Error: ") + e.what();
        }
    }
    AlgorithmOptions opts;
};

// =====================================================
// 3) All-pairs distances (Floyd-Warshall)
// =====================================================
struct AlgoFloydWarshall final : IGraphAlgorithm {
    std::string run(const TextGraph& g) override {
        const auto vs = sortedVertices(g);
        if (vs.empty()) return "All-pairs distances: (empty graph).";
        const auto table = floyd_warshall(g);
        std::ostringstream oss;
        oss << "All-pairs distances:";
        for (const auto& i : vs)
            for (const auto& j : vs)
                if (i != j) oss << "\n  " << i << " -> " << j << ": " << formatNumber(table.at(i).at(j));
        return oss.str();
    }
};

// =====================================================
// 4) Minimum spanning tree (Kruskal): undirected graphs only
// =====================================================
struct AlgoSpanningTree final : IGraphAlgorithm {
    std::string run(const TextGraph& g) override {
        try {
            const auto tree = minimum_spanning_tree(g);
            double total = 0.0;
            for (const auto& e : tree.edges()) total += g.weight(e.tail(), e.head());
            std::ostringstream oss;
            oss << "MST: " << formatEdges(tree.edges()) << " weight " << formatNumber(total)
                << " (edges used: " << tree.edge_count() << ").";
            if (g.vertex_count() > 0 && tree.edge_count() + 1 < g.vertex_count())
                oss << " Graph is disconnected; result is a spanning forest.";
            return oss.str();
        } catch (const UnsupportedError&) {
            return "MST undefined for directed graphs.";
        }
    }
};

// =====================================================
// 5) Shortest path subgraph
// =====================================================
struct AlgoShortestPathSubgraph final : IGraphAlgorithm {
    std::string run(const TextGraph& g) override {
        const auto sub = shortest_path_subgraph(g);
        return "Shortest path subgraph: " + formatEdges(sub.edges());
    }
};

// =====================================================
// 6) Connectivity (BFS)
// =====================================================
struct AlgoConnected final : IGraphAlgorithm {
    explicit AlgoConnected(AlgorithmOptions o) : opts(std::move(o)) {}
    std::string run(const TextGraph& g) override {
        if (opts.source.empty() || opts.target.empty())
            return "CONNECTED needs a source and a target vertex.";
        try {
            const bool c = connected(g, opts.source, opts.target);
            return opts.source + " and " + opts.target + (c ? " are connected." : " are not connected.");
        } catch (const NotFoundError& e) {
            return std::string("Error: ") + e.what();
        }
    }
    AlgorithmOptions opts;
};

// =====================================================
// 7) Normalization
// =====================================================
struct AlgoNormalize final : IGraphAlgorithm {
    std::string run(const TextGraph& g) override {
        TextGraph copy = g;                                         // strategies never mutate the input
        copy.normalize();
        return "Normalized V: " + formatDegrees(copy.fuzzy_vertices()) +
               " E: " + formatDegrees(copy.fuzzy_edges());
    }
};

} // namespace

// =====================================================
// Factory definition (matches header declaration)
// =====================================================
std::unique_ptr<IGraphAlgorithm>
AlgorithmFactory::create(const std::string& name, const AlgorithmOptions& opts) {
    const auto n = to_lower(name);                                   // normalize the name to lowercase
    if (n == "alpha")     return std::make_unique<AlgoAlphaCut>(opts);
    if (n == "path")      return std::make_unique<AlgoShortestPath>(opts);
    if (n == "floyd")     return std::make_unique<AlgoFloydWarshall>();
    if (n == "mst")       return std::make_unique<AlgoSpanningTree>();
    if (n == "sps")       return std::make_unique<AlgoShortestPathSubgraph>();
    if (n == "connected") return std::make_unique<AlgoConnected>(opts);
    if (n == "normalize") return std::make_unique<AlgoNormalize>();
    return nullptr;                                                  // unknown name: caller handles error
}

} // namespace fuzz
