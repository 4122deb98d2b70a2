#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/graph/Errors.hpp"  // NotFoundError

#include <algorithm>      // std::reverse, std::min
#include <limits>         // infinity
#include <optional>       // predecessor entries
#include <unordered_map>  // distance / predecessor maps
#include <unordered_set>  // unvisited set
#include <vector>         // paths

namespace fuzz {

// ==========================
// Shortest paths
// ==========================
// Every algorithm reads edge costs through g.weight(tail, head): 1 for an
// unweighted Graph, the stored cost for a WeightedGraph, 1 / membership for a
// FuzzyGraph. Costs must be non-negative.
// ==========================

// Result of a single-source search.
template <typename V>
struct ShortestPathTree {
    using vertex_type = V;

    V source;
    std::unordered_map<V, double> distance;             // infinity when unreachable
    std::unordered_map<V, std::optional<V>> previous;   // empty for the source and unreachable vertices
};

// A path from start to end. An unreachable end gives no vertices and an
// infinite distance.
template <typename V>
struct Path {
    std::vector<V> vertices;
    double distance = std::numeric_limits<double>::infinity();

    bool found() const noexcept { return !vertices.empty(); }
};

// Pairwise shortest distances: table[i][j] is the distance from i to j.
template <typename V>
using DistanceTable = std::unordered_map<V, std::unordered_map<V, double>>;

// Dijkstra's algorithm from start. Selection scans the whole unvisited set
// (O(V^2)); ties go to whichever vertex the scan meets first, so tie order
// depends on the vertex set's iteration order.
template <typename G>
ShortestPathTree<typename G::Vertex> dijkstra(const G& g, const typename G::Vertex& start) {
    using V = typename G::Vertex;
    const double inf = std::numeric_limits<double>::infinity();

    const auto& vertices = g.vertices();
    if (vertices.count(start) == 0) throw NotFoundError("start vertex not in graph: " + detail::describe(start));

    ShortestPathTree<V> tree{start, {}, {}};
    std::unordered_set<V> unvisited;
    for (const auto& v : vertices) {
        tree.distance[v] = inf;
        tree.previous[v] = std::nullopt;
        unvisited.insert(v);
    }
    tree.distance[start] = 0.0;

    while (!unvisited.empty()) {
        auto best = unvisited.end();
        for (auto it = unvisited.begin(); it != unvisited.end(); ++it) {   // O(V) selection
            if (best == unvisited.end() || tree.distance[*it] < tree.distance[*best]) best = it;
        }
        if (tree.distance[*best] == inf) break;                            // rest is unreachable
        V u = *best;
        unvisited.erase(best);

        for (const auto& v : g.neighbors(u)) {
            const double alt = tree.distance[u] + g.weight(u, v);
            if (alt < tree.distance[v]) {                                  // relax u -> v
                tree.distance[v] = alt;
                tree.previous[v] = u;
            }
        }
    }
    return tree;
}

// Walk the predecessor map of a finished search back from end.
template <typename V>
Path<V> shortest_path(const ShortestPathTree<V>& tree, const typename ShortestPathTree<V>::vertex_type& end) {
    auto d = tree.distance.find(end);
    if (d == tree.distance.end()) throw NotFoundError("end vertex not in graph: " + detail::describe(end));

    Path<V> path;
    if (d->second == std::numeric_limits<double>::infinity()) return path;   // unreachable: no path

    path.distance = d->second;
    std::optional<V> u = end;
    while (u) {
        path.vertices.push_back(*u);
        u = tree.previous.at(*u);
    }
    std::reverse(path.vertices.begin(), path.vertices.end());             // start -> end
    return path;
}

// Shortest path from start to end (Dijkstra).
template <typename G>
Path<typename G::Vertex> shortest_path(const G& g, const typename G::Vertex& start,
                                       const typename G::Vertex& end) {
    return shortest_path(dijkstra(g, start), end);
}

// Floyd-Warshall all-pairs distances, O(V^3). table[v][v] is always 0.
template <typename G>
DistanceTable<typename G::Vertex> floyd_warshall(const G& g) {
    using V = typename G::Vertex;
    const auto& vertices = g.vertices();

    DistanceTable<V> table;
    for (const auto& i : vertices)
        for (const auto& j : vertices) table[i][j] = g.weight(i, j);

    for (const auto& k : vertices) {
        for (const auto& i : vertices) {
            const double ik = table[i][k];
            for (const auto& j : vertices) {
                table[i][j] = std::min(table[i][j], ik + table[k][j]);
            }
        }
    }
    return table;
}

} // namespace fuzz
