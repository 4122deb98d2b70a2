#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/algo/ShortestPath.hpp"  // floyd_warshall
#include "fuzz/graph/Errors.hpp"       // UnsupportedError
#include "fuzz/graph/Graph.hpp"        // crisp result type

#include <algorithm>      // std::stable_sort
#include <cstddef>        // std::size_t
#include <optional>       // edge filters
#include <unordered_map>  // vertex -> union-find slot
#include <utility>        // std::pair, std::swap
#include <vector>         // candidate edges

namespace fuzz {

// Edges (optionally filtered by tail and/or head) in ascending weight order.
// The sort is stable: equal weights keep the edge set's iteration order.
template <typename G>
std::vector<typename G::Edge> edges_by_weight(const G& g,
                                              const std::optional<typename G::Vertex>& tail = std::nullopt,
                                              const std::optional<typename G::Vertex>& head = std::nullopt) {
    using Edge = typename G::Edge;
    std::vector<std::pair<Edge, double>> weighted;
    for (const auto& e : g.edges(tail, head)) weighted.emplace_back(e, g.weight(e.tail(), e.head()));

    std::stable_sort(weighted.begin(), weighted.end(),
                     [](const std::pair<Edge, double>& a, const std::pair<Edge, double>& b) {
                         return a.second < b.second;
                     });

    std::vector<Edge> out;
    out.reserve(weighted.size());
    for (const auto& p : weighted) out.push_back(p.first);
    return out;
}

// Minimum spanning tree (forest, for a disconnected graph) by Kruskal's
// algorithm. Throws UnsupportedError for directed graphs.
template <typename G>
Graph<typename G::Vertex> minimum_spanning_tree(const G& g) {
    using V = typename G::Vertex;
    using Tree = Graph<V>;

    if (g.directed()) throw UnsupportedError("Kruskal's algorithm is for undirected graphs only");

    const auto& vertices = g.vertices();
    Tree tree(Tree::Kind::Undirected);                               // same vertices, no edges yet
    std::unordered_map<V, std::size_t> slot;                         // vertex -> union-find index
    for (const auto& v : vertices) {
        slot.emplace(v, slot.size());
        tree.add_vertex(v);
    }
    const std::size_t n = slot.size();
    if (n == 0) return tree;

    std::vector<std::size_t> parent(n), rnk(n, 0);                   // disjoint-set union (parent and rank)
    for (std::size_t i = 0; i < n; ++i) parent[i] = i;               // each vertex is its own root

    auto find = [&](auto&& self, std::size_t x) -> std::size_t {     // path-compressed find
        return parent[x] == x ? x : parent[x] = self(self, parent[x]);
    };

    auto unite = [&](std::size_t a, std::size_t b) -> bool {         // union by rank; true if merged
        a = find(find, a);
        b = find(find, b);
        if (a == b) return false;                                    // already connected in the tree
        if (rnk[a] < rnk[b]) std::swap(a, b);
        parent[b] = a;
        if (rnk[a] == rnk[b]) ++rnk[a];
        return true;
    };

    for (const auto& e : edges_by_weight(g)) {                       // cheapest candidates first
        if (unite(slot.at(e.tail()), slot.at(e.head()))) {
            tree.add_edge(e);
            if (tree.edge_count() == n - 1) break;                   // spanning tree complete
        }
    }
    return tree;
}

// Copy of g keeping only the edges that lie on some shortest path, i.e.
// whose direct weight equals the all-pairs distance between their ends.
template <typename G>
G shortest_path_subgraph(const G& g) {
    G sub = g;
    const auto table = floyd_warshall(g);
    for (const auto& e : g.edges()) {
        if (g.weight(e.tail(), e.head()) > table.at(e.tail()).at(e.head()))
            sub.remove_edge(e.tail(), e.head());
    }
    return sub;
}

} // namespace fuzz
