#pragma once                              // ensure this header is included only once per translation unit

#include <queue>          // BFS frontier
#include <unordered_set>  // discovered vertices

namespace fuzz {

// Report whether head is reachable from tail through a non-empty path,
// following edge direction when the graph is directed (breadth-first search).
// Always false for tail == head.
//
// G is any graph type of this library (Graph, WeightedGraph, FuzzyGraph).
template <typename G>
bool connected(const G& g, const typename G::Vertex& tail, const typename G::Vertex& head) {
    using V = typename G::Vertex;
    if (tail == head) return false;

    std::unordered_set<V> seen;                         // vertices already queued
    std::queue<V> frontier;                             // BFS queue
    for (const auto& v : g.neighbors(tail)) {           // first ring around tail
        seen.insert(v);
        frontier.push(v);
    }
    while (!frontier.empty()) {
        V u = frontier.front();
        frontier.pop();
        if (u == head) return true;                     // reached the target
        for (const auto& v : g.neighbors(u)) {
            if (seen.insert(v).second) frontier.push(v); // enqueue unseen vertices only
        }
    }
    return false;
}

} // namespace fuzz
