#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/graph/Errors.hpp"  // InvalidEdgeError, detail::describe

#include <cstddef>       // std::size_t
#include <functional>    // std::hash
#include <ostream>       // operator<<
#include <utility>       // std::move

namespace fuzz {

// ==========================
// GraphEdge
// ==========================
// Ordered pair (tail, head) of distinct vertices. Edges are immutable values:
// reverse() builds a new edge instead of swapping in place.
//
// Equality is ordered, (a,b) != (b,a), while std::hash<GraphEdge> is
// symmetric, hash(a,b) == hash(b,a). Both orientations land in the same
// bucket and are then told apart by operator==. Containers stay correct;
// undirected lookups rely on the graph's query overlay, not on the hash.
// ==========================
template <typename V>
class GraphEdge {
public:
    using Vertex = V;

    // Throws InvalidEdgeError if tail == head (self-loops are not allowed).
    GraphEdge(V tail, V head) : m_tail(std::move(tail)), m_head(std::move(head)) {
        if (m_tail == m_head)
            throw InvalidEdgeError("tail and head must differ: " + detail::describe(m_tail));
    }

    const V& tail() const noexcept { return m_tail; }
    const V& head() const noexcept { return m_head; }

    // True if the edge touches `vertex` at either end.
    bool contains(const V& vertex) const { return m_tail == vertex || m_head == vertex; }

    GraphEdge reverse() const { return GraphEdge(m_head, m_tail); }

    friend bool operator==(const GraphEdge& a, const GraphEdge& b) {
        return a.m_tail == b.m_tail && a.m_head == b.m_head;
    }
    friend bool operator!=(const GraphEdge& a, const GraphEdge& b) { return !(a == b); }

    friend std::ostream& operator<<(std::ostream& os, const GraphEdge& e) {
        return os << '(' << detail::describe(e.m_tail) << ", " << detail::describe(e.m_head) << ')';
    }

private:
    V m_tail;
    V m_head;
};

} // namespace fuzz

namespace std {

template <typename V>
struct hash<fuzz::GraphEdge<V>> {
    std::size_t operator()(const fuzz::GraphEdge<V>& e) const {
        std::hash<V> h;
        return h(e.tail()) ^ h(e.head());   // symmetric in tail and head
    }
};

} // namespace std
