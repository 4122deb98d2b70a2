#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/graph/Errors.hpp"     // NotFoundError, DuplicateError, TypeError
#include "fuzz/graph/GraphEdge.hpp"  // GraphEdge value type

#include <cstddef>          // std::size_t
#include <initializer_list> // brace construction
#include <limits>           // infinity for missing edges
#include <optional>         // optional tail/head filters
#include <ostream>          // operator<<
#include <sstream>          // label()
#include <string>           // label()
#include <unordered_set>    // vertex and edge storage
#include <utility>          // std::move
#include <vector>           // temporary edge lists

namespace fuzz {

// ==========================
// Crisp graph
// ==========================
// Vertices are caller-supplied hashable values; edges are GraphEdge values
// whose endpoints must be vertices of the graph. Edges are always stored as
// given (tail -> head). An undirected graph is the same storage read through
// a symmetric overlay: every query and mutation keyed by (tail, head) also
// matches the stored (head, tail).
//
// weight() is virtual so weighted variants can plug their own cost into the
// algorithms in fuzz/algo (shortest paths, spanning trees).
// ==========================
template <typename V>
class Graph {
public:
    // Enumeration to specify whether the graph is Undirected or Directed
    enum class Kind { Undirected, Directed };

    using Vertex    = V;
    using Edge      = GraphEdge<V>;
    using VertexSet = std::unordered_set<V>;
    using EdgeSet   = std::unordered_set<Edge>;

    // ---- Constructors ----

    explicit Graph(Kind kind = Kind::Directed) : m_kind(kind) {}

    // Build from any iterable of vertices and any iterable of edges.
    template <typename VRange, typename ERange>
    Graph(const VRange& vertices, const ERange& edges, Kind kind = Kind::Directed) : m_kind(kind) {
        for (const auto& v : vertices) add_vertex(v);
        for (const auto& e : edges) add_edge(e);
    }

    Graph(std::initializer_list<V> vertices, std::initializer_list<Edge> edges = {},
          Kind kind = Kind::Directed)
        : m_kind(kind) {
        for (const auto& v : vertices) add_vertex(v);
        for (const auto& e : edges) add_edge(e);
    }

    virtual ~Graph() = default;

    Graph(const Graph&) = default;
    Graph(Graph&&) = default;

    // Assignment replaces the edge set, so derived per-edge data is dropped
    // through edges_replaced(). A derived class's own assignment copies its
    // data back afterwards.
    Graph& operator=(const Graph& other) {
        if (this != &other) {
            m_kind = other.m_kind;
            m_vertices = other.m_vertices;
            m_edges = other.m_edges;
            edges_replaced();
        }
        return *this;
    }

    Graph& operator=(Graph&& other) {
        if (this != &other) {
            m_kind = other.m_kind;
            m_vertices = std::move(other.m_vertices);
            m_edges = std::move(other.m_edges);
            edges_replaced();
        }
        return *this;
    }

    // ---- Properties ----

    Kind kind() const noexcept { return m_kind; }
    bool directed() const noexcept { return m_kind == Kind::Directed; }

    const VertexSet& vertices() const noexcept { return m_vertices; }
    bool has_vertex(const V& v) const { return m_vertices.count(v) != 0; }

    std::size_t vertex_count() const noexcept { return m_vertices.size(); }
    std::size_t edge_count() const noexcept { return m_edges.size(); }

    // ---- Mutation ----

    // Throws TypeError if the vertex does not compare equal to itself.
    void add_vertex(const V& v) {
        detail::requireSelfEqual(v, "vertex");
        m_vertices.insert(v);
    }

    // Remove a vertex and every edge touching it.
    void remove_vertex(const V& vertex) {
        const V v = vertex;                                         // vertex may refer to stored data
        if (!has_vertex(v)) throw NotFoundError("vertex not in graph: " + detail::describe(v));
        std::vector<Edge> touching;
        for (const auto& e : m_edges)
            if (e.contains(v)) touching.push_back(e);
        for (const auto& e : touching) remove_edge(e.tail(), e.head());
        m_vertices.erase(v);
    }

    // Throws NotFoundError if an endpoint is missing and DuplicateError if the
    // edge (or, when undirected, its reverse) is already present.
    virtual void add_edge(const Edge& e) {
        if (!has_vertex(e.tail()) || !has_vertex(e.head()))
            throw NotFoundError("tail and head must be in vertex set: " + detail::describe(e));
        if (!edges(e.tail(), e.head()).empty())
            throw DuplicateError("edge already exists: " + detail::describe(e));
        m_edges.insert(e);
    }

    // Remove every edge matching (tail, head) under the directedness overlay.
    // Nothing matching is not an error.
    virtual void remove_edge(const V& tail, const V& head) {
        for (auto it = m_edges.begin(); it != m_edges.end();) {
            if (matches(*it, tail, head)) it = m_edges.erase(it);
            else ++it;
        }
    }

    void connect(const V& tail, const V& head) { add_edge(Edge(tail, head)); }
    void disconnect(const V& tail, const V& head) { remove_edge(tail, head); }

    // ---- Queries ----

    // Edges with the given tail and/or head; an unset constraint matches any
    // vertex. Throws NotFoundError if a given constraint is not a vertex.
    EdgeSet edges(const std::optional<V>& tail = std::nullopt,
                  const std::optional<V>& head = std::nullopt) const {
        if ((tail && !has_vertex(*tail)) || (head && !has_vertex(*head)))
            throw NotFoundError("specified tail/head must be in vertex set");
        EdgeSet out;
        for (const auto& e : m_edges) {
            bool forward = (!tail || e.tail() == *tail) && (!head || e.head() == *head);
            bool backward = !directed() && (!tail || e.head() == *tail) && (!head || e.tail() == *head);
            if (forward || backward) out.insert(e);
        }
        return out;
    }

    // 0 for tail == head, 1 when an edge joins them, infinity otherwise.
    virtual double weight(const V& tail, const V& head) const {
        if (tail == head) return 0.0;
        if (!edges(tail, head).empty()) return 1.0;
        return std::numeric_limits<double>::infinity();
    }

    // True if an edge joins tail to head (never for tail == head).
    bool adjacent(const V& tail, const V& head) const {
        if (tail == head) return false;
        return !edges(tail, head).empty();
    }

    VertexSet neighbors(const V& v) const {
        VertexSet out;
        for (const auto& u : m_vertices)
            if (adjacent(v, u)) out.insert(u);
        return out;
    }

    // ---- Binary relations (no isomorphism: vertex identity must match) ----

    bool issubgraph(const Graph& other) const {
        return isSubset(m_vertices, other.m_vertices) && isSubset(m_edges, other.m_edges);
    }

    bool issupergraph(const Graph& other) const { return other.issubgraph(*this); }

    friend bool operator==(const Graph& a, const Graph& b) {
        return a.m_vertices == b.m_vertices && a.m_edges == b.m_edges;
    }
    friend bool operator!=(const Graph& a, const Graph& b) { return !(a == b); }
    friend bool operator<=(const Graph& a, const Graph& b) { return a.issubgraph(b); }
    friend bool operator>=(const Graph& a, const Graph& b) { return a.issupergraph(b); }
    friend bool operator<(const Graph& a, const Graph& b) { return a.issubgraph(b) && a != b; }
    friend bool operator>(const Graph& a, const Graph& b) { return a.issupergraph(b) && a != b; }

    // "DirectedGraph(VV,EE)" or "UndirectedGraph(VV,EE)"
    std::string label() const {
        std::ostringstream oss;
        oss << (directed() ? "Directed" : "Undirected");
        oss << "Graph(" << vertex_count() << "V," << edge_count() << "E)";
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Graph& g) {
        os << "V: {";
        const char* sep = "";
        for (const auto& v : g.m_vertices) { os << sep << detail::describe(v); sep = ", "; }
        os << "}\nE: {";
        sep = "";
        for (const auto& e : g.m_edges) { os << sep << e; sep = ", "; }
        return os << '}';
    }

protected:
    // Called after the whole edge set was replaced by assignment.
    virtual void edges_replaced() noexcept {}

    bool matches(const Edge& e, const V& tail, const V& head) const {
        if (e.tail() == tail && e.head() == head) return true;
        return !directed() && e.tail() == head && e.head() == tail;
    }

private:
    template <typename Set>
    static bool isSubset(const Set& a, const Set& b) {
        if (a.size() > b.size()) return false;
        for (const auto& x : a)
            if (b.count(x) == 0) return false;
        return true;
    }

    Kind m_kind;            // directed or undirected overlay
    VertexSet m_vertices;
    EdgeSet m_edges;        // stored orientation as added
};

} // namespace fuzz
