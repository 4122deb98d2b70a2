#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/fuzzy/FuzzySet.hpp"   // fuzzy vertex and edge sets
#include "fuzz/graph/Errors.hpp"     // NotFoundError, DuplicateError
#include "fuzz/graph/Graph.hpp"      // crisp projection target

#include <cstddef>    // std::size_t
#include <limits>     // infinity
#include <optional>   // optional tail/head filters
#include <sstream>    // label()
#include <string>     // label()
#include <vector>     // cascading removal

namespace fuzz {

// ==========================
// Fuzzy graph
// ==========================
// Vertices and edges each carry a membership degree, kept in two FuzzySets.
// Queries follow Graph (same directed/undirected overlay) so the algorithms
// in fuzz/algo run on a FuzzyGraph as well, with weight = 1 / membership.
// alpha() and strong_alpha() project to a crisp Graph.
// ==========================
template <typename V>
class FuzzyGraph {
public:
    using Vertex      = V;
    using Edge        = GraphEdge<V>;
    using Crisp       = Graph<V>;
    using Kind        = typename Crisp::Kind;
    using VertexSet   = typename Crisp::VertexSet;
    using EdgeSet     = typename Crisp::EdgeSet;
    using VertexFuzzy = FuzzySet<V>;
    using EdgeFuzzy   = FuzzySet<Edge>;

    // ---- Constructors ----

    explicit FuzzyGraph(Kind kind = Kind::Directed) : m_kind(kind) {}

    // Range elements may be plain vertices/edges (membership 1.0) or
    // FuzzyElements carrying their own degree.
    template <typename VRange, typename ERange>
    FuzzyGraph(const VRange& vertices, const ERange& edges, Kind kind = Kind::Directed) : m_kind(kind) {
        for (const auto& v : vertices) add_vertex(v);
        for (const auto& e : edges) add_edge(e);
    }

    // ---- Properties ----

    Kind kind() const noexcept { return m_kind; }
    bool directed() const noexcept { return m_kind == Kind::Directed; }

    VertexSet vertices() const { return m_vertices.objects(); }
    bool has_vertex(const V& v) const { return m_vertices.contains(v); }

    const VertexFuzzy& fuzzy_vertices() const noexcept { return m_vertices; }
    const EdgeFuzzy& fuzzy_edges() const noexcept { return m_edges; }

    std::size_t vertex_count() const noexcept { return m_vertices.size(); }
    std::size_t edge_count() const noexcept { return m_edges.size(); }

    // ---- Mutation ----

    // Adding an existing vertex replaces its membership degree.
    void add_vertex(const FuzzyElement<V>& v) { m_vertices.add(v); }
    void add_vertex(const V& v, double mu = 1.0) { m_vertices.add(FuzzyElement<V>(v, mu)); }

    // Remove a vertex and every edge touching it.
    void remove_vertex(const V& v) {
        if (!has_vertex(v)) throw NotFoundError("vertex not in graph: " + detail::describe(v));
        std::vector<Edge> touching;
        for (const auto& e : m_edges)
            if (e.obj().contains(v)) touching.push_back(e.obj());
        for (const auto& e : touching) m_edges.remove(e);
        m_vertices.remove(v);
    }

    // Throws NotFoundError if an endpoint is missing and DuplicateError if the
    // edge (or, when undirected, its reverse) is already present.
    void add_edge(const FuzzyElement<Edge>& e) {
        const Edge& edge = e.obj();
        if (!has_vertex(edge.tail()) || !has_vertex(edge.head()))
            throw NotFoundError("tail and head must be in vertex set: " + detail::describe(edge));
        if (!edges(edge.tail(), edge.head()).empty())
            throw DuplicateError("edge already exists: " + detail::describe(edge));
        m_edges.add(e);
    }

    void add_edge(const Edge& e, double mu = 1.0) { add_edge(FuzzyElement<Edge>(e, mu)); }

    void connect(const V& tail, const V& head, double mu = 1.0) { add_edge(Edge(tail, head), mu); }

    // Remove every edge matching (tail, head); nothing matching is not an error.
    void remove_edge(const V& tail, const V& head) {
        std::vector<Edge> doomed;
        for (const auto& e : m_edges)
            if (matches(e.obj(), tail, head)) doomed.push_back(e.obj());
        for (const auto& e : doomed) m_edges.remove(e);
    }

    void disconnect(const V& tail, const V& head) { remove_edge(tail, head); }

    // ---- Queries ----

    // Same contract as Graph::edges, over the wrapped edge objects.
    EdgeSet edges(const std::optional<V>& tail = std::nullopt,
                  const std::optional<V>& head = std::nullopt) const {
        if ((tail && !has_vertex(*tail)) || (head && !has_vertex(*head)))
            throw NotFoundError("specified tail/head must be in vertex set");
        EdgeSet out;
        for (const auto& fe : m_edges) {
            const Edge& e = fe.obj();
            bool forward = (!tail || e.tail() == *tail) && (!head || e.head() == *head);
            bool backward = !directed() && (!tail || e.head() == *tail) && (!head || e.tail() == *head);
            if (forward || backward) out.insert(e);
        }
        return out;
    }

    // Membership degree of a vertex, 0 if absent.
    double vertex_membership(const V& v) const { return m_vertices.mu(v); }

    // Membership degree of the edge joining tail to head, 0 if there is none.
    double membership(const V& tail, const V& head) const {
        if (!has_vertex(tail) || !has_vertex(head)) return 0.0;
        for (const auto& fe : m_edges)
            if (matches(fe.obj(), tail, head)) return fe.mu;
        return 0.0;
    }

    // Traversal cost: 0 for tail == head, 1 / membership otherwise, infinity
    // when the membership is 0.
    double weight(const V& tail, const V& head) const {
        if (tail == head) return 0.0;
        const double mu = membership(tail, head);
        if (mu == 0.0) return std::numeric_limits<double>::infinity();
        return 1.0 / mu;
    }

    bool adjacent(const V& tail, const V& head) const {
        if (tail == head) return false;
        return !edges(tail, head).empty();
    }

    VertexSet neighbors(const V& v) const {
        VertexSet out;
        for (const auto& fe : m_vertices)
            if (adjacent(v, fe.obj())) out.insert(fe.obj());
        return out;
    }

    // ---- Cuts ----

    // Crisp graph of vertices and edges with membership >= a; edges losing an
    // endpoint are dropped.
    Crisp alpha(double a) const { return project(m_vertices.alpha(a), m_edges.alpha(a)); }

    // As alpha() with membership > a.
    Crisp strong_alpha(double a) const {
        return project(m_vertices.strong_alpha(a), m_edges.strong_alpha(a));
    }

    // Rescale vertex and edge degrees independently so each height is 1.
    void normalize() {
        m_vertices.normalize();
        m_edges.normalize();
    }

    // ---- Binary relations (fuzzy subgraph: pointwise degree <=) ----

    bool issubgraph(const FuzzyGraph& other) const {
        return m_vertices.issubset(other.m_vertices) && m_edges.issubset(other.m_edges);
    }

    bool issupergraph(const FuzzyGraph& other) const { return other.issubgraph(*this); }

    friend bool operator==(const FuzzyGraph& a, const FuzzyGraph& b) {
        return a.m_vertices == b.m_vertices && a.m_edges == b.m_edges;
    }
    friend bool operator!=(const FuzzyGraph& a, const FuzzyGraph& b) { return !(a == b); }
    friend bool operator<=(const FuzzyGraph& a, const FuzzyGraph& b) { return a.issubgraph(b); }
    friend bool operator>=(const FuzzyGraph& a, const FuzzyGraph& b) { return a.issupergraph(b); }
    friend bool operator<(const FuzzyGraph& a, const FuzzyGraph& b) { return a.issubgraph(b) && a != b; }
    friend bool operator>(const FuzzyGraph& a, const FuzzyGraph& b) { return a.issupergraph(b) && a != b; }

    // "DirectedFuzzyGraph(VV,EE)" or "UndirectedFuzzyGraph(VV,EE)"
    std::string label() const {
        std::ostringstream oss;
        oss << (directed() ? "Directed" : "Undirected");
        oss << "FuzzyGraph(" << vertex_count() << "V," << edge_count() << "E)";
        return oss.str();
    }

private:
    bool matches(const Edge& e, const V& tail, const V& head) const {
        if (e.tail() == tail && e.head() == head) return true;
        return !directed() && e.tail() == head && e.head() == tail;
    }

    Crisp project(const VertexSet& vs, const EdgeSet& es) const {
        Crisp g(m_kind);
        for (const auto& v : vs) g.add_vertex(v);
        for (const auto& e : es)
            if (vs.count(e.tail()) && vs.count(e.head())) g.add_edge(e);
        return g;
    }

    Kind m_kind;            // fixed at construction
    VertexFuzzy m_vertices;
    EdgeFuzzy m_edges;
};

} // namespace fuzz
