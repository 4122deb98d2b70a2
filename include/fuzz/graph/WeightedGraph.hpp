#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/graph/Graph.hpp"   // base crisp graph

#include <cmath>          // std::isnan
#include <limits>         // infinity
#include <stdexcept>      // std::invalid_argument
#include <string>         // messages
#include <unordered_map>  // per-edge weights

namespace fuzz {

// ==========================
// Weighted crisp graph
// ==========================
// A Graph whose edges carry a non-negative cost. weight() is what the
// algorithms in fuzz/algo read, so Dijkstra, Floyd-Warshall and Kruskal run
// over these costs unchanged.
// ==========================
template <typename V>
class WeightedGraph : public Graph<V> {
public:
    using Base = Graph<V>;
    using Kind = typename Base::Kind;
    using Edge = typename Base::Edge;

    explicit WeightedGraph(Kind kind = Kind::Directed) : Base(kind) {}

    // Unit-weight edges.
    void add_edge(const Edge& e) override { add_edge(e, 1.0); }

    // Throws std::invalid_argument for a negative or NaN weight, otherwise as
    // Graph::add_edge.
    void add_edge(const Edge& e, double w) {
        checkWeight(w);
        Base::add_edge(e);
        m_weights[e] = w;
    }

    void connect(const V& tail, const V& head, double w = 1.0) { add_edge(Edge(tail, head), w); }

    void remove_edge(const V& tail, const V& head) override {
        Base::remove_edge(tail, head);
        for (auto it = m_weights.begin(); it != m_weights.end();) {
            if (this->matches(it->first, tail, head)) it = m_weights.erase(it);
            else ++it;
        }
    }

    // Re-weight every stored edge matching (tail, head); NotFoundError if none.
    void set_weight(const V& tail, const V& head, double w) {
        checkWeight(w);
        auto matching = this->edges(tail, head);
        if (matching.empty())
            throw NotFoundError("no edge between " + detail::describe(tail) + " and " + detail::describe(head));
        for (const auto& e : matching) m_weights[e] = w;
    }

    // 0 for tail == head, the cheapest matching edge otherwise, infinity if
    // no edge joins them.
    double weight(const V& tail, const V& head) const override {
        if (tail == head) return 0.0;
        double best = std::numeric_limits<double>::infinity();
        for (const auto& e : this->edges(tail, head)) {
            auto it = m_weights.find(e);
            double w = it == m_weights.end() ? 1.0 : it->second;
            if (w < best) best = w;
        }
        return best;
    }

protected:
    // Assigned through a Graph<V>&: the new edges come without costs.
    void edges_replaced() noexcept override { m_weights.clear(); }

private:
    static void checkWeight(double w) {
        if (std::isnan(w) || w < 0.0)
            throw std::invalid_argument("edge weight must be non-negative: " + std::to_string(w));
    }

    std::unordered_map<Edge, double> m_weights;
};

} // namespace fuzz
