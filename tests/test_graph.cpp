// ==========================
// tests/test_graph.cpp
// ==========================
// Unit tests for GraphEdge, Graph and WeightedGraph: construction rules,
// the directed/undirected query overlay, cascading removal, weights and
// graph containment.
// ==========================

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "fuzz/graph/Graph.hpp"
#include "fuzz/graph/GraphEdge.hpp"
#include "fuzz/graph/WeightedGraph.hpp"

#include <cmath>             // std::nan
#include <functional>        // std::hash
#include <limits>            // infinity
#include <stdexcept>         // std::invalid_argument
#include <optional>          // std::nullopt
#include <string>            // std::string
#include <vector>            // std::vector

using SGraph = fuzz::Graph<std::string>;
using SEdge  = fuzz::GraphEdge<std::string>;
using IGraph = fuzz::Graph<int>;
using IEdge  = fuzz::GraphEdge<int>;

static const double kInf = std::numeric_limits<double>::infinity();

// Path a -> b -> c plus an isolated d.
static SGraph makeChain(SGraph::Kind kind) {
    SGraph g(kind);
    for (const char* v : {"a", "b", "c", "d"}) g.add_vertex(v);
    g.connect("a", "b");
    g.connect("b", "c");
    return g;
}

// ---------------- GraphEdge ----------------

TEST_CASE("GraphEdge equality is ordered, hash is symmetric") {
    SEdge ab("a", "b");
    CHECK(ab == SEdge("a", "b"));
    CHECK_FALSE(ab == SEdge("b", "a"));
    CHECK(ab != SEdge("b", "a"));
    std::hash<SEdge> h;
    CHECK(h(ab) == h(SEdge("b", "a")));
}

TEST_CASE("GraphEdge rejects self-loops") {
    CHECK_THROWS_AS(SEdge("a", "a"), fuzz::InvalidEdgeError);
    for (int v : {0, 1, -7, 42}) CHECK_THROWS_AS(IEdge(v, v), fuzz::InvalidEdgeError);
}

TEST_CASE("GraphEdge contains() and reverse()") {
    SEdge ab("a", "b");
    CHECK(ab.contains("a"));
    CHECK(ab.contains("b"));
    CHECK_FALSE(ab.contains("c"));
    SEdge ba = ab.reverse();
    CHECK(ba.tail() == "b");
    CHECK(ba.head() == "a");
    CHECK(ab.tail() == "a");               // original untouched
}

// ---------------- Graph: vertices and edges ----------------

TEST_CASE("add_edge then lookup; second add is a duplicate") {
    SGraph g({"a", "b"}, {});
    SEdge e("a", "b");
    g.add_edge(e);
    CHECK(g.edges().count(e) == 1);
    CHECK_THROWS_AS(g.add_edge(e), fuzz::DuplicateError);
}

TEST_CASE("add_edge requires both endpoints") {
    SGraph g({"a"}, {});
    CHECK_THROWS_AS(g.add_edge(SEdge("a", "z")), fuzz::NotFoundError);
    CHECK_THROWS_AS(g.connect("z", "a"), fuzz::NotFoundError);
    CHECK(g.edge_count() == 0);
}

TEST_CASE("vertex that is not equal to itself raises TypeError") {
    fuzz::Graph<double> g;
    CHECK_THROWS_AS(g.add_vertex(std::nan("")), fuzz::TypeError);
    CHECK_NOTHROW(g.add_vertex(1.5));
}

TEST_CASE("directed graph keeps both orientations apart") {
    SGraph g({"a", "b"}, {});
    g.connect("a", "b");
    CHECK_NOTHROW(g.connect("b", "a"));    // distinct arc when directed
    CHECK(g.edge_count() == 2);
    CHECK(g.edges("a", "b").size() == 1);
    CHECK(g.edges(std::nullopt, std::string("a")).count(SEdge("b", "a")) == 1);
}

TEST_CASE("undirected overlay is symmetric") {
    SGraph g = makeChain(SGraph::Kind::Undirected);
    for (const auto& a : g.vertices()) {
        for (const auto& b : g.vertices()) {
            if (a == b) continue;
            CHECK(g.edges(a, b).empty() == g.edges(b, a).empty());
        }
    }
    CHECK(g.edges("b", "a").count(SEdge("a", "b")) == 1);   // stored orientation returned
    CHECK_THROWS_AS(g.connect("b", "a"), fuzz::DuplicateError);
}

TEST_CASE("edges() with an unknown constraint throws") {
    SGraph g = makeChain(SGraph::Kind::Directed);
    CHECK_THROWS_AS((void)g.edges("zz"), fuzz::NotFoundError);
    CHECK(g.edges("b").size() == 1);                        // b -> c only
    CHECK(g.edges().size() == 2);
}

TEST_CASE("remove_vertex cascades to touching edges") {
    SGraph g = makeChain(SGraph::Kind::Undirected);
    g.remove_vertex("b");
    CHECK_FALSE(g.has_vertex("b"));
    for (const auto& e : g.edges()) CHECK_FALSE(e.contains("b"));
    CHECK(g.edge_count() == 0);
    CHECK_THROWS_AS(g.remove_vertex("b"), fuzz::NotFoundError);
}

TEST_CASE("remove_edge honours direction and is silent when nothing matches") {
    SGraph directed = makeChain(SGraph::Kind::Directed);
    directed.remove_edge("b", "a");                         // wrong way round: no-op
    CHECK(directed.edge_count() == 2);
    CHECK_NOTHROW(directed.remove_edge("a", "d"));
    CHECK_NOTHROW(directed.remove_edge("x", "y"));

    SGraph undirected = makeChain(SGraph::Kind::Undirected);
    undirected.remove_edge("b", "a");                       // either way round
    CHECK(undirected.edge_count() == 1);
    undirected.disconnect("c", "b");
    CHECK(undirected.edge_count() == 0);
}

TEST_CASE("weight() of the unweighted graph") {
    SGraph g = makeChain(SGraph::Kind::Directed);
    CHECK(g.weight("a", "a") == 0.0);
    CHECK(g.weight("a", "b") == 1.0);
    CHECK(g.weight("b", "a") == kInf);
    CHECK(g.weight("a", "c") == kInf);

    SGraph u = makeChain(SGraph::Kind::Undirected);
    CHECK(u.weight("b", "a") == 1.0);
}

TEST_CASE("adjacent() and neighbors()") {
    SGraph g = makeChain(SGraph::Kind::Directed);
    CHECK(g.adjacent("a", "b"));
    CHECK_FALSE(g.adjacent("b", "a"));
    CHECK_FALSE(g.adjacent("a", "a"));
    CHECK(g.neighbors("b") == SGraph::VertexSet{"c"});
    CHECK(g.neighbors("d").empty());

    SGraph u = makeChain(SGraph::Kind::Undirected);
    CHECK(u.neighbors("b") == SGraph::VertexSet{"a", "c"});
}

// ---------------- Graph: relations ----------------

TEST_CASE("subgraph relations are consistent") {
    SGraph g = makeChain(SGraph::Kind::Directed);
    CHECK(g.issubgraph(g));
    CHECK(g.issupergraph(g));
    CHECK(g <= g);
    CHECK_FALSE(g < g);
    CHECK_FALSE(g > g);
    CHECK(g == g);

    SGraph bigger = g;
    bigger.add_vertex("e");
    CHECK(g < bigger);
    CHECK(bigger > g);
    CHECK(g.issubgraph(bigger));
    CHECK_FALSE(bigger.issubgraph(g));
    CHECK(g != bigger);

    SGraph fewer = g;
    fewer.remove_edge("a", "b");
    CHECK(fewer < g);
}

TEST_CASE("equality needs identical vertex identities") {
    IGraph a({1, 2}, {IEdge(1, 2)});
    IGraph b({1, 2}, {IEdge(1, 2)});
    IGraph c({1, 2}, {IEdge(2, 1)});
    CHECK(a == b);
    CHECK(a != c);
}

TEST_CASE("construction from ranges and label()") {
    std::vector<int> vs{1, 2, 3};
    std::vector<IEdge> es{IEdge(1, 2), IEdge(2, 3)};
    IGraph g(vs, es, IGraph::Kind::Undirected);
    CHECK_FALSE(g.directed());
    CHECK(g.kind() == IGraph::Kind::Undirected);
    CHECK(g.label() == "UndirectedGraph(3V,2E)");

    IGraph d;
    CHECK(d.directed());                                  // default kind
    CHECK(d.label() == "DirectedGraph(0V,0E)");
}

// ---------------- WeightedGraph ----------------

TEST_CASE("WeightedGraph stores per-edge weights") {
    fuzz::WeightedGraph<int> g(IGraph::Kind::Undirected);
    for (int v : {1, 2, 3}) g.add_vertex(v);
    g.connect(1, 2, 2.5);
    g.add_edge(IEdge(2, 3));                               // unit weight
    CHECK(g.weight(1, 2) == 2.5);
    CHECK(g.weight(2, 1) == 2.5);                          // undirected overlay
    CHECK(g.weight(2, 3) == 1.0);
    CHECK(g.weight(1, 3) == kInf);
    CHECK(g.weight(3, 3) == 0.0);

    g.set_weight(3, 2, 4.0);
    CHECK(g.weight(2, 3) == 4.0);
    CHECK_THROWS_AS(g.set_weight(1, 3, 1.0), fuzz::NotFoundError);
}

TEST_CASE("WeightedGraph rejects negative weights and forgets removed edges") {
    fuzz::WeightedGraph<int> g(IGraph::Kind::Directed);
    g.add_vertex(1);
    g.add_vertex(2);
    CHECK_THROWS_AS(g.connect(1, 2, -1.0), std::invalid_argument);
    CHECK(g.edge_count() == 0);

    g.connect(1, 2, 7.0);
    g.remove_edge(1, 2);
    CHECK(g.weight(1, 2) == kInf);
    g.connect(1, 2);                                       // re-added with default weight
    CHECK(g.weight(1, 2) == 1.0);

    g.remove_vertex(2);
    CHECK(g.edge_count() == 0);
}

TEST_CASE("WeightedGraph assignment carries weights; plain Graph assignment drops them") {
    fuzz::WeightedGraph<int> w(IGraph::Kind::Directed);
    w.add_vertex(1);
    w.add_vertex(2);
    w.connect(1, 2, 5.0);

    fuzz::WeightedGraph<int> copy;
    copy = w;
    CHECK(copy.weight(1, 2) == 5.0);

    IGraph plain({1, 2}, {IEdge(1, 2)}, IGraph::Kind::Directed);
    IGraph& base = copy;
    base = plain;                                          // edges arrive without costs
    CHECK(copy.edge_count() == 1);
    CHECK(copy.weight(1, 2) == 1.0);
    CHECK(w.weight(1, 2) == 5.0);                          // source untouched
}
