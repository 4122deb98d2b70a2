// ==========================
// tests/test_fuzzy_graph.cpp
// ==========================
// Unit tests for FuzzySet and FuzzyGraph: membership lookup, reciprocal
// weights, alpha cuts, normalization and fuzzy containment.
// ==========================

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include "fuzz/fuzzy/FuzzyGraph.hpp"
#include "fuzz/fuzzy/FuzzySet.hpp"

#include <limits>            // infinity
#include <stdexcept>         // std::invalid_argument
#include <string>            // std::string
#include <vector>            // std::vector

using FGraph = fuzz::FuzzyGraph<std::string>;
using SEdge  = fuzz::GraphEdge<std::string>;

static const double kInf = std::numeric_limits<double>::infinity();

// X and Y fully present, joined with degree 0.5.
static FGraph makePair(FGraph::Kind kind = FGraph::Kind::Directed) {
    FGraph g(kind);
    g.add_vertex("X", 1.0);
    g.add_vertex("Y", 1.0);
    g.connect("X", "Y", 0.5);
    return g;
}

// ---------------- FuzzySet ----------------

TEST_CASE("FuzzySet cuts and height") {
    fuzz::FuzzySet<std::string> s;
    s.add("a", 0.2);
    s.add("b", 0.5);
    s.add("c", 0.9);
    CHECK(s.mu("b") == 0.5);
    CHECK(s.mu("zz") == 0.0);
    CHECK(s.height() == 0.9);
    CHECK(s.alpha(0.5) == fuzz::FuzzySet<std::string>::Objects{"b", "c"});
    CHECK(s.strong_alpha(0.5) == fuzz::FuzzySet<std::string>::Objects{"c"});
    CHECK(s.objects().size() == 3);
}

TEST_CASE("FuzzySet degree can be changed in place") {
    fuzz::FuzzySet<std::string> s;
    s.add("a", 0.2);
    s.get("a").mu = 0.7;
    CHECK(s.mu("a") == 0.7);
}

TEST_CASE("FuzzySet equality needs equal degrees both ways") {
    fuzz::FuzzySet<int> low;
    fuzz::FuzzySet<int> high;
    low.add(1, 0.2);
    high.add(1, 0.5);
    CHECK_FALSE(low == high);
    CHECK_FALSE(high == low);
    CHECK(low != high);
    CHECK(low.issubset(high));

    high.get(1).mu = 0.2;
    CHECK(low == high);
    CHECK(high == low);

    high.add(2, 0.0);                                  // extra object, even at degree 0
    CHECK_FALSE(low == high);
    CHECK_FALSE(high == low);
}

TEST_CASE("FuzzySet accepts its own element back") {
    fuzz::FuzzySet<std::string> s;
    const std::string name(45, 'v');
    s.add(name, 0.6);
    s.add(*s.begin());
    CHECK(s.size() == 1);
    CHECK(s.mu(name) == 0.6);
}

TEST_CASE("FuzzyElement rejects degrees outside [0, 1]") {
    CHECK_THROWS_AS(fuzz::FuzzyElement<std::string>("a", 1.5), std::invalid_argument);
    CHECK_THROWS_AS(fuzz::FuzzyElement<std::string>("a", -0.1), std::invalid_argument);
    CHECK_NOTHROW(fuzz::FuzzyElement<std::string>("a", 0.0));
}

TEST_CASE("FuzzySet normalize of an all-zero set is a no-op") {
    fuzz::FuzzySet<int> s;
    s.add(1, 0.0);
    s.normalize();
    CHECK(s.mu(1) == 0.0);
}

// ---------------- FuzzyGraph: construction ----------------

TEST_CASE("plain vertices and edges default to membership 1") {
    std::vector<std::string> vs{"a", "b"};
    std::vector<SEdge> es{SEdge("a", "b")};
    FGraph g(vs, es, FGraph::Kind::Undirected);
    CHECK(g.vertex_membership("a") == 1.0);
    CHECK(g.membership("a", "b") == 1.0);
    CHECK(g.label() == "UndirectedFuzzyGraph(2V,1E)");
}

TEST_CASE("ranges of fuzzy elements keep their degrees") {
    std::vector<fuzz::FuzzyElement<std::string>> vs{fuzz::FuzzyElement<std::string>("a", 0.3),
                                                    fuzz::FuzzyElement<std::string>("b", 0.6)};
    std::vector<fuzz::FuzzyElement<SEdge>> es{fuzz::FuzzyElement<SEdge>(SEdge("a", "b"), 0.4)};
    FGraph g(vs, es);
    CHECK(g.vertex_membership("a") == 0.3);
    CHECK(g.vertex_membership("b") == 0.6);
    CHECK(g.membership("a", "b") == 0.4);
}

TEST_CASE("re-adding a vertex replaces its degree") {
    FGraph g;
    g.add_vertex("a", 0.3);
    g.add_vertex("a", 0.8);
    CHECK(g.vertex_count() == 1);
    CHECK(g.vertex_membership("a") == 0.8);
}

TEST_CASE("add_edge errors") {
    FGraph g = makePair();
    CHECK_THROWS_AS(g.connect("X", "Z", 0.5), fuzz::NotFoundError);
    CHECK_THROWS_AS(g.connect("X", "Y", 0.9), fuzz::DuplicateError);
    CHECK_THROWS_AS(g.connect("X", "X", 0.9), fuzz::InvalidEdgeError);
    CHECK(g.membership("X", "Y") == 0.5);              // original degree kept
}

// ---------------- FuzzyGraph: queries ----------------

TEST_CASE("membership and reciprocal weight") {
    FGraph g = makePair();
    CHECK(g.membership("X", "Y") == 0.5);
    CHECK(g.weight("X", "Y") == 2.0);
    CHECK(g.weight("X", "X") == 0.0);
    CHECK(g.membership("Y", "X") == 0.0);              // directed: no reverse edge
    CHECK(g.weight("Y", "X") == kInf);
    CHECK(g.membership("X", "nowhere") == 0.0);
}

TEST_CASE("undirected fuzzy graph reads edges both ways") {
    FGraph g = makePair(FGraph::Kind::Undirected);
    CHECK(g.membership("Y", "X") == 0.5);
    CHECK(g.weight("Y", "X") == 2.0);
    CHECK(g.edges("Y", "X").count(SEdge("X", "Y")) == 1);
    CHECK(g.adjacent("Y", "X"));
    CHECK(g.neighbors("Y") == FGraph::VertexSet{"X"});
    CHECK_THROWS_AS(g.connect("Y", "X", 0.1), fuzz::DuplicateError);
    CHECK_THROWS_AS((void)g.edges("Q"), fuzz::NotFoundError);
}

TEST_CASE("zero-degree edge costs infinity") {
    FGraph g;
    g.add_vertex("a");
    g.add_vertex("b");
    g.connect("a", "b", 0.0);
    CHECK(g.membership("a", "b") == 0.0);
    CHECK(g.weight("a", "b") == kInf);
}

// ---------------- FuzzyGraph: cuts ----------------

TEST_CASE("alpha and strong alpha cuts at the edge degree") {
    FGraph g = makePair();
    auto cut = g.alpha(0.5);
    CHECK(cut.vertices().size() == 2);
    CHECK(cut.edges().count(SEdge("X", "Y")) == 1);
    CHECK(cut.directed());

    auto strong = g.strong_alpha(0.5);
    CHECK(strong.vertices().size() == 2);
    CHECK(strong.edges().empty());
}

TEST_CASE("cut vertices take their edges with them") {
    FGraph g(FGraph::Kind::Undirected);
    g.add_vertex("X", 1.0);
    g.add_vertex("Z", 0.3);
    g.connect("X", "Z", 0.9);                          // strong edge, weak endpoint
    auto cut = g.alpha(0.5);
    CHECK(cut.has_vertex("X"));
    CHECK_FALSE(cut.has_vertex("Z"));
    CHECK(cut.edge_count() == 0);
    CHECK_FALSE(cut.directed());
}

// ---------------- FuzzyGraph: normalization ----------------

TEST_CASE("normalize rescales vertices and edges independently") {
    FGraph g;
    g.add_vertex("a", 0.5);
    g.add_vertex("b", 0.25);
    g.add_vertex("c", 0.25);
    g.connect("a", "b", 0.4);
    g.connect("b", "c", 0.2);
    g.normalize();
    CHECK(g.vertex_membership("a") == 1.0);
    CHECK(g.vertex_membership("b") == 0.5);
    CHECK(g.membership("a", "b") == 1.0);
    CHECK(g.membership("b", "c") == 0.5);
}

TEST_CASE("normalize is idempotent") {
    FGraph g;
    g.add_vertex("a", 0.6);
    g.add_vertex("b", 0.3);
    g.connect("a", "b", 0.7);
    g.normalize();
    const double va = g.vertex_membership("a");
    const double vb = g.vertex_membership("b");
    const double e = g.membership("a", "b");
    g.normalize();
    CHECK(g.vertex_membership("a") == va);
    CHECK(g.vertex_membership("b") == vb);
    CHECK(g.membership("a", "b") == e);
}

// ---------------- FuzzyGraph: mutation and relations ----------------

TEST_CASE("remove_vertex cascades in a fuzzy graph") {
    FGraph g = makePair();
    g.add_vertex("W", 0.4);
    g.connect("W", "X", 0.4);
    g.remove_vertex("X");
    CHECK(g.edge_count() == 0);
    for (const auto& e : g.edges()) CHECK_FALSE(e.contains("X"));
    CHECK_THROWS_AS(g.remove_vertex("X"), fuzz::NotFoundError);

    FGraph h = makePair();
    CHECK_NOTHROW(h.remove_edge("Y", "X"));            // directed: nothing matches
    CHECK(h.edge_count() == 1);
    h.disconnect("X", "Y");
    CHECK(h.edge_count() == 0);
}

TEST_CASE("fuzzy subgraph compares degrees pointwise") {
    FGraph g = makePair();
    CHECK(g.issubgraph(g));
    CHECK_FALSE(g < g);
    CHECK(g == g);

    FGraph weaker = makePair();
    weaker.disconnect("X", "Y");
    weaker.connect("X", "Y", 0.2);
    CHECK(weaker.issubgraph(g));
    CHECK(weaker < g);
    CHECK(g > weaker);
    CHECK_FALSE(g.issubgraph(weaker));
    CHECK_FALSE(weaker == g);
    CHECK_FALSE(g == weaker);
    CHECK(weaker != g);
    CHECK(weaker <= g);
    CHECK_FALSE(g <= weaker);
}

TEST_CASE("re-adding a stored fuzzy vertex keeps the graph unchanged") {
    FGraph g = makePair();
    const FGraph before = g;
    g.add_vertex(*g.fuzzy_vertices().begin());
    CHECK(g == before);
    CHECK(g.vertex_count() == 2);
    g.remove_vertex(g.fuzzy_vertices().begin()->obj());
    CHECK(g.vertex_count() == 1);
    CHECK(g.edge_count() == 0);
}
