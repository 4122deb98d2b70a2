#pragma once                              // ensure this header is included only once per translation unit

#include "fuzz/algo/GraphAlgorithm.hpp"   // TextGraph
#include "fuzz/algo/ShortestPath.hpp"     // Path
#include "fuzz/graph/Graph.hpp"           // crisp edge sets

#include <string>         // text in and out
#include <unordered_set>  // vertex sets

namespace fuzz {

// ==========================
// Text form of graphs
// ==========================
// Vertices: "A:0.8,B,C"     (degree defaults to 1.0)
// Edges:    "A-B:0.5,B-C"   (degree defaults to 1.0)
// Output helpers sort their items so results are stable across runs.
// ==========================

// Build a graph from the two lists. Malformed text throws
// std::invalid_argument; edges naming unknown vertices throw NotFoundError.
TextGraph parseGraph(const std::string& vertexSpec, const std::string& edgeSpec,
                     TextGraph::Kind kind = TextGraph::Kind::Undirected);

// Shortest decimal form of a cost or degree; "inf" for infinity.
std::string formatNumber(double x);

// "{A, B, C}"
std::string formatVertices(const std::unordered_set<std::string>& vertices);

// "{(A, B), (B, C)}"
std::string formatEdges(const Graph<std::string>::EdgeSet& edges);

// "A -> B -> C (distance 2)" or "no path"
std::string formatPath(const Path<std::string>& path);

} // namespace fuzz
