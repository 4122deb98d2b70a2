// ==========================
// Graph.cpp
// ==========================
// The graph containers are class templates defined in their headers.
// This file instantiates them for the vertex types the library ships with
// (strings for the text front end, integers for numeric work), so every
// member is compiled once into the library.
// ==========================

#include "fuzz/fuzzy/FuzzyGraph.hpp"     // FuzzyGraph, FuzzySet
#include "fuzz/graph/Graph.hpp"          // Graph
#include "fuzz/graph/WeightedGraph.hpp"  // WeightedGraph

#include <string>        // std::string vertices

namespace fuzz {

template class Graph<std::string>;
template class Graph<int>;

template class WeightedGraph<std::string>;
template class WeightedGraph<int>;

template class FuzzyGraph<std::string>;
template class FuzzyGraph<int>;

} // namespace fuzz
