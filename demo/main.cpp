// ==========================
// Fuzzy graph demo
// ==========================
// Builds a small undirected fuzzy graph, takes alpha cuts of it and runs
// the crisp algorithms on the result.
// ==========================

#include "fuzz/algo/GraphText.hpp"        // formatVertices, formatEdges, formatPath
#include "fuzz/algo/ShortestPath.hpp"     // shortest_path
#include "fuzz/algo/Spanning.hpp"         // minimum_spanning_tree
#include "fuzz/fuzzy/FuzzyGraph.hpp"      // FuzzyGraph

#include <iostream>          // for std::cout
#include <string>            // vertex names

int main() {
    using G = fuzz::FuzzyGraph<std::string>;

    // Four stations; links are trusted to different degrees.
    G g(G::Kind::Undirected);
    g.add_vertex("A");
    g.add_vertex("B");
    g.add_vertex("C", 0.9);
    g.add_vertex("D", 0.4);
    g.connect("A", "B", 0.8);
    g.connect("B", "C", 0.5);
    g.connect("A", "C", 0.2);
    g.connect("C", "D", 1.0);

    std::cout << g.label() << "\n";

    // Cheapest route uses the strong links: cost is 1 / membership.
    std::cout << "A to C: " << fuzz::formatPath(fuzz::shortest_path(g, "A", "C")) << "\n";

    // Alpha cuts drop weak links (and, below, the weak vertex D with its edge).
    const auto cut = g.alpha(0.5);
    std::cout << "alpha(0.5):        " << cut.label() << " " << fuzz::formatEdges(cut.edges()) << "\n";
    const auto strong = g.strong_alpha(0.5);
    std::cout << "strong_alpha(0.5): " << strong.label() << " " << fuzz::formatEdges(strong.edges()) << "\n";

    // Spanning tree over the fuzzy costs.
    const auto tree = fuzz::minimum_spanning_tree(g);
    std::cout << "MST: " << fuzz::formatEdges(tree.edges()) << "\n";

    return 0; // indicate successful run
}
