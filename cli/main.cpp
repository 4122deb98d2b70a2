// ==========================
// fuzzgraph: command-line front end
// ==========================
// Parses: -a <ALG> -V <vertices> [-E <edges>] [-s <src>] [-t <dst>]
//         [-c <alpha>] [--strong] [--directed]
// Builds a fuzzy graph from the text lists and runs one strategy on it.
//   vertices: A:0.8,B,C      edges: A-B:0.5,B-C    (degree defaults to 1)
// ==========================

#include "fuzz/algo/GraphAlgorithm.hpp"   // AlgorithmFactory
#include "fuzz/algo/GraphText.hpp"        // parseGraph
#include "fuzz/graph/Errors.hpp"          // GraphError

#include <getopt.h>           // getopt_long for command-line parsing
#include <cstdlib>            // std::strtod, std::exit
#include <iostream>           // I/O
#include <stdexcept>          // std::invalid_argument
#include <string>             // std::string

static void usage(const char* prog) {                         // print usage and exit
    std::cerr << "Usage: " << prog
              << " -a <ALPHA|PATH|FLOYD|MST|SPS|CONNECTED|NORMALIZE>"
              << " -V <vertices> [-E <edges>] [-s <src>] [-t <dst>] [-c <alpha>]"
              << " [--strong] [--directed]\n";
    std::exit(1);
}

int main(int argc, char* argv[]) {                            // entry point
    std::string alg, vspec, espec;                            // required algorithm + graph text
    fuzz::AlgorithmOptions opts;                              // strategy parameters
    bool dir = false; int li = 0;                             // defaults and parsing state
    option lo[] = {{"directed", no_argument, nullptr, 'D'},   // long options
                   {"strong",   no_argument, nullptr, 'S'},
                   {nullptr, 0, nullptr, 0}};

    for (int opt; (opt = getopt_long(argc, argv, "a:V:E:s:t:c:", lo, &li)) != -1; ) { // parse flags
        if (opt=='a') alg = optarg;                           // algorithm name
        else if (opt=='V') vspec = optarg;                    // vertex list
        else if (opt=='E') espec = optarg;                    // edge list
        else if (opt=='s') opts.source = optarg;              // source vertex
        else if (opt=='t') opts.target = optarg;              // target vertex
        else if (opt=='c') {                                  // alpha threshold
            char* end = nullptr;
            opts.alpha = std::strtod(optarg, &end);
            if (end == optarg || *end != '\0') usage(argv[0]);
        }
        else if (opt=='S') opts.strong = true;                // strict cut
        else if (opt=='D') dir = true;                        // directed flag
        else usage(argv[0]);                                  // invalid flag
    }

    if (alg.empty() || vspec.empty()) usage(argv[0]);         // basic validation

    auto algo = fuzz::AlgorithmFactory::create(alg, opts);    // pick the strategy
    if (!algo) {
        std::cerr << "[fuzzgraph] unknown algorithm: " << alg << "\n";
        return 1;
    }

    try {
        const auto g = fuzz::parseGraph(vspec, espec,
                                        dir ? fuzz::TextGraph::Kind::Directed
                                            : fuzz::TextGraph::Kind::Undirected);
        std::cout << "Loaded " << g.label() << "\n";          // summary
        std::cout << algo->run(g) << "\n";                    // run the strategy
    } catch (const fuzz::GraphError& e) {                     // graph rule violated by the input
        std::cerr << "[fuzzgraph] " << e.what() << "\n";
        return 2;
    } catch (const std::invalid_argument& e) {                // malformed text
        std::cerr << "[fuzzgraph] " << e.what() << "\n";
        return 2;
    }

    return 0;                                                 // success
}
