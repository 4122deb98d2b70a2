#pragma once
#include "fuzz/fuzzy/FuzzyGraph.hpp"   // TextGraph
#include <memory>
#include <string>

namespace fuzz {

// Graph type handled by the text front end: string vertices, fuzzy degrees.
using TextGraph = FuzzyGraph<std::string>;

// Parameters a strategy may read (unused fields are ignored).
struct AlgorithmOptions {
    std::string source;    // PATH / CONNECTED start vertex
    std::string target;    // PATH / CONNECTED end vertex
    double alpha = 0.0;    // ALPHA threshold
    bool strong = false;   // ALPHA: strict (>) instead of >=
};

// Strategy interface all algorithms implement
struct IGraphAlgorithm {
    virtual ~IGraphAlgorithm() = default;
    virtual std::string run(const TextGraph& g) = 0;
};

// Factory that returns a concrete strategy by name
// Accepts: "ALPHA", "PATH", "FLOYD", "MST", "SPS", "CONNECTED", "NORMALIZE"
// (case-insensitive); returns nullptr for anything else.
struct AlgorithmFactory {
    static std::unique_ptr<IGraphAlgorithm> create(const std::string& name,
                                                   const AlgorithmOptions& opts = AlgorithmOptions{});
};

} // namespace fuzz
