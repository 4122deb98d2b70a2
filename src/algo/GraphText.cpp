// ==========================
// GraphText.cpp
// ==========================
// Parsing of the "A:0.8,B" / "A-B:0.5" graph lists used by the command
// line front end, and the formatting helpers the strategies share.
// ==========================

#include "fuzz/algo/GraphText.hpp"   // declarations

#include <algorithm>     // std::sort
#include <cctype>        // std::isspace
#include <cmath>         // std::isinf
#include <sstream>       // std::ostringstream, std::istringstream
#include <stdexcept>     // std::invalid_argument
#include <vector>        // token lists

namespace fuzz {

// ---------- helper: trim surrounding whitespace ----------
static std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();                                     // [b, e) is the kept range
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// ---------- helper: split on commas, dropping empty items ----------
static std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);                                            // stream over the list
    std::string item;
    while (std::getline(in, item, ',')) {                                // one comma-separated token
        item = trim(item);
        if (!item.empty()) out.push_back(item);
    }
    return out;
}

// ---------- helper: "name[:degree]" -> (name, degree) ----------
static std::pair<std::string, double> splitDegree(const std::string& token) {
    const auto colon = token.rfind(':');
    if (colon == std::string::npos) return {token, 1.0};                 // no degree: full membership

    const std::string name = trim(token.substr(0, colon));
    const std::string degree = trim(token.substr(colon + 1));
    if (name.empty() || degree.empty())
        throw std::invalid_argument("malformed item: '" + token + "'");

    std::size_t used = 0;
    double mu = 0.0;
    try {
        mu = std::stod(degree, &used);                                   // parse the degree
    } catch (const std::exception&) {
        throw std::invalid_argument("bad membership degree in '" + token + "'");
    }
    if (used != degree.size()) throw std::invalid_argument("bad membership degree in '" + token + "'");
    return {name, mu};
}

TextGraph parseGraph(const std::string& vertexSpec, const std::string& edgeSpec, TextGraph::Kind kind) {
    TextGraph g(kind);

    for (const auto& token : splitList(vertexSpec)) {                    // vertices first
        const auto item = splitDegree(token);
        g.add_vertex(item.first, item.second);
    }

    for (const auto& token : splitList(edgeSpec)) {                      // then edges between them
        const auto item = splitDegree(token);
        const auto dash = item.first.find('-');
        if (dash == std::string::npos)
            throw std::invalid_argument("edge must look like tail-head: '" + token + "'");
        const std::string tail = trim(item.first.substr(0, dash));
        const std::string head = trim(item.first.substr(dash + 1));
        if (tail.empty() || head.empty())
            throw std::invalid_argument("edge must look like tail-head: '" + token + "'");
        g.connect(tail, head, item.second);                              // may throw NotFound/Duplicate/InvalidEdge
    }
    return g;
}

std::string formatNumber(double x) {
    if (std::isinf(x)) return "inf";
    std::ostringstream oss;
    oss << x;                                                            // default precision: 2, 0.5, 1.66667
    return oss.str();
}

std::string formatVertices(const std::unordered_set<std::string>& vertices) {
    std::vector<std::string> sorted(vertices.begin(), vertices.end());
    std::sort(sorted.begin(), sorted.end());

    std::ostringstream oss;
    oss << '{';
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        oss << sorted[i];
        if (i + 1 < sorted.size()) oss << ", ";
    }
    oss << '}';
    return oss.str();
}

std::string formatEdges(const Graph<std::string>::EdgeSet& edges) {
    std::vector<std::pair<std::string, std::string>> sorted;
    for (const auto& e : edges) sorted.emplace_back(e.tail(), e.head());
    std::sort(sorted.begin(), sorted.end());

    std::ostringstream oss;
    oss << '{';
    for (std::size_t i = 0; i < sorted.size(); ++i) {
        oss << '(' << sorted[i].first << ", " << sorted[i].second << ')';
        if (i + 1 < sorted.size()) oss << ", ";
    }
    oss << '}';
    return oss.str();
}

std::string formatPath(const Path<std::string>& path) {
    if (!path.found()) return "no path";
    std::ostringstream oss;
    for (std::size_t i = 0; i < path.vertices.size(); ++i) {
        oss << path.vertices[i];
        if (i + 1 < path.vertices.size()) oss << " -> ";
    }
    oss << " (distance " << formatNumber(path.distance) << ")";
    return oss.str();
}

} // namespace fuzz
