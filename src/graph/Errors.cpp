// ==========================
// Errors.cpp
// ==========================
// Out-of-line pieces of the error taxonomy: kind names and the
// GraphError constructor that prefixes every message with its kind.
// ==========================

#include "fuzz/graph/Errors.hpp"   // error class declarations

namespace fuzz {

const char* kindName(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Type:        return "TypeKind";
    case ErrorKind::NotFound:    return "NotFoundKind";
    case ErrorKind::Duplicate:   return "DuplicateKind";
    case ErrorKind::InvalidEdge: return "InvalidEdgeKind";
    case ErrorKind::Unsupported: return "UnsupportedKind";
    }
    return "UnknownKind";                                   // unreachable for valid enumerators
}

GraphError::GraphError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(kindName(kind)) + ": " + message), // "<Kind>: <message>"
      m_kind(kind) {}

} // namespace fuzz
