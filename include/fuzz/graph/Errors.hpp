#pragma once                              // ensure this header is included only once per translation unit

#include <sstream>       // used to render offending values into messages
#include <stdexcept>     // std::runtime_error base class
#include <string>        // std::string messages
#include <type_traits>   // std::true_type / std::false_type for the streamable trait
#include <utility>       // std::declval

namespace fuzz {

// Kind of failure raised by the graph and indexed-set containers.
enum class ErrorKind { Type, NotFound, Duplicate, InvalidEdge, Unsupported };

// Short name of an error kind ("TypeKind", "NotFoundKind", ...).
const char* kindName(ErrorKind kind) noexcept;

// Common base of every error thrown by the library.
// what() reads "<KindName>: <message>".
class GraphError : public std::runtime_error {
public:
    GraphError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

// Wrong kind of value where a specific one is required (e.g. an index or
// vertex that is not equal to itself and so cannot be hashed meaningfully).
struct TypeError : GraphError {
    explicit TypeError(const std::string& message) : GraphError(ErrorKind::Type, message) {}
};

// Lookup or removal of a key, vertex or edge that is absent.
struct NotFoundError : GraphError {
    explicit NotFoundError(const std::string& message) : GraphError(ErrorKind::NotFound, message) {}
};

// Insertion of an edge that already exists.
struct DuplicateError : GraphError {
    explicit DuplicateError(const std::string& message) : GraphError(ErrorKind::Duplicate, message) {}
};

// Construction of a self-loop edge.
struct InvalidEdgeError : GraphError {
    explicit InvalidEdgeError(const std::string& message) : GraphError(ErrorKind::InvalidEdge, message) {}
};

// Operation invoked on a graph shape it does not support.
struct UnsupportedError : GraphError {
    explicit UnsupportedError(const std::string& message) : GraphError(ErrorKind::Unsupported, message) {}
};

namespace detail {

template <typename T, typename = void>
struct is_streamable : std::false_type {};

template <typename T>
struct is_streamable<T, decltype(void(std::declval<std::ostream&>() << std::declval<const T&>()))>
    : std::true_type {};

// Render a value for an error message; falls back to a placeholder for types
// without operator<<.
template <typename T>
std::string describe(const T& value) {
    if constexpr (is_streamable<T>::value) {
        std::ostringstream oss;
        oss << value;
        return oss.str();
    } else {
        return "<value>";
    }
}

// A value that does not compare equal to itself (NaN and friends) cannot act
// as a set key: reject it.
template <typename T>
void requireSelfEqual(const T& value, const char* what) {
    if (!(value == value))
        throw TypeError(std::string(what) + " must be equality-comparable with itself: " + describe(value));
}

} // namespace detail

} // namespace fuzz
