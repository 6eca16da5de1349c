#ifndef TAKEAWAY_ERRORS_HPP
#define TAKEAWAY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace takeaway {

/**
 * Thrown by HypergraphState insertions when an edge or face has the wrong
 * arity or references a vertex that is not in the state.
 * Removals never throw.
 */
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * Thrown by TurnEngine::move_vertex when the vertex is not in the live state.
 * The engine is unchanged, so the caller may retry with another vertex.
 */
class InvalidMoveError : public std::invalid_argument {
public:
    explicit InvalidMoveError(const std::string& message)
        : std::invalid_argument(message) {}
};

} // namespace takeaway

#endif // TAKEAWAY_ERRORS_HPP
