#ifndef TAKEAWAY_HYPEREDGE_HPP
#define TAKEAWAY_HYPEREDGE_HPP

#include <takeaway/vertex.hpp>
#include <vector>
#include <algorithm>
#include <initializer_list>
#include <stdexcept>
#include <string>

namespace takeaway {

/**
 * Undirected hyperedge: an unordered set of vertices.
 * Vertices are kept sorted and de-duplicated, so {A,B,C} == {C,A,B}.
 * Backs both 2-vertex edges and larger faces of a HypergraphState.
 */
class Hyperedge {
private:
    std::vector<Vertex> vertices_;

    void normalize() {
        std::sort(vertices_.begin(), vertices_.end());
        vertices_.erase(std::unique(vertices_.begin(), vertices_.end()), vertices_.end());
    }

public:
    Hyperedge() = default;

    explicit Hyperedge(const std::vector<Vertex>& vertices)
        : vertices_(vertices) {
        normalize();
    }

    Hyperedge(std::initializer_list<Vertex> vertices)
        : vertices_(vertices) {
        normalize();
    }

    explicit Hyperedge(const VertexSet& vertices)
        : vertices_(vertices.begin(), vertices.end()) {}

    // Accessors
    const std::vector<Vertex>& vertices() const { return vertices_; }
    std::size_t arity() const { return vertices_.size(); }
    bool empty() const { return vertices_.empty(); }

    const Vertex& vertex(std::size_t index) const {
        if (index >= vertices_.size()) {
            throw std::out_of_range("Vertex index out of range");
        }
        return vertices_[index];
    }

    // Iterators
    auto begin() const { return vertices_.begin(); }
    auto end() const { return vertices_.end(); }

    bool contains(const Vertex& vertex) const {
        return std::binary_search(vertices_.begin(), vertices_.end(), vertex);
    }

    // True if every vertex of this hyperedge is also in other
    bool is_subset_of(const Hyperedge& other) const {
        return std::includes(other.vertices_.begin(), other.vertices_.end(),
                             vertices_.begin(), vertices_.end());
    }

    bool operator==(const Hyperedge& other) const {
        return vertices_ == other.vertices_;
    }

    bool operator!=(const Hyperedge& other) const {
        return !(*this == other);
    }

    // Lexicographic over the sorted vertex lists
    bool operator<(const Hyperedge& other) const {
        return vertices_ < other.vertices_;
    }

    // Renders as {a, b, c}
    std::string to_string() const {
        std::string out = "{";
        for (std::size_t i = 0; i < vertices_.size(); ++i) {
            if (i > 0) out += ", ";
            out += vertices_[i];
        }
        out += "}";
        return out;
    }
};

} // namespace takeaway

#endif // TAKEAWAY_HYPEREDGE_HPP
