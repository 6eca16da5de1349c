#ifndef TAKEAWAY_HYPERGRAPH_STATE_HPP
#define TAKEAWAY_HYPERGRAPH_STATE_HPP

#include <takeaway/vertex.hpp>
#include <takeaway/hyperedge.hpp>
#include <cstddef>
#include <functional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

namespace takeaway {

using HyperedgeSet = std::set<Hyperedge>;

/**
 * A position of the take-away game: vertices, 2-vertex edges and faces.
 *
 * Every member of an edge or face is checked against the vertex set at
 * insertion time, and removing a vertex removes every edge and face that
 * contains it, so no dangling references exist after any mutation.
 *
 * All three member sets are ordered containers. Their iteration order is the
 * canonical order, so equality, ordering, hashing and the display string are
 * independent of insertion order.
 */
class HypergraphState {
private:
    VertexSet vertices_;
    HyperedgeSet edges_;
    HyperedgeSet faces_;

    void check_members_present(const Hyperedge& hyperedge, const char* kind) const;

public:
    HypergraphState() = default;

    // Mutation
    void add_vertex(const Vertex& vertex);
    void add_edge(const Hyperedge& edge);
    void add_face(const Hyperedge& face);

    void remove_vertex(const Vertex& vertex);
    void remove_edge(const Hyperedge& edge);
    void remove_face(const Hyperedge& face);

    /**
     * Remove every face that is a superset of hyperedge, and the exact edge
     * if hyperedge has two vertices. Retracts a connection together with all
     * larger faces built on it.
     */
    void remove_hyperedge(const Hyperedge& hyperedge);

    // Accessors
    const VertexSet& vertices() const { return vertices_; }
    const HyperedgeSet& edges() const { return edges_; }
    const HyperedgeSet& faces() const { return faces_; }
    std::size_t num_vertices() const { return vertices_.size(); }
    std::size_t num_edges() const { return edges_.size(); }
    std::size_t num_faces() const { return faces_.size(); }

    bool has_vertex(const Vertex& vertex) const { return vertices_.count(vertex) > 0; }
    bool has_edge(const Hyperedge& edge) const { return edges_.count(edge) > 0; }
    bool has_face(const Hyperedge& face) const { return faces_.count(face) > 0; }
    bool is_empty() const { return vertices_.empty(); }

    // Edges and faces incident to vertex, edges first
    std::vector<Hyperedge> hyperedges_containing(const Vertex& vertex) const;

    // Independent value copy; no member container is shared with this state
    HypergraphState copy() const { return *this; }

    /**
     * Split into maximal connected sub-states. Two vertices are connected if
     * they share an edge or a face. Each component holds only the edges and
     * faces that lie inside its own vertex subset. Components are ordered by
     * their smallest vertex.
     */
    std::vector<HypergraphState> get_components() const;

    // Deterministic FNV-1a hash over the canonical form
    std::size_t hash() const;

    // "V: {..} | E: {..} | F: {..}"
    std::string to_string() const;

    bool operator==(const HypergraphState& other) const {
        return vertices_ == other.vertices_ && edges_ == other.edges_ && faces_ == other.faces_;
    }

    bool operator!=(const HypergraphState& other) const {
        return !(*this == other);
    }

    // Lexicographic by (vertices, edges, faces)
    bool operator<(const HypergraphState& other) const;
};

std::ostream& operator<<(std::ostream& os, const HypergraphState& state);

struct HypergraphStateHash {
    std::size_t operator()(const HypergraphState& state) const {
        return state.hash();
    }
};

} // namespace takeaway

namespace std {
    template<>
    struct hash<takeaway::HypergraphState> {
        std::size_t operator()(const takeaway::HypergraphState& state) const {
            return state.hash();
        }
    };
}

#endif // TAKEAWAY_HYPERGRAPH_STATE_HPP
