// hypergraph_state.cpp - Mutation, decomposition and canonical identity of game positions

#include <takeaway/hypergraph_state.hpp>
#include <takeaway/errors.hpp>
#include <iterator>
#include <map>
#include <queue>
#include <tuple>

namespace takeaway {

namespace {

constexpr std::size_t FNV_OFFSET_BASIS = 14695981039346656037ULL;
constexpr std::size_t FNV_PRIME = 1099511628211ULL;

void fnv_mix_byte(std::size_t& hash, unsigned char byte) {
    hash ^= byte;
    hash *= FNV_PRIME;
}

void fnv_mix_string(std::size_t& hash, const std::string& text) {
    for (char c : text) {
        fnv_mix_byte(hash, static_cast<unsigned char>(c));
    }
    // Terminator keeps {"ab"} and {"a","b"} apart
    fnv_mix_byte(hash, 0x00);
}

void fnv_mix_hyperedges(std::size_t& hash, const HyperedgeSet& hyperedges) {
    for (const auto& hyperedge : hyperedges) {
        for (const auto& vertex : hyperedge) {
            fnv_mix_string(hash, vertex);
        }
        fnv_mix_byte(hash, 0x01);
    }
}

std::string render_hyperedges(const HyperedgeSet& hyperedges) {
    std::string out = "{";
    bool first = true;
    for (const auto& hyperedge : hyperedges) {
        if (!first) out += ", ";
        out += hyperedge.to_string();
        first = false;
    }
    out += "}";
    return out;
}

} // namespace

// =============================================================================
// Mutation
// =============================================================================

void HypergraphState::check_members_present(const Hyperedge& hyperedge, const char* kind) const {
    for (const auto& vertex : hyperedge) {
        if (!has_vertex(vertex)) {
            throw ValidationError(std::string(kind) + " " + hyperedge.to_string() +
                                  " references missing vertex '" + vertex + "'");
        }
    }
}

void HypergraphState::add_vertex(const Vertex& vertex) {
    vertices_.insert(vertex);
}

void HypergraphState::add_edge(const Hyperedge& edge) {
    if (edge.arity() != 2) {
        throw ValidationError("Edge must connect exactly two distinct vertices, got " + edge.to_string());
    }
    check_members_present(edge, "Edge");
    edges_.insert(edge);
}

void HypergraphState::add_face(const Hyperedge& face) {
    if (face.empty()) {
        throw ValidationError("Face must contain at least one vertex");
    }
    check_members_present(face, "Face");
    faces_.insert(face);
}

void HypergraphState::remove_vertex(const Vertex& vertex) {
    if (vertices_.erase(vertex) == 0) {
        return;
    }

    // Cascade: drop every edge and face incident to the removed vertex
    for (auto it = edges_.begin(); it != edges_.end();) {
        it = it->contains(vertex) ? edges_.erase(it) : std::next(it);
    }
    for (auto it = faces_.begin(); it != faces_.end();) {
        it = it->contains(vertex) ? faces_.erase(it) : std::next(it);
    }
}

void HypergraphState::remove_edge(const Hyperedge& edge) {
    edges_.erase(edge);
}

void HypergraphState::remove_face(const Hyperedge& face) {
    faces_.erase(face);
}

void HypergraphState::remove_hyperedge(const Hyperedge& hyperedge) {
    for (auto it = faces_.begin(); it != faces_.end();) {
        it = hyperedge.is_subset_of(*it) ? faces_.erase(it) : std::next(it);
    }
    if (hyperedge.arity() == 2) {
        edges_.erase(hyperedge);
    }
}

// =============================================================================
// Queries
// =============================================================================

std::vector<Hyperedge> HypergraphState::hyperedges_containing(const Vertex& vertex) const {
    std::vector<Hyperedge> result;
    for (const auto& edge : edges_) {
        if (edge.contains(vertex)) result.push_back(edge);
    }
    for (const auto& face : faces_) {
        if (face.contains(vertex)) result.push_back(face);
    }
    return result;
}

std::vector<HypergraphState> HypergraphState::get_components() const {
    // Adjacency from co-occurrence in any edge or face
    std::map<Vertex, VertexSet> adjacency;
    auto connect = [&adjacency](const HyperedgeSet& hyperedges) {
        for (const auto& hyperedge : hyperedges) {
            for (const auto& u : hyperedge) {
                for (const auto& v : hyperedge) {
                    if (u != v) adjacency[u].insert(v);
                }
            }
        }
    };
    connect(edges_);
    connect(faces_);

    // Breadth-first search from each unvisited vertex, in canonical order
    std::map<Vertex, std::size_t> component_of;
    std::vector<HypergraphState> components;
    for (const auto& start : vertices_) {
        if (component_of.count(start)) continue;

        std::size_t index = components.size();
        components.emplace_back();
        HypergraphState& component = components.back();

        std::queue<Vertex> frontier;
        frontier.push(start);
        component_of[start] = index;
        while (!frontier.empty()) {
            Vertex current = frontier.front();
            frontier.pop();
            component.vertices_.insert(current);

            auto adj = adjacency.find(current);
            if (adj == adjacency.end()) continue;
            for (const auto& next : adj->second) {
                if (component_of.emplace(next, index).second) {
                    frontier.push(next);
                }
            }
        }
    }

    // A connected hyperedge lies entirely inside the component of its first vertex
    for (const auto& edge : edges_) {
        components[component_of.at(edge.vertex(0))].edges_.insert(edge);
    }
    for (const auto& face : faces_) {
        components[component_of.at(face.vertex(0))].faces_.insert(face);
    }

    return components;
}

// =============================================================================
// Canonical identity
// =============================================================================

std::size_t HypergraphState::hash() const {
    std::size_t hash = FNV_OFFSET_BASIS;
    for (const auto& vertex : vertices_) {
        fnv_mix_string(hash, vertex);
    }
    fnv_mix_byte(hash, 0x02);
    fnv_mix_hyperedges(hash, edges_);
    fnv_mix_byte(hash, 0x03);
    fnv_mix_hyperedges(hash, faces_);
    return hash;
}

bool HypergraphState::operator<(const HypergraphState& other) const {
    return std::tie(vertices_, edges_, faces_) < std::tie(other.vertices_, other.edges_, other.faces_);
}

std::string HypergraphState::to_string() const {
    std::string out = "V: {";
    bool first = true;
    for (const auto& vertex : vertices_) {
        if (!first) out += ", ";
        out += vertex;
        first = false;
    }
    out += "} | E: " + render_hyperedges(edges_);
    out += " | F: " + render_hyperedges(faces_);
    return out;
}

std::ostream& operator<<(std::ostream& os, const HypergraphState& state) {
    return os << state.to_string();
}

} // namespace takeaway
