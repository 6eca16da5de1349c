#ifndef TAKEAWAY_VERTEX_HPP
#define TAKEAWAY_VERTEX_HPP

#include <set>
#include <string>

namespace takeaway {

// Vertices are opaque labels. Ordering on the label gives the canonical order
// used by every container in a HypergraphState.
using Vertex = std::string;

using VertexSet = std::set<Vertex>;

} // namespace takeaway

#endif // TAKEAWAY_VERTEX_HPP
