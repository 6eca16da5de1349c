#include <takeaway/game_tree.hpp>
#include <takeaway/debug_log.hpp>
#include <sstream>

namespace takeaway {

namespace {

void render(const GameTreeNode& node, std::size_t depth, std::ostringstream& oss) {
    oss << std::string(depth * 2, ' ') << node.state << " [g=" << node.grundy_number << "]";
    if (node.truncated) oss << " (truncated)";
    if (node.cycle_detected) oss << " (cycle)";
    oss << "\n";
    for (const auto& child : node.children) {
        render(child, depth + 1, oss);
    }
}

} // namespace

std::string GameTreeNode::to_string() const {
    std::ostringstream oss;
    render(*this, 0, oss);
    return oss.str();
}

std::size_t count_nodes(const GameTreeNode& node) {
    std::size_t total = 1;
    for (const auto& child : node.children) {
        total += count_nodes(child);
    }
    return total;
}

GameTreeNode GameTreeBuilder::build(const HypergraphState& state, int max_depth) {
    return build(state, max_depth, 0, {});
}

GameTreeNode GameTreeBuilder::build(const HypergraphState& state,
                                    int max_depth,
                                    int current_depth,
                                    std::set<HypergraphState> visited) {
    GameTreeNode node;
    node.state = state.to_string();

    if (max_depth != UNLIMITED_DEPTH && current_depth >= max_depth) {
        TAKEAWAY_DEBUG_LOG("depth %d reached, truncating at %s", current_depth, node.state.c_str());
        node.grundy_number = evaluator_.grundy(state);
        node.truncated = true;
        return node;
    }

    if (visited.count(state)) {
        TAKEAWAY_DEBUG_LOG("cycle at depth %d: %s", current_depth, node.state.c_str());
        node.grundy_number = evaluator_.grundy(state);
        node.cycle_detected = true;
        return node;
    }

    if (state.is_empty()) {
        node.grundy_number = 0;
        return node;
    }

    node.grundy_number = evaluator_.grundy(state);

    visited.insert(state);
    node.children.reserve(state.num_vertices());
    for (const auto& vertex : state.vertices()) {
        HypergraphState successor = state.copy();
        successor.remove_vertex(vertex);
        // Passed by value: every branch gets its own copy of the ancestor chain
        node.children.push_back(build(successor, max_depth, current_depth + 1, visited));
    }

    return node;
}

} // namespace takeaway
