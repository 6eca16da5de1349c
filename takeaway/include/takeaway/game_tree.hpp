#ifndef TAKEAWAY_GAME_TREE_HPP
#define TAKEAWAY_GAME_TREE_HPP

#include <takeaway/hypergraph_state.hpp>
#include <takeaway/grundy_evaluator.hpp>
#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace takeaway {

/**
 * One position in an explored game tree.
 * state is the canonical display string of the position.
 */
struct GameTreeNode {
    std::string state;
    GrundyValue grundy_number = 0;
    std::vector<GameTreeNode> children;
    bool truncated = false;       // depth limit reached, children not expanded
    bool cycle_detected = false;  // position already on the current path

    // Indented outline, one node per line
    std::string to_string() const;
};

// Total number of nodes in the tree rooted at node
std::size_t count_nodes(const GameTreeNode& node);

/**
 * Explicit exploration of the positions reachable from a start state.
 *
 * Checks run in this order for every position:
 *   1. depth limit   -> leaf flagged truncated (value still computed)
 *   2. cycle guard   -> leaf flagged cycle_detected (value still computed)
 *   3. empty state   -> leaf with value 0
 *   4. otherwise     -> one child per vertex, by cascading removal
 *
 * The visited set holds only the ancestors on the current path and is copied
 * into each branch, so siblings never see each other's markers. Vertex
 * removal always shrinks the state, so the cycle guard cannot fire with the
 * current move set; it stays in place for moves that do not shrink.
 *
 * Grundy values come from the evaluator passed at construction, whose cache
 * is shared across builds.
 */
class GameTreeBuilder {
public:
    static constexpr int UNLIMITED_DEPTH = -1;

private:
    GrundyEvaluator& evaluator_;

public:
    explicit GameTreeBuilder(GrundyEvaluator& evaluator) : evaluator_(evaluator) {}

    GameTreeNode build(const HypergraphState& state, int max_depth = UNLIMITED_DEPTH);

    GameTreeNode build(const HypergraphState& state,
                       int max_depth,
                       int current_depth,
                       std::set<HypergraphState> visited);
};

} // namespace takeaway

#endif // TAKEAWAY_GAME_TREE_HPP
