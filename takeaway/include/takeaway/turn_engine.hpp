#ifndef TAKEAWAY_TURN_ENGINE_HPP
#define TAKEAWAY_TURN_ENGINE_HPP

#include <takeaway/hypergraph_state.hpp>
#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace takeaway {

struct MoveRecord {
    std::string player;
    std::string description;  // "remove vertex a", "remove hyperedge {a, b}"
};

/**
 * Two-player alternating play on one live HypergraphState.
 *
 * Normal play: whoever removes the last vertex wins. The game is over exactly
 * when the live state has no vertices; that is recomputed on every query.
 *
 * Every accepted move pushes a snapshot of the pre-move state, so undo()
 * can step back through both vertex and hyperedge moves.
 */
class TurnEngine {
private:
    HypergraphState state_;
    std::array<std::string, 2> players_;
    std::size_t current_player_index_ = 0;
    std::optional<std::string> winner_;
    std::vector<HypergraphState> history_;
    std::vector<MoveRecord> moves_;

    void next_player() { current_player_index_ = 1 - current_player_index_; }

public:
    explicit TurnEngine(HypergraphState initial_state,
                        std::string first_player = "Player 1",
                        std::string second_player = "Player 2");

    /**
     * Remove vertex and everything incident to it.
     * Throws InvalidMoveError if vertex is not in the live state; nothing
     * changes in that case. Sets the winner when the state becomes empty.
     */
    void move_vertex(const Vertex& vertex);

    /**
     * Retract hyperedge via HypergraphState::remove_hyperedge and pass the turn.
     * Does not check for a finished game or set the winner.
     */
    void move_hyperedge(const Hyperedge& hyperedge);

    /**
     * Restore the state before the last move and hand the turn back.
     * No-op without history. A winner already set is kept.
     */
    void undo();

    bool is_game_over() const { return state_.is_empty(); }

    const HypergraphState& state() const { return state_; }
    const std::string& current_player() const { return players_[current_player_index_]; }
    std::size_t current_player_index() const { return current_player_index_; }
    const std::array<std::string, 2>& players() const { return players_; }
    const std::optional<std::string>& winner() const { return winner_; }
    std::size_t history_size() const { return history_.size(); }
    const std::vector<MoveRecord>& moves() const { return moves_; }

    // "Current player: <name>\n<state>"
    std::string to_string() const;
};

} // namespace takeaway

#endif // TAKEAWAY_TURN_ENGINE_HPP
