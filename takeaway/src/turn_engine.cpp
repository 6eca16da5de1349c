#include <takeaway/turn_engine.hpp>
#include <takeaway/errors.hpp>
#include <takeaway/debug_log.hpp>
#include <utility>

namespace takeaway {

TurnEngine::TurnEngine(HypergraphState initial_state,
                       std::string first_player,
                       std::string second_player)
    : state_(std::move(initial_state))
    , players_{std::move(first_player), std::move(second_player)} {}

void TurnEngine::move_vertex(const Vertex& vertex) {
    if (!state_.has_vertex(vertex)) {
        throw InvalidMoveError("Vertex '" + vertex + "' not found in hypergraph");
    }

    history_.push_back(state_.copy());
    state_.remove_vertex(vertex);
    moves_.push_back({current_player(), "remove vertex " + vertex});
    TAKEAWAY_DEBUG_LOG("%s removed vertex %s", current_player().c_str(), vertex.c_str());

    if (state_.is_empty()) {
        winner_ = current_player();
        TAKEAWAY_DEBUG_LOG("%s took the last vertex and wins", winner_->c_str());
    }
    next_player();
}

void TurnEngine::move_hyperedge(const Hyperedge& hyperedge) {
    history_.push_back(state_.copy());
    state_.remove_hyperedge(hyperedge);
    moves_.push_back({current_player(), "remove hyperedge " + hyperedge.to_string()});
    TAKEAWAY_DEBUG_LOG("%s removed hyperedge %s", current_player().c_str(), hyperedge.to_string().c_str());
    next_player();
}

void TurnEngine::undo() {
    if (history_.empty()) {
        return;
    }

    state_ = std::move(history_.back());
    history_.pop_back();
    if (!moves_.empty()) {
        moves_.pop_back();
    }
    next_player();
    TAKEAWAY_DEBUG_LOG("undo: %zu moves left in history, %s to move",
                       history_.size(), current_player().c_str());
}

std::string TurnEngine::to_string() const {
    return "Current player: " + current_player() + "\n" + state_.to_string();
}

} // namespace takeaway
