/**
 * Take-Away Game Simulation
 *
 * Plays a short scripted game on a small hypergraph:
 * - Building a position from vertices, edges and a face
 * - Reporting the Grundy value of each position
 * - Alternating vertex moves until the last vertex is taken
 */

#include <takeaway/hypergraph_state.hpp>
#include <takeaway/grundy_evaluator.hpp>
#include <takeaway/game_tree.hpp>
#include <takeaway/turn_engine.hpp>
#include <takeaway/errors.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace takeaway;

int main() {
    std::cout << "=== Take-Away Game Simulation ===\n\n";

    HypergraphState state;
    for (const char* v : {"A", "B", "C", "D"}) {
        state.add_vertex(v);
    }
    state.add_edge({"A", "B"});
    state.add_edge({"C", "D"});
    state.add_face({"A", "C", "D"});

    std::cout << "Initial position:\n  " << state << "\n";

    GrundyEvaluator evaluator;
    std::cout << "  Grundy value: " << evaluator.grundy(state) << "\n";
    std::cout << "  Components: " << state.get_components().size()
              << ", nim-sum of components: " << evaluator.grundy_by_components(state) << "\n\n";

    GameTreeBuilder builder(evaluator);
    GameTreeNode tree = builder.build(state, 1);
    std::cout << "Positions one move ahead:\n" << tree.to_string() << "\n";

    TurnEngine game(state);
    std::cout << "Game initialized. Current player: " << game.current_player() << "\n\n";

    const std::vector<std::string> script = {"A", "C", "B", "D"};
    for (const auto& vertex : script) {
        std::cout << "[" << game.current_player() << "] removes vertex '" << vertex << "'\n";
        try {
            game.move_vertex(vertex);
        } catch (const InvalidMoveError& e) {
            std::cout << "  Rejected: " << e.what() << "\n";
            return 1;
        }

        std::cout << "  " << game.state() << "\n";
        std::cout << "  Grundy value: " << evaluator.grundy(game.state()) << "\n";
        std::cout << "  Next player: " << game.current_player() << "\n";
        std::cout << "  Game over: " << (game.is_game_over() ? "yes" : "no") << "\n\n";

        if (game.is_game_over()) {
            std::cout << "Winner: " << game.winner().value_or("none") << "\n";
            return 0;
        }
    }

    std::cout << "Script ended without a winner.\n";
    return 0;
}
