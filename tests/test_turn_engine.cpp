#include <gtest/gtest.h>
#include <takeaway/turn_engine.hpp>
#include <takeaway/errors.hpp>
#include "test_helpers.hpp"

using namespace takeaway;

class TurnEngineTest : public ::testing::Test {
protected:
    static HypergraphState small_board() {
        return test_utils::make_state({"a", "b", "c"}, {{"a", "b"}}, {{"a", "b", "c"}});
    }
};

// === INITIAL STATE ===

TEST_F(TurnEngineTest, InitialState) {
    TurnEngine game(small_board());

    EXPECT_EQ(game.current_player(), "Player 1");
    EXPECT_EQ(game.current_player_index(), 0);
    EXPECT_FALSE(game.is_game_over());
    EXPECT_FALSE(game.winner().has_value());
    EXPECT_EQ(game.history_size(), 0);
    EXPECT_EQ(game.state(), small_board());
}

TEST_F(TurnEngineTest, CustomPlayerNames) {
    TurnEngine game(small_board(), "Alice", "Bob");
    EXPECT_EQ(game.players()[0], "Alice");
    EXPECT_EQ(game.players()[1], "Bob");

    game.move_vertex("c");
    EXPECT_EQ(game.current_player(), "Bob");
}

TEST_F(TurnEngineTest, EmptyStartIsAlreadyOver) {
    TurnEngine game(HypergraphState{});
    EXPECT_TRUE(game.is_game_over());
    EXPECT_FALSE(game.winner().has_value());
}

// === VERTEX MOVES ===

TEST_F(TurnEngineTest, MoveVertexCascadesAndSwitchesPlayer) {
    TurnEngine game(small_board());
    game.move_vertex("b");

    EXPECT_FALSE(game.state().has_vertex("b"));
    EXPECT_FALSE(game.state().has_edge({"a", "b"}));
    EXPECT_FALSE(game.state().has_face({"a", "b", "c"}));
    EXPECT_EQ(game.current_player(), "Player 2");
    EXPECT_EQ(game.history_size(), 1);
    EXPECT_FALSE(game.is_game_over());
}

TEST_F(TurnEngineTest, LastVertexWins) {
    TurnEngine game(test_utils::make_state({"x"}));
    game.move_vertex("x");

    EXPECT_TRUE(game.is_game_over());
    ASSERT_TRUE(game.winner().has_value());
    EXPECT_EQ(*game.winner(), "Player 1");
    // Turn still passes after the final move
    EXPECT_EQ(game.current_player(), "Player 2");
}

TEST_F(TurnEngineTest, SecondPlayerCanWin) {
    TurnEngine game(test_utils::make_state({"a", "b"}, {{"a", "b"}}));
    game.move_vertex("a");
    EXPECT_FALSE(game.winner().has_value());
    game.move_vertex("b");

    EXPECT_TRUE(game.is_game_over());
    EXPECT_EQ(game.winner().value_or(""), "Player 2");
}

TEST_F(TurnEngineTest, InvalidMoveThrowsAndLeavesGameUnchanged) {
    TurnEngine game(small_board());

    EXPECT_THROW(game.move_vertex("z"), InvalidMoveError);
    EXPECT_EQ(game.state(), small_board());
    EXPECT_EQ(game.current_player(), "Player 1");
    EXPECT_EQ(game.history_size(), 0);
    EXPECT_TRUE(game.moves().empty());

    // Retry with a valid vertex succeeds
    EXPECT_NO_THROW(game.move_vertex("a"));
    EXPECT_EQ(game.current_player(), "Player 2");
}

TEST_F(TurnEngineTest, RemovedVertexCannotBeMovedAgain) {
    TurnEngine game(small_board());
    game.move_vertex("a");
    EXPECT_THROW(game.move_vertex("a"), InvalidMoveError);
}

// === HYPEREDGE MOVES ===

TEST_F(TurnEngineTest, MoveHyperedgeRetractsAndSwitchesPlayer) {
    TurnEngine game(small_board());
    game.move_hyperedge({"a", "b"});

    EXPECT_FALSE(game.state().has_edge({"a", "b"}));
    EXPECT_FALSE(game.state().has_face({"a", "b", "c"}));
    EXPECT_EQ(game.state().num_vertices(), 3);
    EXPECT_EQ(game.current_player(), "Player 2");
    EXPECT_FALSE(game.winner().has_value());
}

TEST_F(TurnEngineTest, MoveHyperedgeNeverSetsWinner) {
    // Even on an already empty board the winner stays unset
    TurnEngine game(HypergraphState{});
    game.move_hyperedge({"a", "b"});

    EXPECT_TRUE(game.is_game_over());
    EXPECT_FALSE(game.winner().has_value());
    EXPECT_EQ(game.current_player(), "Player 2");
}

TEST_F(TurnEngineTest, MoveHyperedgeCanBeUndone) {
    TurnEngine game(small_board());
    game.move_hyperedge({"a", "b"});
    game.undo();

    EXPECT_EQ(game.state(), small_board());
    EXPECT_EQ(game.current_player(), "Player 1");
}

// === UNDO ===

TEST_F(TurnEngineTest, UndoRestoresStateAndPlayer) {
    TurnEngine game(small_board());
    game.move_vertex("a");
    EXPECT_FALSE(game.state().has_vertex("a"));

    game.undo();
    EXPECT_TRUE(game.state().has_vertex("a"));
    EXPECT_EQ(game.state(), small_board());
    EXPECT_EQ(game.current_player(), "Player 1");
    EXPECT_EQ(game.history_size(), 0);
}

TEST_F(TurnEngineTest, UndoIsLastInFirstOut) {
    TurnEngine game(small_board());
    game.move_vertex("c");
    auto after_first = game.state();
    game.move_vertex("a");

    game.undo();
    EXPECT_EQ(game.state(), after_first);
    EXPECT_EQ(game.current_player(), "Player 2");

    game.undo();
    EXPECT_EQ(game.state(), small_board());
    EXPECT_EQ(game.current_player(), "Player 1");
}

TEST_F(TurnEngineTest, UndoWithoutHistoryIsNoOp) {
    TurnEngine game(small_board());
    game.undo();

    EXPECT_EQ(game.state(), small_board());
    EXPECT_EQ(game.current_player(), "Player 1");
}

TEST_F(TurnEngineTest, UndoKeepsWinner) {
    TurnEngine game(test_utils::make_state({"x"}));
    game.move_vertex("x");
    ASSERT_TRUE(game.winner().has_value());

    game.undo();
    EXPECT_FALSE(game.is_game_over());
    EXPECT_TRUE(game.state().has_vertex("x"));
    EXPECT_EQ(game.current_player(), "Player 1");
    // The stale winner is kept
    EXPECT_EQ(game.winner().value_or(""), "Player 1");
}

// === MOVE LOG ===

TEST_F(TurnEngineTest, MovesAreLoggedAndUndone) {
    TurnEngine game(small_board());
    game.move_vertex("c");
    game.move_hyperedge({"b", "a"});

    ASSERT_EQ(game.moves().size(), 2);
    EXPECT_EQ(game.moves()[0].player, "Player 1");
    EXPECT_EQ(game.moves()[0].description, "remove vertex c");
    EXPECT_EQ(game.moves()[1].player, "Player 2");
    EXPECT_EQ(game.moves()[1].description, "remove hyperedge {a, b}");

    game.undo();
    ASSERT_EQ(game.moves().size(), 1);
    EXPECT_EQ(game.moves()[0].description, "remove vertex c");
}

TEST_F(TurnEngineTest, ToStringShowsPlayerAndState) {
    TurnEngine game(test_utils::make_state({"a"}));
    EXPECT_EQ(game.to_string(), "Current player: Player 1\nV: {a} | E: {} | F: {}");
}

// === FULL GAME ===

TEST_F(TurnEngineTest, ScriptedGameToCompletion) {
    auto board = test_utils::make_state({"A", "B", "C", "D"}, {{"A", "B"}, {"C", "D"}}, {{"A", "C", "D"}});
    TurnEngine game(board);

    game.move_vertex("A");
    EXPECT_EQ(game.state().to_string(), "V: {B, C, D} | E: {{C, D}} | F: {}");
    game.move_vertex("C");
    game.move_vertex("B");
    EXPECT_FALSE(game.is_game_over());
    game.move_vertex("D");

    EXPECT_TRUE(game.is_game_over());
    EXPECT_EQ(game.winner().value_or(""), "Player 2");
    EXPECT_EQ(game.history_size(), 4);
}
