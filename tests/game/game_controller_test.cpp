#include <gtest/gtest.h>
#include "quorum/game/game_controller.h"
#include "quorum/rules/move_generator.h"
#include "support/test_boards.h"

namespace quorum {
namespace game {

using core::Board;
using core::Color;
using core::GameResult;
using core::GameState;
using core::IllegalPlayException;
using core::IllegalPlayReason;
using core::Movement;
using core::Placement;
using core::Play;
using test_support::checkerboard;
using test_support::makeBoard;
using test_support::sq;
using test_support::squares;

namespace {

config::EngineConfig losePolicy() {
    config::EngineConfig config;
    config.no_play_policy = config::NoPlayPolicy::LOSE;
    return config;
}

// Black's stones are boxed into its home corner; White still has room
Board boxedInBlack() {
    return makeBoard("h6 f8 f6 f7 g6 a1 b1", "h8 h7 g8 g7");
}

IllegalPlayReason reasonFor(const GameController& controller, const GameState& state, const Play& play) {
    try {
        controller.apply(state, play);
    } catch (const IllegalPlayException& e) {
        return e.getReason();
    }
    ADD_FAILURE() << "expected " << core::toNotation(play) << " to be rejected";
    return IllegalPlayReason::GAME_OVER;
}

} // namespace

class GameControllerTest : public ::testing::Test {
protected:
    GameController controller;
    GameState initial = controller.initialState();
};

TEST_F(GameControllerTest, InitialState) {
    EXPECT_EQ(initial, GameState());
    EXPECT_EQ(initial.currentPlayer(), Color::WHITE);
    EXPECT_EQ(controller.getConfig().no_play_policy, config::NoPlayPolicy::PASS);
}

TEST_F(GameControllerTest, QuietMovement) {
    GameState before = initial;
    Play play = Movement{sq("b1"), sq("c2")};

    GameState after = controller.apply(initial, play);

    EXPECT_TRUE(after.board().isEmpty(sq("b1")));
    EXPECT_EQ(after.stoneAt(sq("c2")), Color::WHITE);
    EXPECT_EQ(after.stoneAt(sq("d3")), Color::WHITE);
    EXPECT_EQ(after.board().countStones(Color::WHITE), 10);
    EXPECT_EQ(after.board().countStones(Color::BLACK), 10);

    EXPECT_EQ(after.currentPlayer(), Color::BLACK);
    EXPECT_EQ(after.result(), GameResult::ONGOING);
    EXPECT_EQ(after.ply(), 1);
    EXPECT_EQ(after.lastPlay(), play);
    EXPECT_FALSE(after.passedColor().has_value());

    // The input state is never modified
    EXPECT_EQ(initial, before);
}

TEST_F(GameControllerTest, IllegalPlaysAreRejected) {
    GameState before = initial;

    // c2-e4: the center d3 is empty
    EXPECT_EQ(reasonFor(controller, initial, Movement{sq("c2"), sq("d3")}), IllegalPlayReason::OWNERSHIP);
    // Moving the opponent's stones
    EXPECT_EQ(reasonFor(controller, initial, Movement{sq("h8"), sq("g7")}), IllegalPlayReason::OWNERSHIP);
    EXPECT_EQ(reasonFor(controller, initial, Movement{sq("a1"), sq("c2")}), IllegalPlayReason::DISTANCE);
    // a1-c1: c1 is occupied
    EXPECT_EQ(reasonFor(controller, initial, Movement{sq("a1"), sq("b1")}), IllegalPlayReason::SPACE);
    // Home is full
    EXPECT_EQ(reasonFor(controller, initial, Placement{}), IllegalPlayReason::HOME_OCCUPANCY);

    EXPECT_EQ(initial, before);
}

TEST_F(GameControllerTest, ExceptionCarriesThePlay) {
    try {
        controller.apply(initial, Movement{sq("a1"), sq("b1")});
        FAIL() << "expected IllegalPlayException";
    } catch (const IllegalPlayException& e) {
        EXPECT_EQ(e.getReason(), IllegalPlayReason::SPACE);
        EXPECT_EQ(e.getPlay(), "a1-c1");
        EXPECT_NE(std::string(e.what()).find("Illegal play a1-c1 by White"), std::string::npos);
    }
}

TEST_F(GameControllerTest, PlacementFillsExactlyTheEmptyHomeSquares) {
    Board board = initial.board();
    board.set(sq("a1"), std::nullopt);
    board.set(sq("b2"), std::nullopt);
    GameState state(board, Color::WHITE);

    EXPECT_EQ(reasonFor(controller, state, Placement{squares("a1")}), IllegalPlayReason::HOME_OCCUPANCY);
    EXPECT_EQ(reasonFor(controller, state, Placement{squares("a1 b2 c3")}), IllegalPlayReason::HOME_OCCUPANCY);

    GameState after = controller.apply(state, Placement{squares("b2 a1")});
    EXPECT_EQ(after.stoneAt(sq("a1")), Color::WHITE);
    EXPECT_EQ(after.stoneAt(sq("b2")), Color::WHITE);
    EXPECT_EQ(after.board().countStones(Color::WHITE), 10);
    EXPECT_EQ(after.currentPlayer(), Color::BLACK);
}

TEST_F(GameControllerTest, WinByMovement) {
    GameState state(makeBoard("c3 d4 d5 e4", "h8"), Color::WHITE);

    // c3 jumps over d4 onto e5
    GameState after = controller.apply(state, Movement{sq("c3"), sq("d4")});

    EXPECT_EQ(after.result(), GameResult::WHITE_WINS);
    EXPECT_TRUE(after.isTerminal());
    EXPECT_EQ(after.winner(), Color::WHITE);
    EXPECT_EQ(after.ply(), 1);

    // Nothing can follow a win
    EXPECT_EQ(reasonFor(controller, after, Placement{squares("h7 g8 g7")}), IllegalPlayReason::GAME_OVER);
}

TEST_F(GameControllerTest, WinByConversion) {
    GameState state(makeBoard("d4 d5 e4 h6 g6", "e5 a8"), Color::WHITE);

    // Landing on f6 flanks e5 against d4
    GameState after = controller.apply(state, Movement{sq("h6"), sq("g6")});

    EXPECT_EQ(after.stoneAt(sq("e5")), Color::WHITE);
    EXPECT_EQ(after.result(), GameResult::WHITE_WINS);
}

TEST_F(GameControllerTest, BlackCanWin) {
    GameState state(makeBoard("a1", "f6 e5 d5 e4"), Color::BLACK);

    // f6 jumps over e5 onto d4
    GameState after = controller.apply(state, Movement{sq("f6"), sq("e5")});
    EXPECT_TRUE(after.board().isEmpty(sq("f6")));
    EXPECT_EQ(after.result(), GameResult::BLACK_WINS);
    EXPECT_EQ(after.winner(), Color::BLACK);
}

TEST_F(GameControllerTest, PassWhenOpponentIsStuck) {
    GameState state(boxedInBlack(), Color::WHITE);
    ASSERT_FALSE(rules::MoveGenerator::hasAnyLegalPlay(state.board(), Color::BLACK));

    // a1 jumps over b1 to c1
    GameState after = controller.apply(state, Movement{sq("a1"), sq("b1")});

    EXPECT_EQ(after.result(), GameResult::ONGOING);
    EXPECT_EQ(after.currentPlayer(), Color::WHITE);
    EXPECT_EQ(after.passedColor(), Color::BLACK);
    EXPECT_EQ(after.ply(), 1);
}

TEST_F(GameControllerTest, StuckPlayerLosesUnderLosePolicy) {
    GameController strict(losePolicy());
    GameState state(boxedInBlack(), Color::WHITE);

    GameState after = strict.apply(state, Movement{sq("a1"), sq("b1")});

    EXPECT_EQ(after.result(), GameResult::WHITE_WINS);
    EXPECT_EQ(after.currentPlayer(), Color::BLACK);
    EXPECT_FALSE(after.passedColor().has_value());
}

TEST_F(GameControllerTest, DrawWhenNeitherSideCanPlay) {
    Board board = checkerboard();
    board.set(sq("a1"), std::nullopt);
    GameState state(board, Color::WHITE);

    GameState after = controller.apply(state, Placement{squares("a1")});

    EXPECT_EQ(after.result(), GameResult::DRAW);
    EXPECT_TRUE(after.isTerminal());
    EXPECT_FALSE(after.winner().has_value());

    // Under the lose policy the stuck opponent loses instead
    GameState strict = GameController(losePolicy()).apply(state, Placement{squares("a1")});
    EXPECT_EQ(strict.result(), GameResult::WHITE_WINS);
}

TEST_F(GameControllerTest, WinCheckAfterPlacementIsConfigurable) {
    GameState state(makeBoard("d4 d5 e4 e5", "h8"), Color::WHITE);
    Placement placement{squares("a1 a2 b1 b2")};

    EXPECT_EQ(controller.apply(state, placement).result(), GameResult::WHITE_WINS);

    config::EngineConfig config;
    config.check_win_after_placement = false;
    GameState after = GameController(config).apply(state, placement);
    EXPECT_EQ(after.result(), GameResult::ONGOING);
    EXPECT_EQ(after.currentPlayer(), Color::BLACK);
}

} // namespace game
} // namespace quorum
