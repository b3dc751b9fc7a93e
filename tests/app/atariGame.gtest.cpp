#include "app/atariGame.hpp"
#include "engine/mockChannel.hpp"

#include <gtest/gtest.h>

namespace fuseki::gtest {

class AtariGameTest : public ::testing::Test {
protected:
	void SetUp() override {
		channel.pushSuccess();
		channel.pushSuccess();
		ASSERT_TRUE(game.start());
	}

	MockChannel channel;
	engine::GtpEngine gtp{channel};
	app::AtariGame game{gtp};
};

TEST_F(AtariGameTest, StartPreparesBoard) {
	EXPECT_EQ(channel.sent(), (std::vector<std::string>{"boardsize 9\n", "clear_board\n"}));
	EXPECT_EQ(game.currentPlayer(), Player::Black);
	EXPECT_TRUE(game.isActive());
	EXPECT_FALSE(game.winner().has_value());
}

TEST_F(AtariGameTest, PlayersAlternate) {
	channel.pushSuccess();
	channel.pushSuccess("0");
	EXPECT_EQ(game.play({2u, 2u}), app::MoveResult::Accepted);
	EXPECT_EQ(game.currentPlayer(), Player::White);

	channel.pushSuccess();
	channel.pushSuccess("0");
	EXPECT_EQ(game.play({3u, 2u}), app::MoveResult::Accepted);
	EXPECT_EQ(game.currentPlayer(), Player::Black);

	EXPECT_EQ(channel.sent()[2u], "play black C3\n");
	EXPECT_EQ(channel.sent()[3u], "captures black\n");
	EXPECT_EQ(channel.sent()[4u], "play white D3\n");
}

TEST_F(AtariGameTest, RejectedMoves) {
	// Off the board. Nothing is sent.
	EXPECT_EQ(game.play({9u, 0u}), app::MoveResult::Rejected);
	EXPECT_EQ(channel.sent().size(), 2u);

	channel.pushFailure("illegal move");
	EXPECT_EQ(game.play({0u, 0u}), app::MoveResult::Rejected);
	EXPECT_EQ(game.currentPlayer(), Player::Black);
}

TEST_F(AtariGameTest, FirstCaptureWins) {
	channel.pushSuccess();
	channel.pushSuccess("1");
	EXPECT_EQ(game.play({1u, 0u}), app::MoveResult::Win);
	EXPECT_EQ(game.winner(), Player::Black);
	EXPECT_FALSE(game.isActive());

	// Finished games accept no further moves.
	const auto sentBefore = channel.sent().size();
	EXPECT_EQ(game.play({5u, 5u}), app::MoveResult::Rejected);
	EXPECT_EQ(channel.sent().size(), sentBefore);
}

TEST_F(AtariGameTest, UndoResumesFinishedGame) {
	channel.pushSuccess();
	channel.pushSuccess("1");
	ASSERT_EQ(game.play({1u, 0u}), app::MoveResult::Win);

	channel.pushSuccess();
	EXPECT_TRUE(game.undo());
	EXPECT_TRUE(game.isActive());
	EXPECT_EQ(game.currentPlayer(), Player::Black);
}

TEST_F(AtariGameTest, UndoSwitchesPlayer) {
	channel.pushSuccess();
	channel.pushSuccess("0");
	ASSERT_EQ(game.play({4u, 4u}), app::MoveResult::Accepted);

	channel.pushSuccess();
	EXPECT_TRUE(game.undo());
	EXPECT_EQ(game.currentPlayer(), Player::Black);

	channel.pushFailure("cannot undo");
	EXPECT_FALSE(game.undo());
	EXPECT_EQ(game.currentPlayer(), Player::Black);
}

TEST_F(AtariGameTest, Stones) {
	channel.pushSuccess("A1 B2");
	channel.pushSuccess("C3");
	const auto stones = game.stones();
	EXPECT_EQ(stones.white, (std::vector<Coord>{{0u, 0u}, {1u, 1u}}));
	EXPECT_EQ(stones.black, (std::vector<Coord>{{2u, 2u}}));
}

TEST(AtariGame, StartFailsWhenEngineRefuses) {
	MockChannel channel;
	channel.pushFailure("unacceptable size");
	engine::GtpEngine gtp{channel};
	app::AtariGame game{gtp};
	EXPECT_FALSE(game.start());
}

} // namespace fuseki::gtest
