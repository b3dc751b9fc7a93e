#include "engine/gtpProtocol.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <vector>

namespace fuseki::gtest {

TEST(GtpProtocol, CommandLines) {
	EXPECT_EQ(engine::boardSizeCommand(9u).toLine(), "boardsize 9\n");
	EXPECT_EQ(engine::clearBoardCommand().toLine(), "clear_board\n");
	EXPECT_EQ(engine::playCommand(Player::Black, {3u, 3u}).toLine(), "play black D4\n");
	EXPECT_EQ(engine::playCommand(Player::White, {8u, 0u}).toLine(), "play white J1\n");
	EXPECT_EQ(engine::genmoveCommand(Player::White).toLine(), "genmove white\n");
	EXPECT_EQ(engine::listStonesCommand(Player::Black).toLine(), "list_stones black\n");
	EXPECT_EQ(engine::capturesCommand(Player::White).toLine(), "captures white\n");
	EXPECT_EQ(engine::undoCommand().toLine(), "undo\n");
}

TEST(GtpProtocol, ToVertexSkipsI) {
	EXPECT_EQ(engine::toVertex({0u, 0u}), "A1");
	EXPECT_EQ(engine::toVertex({7u, 4u}), "H5");
	EXPECT_EQ(engine::toVertex({8u, 4u}), "J5");
	EXPECT_EQ(engine::toVertex({18u, 18u}), "T19");
}

TEST(GtpProtocol, FromVertexValid) {
	EXPECT_EQ(engine::fromVertex("A1"), (Coord{0u, 0u}));
	EXPECT_EQ(engine::fromVertex("h5"), (Coord{7u, 4u}));
	EXPECT_EQ(engine::fromVertex("J5"), (Coord{8u, 4u}));
	EXPECT_EQ(engine::fromVertex("T19"), (Coord{18u, 18u}));
	EXPECT_EQ(engine::fromVertex("Z25"), (Coord{24u, 24u}));

	for (const Coord c: {Coord{0u, 0u}, Coord{8u, 8u}, Coord{12u, 3u}, Coord{18u, 17u}}) {
		EXPECT_EQ(engine::fromVertex(engine::toVertex(c)), c);
	}
}

TEST(GtpProtocol, FromVertexInvalid) {
	EXPECT_FALSE(engine::fromVertex("").has_value());
	EXPECT_FALSE(engine::fromVertex("A").has_value());
	EXPECT_FALSE(engine::fromVertex("I5").has_value());
	EXPECT_FALSE(engine::fromVertex("A0").has_value());
	EXPECT_FALSE(engine::fromVertex("A26").has_value());
	EXPECT_FALSE(engine::fromVertex("5A").has_value());
	EXPECT_FALSE(engine::fromVertex("B2x").has_value());
	EXPECT_FALSE(engine::fromVertex("pass").has_value());
}

TEST(GtpProtocol, ParseSuccess) {
	const auto simple = engine::parseResponse("= C3\n\n");
	ASSERT_TRUE(simple.has_value());
	EXPECT_TRUE(simple->success);
	EXPECT_EQ(simple->payload, "C3");

	const auto empty = engine::parseResponse("=\n\n");
	ASSERT_TRUE(empty.has_value());
	EXPECT_TRUE(empty->success);
	EXPECT_TRUE(empty->payload.empty());

	const auto withId = engine::parseResponse("=12 D4\r\n\r\n");
	ASSERT_TRUE(withId.has_value());
	EXPECT_TRUE(withId->success);
	EXPECT_EQ(withId->payload, "D4");

	const auto multiLine = engine::parseResponse("= first line\n  second line\n\n");
	ASSERT_TRUE(multiLine.has_value());
	EXPECT_EQ(multiLine->payload, "first line\nsecond line");
}

TEST(GtpProtocol, ParseFailure) {
	const auto failure = engine::parseResponse("? illegal move\n\n");
	ASSERT_TRUE(failure.has_value());
	EXPECT_FALSE(failure->success);
	EXPECT_EQ(failure->payload, "illegal move");

	const auto withId = engine::parseResponse("?3 unknown command");
	ASSERT_TRUE(withId.has_value());
	EXPECT_FALSE(withId->success);
	EXPECT_EQ(withId->payload, "unknown command");
}

TEST(GtpProtocol, ParseInvalid) {
	EXPECT_FALSE(engine::parseResponse("").has_value());
	EXPECT_FALSE(engine::parseResponse("\n\n").has_value());
	EXPECT_FALSE(engine::parseResponse("C3").has_value());
	EXPECT_FALSE(engine::parseResponse("=C3").has_value());
}

TEST(GtpProtocol, VertexList) {
	const auto list = engine::parseVertexList("A1 b2 PASS\nC3 pass");
	ASSERT_TRUE(list.has_value());
	EXPECT_EQ(*list, (std::vector<Coord>{{0u, 0u}, {1u, 1u}, {2u, 2u}}));

	const auto empty = engine::parseVertexList("");
	ASSERT_TRUE(empty.has_value());
	EXPECT_TRUE(empty->empty());

	EXPECT_FALSE(engine::parseVertexList("A1 I9").has_value());
	EXPECT_FALSE(engine::parseVertexList("A1 resign").has_value());
}

} // namespace fuseki::gtest
