#include "core/propertyEvent.hpp"
#include "core/sgfError.hpp"

#include <gtest/gtest.h>

namespace fuseki::gtest {

static SgfProperty property(std::string identifier, std::vector<std::string> values) {
	return SgfProperty{.identifier = std::move(identifier), .values = std::move(values)};
}

TEST(PropertyEvent, BoardSize) {
	const auto event = toPropertyEvent(property("SZ", {"19"}), 0u);
	ASSERT_TRUE(std::holds_alternative<BoardSizeEvent>(event));
	EXPECT_EQ(std::get<BoardSizeEvent>(event).size, 19u);

	const auto square = toPropertyEvent(property("SZ", {"13:13"}), 0u);
	ASSERT_TRUE(std::holds_alternative<BoardSizeEvent>(square));
	EXPECT_EQ(std::get<BoardSizeEvent>(square).size, 13u);
}

TEST(PropertyEvent, BoardSizeInvalid) {
	for (const auto* value: {"", "0", "abc", "9x", "9:13", "53", "-9"}) {
		try {
			toPropertyEvent(property("SZ", {value}), 0u);
			ADD_FAILURE() << "Accepted size '" << value << "'";
		} catch (const SgfError& e) {
			EXPECT_EQ(e.kind(), SgfError::Kind::Malformed);
		}
	}
}

TEST(PropertyEvent, Moves) {
	const auto black = toPropertyEvent(property("B", {"cd"}), 9u);
	ASSERT_TRUE(std::holds_alternative<MoveEvent>(black));
	EXPECT_EQ(std::get<MoveEvent>(black).player, Player::Black);
	ASSERT_TRUE(std::get<MoveEvent>(black).c.has_value());
	EXPECT_EQ(*std::get<MoveEvent>(black).c, (Coord{2u, 3u}));

	const auto white = toPropertyEvent(property("W", {"aa"}), 9u);
	ASSERT_TRUE(std::holds_alternative<MoveEvent>(white));
	EXPECT_EQ(std::get<MoveEvent>(white).player, Player::White);
}

TEST(PropertyEvent, Pass) {
	const auto empty = toPropertyEvent(property("B", {""}), 19u);
	ASSERT_TRUE(std::holds_alternative<MoveEvent>(empty));
	EXPECT_FALSE(std::get<MoveEvent>(empty).c.has_value());

	const auto tt = toPropertyEvent(property("W", {"tt"}), 9u);
	ASSERT_TRUE(std::holds_alternative<MoveEvent>(tt));
	EXPECT_FALSE(std::get<MoveEvent>(tt).c.has_value());
}

TEST(PropertyEvent, AddStones) {
	const auto event = toPropertyEvent(property("AW", {"aa", "bb:bc"}), 9u);
	ASSERT_TRUE(std::holds_alternative<AddStonesEvent>(event));

	const auto& add = std::get<AddStonesEvent>(event);
	EXPECT_EQ(add.player, Player::White);
	EXPECT_EQ(add.stones, (std::vector<Coord>{{0u, 0u}, {1u, 1u}, {1u, 2u}}));

	const auto black = toPropertyEvent(property("AB", {"ee"}), 9u);
	ASSERT_TRUE(std::holds_alternative<AddStonesEvent>(black));
	EXPECT_EQ(std::get<AddStonesEvent>(black).player, Player::Black);
}

TEST(PropertyEvent, Other) {
	for (const auto* identifier: {"KM", "PB", "C", "AE", "FF"}) {
		const auto event = toPropertyEvent(property(identifier, {"x"}), 9u);
		ASSERT_TRUE(std::holds_alternative<OtherEvent>(event));
		EXPECT_EQ(std::get<OtherEvent>(event).identifier, identifier);
	}
}

TEST(PropertyEvent, InvalidPoint) {
	EXPECT_THROW(toPropertyEvent(property("B", {"a"}), 9u), SgfError);
	EXPECT_THROW(toPropertyEvent(property("AB", {"aa", "1"}), 9u), SgfError);
}

} // namespace fuseki::gtest
