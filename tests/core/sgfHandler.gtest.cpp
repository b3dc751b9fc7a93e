#include "core/sgfError.hpp"
#include "core/sgfHandler.hpp"

#include <gtest/gtest.h>

namespace fuseki::gtest {

TEST(SgfHandler, FromSGF) {
	EXPECT_EQ(fromSGF("aa"), (Coord{0u, 0u}));
	EXPECT_EQ(fromSGF("cd"), (Coord{2u, 3u}));
	EXPECT_EQ(fromSGF("sa"), (Coord{18u, 0u}));
	EXPECT_EQ(fromSGF("Aa"), (Coord{26u, 0u}));
}

TEST(SgfHandler, ToSGF) {
	EXPECT_EQ(toSGF({0u, 0u}), "aa");
	EXPECT_EQ(toSGF({2u, 3u}), "cd");
	EXPECT_EQ(toSGF({18u, 18u}), "ss");
	EXPECT_EQ(toSGF({27u, 1u}), "Bb");
}

TEST(SgfHandler, FromSGFInvalid) {
	EXPECT_THROW(fromSGF("a"), SgfError);
	EXPECT_THROW(fromSGF("abc"), SgfError);
	EXPECT_THROW(fromSGF("a1"), SgfError);
	EXPECT_THROW(fromSGF(""), SgfError);
}

TEST(SgfHandler, Pass) {
	EXPECT_TRUE(isPassSGF("", 9u));
	EXPECT_TRUE(isPassSGF("tt", 19u));
	EXPECT_FALSE(isPassSGF("tt", 21u)); // Real point on large boards.
	EXPECT_FALSE(isPassSGF("aa", 9u));
}

TEST(SgfHandler, ExpandSinglePoint) {
	const auto points = expandPointList("bc");
	ASSERT_EQ(points.size(), 1u);
	EXPECT_EQ(points[0u], (Coord{1u, 2u}));
}

TEST(SgfHandler, ExpandRectangle) {
	const auto points = expandPointList("aa:bc");
	const std::vector<Coord> expected{{0u, 0u}, {0u, 1u}, {0u, 2u}, {1u, 0u}, {1u, 1u}, {1u, 2u}};
	EXPECT_EQ(points, expected);

	// Corners given in any order cover the same rectangle.
	EXPECT_EQ(expandPointList("bc:aa"), expected);
}

TEST(SgfHandler, ExpandInvalid) {
	EXPECT_THROW(expandPointList("aa:"), SgfError);
	EXPECT_THROW(expandPointList("a:bb"), SgfError);
}

} // namespace fuseki::gtest
