#include "../src/world/wrapgrid.hpp"

#include <algorithm>
#include <set>

#include <gtest/gtest.h>

namespace torus {

class NeighborsFixture : public ::testing::Test {
protected:
	WrapGrid g{ 10, 10 };
};

TEST_F(NeighborsFixture, Ring4) {
	std::array<size_t, 4> exp{{ 96, 5, 94, 85 }};
	EXPECT_EQ(exp, g.neighbors4(95));
	EXPECT_EQ(exp, g.neighbors4(5, 9));
}

TEST_F(NeighborsFixture, Ring4Corner) {
	std::array<size_t, 4> exp{{ 1, 10, 9, 90 }};
	EXPECT_EQ(exp, g.neighbors4(0));
	EXPECT_EQ(exp, g.neighbors4(-10, 20));
}

TEST_F(NeighborsFixture, Ring8) {
	std::array<size_t, 8> exp{{ 96, 6, 5, 4, 94, 84, 85, 86 }};
	EXPECT_EQ(exp, g.neighbors8(95));
	EXPECT_EQ(exp, g.neighbors8(5, 9));
}

TEST_F(NeighborsFixture, Ring8Corner) {
	std::array<size_t, 8> exp{{ 1, 11, 10, 19, 9, 99, 90, 91 }};
	EXPECT_EQ(exp, g.neighbors8(0));
}

TEST_F(NeighborsFixture, Ring16) {
	// x=5, y=9: the ring above wraps onto rows 0 and 1
	std::array<size_t, 16> exp{{
		97, 7, 17, 16,
		15, 14, 13, 3,
		93, 83, 73, 74,
		75, 76, 77, 87,
	}};
	EXPECT_EQ(exp, g.neighbors16(95));
}

TEST_F(NeighborsFixture, Ring24) {
	std::array<size_t, 24> n(g.neighbors24(95));
	std::array<size_t, 8> inner(g.neighbors8(95));
	std::array<size_t, 16> outer(g.neighbors16(95));

	EXPECT_TRUE(std::equal(inner.begin(), inner.end(), n.begin()));
	EXPECT_TRUE(std::equal(outer.begin(), outer.end(), n.begin() + 8));
}

TEST_F(NeighborsFixture, Ring24Distinct) {
	std::array<size_t, 24> n(g.neighbors24(42));
	std::set<size_t> seen(n.begin(), n.end());

	EXPECT_EQ(24u, seen.size());
	EXPECT_EQ(0u, seen.count(42));
}

TEST_F(NeighborsFixture, IndexMatchesCoords) {
	for (size_t i = 0; i < g.size(); ++i) {
		Coords c(g.coords(i));
		ASSERT_EQ(g.neighbors8(c.first, c.second), g.neighbors8(i));
		ASSERT_EQ(g.neighbors24(c.first, c.second), g.neighbors24(i));
	}
}

TEST_F(NeighborsFixture, OutOfRange) {
	EXPECT_THROW(g.neighbors4(100), IndexOutOfRange);
	EXPECT_THROW(g.neighbors8(100), IndexOutOfRange);
	EXPECT_THROW(g.neighbors16(1000), IndexOutOfRange);
	EXPECT_THROW(g.neighbors24(static_cast<size_t>(-1)), IndexOutOfRange);
}

TEST(Neighbors, NarrowGridRepeats) {
	WrapGrid g(2, 1);

	// left and right are the same cell, up and down wrap onto itself
	std::array<size_t, 4> exp{{ 1, 0, 1, 0 }};
	EXPECT_EQ(exp, g.neighbors4(0));
}

TEST(Neighbors, SingleCell) {
	WrapGrid g(1, 1);
	std::array<size_t, 24> n(g.neighbors24(0));

	for (size_t i : n)
		EXPECT_EQ(0u, i);
}

}
