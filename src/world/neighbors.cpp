#include "wrapgrid.hpp"

#include <algorithm>

namespace torus {

namespace {

struct Delta {
	coord_t dx, dy;
};

/*
  1      (0,  1)
2 X 0  (-1, 0)  (1, 0)
  3      (0, -1)
*/
constexpr std::array<Delta, 4> ring4{{
	{ 1, 0 }, { 0, 1 }, { -1, 0 }, { 0, -1 },
}};

/*
3 2 1  (-1,  1) (0,  1) (1,  1)
4 X 0  (-1,  0)         (1,  0)
5 6 7  (-1, -1) (0, -1) (1, -1)
*/
constexpr std::array<Delta, 8> ring8{{
	{ 1, 0 }, { 1, 1 }, { 0, 1 }, { -1, 1 },
	{ -1, 0 }, { -1, -1 }, { 0, -1 }, { 1, -1 },
}};

/*
 6  5  4  3  2
 7  .  .  .  1
 8  .  X  .  0
 9  .  .  .  15
10 11 12 13  14
*/
constexpr std::array<Delta, 16> ring16{{
	{ 2, 0 }, { 2, 1 }, { 2, 2 }, { 1, 2 },
	{ 0, 2 }, { -1, 2 }, { -2, 2 }, { -2, 1 },
	{ -2, 0 }, { -2, -1 }, { -2, -2 }, { -1, -2 },
	{ 0, -2 }, { 1, -2 }, { 2, -2 }, { 2, -1 },
}};

template<size_t N> std::array<size_t, N> around(const WrapGrid &g, coord_t x, coord_t y, const std::array<Delta, N> &ring) noexcept {
	std::array<size_t, N> n;

	for (size_t i = 0; i < N; ++i)
		n[i] = g.neighbor(x, y, ring[i].dx, ring[i].dy);

	return n;
}

}

std::array<size_t, 4> WrapGrid::neighbors4(coord_t x, coord_t y) const noexcept {
	return around(*this, x, y, ring4);
}

std::array<size_t, 8> WrapGrid::neighbors8(coord_t x, coord_t y) const noexcept {
	return around(*this, x, y, ring8);
}

std::array<size_t, 16> WrapGrid::neighbors16(coord_t x, coord_t y) const noexcept {
	return around(*this, x, y, ring16);
}

std::array<size_t, 24> WrapGrid::neighbors24(coord_t x, coord_t y) const noexcept {
	std::array<size_t, 24> n;
	std::array<size_t, 8> inner(neighbors8(x, y));
	std::array<size_t, 16> outer(neighbors16(x, y));

	std::copy(inner.begin(), inner.end(), n.begin());
	std::copy(outer.begin(), outer.end(), n.begin() + inner.size());

	return n;
}

std::array<size_t, 4> WrapGrid::neighbors4(size_t index) const {
	Coords c(coords(index));
	return neighbors4(c.first, c.second);
}

std::array<size_t, 8> WrapGrid::neighbors8(size_t index) const {
	Coords c(coords(index));
	return neighbors8(c.first, c.second);
}

std::array<size_t, 16> WrapGrid::neighbors16(size_t index) const {
	Coords c(coords(index));
	return neighbors16(c.first, c.second);
}

std::array<size_t, 24> WrapGrid::neighbors24(size_t index) const {
	Coords c(coords(index));
	return neighbors24(c.first, c.second);
}

}
