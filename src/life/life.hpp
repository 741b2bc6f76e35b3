#pragma once

#include <cstdint>
#include <cstdio>

#include <vector>

#include "../world/wrapgrid.hpp"

namespace torus {

/**
 * Conway's game of life (B3/S23) on a torus. Cell attributes are kept in
 * parallel flat arrays that share one WrapGrid for indexing.
 */
class Life final {
	WrapGrid grid;
	std::vector<uint8_t> cells, next;
	std::vector<uint32_t> ages;
	unsigned gen;
public:
	explicit Life(const WrapGrid &grid);

	const WrapGrid &dimensions() const noexcept { return grid; }

	/** Randomly populate with the given probability of a cell being alive. */
	void seed(unsigned seed, double density);
	void clear();

	void set(coord_t x, coord_t y, bool alive);
	bool alive(coord_t x, coord_t y) const noexcept { return cells[grid.idx(x, y)] != 0; }
	uint32_t age(coord_t x, coord_t y) const noexcept { return ages[grid.idx(x, y)]; }

	unsigned live_neighbors(size_t index) const;

	void step();

	size_t population() const noexcept;
	unsigned generation() const noexcept { return gen; }

	void dump(FILE *f) const;
};

}
