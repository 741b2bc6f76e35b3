#include "life.hpp"

#include <algorithm>
#include <random>

#include <tracy/Tracy.hpp>

namespace torus {

Life::Life(const WrapGrid &grid) : grid(grid), cells(grid.size(), 0), next(grid.size(), 0), ages(grid.size(), 0), gen(0) {}

void Life::seed(unsigned seed, double density) {
	ZoneScoped;

	std::mt19937 rng(seed);
	std::bernoulli_distribution coin(density);

	for (size_t i = 0; i < cells.size(); ++i) {
		cells[i] = coin(rng) ? 1 : 0;
		ages[i] = 0;
	}

	gen = 0;
}

void Life::clear() {
	std::fill(cells.begin(), cells.end(), 0);
	std::fill(ages.begin(), ages.end(), 0);
	gen = 0;
}

void Life::set(coord_t x, coord_t y, bool alive) {
	size_t pos = grid.idx(x, y);

	cells[pos] = alive ? 1 : 0;
	ages[pos] = 0;
}

unsigned Life::live_neighbors(size_t index) const {
	unsigned n = 0;

	for (size_t pos : grid.neighbors8(index))
		n += cells[pos];

	return n;
}

void Life::step() {
	ZoneScoped;

	for (size_t i = 0; i < cells.size(); ++i) {
		unsigned n = live_neighbors(i);
		next[i] = (n == 3 || (n == 2 && cells[i])) ? 1 : 0;
	}

	for (size_t i = 0; i < cells.size(); ++i)
		ages[i] = next[i] && cells[i] ? ages[i] + 1 : 0;

	cells.swap(next);
	++gen;

	FrameMark;
}

size_t Life::population() const noexcept {
	size_t n = 0;

	for (uint8_t c : cells)
		n += c;

	return n;
}

void Life::dump(FILE *f) const {
	for (coord_t y = 0; y < grid.height(); ++y) {
		for (coord_t x = 0; x < grid.width(); ++x)
			fputc(alive(x, y) ? '#' : '.', f);
		fputc('\n', f);
	}
}

}
