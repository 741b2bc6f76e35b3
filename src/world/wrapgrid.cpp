#include "wrapgrid.hpp"

namespace torus {

static coord_t checked_size(coord_t width, coord_t height) {
	if (width < 1 || height < 1)
		throw InvalidDimension("width or height less than 1: " + std::to_string(width) + "x" + std::to_string(height));

	int64_t n = (int64_t)width * height;
	if (n > WrapGrid::max_size)
		throw Overflow("grid " + std::to_string(width) + "x" + std::to_string(height) + " exceeds " + std::to_string(WrapGrid::max_size) + " cells");

	return (coord_t)n;
}

WrapGrid::WrapGrid(coord_t width, coord_t height) : w(width), h(height), sz(checked_size(width, height)) {}

WrapGrid WrapGrid::from_width_and_size(coord_t width, size_t size) {
	if (width < 1)
		throw InvalidDimension("width less than 1: " + std::to_string(width));

	if (size > (size_t)max_size)
		throw Overflow("size " + std::to_string(size) + " exceeds " + std::to_string(max_size) + " cells");

	if (size == 0 || size % (size_t)width != 0)
		throw InvalidDimension("size " + std::to_string(size) + " is not a non-zero multiple of width " + std::to_string(width));

	return WrapGrid(width, (coord_t)(size / (size_t)width));
}

void WrapGrid::check_index(const char *func, size_t index) const {
	if (!contains(index))
		throw IndexOutOfRange(std::string(func) + ": index " + std::to_string(index) + " not in [0, " + std::to_string(sz) + ")");
}

Coords WrapGrid::coords(size_t index) const {
	check_index(__func__, index);

	coord_t i = (coord_t)index;
	return Coords(i % w, i / w);
}

size_t WrapGrid::shift(size_t index, coord_t dx, coord_t dy) const {
	check_index(__func__, index);

	coord_t i = (coord_t)index;
	return neighbor(i % w, i / w, dx, dy);
}

}
