#pragma once

#include <cassert>
#include <cstddef>
#include <cstdint>

#include <array>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

namespace torus {

typedef int32_t coord_t;
typedef std::pair<coord_t, coord_t> Coords;

class InvalidDimension final : public std::invalid_argument {
public:
	explicit InvalidDimension(const std::string &what) : std::invalid_argument(what) {}
};

class Overflow final : public std::overflow_error {
public:
	explicit Overflow(const std::string &what) : std::overflow_error(what) {}
};

class IndexOutOfRange final : public std::out_of_range {
public:
	explicit IndexOutOfRange(const std::string &what) : std::out_of_range(what) {}
};

/**
 * Translates between (x, y) cells and row-major offsets of a flat buffer
 * holding width * height elements. Both axes wrap around, so every
 * coordinate pair maps onto some cell. Immutable once constructed.
 */
class WrapGrid final {
	coord_t w, h, sz;
public:
	static constexpr coord_t max_size = std::numeric_limits<coord_t>::max();

	WrapGrid(coord_t width, coord_t height);

	/** Derive height from a buffer length. size must be a non-zero multiple of width. */
	static WrapGrid from_width_and_size(coord_t width, size_t size);

	coord_t width() const noexcept { return w; }
	coord_t height() const noexcept { return h; }
	size_t size() const noexcept { return (size_t)sz; }
	coord_t size32() const noexcept { return sz; }

	bool contains(size_t index) const noexcept { return index < (size_t)sz; }

	/** Floor modulo: result is always in [0, rhs) for rhs > 0. */
	static constexpr coord_t modulo(int64_t lhs, coord_t rhs) noexcept {
		assert(rhs > 0);
		int64_t r = lhs % rhs;
		if (r < 0)
			r += rhs;
		return (coord_t)r;
	}

	size_t idx(coord_t x, coord_t y) const noexcept {
		return wrap_idx(x, y);
	}

	Coords coords(size_t index) const;

	size_t neighbor(coord_t x, coord_t y, coord_t dx, coord_t dy) const noexcept {
		return wrap_idx((int64_t)x + dx, (int64_t)y + dy);
	}

	size_t shift(size_t index, coord_t dx, coord_t dy) const;

	// fixed neighborhoods, see neighbors.cpp for the ordering
	std::array<size_t, 4> neighbors4(size_t index) const;
	std::array<size_t, 8> neighbors8(size_t index) const;
	std::array<size_t, 16> neighbors16(size_t index) const;
	std::array<size_t, 24> neighbors24(size_t index) const;

	std::array<size_t, 4> neighbors4(coord_t x, coord_t y) const noexcept;
	std::array<size_t, 8> neighbors8(coord_t x, coord_t y) const noexcept;
	std::array<size_t, 16> neighbors16(coord_t x, coord_t y) const noexcept;
	std::array<size_t, 24> neighbors24(coord_t x, coord_t y) const noexcept;

	bool operator==(const WrapGrid &other) const noexcept { return w == other.w && h == other.h; }
	bool operator!=(const WrapGrid &other) const noexcept { return !(*this == other); }
private:
	// ny * w + nx <= sz - 1, which fits because sz <= max_size
	size_t wrap_idx(int64_t x, int64_t y) const noexcept {
		return (size_t)modulo(y, h) * (size_t)w + (size_t)modulo(x, w);
	}

	void check_index(const char *func, size_t index) const;
};

}
