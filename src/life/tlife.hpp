#pragma once

#include <cstdio>

#include "../engine/ini.hpp"

namespace torus {

struct Settings final {
	int width, height;
	int generations;
	int seed;
	double density;
	bool print, verbose;

	explicit Settings(const IniParser &ini);
};

/** Run the configured simulation. Returns the process exit status. */
int run(const Settings &cfg, FILE *out, FILE *err);

}
