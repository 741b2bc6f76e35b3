#include "tlife.hpp"

#include <stdexcept>

#include "life.hpp"

namespace torus {

Settings::Settings(const IniParser &ini)
	: width(ini.get_or_default("grid", "width", 64))
	, height(ini.get_or_default("grid", "height", 32))
	, generations(ini.get_or_default("life", "generations", 100))
	, seed(ini.get_or_default("life", "seed", 1))
	, density(0.3)
	, print(ini.get_or_default("output", "print", true))
	, verbose(ini.get_or_default("output", "verbose", false))
{
	IniStatus s = ini.try_clamp("life", "density", density, 0.0, 1.0);
	if (s == IniStatus::invalid_value)
		fprintf(stderr, "%s: bad density, using %.2f\n", __func__, density);

	if (generations < 0)
		generations = 0;
}

int run(const Settings &cfg, FILE *out, FILE *err)
{
	try {
		WrapGrid grid(cfg.width, cfg.height);
		Life life(grid);

		life.seed((unsigned)cfg.seed, cfg.density);
		fprintf(out, "grid %dx%d, %zu cells, seed %d, density %.2f\n", grid.width(), grid.height(), grid.size(), cfg.seed, cfg.density);

		for (int i = 0; i < cfg.generations; ++i) {
			life.step();
			if (cfg.verbose)
				fprintf(out, "generation %u: population %zu\n", life.generation(), life.population());
		}

		fprintf(out, "generation %u: population %zu\n", life.generation(), life.population());

		if (cfg.print)
			life.dump(out);
	} catch (std::exception &e) {
		fprintf(err, "%s: %s\n", __func__, e.what());
		return 1;
	}

	return 0;
}

}
