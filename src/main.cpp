#include <cstdio>

#include "engine/ini.hpp"
#include "life/tlife.hpp"

using namespace torus;

int main(int argc, char **argv)
{
	const char *path = argc > 1 ? argv[1] : "tlife.ini";
	IniParser ini(path);

	switch (ini.status()) {
		case IniStatus::ok:
			break;
		case IniStatus::not_found:
			if (argc > 1)
				fprintf(stderr, "%s: %s not found, using defaults\n", __func__, path);
			break;
		default:
			fprintf(stderr, "%s: cannot read %s: %s\n", __func__, path, to_string(ini.status()));
			return 1;
	}

	return run(Settings(ini), stdout, stderr);
}
