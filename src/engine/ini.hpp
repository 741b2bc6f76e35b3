#pragma once

#include <map>
#include <string>

namespace torus {

enum class IniStatus {
	ok,
	not_found,
	ioerr,
	invalid_value,
};

enum class IniState {
	find_data,
	in_section,
	in_comment,
	in_key,
	parse_value,
	parse_qval,
};

/**
 * Minimal ini reader. The whole file is parsed once; lookups only touch
 * the cache. Keys before the first section live in section "".
 * If a key occurs twice in one section, the first occurrence wins.
 */
class IniParser final {
	std::map<std::string, std::map<std::string, std::string>> cache;
	IniStatus loaded;
public:
	IniParser() : cache(), loaded(IniStatus::not_found) {}
	explicit IniParser(const char *path);

	bool exists() const noexcept { return loaded == IniStatus::ok; }
	IniStatus status() const noexcept { return loaded; }

	IniStatus load(const char *path);
	void parse(const std::string &text);

	IniStatus try_get(const char *section, const char *key, std::string &dst) const;
	IniStatus try_get(const char *section, const char *key, double &dst) const;
	IniStatus try_get(const char *section, const char *key, long long &dst) const;
	IniStatus try_get(const char *section, const char *key, int &dst) const;
	IniStatus try_get(const char *section, const char *key, bool &dst) const;

	std::string get_or_default(const char *section, const char *key, const char *def) const;
	double get_or_default(const char *section, const char *key, double def) const;
	int get_or_default(const char *section, const char *key, int def) const;
	bool get_or_default(const char *section, const char *key, bool def) const;

	IniStatus try_clamp(const char *section, const char *key, int &dst, int min, int max) const;
	IniStatus try_clamp(const char *section, const char *key, double &dst, double min, double max) const;

	void add_cache(const std::string &section, const std::string &key, const std::string &value);
};

const char *to_string(IniStatus s) noexcept;

}
