#include "ini.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib> // strtod, strtoll
#include <cctype>  // tolower
#include <climits>

namespace torus {

IniParser::IniParser(const char *path) : cache(), loaded(IniStatus::not_found) {
	if (path)
		load(path);
}

IniStatus IniParser::load(const char *path)
{
	FILE *f;

	if (!(f = fopen(path, "rb")))
		return loaded = errno == ENOENT ? IniStatus::not_found : IniStatus::ioerr;

	std::string text;
	char rbuf[4096];
	size_t in;

	while ((in = fread(rbuf, 1, sizeof rbuf, f)) > 0)
		text.append(rbuf, in);

	bool bad = ferror(f) != 0;
	fclose(f);

	if (bad)
		return loaded = IniStatus::ioerr;

	parse(text);
	return loaded = IniStatus::ok;
}

static std::string trim(const std::string &s)
{
	size_t b = s.find_first_not_of(" \t\r"), e = s.find_last_not_of(" \t\r");
	return b == s.npos ? std::string() : s.substr(b, e - b + 1);
}

void IniParser::parse(const std::string &text)
{
	IniState state = IniState::find_data;
	std::string section, key, value;

	for (size_t i = 0, n = text.size(); i < n; ++i) {
		int ch = (unsigned char)text[i];

		switch (state) {
			case IniState::find_data:
				switch (ch) {
					case '[':
						section.clear();
						state = IniState::in_section;
						break;
					case ';':
						state = IniState::in_comment;
						break;
					case ' ': case '\t': case '\r': case '\n':
						break;
					default:
						key.clear();
						key += ch;
						state = IniState::in_key;
						break;
				}
				break;
			case IniState::in_comment:
				if (ch == '\n')
					state = IniState::find_data;
				break;
			case IniState::in_section:
				switch (ch) {
					case ']':
						section = trim(section);
						state = IniState::in_comment;
						break;
					case '\n':
						// unterminated section header
						section = trim(section);
						state = IniState::find_data;
						break;
					default:
						section += ch;
						break;
				}
				break;
			case IniState::in_key:
				switch (ch) {
					case '=':
						value.clear();
						while (i + 1 < n && (text[i + 1] == ' ' || text[i + 1] == '\t'))
							++i;

						if (i + 1 < n && text[i + 1] == '"') {
							state = IniState::parse_qval;
							++i;
						} else {
							state = IniState::parse_value;
						}
						break;
					case '\n':
						// key without value
						state = IniState::find_data;
						break;
					case ' ': case '\t': case '\r':
						break;
					default:
						key += ch;
						break;
				}
				break;
			case IniState::parse_value:
				switch (ch) {
					case ';':
						add_cache(section, key, trim(value));
						state = IniState::in_comment;
						break;
					case '\n':
						add_cache(section, key, trim(value));
						state = IniState::find_data;
						break;
					default:
						value += ch;
						break;
				}
				break;
			case IniState::parse_qval:
				switch (ch) {
					case '"':
						add_cache(section, key, value);
						state = IniState::in_comment;
						break;
					case '\r':
						break;
					default:
						value += ch;
						break;
				}
				break;
		}
	}

	// unterminated values run up to the end of the text
	if (state == IniState::parse_value)
		add_cache(section, key, trim(value));
	else if (state == IniState::parse_qval)
		add_cache(section, key, value);
}

void IniParser::add_cache(const std::string &section, const std::string &key, const std::string &value)
{
	cache[section].try_emplace(key, value);
}

IniStatus IniParser::try_get(const char *section, const char *key, std::string &dst) const
{
	auto it = cache.find(section);
	if (it == cache.end())
		return IniStatus::not_found;

	auto it2 = it->second.find(key);
	if (it2 == it->second.end())
		return IniStatus::not_found;

	dst = it2->second;
	return IniStatus::ok;
}

IniStatus IniParser::try_get(const char *section, const char *key, double &dst) const
{
	std::string value;
	IniStatus s;

	if ((s = try_get(section, key, value)) != IniStatus::ok)
		return s;

	const char *str = value.c_str();
	char *end = NULL;

	errno = 0;
	double v = std::strtod(str, &end);
	if (end == str || *end || errno == ERANGE)
		return IniStatus::invalid_value;

	dst = v;
	return IniStatus::ok;
}

IniStatus IniParser::try_get(const char *section, const char *key, long long &dst) const
{
	std::string value;
	IniStatus s;

	if ((s = try_get(section, key, value)) != IniStatus::ok)
		return s;

	const char *str = value.c_str();
	char *end = NULL;

	errno = 0;
	long long v = std::strtoll(str, &end, 10);
	if (end == str || *end || errno == ERANGE)
		return IniStatus::invalid_value;

	dst = v;
	return IniStatus::ok;
}

IniStatus IniParser::try_get(const char *section, const char *key, int &dst) const
{
	long long v;
	IniStatus s;

	if ((s = try_get(section, key, v)) != IniStatus::ok)
		return s;

	if (v < INT_MIN || v > INT_MAX)
		return IniStatus::invalid_value;

	dst = (int)v;
	return IniStatus::ok;
}

static bool streqcase(const std::string &s1, const char *s2)
{
	size_t i = 0;

	for (; i < s1.size() && s2[i]; ++i)
		if (tolower((unsigned char)s1[i]) != tolower((unsigned char)s2[i]))
			return false;

	return i == s1.size() && !s2[i];
}

IniStatus IniParser::try_get(const char *section, const char *key, bool &dst) const
{
	std::string value;
	IniStatus s;

	if ((s = try_get(section, key, value)) != IniStatus::ok)
		return s;

	if (value == "1" || streqcase(value, "true") || streqcase(value, "on")) {
		dst = true;
		return IniStatus::ok;
	}

	if (value == "0" || streqcase(value, "false") || streqcase(value, "off")) {
		dst = false;
		return IniStatus::ok;
	}

	return IniStatus::invalid_value;
}

std::string IniParser::get_or_default(const char *section, const char *key, const char *def) const
{
	std::string v;
	return try_get(section, key, v) == IniStatus::ok ? v : std::string(def);
}

double IniParser::get_or_default(const char *section, const char *key, double def) const
{
	double v;
	return try_get(section, key, v) == IniStatus::ok ? v : def;
}

int IniParser::get_or_default(const char *section, const char *key, int def) const
{
	int v;
	return try_get(section, key, v) == IniStatus::ok ? v : def;
}

bool IniParser::get_or_default(const char *section, const char *key, bool def) const
{
	bool v;
	return try_get(section, key, v) == IniStatus::ok ? v : def;
}

IniStatus IniParser::try_clamp(const char *section, const char *key, int &dst, int min, int max) const
{
	int v;
	IniStatus s;

	if ((s = try_get(section, key, v)) != IniStatus::ok)
		return s;

	dst = v < min ? min : v > max ? max : v;
	return IniStatus::ok;
}

IniStatus IniParser::try_clamp(const char *section, const char *key, double &dst, double min, double max) const
{
	double v;
	IniStatus s;

	if ((s = try_get(section, key, v)) != IniStatus::ok)
		return s;

	dst = v < min ? min : v > max ? max : v;
	return IniStatus::ok;
}

const char *to_string(IniStatus s) noexcept
{
	switch (s) {
		case IniStatus::ok:            return "ok";
		case IniStatus::not_found:     return "not found";
		case IniStatus::ioerr:         return "i/o error";
		case IniStatus::invalid_value: return "invalid value";
	}
	return "unknown";
}

}
