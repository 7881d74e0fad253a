#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <strings.h>

class Strings {
public:
	static bool IsNumber(const std::string &s);
	static int ToInt(const std::string &s, int fallback = 0);
	static uint32_t ToUnsignedInt(const std::string &s, uint32_t fallback = 0);
	static std::string ToLower(std::string s);
	static std::string &RTrim(std::string &str, std::string_view chars = "\t\n\v\f\r ");
	static std::string Join(const std::vector<std::string> &parts, const std::string &delim);

	// "Annie:1:" -> {"Annie", "1"}; a trailing empty field is dropped
	static std::vector<std::string> Split(const std::string &s, char delim = ',');

	static inline bool EqualFold(const std::string &a, const std::string &b)
	{
		return strcasecmp(a.c_str(), b.c_str()) == 0;
	}
};
