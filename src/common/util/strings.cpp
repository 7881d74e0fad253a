#include "common/util/strings.h"

#include <algorithm>
#include <cctype>
#include <limits>
#include <stdexcept>

bool Strings::IsNumber(const std::string &s)
{
	if (s.empty()) {
		return false;
	}

	size_t start = s[0] == '-' ? 1 : 0;
	if (start == s.size()) {
		return false;
	}
	return std::all_of(s.begin() + start, s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

int Strings::ToInt(const std::string &s, int fallback)
{
	if (!IsNumber(s)) {
		return fallback;
	}

	try {
		return std::stoi(s);
	}
	catch (const std::out_of_range &) {
		return fallback;
	}
}

uint32_t Strings::ToUnsignedInt(const std::string &s, uint32_t fallback)
{
	if (!IsNumber(s) || s[0] == '-') {
		return fallback;
	}

	try {
		unsigned long long v = std::stoull(s);
		if (v > std::numeric_limits<uint32_t>::max()) {
			return fallback;
		}
		return static_cast<uint32_t>(v);
	}
	catch (const std::out_of_range &) {
		return fallback;
	}
}

std::string Strings::ToLower(std::string s)
{
	std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return s;
}

std::string &Strings::RTrim(std::string &str, std::string_view chars)
{
	const auto last = str.find_last_not_of(chars);
	str.erase(last == std::string::npos ? 0 : last + 1);
	return str;
}

std::string Strings::Join(const std::vector<std::string> &parts, const std::string &delim)
{
	std::string out;
	for (size_t i = 0; i < parts.size(); ++i) {
		if (i != 0) {
			out += delim;
		}
		out += parts[i];
	}
	return out;
}

std::vector<std::string> Strings::Split(const std::string &s, char delim)
{
	std::vector<std::string> out;
	size_t start = 0;
	size_t end = s.find(delim);
	while (end != std::string::npos) {
		out.emplace_back(s, start, end - start);
		start = end + 1;
		end = s.find(delim, start);
	}
	if (s.length() > start) {
		out.emplace_back(s, start, s.length() - start);
	}
	return out;
}
