#pragma once

#include <json/json.h>
#include <string>

namespace CVW {

// Thin wrapper over a parsed JSON document with "section.parameter" lookups
// that fall back to a default when the value is missing or has the wrong type.
class JsonConfigFile {
public:
	JsonConfigFile();
	explicit JsonConfigFile(const Json::Value &value);
	~JsonConfigFile() = default;

	// Never throws. A missing file yields an empty (object) config with
	// Exists() false; a parse error yields an empty config with Error() set.
	static JsonConfigFile Load(const std::string &file_name);
	static JsonConfigFile Parse(const std::string &contents);

	bool Exists() const { return m_exists; }
	bool Ok() const { return m_error.empty(); }
	const std::string &Error() const { return m_error; }

	std::string GetVariableString(const std::string &title, const std::string &parameter,
		const std::string &default_value) const;
	int GetVariableInt(const std::string &title, const std::string &parameter, int default_value) const;
	bool GetVariableBool(const std::string &title, const std::string &parameter, bool default_value) const;
	double GetVariableDouble(const std::string &title, const std::string &parameter, double default_value) const;

	Json::Value &RawHandle() { return m_root; }
	const Json::Value &RawHandle() const { return m_root; }

private:
	const Json::Value *Find(const std::string &title, const std::string &parameter) const;

	Json::Value m_root;
	bool m_exists = false;
	std::string m_error;
};

} // namespace CVW
