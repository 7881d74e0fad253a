#include "common/util/json_config.h"
#include "common/logging.h"

#include <fstream>
#include <sstream>

namespace CVW {

JsonConfigFile::JsonConfigFile()
	: m_root(Json::objectValue)
{
}

JsonConfigFile::JsonConfigFile(const Json::Value &value)
	: m_root(value), m_exists(true)
{
}

JsonConfigFile JsonConfigFile::Load(const std::string &file_name)
{
	std::ifstream ifs(file_name);
	if (!ifs.is_open()) {
		LOG_WARN(MOD_CONFIG, "Config file [{}] not found, using defaults", file_name);
		return JsonConfigFile();
	}

	std::stringstream buffer;
	buffer << ifs.rdbuf();
	JsonConfigFile ret = Parse(buffer.str());
	if (!ret.Ok()) {
		LOG_ERROR(MOD_CONFIG, "Failed to parse config file [{}]: {}", file_name, ret.Error());
	}
	return ret;
}

JsonConfigFile JsonConfigFile::Parse(const std::string &contents)
{
	JsonConfigFile ret;

	Json::CharReaderBuilder builder;
	std::string errors;
	std::istringstream stream(contents);
	Json::Value root;
	if (!Json::parseFromStream(builder, stream, &root, &errors)) {
		ret.m_error = errors.empty() ? "parse error" : errors;
		return ret;
	}

	if (!root.isObject()) {
		ret.m_error = "top-level value is not an object";
		return ret;
	}

	ret.m_root = root;
	ret.m_exists = true;
	return ret;
}

const Json::Value *JsonConfigFile::Find(const std::string &title, const std::string &parameter) const
{
	if (!m_root.isObject() || !m_root.isMember(title)) {
		return nullptr;
	}

	const Json::Value &section = m_root[title];
	if (!section.isObject() || !section.isMember(parameter)) {
		return nullptr;
	}

	return &section[parameter];
}

std::string JsonConfigFile::GetVariableString(const std::string &title, const std::string &parameter,
	const std::string &default_value) const
{
	const Json::Value *v = Find(title, parameter);
	if (!v || !v->isString()) {
		return default_value;
	}
	return v->asString();
}

int JsonConfigFile::GetVariableInt(const std::string &title, const std::string &parameter, int default_value) const
{
	const Json::Value *v = Find(title, parameter);
	if (!v || !v->isInt()) {
		return default_value;
	}
	return v->asInt();
}

bool JsonConfigFile::GetVariableBool(const std::string &title, const std::string &parameter, bool default_value) const
{
	const Json::Value *v = Find(title, parameter);
	if (!v || !v->isBool()) {
		return default_value;
	}
	return v->asBool();
}

double JsonConfigFile::GetVariableDouble(const std::string &title, const std::string &parameter,
	double default_value) const
{
	const Json::Value *v = Find(title, parameter);
	if (!v || !v->isNumeric()) {
		return default_value;
	}
	return v->asDouble();
}

} // namespace CVW
