#ifndef __TINY_STEAMGUARD_JSONHELPERS_HPP__
#define __TINY_STEAMGUARD_JSONHELPERS_HPP__

#include <charconv>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

//Steam and SDA are not consistent about value types: ids and timestamps show up
//both as numbers and as strings, and optional fields are either missing or null.

inline bool JsonHasValue(const json& data, const char* key)
{
	auto it = data.find(key);
	return it != data.end() && !it->is_null();
}

inline std::string JsonGetString(const json& data, const char* key)
{
	auto it = data.find(key);
	if (it == data.end() || it->is_null())
		return {};

	if (it->is_string())
		return it->get<std::string>();

	return it->dump();
}

//Required string field, numbers are accepted and kept as their json text
inline std::string JsonRequireString(const json& data, const char* key)
{
	if (!JsonHasValue(data, key))
		throw std::invalid_argument(std::string("missing field ") + key);

	return JsonGetString(data, key);
}

inline uint64_t ParseUInt64(const std::string& text, const char* what)
{
	uint64_t value = 0;
	auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
	if (ec != std::errc() || ptr != text.data() + text.size() || text.empty())
		throw std::invalid_argument(std::string(what) + " is not an unsigned integer: \"" + text + "\"");

	return value;
}

inline uint64_t JsonGetUInt64(const json& data, const char* key)
{
	auto it = data.find(key);
	if (it == data.end() || it->is_null())
		return 0;

	if (it->is_number_unsigned())
		return it->get<uint64_t>();

	if (it->is_number_integer())
	{
		auto value = it->get<int64_t>();
		if (value < 0)
			throw std::invalid_argument(std::string(key) + " is negative: " + std::to_string(value));
		return static_cast<uint64_t>(value);
	}

	if (it->is_string())
		return ParseUInt64(it->get<std::string>(), key);

	throw std::invalid_argument(std::string(key) + " has an unexpected type: " + it->type_name());
}

inline bool JsonGetBool(const json& data, const char* key, bool defaultValue = false)
{
	auto it = data.find(key);
	if (it == data.end() || it->is_null())
		return defaultValue;

	return it->get<bool>();
}

inline std::optional<std::string> JsonGetOptionalString(const json& data, const char* key)
{
	if (!JsonHasValue(data, key))
		return std::nullopt;

	return JsonGetString(data, key);
}

#endif // !__TINY_STEAMGUARD_JSONHELPERS_HPP__
