#ifndef __TINY_STEAMGUARD_MANIFEST_HPP__
#define __TINY_STEAMGUARD_MANIFEST_HPP__

#include <algorithm>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include "JsonHelpers.hpp"

inline constexpr auto CURRENT_MANIFEST_VERSION	= 1;
inline constexpr auto MANIFEST_FILE_NAME		= "manifest.json";
inline constexpr auto MAFILE_EXTENSION			= ".maFile";

enum class EncryptionScheme
{
	//PBKDF2-HMAC-SHA1 key, AES-256-CBC body, what Steam Desktop Authenticator writes
	LegacySdaCompatible,
};

inline constexpr const char* EncryptionSchemeName(EncryptionScheme scheme)
{
	switch (scheme)
	{
	case EncryptionScheme::LegacySdaCompatible:
		return "LegacySdaCompatible";
	}
	return "";
}

//Everything needed to derive the key of one entry from the passkey. Base64 encoded.
struct EntryEncryptionParams
{
	std::string			iv;
	std::string			salt;
	EncryptionScheme	scheme = EncryptionScheme::LegacySdaCompatible;
};

inline void to_json(json& data, const EntryEncryptionParams& params)
{
	data = json{
		{ "iv", params.iv },
		{ "salt", params.salt },
		{ "scheme", EncryptionSchemeName(params.scheme) },
	};
}

inline void from_json(const json& data, EntryEncryptionParams& params)
{
	params.iv = data.at("iv").get<std::string>();
	params.salt = data.at("salt").get<std::string>();

	auto scheme = JsonGetString(data, "scheme");
	if (scheme.empty() || scheme == EncryptionSchemeName(EncryptionScheme::LegacySdaCompatible))
		params.scheme = EncryptionScheme::LegacySdaCompatible;
	else
		throw std::invalid_argument("unsupported encryption scheme \"" + scheme + "\"");
}

struct ManifestEntry
{
	std::string filename;
	std::string account_name;
	uint64_t	steam_id = 0;
	std::optional<EntryEncryptionParams> encryption;
};

inline void to_json(json& data, const ManifestEntry& entry)
{
	data = json{
		{ "filename", entry.filename },
		{ "steam_id", entry.steam_id },
		{ "account_name", entry.account_name },
	};

	if (entry.encryption)
		data["encryption"] = *entry.encryption;
	else
		data["encryption"] = nullptr;
}

inline void from_json(const json& data, ManifestEntry& entry)
{
	entry.filename = data.at("filename").get<std::string>();
	entry.account_name = JsonGetString(data, "account_name");
	entry.steam_id = JsonGetUInt64(data, "steam_id");

	if (JsonHasValue(data, "encryption"))
		entry.encryption = data.at("encryption").get<EntryEncryptionParams>();
	else
		entry.encryption.reset();
}

//Canonical manifest
struct Manifest
{
	int							version = CURRENT_MANIFEST_VERSION;
	std::vector<ManifestEntry>	entries;
	std::optional<std::string>	keyring_id;

	bool IsEncrypted() const
	{
		return std::any_of(entries.begin(), entries.end(),
			[](const ManifestEntry& entry) { return entry.encryption.has_value(); });
	}
};

inline void to_json(json& data, const Manifest& manifest)
{
	data = json{
		{ "version", manifest.version },
		{ "entries", manifest.entries },
	};

	if (manifest.keyring_id)
		data["keyring_id"] = *manifest.keyring_id;
	else
		data["keyring_id"] = nullptr;
}

inline void from_json(const json& data, Manifest& manifest)
{
	manifest.version = data.at("version").get<int>();
	manifest.entries = data.at("entries").get<std::vector<ManifestEntry>>();
	manifest.keyring_id = JsonGetOptionalString(data, "keyring_id");
}

#endif // !__TINY_STEAMGUARD_MANIFEST_HPP__
