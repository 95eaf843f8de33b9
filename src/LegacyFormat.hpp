#ifndef __TINY_STEAMGUARD_LEGACYFORMAT_HPP__
#define __TINY_STEAMGUARD_LEGACYFORMAT_HPP__

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "JsonHelpers.hpp"
#include "Manifest.hpp"
#include "SteamGuardAccount.hpp"

//Files written by Steam Desktop Authenticator (SDA), the format before manifests were versioned.

struct SdaEntryEncryptionParams
{
	std::string iv;
	std::string salt;
};

struct SdaManifestEntry
{
	std::string filename;
	uint64_t	steam_id = 0;
	std::optional<SdaEntryEncryptionParams> encryption;
};

inline void from_json(const json& data, SdaManifestEntry& entry)
{
	entry.filename = data.at("filename").get<std::string>();
	entry.steam_id = JsonGetUInt64(data, "steamid");

	//SDA writes null for both fields when the entry is not encrypted
	if (JsonHasValue(data, "encryption_iv") && JsonHasValue(data, "encryption_salt"))
	{
		entry.encryption = SdaEntryEncryptionParams{
			data.at("encryption_iv").get<std::string>(),
			data.at("encryption_salt").get<std::string>(),
		};
	}
	else
	{
		entry.encryption.reset();
	}
}

//Only what survives the upgrade is kept, SDA's confirmation settings are dropped
struct SdaManifest
{
	bool encrypted = false;
	bool first_run = false;
	std::vector<SdaManifestEntry> entries;
};

inline void from_json(const json& data, SdaManifest& manifest)
{
	manifest.encrypted = JsonGetBool(data, "encrypted");
	manifest.first_run = JsonGetBool(data, "first_run");
	manifest.entries = data.at("entries").get<std::vector<SdaManifestEntry>>();
}

struct SdaAccount
{
	std::string shared_secret;
	std::string serial_number;
	std::string revocation_code;
	std::string uri;
	uint64_t	server_time = 0;
	std::string account_name;
	std::string token_gid;
	std::string identity_secret;
	std::string secret_1;
	int32_t		status = 0;
	std::string device_id;
	bool		fully_enrolled = false;
	std::optional<Session> session;
};

inline void from_json(const json& data, SdaAccount& account)
{
	account.shared_secret = JsonGetString(data, "shared_secret");
	account.serial_number = JsonGetString(data, "serial_number");
	account.revocation_code = JsonGetString(data, "revocation_code");
	account.uri = JsonGetString(data, "uri");
	account.server_time = JsonGetUInt64(data, "server_time");
	account.account_name = JsonGetString(data, "account_name");
	account.token_gid = JsonGetString(data, "token_gid");
	account.identity_secret = JsonGetString(data, "identity_secret");
	account.secret_1 = JsonGetString(data, "secret_1");
	account.status = JsonHasValue(data, "status") ? data.at("status").get<int32_t>() : 0;
	account.device_id = JsonGetString(data, "device_id");
	account.fully_enrolled = JsonGetBool(data, "fully_enrolled");

	if (JsonHasValue(data, "Session"))
		account.session = data.at("Session").get<Session>();
	else
		account.session.reset();
}

inline Manifest UpgradeSdaManifest(const SdaManifest& sda)
{
	Manifest manifest;
	manifest.version = CURRENT_MANIFEST_VERSION;
	manifest.entries.reserve(sda.entries.size());

	for (const auto& sdaEntry : sda.entries)
	{
		ManifestEntry entry;
		entry.filename = sdaEntry.filename;
		entry.steam_id = sdaEntry.steam_id;
		//SDA never stored account names, they are filled in from the accounts later

		if (sdaEntry.encryption)
		{
			entry.encryption = EntryEncryptionParams{
				sdaEntry.encryption->iv,
				sdaEntry.encryption->salt,
				EncryptionScheme::LegacySdaCompatible,
			};
		}

		manifest.entries.push_back(std::move(entry));
	}

	return manifest;
}

inline SteamGuardAccount UpgradeSdaAccount(const SdaAccount& sda)
{
	SteamGuardAccount account;
	account.account_name = sda.account_name;
	account.steam_id = sda.session ? sda.session->steam_id : 0;
	account.serial_number = sda.serial_number;
	account.revocation_code = sda.revocation_code;
	account.shared_secret = sda.shared_secret;
	account.token_gid = sda.token_gid;
	account.identity_secret = sda.identity_secret;
	account.uri = sda.uri;
	account.device_id = sda.device_id;
	account.secret_1 = sda.secret_1;
	account.server_time = sda.server_time;
	account.fully_enrolled = sda.fully_enrolled;
	account.session = sda.session;
	return account;
}

#endif // !__TINY_STEAMGUARD_LEGACYFORMAT_HPP__
