#ifndef __TINY_STEAMGUARD_STEAMGUARDACCOUNT_HPP__
#define __TINY_STEAMGUARD_STEAMGUARDACCOUNT_HPP__

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/hex.h>
#include <cryptopp/hmac.h>
#include <cryptopp/sha.h>
#include "JsonHelpers.hpp"

inline constexpr auto STEAM_GUARD_CODE_CHARS	= "23456789BCDFGHJKMNPQRTVWXY";
inline constexpr auto STEAM_GUARD_CODE_LENGTH	= 5;
inline constexpr auto STEAM_GUARD_CODE_PERIOD	= 30;

//Tokens needed to act as a logged in steam user. Keys match what SDA writes.
struct Session
{
	std::string session_id;
	std::string steam_login;
	std::string steam_login_secure;
	std::string web_cookie;
	std::string token;
	uint64_t	steam_id = 0;
};

inline void to_json(json& data, const Session& session)
{
	data = json{
		{ "SessionID", session.session_id },
		{ "SteamLogin", session.steam_login },
		{ "SteamLoginSecure", session.steam_login_secure },
		{ "WebCookie", session.web_cookie },
		{ "OAuthToken", session.token },
		{ "SteamID", session.steam_id },
	};
}

inline void from_json(const json& data, Session& session)
{
	session.session_id = JsonGetString(data, "SessionID");
	session.steam_login = JsonGetString(data, "SteamLogin");
	session.steam_login_secure = JsonGetString(data, "SteamLoginSecure");
	session.web_cookie = JsonGetString(data, "WebCookie");
	session.token = JsonGetString(data, "OAuthToken");
	session.steam_id = JsonGetUInt64(data, "SteamID");
}

//Canonical secret bundle of one authenticator
struct SteamGuardAccount
{
	std::string account_name;
	uint64_t	steam_id = 0;
	std::string serial_number;
	std::string revocation_code;
	std::string shared_secret;
	std::string token_gid;
	std::string identity_secret;
	std::string uri;
	std::string device_id;
	std::string secret_1;
	uint64_t	server_time = 0;
	bool		fully_enrolled = false;
	std::optional<Session> session;

	//Generate the steam guard code valid at the given unix time
	std::string GenerateCode(time_t time) const
	{
		std::string key;
		CryptoPP::StringSource decoder(shared_secret, true,
			new CryptoPP::Base64Decoder(
				new CryptoPP::StringSink(key)
			)
		);

		uint64_t steps = static_cast<uint64_t>(time) / STEAM_GUARD_CODE_PERIOD;
		CryptoPP::byte message[8];
		for (int i = 7; i >= 0; --i)
		{
			message[i] = static_cast<CryptoPP::byte>(steps & 0xFF);
			steps >>= 8;
		}

		CryptoPP::byte digest[CryptoPP::HMAC<CryptoPP::SHA1>::DIGESTSIZE];
		CryptoPP::HMAC<CryptoPP::SHA1> hmac(reinterpret_cast<const CryptoPP::byte*>(key.data()), key.size());
		hmac.CalculateDigest(digest, message, sizeof(message));

		//Dynamic truncation, same as RFC 4226
		auto offset = digest[sizeof(digest) - 1] & 0x0F;
		uint32_t fullCode = ((digest[offset] & 0x7F) << 24)
			| ((digest[offset + 1] & 0xFF) << 16)
			| ((digest[offset + 2] & 0xFF) << 8)
			| (digest[offset + 3] & 0xFF);

		const std::string alphabet = STEAM_GUARD_CODE_CHARS;
		std::string code;
		for (int i = 0; i < STEAM_GUARD_CODE_LENGTH; ++i)
		{
			code += alphabet[fullCode % alphabet.size()];
			fullCode /= static_cast<uint32_t>(alphabet.size());
		}

		return code;
	}

	std::string GenerateCode() const
	{
		return GenerateCode(time(nullptr));
	}
};

inline void to_json(json& data, const SteamGuardAccount& account)
{
	data = json{
		{ "account_name", account.account_name },
		{ "steam_id", account.steam_id },
		{ "serial_number", account.serial_number },
		{ "revocation_code", account.revocation_code },
		{ "shared_secret", account.shared_secret },
		{ "token_gid", account.token_gid },
		{ "identity_secret", account.identity_secret },
		{ "uri", account.uri },
		{ "device_id", account.device_id },
		{ "secret_1", account.secret_1 },
		{ "server_time", account.server_time },
		{ "fully_enrolled", account.fully_enrolled },
	};

	if (account.session)
		data["Session"] = *account.session;
	else
		data["Session"] = nullptr;
}

inline void from_json(const json& data, SteamGuardAccount& account)
{
	account.account_name = JsonGetString(data, "account_name");
	account.steam_id = JsonGetUInt64(data, "steam_id");
	account.serial_number = JsonGetString(data, "serial_number");
	account.revocation_code = JsonGetString(data, "revocation_code");
	account.shared_secret = JsonGetString(data, "shared_secret");
	account.token_gid = JsonGetString(data, "token_gid");
	account.identity_secret = JsonGetString(data, "identity_secret");
	account.uri = JsonGetString(data, "uri");
	account.device_id = JsonGetString(data, "device_id");
	account.secret_1 = JsonGetString(data, "secret_1");
	account.server_time = JsonGetUInt64(data, "server_time");
	account.fully_enrolled = JsonGetBool(data, "fully_enrolled");

	if (JsonHasValue(data, "Session"))
		account.session = data.at("Session").get<Session>();
	else
		account.session.reset();
}

//Device id the mobile app derives from the steam id: android:<sha1 formatted as a uuid>
inline std::string GenerateDeviceId(uint64_t steamId)
{
	std::string hex;
	CryptoPP::SHA1 sha1;
	CryptoPP::StringSource hasher(std::to_string(steamId), true,
		new CryptoPP::HashFilter(sha1,
			new CryptoPP::HexEncoder(
				new CryptoPP::StringSink(hex), false
			)
		)
	);

	return "android:" + hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-"
		+ hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

#endif // !__TINY_STEAMGUARD_STEAMGUARDACCOUNT_HPP__
