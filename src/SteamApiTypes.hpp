#ifndef __TINY_STEAMGUARD_STEAMAPITYPES_HPP__
#define __TINY_STEAMGUARD_STEAMAPITYPES_HPP__

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "JsonHelpers.hpp"
#include "SteamGuardAccount.hpp"

//Tokens handed out by a successful login, only used to build a Session
struct OAuthData
{
	std::string oauth_token;
	std::string steamid;
	std::string wgtoken;
	std::string wgtoken_secure;
	std::string webcookie;
};

inline void from_json(const json& data, OAuthData& oauth)
{
	oauth.oauth_token = JsonRequireString(data, "oauth_token");
	oauth.steamid = JsonRequireString(data, "steamid");
	oauth.wgtoken = JsonRequireString(data, "wgtoken");
	oauth.wgtoken_secure = JsonRequireString(data, "wgtoken_secure");
	oauth.webcookie = JsonRequireString(data, "webcookie");
}

struct LoginTransferParameters
{
	std::string steamid;
	std::string token_secure;
	std::string auth;
	bool		remember_login = false;
	std::string webcookie;
};

inline void to_json(json& data, const LoginTransferParameters& params)
{
	data = json{
		{ "steamid", params.steamid },
		{ "token_secure", params.token_secure },
		{ "auth", params.auth },
		{ "remember_login", params.remember_login },
		{ "webcookie", params.webcookie },
	};
}

inline void from_json(const json& data, LoginTransferParameters& params)
{
	params.steamid = JsonRequireString(data, "steamid");
	params.token_secure = JsonRequireString(data, "token_secure");
	params.auth = JsonRequireString(data, "auth");
	params.remember_login = JsonGetBool(data, "remember_login");
	params.webcookie = JsonGetString(data, "webcookie");
}

//Response of /login/dologin. Either the login finished (oauth is set), a transfer is needed
//(transfer_urls/transfer_parameters are set) or one of the challenge flags tells what to add.
struct LoginResponse
{
	bool		success = false;
	bool		login_complete = false;
	bool		captcha_needed = false;
	std::string captcha_gid;
	uint64_t	emailsteamid = 0;
	bool		emailauth_needed = false;
	bool		requires_twofactor = false;
	std::string message;
	std::optional<OAuthData> oauth;
	std::optional<std::vector<std::string>> transfer_urls;
	std::optional<LoginTransferParameters> transfer_parameters;

	bool NeedsTransferLogin() const
	{
		return transfer_urls.has_value() || transfer_parameters.has_value();
	}
};

inline void from_json(const json& data, LoginResponse& response)
{
	response.success = data.at("success").get<bool>();
	response.login_complete = JsonGetBool(data, "login_complete");
	response.captcha_needed = JsonGetBool(data, "captcha_needed");
	response.captcha_gid = JsonGetString(data, "captcha_gid");
	response.emailsteamid = JsonGetUInt64(data, "emailsteamid");
	response.emailauth_needed = JsonGetBool(data, "emailauth_needed");
	response.requires_twofactor = JsonGetBool(data, "requires_twofactor");
	response.message = JsonGetString(data, "message");

	//oauth is a string holding another json document
	if (JsonHasValue(data, "oauth"))
		response.oauth = json::parse(data.at("oauth").get<std::string>()).get<OAuthData>();
	else
		response.oauth.reset();

	if (JsonHasValue(data, "transfer_urls"))
		response.transfer_urls = data.at("transfer_urls").get<std::vector<std::string>>();
	else
		response.transfer_urls.reset();

	if (JsonHasValue(data, "transfer_parameters"))
		response.transfer_parameters = data.at("transfer_parameters").get<LoginTransferParameters>();
	else
		response.transfer_parameters.reset();
}

struct RsaResponse
{
	bool		success = false;
	std::string publickey_exp;
	std::string publickey_mod;
	std::string timestamp;
	std::string token_gid;
};

inline void from_json(const json& data, RsaResponse& response)
{
	response.success = data.at("success").get<bool>();
	response.publickey_exp = JsonGetString(data, "publickey_exp");
	response.publickey_mod = JsonGetString(data, "publickey_mod");
	response.timestamp = JsonGetString(data, "timestamp");
	response.token_gid = JsonGetString(data, "token_gid");
}

//The "response" object of ITwoFactorService/AddAuthenticator
struct AddAuthenticatorResponse
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

	//Not usable for confirmations until the authenticator is finalized
	SteamGuardAccount ToSteamGuardAccount() const
	{
		SteamGuardAccount account;
		account.shared_secret = shared_secret;
		account.serial_number = serial_number;
		account.revocation_code = revocation_code;
		account.uri = uri;
		account.server_time = server_time;
		account.account_name = account_name;
		account.token_gid = token_gid;
		account.identity_secret = identity_secret;
		account.secret_1 = secret_1;
		account.fully_enrolled = false;
		return account;
	}
};

inline void from_json(const json& data, AddAuthenticatorResponse& response)
{
	response.shared_secret = JsonGetString(data, "shared_secret");
	response.serial_number = JsonGetString(data, "serial_number");
	response.revocation_code = JsonGetString(data, "revocation_code");
	response.uri = JsonGetString(data, "uri");
	response.server_time = JsonGetUInt64(data, "server_time");
	response.account_name = JsonGetString(data, "account_name");
	response.token_gid = JsonGetString(data, "token_gid");
	response.identity_secret = JsonGetString(data, "identity_secret");
	response.secret_1 = JsonGetString(data, "secret_1");
	response.status = JsonHasValue(data, "status") ? static_cast<int32_t>(JsonGetUInt64(data, "status")) : 0;
}

#endif // !__TINY_STEAMGUARD_STEAMAPITYPES_HPP__
