#ifndef __TINY_STEAMGUARD_STEAMAPICLIENT_HPP__
#define __TINY_STEAMGUARD_STEAMAPICLIENT_HPP__

#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/integer.h>
#include <cryptopp/osrng.h>
#include <cryptopp/rsa.h>
#include "BasicIO.hpp"
#include "CookieJar.hpp"
#include "HttpTransport.hpp"
#include "JsonHelpers.hpp"
#include "SteamApiTypes.hpp"
#include "SteamGuardAccount.hpp"
#include "SteamGuardError.hpp"

inline constexpr auto STEAM_COMMUNITY_BASE	= "https://steamcommunity.com";
inline constexpr auto STEAM_API_BASE		= "https://api.steampowered.com";

//The community site only serves the mobile flow to something that looks like the android app
inline constexpr auto MOBILE_USER_AGENT		= "Mozilla/5.0 (Linux; U; Android 4.1.1; en-us; Google Nexus 4 - 4.1.1 - API 16 - 768x1280 Build/JRO03S) AppleWebKit/534.30 (KHTML, like Gecko) Version/4.0 Mobile Safari/534.30";
inline constexpr auto MOBILE_REQUESTED_WITH	= "com.valvesoftware.android.steam.community";
inline constexpr auto MOBILE_CLIENT_VERSION	= "0 (2.1.3)";

inline constexpr auto OAUTH_CLIENT_ID		= "DE45CD61";
inline constexpr auto OAUTH_SCOPE			= "read_profile write_profile read_client write_client";
inline constexpr auto SESSION_ID_COOKIE		= "sessionid";
inline constexpr auto STEAM_LOGIN_SEPARATOR	= "%7C%7C";

inline constexpr auto CONTENT_TYPE_FORM		= "application/x-www-form-urlencoded";
inline constexpr auto CONTENT_TYPE_JSON		= "application/json";

struct SteamApiConfig
{
	std::string community_base = STEAM_COMMUNITY_BASE;
	std::string api_base = STEAM_API_BASE;
	std::string user_agent = MOBILE_USER_AGENT;
	std::string requested_with = MOBILE_REQUESTED_WITH;
	std::string mobile_client_version = MOBILE_CLIENT_VERSION;
};

//Raw access to steam's mobile login and authenticator endpoints. Owns the cookie jar and
//the session derived from it, use one instance per steam account. Not thread safe.
class SteamApiClient
{
public:
	explicit SteamApiClient(std::shared_ptr<IHttpTransport> transport, SteamApiConfig config = {}) :
		m_Transport(std::move(transport)),
		m_Config(std::move(config))
	{
	}

	//Fills the cookie jar with a fresh anonymous sessionid
	void UpdateSession()
	{
		tracemsg("SteamApiClient::UpdateSession\n");

		auto url = m_Config.community_base + "/login?oauth_client_id=" + OAUTH_CLIENT_ID
			+ "&oauth_scope=" + UrlEncode(OAUTH_SCOPE);
		Send(HttpMethod::Get, url);
		dbgmsg("Session updated, %zu cookie(s) in jar\n", m_Cookies.Size());
	}

	//Endpoint: POST /login/getrsakey
	RsaResponse GetRsaKey(const std::string& username)
	{
		FormParams params = {
			{ "donotcache", DoNotCache() },
			{ "username", username },
		};

		auto response = Send(HttpMethod::Post, m_Config.community_base + "/login/getrsakey", FormEncode(params), CONTENT_TYPE_FORM);
		return Decode<RsaResponse>(response, "rsa key");
	}

	//RSA PKCS#1 v1.5 with the key from GetRsaKey, base64 encoded the way dologin expects it
	static std::string EncryptPassword(const RsaResponse& rsa, const std::string& password)
	{
		if (!IsHex(rsa.publickey_mod) || !IsHex(rsa.publickey_exp))
			throw SteamApiError(SteamApiErrc::Decode, "rsa key is not hex encoded");

		CryptoPP::Integer modulus((rsa.publickey_mod + "h").c_str());
		CryptoPP::Integer exponent((rsa.publickey_exp + "h").c_str());

		CryptoPP::RSA::PublicKey publicKey;
		publicKey.Initialize(modulus, exponent);
		CryptoPP::RSAES_PKCS1v15_Encryptor rsaEncryptor(publicKey);

		CryptoPP::AutoSeededRandomPool randomPool;
		std::string encrypted;
		CryptoPP::StringSource rsa_s(password, true,
			new CryptoPP::PK_EncryptorFilter(randomPool, rsaEncryptor,
				new CryptoPP::Base64Encoder(
					new CryptoPP::StringSink(encrypted), false
				)
			)
		);

		return encrypted;
	}

	//Endpoint: POST /login/dologin
	LoginResponse Login(const std::string& username,
		const std::string& encryptedPassword,
		const std::string& twoFactorCode,
		const std::string& emailCode,
		const std::string& captchaGid,
		const std::string& captchaText,
		const std::string& rsaTimestamp)
	{
		FormParams params = {
			{ "donotcache", DoNotCache() },
			{ "username", username },
			{ "password", encryptedPassword },
			{ "twofactorcode", twoFactorCode },
			{ "emailauth", emailCode },
			{ "captchagid", captchaGid },
			{ "captcha_text", captchaText },
			{ "rsatimestamp", rsaTimestamp },
			{ "remember_login", "true" },
			{ "oauth_client_id", OAUTH_CLIENT_ID },
			{ "oauth_scope", OAUTH_SCOPE },
		};

		auto response = Send(HttpMethod::Post, m_Config.community_base + "/login/dologin", FormEncode(params), CONTENT_TYPE_FORM);
		tracemsg("raw login response: %s\n", response.body.c_str());

		auto login = Decode<LoginResponse>(response, "login response");
		if (login.oauth)
			m_Session = BuildSession(*login.oauth);

		if (!login.success)
		{
			dbgmsg("Login not complete: captcha_needed %d, requires_twofactor %d, emailauth_needed %d\n",
				login.captcha_needed, login.requires_twofactor, login.emailauth_needed);
		}

		return login;
	}

	//Second login step, only needed when the login response carried transfer data.
	//Endpoints: provided by the login response
	OAuthData TransferLogin(const LoginResponse& login)
	{
		if (!login.transfer_urls && !login.transfer_parameters)
			throw SteamApiError(SteamApiErrc::MissingTransferData);
		if (!login.transfer_parameters)
			throw SteamApiError(SteamApiErrc::MissingTransferParameters);
		if (!login.transfer_urls)
			throw SteamApiError(SteamApiErrc::MissingTransferUrls);

		dbgmsg("Received transfer parameters, relaying data...\n");
		const auto& params = *login.transfer_parameters;
		auto body = json(params).dump();
		for (const auto& url : *login.transfer_urls)
		{
			tracemsg("Posting transfer to %s\n", url.c_str());
			Send(HttpMethod::Post, url, body, CONTENT_TYPE_JSON);
		}

		//TODO: check wgtoken against captured transfer traffic, token_secure is assumed for both
		OAuthData oauth;
		oauth.oauth_token = params.auth;
		oauth.steamid = params.steamid;
		oauth.wgtoken = params.token_secure;
		oauth.wgtoken_secure = params.token_secure;
		oauth.webcookie = params.webcookie;

		m_Session = BuildSession(oauth);
		return oauth;
	}

	bool HasPhone()
	{
		return PhoneAjax("has_phone", "null");
	}

	bool CheckSmsCode(const std::string& smsCode)
	{
		return PhoneAjax("check_sms_code", smsCode);
	}

	bool CheckEmailConfirmation()
	{
		return PhoneAjax("email_confirmation", "");
	}

	bool AddPhoneNumber(const std::string& phoneNumber)
	{
		return PhoneAjax("add_phone_number", phoneNumber);
	}

	//Starts linking a new authenticator. Nothing is checked beforehand (phone, email confirmation),
	//steam rejects the request when those are missing.
	//Endpoint: POST /ITwoFactorService/AddAuthenticator/v0001
	AddAuthenticatorResponse AddAuthenticator(const std::string& deviceId)
	{
		const auto& session = RequireSession();
		FormParams params = {
			{ "access_token", session.token },
			{ "steamid", std::to_string(session.steam_id) },
			{ "authenticator_type", "1" },
			{ "device_identifier", deviceId },
			{ "sms_phone_id", "1" },
		};

		auto response = Send(HttpMethod::Post, m_Config.api_base + "/ITwoFactorService/AddAuthenticator/v0001", FormEncode(params), CONTENT_TYPE_FORM);
		tracemsg("raw add authenticator response: %s\n", response.body.c_str());

		auto data = ParseJson(response, "add authenticator response");
		if (!JsonHasValue(data, "response"))
			throw SteamApiError(SteamApiErrc::MissingField, "response");

		return Decode<AddAuthenticatorResponse>(data.at("response"), "add authenticator response");
	}

	//Endpoint: POST /ITwoFactorService/QueryTime/v0001
	int64_t GetServerTime()
	{
		auto response = Send(HttpMethod::Post, m_Config.api_base + "/ITwoFactorService/QueryTime/v0001", "steamid=0", CONTENT_TYPE_FORM);

		auto data = ParseJson(response, "query time response");
		if (!JsonHasValue(data, "response") || !JsonHasValue(data.at("response"), "server_time"))
			throw SteamApiError(SteamApiErrc::MissingField, "response.server_time");

		try
		{
			return static_cast<int64_t>(JsonGetUInt64(data.at("response"), "server_time"));
		}
		catch (const std::exception& e)
		{
			throw SteamApiError(SteamApiErrc::Decode, e.what());
		}
	}

	const std::optional<Session>& GetSession() const { return m_Session; }
	void SetSession(Session session) { m_Session = std::move(session); }
	const CookieJar& GetCookies() const { return m_Cookies; }
	const SteamApiConfig& GetConfig() const { return m_Config; }
	const std::shared_ptr<IHttpTransport>& GetTransport() const { return m_Transport; }

private:
	//Every request looks like it came from the mobile app and carries the whole jar
	HttpResponse Send(HttpMethod method, const std::string& url, std::string body = {}, const char* contentType = nullptr)
	{
		m_Cookies.Set("mobileClientVersion", m_Config.mobile_client_version);
		m_Cookies.Set("mobileClient", "android");
		m_Cookies.Set("Steam_Language", "english");

		HttpRequest request;
		request.method = method;
		request.url = url;
		request.body = std::move(body);
		request.headers = {
			{ "User-Agent", m_Config.user_agent },
			{ "X-Requested-With", m_Config.requested_with },
			{ "Cookie", m_Cookies.ToHeader() },
		};
		if (contentType)
			request.headers.emplace_back("Content-Type", contentType);

		auto response = m_Transport->Perform(request);
		SaveCookiesFromResponse(response);
		return response;
	}

	void SaveCookiesFromResponse(const HttpResponse& response)
	{
		for (const auto& header : response.GetHeaders("Set-Cookie"))
			m_Cookies.AddSetCookieHeader(header);
	}

	Session BuildSession(const OAuthData& oauth) const
	{
		Session session;
		try
		{
			session.steam_id = ParseUInt64(oauth.steamid, "steamid");
		}
		catch (const std::invalid_argument& e)
		{
			throw SteamApiError(SteamApiErrc::Decode, e.what());
		}

		session.token = oauth.oauth_token;
		session.steam_login = oauth.steamid + STEAM_LOGIN_SEPARATOR + oauth.wgtoken;
		session.steam_login_secure = oauth.steamid + STEAM_LOGIN_SEPARATOR + oauth.wgtoken_secure;
		session.web_cookie = oauth.webcookie;

		auto sessionId = m_Cookies.Get(SESSION_ID_COOKIE);
		if (!sessionId)
			throw SteamApiError(SteamApiErrc::MissingField, "no sessionid cookie, call UpdateSession first");
		session.session_id = *sessionId;

		return session;
	}

	const Session& RequireSession() const
	{
		if (!m_Session)
			throw SteamApiError(SteamApiErrc::NoSession);

		return *m_Session;
	}

	//Endpoint: POST /steamguard/phoneajax
	bool PhoneAjax(const std::string& op, const std::string& arg)
	{
		const auto& session = RequireSession();
		FormParams params = {
			{ "op", op },
			{ "arg", arg },
			{ "sessionid", session.session_id },
		};
		if (op == "check_sms_code")
		{
			params.emplace_back("checkfortos", "0");
			params.emplace_back("skipvoip", "1");
		}

		auto response = Send(HttpMethod::Post, m_Config.community_base + "/steamguard/phoneajax", FormEncode(params), CONTENT_TYPE_FORM);
		auto result = ParseJson(response, "phoneajax response");

		for (const char* field : { "has_phone", "success" })
		{
			if (!JsonHasValue(result, field))
				continue;

			tracemsg("Found %s field\n", field);
			const auto& value = result.at(field);
			if (!value.is_boolean())
				throw SteamApiError(SteamApiErrc::Decode, std::string("failed to parse ") + field + " field into boolean");

			return value.get<bool>();
		}

		tracemsg("Did not find any expected field\n");
		return false;
	}

	static json ParseJson(const HttpResponse& response, const char* what)
	{
		try
		{
			return json::parse(response.body);
		}
		catch (const json::exception& e)
		{
			throw SteamApiError(SteamApiErrc::Decode, std::string(what) + " (HTTP " + std::to_string(response.status) + "): " + e.what());
		}
	}

	template<typename ResponseType>
	static ResponseType Decode(const json& data, const char* what)
	{
		try
		{
			return data.get<ResponseType>();
		}
		catch (const json::exception& e)
		{
			throw SteamApiError(SteamApiErrc::Decode, std::string(what) + ": " + e.what());
		}
		catch (const std::invalid_argument& e)
		{
			throw SteamApiError(SteamApiErrc::Decode, std::string(what) + ": " + e.what());
		}
	}

	template<typename ResponseType>
	static ResponseType Decode(const HttpResponse& response, const char* what)
	{
		return Decode<ResponseType>(ParseJson(response, what), what);
	}

	static std::string DoNotCache()
	{
		auto now = std::chrono::system_clock::now().time_since_epoch();
		return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now).count() * 1000);
	}

	static bool IsHex(const std::string& text)
	{
		if (text.empty())
			return false;

		for (unsigned char c : text)
		{
			if (!std::isxdigit(c))
				return false;
		}
		return true;
	}

private:
	std::shared_ptr<IHttpTransport> m_Transport;
	SteamApiConfig			m_Config;
	CookieJar				m_Cookies;
	std::optional<Session>	m_Session;
};

#endif // !__TINY_STEAMGUARD_STEAMAPICLIENT_HPP__
