#ifndef __TINY_STEAMGUARD_PHONESERVICE_HPP__
#define __TINY_STEAMGUARD_PHONESERVICE_HPP__

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include "BasicIO.hpp"
#include "HttpTransport.hpp"
#include "MaFileCrypto.hpp"
#include "SteamApiClient.hpp"
#include "SteamGuardError.hpp"
#include "proto/service_phone.pb.h"

inline constexpr auto PHONE_SERVICE_INTERFACE	= "IPhoneService";
inline constexpr auto ERESULT_HEADER			= "x-eresult";
inline constexpr auto ERESULT_OK				= "1";

//IPhoneService web api. Requests and responses are protobufs, authorized by the
//oauth token of a logged in Session.
class PhoneService
{
public:
	PhoneService(std::shared_ptr<IHttpTransport> transport, std::string accessToken, SteamApiConfig config = {}) :
		m_Transport(std::move(transport)),
		m_AccessToken(std::move(accessToken)),
		m_Config(std::move(config))
	{
	}

	CPhone_AccountPhoneStatus_Response AccountPhoneStatus()
	{
		CPhone_AccountPhoneStatus_Request request;
		return CallMethod<CPhone_AccountPhoneStatus_Response>("AccountPhoneStatus", request);
	}

	CPhone_SetAccountPhoneNumber_Response SetAccountPhoneNumber(const std::string& phoneNumber, const std::string& countryCode)
	{
		CPhone_SetAccountPhoneNumber_Request request;
		request.set_phone_number(phoneNumber);
		request.set_phone_country_code(countryCode);
		return CallMethod<CPhone_SetAccountPhoneNumber_Response>("SetAccountPhoneNumber", request);
	}

	CPhone_SendPhoneVerificationCode_Response SendPhoneVerificationCode(uint32_t language = 0)
	{
		CPhone_SendPhoneVerificationCode_Request request;
		request.set_language(language);
		return CallMethod<CPhone_SendPhoneVerificationCode_Response>("SendPhoneVerificationCode", request);
	}

	CPhone_VerifyAccountPhoneWithCode_Response VerifyAccountPhoneWithCode(const std::string& code)
	{
		CPhone_VerifyAccountPhoneWithCode_Request request;
		request.set_code(code);
		return CallMethod<CPhone_VerifyAccountPhoneWithCode_Response>("VerifyAccountPhoneWithCode", request);
	}

	CPhone_IsAccountWaitingForEmailConfirmation_Response IsAccountWaitingForEmailConfirmation()
	{
		CPhone_IsAccountWaitingForEmailConfirmation_Request request;
		return CallMethod<CPhone_IsAccountWaitingForEmailConfirmation_Response>("IsAccountWaitingForEmailConfirmation", request);
	}

	CPhone_AddPhoneToAccount_Response ConfirmAddPhoneToAccount(uint64_t steamId, const std::string& stoken)
	{
		CPhone_ConfirmAddPhoneToAccount_Request request;
		request.set_steamid(steamId);
		request.set_stoken(stoken);
		return CallMethod<CPhone_AddPhoneToAccount_Response>("ConfirmAddPhoneToAccount", request);
	}

private:
	template<typename ResponseType, typename RequestType>
	ResponseType CallMethod(const char* method, const RequestType& request)
	{
		std::string serialized;
		if (!request.SerializeToString(&serialized))
			throw SteamApiError(SteamApiErrc::Decode, std::string("can't serialize request of ") + method);

		FormParams params = {
			{ "input_protobuf_encoded", MaFileCrypto::Base64Encode(serialized) },
		};

		HttpRequest httpRequest;
		httpRequest.method = HttpMethod::Post;
		httpRequest.url = m_Config.api_base + "/" + PHONE_SERVICE_INTERFACE + "/" + method + "/v1?access_token=" + UrlEncode(m_AccessToken);
		httpRequest.body = FormEncode(params);
		httpRequest.headers = {
			{ "User-Agent", m_Config.user_agent },
			{ "Content-Type", CONTENT_TYPE_FORM },
		};

		dbgmsg("Calling %s.%s\n", PHONE_SERVICE_INTERFACE, method);
		auto response = m_Transport->Perform(httpRequest);

		auto eresult = response.GetHeader(ERESULT_HEADER);
		if (eresult && *eresult != ERESULT_OK)
			throw SteamApiError(SteamApiErrc::BadEResult, std::string(method) + " returned eresult " + *eresult);

		ResponseType result;
		if (!result.ParseFromString(response.body))
			throw SteamApiError(SteamApiErrc::Decode, std::string("can't parse response of ") + method);

		tracemsg("%s response: %zu bytes\n", method, response.body.size());
		return result;
	}

private:
	std::shared_ptr<IHttpTransport> m_Transport;
	std::string		m_AccessToken;
	SteamApiConfig	m_Config;
};

#endif // !__TINY_STEAMGUARD_PHONESERVICE_HPP__
