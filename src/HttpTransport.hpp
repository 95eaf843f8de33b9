#ifndef __TINY_STEAMGUARD_HTTPTRANSPORT_HPP__
#define __TINY_STEAMGUARD_HTTPTRANSPORT_HPP__

#include <cctype>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <curl/curl.h>
#include "BasicIO.hpp"
#include "SteamGuardError.hpp"

inline constexpr auto DEFAULT_HTTP_TIMEOUT_MS			= 30000L;
inline constexpr auto DEFAULT_HTTP_CONNECT_TIMEOUT_MS	= 10000L;
inline constexpr auto HTTP_MAX_REDIRECTS				= 10L;

enum class HttpMethod
{
	Get,
	Post,
};

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;
using FormParams = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest
{
	HttpMethod	method = HttpMethod::Get;
	std::string url;
	HttpHeaders headers;
	std::string body;
};

struct HttpResponse
{
	long		status = 0;
	HttpHeaders headers;
	std::string body;

	//All values of a header, in the order they were received. Names are case insensitive.
	std::vector<std::string> GetHeaders(std::string_view name) const
	{
		std::vector<std::string> values;
		for (const auto& [key, value] : headers)
		{
			if (EqualsIgnoreCase(key, name))
				values.push_back(value);
		}
		return values;
	}

	std::optional<std::string> GetHeader(std::string_view name) const
	{
		for (const auto& [key, value] : headers)
		{
			if (EqualsIgnoreCase(key, name))
				return value;
		}
		return std::nullopt;
	}

private:
	static bool EqualsIgnoreCase(std::string_view a, std::string_view b)
	{
		if (a.size() != b.size())
			return false;

		for (size_t i = 0; i < a.size(); ++i)
		{
			if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
				return false;
		}
		return true;
	}
};

//application/x-www-form-urlencoded escaping
inline std::string UrlEncode(std::string_view text)
{
	static constexpr char hex[] = "0123456789ABCDEF";

	std::string encoded;
	encoded.reserve(text.size() * 3);
	for (unsigned char c : text)
	{
		if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '*')
		{
			encoded += static_cast<char>(c);
		}
		else if (c == ' ')
		{
			encoded += '+';
		}
		else
		{
			encoded += '%';
			encoded += hex[c >> 4];
			encoded += hex[c & 0x0F];
		}
	}
	return encoded;
}

inline std::string FormEncode(const FormParams& params)
{
	std::string body;
	for (const auto& [key, value] : params)
	{
		if (!body.empty())
			body += '&';
		body += UrlEncode(key);
		body += '=';
		body += UrlEncode(value);
	}
	return body;
}

//Sends one request and waits for the whole response. Throws TransportError when no
//response could be received, http error statuses are returned like any other response.
class IHttpTransport
{
public:
	virtual ~IHttpTransport() = default;
	virtual HttpResponse Perform(const HttpRequest& request) = 0;
};

//Process wide curl state. Create one in main before any thread or transport exists,
//CurlHttpTransport expects it to outlive every request.
class HttpGlobalScope
{
public:
	HttpGlobalScope()
	{
		auto res = curl_global_init(CURL_GLOBAL_DEFAULT);
		if (res != CURLE_OK)
			throw TransportError(std::string("CURL global init failed! ") + curl_easy_strerror(res));
	}

	~HttpGlobalScope()
	{
		curl_global_cleanup();
	}

	HttpGlobalScope(const HttpGlobalScope&) = delete;
	HttpGlobalScope& operator=(const HttpGlobalScope&) = delete;
};

class CurlHttpTransport : public IHttpTransport
{
public:
	explicit CurlHttpTransport(long timeoutMs = DEFAULT_HTTP_TIMEOUT_MS, long connectTimeoutMs = DEFAULT_HTTP_CONNECT_TIMEOUT_MS) :
		m_TimeoutMs(timeoutMs),
		m_ConnectTimeoutMs(connectTimeoutMs)
	{
	}

	CurlHttpTransport(const CurlHttpTransport&) = delete;
	CurlHttpTransport& operator=(const CurlHttpTransport&) = delete;

	HttpResponse Perform(const HttpRequest& request) override
	{
		std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
		if (!curl)
			throw TransportError("CURL can't be initialized!");

		HttpResponse response;
		curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
		curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
		curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
		curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, HTTP_MAX_REDIRECTS);
		curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "");
		curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, m_TimeoutMs);
		curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, m_ConnectTimeoutMs);
		curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, CurlWriteDataCallback);
		curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
		curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, CurlHeaderCallback);
		curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

		if (request.method == HttpMethod::Post)
		{
			curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
			curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
			curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
		}
		else
		{
			curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
		}

		std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
		for (const auto& [name, value] : request.headers)
		{
			auto line = name + ": " + value;
			auto* appended = curl_slist_append(headers.get(), line.c_str());
			if (!appended)
				throw TransportError("Can't build request headers for " + request.url);

			headers.release();
			headers.reset(appended);
		}
		curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());

		dbgmsg("%s %s\n", request.method == HttpMethod::Post ? "POST" : "GET", request.url.c_str());
		auto res = curl_easy_perform(curl.get());
		if (res != CURLE_OK)
			throw TransportError(std::string("Request to ") + request.url + " failed! " + curl_easy_strerror(res));

		curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
		dbgmsg("HTTP %ld from %s\n", response.status, request.url.c_str());
		return response;
	}

private:
	static size_t CurlWriteDataCallback(char* ptr, size_t size, size_t nmemb, void* userdata)
	{
		auto length = size * nmemb;
		static_cast<std::string*>(userdata)->append(ptr, length);
		return length;
	}

	//Called once per header line, redirects included, so Set-Cookie of every hop is kept
	static size_t CurlHeaderCallback(char* buffer, size_t size, size_t nitems, void* userdata)
	{
		auto length = size * nitems;
		std::string_view line(buffer, length);

		auto colon = line.find(':');
		if (colon == std::string_view::npos)
			return length;

		auto name = line.substr(0, colon);
		auto value = line.substr(colon + 1);
		while (!value.empty() && (value.front() == ' ' || value.front() == '\t'))
			value.remove_prefix(1);
		while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' '))
			value.remove_suffix(1);

		static_cast<HttpHeaders*>(userdata)->emplace_back(std::string(name), std::string(value));
		return length;
	}

private:
	long m_TimeoutMs;
	long m_ConnectTimeoutMs;
};

#endif // !__TINY_STEAMGUARD_HTTPTRANSPORT_HPP__
