#ifndef __TINY_STEAMGUARD_COOKIEJAR_HPP__
#define __TINY_STEAMGUARD_COOKIEJAR_HPP__

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <locale>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//Cookies of the steam community domain. Only name and value are tracked,
//every cookie is sent with every request.
class CookieJar
{
public:
	void Set(const std::string& name, const std::string& value)
	{
		auto it = Find(name);
		if (it != m_Cookies.end())
			it->second = value;
		else
			m_Cookies.emplace_back(name, value);
	}

	void Remove(const std::string& name)
	{
		auto it = Find(name);
		if (it != m_Cookies.end())
			m_Cookies.erase(it);
	}

	std::optional<std::string> Get(const std::string& name) const
	{
		auto it = std::find_if(m_Cookies.begin(), m_Cookies.end(),
			[&name](const auto& cookie) { return cookie.first == name; });
		if (it == m_Cookies.end())
			return std::nullopt;

		return it->second;
	}

	//Set-Cookie: name=value; Path=/; Max-Age=0
	//An expired Max-Age or Expires removes the cookie
	void AddSetCookieHeader(std::string_view header)
	{
		auto end = header.find(';');
		auto pair = Trim(header.substr(0, end));

		auto eq = pair.find('=');
		if (eq == std::string_view::npos)
			return;

		std::string name(Trim(pair.substr(0, eq)));
		std::string value(Trim(pair.substr(eq + 1)));
		if (name.empty())
			return;

		if (end != std::string_view::npos && IsExpired(header.substr(end + 1)))
			Remove(name);
		else
			Set(name, value);
	}

	//Value of the Cookie request header
	std::string ToHeader() const
	{
		std::string header;
		for (const auto& [name, value] : m_Cookies)
		{
			if (!header.empty())
				header += "; ";
			header += name + "=" + value;
		}
		return header;
	}

	size_t Size() const { return m_Cookies.size(); }
	bool Empty() const { return m_Cookies.empty(); }

private:
	std::vector<std::pair<std::string, std::string>>::iterator Find(const std::string& name)
	{
		return std::find_if(m_Cookies.begin(), m_Cookies.end(),
			[&name](const auto& cookie) { return cookie.first == name; });
	}

	static std::string_view Trim(std::string_view text)
	{
		while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
			text.remove_prefix(1);
		while (!text.empty() && (text.back() == ' ' || text.back() == '\t' || text.back() == '\r' || text.back() == '\n'))
			text.remove_suffix(1);
		return text;
	}

	static std::string Lowered(std::string_view text)
	{
		std::string lowered(text);
		std::transform(lowered.begin(), lowered.end(), lowered.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return lowered;
	}

	//Expires=Thu, 01 Jan 1970 00:00:01 GMT, the dashed form is also accepted
	static std::optional<std::time_t> ParseHttpDate(std::string_view text)
	{
		std::string date(text);
		std::replace(date.begin(), date.end(), '-', ' ');

		std::tm tm{};
		std::istringstream in(date);
		in.imbue(std::locale::classic());
		in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
		if (in.fail())
			return std::nullopt;

		return timegm(&tm);
	}

	//Max-Age wins over Expires, a date that can't be parsed never expires
	static bool IsExpired(std::string_view attributes)
	{
		constexpr std::string_view maxAge = "max-age=";
		constexpr std::string_view expires = "expires=";

		std::optional<std::string_view> expiresValue;
		while (!attributes.empty())
		{
			auto end = attributes.find(';');
			auto attribute = Trim(attributes.substr(0, end));
			auto lowered = Lowered(attribute.substr(0, std::max(maxAge.size(), expires.size())));

			if (attribute.size() > maxAge.size() && lowered.compare(0, maxAge.size(), maxAge) == 0)
			{
				auto value = Trim(attribute.substr(maxAge.size()));
				return value == "0" || (!value.empty() && value.front() == '-');
			}

			if (attribute.size() > expires.size() && lowered.compare(0, expires.size(), expires) == 0)
				expiresValue = Trim(attribute.substr(expires.size()));

			if (end == std::string_view::npos)
				break;
			attributes.remove_prefix(end + 1);
		}

		if (!expiresValue)
			return false;

		auto date = ParseHttpDate(*expiresValue);
		return date && *date <= std::time(nullptr);
	}

private:
	std::vector<std::pair<std::string, std::string>> m_Cookies;
};

#endif // !__TINY_STEAMGUARD_COOKIEJAR_HPP__
