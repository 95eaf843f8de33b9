#ifndef __TINY_STEAMGUARD_TESTHELPERS_HPP__
#define __TINY_STEAMGUARD_TESTHELPERS_HPP__

#include <atomic>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>
#include "HttpTransport.hpp"

namespace fs = std::filesystem;

inline fs::path FixturePath(const std::string& relative)
{
	return fs::path(TINY_STEAMGUARD_FIXTURES_DIR) / relative;
}

inline std::string ReadText(const fs::path& path)
{
	std::ifstream file(path, std::ifstream::in | std::ifstream::binary);
	if (!file)
		throw std::runtime_error("can't open " + path.string());

	return std::string{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
}

inline void WriteText(const fs::path& path, const std::string& text)
{
	std::ofstream file(path, std::ofstream::out | std::ofstream::binary | std::ofstream::trunc);
	file.write(text.c_str(), text.size());
	if (!file)
		throw std::runtime_error("can't write " + path.string());
}

//Scratch directory removed with the object
class TempDir
{
public:
	TempDir()
	{
		std::random_device rd;
		m_Path = fs::temp_directory_path() / ("tiny-steamguard-test-" + std::to_string(rd()) + std::to_string(rd()));
		fs::create_directories(m_Path);
	}

	~TempDir()
	{
		std::error_code ec;
		fs::remove_all(m_Path, ec);
	}

	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	const fs::path& Path() const { return m_Path; }

	//Copies a fixture folder so tests can write next to it
	fs::path CopyFixture(const std::string& relative) const
	{
		auto target = m_Path / fs::path(relative).filename();
		fs::copy(FixturePath(relative), target, fs::copy_options::recursive);
		return target;
	}

private:
	fs::path m_Path;
};

//Replays canned responses in order and keeps every request it was given
class FakeHttpTransport : public IHttpTransport
{
public:
	HttpResponse Perform(const HttpRequest& request) override
	{
		m_Requests.push_back(request);
		if (m_Responses.empty())
			throw TransportError("no scripted response for " + request.url);

		auto response = m_Responses.front();
		m_Responses.pop_front();
		return response;
	}

	void Enqueue(std::string body, HttpHeaders headers = {}, long status = 200)
	{
		HttpResponse response;
		response.status = status;
		response.headers = std::move(headers);
		response.body = std::move(body);
		m_Responses.push_back(std::move(response));
	}

	const std::vector<HttpRequest>& Requests() const { return m_Requests; }
	const HttpRequest& LastRequest() const { return m_Requests.back(); }
	size_t Pending() const { return m_Responses.size(); }

private:
	std::deque<HttpResponse> m_Responses;
	std::vector<HttpRequest> m_Requests;
};

inline std::string HeaderValue(const HttpRequest& request, const std::string& name)
{
	for (const auto& [key, value] : request.headers)
	{
		if (key == name)
			return value;
	}
	return {};
}

#endif // !__TINY_STEAMGUARD_TESTHELPERS_HPP__
