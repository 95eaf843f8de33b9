#ifndef __TINY_STEAMGUARD_ENTRYLOADER_HPP__
#define __TINY_STEAMGUARD_ENTRYLOADER_HPP__

#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include "BasicIO.hpp"
#include "JsonHelpers.hpp"
#include "MaFileCrypto.hpp"
#include "Manifest.hpp"
#include "SteamGuardError.hpp"

namespace fs = std::filesystem;

//Reads one secret file. Implementations are called from several threads at once
//during bulk loading and must not keep mutable state.
class IEntryLoader
{
public:
	virtual ~IEntryLoader() = default;

	//Returns the decrypted account json, throws EntryLoadError
	virtual json Load(const fs::path& path,
		const std::optional<std::string>& passkey,
		const std::optional<EntryEncryptionParams>& params) const = 0;
};

class MaFileEntryLoader : public IEntryLoader
{
public:
	json Load(const fs::path& path,
		const std::optional<std::string>& passkey,
		const std::optional<EntryEncryptionParams>& params) const override
	{
		dbgmsg("Loading maFile %s\n", path.string().c_str());

		auto content = ReadFile(path);
		if (params)
		{
			if (!passkey)
				throw EntryLoadError(EntryLoadErrc::MissingPasskey, path.string());

			content = MaFileCrypto::Decrypt(*passkey, *params, content);
		}

		try
		{
			return json::parse(content);
		}
		catch (const json::exception& e)
		{
			throw EntryLoadError(EntryLoadErrc::DeserializeFailed, path.filename().string() + ": " + e.what());
		}
	}

	void Save(const fs::path& path,
		const json& account,
		const std::optional<std::string>& passkey,
		const std::optional<EntryEncryptionParams>& params) const
	{
		dbgmsg("Saving maFile %s\n", path.string().c_str());

		auto content = account.dump();
		if (params)
		{
			if (!passkey)
				throw EntryLoadError(EntryLoadErrc::MissingPasskey, path.string());

			content = MaFileCrypto::Encrypt(*passkey, *params, content);
		}

		std::ofstream out(path, std::ofstream::out | std::ofstream::binary | std::ofstream::trunc);
		if (!out)
			throw EntryLoadError(EntryLoadErrc::WriteFailed, path.string());

		out.write(content.c_str(), content.size());
		out.close();
		if (!out)
			throw EntryLoadError(EntryLoadErrc::WriteFailed, path.string());
	}

private:
	static std::string ReadFile(const fs::path& path)
	{
		std::ifstream file(path, std::ifstream::in | std::ifstream::binary);
		if (!file)
			throw EntryLoadError(EntryLoadErrc::FileReadFailed, path.string());

		std::string content{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
		if (file.bad())
			throw EntryLoadError(EntryLoadErrc::FileReadFailed, path.string());

		return content;
	}
};

#endif // !__TINY_STEAMGUARD_ENTRYLOADER_HPP__
