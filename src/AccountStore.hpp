#ifndef __TINY_STEAMGUARD_ACCOUNTSTORE_HPP__
#define __TINY_STEAMGUARD_ACCOUNTSTORE_HPP__

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>
#include "BasicIO.hpp"
#include "EntryLoader.hpp"
#include "MaFileCrypto.hpp"
#include "Manifest.hpp"
#include "SteamGuardAccount.hpp"
#include "SteamGuardError.hpp"

namespace fs = std::filesystem;

inline constexpr auto TEMP_EXTENSION = ".tmp";

class AccountStore
{
public:
	//Writes every account to its entry's maFile and then the manifest itself.
	//Encrypted entries get a fresh salt and IV, the returned manifest is what was written.
	//All files are staged as <name>.tmp first, a failed save leaves the old store readable.
	static Manifest Save(const fs::path& manifestPath,
		Manifest manifest,
		const std::vector<SteamGuardAccount>& accounts,
		const std::optional<std::string>& passkey)
	{
		if (manifest.entries.size() != accounts.size())
			throw std::invalid_argument("manifest has " + std::to_string(manifest.entries.size())
				+ " entries but " + std::to_string(accounts.size()) + " accounts were given");

		if (manifest.IsEncrypted() && !passkey)
			throw MigrationError(MigrationErrc::MissingPasskey);

		if (!manifest.IsEncrypted() && passkey)
			throw MigrationError(MigrationErrc::UnexpectedPasskey, "refusing to save an unencrypted manifest with a passkey");

		auto folder = manifestPath.parent_path();
		MaFileEntryLoader writer;
		std::vector<std::pair<fs::path, fs::path>> staged;
		try
		{
			//Nothing replaces a live file until every new file is completely written
			for (size_t i = 0; i < accounts.size(); ++i)
			{
				auto& entry = manifest.entries[i];
				if (entry.encryption)
					entry.encryption = MaFileCrypto::GenerateParams();

				auto target = folder / entry.filename;
				auto tempPath = TempPathFor(target);
				writer.Save(tempPath, json(accounts[i]), passkey, entry.encryption);
				staged.emplace_back(tempPath, target);
			}

			auto manifestTemp = TempPathFor(manifestPath);
			WriteManifest(manifestTemp, manifest);
			staged.emplace_back(manifestTemp, manifestPath);
		}
		catch (const std::exception& e)
		{
			warnmsg("Saving %s failed, discarding %zu staged file(s): %s\n", manifestPath.string().c_str(), staged.size(), e.what());
			RemoveStaged(staged);
			throw;
		}

		//The manifest is the last one in, maFiles are renamed before it
		for (const auto& [tempPath, target] : staged)
		{
			std::error_code ec;
			fs::rename(tempPath, target, ec);
			if (ec)
			{
				RemoveStaged(staged);
				throw MigrationError(MigrationErrc::WriteFailed, target.string() + ": " + ec.message());
			}
		}

		infomsg("Saved %zu account(s) to %s\n", accounts.size(), manifestPath.string().c_str());
		return manifest;
	}

private:
	static fs::path TempPathFor(const fs::path& path)
	{
		auto tempPath = path;
		tempPath += TEMP_EXTENSION;
		return tempPath;
	}

	static void WriteManifest(const fs::path& path, const Manifest& manifest)
	{
		auto dump = json(manifest).dump(2);

		std::ofstream out(path, std::ofstream::out | std::ofstream::binary | std::ofstream::trunc);
		if (!out)
			throw MigrationError(MigrationErrc::WriteFailed, path.string());

		out.write(dump.c_str(), dump.size());
		out.close();
		if (!out)
			throw MigrationError(MigrationErrc::WriteFailed, path.string());
	}

	//Only files this save created are removed, renamed ones are already gone from their temp path
	static void RemoveStaged(const std::vector<std::pair<fs::path, fs::path>>& staged)
	{
		for (const auto& [tempPath, target] : staged)
		{
			std::error_code ec;
			if (fs::is_regular_file(tempPath, ec))
				fs::remove(tempPath, ec);
			if (ec)
				warnmsg("Can't remove %s: %s\n", tempPath.string().c_str(), ec.message().c_str());
		}
	}
};

#endif // !__TINY_STEAMGUARD_ACCOUNTSTORE_HPP__
