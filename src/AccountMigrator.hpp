#ifndef __TINY_STEAMGUARD_ACCOUNTMIGRATOR_HPP__
#define __TINY_STEAMGUARD_ACCOUNTMIGRATOR_HPP__

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "BasicIO.hpp"
#include "EntryLoader.hpp"
#include "LegacyFormat.hpp"
#include "ManifestMigration.hpp"
#include "SteamGuardError.hpp"

namespace fs = std::filesystem;

inline constexpr auto BACKUP_EXTENSION = ".bak";

using MigratedStore = std::pair<Manifest, std::vector<SteamGuardAccount>>;

//Brings a manifest of any known version, and the maFiles it points at, to the current version.
//Nothing is written except backups, persisting the result is up to the caller.
class AccountMigrator
{
public:
	explicit AccountMigrator(const IEntryLoader& loader, size_t maxThreads = 0) :
		m_Loader(loader),
		m_MaxThreads(maxThreads)
	{
	}

	//Backs up the manifest and every maFile next to it, then migrates
	MigratedStore LoadAndMigrate(const fs::path& manifestPath, const std::optional<std::string>& passkey) const
	{
		BackupStore(manifestPath);
		return Migrate(manifestPath, passkey);
	}

	MigratedStore Migrate(const fs::path& manifestPath, const std::optional<std::string>& passkey) const
	{
		auto manifest = MigratingManifest::Parse(ReadManifest(manifestPath));

		if (manifest.IsEncrypted() && !passkey)
			throw MigrationError(MigrationErrc::MissingPasskey);

		//Going on would encrypt the maFiles, which is almost never what the user meant
		if (!manifest.IsEncrypted() && passkey)
			throw MigrationError(MigrationErrc::UnexpectedPasskey,
				"aborting migration because it would encrypt the maFiles");

		//Decrypt with the params of the version on disk, before any upgrade touches them
		auto accounts = manifest.LoadAllAccounts(GetFolder(manifestPath), passkey, m_Loader, m_MaxThreads);

		while (!manifest.IsLatest())
		{
			manifest = manifest.Upgrade();

			for (auto& account : accounts)
				account = account.Upgrade();
		}

		auto latest = manifest.ToLatest();
		std::vector<SteamGuardAccount> upgraded;
		upgraded.reserve(accounts.size());
		for (const auto& account : accounts)
			upgraded.push_back(account.ToLatest());

		//The account, not the manifest, knows the real account name
		for (size_t i = 0; i < latest.entries.size(); ++i)
			latest.entries[i].account_name = ToLower(upgraded[i].account_name);

		infomsg("Migrated %zu account(s) to manifest version %d\n", upgraded.size(), latest.version);
		return { std::move(latest), std::move(upgraded) };
	}

	//Import a lone SDA maFile that has no manifest
	static SteamGuardAccount LoadAndUpgradeSdaAccount(const fs::path& path)
	{
		MaFileEntryLoader loader;
		auto data = loader.Load(path, std::nullopt, std::nullopt);

		std::optional<MigratingAccount> account;
		try
		{
			account.emplace(data.get<SdaAccount>());
		}
		catch (const json::exception& e)
		{
			throw EntryLoadError(EntryLoadErrc::DeserializeFailed, path.filename().string() + ": " + e.what());
		}
		catch (const std::invalid_argument& e)
		{
			throw EntryLoadError(EntryLoadErrc::DeserializeFailed, path.filename().string() + ": " + e.what());
		}

		while (!account->IsLatest())
			account = account->Upgrade();

		return account->ToLatest();
	}

	//Copies the manifest and all sibling maFiles to <name>.bak. Stops at the first failure.
	static void BackupStore(const fs::path& manifestPath)
	{
		try
		{
			std::vector<fs::path> files{ manifestPath };
			for (const auto& entry : fs::directory_iterator(GetFolder(manifestPath)))
			{
				if (entry.is_regular_file() && entry.path().extension() == MAFILE_EXTENSION)
					files.push_back(entry.path());
			}

			for (const auto& file : files)
			{
				auto backup = BackupFile(file);
				dbgmsg("Backed up %s to %s\n", file.string().c_str(), backup.string().c_str());
			}
		}
		catch (const fs::filesystem_error& e)
		{
			throw MigrationError(MigrationErrc::BackupFailed, e.what());
		}
	}

	static fs::path BackupFile(const fs::path& path)
	{
		auto backup = path;
		backup += BACKUP_EXTENSION;
		fs::copy_file(path, backup, fs::copy_options::overwrite_existing);
		return backup;
	}

private:
	static fs::path GetFolder(const fs::path& manifestPath)
	{
		auto folder = manifestPath.parent_path();
		return folder.empty() ? fs::path(".") : folder;
	}

	static std::string ReadManifest(const fs::path& manifestPath)
	{
		std::ifstream file(manifestPath, std::ifstream::in | std::ifstream::binary);
		if (!file)
			throw MigrationError(MigrationErrc::ManifestReadFailed, manifestPath.string());

		std::string text{ std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
		if (file.bad())
			throw MigrationError(MigrationErrc::ManifestReadFailed, manifestPath.string());

		return text;
	}

	static std::string ToLower(std::string text)
	{
		std::transform(text.begin(), text.end(), text.begin(),
			[](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return text;
	}

private:
	const IEntryLoader&	m_Loader;
	size_t				m_MaxThreads;
};

#endif // !__TINY_STEAMGUARD_ACCOUNTMIGRATOR_HPP__
