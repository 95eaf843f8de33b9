#ifndef __TINY_STEAMGUARD_MANIFESTMIGRATION_HPP__
#define __TINY_STEAMGUARD_MANIFESTMIGRATION_HPP__

#include <algorithm>
#include <filesystem>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <variant>
#include <vector>
#include <asio/post.hpp>
#include <asio/thread_pool.hpp>
#include "BasicIO.hpp"
#include "EntryLoader.hpp"
#include "JsonHelpers.hpp"
#include "LegacyFormat.hpp"
#include "Manifest.hpp"
#include "SteamGuardAccount.hpp"
#include "SteamGuardError.hpp"

namespace fs = std::filesystem;

//Types below only exist while a store is being upgraded. Every version has exactly one
//upgrade step, the latest version upgrades to itself.

class MigratingAccount
{
public:
	using Value = std::variant<SdaAccount, SteamGuardAccount>;

	explicit MigratingAccount(Value value) : m_Value(std::move(value))
	{
	}

	bool IsLatest() const
	{
		return std::holds_alternative<SteamGuardAccount>(m_Value);
	}

	MigratingAccount Upgrade() const
	{
		if (const auto* sda = std::get_if<SdaAccount>(&m_Value))
			return MigratingAccount(UpgradeSdaAccount(*sda));

		return *this;
	}

	SteamGuardAccount ToLatest() const
	{
		if (const auto* account = std::get_if<SteamGuardAccount>(&m_Value))
			return *account;

		throw MigrationFault("Account is not at the latest version!");
	}

	const Value& GetValue() const { return m_Value; }

private:
	Value m_Value;
};

class MigratingManifest
{
public:
	using Value = std::variant<SdaManifest, Manifest>;

	explicit MigratingManifest(Value value) : m_Value(std::move(value))
	{
	}

	//Picks the shape from the "version" field: missing or null is SDA, 1 is current
	static MigratingManifest Parse(const std::string& text)
	{
		json data;
		try
		{
			data = json::parse(text);
		}
		catch (const json::exception& e)
		{
			throw MigrationError(MigrationErrc::ManifestDeserializeFailed, e.what());
		}

		if (!data.is_object())
			throw MigrationError(MigrationErrc::ManifestDeserializeFailed, "manifest is not a json object");

		auto version = data.find("version");
		dbgmsg("Deserializing manifest: version %s\n", version == data.end() ? "null" : version->dump().c_str());

		try
		{
			if (version == data.end() || version->is_null())
				return MigratingManifest(data.get<SdaManifest>());

			if (version->is_number_integer() && *version == CURRENT_MANIFEST_VERSION)
				return MigratingManifest(data.get<Manifest>());
		}
		catch (const json::exception& e)
		{
			throw MigrationError(MigrationErrc::ManifestDeserializeFailed, e.what());
		}
		catch (const std::invalid_argument& e)
		{
			throw MigrationError(MigrationErrc::ManifestDeserializeFailed, e.what());
		}

		throw MigrationError(MigrationErrc::UnknownManifestVersion, version->dump());
	}

	bool IsLatest() const
	{
		return std::holds_alternative<Manifest>(m_Value);
	}

	bool IsEncrypted() const
	{
		return std::visit([](const auto& manifest) {
			return std::any_of(manifest.entries.begin(), manifest.entries.end(),
				[](const auto& entry) { return entry.encryption.has_value(); });
		}, m_Value);
	}

	size_t EntryCount() const
	{
		return std::visit([](const auto& manifest) { return manifest.entries.size(); }, m_Value);
	}

	MigratingManifest Upgrade() const
	{
		if (const auto* sda = std::get_if<SdaManifest>(&m_Value))
			return MigratingManifest(UpgradeSdaManifest(*sda));

		return *this;
	}

	Manifest ToLatest() const
	{
		if (const auto* manifest = std::get_if<Manifest>(&m_Value))
			return *manifest;

		throw MigrationFault("Manifest is not at the latest version!");
	}

	//Loads every entry, all of them are attempted even if some fail. The result is in
	//entry order and in the account shape matching this manifest's version.
	std::vector<MigratingAccount> LoadAllAccounts(const fs::path& folder,
		const std::optional<std::string>& passkey,
		const IEntryLoader& loader,
		size_t maxThreads = 0) const
	{
		dbgmsg("Loading all accounts for migration\n");

		struct PendingEntry
		{
			std::string filename;
			std::optional<EntryEncryptionParams> params;
		};

		std::vector<PendingEntry> pending;
		std::visit([&pending](const auto& manifest) {
			using ManifestType = std::decay_t<decltype(manifest)>;
			for (const auto& entry : manifest.entries)
			{
				std::optional<EntryEncryptionParams> params;
				if constexpr (std::is_same_v<ManifestType, SdaManifest>)
				{
					if (entry.encryption)
						params = EntryEncryptionParams{ entry.encryption->iv, entry.encryption->salt, EncryptionScheme::LegacySdaCompatible };
				}
				else
				{
					params = entry.encryption;
				}
				pending.push_back({ entry.filename, std::move(params) });
			}
		}, m_Value);

		const bool legacy = std::holds_alternative<SdaManifest>(m_Value);
		std::vector<std::optional<MigratingAccount>> accounts(pending.size());
		std::vector<std::optional<std::string>> errors(pending.size());

		if (!pending.empty())
		{
			if (maxThreads == 0)
				maxThreads = std::max(1u, std::thread::hardware_concurrency());

			asio::thread_pool pool(std::min(maxThreads, pending.size()));
			for (size_t i = 0; i < pending.size(); ++i)
			{
				asio::post(pool, [&, i]() {
					try
					{
						auto data = loader.Load(folder / pending[i].filename, passkey, pending[i].params);
						if (legacy)
							accounts[i] = MigratingAccount(data.get<SdaAccount>());
						else
							accounts[i] = MigratingAccount(data.get<SteamGuardAccount>());
					}
					catch (const std::exception& e)
					{
						//Collected below, every failing entry is reported
						errors[i] = e.what();
					}
				});
			}
			pool.join();
		}

		std::vector<EntryLoadFailure> failures;
		for (size_t i = 0; i < pending.size(); ++i)
		{
			if (errors[i])
			{
				warnmsg("Failed to load %s: %s\n", pending[i].filename.c_str(), errors[i]->c_str());
				failures.push_back({ pending[i].filename, *errors[i] });
			}
		}

		if (!failures.empty())
			throw AccountLoadError(std::move(failures));

		std::vector<MigratingAccount> loaded;
		loaded.reserve(accounts.size());
		for (auto& account : accounts)
			loaded.push_back(std::move(*account));

		return loaded;
	}

	const Value& GetValue() const { return m_Value; }

private:
	Value m_Value;
};

#endif // !__TINY_STEAMGUARD_MANIFESTMIGRATION_HPP__
