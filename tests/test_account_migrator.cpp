/**
 * @file test_account_migrator.cpp
 * @brief Migration of whole account stores, from fixture folders on disk
 */

#include <gtest/gtest.h>
#include <atomic>
#include <cctype>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "AccountMigrator.hpp"
#include "AccountStore.hpp"
#include "TestHelpers.hpp"

namespace {

//Wraps the real loader and counts how often each file was opened
class CountingEntryLoader : public IEntryLoader
{
public:
	json Load(const fs::path& path,
		const std::optional<std::string>& passkey,
		const std::optional<EntryEncryptionParams>& params) const override
	{
		++m_Calls;
		{
			std::lock_guard<std::mutex> lock(m_Lock);
			m_Files.push_back(path.filename().string());
		}
		return m_Loader.Load(path, passkey, params);
	}

	int Calls() const { return m_Calls.load(); }

	std::vector<std::string> Files() const
	{
		std::lock_guard<std::mutex> lock(m_Lock);
		return m_Files;
	}

private:
	MaFileEntryLoader m_Loader;
	mutable std::atomic<int> m_Calls{ 0 };
	mutable std::mutex m_Lock;
	mutable std::vector<std::string> m_Files;
};

struct CompatCase
{
	const char* folder;
	std::optional<std::string> passkey;
};

std::string CompatName(const ::testing::TestParamInfo<CompatCase>& info)
{
	std::string name = info.param.folder;
	for (auto& c : name)
	{
		if (!std::isalnum(static_cast<unsigned char>(c)))
			c = '_';
	}
	return name;
}

} // namespace

class AccountMigratorTest : public ::testing::Test {
protected:
	fs::path CopyCompat(const std::string& folder)
	{
		return temp.CopyFixture("maFiles/compat/" + folder) / MANIFEST_FILE_NAME;
	}

	TempDir temp;
	MaFileEntryLoader loader;
};

// =============================================================================
// Legacy stores
// =============================================================================

class CompatStoreTest : public AccountMigratorTest,
	public ::testing::WithParamInterface<CompatCase> {
};

TEST_P(CompatStoreTest, MigratesToLatestVersion) {
	auto manifestPath = CopyCompat(GetParam().folder);

	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.Migrate(manifestPath, GetParam().passkey);

	EXPECT_EQ(manifest.version, CURRENT_MANIFEST_VERSION);
	ASSERT_FALSE(manifest.entries.empty());
	EXPECT_EQ(manifest.entries[0].account_name, "example");
	EXPECT_EQ(manifest.entries[0].steam_id, 1234u);
	ASSERT_EQ(accounts.size(), manifest.entries.size());
	EXPECT_EQ(accounts[0].account_name, "example");
	EXPECT_EQ(accounts[0].steam_id, 1234u);
}

INSTANTIATE_TEST_SUITE_P(Fixtures, CompatStoreTest, ::testing::Values(
	CompatCase{ "1-account", std::nullopt },
	CompatCase{ "1-account-encrypted", std::string("password") },
	CompatCase{ "2-account", std::nullopt },
	CompatCase{ "missing-account-name", std::nullopt },
	CompatCase{ "no-webcookie", std::nullopt }
), CompatName);

TEST_F(AccountMigratorTest, KeepsEntryOrderAndLowercasesNames) {
	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.Migrate(CopyCompat("2-account"), std::nullopt);

	ASSERT_EQ(manifest.entries.size(), 2u);
	ASSERT_EQ(accounts.size(), 2u);
	EXPECT_EQ(manifest.entries[0].filename, "1234.maFile");
	EXPECT_EQ(manifest.entries[1].filename, "5678.maFile");
	EXPECT_EQ(manifest.entries[1].steam_id, 5678u);
	EXPECT_EQ(accounts[1].account_name, "Example2");
	EXPECT_EQ(manifest.entries[1].account_name, "example2");
}

TEST_F(AccountMigratorTest, EncryptedEntryKeepsItsParameters) {
	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.Migrate(CopyCompat("1-account-encrypted"), std::string("password"));

	ASSERT_TRUE(manifest.entries[0].encryption.has_value());
	EXPECT_EQ(manifest.entries[0].encryption->iv, "ABEiM0RVZneImaq7zN3u/w==");
	EXPECT_EQ(manifest.entries[0].encryption->salt, "ChssPU5fYHE=");
	EXPECT_EQ(manifest.entries[0].encryption->scheme, EncryptionScheme::LegacySdaCompatible);
	EXPECT_EQ(accounts[0].shared_secret, "zvIayp3JPvtvX/QGHqsqKBk/44s=");
}

TEST_F(AccountMigratorTest, MissingWebCookieLeavesItEmpty) {
	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.Migrate(CopyCompat("no-webcookie"), std::nullopt);

	ASSERT_TRUE(accounts[0].session.has_value());
	EXPECT_TRUE(accounts[0].session->web_cookie.empty());
	EXPECT_EQ(accounts[0].session->steam_id, 1234u);
}

// =============================================================================
// Passkey checks
// =============================================================================

TEST_F(AccountMigratorTest, EncryptedStoreWithoutPasskeyFails) {
	AccountMigrator migrator(loader);
	try {
		migrator.Migrate(CopyCompat("1-account-encrypted"), std::nullopt);
		FAIL() << "expected MigrationError";
	} catch (const MigrationError& e) {
		EXPECT_EQ(e.code(), MigrationErrc::MissingPasskey);
	}
}

TEST_F(AccountMigratorTest, PlainStoreWithPasskeyFails) {
	AccountMigrator migrator(loader);
	try {
		migrator.Migrate(CopyCompat("1-account"), std::string("password"));
		FAIL() << "expected MigrationError";
	} catch (const MigrationError& e) {
		EXPECT_EQ(e.code(), MigrationErrc::UnexpectedPasskey);
	}
}

TEST_F(AccountMigratorTest, WrongPasskeyNamesTheEntry) {
	AccountMigrator migrator(loader);
	try {
		migrator.Migrate(CopyCompat("1-account-encrypted"), std::string("not the password"));
		FAIL() << "expected AccountLoadError";
	} catch (const AccountLoadError& e) {
		EXPECT_EQ(e.code(), MigrationErrc::AccountLoadFailed);
		ASSERT_EQ(e.GetFailures().size(), 1u);
		EXPECT_EQ(e.GetFailures()[0].filename, "1234.maFile");
		EXPECT_NE(std::string(e.what()).find("1234.maFile"), std::string::npos);
	}
}

// =============================================================================
// Failure aggregation
// =============================================================================

TEST_F(AccountMigratorTest, ReportsEveryBrokenEntry) {
	auto manifestPath = CopyCompat("2-account");
	auto folder = manifestPath.parent_path();
	WriteText(folder / "1234.maFile", "{ not json");
	fs::remove(folder / "5678.maFile");

	AccountMigrator migrator(loader, 2);
	try {
		migrator.Migrate(manifestPath, std::nullopt);
		FAIL() << "expected AccountLoadError";
	} catch (const AccountLoadError& e) {
		ASSERT_EQ(e.GetFailures().size(), 2u);
		EXPECT_EQ(e.GetFailures()[0].filename, "1234.maFile");
		EXPECT_EQ(e.GetFailures()[1].filename, "5678.maFile");
	}
}

TEST_F(AccountMigratorTest, OneBrokenEntryFailsTheWholeStore) {
	auto manifestPath = CopyCompat("2-account");
	WriteText(manifestPath.parent_path() / "5678.maFile", R"({"account_name": "broken", "server_time": "soon"})");

	AccountMigrator migrator(loader);
	try {
		migrator.Migrate(manifestPath, std::nullopt);
		FAIL() << "expected AccountLoadError";
	} catch (const AccountLoadError& e) {
		ASSERT_EQ(e.GetFailures().size(), 1u);
		EXPECT_EQ(e.GetFailures()[0].filename, "5678.maFile");
	}
}

TEST_F(AccountMigratorTest, MissingManifestFails) {
	AccountMigrator migrator(loader);
	try {
		migrator.Migrate(temp.Path() / "nothing-here" / MANIFEST_FILE_NAME, std::nullopt);
		FAIL() << "expected MigrationError";
	} catch (const MigrationError& e) {
		EXPECT_EQ(e.code(), MigrationErrc::ManifestReadFailed);
	}
}

TEST_F(AccountMigratorTest, EachEntryIsLoadedOnce) {
	CountingEntryLoader counting;
	AccountMigrator migrator(counting, 4);
	auto [manifest, accounts] = migrator.Migrate(CopyCompat("2-account"), std::nullopt);

	EXPECT_EQ(counting.Calls(), 2);
	auto files = counting.Files();
	EXPECT_EQ(std::set<std::string>(files.begin(), files.end()),
		(std::set<std::string>{ "1234.maFile", "5678.maFile" }));
}

// =============================================================================
// Backups and saving
// =============================================================================

TEST_F(AccountMigratorTest, LoadAndMigrateWritesBackups) {
	auto manifestPath = CopyCompat("2-account");
	auto folder = manifestPath.parent_path();
	auto original = ReadText(manifestPath);

	AccountMigrator migrator(loader);
	migrator.LoadAndMigrate(manifestPath, std::nullopt);

	ASSERT_TRUE(fs::exists(folder / "manifest.json.bak"));
	EXPECT_TRUE(fs::exists(folder / "1234.maFile.bak"));
	EXPECT_TRUE(fs::exists(folder / "5678.maFile.bak"));
	EXPECT_EQ(ReadText(folder / "manifest.json.bak"), original);
	EXPECT_EQ(ReadText(manifestPath), original);
}

TEST_F(AccountMigratorTest, SavedStoreMigratesToItself) {
	auto manifestPath = CopyCompat("2-account");

	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.LoadAndMigrate(manifestPath, std::nullopt);
	auto written = AccountStore::Save(manifestPath, manifest, accounts, std::nullopt);

	auto data = json::parse(ReadText(manifestPath));
	EXPECT_EQ(data.at("version").get<int>(), CURRENT_MANIFEST_VERSION);

	auto [again, againAccounts] = migrator.Migrate(manifestPath, std::nullopt);
	EXPECT_EQ(json(again), json(written));
	ASSERT_EQ(againAccounts.size(), accounts.size());
	for (size_t i = 0; i < accounts.size(); ++i)
		EXPECT_EQ(json(againAccounts[i]), json(accounts[i]));
}

TEST_F(AccountMigratorTest, SavedEncryptedStoreUsesFreshParameters) {
	auto manifestPath = CopyCompat("1-account-encrypted");
	const std::string passkey = "password";

	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.Migrate(manifestPath, passkey);
	auto written = AccountStore::Save(manifestPath, manifest, accounts, passkey);

	ASSERT_TRUE(written.entries[0].encryption.has_value());
	EXPECT_NE(written.entries[0].encryption->iv, manifest.entries[0].encryption->iv);
	EXPECT_NE(written.entries[0].encryption->salt, manifest.entries[0].encryption->salt);

	auto [again, againAccounts] = migrator.Migrate(manifestPath, passkey);
	EXPECT_EQ(json(againAccounts[0]), json(accounts[0]));
}

TEST_F(AccountMigratorTest, SaveRejectsMismatchedAccounts) {
	AccountMigrator migrator(loader);
	auto manifestPath = CopyCompat("2-account");
	auto [manifest, accounts] = migrator.Migrate(manifestPath, std::nullopt);
	accounts.pop_back();

	EXPECT_THROW(AccountStore::Save(manifestPath, manifest, accounts, std::nullopt), std::invalid_argument);
}

TEST_F(AccountMigratorTest, FailedManifestWriteKeepsOldEncryption) {
	auto manifestPath = CopyCompat("1-account-encrypted");
	auto folder = manifestPath.parent_path();
	const std::string passkey = "password";
	auto originalEntry = ReadText(folder / "1234.maFile");

	AccountMigrator migrator(loader);
	auto [manifest, accounts] = migrator.Migrate(manifestPath, passkey);

	//A non-empty directory in the way of the staged manifest
	auto blocker = folder / "manifest.json.tmp";
	fs::create_directory(blocker);
	WriteText(blocker / "keep", "x");

	try {
		AccountStore::Save(manifestPath, manifest, accounts, passkey);
		FAIL() << "expected MigrationError";
	} catch (const MigrationError& e) {
		EXPECT_EQ(e.code(), MigrationErrc::WriteFailed);
	}

	EXPECT_EQ(ReadText(folder / "1234.maFile"), originalEntry);
	EXPECT_FALSE(fs::exists(folder / "1234.maFile.tmp"));
	EXPECT_TRUE(fs::exists(blocker / "keep"));

	fs::remove_all(blocker);
	auto [again, againAccounts] = migrator.Migrate(manifestPath, passkey);
	ASSERT_TRUE(again.entries[0].encryption.has_value());
	EXPECT_EQ(again.entries[0].encryption->iv, manifest.entries[0].encryption->iv);
	EXPECT_EQ(json(againAccounts[0]), json(accounts[0]));
}

TEST_F(AccountMigratorTest, FailedBackupLeavesStoreUntouched) {
	auto manifestPath = CopyCompat("2-account");
	auto folder = manifestPath.parent_path();
	auto manifestText = ReadText(manifestPath);
	auto firstEntry = ReadText(folder / "1234.maFile");
	auto secondEntry = ReadText(folder / "5678.maFile");

	//The backup of 1234.maFile can't replace a non-empty directory
	fs::create_directory(folder / "1234.maFile.bak");
	WriteText(folder / "1234.maFile.bak" / "keep", "x");

	AccountMigrator migrator(loader);
	try {
		migrator.LoadAndMigrate(manifestPath, std::nullopt);
		FAIL() << "expected MigrationError";
	} catch (const MigrationError& e) {
		EXPECT_EQ(e.code(), MigrationErrc::BackupFailed);
	}

	EXPECT_EQ(ReadText(manifestPath), manifestText);
	EXPECT_EQ(ReadText(folder / "1234.maFile"), firstEntry);
	EXPECT_EQ(ReadText(folder / "5678.maFile"), secondEntry);
	EXPECT_FALSE(fs::exists(folder / "manifest.json.tmp"));
}

// =============================================================================
// Lone maFile import
// =============================================================================

TEST_F(AccountMigratorTest, ImportsLoneLegacyMaFile) {
	auto account = AccountMigrator::LoadAndUpgradeSdaAccount(FixturePath("maFiles/compat/1-account/1234.maFile"));

	EXPECT_EQ(account.account_name, "example");
	EXPECT_EQ(account.steam_id, 1234u);
	EXPECT_TRUE(account.fully_enrolled);
	ASSERT_TRUE(account.session.has_value());
	EXPECT_EQ(account.session->web_cookie, "FEEDFACE");
}

TEST_F(AccountMigratorTest, ImportOfMissingFileFails) {
	try {
		AccountMigrator::LoadAndUpgradeSdaAccount(temp.Path() / "missing.maFile");
		FAIL() << "expected EntryLoadError";
	} catch (const EntryLoadError& e) {
		EXPECT_EQ(e.code(), EntryLoadErrc::FileReadFailed);
	}
}
