/**
 * @file test_mafile_crypto.cpp
 * @brief maFile encryption compatible with Steam Desktop Authenticator
 */

#include <gtest/gtest.h>
#include <string>
#include "EntryLoader.hpp"
#include "MaFileCrypto.hpp"
#include "TestHelpers.hpp"

namespace {

//Written by openssl enc -aes-256-cbc with a PBKDF2-HMAC-SHA1 key of "password"
const EntryEncryptionParams FIXTURE_PARAMS{ "ABEiM0RVZneImaq7zN3u/w==", "ChssPU5fYHE=", EncryptionScheme::LegacySdaCompatible };
const char* ENCRYPTED_FIXTURE = "maFiles/compat/1-account-encrypted/1234.maFile";

} // namespace

class MaFileCryptoTest : public ::testing::Test {
protected:
	TempDir temp;
	MaFileEntryLoader loader;
};

// =============================================================================
// Known answers
// =============================================================================

TEST_F(MaFileCryptoTest, DecryptsFileWrittenByOpenSsl) {
	auto plainText = MaFileCrypto::Decrypt("password", FIXTURE_PARAMS, ReadText(FixturePath(ENCRYPTED_FIXTURE)));

	auto data = json::parse(plainText);
	EXPECT_EQ(data.at("account_name").get<std::string>(), "example");
	EXPECT_EQ(data.at("Session").at("SteamID").get<uint64_t>(), 1234u);
}

TEST_F(MaFileCryptoTest, LoaderDecryptsWithParams) {
	auto data = loader.Load(FixturePath(ENCRYPTED_FIXTURE), std::string("password"), FIXTURE_PARAMS);
	EXPECT_EQ(data.at("shared_secret").get<std::string>(), "zvIayp3JPvtvX/QGHqsqKBk/44s=");
}

TEST_F(MaFileCryptoTest, WrongPasskeyFailsToDecrypt) {
	try {
		loader.Load(FixturePath(ENCRYPTED_FIXTURE), std::string("wrong"), FIXTURE_PARAMS);
		FAIL() << "expected EntryLoadError";
	} catch (const EntryLoadError& e) {
		//A lucky padding byte still leaves garbage that is not json
		EXPECT_TRUE(e.code() == EntryLoadErrc::DecryptFailed || e.code() == EntryLoadErrc::DeserializeFailed) << e.what();
	}
}

TEST_F(MaFileCryptoTest, WrongPasskeyIsAPaddingError) {
	EXPECT_THROW(MaFileCrypto::Decrypt("hunter2", FIXTURE_PARAMS, ReadText(FixturePath(ENCRYPTED_FIXTURE))), EntryLoadError);
}

TEST_F(MaFileCryptoTest, EncryptedEntryNeedsPasskey) {
	try {
		loader.Load(FixturePath(ENCRYPTED_FIXTURE), std::nullopt, FIXTURE_PARAMS);
		FAIL() << "expected EntryLoadError";
	} catch (const EntryLoadError& e) {
		EXPECT_EQ(e.code(), EntryLoadErrc::MissingPasskey);
	}
}

TEST_F(MaFileCryptoTest, BadIvLengthFails) {
	EntryEncryptionParams params = FIXTURE_PARAMS;
	params.iv = "ChssPU5fYHE=";
	try {
		MaFileCrypto::Decrypt("password", params, ReadText(FixturePath(ENCRYPTED_FIXTURE)));
		FAIL() << "expected EntryLoadError";
	} catch (const EntryLoadError& e) {
		EXPECT_EQ(e.code(), EntryLoadErrc::DecryptFailed);
	}
}

// =============================================================================
// Writing
// =============================================================================

TEST_F(MaFileCryptoTest, GeneratedParamsHaveExpectedSizes) {
	auto params = MaFileCrypto::GenerateParams();
	EXPECT_EQ(MaFileCrypto::Base64Decode(params.iv).size(), static_cast<size_t>(IV_LENGTH));
	EXPECT_EQ(MaFileCrypto::Base64Decode(params.salt).size(), static_cast<size_t>(SALT_LENGTH));
	EXPECT_EQ(params.scheme, EncryptionScheme::LegacySdaCompatible);

	auto other = MaFileCrypto::GenerateParams();
	EXPECT_NE(params.iv, other.iv);
}

TEST_F(MaFileCryptoTest, SavedEntryLoadsBack) {
	auto params = MaFileCrypto::GenerateParams();
	json account = { { "account_name", "example" }, { "steam_id", 1234 } };
	auto path = temp.Path() / "1234.maFile";

	loader.Save(path, account, std::string("password"), params);
	EXPECT_EQ(ReadText(path).find("example"), std::string::npos);
	EXPECT_EQ(ReadText(path).find('\n'), std::string::npos);

	EXPECT_EQ(loader.Load(path, std::string("password"), params), account);
}

TEST_F(MaFileCryptoTest, PlainEntryIsWrittenAsJson) {
	json account = { { "account_name", "example" } };
	auto path = temp.Path() / "plain.maFile";

	loader.Save(path, account, std::nullopt, std::nullopt);
	EXPECT_EQ(json::parse(ReadText(path)), account);
}

TEST_F(MaFileCryptoTest, MissingFileFailsToRead) {
	try {
		loader.Load(temp.Path() / "missing.maFile", std::nullopt, std::nullopt);
		FAIL() << "expected EntryLoadError";
	} catch (const EntryLoadError& e) {
		EXPECT_EQ(e.code(), EntryLoadErrc::FileReadFailed);
	}
}
