#ifndef __TINY_STEAMGUARD_MAFILECRYPTO_HPP__
#define __TINY_STEAMGUARD_MAFILECRYPTO_HPP__

#include <string>
#include <cryptopp/aes.h>
#include <cryptopp/base64.h>
#include <cryptopp/filters.h>
#include <cryptopp/modes.h>
#include <cryptopp/osrng.h>
#include <cryptopp/pwdbased.h>
#include <cryptopp/secblock.h>
#include <cryptopp/sha.h>
#include "Manifest.hpp"
#include "SteamGuardError.hpp"

//Parameters of the SDA compatible scheme, changing any of them breaks existing files
inline constexpr auto PBKDF2_ITERATIONS	= 50000;
inline constexpr auto SALT_LENGTH		= 8;
inline constexpr auto IV_LENGTH			= 16;
inline constexpr auto KEY_SIZE_BYTES	= 32;

using namespace CryptoPP;

//maFile body encryption. The file content is base64(AES-256-CBC(json)) keyed by
//PBKDF2-HMAC-SHA1(passkey, salt). Salt and IV live in the manifest entry.
class MaFileCrypto
{
public:
	static std::string Decrypt(const std::string& passkey, const EntryEncryptionParams& params, const std::string& cipherText)
	{
		CheckScheme(params);

		std::string plainText;
		try
		{
			auto key = DeriveKey(passkey, params.salt);
			auto iv = Base64Decode(params.iv);
			if (iv.size() != IV_LENGTH)
				throw EntryLoadError(EntryLoadErrc::DecryptFailed, "IV must be " + std::to_string(IV_LENGTH) + " bytes");

			CBC_Mode<AES>::Decryption aesCbcDecryptor;
			aesCbcDecryptor.SetKeyWithIV(key, key.size(), reinterpret_cast<const byte*>(iv.data()), iv.size());

			StringSource cbc_s(cipherText, true,
				new Base64Decoder(
					new StreamTransformationFilter(aesCbcDecryptor,
						new StringSink(plainText),
						BlockPaddingSchemeDef::PKCS_PADDING
					)
				)
			);
		}
		catch (const CryptoPP::Exception& e)
		{
			//A wrong passkey almost always ends up here as a padding error
			throw EntryLoadError(EntryLoadErrc::DecryptFailed, e.what());
		}

		return plainText;
	}

	static std::string Encrypt(const std::string& passkey, const EntryEncryptionParams& params, const std::string& plainText)
	{
		CheckScheme(params);

		std::string cipherText;
		try
		{
			auto key = DeriveKey(passkey, params.salt);
			auto iv = Base64Decode(params.iv);
			if (iv.size() != IV_LENGTH)
				throw EntryLoadError(EntryLoadErrc::WriteFailed, "IV must be " + std::to_string(IV_LENGTH) + " bytes");

			CBC_Mode<AES>::Encryption aesCbcEncryptor;
			aesCbcEncryptor.SetKeyWithIV(key, key.size(), reinterpret_cast<const byte*>(iv.data()), iv.size());

			StringSource cbc_s(plainText, true,
				new StreamTransformationFilter(aesCbcEncryptor,
					new Base64Encoder(
						new StringSink(cipherText), false
					),
					BlockPaddingSchemeDef::PKCS_PADDING
				)
			);
		}
		catch (const CryptoPP::Exception& e)
		{
			throw EntryLoadError(EntryLoadErrc::WriteFailed, e.what());
		}

		return cipherText;
	}

	//Fresh salt and IV for one entry
	static EntryEncryptionParams GenerateParams()
	{
		AutoSeededRandomPool randomPool;

		std::string salt(SALT_LENGTH, '\0');
		randomPool.GenerateBlock(reinterpret_cast<byte*>(salt.data()), salt.size());

		std::string iv(IV_LENGTH, '\0');
		randomPool.GenerateBlock(reinterpret_cast<byte*>(iv.data()), iv.size());

		return EntryEncryptionParams{ Base64Encode(iv), Base64Encode(salt), EncryptionScheme::LegacySdaCompatible };
	}

	static std::string Base64Encode(const std::string& data)
	{
		std::string encoded;
		StringSource s(data, true,
			new Base64Encoder(
				new StringSink(encoded), false
			)
		);
		return encoded;
	}

	static std::string Base64Decode(const std::string& data)
	{
		std::string decoded;
		StringSource s(data, true,
			new Base64Decoder(
				new StringSink(decoded)
			)
		);
		return decoded;
	}

private:
	static SecByteBlock DeriveKey(const std::string& passkey, const std::string& saltBase64)
	{
		auto salt = Base64Decode(saltBase64);

		SecByteBlock key(KEY_SIZE_BYTES);
		PKCS5_PBKDF2_HMAC<SHA1> pbkdf2;
		pbkdf2.DeriveKey(key, key.size(), 0,
			reinterpret_cast<const byte*>(passkey.data()), passkey.size(),
			reinterpret_cast<const byte*>(salt.data()), salt.size(),
			PBKDF2_ITERATIONS);

		return key;
	}

	static void CheckScheme(const EntryEncryptionParams& params)
	{
		if (params.scheme != EncryptionScheme::LegacySdaCompatible)
			throw EntryLoadError(EntryLoadErrc::UnsupportedScheme, EncryptionSchemeName(params.scheme));
	}
};

#endif // !__TINY_STEAMGUARD_MAFILECRYPTO_HPP__
