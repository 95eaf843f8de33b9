#ifndef __TINY_STEAMGUARD_STEAMGUARDERROR_HPP__
#define __TINY_STEAMGUARD_STEAMGUARDERROR_HPP__

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

enum class MigrationErrc
{
	ManifestReadFailed,
	ManifestDeserializeFailed,
	UnknownManifestVersion,
	MissingPasskey,
	UnexpectedPasskey,
	AccountLoadFailed,
	BackupFailed,
	WriteFailed,
};

enum class EntryLoadErrc
{
	FileReadFailed,
	MissingPasskey,
	DecryptFailed,
	DeserializeFailed,
	UnsupportedScheme,
	WriteFailed,
};

enum class SteamApiErrc
{
	Decode,
	MissingField,
	NoSession,
	MissingTransferData,
	MissingTransferUrls,
	MissingTransferParameters,
	BadEResult,
};

inline constexpr std::string_view to_string(MigrationErrc errc) noexcept
{
	switch (errc)
	{
	case MigrationErrc::ManifestReadFailed:
		return "Failed to read manifest";
	case MigrationErrc::ManifestDeserializeFailed:
		return "Failed to deserialize manifest";
	case MigrationErrc::UnknownManifestVersion:
		return "Unknown manifest version";
	case MigrationErrc::MissingPasskey:
		return "Passkey is required to decrypt manifest";
	case MigrationErrc::UnexpectedPasskey:
		return "A passkey was provided but the manifest is not encrypted";
	case MigrationErrc::AccountLoadFailed:
		return "Failed to load some accounts";
	case MigrationErrc::BackupFailed:
		return "Failed to back up files before migration";
	case MigrationErrc::WriteFailed:
		return "Failed to write manifest";
	}
	return "Unknown migration error";
}

inline constexpr std::string_view to_string(EntryLoadErrc errc) noexcept
{
	switch (errc)
	{
	case EntryLoadErrc::FileReadFailed:
		return "Failed to read maFile";
	case EntryLoadErrc::MissingPasskey:
		return "maFile is encrypted but no passkey was given";
	case EntryLoadErrc::DecryptFailed:
		return "Failed to decrypt maFile, the passkey is probably wrong";
	case EntryLoadErrc::DeserializeFailed:
		return "Failed to deserialize maFile";
	case EntryLoadErrc::UnsupportedScheme:
		return "Unsupported encryption scheme";
	case EntryLoadErrc::WriteFailed:
		return "Failed to write maFile";
	}
	return "Unknown entry error";
}

inline constexpr std::string_view to_string(SteamApiErrc errc) noexcept
{
	switch (errc)
	{
	case SteamApiErrc::Decode:
		return "Failed to decode response";
	case SteamApiErrc::MissingField:
		return "Response is missing an expected field";
	case SteamApiErrc::NoSession:
		return "No session, log in first";
	case SteamApiErrc::MissingTransferData:
		return "did not receive transfer_urls and transfer_parameters";
	case SteamApiErrc::MissingTransferUrls:
		return "did not receive transfer_urls";
	case SteamApiErrc::MissingTransferParameters:
		return "did not receive transfer_parameters";
	case SteamApiErrc::BadEResult:
		return "Steam returned a failure result";
	}
	return "Unknown steam api error";
}

template<typename Errc>
inline std::string FormatErrorMessage(Errc errc, const std::string& detail)
{
	std::string message{ to_string(errc) };
	if (!detail.empty())
		message.append(": ").append(detail);
	return message;
}

class MigrationError : public std::runtime_error
{
public:
	MigrationError(MigrationErrc errc, const std::string& detail = {}) :
		std::runtime_error(FormatErrorMessage(errc, detail)),
		m_Errc(errc)
	{
	}

	MigrationErrc code() const noexcept { return m_Errc; }

private:
	MigrationErrc m_Errc;
};

struct EntryLoadFailure
{
	std::string filename;
	std::string reason;
};

//Bulk decryption failure, lists every entry that could not be loaded
class AccountLoadError : public MigrationError
{
public:
	explicit AccountLoadError(std::vector<EntryLoadFailure> failures) :
		MigrationError(MigrationErrc::AccountLoadFailed, DescribeFailures(failures)),
		m_Failures(std::move(failures))
	{
	}

	const std::vector<EntryLoadFailure>& GetFailures() const noexcept { return m_Failures; }

private:
	static std::string DescribeFailures(const std::vector<EntryLoadFailure>& failures)
	{
		std::string detail;
		for (const auto& failure : failures)
		{
			if (!detail.empty())
				detail += "; ";
			detail += failure.filename + " (" + failure.reason + ")";
		}
		return detail;
	}

private:
	std::vector<EntryLoadFailure> m_Failures;
};

class EntryLoadError : public std::runtime_error
{
public:
	EntryLoadError(EntryLoadErrc errc, const std::string& detail = {}) :
		std::runtime_error(FormatErrorMessage(errc, detail)),
		m_Errc(errc)
	{
	}

	EntryLoadErrc code() const noexcept { return m_Errc; }

private:
	EntryLoadErrc m_Errc;
};

//Raised when a value that is not at the latest version is converted to the latest type.
//This means the upgrade chain is broken, it is never caused by input.
class MigrationFault : public std::logic_error
{
public:
	using std::logic_error::logic_error;
};

class SteamApiError : public std::runtime_error
{
public:
	SteamApiError(SteamApiErrc errc, const std::string& detail = {}) :
		std::runtime_error(FormatErrorMessage(errc, detail)),
		m_Errc(errc)
	{
	}

	SteamApiErrc code() const noexcept { return m_Errc; }

private:
	SteamApiErrc m_Errc;
};

class TransportError : public std::runtime_error
{
public:
	using std::runtime_error::runtime_error;
};

#endif // !__TINY_STEAMGUARD_STEAMGUARDERROR_HPP__
