#include <cstdio>
#include <memory>
#include <optional>
#include <string>
#include "argparser.hpp"
#include "AccountMigrator.hpp"
#include "AccountStore.hpp"
#include "BasicIO.hpp"
#include "EntryLoader.hpp"
#include "HttpTransport.hpp"
#include "SteamApiClient.hpp"

static std::optional<std::string> GetPasskey(ArgParser& parser)
{
    if (!parser.HasOption("-passkey"))
        return std::nullopt;

    return parser.GetOptionValueString("-passkey");
}

static int RunMigrate(ArgParser& parser)
{
    if (!parser.HasOption("-manifest"))
    {
        criticalmsg("-cmd migrate needs -manifest.\n");
        return -1;
    }

    fs::path manifestPath = parser.GetOptionValueString("-manifest");
    auto passkey = GetPasskey(parser);

    MaFileEntryLoader loader;
    AccountMigrator migrator(loader);
    auto [manifest, accounts] = migrator.LoadAndMigrate(manifestPath, passkey);
    AccountStore::Save(manifestPath, std::move(manifest), accounts, passkey);

    printf("Migrated %zu account(s), backups were written next to the originals\n", accounts.size());
    return 0;
}

static int RunCode(ArgParser& parser)
{
    if (!parser.HasOption("-manifest"))
    {
        criticalmsg("-cmd code needs -manifest.\n");
        return -1;
    }

    MaFileEntryLoader loader;
    AccountMigrator migrator(loader);
    auto [manifest, accounts] = migrator.Migrate(parser.GetOptionValueString("-manifest"), GetPasskey(parser));

    for (const auto& account : accounts)
        printf("%s\t%s\n", account.account_name.c_str(), account.GenerateCode().c_str());

    return 0;
}

static int RunImport(ArgParser& parser)
{
    if (!parser.HasOption("-import"))
    {
        criticalmsg("-cmd import needs -import.\n");
        return -1;
    }

    auto account = AccountMigrator::LoadAndUpgradeSdaAccount(parser.GetOptionValueString("-import"));
    printf("%s\n", json(account).dump(2).c_str());
    return 0;
}

static int RunServerTime()
{
    SteamApiClient client(std::make_shared<CurlHttpTransport>());
    printf("%lld\n", static_cast<long long>(client.GetServerTime()));
    return 0;
}

int main(int argc, char** argv)
{
    ArgParser parser;

    parser.AddOption("-cmd", "Command to run: migrate, code, import or servertime.", OptionAttr::OptionalWithValue, OptionValueType::STRING);
    parser.AddOption("-manifest", "Path to manifest.json.", OptionAttr::OptionalWithValue, OptionValueType::STRING);
    parser.AddOption("-passkey", "Passkey of an encrypted manifest.", OptionAttr::OptionalWithValue, OptionValueType::STRING);
    parser.AddOption("-import", "Legacy maFile to import.", OptionAttr::OptionalWithValue, OptionValueType::STRING);
    parser.AddOption("-verbosity", "0 critical, 1 warning, 2 info, 3 debug, 4 trace.", OptionAttr::OptionalWithValue, OptionValueType::INT16U);

    //Parse arguments
    try
    {
        parser.ParseArgument(argc, argv);
    }
    catch (const std::exception& e)
    {
        criticalmsg("%s\n", e.what());
        return -1;
    }

    //Check argumtents
    if (parser.OptionCount() < 1 || !parser.HasOption("-cmd"))
    {
        parser.PrintOptions();
        return -1;
    }

    if (parser.HasOption("-verbosity"))
    {
        auto verbosity = parser.GetOptionValueInt16U("-verbosity");
        if (verbosity > static_cast<int>(LogLevel::Trace))
        {
            criticalmsg("-verbosity must be between 0 and %d.\n", static_cast<int>(LogLevel::Trace));
            return -1;
        }
        SetLogLevel(static_cast<LogLevel>(verbosity));
    }

    auto cmd = parser.GetOptionValueString("-cmd");
    try
    {
        HttpGlobalScope http;

        if (cmd == "migrate")
            return RunMigrate(parser);
        if (cmd == "code")
            return RunCode(parser);
        if (cmd == "import")
            return RunImport(parser);
        if (cmd == "servertime")
            return RunServerTime();
    }
    catch (const std::exception& e)
    {
        criticalmsg("%s failed! %s\n", cmd.c_str(), e.what());
        return -1;
    }

    criticalmsg("Unknown command %s\n", cmd.c_str());
    parser.PrintOptions();
    return -1;
}
