// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "storage_provider.h"
#include "ftp.h"

using namespace zen;
using namespace fst;


namespace
{
std::wstring getInvalidSettingMsg(const ZstringView varName)
{
    return replaceCpy(_("Invalid configuration value %x."), L"%x", fmtPath(Zstring(varName)));
}


bool parseBoolSetting(const ZstringView varName, const Zstring& value) //throw FileError
{
    for (const ZstringView yes : {Zstr("1"), Zstr("true"), Zstr("yes"), Zstr("on")})
        if (equalAsciiNoCase(value, yes))
            return true;

    for (const ZstringView no : {Zstr("0"), Zstr("false"), Zstr("no"), Zstr("off"), Zstr("")})
        if (equalAsciiNoCase(value, no))
            return false;

    throw FileError(getInvalidSettingMsg(varName), replaceCpy(_("Expected a boolean value, got %x."), L"%x", fmtPath(value)));
}


int parseIntSetting(const ZstringView varName, const Zstring& value) //throw FileError
{
    if (value.empty() || value.size() > 9 || !std::all_of(value.begin(), value.end(), [](Zchar c) { return isDigit(c); }))
        throw FileError(getInvalidSettingMsg(varName), replaceCpy(_("Expected a positive number, got %x."), L"%x", fmtPath(value)));

    return stringTo<int>(value);
}


double parseDoubleSetting(const ZstringView varName, const Zstring& value) //throw FileError
{
    const bool validChars = !value.empty() && std::all_of(value.begin(), value.end(), [](Zchar c) { return isDigit(c) || c == Zstr('.'); });
    if (!validChars || std::count(value.begin(), value.end(), Zstr('.')) > 1)
        throw FileError(getInvalidSettingMsg(varName), replaceCpy(_("Expected a positive number, got %x."), L"%x", fmtPath(value)));

    return stringTo<double>(value);
}
}


StorageProviderSettings fst::readSettingsFromEnv() //throw FileError
{
    StorageProviderSettings settings;

    if (std::optional<Zstring> val = getEnvironmentVar(Zstr("FTPSTORE_USERNAME")); val && !val->empty())
        settings.username = *val;

    if (std::optional<Zstring> val = getEnvironmentVar(Zstr("FTPSTORE_PASSWORD")))
        settings.password = *val;

    if (std::optional<Zstring> val = getEnvironmentVar(Zstr("FTPSTORE_ACTIVE_MODE")))
        settings.activeMode = parseBoolSetting(Zstr("FTPSTORE_ACTIVE_MODE"), *val); //throw FileError

    if (std::optional<Zstring> val = getEnvironmentVar(Zstr("FTPSTORE_TIMEOUT")))
        settings.timeoutSec = parseIntSetting(Zstr("FTPSTORE_TIMEOUT"), *val); //throw FileError

    if (std::optional<Zstring> val = getEnvironmentVar(Zstr("FTPSTORE_MAX_REQUESTS_PER_SECOND")))
        settings.maxRequestsPerSecond = parseDoubleSetting(Zstr("FTPSTORE_MAX_REQUESTS_PER_SECOND"), *val); //throw FileError

    validateSettings(settings); //throw FileError
    return settings;
}


void fst::validateSettings(const StorageProviderSettings& settings) //throw FileError
{
    if (settings.timeoutSec < 1)
        throw FileError(getInvalidSettingMsg(Zstr("timeoutSec")),
                        replaceCpy(_("Timeout must be at least one second, got %x."), L"%x", numberTo<std::wstring>(settings.timeoutSec)));

    if (!(settings.maxRequestsPerSecond > 0)) //NaN, too
        throw FileError(getInvalidSettingMsg(Zstr("maxRequestsPerSecond")),
                        replaceCpy(_("Request limit must be greater than zero, got %x."), L"%x", numberTo<std::wstring>(settings.maxRequestsPerSecond)));

    if (settings.username && trimCpy(*settings.username) != *settings.username)
        throw FileError(getInvalidSettingMsg(Zstr("username")), _("User name must not start or end with a space."));
}


SessionFactory fst::createFtpSessionFactory(const StorageProviderSettings& settings)
{
    return [settings](const EndpointKey& key) //throw SysError
    {
        FtpLogin login;
        login.server     = key.hostname;
        login.port       = key.port;
        login.username   = settings.username ? *settings.username : Zstring();
        login.password   = settings.password;
        login.useTls     = key.protocol == Protocol::secure;
        login.activeMode = settings.activeMode;
        login.timeoutSec = settings.timeoutSec;

        return createFtpSession(login); //throw SysError
    };
}


StorageProvider::StorageProvider(const StorageProviderSettings& settings) : //throw FileError
    StorageProvider(settings, createFtpSessionFactory(settings)) {}


StorageProvider::StorageProvider(const StorageProviderSettings& settings, const SessionFactory& sessionFactory) : //throw FileError
    settings_((validateSettings(settings), settings)), //throw FileError
    pool_(sessionFactory) {}


std::vector<ExampleQuery> StorageProvider::exampleQueries()
{
    return
    {
        {
            "ftp://ftpserver.com:21/myfile.txt", QueryType::any,
            L"A file on an ftp server. The port is optional and defaults to 21."
        },
        {
            "ftps://ftpserver.com:21/myfile.txt", QueryType::any,
            L"A file on an ftp server (using encrypted transport). The port is optional and defaults to 21."
        },
    };
}


std::unique_ptr<FtpStorageObject> StorageProvider::createStorageObject(const std::string& query, const Zstring& localPath) //throw ErrorInvalidQuery
{
    return std::make_unique<FtpStorageObject>(query, localPath, pool_); //throw ErrorInvalidQuery
}
