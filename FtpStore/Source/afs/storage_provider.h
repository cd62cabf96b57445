// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STORAGE_PROVIDER_H_3391028475610293847
#define STORAGE_PROVIDER_H_3391028475610293847

#include "storage_object.h"


namespace fst
{
struct StorageProviderSettings
{
    std::optional<Zstring> username; //none: anonymous
    std::optional<Zstring> password;
    bool activeMode = false; //default: passive mode
    int timeoutSec = 10;
    double maxRequestsPerSecond = 10.0;
};

/*  FTPSTORE_USERNAME
    FTPSTORE_PASSWORD
    FTPSTORE_ACTIVE_MODE               1/0, true/false, yes/no, on/off
    FTPSTORE_TIMEOUT                   seconds
    FTPSTORE_MAX_REQUESTS_PER_SECOND        */
StorageProviderSettings readSettingsFromEnv(); //throw FileError

void validateSettings(const StorageProviderSettings& settings); //throw FileError


enum class QueryType
{
    input,
    output,
    any,
};

struct ExampleQuery
{
    std::string query;
    QueryType type = QueryType::any;
    std::wstring description;
};


//owns the connection pool shared by all storage objects it creates
class StorageProvider
{
public:
    explicit StorageProvider(const StorageProviderSettings& settings); //throw FileError
    StorageProvider(const StorageProviderSettings& settings, const SessionFactory& sessionFactory); //throw FileError

    static std::vector<ExampleQuery> exampleQueries();

    static QueryValidationResult isValidQuery(const std::string& query) { return fst::isValidQuery(query); }

    //hints for the host's request throttling: one limiter per server
    bool useRateLimiter() const { return true; }
    double defaultMaxRequestsPerSecond() const { return 10.0; }
    double maxRequestsPerSecond() const { return settings_.maxRequestsPerSecond; }
    std::string rateLimiterKey(const std::string& query) const { return getQueryNetloc(query); }

    //retries with DEFAULT_RETRY_POLICY
    std::unique_ptr<FtpStorageObject> createStorageObject(const std::string& query, const Zstring& localPath); //throw ErrorInvalidQuery

    const StorageProviderSettings& getSettings() const { return settings_; }
    ConnectionPool& getConnectionPool() { return pool_; }

private:
    StorageProvider           (const StorageProvider&) = delete;
    StorageProvider& operator=(const StorageProvider&) = delete;

    const StorageProviderSettings settings_;
    ConnectionPool pool_;
};

//FTP sessions with credentials and transfer mode taken from the settings
SessionFactory createFtpSessionFactory(const StorageProviderSettings& settings);
}

#endif //STORAGE_PROVIDER_H_3391028475610293847
