// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STORAGE_OBJECT_H_4718203956142870392
#define STORAGE_OBJECT_H_4718203956142870392

#include "query.h"
#include "retry.h"
#include "session_pool.h"


namespace fst
{
/*  capabilities of a storage object, as seen by the host:

    all operations crossing the network are retried on transient errors and throw
    - ErrorRemoteOperation: retries exhausted
    - FileError:            permanent remote error or local error    */
class StorageObjectRead
{
public:
    virtual ~StorageObjectRead() {}

    virtual bool exists() = 0; //throw FileError; never "false" on error
    virtual time_t mtime() = 0; //throw FileError; UTC
    virtual uint64_t size() = 0; //throw FileError; files only

    //make object available under the local path: file or complete folder tree
    virtual void retrieveObject() = 0; //throw FileError

    //location relative to the host's staging area
    virtual std::string localSuffix() const = 0;
};


class StorageObjectWrite
{
public:
    virtual ~StorageObjectWrite() {}

    //upload local file or folder tree, creating missing remote parent folders
    virtual void storeObject() = 0; //throw FileError

    //file, or folder including all content
    virtual void removeObject() = 0; //throw FileError
};


class StorageObjectGlob
{
public:
    virtual ~StorageObjectGlob() {}

    //concrete queries "scheme://netloc/path" below the literal prefix of the query: files and empty folders
    virtual std::vector<std::string> listCandidateMatches() = 0; //throw FileError
};

//------------------------------------------------------------------------------------------

//thread-safe: operations on the same object may run concurrently, serialized per endpoint session
class FtpStorageObject : public StorageObjectRead, public StorageObjectWrite, public StorageObjectGlob
{
public:
    FtpStorageObject(const std::string& query, const Zstring& localPath, ConnectionPool& pool, //throw ErrorInvalidQuery
                     const RetryPolicy& retryPolicy = DEFAULT_RETRY_POLICY);

    bool exists() override; //throw FileError
    time_t mtime() override; //throw FileError
    uint64_t size() override; //throw FileError
    void retrieveObject() override; //throw FileError
    std::string localSuffix() const override { return parsedQuery_.netloc + parsedQuery_.path; }

    void storeObject() override; //throw FileError
    void removeObject() override; //throw FileError

    std::vector<std::string> listCandidateMatches() override; //throw FileError
    std::vector<std::string> listCandidatePaths(); //throw FileError; server paths "/a/b"

    const std::string& getQuery() const { return query_; }
    const ParsedQuery& getParsedQuery() const { return parsedQuery_; }
    const Zstring& getLocalPath() const { return localPath_; }

private:
    FtpStorageObject           (const FtpStorageObject&) = delete;
    FtpStorageObject& operator=(const FtpStorageObject&) = delete;

    std::wstring getDisplayPath(const RemotePath& itemPath) const;

    RemoteItem getItemInfo(RemoteSession& session, bool followSymlinks = true); //throw SysError, FileError

    template <class Function>
    auto runRemoteOperation(const std::wstring& operationMsg, Function fun /*throw SysError, FileError*/); //throw FileError

    const std::string query_;
    const ParsedQuery parsedQuery_;
    const RemotePath remotePath_;
    const Zstring localPath_;
    const RetryPolicy retryPolicy_;

    ConnectionPool& pool_; //first use of the endpoint performs the handshake
};
}

#endif //STORAGE_OBJECT_H_4718203956142870392
