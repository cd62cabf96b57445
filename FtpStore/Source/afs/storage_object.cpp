// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "storage_object.h"
#include <zen/file_access.h>
#include "remote_tree.h"

using namespace zen;
using namespace fst;


FtpStorageObject::FtpStorageObject(const std::string& query, const Zstring& localPath, ConnectionPool& pool, //throw ErrorInvalidQuery
                                   const RetryPolicy& retryPolicy) :
    query_(query),
    parsedQuery_(parseQuery(query)), //throw ErrorInvalidQuery
    remotePath_(sanitizeRemotePath(parsedQuery_.path)),
    localPath_(localPath),
    retryPolicy_(retryPolicy),
    pool_(pool) {}


std::wstring FtpStorageObject::getDisplayPath(const RemotePath& itemPath) const
{
    //no user info: might contain a password
    const EndpointKey& ep = parsedQuery_.endpoint;
    return utfTo<std::wstring>(getSchemeName(ep.protocol) + Zstr("://") + ep.hostname + Zstr(':') + numberTo<Zstring>(ep.port) + getServerRelPath(itemPath));
}


template <class Function> inline
auto FtpStorageObject::runRemoteOperation(const std::wstring& operationMsg, Function fun /*throw SysError, FileError*/) //throw FileError
{
    return runWithRetry([&]
    {
        const std::shared_ptr<Session> session = pool_.getConnection(parsedQuery_.endpoint); //throw SysError

        return session->access([&](RemoteSession& rs) { return fun(rs); }); //throw SysError, FileError
    }, operationMsg, isTransientRemoteError, retryPolicy_); //throw FileError, ErrorRemoteOperation
}


RemoteItem FtpStorageObject::getItemInfo(RemoteSession& session, bool followSymlinks) //throw SysError, FileError
{
    if (const std::optional<RemoteItem> item = getItemInfoIfExists(session, remotePath_, followSymlinks)) //throw SysError
        return *item;

    throw FileError(replaceCpy(_("Cannot find %x."), L"%x", fmtPath(getDisplayPath(remotePath_))));
}


bool FtpStorageObject::exists() //throw FileError
{
    return runRemoteOperation(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(remotePath_))),
                              [&](RemoteSession& session)
    {
        return static_cast<bool>(getItemTypeIfExists(session, remotePath_)); //throw SysError
    });
}


time_t FtpStorageObject::mtime() //throw FileError
{
    return runRemoteOperation(replaceCpy(_("Cannot read modification time of %x."), L"%x", fmtPath(getDisplayPath(remotePath_))),
                              [&](RemoteSession& session)
    {
        return getItemInfo(session).modTime; //throw SysError, FileError
    });
}


uint64_t FtpStorageObject::size() //throw FileError
{
    return runRemoteOperation(replaceCpy(_("Cannot read file size of %x."), L"%x", fmtPath(getDisplayPath(remotePath_))),
                              [&](RemoteSession& session)
    {
        const RemoteItem item = getItemInfo(session); //throw SysError, FileError
        if (item.type == RemoteItemType::folder)
            throw FileError(replaceCpy(_("Cannot read file size of %x."), L"%x", fmtPath(getDisplayPath(remotePath_))),
                            _("The item is a folder, not a file."));
        return item.fileSize;
    });
}


void FtpStorageObject::retrieveObject() //throw FileError
{
    runRemoteOperation(replaceCpy(replaceCpy(_("Cannot copy %x to %y."),
                                             L"%x", fmtPath(getDisplayPath(remotePath_))),
                                  L"%y", fmtPath(localPath_)),
                       [&](RemoteSession& session)
    {
        if (getItemInfo(session).type == RemoteItemType::folder) //throw SysError, FileError
            downloadFolderRecursion(session, remotePath_, localPath_); //throw SysError, FileError
        else
        {
            if (const std::optional<Zstring> parentPath = getParentFolderPath(localPath_);
                parentPath && !parentPath->empty())
                createDirectoryIfMissingRecursion(*parentPath); //throw FileError

            downloadFile(session, remotePath_, localPath_); //throw SysError, FileError
        }
    });
}


void FtpStorageObject::storeObject() //throw FileError
{
    runRemoteOperation(replaceCpy(replaceCpy(_("Cannot copy %x to %y."),
                                             L"%x", fmtPath(localPath_)),
                                  L"%y", fmtPath(getDisplayPath(remotePath_))),
                       [&](RemoteSession& session)
    {
        ItemType localType = getItemType(localPath_); //throw FileError
        if (localType == ItemType::symlink)
            localType = getSymlinkTargetType(localPath_); //throw FileError

        if (localType == ItemType::folder)
            uploadFolderRecursion(session, localPath_, remotePath_); //throw SysError, FileError
        else
        {
            if (const std::optional<RemotePath> parentPath = getParentPath(remotePath_))
                createFolderIfMissingRecursion(session, *parentPath); //throw SysError

            uploadFile(session, localPath_, remotePath_); //throw SysError, FileError
        }
    });
}


void FtpStorageObject::removeObject() //throw FileError
{
    runRemoteOperation(replaceCpy(_("Cannot delete %x."), L"%x", fmtPath(getDisplayPath(remotePath_))),
                       [&](RemoteSession& session)
    {
        if (getItemInfo(session, false /*followSymlinks*/).type == RemoteItemType::folder) //throw SysError, FileError
            removeFolderRecursion(session, remotePath_); //throw SysError
        else
            session.removeFile(remotePath_); //throw SysError; symlink: delete the link, not its target
    });
}


std::vector<std::string> FtpStorageObject::listCandidatePaths() //throw FileError
{
    const RemotePath prefixPath = sanitizeRemotePath(getLiteralPathPrefix(parsedQuery_.path));

    const std::vector<RemotePath> candidates =
        runRemoteOperation(replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(prefixPath))),
                           [&](RemoteSession& session)
    {
        return fst::listCandidatePaths(session, prefixPath); //throw SysError
    });

    std::vector<std::string> output;
    for (const RemotePath& itemPath : candidates)
        output.push_back(getServerRelPath(itemPath));
    return output;
}


std::vector<std::string> FtpStorageObject::listCandidateMatches() //throw FileError
{
    std::vector<std::string> output;
    for (const std::string& itemPath : listCandidatePaths()) //throw FileError
        output.push_back(formatQuery(parsedQuery_, itemPath));
    return output;
}
