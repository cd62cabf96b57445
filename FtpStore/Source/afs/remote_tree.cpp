// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "remote_tree.h"
#include <zen/file_io.h>
#include <zen/file_traverser.h>
#include <zen/extra_log.h>
#include <algorithm>

using namespace zen;
using namespace fst;


namespace
{
const long FTP_ERROR_NOT_AVAILABLE = 550; //"Requested action not taken. File unavailable (e.g., file not found, no access)."


//already existing: ok
void createFolderIfMissing(RemoteSession& session, const RemotePath& folderPath) //throw SysError
{
    try
    {
        session.createFolder(folderPath); //throw SysError
    }
    catch (const SysErrorFtpProtocol&) //already existing? => possible, if run in parallel or after retry
    {
        if (const std::optional<RemoteItemType> type = getItemTypeIfExists(session, folderPath)) //throw SysError
        {
            if (*type == RemoteItemType::folder)
                return;

            throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPath))));
        }
        throw;
    }
}
}


std::optional<RemoteItem> fst::getItemInfoIfExists(RemoteSession& session, const RemotePath& itemPath, bool followSymlinks) //throw SysError
{
    const std::optional<RemotePath> parentPath = getParentPath(itemPath);
    if (!parentPath) //server root => quick access test
    {
        session.testConnection(); //throw SysError

        RemoteItem root;
        root.type = RemoteItemType::folder;
        return root;
    }

    std::optional<SysErrorFtpProtocol> lastFtpError;
    try
    {
        const Zstring itemName = getItemName(itemPath);
        assert(!itemName.empty());

        for (const RemoteItem& item : session.listFolder(*parentPath)) //throw SysError
            if (item.itemName == itemName) //case-sensitive comparison!
            {
                if (item.type == RemoteItemType::symlink && followSymlinks)
                    return getSymlinkTargetIfExists(session, itemPath); //throw SysError
                return item;
            }

        return std::nullopt;
    }
    catch (const SysErrorFtpProtocol& e)
    {
        //let's dig deeper, but *only* for "not existing"-like replies, not for general connection issues
        if (e.ftpErrorCode != FTP_ERROR_NOT_AVAILABLE)
            throw;
        lastFtpError = e; //-> get out of catch clause
    }

    //----------------------------------------------------------------
    if (const std::optional<RemoteItemType> parentType = getItemTypeIfExists(session, *parentPath)) //throw SysError
    {
        if (*parentType == RemoteItemType::file) //obscure, but possible: nothing can exist below a file
            return std::nullopt;

        throw* lastFtpError; //throw SysErrorFtpProtocol; parent path existing, so traversal should not have failed!
    }
    return std::nullopt;
}


std::optional<RemoteItem> fst::getSymlinkTargetIfExists(RemoteSession& session, const RemotePath& linkPath) //throw SysError
{
    try
    {
        RemoteItem target = session.getSymlinkTargetInfo(linkPath); //throw SysError
        target.itemName = getItemName(linkPath);
        return target;
    }
    catch (const SysErrorFtpProtocol& e)
    {
        if (e.ftpErrorCode != FTP_ERROR_NOT_AVAILABLE)
            throw;
        return std::nullopt; //broken link
    }
}


void fst::createFolderIfMissingRecursion(RemoteSession& session, const RemotePath& folderPath) //throw SysError
{
    //find first existing parent folder (backwards iteration):
    RemotePath folderPathEx = folderPath;
    std::vector<Zstring> folderNames; //reverse order
    for (;;)
    {
        if (const std::optional<RemoteItemType> type = getItemTypeIfExists(session, folderPathEx)) //throw SysError
        {
            if (*type == RemoteItemType::file) //obscure, but possible
                throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(folderPathEx))));
            break;
        }

        const std::optional<RemotePath> parentPath = getParentPath(folderPathEx);
        assert(parentPath); //root always exists
        if (!parentPath)
            break;

        folderNames.push_back(getItemName(folderPathEx));
        folderPathEx = *parentPath;
    }

    for (auto it = folderNames.rbegin(); it != folderNames.rend(); ++it)
    {
        folderPathEx = appendRelPath(folderPathEx, *it);
        createFolderIfMissing(session, folderPathEx); //throw SysError
    }
}


void fst::removeFolderRecursion(RemoteSession& session, const RemotePath& folderPath) //throw SysError
{
    std::function<void(const RemotePath& folderPath2)> removeFolderRecursionImpl;
    removeFolderRecursionImpl = [&session, &removeFolderRecursionImpl](const RemotePath& folderPath2) //throw SysError
    {
        std::vector<Zstring> folderNames;

        for (const RemoteItem& item : session.listFolder(folderPath2)) //throw SysError
            switch (item.type)
            {
                case RemoteItemType::file:
                case RemoteItemType::symlink: //delete the link, not its target
                    session.removeFile(appendRelPath(folderPath2, item.itemName)); //throw SysError
                    break;

                case RemoteItemType::folder:
                    folderNames.push_back(item.itemName);
                    break;
            }

        for (const Zstring& folderName : folderNames)
            removeFolderRecursionImpl(appendRelPath(folderPath2, folderName)); //throw SysError

        session.removeFolder(folderPath2); //throw SysError
    };

    removeFolderRecursionImpl(folderPath); //throw SysError
}


void fst::downloadFile(RemoteSession& session, const RemotePath& filePath, const Zstring& localFilePath) //throw SysError, FileError
{
    const Zstring tmpFilePath = getPathWithTempName(localFilePath);
    {
        FileOutputPlain fileOut(tmpFilePath); //throw FileError, ErrorTargetExisting

        session.downloadFile(filePath, [&](const void* buffer, size_t bytesToWrite)
        {
            fileOut.write(buffer, bytesToWrite); //throw FileError
        }); //throw SysError, FileError

        fileOut.close(); //throw FileError
    } //not closed => ~FileOutputPlain() deletes the temp file
    //take over ownership:
    ZEN_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); /*throw FileError*/ }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, localFilePath, true /*replaceExisting*/); //throw FileError, (ErrorTargetExisting)
}


void fst::downloadFolderRecursion(RemoteSession& session, const RemotePath& folderPath, const Zstring& localFolderPath) //throw SysError, FileError
{
    createDirectoryIfMissingRecursion(localFolderPath); //throw FileError

    for (const RemoteItem& item : session.listFolder(folderPath)) //throw SysError
    {
        const RemotePath itemPath = appendRelPath(folderPath, item.itemName);
        const Zstring localItemPath = appendPath(localFolderPath, item.itemName);

        switch (item.type)
        {
            case RemoteItemType::file:
                downloadFile(session, itemPath, localItemPath); //throw SysError, FileError
                break;

            case RemoteItemType::folder:
                downloadFolderRecursion(session, itemPath, localItemPath); //throw SysError, FileError
                break;

            case RemoteItemType::symlink:
                if (const std::optional<RemoteItem> target = getSymlinkTargetIfExists(session, itemPath)) //throw SysError
                {
                    if (target->type == RemoteItemType::folder) //might point to an ancestor => never descend
                        logExtraWarning(replaceCpy(_("Skipped symbolic link to folder %x."), L"%x", fmtPath(getServerRelPath(itemPath))));
                    else
                        downloadFile(session, itemPath, localItemPath); //throw SysError, FileError
                }
                else
                    logExtraWarning(replaceCpy(_("Cannot resolve symbolic link %x."), L"%x", fmtPath(getServerRelPath(itemPath))));
                break;
        }
    }
}


void fst::uploadFile(RemoteSession& session, const Zstring& localFilePath, const RemotePath& filePath) //throw SysError, FileError
{
    FileInputPlain fileIn(localFilePath); //throw FileError

    session.uploadFile(filePath, [&](void* buffer, size_t bytesToRead)
    {
        //libcurl expects a full block unless end of stream
        size_t bytesRead = 0;
        while (bytesRead < bytesToRead)
        {
            const size_t bytesReadNow = fileIn.tryRead(static_cast<char*>(buffer) + bytesRead, bytesToRead - bytesRead); //throw FileError
            if (bytesReadNow == 0) //end of file
                break;
            bytesRead += bytesReadNow;
        }
        return bytesRead;
    }); //throw SysError, FileError

    fileIn.close(); //throw FileError
}


void fst::uploadFolderRecursion(RemoteSession& session, const Zstring& localFolderPath, const RemotePath& folderPath) //throw SysError, FileError
{
    createFolderIfMissingRecursion(session, folderPath); //throw SysError

    std::function<void(const Zstring& localFolderPath2, const RemotePath& folderPath2)> uploadFolderContent;
    uploadFolderContent = [&session, &uploadFolderContent](const Zstring& localFolderPath2, const RemotePath& folderPath2) //throw SysError, FileError
    {
        std::vector<Zstring> fileNames;
        std::vector<Zstring> folderNames;

        traverseFolder(localFolderPath2,
        [&](const FileInfo&   fi) { fileNames  .push_back(fi.itemName); },
        [&](const FolderInfo& fi) { folderNames.push_back(fi.itemName); },
        [&](const SymlinkInfo& si)
        {
            try
            {
                if (getSymlinkTargetType(si.fullPath) == ItemType::folder) //throw FileError
                    logExtraWarning(replaceCpy(_("Skipped symbolic link to folder %x."), L"%x", fmtPath(si.fullPath)));
                else
                    fileNames.push_back(si.itemName);
            }
            catch (const FileError& e) { logExtraWarning(e.toString()); } //broken link
        }); //throw FileError

        for (const Zstring& fileName : fileNames)
            uploadFile(session, appendPath(localFolderPath2, fileName), appendRelPath(folderPath2, fileName)); //throw SysError, FileError

        for (const Zstring& folderName : folderNames)
        {
            const RemotePath subFolderPath = appendRelPath(folderPath2, folderName);
            createFolderIfMissing(session, subFolderPath); //throw SysError; empty folders, too

            uploadFolderContent(appendPath(localFolderPath2, folderName), subFolderPath); //throw SysError, FileError
        }
    };

    uploadFolderContent(localFolderPath, folderPath); //throw SysError, FileError
}


std::vector<RemotePath> fst::listCandidatePaths(RemoteSession& session, const RemotePath& prefixPath) //throw SysError
{
    const std::optional<RemoteItemType> prefixType = getItemTypeIfExists(session, prefixPath); //throw SysError
    if (!prefixType)
        return {};

    if (*prefixType != RemoteItemType::folder)
        return {prefixPath};

    std::vector<RemotePath> candidates;

    std::vector<RemotePath> workStack{prefixPath};
    while (!workStack.empty())
    {
        const RemotePath folderPath = std::move(workStack.back());
        workStack.pop_back();

        const std::vector<RemoteItem> items = session.listFolder(folderPath); //throw SysError
        if (items.empty()) //can't be refined any further => represents itself
            candidates.push_back(folderPath);

        for (const RemoteItem& item : items)
        {
            RemotePath itemPath = appendRelPath(folderPath, item.itemName);

            if (item.type == RemoteItemType::folder)
                workStack.push_back(std::move(itemPath));
            else //symlinks: not followed, not resolved
                candidates.push_back(std::move(itemPath));
        }
    }

    std::sort(candidates.begin(), candidates.end());
    return candidates;
}
