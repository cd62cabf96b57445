// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_access.h"
#include <deque>
#include "file_traverser.h"
    #include <sys/stat.h>
    #include <unistd.h> //unlink, rmdir
    #include <cstdio>   //rename

using namespace zen;


namespace
{
struct SysErrorCode : public SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const Zstring& itemPath, bool followSymlinks = false) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (followSymlinks)
    {
        if (::stat(itemPath.c_str(), &itemInfo) != 0)
            throw SysErrorCode("stat", errno);
    }
    else if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}
}


ItemType zen::getItemType(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString()); }
}


ItemType zen::getSymlinkTargetType(const Zstring& linkPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(linkPath, true /*followSymlinks*/); //throw SysErrorCode
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot resolve symbolic link %x."), L"%x", fmtPath(linkPath)), e.toString()); }
}


std::optional<ItemType> zen::getItemTypeIfExists(const Zstring& itemPath) //throw FileError
{
    try
    {
        return getItemTypeImpl(itemPath); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        //"not existing" only if the error code says so; anything else (e.g. EACCES) is a real error
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR)
            return std::nullopt;

        throw FileError(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), e.toString());
    }
}


uint64_t zen::getFileSize(const Zstring& filePath) //throw FileError
{
    struct stat fileInfo = {};
    if (::stat(filePath.c_str(), &fileInfo) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(filePath)), "stat");

    return fileInfo.st_size;
}


void zen::removeFilePlain(const Zstring& filePath) //throw FileError
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void zen::removeDirectoryPlain(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (::rmdir(dirPath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("rmdir");
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


namespace
{
void removeDirectoryImpl(const Zstring& folderPath) //throw FileError
{
    std::vector<Zstring> folderPaths;
    {
        std::vector<Zstring> filePaths;

        //get all files and directories from current directory (WITHOUT subdirectories!)
        traverseFolder(folderPath,
        [&](const    FileInfo& fi) {   filePaths.push_back(fi.fullPath); },
        [&](const  FolderInfo& fi) { folderPaths.push_back(fi.fullPath); },
        [&](const SymlinkInfo& si) {   filePaths.push_back(si.fullPath); }); //throw FileError

        for (const Zstring& filePath : filePaths)
            removeFilePlain(filePath); //throw FileError; unlink() also removes symlinks
    } //=> save stack space and allow deletion of extremely deep hierarchies!

    for (const Zstring& subFolderPath : folderPaths)
        removeDirectoryImpl(subFolderPath); //throw FileError

    removeDirectoryPlain(folderPath); //throw FileError
}
}


void zen::removeDirectoryPlainRecursion(const Zstring& dirPath) //throw FileError
{
    try
    {
        if (getItemTypeImpl(dirPath) == ItemType::symlink) //throw SysErrorCode
            removeFilePlain(dirPath); //throw FileError
        else
            removeDirectoryImpl(dirPath); //throw FileError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo, bool replaceExisting) //throw FileError, ErrorTargetExisting
{
    const std::wstring errorMsg = replaceCpy(replaceCpy(_("Cannot move %x to %y."), L"%x", fmtPath(pathFrom)), L"%y", fmtPath(pathTo));

    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (!replaceExisting)
    {
        struct stat infoTarget = {};
        if (::lstat(pathTo.c_str(), &infoTarget) == 0)
            throw ErrorTargetExisting(errorMsg, formatSystemError("rename", EEXIST));
    }

    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
        THROW_LAST_FILE_ERROR(errorMsg, "rename");
}


void zen::createDirectory(const Zstring& dirPath) //throw FileError, ErrorTargetExisting
{
    try
    {
        const mode_t mode = S_IRWXU | S_IRWXG | S_IRWXO; //0777 => consider umask!

        if (::mkdir(dirPath.c_str(), mode) != 0)
        {
            const int ec = errno; //copy before directly or indirectly making other system calls!
            if (ec == EEXIST)
                throw ErrorTargetExisting(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), formatSystemError("mkdir", ec));
            THROW_LAST_SYS_ERROR("mkdir");
        }
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString()); }
}


void zen::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    try
    {
        //find first existing parent folder (backwards iteration):
        Zstring dirPathEx = dirPath;
        std::deque<Zstring> dirNames;
        for (;;)
        {
            const std::optional<ItemType> type = getItemTypeIfExists(dirPathEx); //throw FileError
            if (type)
            {
                if (*type == ItemType::file /*obscure, but possible*/)
                    throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPathEx))));
                break;
            }

            const std::optional<Zstring> parentPath = getParentFolderPath(dirPathEx);
            if (!parentPath) //root
                break;
            dirNames.push_front(getItemName(dirPathEx));

            if (parentPath->empty()) //relative path
            {
                dirPathEx.clear();
                break;
            }
            dirPathEx = *parentPath;
        }
        //-----------------------------------------------------------

        Zstring dirPathNew = dirPathEx;
        for (const Zstring& dirName : dirNames)
        {
            dirPathNew = appendPath(dirPathNew, dirName);
            try
            {
                createDirectory(dirPathNew); //throw FileError, ErrorTargetExisting
            }
            catch (ErrorTargetExisting&)
            {
                if (getItemType(dirPathNew) == ItemType::file) //throw FileError
                    throw SysError(replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPathNew))));
                //already existing => possible, if createDirectoryIfMissingRecursion() is run in parallel
            }
        }
    }
    catch (const SysError& e)
    {
        throw FileError(replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath)), e.toString());
    }
}
