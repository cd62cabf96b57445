// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef REMOTE_TREE_H_6093182745501928374
#define REMOTE_TREE_H_6093182745501928374

#include "remote.h"


/*  algorithms on top of the RemoteSession primitives

    - remote errors are thrown as SysError *unchanged*: the retry wrapper needs the original type
    - local errors are thrown as FileError
    - a symlink given as path is followed, but tree walks never descend into linked folders:
      the target might be an ancestor    */
namespace fst
{
//root: folder; broken symlink: no value
std::optional<RemoteItem> getItemInfoIfExists(RemoteSession& session, const RemotePath& itemPath, bool followSymlinks = true); //throw SysError

inline
std::optional<RemoteItemType> getItemTypeIfExists(RemoteSession& session, const RemotePath& itemPath) //throw SysError
{
    if (const std::optional<RemoteItem> item = getItemInfoIfExists(session, itemPath)) //throw SysError
        return item->type;
    return std::nullopt;
}

//target type and details; broken link: no value
std::optional<RemoteItem> getSymlinkTargetIfExists(RemoteSession& session, const RemotePath& linkPath); //throw SysError

//tolerates existing folders, e.g. created concurrently
void createFolderIfMissingRecursion(RemoteSession& session, const RemotePath& folderPath); //throw SysError

//children first, then the folder itself
void removeFolderRecursion(RemoteSession& session, const RemotePath& folderPath); //throw SysError

//----------------------------------------------------------------------------------------------

//download to temporary sibling, then rename: no partial target file on failure
void downloadFile(RemoteSession& session, const RemotePath& filePath, const Zstring& localFilePath); //throw SysError, FileError

//mirror remote tree into local folder (created if missing)
//symlinks: files are copied, linked folders and broken links skipped with a warning
void downloadFolderRecursion(RemoteSession& session, const RemotePath& folderPath, const Zstring& localFolderPath); //throw SysError, FileError

void uploadFile(RemoteSession& session, const Zstring& localFilePath, const RemotePath& filePath); //throw SysError, FileError

//remote target folder and all subfolders (including empty ones) are created as needed
//local symlinks: same as for downloadFolderRecursion()
void uploadFolderRecursion(RemoteSession& session, const Zstring& localFolderPath, const RemotePath& folderPath); //throw SysError, FileError

//----------------------------------------------------------------------------------------------

/*  candidate paths below a wildcard-free prefix:
    - folder: all files and symlinks at any depth + all empty folders (prefix folder included)
    - file:   the prefix itself
    - not existing: nothing    */
std::vector<RemotePath> listCandidatePaths(RemoteSession& session, const RemotePath& prefixPath); //throw SysError
}

#endif //REMOTE_TREE_H_6093182745501928374
