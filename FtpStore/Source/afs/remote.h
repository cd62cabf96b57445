// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef REMOTE_H_5029384756102938475
#define REMOTE_H_5029384756102938475

#include <chrono>
#include <functional>
#include <optional>
#include <vector>
#include <zen/file_error.h>
#include <zen/file_path.h>


namespace fst
{
struct RemotePath //= path relative to the server root folder (no leading/trailing separator)
{
    RemotePath() {}
    explicit RemotePath(const Zstring& p) : value(p) { assert(zen::isValidRelPath(value)); }
    Zstring value;

    std::strong_ordering operator<=>(const RemotePath&) const = default;
};

RemotePath sanitizeRemotePath(Zstring serverPath); //accepts "/a//b/", "a/b", "/", ...
Zstring getServerRelPath(const RemotePath& itemPath); //=> "/a/b", root: "/"

std::optional<RemotePath> getParentPath(const RemotePath& itemPath); //no value for root
RemotePath appendRelPath(const RemotePath& itemPath, const Zstring& relPath);
inline Zstring getItemName(const RemotePath& itemPath) { return zen::afterLast(itemPath.value, FILE_NAME_SEPARATOR, zen::IfNotFoundReturn::all); }

//------------------------------------------------------------------------------------------

enum class RemoteItemType : unsigned char
{
    file,
    folder,
    symlink,
};

struct RemoteItem
{
    RemoteItemType type = RemoteItemType::file;
    Zstring itemName;
    uint64_t fileSize = 0; //files only
    time_t modTime = 0;    //UTC
};

//------------------------------------------------------------------------------------------

//connection-level failure: reset, timeout, failed connect, send/receive error
DEFINE_NEW_SYS_ERROR(SysErrorTransient)

//authentication rejected
DEFINE_NEW_SYS_ERROR(SysErrorPassword)

//server replied with an FTP error status
struct SysErrorFtpProtocol : public zen::SysError
{
    SysErrorFtpProtocol(const std::wstring& msg, long ftpError) : SysError(msg), ftpErrorCode(ftpError) {}

    long ftpErrorCode;
};

//------------------------------------------------------------------------------------------

/*  authenticated, stateful handle to one remote endpoint

    - NOT thread-safe: callers serialize access (see session_pool.h)
    - all paths are server-absolute
    - throws SysError or one of the subtypes above; never FileError */
class RemoteSession
{
public:
    virtual ~RemoteSession() {}

    //log in (if not yet connected) and verify the control connection
    virtual void testConnection() = 0; //throw SysError

    //close the network connection (if any): next call reconnects transparently
    virtual void closeConnection() = 0; //noexcept

    //children only, no "." and ".."; a missing folder fails with SysErrorFtpProtocol(550)
    virtual std::vector<RemoteItem> listFolder(const RemotePath& folderPath) = 0; //throw SysError

    //info about the target of an existing symlink; broken link: SysErrorFtpProtocol(550)
    virtual RemoteItem getSymlinkTargetInfo(const RemotePath& linkPath) = 0; //throw SysError

    //already existing: fail
    virtual void createFolder(const RemotePath& folderPath) = 0; //throw SysError
    virtual void removeFile  (const RemotePath& filePath  ) = 0; //throw SysError
    virtual void removeFolder(const RemotePath& folderPath) = 0; //throw SysError; folder must be empty

    virtual void downloadFile(const RemotePath& filePath, //throw SysError, X
                              const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) = 0;

    //already existing: overwrite
    virtual void uploadFile(const RemotePath& filePath, //throw SysError, X
                            const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X; return "bytesToRead" bytes unless end of stream*/) = 0;
};
}

#endif //REMOTE_H_5029384756102938475
