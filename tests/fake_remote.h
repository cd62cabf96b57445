// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FAKE_REMOTE_H_5590137284610938274
#define FAKE_REMOTE_H_5590137284610938274

#include <map>
#include <set>
#include <FtpStore/Source/afs/remote.h>


//in-memory FTP server with failure injection: shared by all sessions connecting to it
struct FakeServer
{
    std::mutex lock;

    std::set<Zstring> folders;             //relative paths; root "" always exists
    std::map<Zstring, std::string> files;  //relative path -> content
    std::map<Zstring, Zstring> symlinks;   //relative path -> relative target path (may be missing or an ancestor)
    time_t modTime = 1700000000;

    //failure injection:
    int transientFailures = 0;             //next n commands fail with SysErrorTransient
    int ftpErrorFailures = 0;              //next n commands fail with ftpErrorCode
    long ftpErrorCode = 450;
    bool denyLogin = false;
    bool breakDownloadMidway = false;      //deliver half the data, then fail with SysErrorTransient
    int maxCommands = 0;                   //> 0: fail permanently beyond this many commands, e.g. a walk that does not terminate

    //statistics:
    int loginCount = 0;
    int commandCount = 0;
    int closeCount = 0;

    void addFolder(const Zstring& relPath)
    {
        std::lock_guard dummy(lock);
        for (Zstring path = relPath; !path.empty(); path = zen::beforeLast(path, Zstr('/'), zen::IfNotFoundReturn::none))
            folders.insert(path);
    }

    void addSymlink(const Zstring& relPath, const Zstring& targetRelPath)
    {
        if (const Zstring parent = zen::beforeLast(relPath, Zstr('/'), zen::IfNotFoundReturn::none); !parent.empty())
            addFolder(parent);

        std::lock_guard dummy(lock);
        symlinks[relPath] = targetRelPath;
    }

    void addFile(const Zstring& relPath, const std::string& content)
    {
        if (const Zstring parent = zen::beforeLast(relPath, Zstr('/'), zen::IfNotFoundReturn::none); !parent.empty())
            addFolder(parent);

        std::lock_guard dummy(lock);
        files[relPath] = content;
    }
};


class FakeRemoteSession : public fst::RemoteSession
{
public:
    explicit FakeRemoteSession(const std::shared_ptr<FakeServer>& server) : server_(server) {}

    ~FakeRemoteSession() { closeConnection(); }

    void testConnection() override //throw SysError
    {
        std::lock_guard dummy(server_->lock);
        runCommand(); //throw SysError
    }

    void closeConnection() override
    {
        std::lock_guard dummy(server_->lock);
        if (connected_)
        {
            connected_ = false;
            ++server_->closeCount;
        }
    }

    std::vector<fst::RemoteItem> listFolder(const fst::RemotePath& folderPath) override //throw SysError
    {
        std::lock_guard dummy(server_->lock);
        runCommand(); //throw SysError

        const Zstring folderPathRes = resolvePath(folderPath.value);
        if (!isFolder(folderPathRes))
            throwNotAvailable(folderPath);

        std::vector<fst::RemoteItem> items;
        for (const Zstring& path : server_->folders)
            if (getParent(path) == folderPathRes)
            {
                fst::RemoteItem item;
                item.type = fst::RemoteItemType::folder;
                item.itemName = zen::getItemName(path);
                item.modTime = server_->modTime;
                items.push_back(item);
            }

        for (const auto& [path, content] : server_->files)
            if (getParent(path) == folderPathRes)
            {
                fst::RemoteItem item;
                item.itemName = zen::getItemName(path);
                item.fileSize = content.size();
                item.modTime = server_->modTime;
                items.push_back(item);
            }

        for (const auto& [path, target] : server_->symlinks)
            if (getParent(path) == folderPathRes)
            {
                fst::RemoteItem item;
                item.type = fst::RemoteItemType::symlink;
                item.itemName = zen::getItemName(path);
                item.modTime = server_->modTime;
                items.push_back(item);
            }
        return items;
    }

    fst::RemoteItem getSymlinkTargetInfo(const fst::RemotePath& linkPath) override //throw SysError
    {
        std::lock_guard dummy(server_->lock);
        runCommand(); //throw SysError

        const Zstring targetPath = resolvePath(linkPath.value);

        fst::RemoteItem item;
        item.itemName = zen::getItemName(linkPath.value);
        item.modTime = server_->modTime;

        if (auto it = server_->files.find(targetPath); it != server_->files.end())
            item.fileSize = it->second.size();
        else if (isFolder(targetPath))
            item.type = fst::RemoteItemType::folder;
        else
            throwNotAvailable(linkPath); //broken link
        return item;
    }

    void createFolder(const fst::RemotePath& folderPath) override //throw SysError
    {
        std::lock_guard dummy(server_->lock);
        runCommand(); //throw SysError

        if (folderPath.value.empty() || isFolder(folderPath.value) || server_->files.contains(folderPath.value) ||
            server_->symlinks.contains(folderPath.value) || !isFolder(getParent(folderPath.value)))
            throwNotAvailable(folderPath);

        server_->folders.insert(folderPath.value);
    }

    void removeFile(const fst::RemotePath& filePath) override //throw SysError
    {
        std::lock_guard dummy(server_->lock);
        runCommand(); //throw SysError

        if (server_->symlinks.erase(filePath.value) == 0 && //the link, not its target
            server_->files.erase(filePath.value) == 0)
            throwNotAvailable(filePath);
    }

    void removeFolder(const fst::RemotePath& folderPath) override //throw SysError
    {
        std::lock_guard dummy(server_->lock);
        runCommand(); //throw SysError

        if (folderPath.value.empty() || !isFolder(folderPath.value))
            throwNotAvailable(folderPath);

        for (const Zstring& path : server_->folders)
            if (getParent(path) == folderPath.value)
                throwNotAvailable(folderPath); //not empty
        for (const auto& [path, content] : server_->files)
            if (getParent(path) == folderPath.value)
                throwNotAvailable(folderPath);
        for (const auto& [path, target] : server_->symlinks)
            if (getParent(path) == folderPath.value)
                throwNotAvailable(folderPath);

        server_->folders.erase(folderPath.value);
    }

    void downloadFile(const fst::RemotePath& filePath, //throw SysError, X
                      const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) override
    {
        std::string content;
        bool breakMidway = false;
        {
            std::lock_guard dummy(server_->lock);
            runCommand(); //throw SysError

            auto it = server_->files.find(resolvePath(filePath.value));
            if (it == server_->files.end())
                throwNotAvailable(filePath);
            content = it->second;
            breakMidway = std::exchange(server_->breakDownloadMidway, false);
        }
        //small blocks: exercise the write loop
        const size_t blockSize = 3;
        const size_t bytesToSend = breakMidway ? content.size() / 2 : content.size();

        for (size_t pos = 0; pos < bytesToSend; pos += blockSize)
            writeBlock(content.data() + pos, std::min(blockSize, bytesToSend - pos)); //throw X

        if (breakMidway)
            throw fst::SysErrorTransient(L"Connection reset by peer (fake).");
    }

    void uploadFile(const fst::RemotePath& filePath, //throw SysError, X
                    const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) override
    {
        {
            std::lock_guard dummy(server_->lock);
            runCommand(); //throw SysError

            if (!isFolder(getParent(filePath.value)) || isFolder(filePath.value))
                throw fst::SysErrorFtpProtocol(L"553 File name not allowed (fake): " + zen::utfTo<std::wstring>(filePath.value), 553);
        }

        std::string content;
        char buffer[4];
        for (;;)
        {
            const size_t bytesRead = readBlock(buffer, sizeof(buffer)); //throw X
            if (bytesRead == 0)
                break;
            content.append(buffer, bytesRead);
        }

        std::lock_guard dummy(server_->lock);
        server_->files[filePath.value] = content;
    }

private:
    //call with server lock held
    void runCommand() //throw SysError
    {
        if (!connected_)
        {
            if (server_->denyLogin)
                throw fst::SysErrorPassword(L"530 Login incorrect (fake).");
            connected_ = true;
            ++server_->loginCount;
        }
        ++server_->commandCount;

        if (server_->maxCommands > 0 && server_->commandCount > server_->maxCommands)
            throw zen::SysError(L"Command limit exceeded (fake).");

        if (server_->transientFailures > 0)
        {
            --server_->transientFailures;
            connected_ = false; //broken connection: reconnect next time
            throw fst::SysErrorTransient(L"Connection timed out (fake).");
        }
        if (server_->ftpErrorFailures > 0)
        {
            --server_->ftpErrorFailures;
            throw fst::SysErrorFtpProtocol(L"FTP error (fake): " + zen::numberTo<std::wstring>(server_->ftpErrorCode), server_->ftpErrorCode);
        }
    }

    bool isFolder(const Zstring& relPath) const { return relPath.empty() || server_->folders.contains(relPath); }

    //follow links in every path component, like the server's file system would
    Zstring resolvePath(const Zstring& relPath) const
    {
        int hops = 0;
        return resolvePath(relPath, hops);
    }

    Zstring resolvePath(const Zstring& relPath, int& hops) const
    {
        Zstring output;
        for (const Zstring& name : zen::splitCpy(relPath, Zstr('/'), zen::SplitOnEmpty::skip))
        {
            output = output.empty() ? name : output + Zstr('/') + name;

            if (auto it = server_->symlinks.find(output); it != server_->symlinks.end())
            {
                if (++hops > 40) //ELOOP
                    return Zstr("?too many levels of symbolic links");
                output = resolvePath(it->second, hops);
            }
        }
        return output;
    }

    static Zstring getParent(const Zstring& relPath) { return zen::beforeLast(relPath, Zstr('/'), zen::IfNotFoundReturn::none); }

    [[noreturn]] static void throwNotAvailable(const fst::RemotePath& itemPath)
    {
        throw fst::SysErrorFtpProtocol(L"550 No such file or directory (fake): " + zen::utfTo<std::wstring>(getServerRelPath(itemPath)), 550);
    }

    const std::shared_ptr<FakeServer> server_;
    bool connected_ = false;
};

#endif //FAKE_REMOTE_H_5590137284610938274
