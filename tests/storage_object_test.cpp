// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <algorithm>
#include <atomic>
#include <thread>
#include <unistd.h>
#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <zen/file_traverser.h>
#include <FtpStore/Source/afs/storage_provider.h>
#include "fake_remote.h"
#include "test_context.h"

using namespace zen;
using namespace fst;


namespace
{
const RetryPolicy fastPolicy{5, std::chrono::milliseconds(1), 2};


struct FakeProvider
{
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    StorageProvider provider{StorageProviderSettings(), [server = server](const EndpointKey&)
    {
        return std::make_unique<FakeRemoteSession>(server);
    }};

    std::unique_ptr<FtpStorageObject> get(const std::string& query, const Zstring& localPath = Zstring(), const RetryPolicy& policy = fastPolicy)
    {
        return std::make_unique<FtpStorageObject>(query, localPath, provider.getConnectionPool(), policy); //fast retries
    }
};


bool containsWarning(const ErrorLog& log, const std::string& text)
{
    return std::any_of(log.begin(), log.end(), [&](const LogEntry& entry) { return entry.type == MSG_TYPE_WARNING && contains(entry.message, text); });
}


size_t countLocalItems(const Zstring& folderPath)
{
    size_t count = 0;
    traverseFolder(folderPath,
    [&](const FileInfo&) { ++count; },
    [&](const FolderInfo&) { ++count; },
    [&](const SymlinkInfo&) { ++count; });
    return count;
}


void testStoreAndRetrieveTree(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;

    const Zstring srcPath = appendPath(tmp.getPath(), Zstr("src"));
    createDirectoryIfMissingRecursion(appendPath(srcPath, Zstr("sub")));
    createDirectoryIfMissingRecursion(appendPath(srcPath, Zstr("empty")));
    setFileContent(appendPath(srcPath, Zstr("a.txt")), "alpha");
    setFileContent(appendPath(srcPath, Zstr("sub/b.txt")), "bravo bravo");

    fp.get("ftp://host/remote/tree", srcPath)->storeObject();

    t.check(fp.server->files.size() == 2, "two files uploaded");
    t.check(fp.server->files["remote/tree/a.txt"] == "alpha", "file content uploaded");
    t.check(fp.server->files["remote/tree/sub/b.txt"] == "bravo bravo", "nested file content uploaded");
    t.check(fp.server->folders.contains("remote/tree/empty"), "empty folder uploaded");

    const Zstring dstPath = appendPath(tmp.getPath(), Zstr("dst"));
    fp.get("ftp://host/remote/tree", dstPath)->retrieveObject();

    t.check(getFileContent(appendPath(dstPath, Zstr("a.txt"))) == "alpha", "file downloaded");
    t.check(getFileContent(appendPath(dstPath, Zstr("sub/b.txt"))) == "bravo bravo", "nested file downloaded");
    t.check(getItemTypeIfExists(appendPath(dstPath, Zstr("empty"))) == ItemType::folder, "empty folder downloaded");
    t.check(countLocalItems(dstPath) == 3, "nothing else downloaded");

    t.check(fp.server->loginCount == 1, "both objects share the pooled session");
}


void testStoreSingleFileCreatesParents(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;

    const Zstring filePath = appendPath(tmp.getPath(), Zstr("data.bin"));
    setFileContent(filePath, std::string("\0\x01\x02 binary", 10));

    fp.get("ftp://host/deep/er/data.bin", filePath)->storeObject();

    t.check(fp.server->folders.contains("deep") && fp.server->folders.contains("deep/er"), "missing parents created");
    t.check(fp.server->files["deep/er/data.bin"] == std::string("\0\x01\x02 binary", 10), "binary content unchanged");

    const Zstring outPath = appendPath(tmp.getPath(), Zstr("out/nested/data.bin"));
    fp.get("ftp://host/deep/er/data.bin", outPath)->retrieveObject();
    t.check(getFileContent(outPath) == std::string("\0\x01\x02 binary", 10), "local parent created on retrieve");
}


void testAttributes(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("dir/file.txt", "12345");
    fp.server->addFolder("dir/sub");

    t.check(fp.get("ftp://host/dir/file.txt")->exists(), "file exists");
    t.check(fp.get("ftp://host/dir/sub")->exists(), "folder exists");
    t.check(fp.get("ftp://host/dir/sub/")->exists(), "trailing slash is ignored");
    t.check(fp.get("ftp://host/")->exists(), "root exists");
    t.check(!fp.get("ftp://host/dir/missing")->exists(), "missing file does not exist");
    t.check(!fp.get("ftp://host/nope/missing")->exists(), "missing parent: does not exist");
    t.check(!fp.get("ftp://host/dir/file.txt/child")->exists(), "file as parent: does not exist");

    t.check(fp.get("ftp://host/dir/file.txt")->size() == 5, "file size");
    t.check(fp.get("ftp://host/dir/file.txt")->mtime() == fp.server->modTime, "modification time");
    t.check(fp.get("ftp://host/dir/sub")->mtime() == fp.server->modTime, "folder modification time");

    bool thrown = false;
    try { fp.get("ftp://host/dir/sub")->size(); }
    catch (const ErrorRemoteOperation&) {}
    catch (const FileError& e)
    {
        thrown = true;
        t.checkContains(e.toString(), L"folder", "reason names the folder");
    }
    t.check(thrown, "size() of a folder is a permanent error");

    thrown = false;
    try { fp.get("ftp://host/dir/missing")->mtime(); }
    catch (const FileError& e)
    {
        thrown = true;
        t.checkContains(e.toString(), L"Cannot find", "missing item reported");
    }
    t.check(thrown, "mtime() of a missing item throws");
}


void testRemove(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("top/a.txt", "a");
    fp.server->addFile("top/x/y/b.txt", "b");
    fp.server->addFolder("top/x/empty");
    fp.server->addFile("keep.txt", "k");

    fp.get("ftp://host/top")->removeObject();

    t.check(fp.server->files.size() == 1 && fp.server->files.contains("keep.txt"), "only sibling file left");
    t.check(fp.server->folders.empty(), "all folders removed, including the target");
    t.check(!fp.get("ftp://host/top")->exists(), "removed folder does not exist");
    t.check(!fp.get("ftp://host/top/x/y/b.txt")->exists(), "nested file below removed folder does not exist");
    t.check(!fp.get("ftp://host/top/x/empty")->exists(), "empty folder below removed folder does not exist");

    fp.get("ftp://host/keep.txt")->removeObject();
    t.check(fp.server->files.empty(), "single file removed");

    bool thrown = false;
    try { fp.get("ftp://host/keep.txt")->removeObject(); }
    catch (const ErrorRemoteOperation&) {}
    catch (const FileError&) { thrown = true; }
    t.check(thrown, "removing a missing item is a permanent error");
}


void testSymlinkToFile(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;
    fp.server->addFile("data/x.txt", "12345");
    fp.server->addSymlink("a/lnk", "data/x.txt");

    t.check(fp.get("ftp://host/a/lnk")->exists(), "file link exists");
    t.check(fp.get("ftp://host/a/lnk")->size() == 5, "size of the link target");

    const Zstring outPath = appendPath(tmp.getPath(), Zstr("lnk.txt"));
    fp.get("ftp://host/a/lnk", outPath)->retrieveObject();
    t.check(getFileContent(outPath) == "12345", "file link retrieved as file");

    const Zstring dstPath = appendPath(tmp.getPath(), Zstr("dst"));
    fp.get("ftp://host/a", dstPath)->retrieveObject();
    t.check(getFileContent(appendPath(dstPath, Zstr("lnk"))) == "12345", "file link inside folder retrieved as file");

    fp.get("ftp://host/a/lnk")->removeObject();
    t.check(!fp.server->symlinks.contains("a/lnk"), "link removed");
    t.check(fp.server->files.contains("data/x.txt"), "link target untouched");
}


void testSymlinkToFolder(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;
    fp.server->addFile("b/y.txt", "yy");
    fp.server->addFile("a/z.txt", "z");
    fp.server->addSymlink("a/dl", "b");

    t.check(fp.get("ftp://host/a/dl")->exists(), "folder link exists");
    t.check(fp.get("ftp://host/a/dl/y.txt")->exists(), "item below folder link exists");

    bool thrown = false;
    try { fp.get("ftp://host/a/dl")->size(); }
    catch (const FileError&) { thrown = true; }
    t.check(thrown, "size() of a folder link is an error");

    fetchExtraLog(); //start clean
    const Zstring dstPath = appendPath(tmp.getPath(), Zstr("dst"));
    fp.get("ftp://host/a", dstPath)->retrieveObject();
    t.check(getFileContent(appendPath(dstPath, Zstr("z.txt"))) == "z", "regular file next to folder link retrieved");
    t.check(!getItemTypeIfExists(appendPath(dstPath, Zstr("dl"))), "linked folder inside the tree is not descended");
    t.check(containsWarning(fetchExtraLog(), "/a/dl"), "skipped folder link is logged");

    const Zstring linkDstPath = appendPath(tmp.getPath(), Zstr("linked"));
    fp.get("ftp://host/a/dl", linkDstPath)->retrieveObject();
    t.check(getFileContent(appendPath(linkDstPath, Zstr("y.txt"))) == "yy", "folder link given as query is followed");

    fp.get("ftp://host/a/dl")->removeObject();
    t.check(!fp.server->symlinks.contains("a/dl"), "folder link removed");
    t.check(fp.server->files.contains("b/y.txt") && fp.server->folders.contains("b"), "linked folder content untouched");
}


void testSymlinkLoop(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;
    fp.server->addFile("a/f", "f");
    fp.server->addSymlink("a/loop", "a"); //e.g. "pub -> ." on public mirrors
    fp.server->maxCommands = 200;

    const Zstring dstPath = appendPath(tmp.getPath(), Zstr("dst"));
    fp.get("ftp://host/a", dstPath)->retrieveObject();

    t.check(getFileContent(appendPath(dstPath, Zstr("f"))) == "f", "file next to loop retrieved");
    t.check(countLocalItems(dstPath) == 1, "loop not followed");

    fp.get("ftp://host/a")->removeObject();
    t.check(fp.server->symlinks.empty() && fp.server->files.empty() && fp.server->folders.empty(), "folder with loop removed");
}


void testBrokenSymlink(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;
    fp.server->addFile("a/f", "f");
    fp.server->addSymlink("a/broken", "nowhere");

    t.check(!fp.get("ftp://host/a/broken")->exists(), "broken link does not exist");

    fetchExtraLog(); //start clean
    const Zstring dstPath = appendPath(tmp.getPath(), Zstr("dst"));
    fp.get("ftp://host/a", dstPath)->retrieveObject();
    t.check(getFileContent(appendPath(dstPath, Zstr("f"))) == "f", "valid file next to broken link retrieved");
    t.check(countLocalItems(dstPath) == 1, "broken link skipped");
    t.check(containsWarning(fetchExtraLog(), "/a/broken"), "broken link is logged");

    fp.get("ftp://host/a/broken")->removeObject();
    t.check(fp.server->symlinks.empty(), "broken link removed");
}


void testLocalSymlinksOnStore(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;

    const Zstring srcPath = appendPath(tmp.getPath(), Zstr("src"));
    createDirectoryIfMissingRecursion(srcPath);
    setFileContent(appendPath(srcPath, Zstr("f.txt")), "local");
    t.check(::symlink(".",       appendPath(srcPath, Zstr("loop")).c_str()) == 0, "create local loop");
    t.check(::symlink("f.txt",   appendPath(srcPath, Zstr("flink")).c_str()) == 0, "create local file link");
    t.check(::symlink("nowhere", appendPath(srcPath, Zstr("broken")).c_str()) == 0, "create local broken link");

    fetchExtraLog(); //start clean
    fp.get("ftp://host/up", srcPath)->storeObject();

    t.check(fp.server->files.size() == 2 && fp.server->files["up/f.txt"] == "local" && fp.server->files["up/flink"] == "local",
            "files and file links uploaded");
    t.check(fp.server->folders == std::set<Zstring> {"up"}, "linked folder not uploaded");
    const ErrorLog log = fetchExtraLog();
    t.check(containsWarning(log, "loop") && containsWarning(log, "broken"), "skipped local links are logged");
}


void testConcurrentUseOfOneObject(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("dir/f.txt", "12345");

    const std::unique_ptr<FtpStorageObject> so = fp.get("ftp://host/dir/f.txt");

    std::atomic<int> okCount{0};
    {
        std::vector<std::thread> workers;
        for (int i = 0; i < 8; ++i)
            workers.emplace_back([&]
        {
            try
            {
                for (int j = 0; j < 10; ++j)
                    if (so->exists() && so->size() == 5)
                        ++okCount;
            }
            catch (const FileError&) {}
        });
        for (std::thread& worker : workers)
            worker.join();
    }
    t.check(okCount == 80, "same object used from several threads");
    t.check(fp.server->loginCount == 1, "one session shared by all threads");
}


void testTransientFailuresAreRetried(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;
    fp.server->addFile("f.txt", "payload");

    fetchExtraLog(); //start clean
    fp.server->transientFailures = 2;

    const Zstring outPath = appendPath(tmp.getPath(), Zstr("f.txt"));
    fp.get("ftp://host/f.txt", outPath)->retrieveObject();

    t.check(getFileContent(outPath) == "payload", "retrieved after reconnect");
    t.check(fp.server->loginCount == 3, "broken connection re-established per retry");
    t.check(!fetchExtraLog().empty(), "retries were logged");

    fp.server->ftpErrorFailures = 1; //FTP 450: transient
    t.check(fp.get("ftp://host/f.txt")->size() == 7, "FTP 4xx is retried");
}


void testPermanentFailureIsNotRetried(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("f.txt", "payload");
    t.check(fp.get("ftp://host/f.txt")->exists(), "connected");

    fp.server->ftpErrorFailures = 1;
    fp.server->ftpErrorCode = 530;
    const int commandsBefore = fp.server->commandCount;

    bool thrown = false;
    try { fp.get("ftp://host/f.txt")->size(); }
    catch (const ErrorRemoteOperation&) {}
    catch (const FileError& e)
    {
        thrown = true;
        t.checkContains(e.toString(), L"530", "FTP error code in details");
    }
    t.check(thrown, "FTP 5xx surfaces immediately");
    t.check(fp.server->commandCount == commandsBefore + 1, "no retry for permanent errors");
}


void testBrokenDownloadLeavesNoPartialFile(TestContext& t)
{
    FakeProvider fp;
    TempFolder tmp;
    fp.server->addFile("big.bin", "0123456789abcdefghij");
    fp.server->breakDownloadMidway = true;

    const Zstring outPath = appendPath(tmp.getPath(), Zstr("big.bin"));

    bool thrown = false;
    try { fp.get("ftp://host/big.bin", outPath, RetryPolicy{1, std::chrono::milliseconds(1), 2})->retrieveObject(); }
    catch (const ErrorRemoteOperation& e)
    {
        thrown = true;
        t.checkContains(e.toString(), L"1 attempt", "exhausted after single attempt");
    }
    t.check(thrown, "broken transfer without retry budget throws ErrorRemoteOperation");
    t.check(countLocalItems(tmp.getPath()) == 0, "neither target nor temporary file left behind");

    fp.server->breakDownloadMidway = true;
    fp.get("ftp://host/big.bin", outPath)->retrieveObject();
    t.check(getFileContent(outPath) == "0123456789abcdefghij", "retry delivers the complete file");
    t.check(countLocalItems(tmp.getPath()) == 1, "only the target file exists");
}


void testQueryHandling(TestContext& t)
{
    FakeProvider fp;
    t.check(fp.provider.createStorageObject("ftp://user@host:2121/a/b.txt", Zstring())->localSuffix() == "user@host:2121/a/b.txt", "local suffix: netloc + path");
    t.check(fp.get("ftps://host/a/b.txt")->localSuffix() == "host/a/b.txt", "local suffix without port");

    bool thrown = false;
    try { fp.provider.createStorageObject("http://host/a/b.txt", Zstring()); }
    catch (const ErrorInvalidQuery&) { thrown = true; }
    t.check(thrown, "invalid query rejected on construction");
    t.check(fp.server->loginCount == 0, "construction does not connect");
}


void testEmptyHostFailsOnConnect(TestContext& t)
{
    StorageProvider provider{StorageProviderSettings()}; //real FTP sessions: fail before any network access
    const std::unique_ptr<FtpStorageObject> so = provider.createStorageObject("ftp:///file.txt", Zstring());
    t.check(so->getParsedQuery().endpoint.hostname.empty(), "empty host name accepted");

    bool thrown = false;
    try { so->exists(); }
    catch (const ErrorRemoteOperation&) {}
    catch (const FileError& e)
    {
        thrown = true;
        t.checkContains(e.toString(), L"Server name must not be empty", "reason names the missing server");
    }
    t.check(thrown, "empty host name is a permanent error on connect");
}
}


int main()
{
    TestContext t;
    try
    {
        testStoreAndRetrieveTree(t);
        testStoreSingleFileCreatesParents(t);
        testAttributes(t);
        testRemove(t);
        testSymlinkToFile(t);
        testSymlinkToFolder(t);
        testSymlinkLoop(t);
        testBrokenSymlink(t);
        testLocalSymlinksOnStore(t);
        testConcurrentUseOfOneObject(t);
        testTransientFailuresAreRetried(t);
        testPermanentFailureIsNotRetried(t);
        testBrokenDownloadLeavesNoPartialFile(t);
        testQueryHandling(t);
        testEmptyHostFailsOnConnect(t);
    }
    catch (const FileError& e)
    {
        t.check(false, "unexpected error: " + utfTo<std::string>(e.toString()));
    }

    if (t.failures == 0)
        std::cout << "storage_object_test: OK\n";
    return t.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
