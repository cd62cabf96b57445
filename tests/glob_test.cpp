// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <FtpStore/Source/afs/storage_provider.h>
#include "fake_remote.h"
#include "test_context.h"

using namespace zen;
using namespace fst;


namespace
{
struct FakeProvider
{
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    StorageProvider provider{StorageProviderSettings(), [server = server](const EndpointKey&)
    {
        return std::make_unique<FakeRemoteSession>(server);
    }};

    std::unique_ptr<FtpStorageObject> get(const std::string& query)
    {
        return std::make_unique<FtpStorageObject>(query, Zstring(), provider.getConnectionPool(), RetryPolicy{3, std::chrono::milliseconds(1), 2});
    }
};


void testFolderWithEmptySubfolder(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("a/f1", "1");
    fp.server->addFile("a/f2", "2");
    fp.server->addFolder("a/empty_dir");
    fp.server->addFile("b/other", "x"); //outside the prefix

    const std::unique_ptr<FtpStorageObject> so = fp.get("ftp://h/a/{name}");

    t.check(so->listCandidatePaths() == std::vector<std::string>{"/a/empty_dir", "/a/f1", "/a/f2"}, "files and empty folders below prefix");
    t.check(so->listCandidateMatches() == std::vector<std::string>{"ftp://h/a/empty_dir", "ftp://h/a/f1", "ftp://h/a/f2"}, "concrete queries");
}


void testNestedTree(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("data/2023/jan.csv", "j");
    fp.server->addFile("data/2023/q2/apr.csv", "a");
    fp.server->addFolder("data/2024");
    fp.server->addFile("data/readme", "r");

    const std::unique_ptr<FtpStorageObject> so = fp.get("ftps://user@h:2121/data/{year}/{month}.csv");

    t.check(so->listCandidatePaths() == std::vector<std::string>{"/data/2023/jan.csv", "/data/2023/q2/apr.csv", "/data/2024", "/data/readme"},
            "all depths, sorted");

    const std::vector<std::string> matches = so->listCandidateMatches();
    t.check(!matches.empty() && matches[0] == "ftps://user@h:2121/data/2023/jan.csv", "scheme and netloc preserved");
}


void testPartialComponentPrefix(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("logs/app-1.log", "1");
    fp.server->addFile("logs/app-2.log", "2");

    //"app-{n}.log": incomplete component is not part of the literal prefix
    t.check(fp.get("ftp://h/logs/app-{n}.log")->listCandidatePaths() == std::vector<std::string>{"/logs/app-1.log", "/logs/app-2.log"},
            "prefix cut at last separator before wildcard");
}


void testFilePrefix(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("single.txt", "s");

    t.check(fp.get("ftp://h/single.txt")->listCandidatePaths() == std::vector<std::string>{"/single.txt"}, "file prefix: itself");
}


void testMissingPrefix(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("a/f1", "1");

    t.check(fp.get("ftp://h/nope/{x}")->listCandidatePaths().empty(), "missing prefix: no candidates");
    t.check(fp.get("ftp://h/a/missing/deeper/{x}")->listCandidatePaths().empty(), "missing nested prefix: no candidates");
}


void testEmptyPrefixFolder(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFolder("void");

    t.check(fp.get("ftp://h/void/{x}")->listCandidatePaths() == std::vector<std::string>{"/void"}, "empty prefix folder represents itself");
}


void testSymlinksAreLeafCandidates(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("a/f", "1");
    fp.server->addFile("b/deep/x", "x");
    fp.server->addSymlink("a/loop", "a");
    fp.server->addSymlink("a/dl", "b");
    fp.server->addSymlink("a/fl", "a/f");
    fp.server->addSymlink("a/broken", "nowhere");
    fp.server->maxCommands = 200;

    t.check(fp.get("ftp://h/a/{x}")->listCandidatePaths() == std::vector<std::string>{"/a/broken", "/a/dl", "/a/f", "/a/fl", "/a/loop"},
            "links listed, never descended; broken link does not abort the walk");
}


void testPrefixIsFolderLink(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("b/x", "x");
    fp.server->addSymlink("a", "b");

    t.check(fp.get("ftp://h/a/{x}")->listCandidatePaths() == std::vector<std::string>{"/a/x"}, "prefix folder link is followed");
}


void testRootPrefix(TestContext& t)
{
    FakeProvider fp;
    fp.server->addFile("top.txt", "t");
    fp.server->addFile("d/in.txt", "i");

    t.check(fp.get("ftp://h/{x}")->listCandidatePaths() == std::vector<std::string>{"/d/in.txt", "/top.txt"}, "whole server below root");
}
}


int main()
{
    TestContext t;
    try
    {
        testFolderWithEmptySubfolder(t);
        testNestedTree(t);
        testPartialComponentPrefix(t);
        testFilePrefix(t);
        testMissingPrefix(t);
        testEmptyPrefixFolder(t);
        testRootPrefix(t);
        testSymlinksAreLeafCandidates(t);
        testPrefixIsFolderLink(t);
    }
    catch (const FileError& e)
    {
        t.check(false, "unexpected error: " + utfTo<std::string>(e.toString()));
    }

    if (t.failures == 0)
        std::cout << "glob_test: OK\n";
    return t.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
