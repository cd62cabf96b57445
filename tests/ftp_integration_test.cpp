// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <zen/extra_log.h>
#include <zen/file_io.h>
#include <FtpStore/Source/afs/storage_provider.h>
#include "test_context.h"

using namespace zen;
using namespace fst;

/*  runs against a live server, e.g. vsftpd or pure-ftpd in a container:

        FTPSTORE_IT_QUERY_BASE=ftp://localhost:2121/ftpstore_it   writable folder, deleted afterwards
        FTPSTORE_USERNAME=...
        FTPSTORE_PASSWORD=...

    skipped (exit code 77) if FTPSTORE_IT_QUERY_BASE is not set    */
namespace
{
const int EXIT_SKIPPED = 77;


void testRoundTrip(TestContext& t, StorageProvider& provider, const std::string& queryBase, const Zstring& tmpPath)
{
    const Zstring srcPath = appendPath(tmpPath, Zstr("src"));
    createDirectoryIfMissingRecursion(appendPath(srcPath, Zstr("sub")));
    createDirectoryIfMissingRecursion(appendPath(srcPath, Zstr("empty")));
    setFileContent(appendPath(srcPath, Zstr("a.txt")), "alpha");
    setFileContent(appendPath(srcPath, Zstr("sub/b.txt")), std::string(300000, 'b')); //several transfer blocks

    const std::unique_ptr<FtpStorageObject> tree = provider.createStorageObject(queryBase + "/tree", srcPath);
    t.check(!tree->exists(), "fresh target does not exist");
    tree->storeObject();
    t.check(tree->exists(), "folder stored");

    const std::unique_ptr<FtpStorageObject> fileA = provider.createStorageObject(queryBase + "/tree/a.txt", Zstring());
    t.check(fileA->exists(), "file stored");
    t.check(fileA->size() == 5, "file size");
    t.check(fileA->mtime() > 0, "modification time");

    const std::unique_ptr<FtpStorageObject> glob = provider.createStorageObject(queryBase + "/tree/{name}", Zstring());
    const std::vector<std::string> matches = glob->listCandidateMatches();
    t.check(matches.size() == 3, "two files and one empty folder");

    const Zstring dstPath = appendPath(tmpPath, Zstr("dst"));
    provider.createStorageObject(queryBase + "/tree", dstPath)->retrieveObject();
    t.check(getFileContent(appendPath(dstPath, Zstr("a.txt"))) == "alpha", "file retrieved");
    t.check(getFileContent(appendPath(dstPath, Zstr("sub/b.txt"))) == std::string(300000, 'b'), "large file retrieved");
    t.check(getItemTypeIfExists(appendPath(dstPath, Zstr("empty"))) == ItemType::folder, "empty folder retrieved");

    tree->removeObject();
    t.check(!tree->exists(), "folder removed recursively");
}
}


int main()
{
    const std::optional<Zstring> queryBase = getEnvironmentVar(Zstr("FTPSTORE_IT_QUERY_BASE"));
    if (!queryBase || queryBase->empty())
    {
        std::cout << "ftp_integration_test: skipped, FTPSTORE_IT_QUERY_BASE not set\n";
        return EXIT_SKIPPED;
    }

    TestContext t;
    try
    {
        StorageProvider provider(readSettingsFromEnv()); //throw FileError
        TempFolder tmp;

        Zstring base = *queryBase;
        if (endsWith(base, Zstr('/')))
            base.pop_back();

        testRoundTrip(t, provider, base, tmp.getPath());
    }
    catch (const FileError& e)
    {
        t.check(false, "unexpected error: " + utfTo<std::string>(e.toString()));
    }

    for (const LogEntry& entry : fetchExtraLog())
        std::cout << formatMessage(entry) << '\n';

    if (t.failures == 0)
        std::cout << "ftp_integration_test: OK\n";
    return t.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
