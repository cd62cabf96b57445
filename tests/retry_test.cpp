// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <algorithm>
#include <zen/extra_log.h>
#include <FtpStore/Source/afs/retry.h>
#include "test_context.h"

using namespace zen;
using namespace fst;


namespace
{
const RetryPolicy fastPolicy{3, std::chrono::milliseconds(1), 2};

const std::wstring operationMsg = L"Cannot do the thing.";


size_t countWarnings(const ErrorLog& log)
{
    return std::count_if(log.begin(), log.end(), [](const LogEntry& entry) { return entry.type == MSG_TYPE_WARNING; });
}


void testSucceedsAfterTransientFailures(TestContext& t)
{
    fetchExtraLog(); //start clean

    int attempts = 0;
    const int result = runWithRetry([&]
    {
        if (++attempts < 3)
            throw SysErrorTransient(L"Connection reset by peer.");
        return 42;
    }, operationMsg, isTransientRemoteError, fastPolicy);

    t.check(result == 42, "result of successful attempt is returned");
    t.check(attempts == 3, "two retries, then success");
    t.check(countWarnings(fetchExtraLog()) == 2, "each retry logged as warning");
}


void testExhaustionThrowsTypedError(TestContext& t)
{
    int attempts = 0;
    bool thrown = false;
    try
    {
        runWithRetry([&] { ++attempts; throw SysErrorTransient(L"Connection timed out."); }, operationMsg, isTransientRemoteError, fastPolicy);
    }
    catch (const ErrorRemoteOperation& e)
    {
        thrown = true;
        t.checkContains(e.toString(), operationMsg, "message carries the operation");
        t.checkContains(e.toString(), L"3 attempts", "message states the attempt count");
        t.checkContains(e.toString(), L"Connection timed out.", "details carry the last failure");
    }
    t.check(thrown, "exhausted retries throw ErrorRemoteOperation");
    t.check(attempts == 3, "bounded by maxAttempts");
}


void testPermanentErrorIsNotRetried(TestContext& t)
{
    int attempts = 0;
    bool thrownFileError = false;
    bool thrownRemoteOp = false;
    try
    {
        runWithRetry([&] { ++attempts; throw SysErrorPassword(L"530 Login incorrect."); }, operationMsg, isTransientRemoteError, fastPolicy);
    }
    catch (const ErrorRemoteOperation&) { thrownRemoteOp = true; }
    catch (const FileError& e)
    {
        thrownFileError = true;
        t.checkContains(e.toString(), L"530 Login incorrect.", "permanent error keeps its details");
    }
    t.check(attempts == 1, "permanent error consumes no retry budget");
    t.check(thrownFileError && !thrownRemoteOp, "permanent error surfaces as plain FileError");
}


void testFtpStatusClassification(TestContext& t)
{
    t.check( isTransientRemoteError(SysErrorTransient(L"")), "connection errors are transient");
    t.check( isTransientRemoteError(SysErrorFtpProtocol(L"", 421)), "FTP 421 is transient");
    t.check( isTransientRemoteError(SysErrorFtpProtocol(L"", 450)), "FTP 450 is transient");
    t.check(!isTransientRemoteError(SysErrorFtpProtocol(L"", 550)), "FTP 550 is permanent");
    t.check(!isTransientRemoteError(SysErrorFtpProtocol(L"", 530)), "FTP 530 is permanent");
    t.check(!isTransientRemoteError(SysErrorPassword(L"")), "login denied is permanent");
    t.check(!isTransientRemoteError(SysError(L"")), "plain SysError is permanent");

    int attempts = 0;
    try
    {
        runWithRetry([&] { ++attempts; throw SysErrorFtpProtocol(L"550 Not found.", 550); }, operationMsg, isTransientRemoteError, fastPolicy);
    }
    catch (const FileError&) {}
    t.check(attempts == 1, "FTP 5xx is re-raised immediately");
}


void testFileErrorPassesThrough(TestContext& t)
{
    int attempts = 0;
    bool thrown = false;
    try
    {
        runWithRetry([&] { ++attempts; throw ErrorTargetExisting(L"Local failure."); }, operationMsg, isTransientRemoteError, fastPolicy);
    }
    catch (const ErrorTargetExisting& e)
    {
        thrown = true;
        t.check(e.toString() == L"Local failure.", "local error unchanged");
    }
    t.check(thrown && attempts == 1, "FileError is neither retried nor wrapped");
}


void testCustomClassifier(TestContext& t)
{
    int attempts = 0;
    try
    {
        runWithRetry([&] { ++attempts; throw SysError(L"Flaky."); }, operationMsg, [](const SysError&) { return true; }, fastPolicy);
    }
    catch (const ErrorRemoteOperation&) {}
    t.check(attempts == 3, "classifier decides what is transient");
}


void testBackoffDelays(TestContext& t)
{
    t.check(getRetryDelay(DEFAULT_RETRY_POLICY, 1) == std::chrono::milliseconds(1000), "first delay");
    t.check(getRetryDelay(DEFAULT_RETRY_POLICY, 2) == std::chrono::milliseconds(2000), "doubling");
    t.check(getRetryDelay(DEFAULT_RETRY_POLICY, 4) == std::chrono::milliseconds(8000), "doubling again");
    t.check(DEFAULT_RETRY_POLICY.maxAttempts == 5, "default retry bound");
}
}


int main()
{
    TestContext t;
    testSucceedsAfterTransientFailures(t);
    testExhaustionThrowsTypedError(t);
    testPermanentErrorIsNotRetried(t);
    testFtpStatusClassification(t);
    testFileErrorPassesThrough(t);
    testCustomClassifier(t);
    testBackoffDelays(t);

    if (t.failures == 0)
        std::cout << "retry_test: OK\n";
    return t.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
