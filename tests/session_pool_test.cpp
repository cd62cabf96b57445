// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include <atomic>
#include <FtpStore/Source/afs/session_pool.h>
#include "fake_remote.h"
#include "test_context.h"

using namespace zen;
using namespace fst;


namespace
{
struct CountingFactory
{
    std::shared_ptr<FakeServer> server = std::make_shared<FakeServer>();
    std::shared_ptr<std::atomic<int>> createCount = std::make_shared<std::atomic<int>>(0);
    std::chrono::milliseconds handshakeDelay{0};

    SessionFactory get() const
    {
        return [server = server, createCount = createCount, delay = handshakeDelay](const EndpointKey&)
        {
            ++*createCount;
            if (delay.count() > 0)
                std::this_thread::sleep_for(delay); //widen the race window
            return std::make_unique<FakeRemoteSession>(server);
        };
    }
};


void testSameKeySameSession(TestContext& t)
{
    CountingFactory factory;
    ConnectionPool pool(factory.get(), false /*runIdleCleaner*/);

    const EndpointKey key{"ftp.example.com", 21, Protocol::plain};

    const std::shared_ptr<Session> s1 = pool.getConnection(key);
    const std::shared_ptr<Session> s2 = pool.getConnection(key);
    const std::shared_ptr<Session> s3 = pool.getConnection({"FTP.EXAMPLE.COM", 21, Protocol::plain});

    t.check(s1 && s1 == s2, "same key returns the identical session");
    t.check(s1 == s3, "host name case does not create a new session");
    t.check(*factory.createCount == 1, "session created once");
    t.check(factory.server->loginCount == 1, "handshake on first use only");
    t.check(pool.size() == 1, "one pooled session");
}


void testDifferentKeysDifferentSessions(TestContext& t)
{
    CountingFactory factory;
    ConnectionPool pool(factory.get(), false /*runIdleCleaner*/);

    const std::shared_ptr<Session> plain  = pool.getConnection({"host", 21, Protocol::plain});
    const std::shared_ptr<Session> secure = pool.getConnection({"host", 21, Protocol::secure});
    const std::shared_ptr<Session> port   = pool.getConnection({"host", 2121, Protocol::plain});
    const std::shared_ptr<Session> other  = pool.getConnection({"other", 21, Protocol::plain});

    t.check(plain != secure && plain != port && plain != other && secure != port, "distinct keys, distinct sessions");
    t.check(*factory.createCount == 4, "one session per key");
    t.check(pool.size() == 4, "four pooled sessions");
}


void testConcurrentFirstUse(TestContext& t)
{
    CountingFactory factory;
    factory.handshakeDelay = std::chrono::milliseconds(50);
    ConnectionPool pool(factory.get(), false /*runIdleCleaner*/);

    const EndpointKey key{"busy.example.com", 21, Protocol::plain};
    const size_t threadCount = 16;

    std::vector<std::shared_ptr<Session>> results(threadCount);
    {
        std::vector<std::thread> workers;
        for (size_t i = 0; i < threadCount; ++i)
            workers.emplace_back([&, i] { results[i] = pool.getConnection(key); });

        for (std::thread& worker : workers)
            worker.join();
    }

    t.check(*factory.createCount == 1, "concurrent first use creates exactly one session");
    t.check(std::all_of(results.begin(), results.end(), [&](const std::shared_ptr<Session>& s) { return s && s == results[0]; }),
            "all threads get the identical session");
}


void testFailedHandshakeStoresNothing(TestContext& t)
{
    CountingFactory factory;
    factory.server->denyLogin = true;
    ConnectionPool pool(factory.get(), false /*runIdleCleaner*/);

    const EndpointKey key{"host", 21, Protocol::plain};

    bool thrown = false;
    try { pool.getConnection(key); }
    catch (const SysErrorPassword&) { thrown = true; }
    t.check(thrown, "login failure surfaces as SysErrorPassword");
    t.check(pool.size() == 0, "failed handshake stores nothing");

    factory.server->denyLogin = false;
    const std::shared_ptr<Session> session = pool.getConnection(key);
    t.check(session != nullptr, "next call creates a new session");
    t.check(*factory.createCount == 2, "second attempt created a fresh session");
    t.check(pool.size() == 1, "stored after successful handshake");
}


void testIdleConnectionIsClosedButSessionKept(TestContext& t)
{
    CountingFactory factory;
    ConnectionPool pool(factory.get(), false /*runIdleCleaner*/);

    const EndpointKey key{"host", 21, Protocol::plain};
    const std::shared_ptr<Session> session = pool.getConnection(key);

    t.check(pool.closeIdleConnections(std::chrono::hours(1)) == 0, "recently used session is kept open");
    t.check(pool.closeIdleConnections(std::chrono::seconds(0)) == 1, "idle connection closed");
    t.check(factory.server->closeCount == 1, "network connection closed once");
    t.check(pool.closeIdleConnections(std::chrono::seconds(0)) == 0, "already closed connection is skipped");

    t.check(pool.getConnection(key) == session, "session identity survives idle clean-up");

    session->access([](RemoteSession& remote) { remote.listFolder(RemotePath()); });
    t.check(factory.server->loginCount == 2, "transparent reconnect on next use");
}


void testBusySessionIsNotClosed(TestContext& t)
{
    CountingFactory factory;
    ConnectionPool pool(factory.get(), false /*runIdleCleaner*/);

    const std::shared_ptr<Session> session = pool.getConnection({"host", 21, Protocol::plain});

    size_t closedWhileBusy = 1;
    session->access([&](RemoteSession&)
    {
        //other thread: try_lock fails while we hold the session
        std::thread cleaner([&] { closedWhileBusy = pool.closeIdleConnections(std::chrono::seconds(0)); });
        cleaner.join();
    });
    t.check(closedWhileBusy == 0, "session in use is never closed");
}
}


int main()
{
    TestContext t;
    testSameKeySameSession(t);
    testDifferentKeysDifferentSessions(t);
    testConcurrentFirstUse(t);
    testFailedHandshakeStoresNothing(t);
    testIdleConnectionIsClosedButSessionKept(t);
    testBusySessionIsNotClosed(t);

    if (t.failures == 0)
        std::cout << "session_pool_test: OK\n";
    return t.failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
