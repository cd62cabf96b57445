// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SESSION_POOL_H_8402716395027461839
#define SESSION_POOL_H_8402716395027461839

#include <map>
#include <zen/thread.h>
#include "endpoint.h"
#include "remote.h"


namespace fst
{
const std::chrono::seconds FTP_SESSION_MAX_IDLE_TIME   (20);
const std::chrono::seconds FTP_SESSION_CLEANUP_INTERVAL (4); //facilitate default Linux TCP keep-alive interval


//one pooled remote session: access is serialized, an FTP control connection carries one command at a time
class Session
{
public:
    explicit Session(std::unique_ptr<RemoteSession>&& remote) : remote_(std::move(remote)) { assert(remote_); }

    template <class Function>
    auto access(Function fun) //throw X
    {
        std::lock_guard dummy(lockSession_);
        ZEN_ON_SCOPE_EXIT(lastUseTime_ = std::chrono::steady_clock::now(); connected_ = true);
        return fun(*remote_); //throw X
    }

    //close network connection if unused for at least maxIdleTime: the session itself stays valid
    //returns false if busy, not idle long enough or already closed
    bool closeIfIdle(std::chrono::steady_clock::duration maxIdleTime);

private:
    Session           (const Session&) = delete;
    Session& operator=(const Session&) = delete;

    std::mutex lockSession_;
    const std::unique_ptr<RemoteSession> remote_;
    std::chrono::steady_clock::time_point lastUseTime_ = std::chrono::steady_clock::now();
    bool connected_ = true; //pool performs the handshake before handing out a session
};


using SessionFactory = std::function<std::unique_ptr<RemoteSession>(const EndpointKey& key)>; //throw SysError


/*  endpoint key -> session

    - getConnection() for the same key always returns the identical session
    - first use per key creates the session and runs the handshake: failure stores nothing
    - concurrent first use of the same key is serialized, different keys do not contend
    - slots are never removed: sessions live as long as the pool    */
class ConnectionPool
{
public:
    explicit ConnectionPool(const SessionFactory& sessionFactory, bool runIdleCleaner = true);

    std::shared_ptr<Session> getConnection(const EndpointKey& key); //throw SysError

    size_t size();

    //returns number of closed connections
    size_t closeIdleConnections(std::chrono::steady_clock::duration maxIdleTime);

private:
    ConnectionPool           (const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    struct SessionSlot
    {
        std::shared_ptr<Session> session;
    };
    using SessionsByKey = std::map<EndpointKey, zen::Protected<SessionSlot>>;

    //context of worker thread:
    void runIdleSessionCleanUp(); //throw ThreadStopRequest

    const SessionFactory sessionFactory_;

    zen::Protected<SessionsByKey> sessionsByKey_;

    zen::InterruptibleThread sessionCleaner_; //declare last: stopped before the other members go away
};
}

#endif //SESSION_POOL_H_8402716395027461839
