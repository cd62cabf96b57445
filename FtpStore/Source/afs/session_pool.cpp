// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "session_pool.h"

using namespace zen;
using namespace fst;


namespace
{
std::wstring formatEndpoint(const EndpointKey& key)
{
    return utfTo<std::wstring>(getSchemeName(key.protocol) + Zstr("://") + key.hostname + Zstr(':') + numberTo<Zstring>(key.port));
}
}


bool Session::closeIfIdle(std::chrono::steady_clock::duration maxIdleTime)
{
    std::unique_lock dummy(lockSession_, std::try_to_lock);
    if (!dummy.owns_lock()) //busy => not idle
        return false;

    if (!connected_ || std::chrono::steady_clock::now() < lastUseTime_ + maxIdleTime)
        return false;

    remote_->closeConnection();
    connected_ = false;
    return true;
}


ConnectionPool::ConnectionPool(const SessionFactory& sessionFactory, bool runIdleCleaner) : sessionFactory_(sessionFactory)
{
    if (runIdleCleaner)
        sessionCleaner_ = InterruptibleThread([this]
    {
        setCurrentThreadName(Zstr("Session Cleaner[FTP]"));
        runIdleSessionCleanUp(); //throw ThreadStopRequest
    });
}


std::shared_ptr<Session> ConnectionPool::getConnection(const EndpointKey& key) //throw SysError
{
    Protected<SessionSlot>* slot = nullptr;

    sessionsByKey_.access([&](SessionsByKey& sessions)
    {
        slot = &sessions[key]; //get or create
    });
    static_assert(std::is_same_v<SessionsByKey, std::map<EndpointKey, Protected<SessionSlot>>>, "require std::map so that the pointers we return remain stable");

    //create-if-absent under the *per-key* lock: other keys keep going during a slow handshake
    return slot->access([&](SessionSlot& s)
    {
        if (!s.session)
        {
            std::unique_ptr<RemoteSession> remote = sessionFactory_(key); //throw SysError
            remote->testConnection(); //throw SysError => nothing stored

            s.session = std::make_shared<Session>(std::move(remote));
            logExtraInfo(replaceCpy(_("Connected to %x."), L"%x", formatEndpoint(key)));
        }
        return s.session;
    });
}


size_t ConnectionPool::size()
{
    size_t count = 0;
    sessionsByKey_.access([&](SessionsByKey& sessions)
    {
        for (auto& [key, slot] : sessions)
            slot.access([&](SessionSlot& s) { if (s.session) ++count; });
    });
    return count;
}


size_t ConnectionPool::closeIdleConnections(std::chrono::steady_clock::duration maxIdleTime)
{
    std::vector<std::pair<EndpointKey, Protected<SessionSlot>*>> slots; //pointers remain stable, thanks to std::map<>

    sessionsByKey_.access([&](SessionsByKey& sessions)
    {
        for (auto& [key, slot] : sessions)
            slots.emplace_back(key, &slot);
    });

    size_t closedCount = 0;
    for (const auto& [key, slot] : slots)
    {
        std::shared_ptr<Session> session;
        slot->access([&](SessionSlot& s) { session = s.session; }); //don't hold the slot lock while closing

        if (session && session->closeIfIdle(maxIdleTime))
        {
            ++closedCount;
            logExtraInfo(replaceCpy(_("Closed idle connection to %x."), L"%x", formatEndpoint(key)));
        }
    }
    return closedCount;
}


//run a dedicated clean-up thread => it's unclear when the server lets a connection time out, so we do it preemptively
//context of worker thread:
void ConnectionPool::runIdleSessionCleanUp() //throw ThreadStopRequest
{
    std::chrono::steady_clock::time_point lastCleanupTime;
    for (;;)
    {
        const auto now = std::chrono::steady_clock::now();

        if (now < lastCleanupTime + FTP_SESSION_CLEANUP_INTERVAL)
            interruptibleSleep(lastCleanupTime + FTP_SESSION_CLEANUP_INTERVAL - now); //throw ThreadStopRequest

        lastCleanupTime = std::chrono::steady_clock::now();

        closeIdleConnections(FTP_SESSION_MAX_IDLE_TIME);
    }
}
