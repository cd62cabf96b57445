// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef EXTRA_LOG_H_4839201756302918476
#define EXTRA_LOG_H_4839201756302918476

#include <functional>
#include "error_log.h"
#include "thread.h"


/*  library-wide log for messages that have no caller to report to, e.g.
    - errors while an exception is in flight
    - clean-up errors
    - retries of remote operations and session life-cycle events

    the host drains it via fetchExtraLog() or receives the remainder on shutdown via initExtraLog()    */
namespace zen
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        assert(!reportOutstandingLog_);
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void log(const std::wstring& msg, MessageType type) { logMsg(log_, msg, type); }

private:
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};


inline constinit Global<Protected<ExtraLog>> globalExtraLog;

template <class Function>
void accessExtraLog(Function fun)
{
    globalExtraLog.setOnce([] { return std::make_unique<Protected<ExtraLog>>(); });

    if (auto protExtraLog = impl::globalExtraLog.get())
        protExtraLog->access([&](ExtraLog& log) { fun(log); });
    else
        assert(false); //access after global shutdown!?
}
}


inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline void logExtraError  (const std::wstring& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_ERROR  ); }); } //nothrow!
inline void logExtraWarning(const std::wstring& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_WARNING); }); } //
inline void logExtraInfo   (const std::wstring& msg) { impl::accessExtraLog([&](impl::ExtraLog& el) { el.log(msg, MSG_TYPE_INFO   ); }); } //
}

#endif //EXTRA_LOG_H_4839201756302918476
