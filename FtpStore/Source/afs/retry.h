// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef RETRY_H_2650918374623019485
#define RETRY_H_2650918374623019485

#include <chrono>
#include <zen/thread.h>
#include "remote.h"


namespace fst
{
struct RetryPolicy
{
    size_t maxAttempts = 5; //including the first one
    std::chrono::milliseconds initialDelay{1000};
    double backoffFactor = 2;
};
const RetryPolicy DEFAULT_RETRY_POLICY;

//retry budget exhausted
DEFINE_NEW_FILE_ERROR(ErrorRemoteOperation)

using TransientErrorClassifier = std::function<bool(const zen::SysError& e)>;

//connection-level errors and FTP 4xx: yes; login denied, FTP 5xx, everything else: no
bool isTransientRemoteError(const zen::SysError& e);

/*  run cmd() until it succeeds, or fails permanently, or runs out of attempts

    - SysError classified transient:  log warning, sleep (holding no lock!), retry
    - SysError classified permanent:  throw FileError(operationMsg, details) immediately
    - exhausted:                      throw ErrorRemoteOperation
    - FileError and all other exceptions pass through unchanged    */
template <class Function>
auto runWithRetry(Function cmd, const std::wstring& operationMsg, //throw FileError, ErrorRemoteOperation, ThreadStopRequest, X
                  const TransientErrorClassifier& isTransient = isTransientRemoteError,
                  const RetryPolicy& policy = DEFAULT_RETRY_POLICY);








//######################## implementation ########################
std::chrono::milliseconds getRetryDelay(const RetryPolicy& policy, size_t failedAttempts);

void logRetry(const std::wstring& operationMsg, const zen::SysError& e, size_t failedAttempts, const RetryPolicy& policy);

[[noreturn]] void throwRetryExhausted(const std::wstring& operationMsg, const zen::SysError& lastError, size_t attempts); //throw ErrorRemoteOperation


template <class Function> inline
auto runWithRetry(Function cmd, const std::wstring& operationMsg, //throw FileError, ErrorRemoteOperation, ThreadStopRequest, X
                  const TransientErrorClassifier& isTransient,
                  const RetryPolicy& policy)
{
    assert(policy.maxAttempts >= 1);

    for (size_t attempt = 1;; ++attempt)
        try
        {
            return cmd(); //throw SysError, FileError, X
        }
        catch (const zen::SysError& e)
        {
            if (!isTransient(e))
                throw zen::FileError(operationMsg, e.toString());

            if (attempt >= policy.maxAttempts)
                throwRetryExhausted(operationMsg, e, attempt); //throw ErrorRemoteOperation

            logRetry(operationMsg, e, attempt, policy);
            zen::interruptibleSleep(getRetryDelay(policy, attempt)); //throw ThreadStopRequest
        }
}
}

#endif //RETRY_H_2650918374623019485
