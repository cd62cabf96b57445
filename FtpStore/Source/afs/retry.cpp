// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "retry.h"
#include <cmath>

using namespace zen;
using namespace fst;


bool fst::isTransientRemoteError(const SysError& e)
{
    if (dynamic_cast<const SysErrorTransient*>(&e))
        return true;

    if (const auto ftpError = dynamic_cast<const SysErrorFtpProtocol*>(&e))
        return 400 <= ftpError->ftpErrorCode && ftpError->ftpErrorCode < 500; //"transient negative completion reply"

    return false; //SysErrorPassword, path/encoding errors, ...
}


std::chrono::milliseconds fst::getRetryDelay(const RetryPolicy& policy, size_t failedAttempts)
{
    assert(failedAttempts >= 1);
    const double delayMs = policy.initialDelay.count() * std::pow(policy.backoffFactor, static_cast<double>(failedAttempts - 1));
    return std::chrono::milliseconds(std::llround(delayMs));
}


void fst::logRetry(const std::wstring& operationMsg, const SysError& e, size_t failedAttempts, const RetryPolicy& policy)
{
    std::wstring msg = _("Retrying operation after error:") + L' ' +
                       replaceCpy(replaceCpy(_("Attempt %x of %y, waiting %z ms."),
                                             L"%x", numberTo<std::wstring>(failedAttempts + 1)),
                                  L"%y", numberTo<std::wstring>(policy.maxAttempts));
    replace(msg, L"%z", numberTo<std::wstring>(getRetryDelay(policy, failedAttempts).count()));

    logExtraWarning(msg + L'\n' + operationMsg + L'\n' + e.toString());
}


void fst::throwRetryExhausted(const std::wstring& operationMsg, const SysError& lastError, size_t attempts) //throw ErrorRemoteOperation
{
    throw ErrorRemoteOperation(operationMsg,
                               replaceCpy(_P("Giving up after %x attempt.", "Giving up after %x attempts.", attempts), L"%x", numberTo<std::wstring>(attempts)) +
                               L'\n' + lastError.toString());
}
