// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_H_745895742383425326568678
#define FTP_H_745895742383425326568678

#include <memory>
#include "remote.h"


namespace fst
{
const int DEFAULT_PORT_FTP = 21; //same for explicit FTPS (AUTH TLS); only *implicit* FTPS uses 990

struct FtpLogin
{
    Zstring server;
    int port = DEFAULT_PORT_FTP;
    Zstring username; //empty: anonymous
    std::optional<Zstring> password;
    bool useTls = false;     //FTPS: encrypted control *and* data channel
    bool activeMode = false; //server connects back to us (PORT/EPRT) instead of PASV/EPSV
    //other settings not specific to FTP session:
    int timeoutSec = 10;
};

//libcurl-based FTP session; connects lazily on first command
std::unique_ptr<RemoteSession> createFtpSession(const FtpLogin& login); //throw SysError
}

#endif //FTP_H_745895742383425326568678
