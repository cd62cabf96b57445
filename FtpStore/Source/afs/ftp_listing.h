// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_LISTING_H_3850127946023857120
#define FTP_LISTING_H_3850127946023857120

#include "remote.h"


//parsing of FTP server responses: independent from libcurl
namespace fst
{
//Extensions to FTP: https://tools.ietf.org/html/rfc3659
//FTP commands:      https://en.wikipedia.org/wiki/List_of_FTP_commands

std::vector<std::string_view> splitFtpResponse(std::string&&) = delete;
std::vector<std::string_view> splitFtpResponse(const std::string& buf); //skips empty lines

std::optional<int> getLastFtpStatusCode(const std::string& response);

std::wstring formatFtpStatus(int sc);

struct FtpFeatures
{
    bool mlsd = false;
    bool clnt = false;
    bool utf8 = false;
};
FtpFeatures parseFeatResponse(const std::string& featResponse);

//"213 1234": std::nullopt on "550 "; throw SysError on anything else
std::optional<uint64_t> parseSizeResponse(const std::string& sizeResponse); //throw SysError

//"213 20170113063314[.sss]"
time_t parseMdtmResponse(const std::string& mdtmResponse); //throw SysError

//---------------------------------------------------------------------------

//convert raw (server-encoded) item names
using FtpNameDecoder = std::function<Zstring(const std::string_view& rawName)>; //throw SysError

//"." and ".." are skipped by all parsers
std::vector<RemoteItem> parseMlsdListing   (const std::string& buf,                    const FtpNameDecoder& decodeName); //throw SysError
std::vector<RemoteItem> parseUnixListing   (const std::string& buf, time_t utcTimeNow, const FtpNameDecoder& decodeName); //throw SysError
std::vector<RemoteItem> parseWindowsListing(const std::string& buf, time_t utcTimeNow, const FtpNameDecoder& decodeName); //throw SysError

//LIST output: auto-detect Unix/DOS format
std::vector<RemoteItem> parseListListing(const std::string& buf, time_t utcTimeNow, const FtpNameDecoder& decodeName); //throw SysError
}

#endif //FTP_LISTING_H_3850127946023857120
