// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef QUERY_H_5820147369204758136
#define QUERY_H_5820147369204758136

#include <zen/file_error.h>
#include "endpoint.h"


namespace fst
{
/*  query syntax: scheme://[user[:password]@]host[:port]/path

    - scheme: "ftp" (plain) or "ftps" (explicit FTPS); port defaults to 21 for both
    - wildcard placeholders like "{sample}" are kept verbatim
    - user info is accepted but ignored: credentials come from the provider settings    */
struct ParsedQuery
{
    EndpointKey endpoint;
    Zstring path;   //as given, e.g. "/data/{sample}.txt"
    Zstring scheme; //lower case
    Zstring netloc; //everything between "//" and the path, e.g. "user@host:2121"
};

struct QueryValidationResult
{
    bool valid = false;
    std::string query;
    std::wstring reason; //empty if valid
};

//never throws for malformed input
QueryValidationResult isValidQuery(const std::string& query);

DEFINE_NEW_FILE_ERROR(ErrorInvalidQuery)

ParsedQuery parseQuery(const std::string& query); //throw ErrorInvalidQuery

//"user@host:2121" for "ftp://user@host:2121/path"; no validation
std::string getQueryNetloc(const std::string& query);

//"scheme://netloc/path"
std::string formatQuery(const ParsedQuery& pq, const Zstring& path);

//longest wildcard-free prefix: cut at first '{', then drop the incomplete last component
//"/a/b{x}/c" -> "/a/"; "/a/{x}" -> "/a/"; "/a/b" -> "/a/b"
Zstring getLiteralPathPrefix(const Zstring& path);
}

#endif //QUERY_H_5820147369204758136
