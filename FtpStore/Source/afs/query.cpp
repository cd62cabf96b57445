// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "query.h"
#include "ftp.h"

using namespace zen;
using namespace fst;


namespace
{
const wchar_t invalidQueryReason[] = L"Query does not start with ftp:// or ftps:// or does not contain a path to a file or directory.";


//'?' and '#' only end the path outside of wildcard braces: "{sample,a?b}" is opaque to us
size_t findPathEnd(const std::string_view& str)
{
    int braceLevel = 0;
    for (size_t i = 0; i < str.size(); ++i)
        switch (str[i])
        {
            case '{':
                ++braceLevel;
                break;
            case '}':
                if (braceLevel > 0)
                    --braceLevel;
                break;
            case '?':
            case '#':
                if (braceLevel == 0)
                    return i;
                break;
        }
    return str.size();
}


struct QueryParts
{
    Zstring scheme;
    Zstring netloc;
    Zstring path;
};

//split without validation, similar to RFC 3986 generic syntax
QueryParts splitQuery(const std::string& query)
{
    QueryParts parts;

    const size_t posSchemeEnd = query.find("://");
    if (posSchemeEnd == std::string::npos)
        return parts;

    parts.scheme = query.substr(0, posSchemeEnd);
    for (Zchar& c : parts.scheme)
        c = asciiToLower(c);

    const std::string_view rest = std::string_view(query).substr(posSchemeEnd + 3);
    const std::string_view restNoQuery = rest.substr(0, findPathEnd(rest));

    const size_t posPath = restNoQuery.find('/');
    if (posPath == std::string_view::npos)
        parts.netloc = restNoQuery;
    else
    {
        parts.netloc = restNoQuery.substr(0, posPath);
        parts.path   = restNoQuery.substr(posPath);
    }
    return parts;
}


//"host", "host:2121", "[::1]:2121"; std::nullopt on bad port
std::optional<EndpointKey> parseNetloc(const Zstring& netloc, Protocol protocol)
{
    const Zstring hostPort = afterLast(netloc, Zstr('@'), IfNotFoundReturn::all); //strip user info

    EndpointKey key;
    key.protocol = protocol;
    key.port = DEFAULT_PORT_FTP;

    Zstring portStr;
    if (startsWith(hostPort, Zstr('['))) //IPv6 literal
    {
        const size_t posEnd = hostPort.find(Zstr(']'));
        if (posEnd == Zstring::npos)
            return {};
        key.hostname = hostPort.substr(1, posEnd - 1);

        const Zstring tail = hostPort.substr(posEnd + 1);
        if (!tail.empty())
        {
            if (!startsWith(tail, Zstr(':')))
                return {};
            portStr = tail.substr(1);
        }
    }
    else
    {
        key.hostname = beforeLast(hostPort, Zstr(':'), IfNotFoundReturn::all);
        portStr      = afterLast (hostPort, Zstr(':'), IfNotFoundReturn::none);
    }

    if (!portStr.empty()) //"host:" => default port
    {
        if (portStr.size() > 5 || !std::all_of(portStr.begin(), portStr.end(), [](Zchar c) { return isDigit(c); }))
            return {};

        key.port = stringTo<int>(portStr);
        if (key.port > 65535)
            return {};
    }
    return key;
}
}


QueryValidationResult fst::isValidQuery(const std::string& query)
{
    const QueryParts parts = splitQuery(query);

    if ((parts.scheme != Zstr("ftp") && parts.scheme != Zstr("ftps")) || parts.path.empty())
        return {false, query, invalidQueryReason};

    const std::optional<EndpointKey> key = parseNetloc(parts.netloc, parts.scheme == Zstr("ftps") ? Protocol::secure : Protocol::plain);
    if (!key)
        return {false, query, replaceCpy<std::wstring>(_("Invalid port number in %x."), L"%x", fmtPath(parts.netloc))};

    return {true, query, L""};
}


ParsedQuery fst::parseQuery(const std::string& query) //throw ErrorInvalidQuery
{
    if (const QueryValidationResult res = isValidQuery(query);
        !res.valid)
        throw ErrorInvalidQuery(replaceCpy<std::wstring>(_("Invalid FTP query %x."), L"%x", fmtPath(query)), res.reason);

    const QueryParts parts = splitQuery(query);

    ParsedQuery pq;
    pq.scheme = parts.scheme;
    pq.netloc = parts.netloc;
    pq.path   = parts.path;
    pq.endpoint = *parseNetloc(parts.netloc, parts.scheme == Zstr("ftps") ? Protocol::secure : Protocol::plain); //validated above
    return pq;
}


std::string fst::getQueryNetloc(const std::string& query)
{
    return splitQuery(query).netloc;
}


std::string fst::formatQuery(const ParsedQuery& pq, const Zstring& path)
{
    return pq.scheme + Zstr("://") + pq.netloc + (startsWith(path, Zstr('/')) ? Zstr("") : Zstr("/")) + path;
}


Zstring fst::getLiteralPathPrefix(const Zstring& path)
{
    const size_t posWildcard = path.find(Zstr('{'));
    if (posWildcard == Zstring::npos)
        return path;

    const Zstring prefix = path.substr(0, posWildcard);
    if (endsWith(prefix, Zstr('/')))
        return prefix;

    return beforeLast(prefix, Zstr('/'), IfNotFoundReturn::none) + (contains(prefix, Zstr('/')) ? Zstr("/") : Zstr(""));
}
