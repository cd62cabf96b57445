// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ENDPOINT_H_1937460218457302916
#define ENDPOINT_H_1937460218457302916

#include <functional>
#include <tuple>
#include <zen/string_tools.h>
#include <zen/zstring.h>


namespace fst
{
enum class Protocol : unsigned char
{
    plain,  //ftp://
    secure, //ftps:// (explicit FTPS: AUTH TLS on the regular port)
};

//identifies one pooled session: host names are case-insensitive
struct EndpointKey
{
    Zstring hostname;
    int port = 0;
    Protocol protocol = Protocol::plain;
};

inline
std::weak_ordering operator<=>(const EndpointKey& lhs, const EndpointKey& rhs)
{
    if (const std::weak_ordering cmp = zen::compareAsciiNoCase(lhs.hostname, rhs.hostname);
        cmp != std::weak_ordering::equivalent)
        return cmp;

    return std::tie(lhs.port, lhs.protocol) <=>
           std::tie(rhs.port, rhs.protocol);
}

inline bool operator==(const EndpointKey& lhs, const EndpointKey& rhs) { return (lhs <=> rhs) == std::weak_ordering::equivalent; }


inline
Zstring getSchemeName(Protocol protocol)
{
    return protocol == Protocol::secure ? Zstr("ftps") : Zstr("ftp");
}
}


//host name hashed case-insensitively: consistent with operator==
template <>
struct std::hash<fst::EndpointKey>
{
    size_t operator()(const fst::EndpointKey& key) const
    {
        zen::FNV1aHash<size_t> hash(zen::StringHashAsciiNoCase()(key.hostname));
        hash.add(static_cast<size_t>(key.port));
        hash.add(static_cast<size_t>(key.protocol));
        return hash.get();
    }
};

#endif //ENDPOINT_H_1937460218457302916
