// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef CURL_WRAP_H_2879058325032785032789645
#define CURL_WRAP_H_2879058325032785032789645

#include <zen/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace zen
{
//ref-counted: first call runs curl_global_init(), last matching tear down runs curl_global_cleanup()
void libcurlInit(); //throw SysError
void libcurlTearDown();


//RAII for libcurlInit()/libcurlTearDown(): keep alive as long as any easy handle exists
class LibcurlInitCookie
{
public:
    LibcurlInitCookie() { libcurlInit(); } //throw SysError
    ~LibcurlInitCookie() { libcurlTearDown(); }

private:
    LibcurlInitCookie           (const LibcurlInitCookie&) = delete;
    LibcurlInitCookie& operator=(const LibcurlInitCookie&) = delete;
};


struct CurlOption
{
    template <class T>
    CurlOption(CURLoption o, T val) : option(o), value(static_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    template <class T>
    CurlOption(CURLoption o, T* val) : option(o), value(reinterpret_cast<uint64_t>(val)) { static_assert(sizeof(val) <= sizeof(value)); }

    CURLoption option = CURLOPT_LASTENTRY;
    uint64_t value = 0;
};


std::wstring formatCurlStatusCode(CURLcode sc);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_2879058325032785032789645
