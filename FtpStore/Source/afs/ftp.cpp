// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp.h"
#include <exception>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "ftp_listing.h"
#include <glib.h>
#include <fcntl.h>

using namespace zen;
using namespace fst;


namespace
{
constexpr ZstringView ftpPrefix = Zstr("ftp:");


enum class ServerEncoding
{
    unknown,
    utf8,
    ansi,
};


Zstring ansiToUtfEncoding(const std::string_view& str) //throw SysError
{
    if (str.empty()) return {};

    gsize bytesWritten = 0; //not including the terminating null

    GError* error = nullptr;
    ZEN_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    //https://developer.gnome.org/glib/stable/glib-Character-Set-Conversion.html#g-convert
    gchar* utfStr = ::g_convert(str.data(),    //const gchar* str
                                str.size(),    //gssize len
                                "UTF-8",       //const gchar* to_codeset
                                "LATIN1",      //const gchar* from_codeset
                                nullptr,       //gsize* bytes_read
                                &bytesWritten, //gsize* bytes_written
                                &error);       //GError** error
    if (!utfStr)
        throw SysError(formatGlibError("g_convert(" + std::string(str) + ", LATIN1 -> UTF-8)", error));
    ZEN_ON_SCOPE_EXIT(::g_free(utfStr));

    return {utfStr, bytesWritten};
}


std::string utfToAnsiEncoding(const Zstring& str) //throw SysError
{
    if (str.empty()) return {};

    //convert to pre-composed *before* attempting conversion
    gchar* strNorm = ::g_utf8_normalize(str.c_str(), str.size(), G_NORMALIZE_NFC);
    if (!strNorm)
        throw SysError(formatSystemError("g_utf8_normalize", L"", L"Conversion failed."));
    ZEN_ON_SCOPE_EXIT(::g_free(strNorm));

    gsize bytesWritten = 0;

    GError* error = nullptr;
    ZEN_ON_SCOPE_EXIT(if (error) ::g_error_free(error));

    //fails for: 1. broken UTF-8 2. not-ANSI-encodable Unicode
    gchar* ansiStr = ::g_convert(strNorm,       //const gchar* str
                                 -1,            //gssize len: null-terminated
                                 "LATIN1",      //const gchar* to_codeset
                                 "UTF-8",       //const gchar* from_codeset
                                 nullptr,       //gsize* bytes_read
                                 &bytesWritten, //gsize* bytes_written
                                 &error);       //GError** error
    if (!ansiStr)
        throw SysError(formatGlibError("g_convert(" + str + ", UTF-8 -> LATIN1)", error));
    ZEN_ON_SCOPE_EXIT(::g_free(ansiStr));

    return {ansiStr, bytesWritten};
}


bool isAsciiString(const std::string_view& str)
{
    return std::all_of(str.begin(), str.end(), [](char c) { return isAsciiChar(c); });
}


//curl error codes that indicate a broken or unreachable connection: worth a retry
bool isTransientCurlError(CURLcode rc)
{
    switch (rc)
    {
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_FTP_ACCEPT_FAILED:
        case CURLE_FTP_ACCEPT_TIMEOUT:
        case CURLE_FTP_WEIRD_PASV_REPLY:
        case CURLE_FTP_WEIRD_227_FORMAT:
        case CURLE_FTP_CANT_GET_HOST:
        case CURLE_FTP_PORT_FAILED:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_NO_CONNECTION_AVAILABLE:
        case CURLE_AGAIN:
            return true;
        default:
            return false;
    }
}


class FtpSession : public RemoteSession
{
public:
    explicit FtpSession(const FtpLogin& login) : login_(login) {} //throw SysError

    ~FtpSession()
    {
        if (easyHandle_)
            ::curl_easy_cleanup(easyHandle_);
    }

    void testConnection() override //throw SysError
    {
        /*  FEAT: there are servers that don't support this command: "550 FEAT: Operation not permitted"
            HELP, NOOP: not always implemented either
            => '*' to the rescue: as long as we get an FTP response - *any* FTP response (including 550) - the connection itself is fine!  */
        const std::string& featBuf = runSingleFtpCommand("*FEAT", false /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        for (const std::string_view& line : splitFtpResponse(featBuf))
            if (startsWith(line, "211 ") ||
                startsWith(line, "500 ") ||
                startsWith(line, "502 ") ||
                startsWith(line, "550 "))
                return;

        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(featBuf) + L')');
    }

    void closeConnection() override
    {
        if (easyHandle_)
        {
            ::curl_easy_cleanup(easyHandle_); //closes control connection: "QUIT"
            easyHandle_ = nullptr;
        }
        //socket numbers get recycled: forget what we did on the old control connection
        utf8RequestedSocket_ = CURL_SOCKET_BAD;
        binaryEnabledSocket_ = CURL_SOCKET_BAD;
    }

    std::vector<RemoteItem> listFolder(const RemotePath& folderPath) override //throw SysError
    {
        std::string rawListing;

        curl_write_callback onBytesReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& listing = *static_cast<std::string*>(callbackData);
            listing.append(buffer, size * nitems);
            return size * nitems;
        };

        std::vector<CurlOption> options =
        {
            {CURLOPT_WRITEDATA, &rawListing},
            {CURLOPT_WRITEFUNCTION, onBytesReceived},
        };
        curl_ftpmethod pathMethod = CURLFTPMETHOD_SINGLECWD;

        const bool useMlsd = getFeatures().mlsd; //throw SysError
        if (useMlsd)
        {
            options.emplace_back(CURLOPT_CUSTOMREQUEST, "MLSD");

            //some FTP servers process wildcards inside the MLSD "dirpath": http://www.proftpd.org/docs/howto/Globbing.html
            const bool pathHasWildcards =
                contains(afterFirst(folderPath.value, Zstr('['), IfNotFoundReturn::none), Zstr(']')) ||
                contains(folderPath.value, Zstr('*')) ||
                contains(folderPath.value, Zstr('?'));

            if (!pathHasWildcards)
                pathMethod = CURLFTPMETHOD_NOCWD; //faster traversal than CURLFTPMETHOD_SINGLECWD
        }
        //else: "LIST" + CURLFTPMETHOD_SINGLECWD; better not use LIST parameters: https://cr.yp.to/ftp/list.html

        perform(folderPath, true /*isDir*/, pathMethod, options, true /*requestUtf8*/); //throw SysError, SysErrorPassword, SysErrorFtpProtocol

        const FtpNameDecoder decodeName = [this](const std::string_view& rawName) { return serverToUtfEncoding(rawName); }; //throw SysError

        if (useMlsd)
            return parseMlsdListing(rawListing, decodeName); //throw SysError
        else
            return parseListListing(rawListing, std::time(nullptr), decodeName); //throw SysError
    }

    RemoteItem getSymlinkTargetInfo(const RemotePath& linkPath) override //throw SysError
    {
        /*  test for a file first: folders fail SIZE with FTP code 550
            alternative: assume folder and try traversal? NOPE: this can *succeed* for file symlinks with MLSD!   */
        RemoteItem output;
        output.itemName = getItemName(linkPath);

        //some servers return ASCII size or fail with "550 SIZE not allowed in ASCII mode"
        ensureBinaryMode(); //throw SysError

        const std::string sizeBuf = runSingleFtpCommand("*SIZE " + getServerPathInternal(linkPath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
        //don't use CURLINFO_CONTENT_LENGTH_DOWNLOAD_T: libcurl adds needless "REST 0" command!

        if (const std::optional<uint64_t> fileSize = parseSizeResponse(sizeBuf)) //throw SysError
        {
            output.fileSize = *fileSize;

            const std::string mdtmBuf = runSingleFtpCommand("MDTM " + getServerPathInternal(linkPath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
            output.modTime = parseMdtmResponse(mdtmBuf); //throw SysError
        }
        else //folder or broken link: only a folder can be listed
        {
            listFolder(linkPath); //throw SysError, SysErrorFtpProtocol(550)
            output.type = RemoteItemType::folder;
        }
        return output;
    }

    //already existing: fail
    //  vsftpd:           "550 Create directory operation failed."
    //  FileZilla Server: "550 Directory already exists"
    //  Windows IIS:      "550 Cannot create a file when that file already exists"
    void createFolder(const RemotePath& folderPath) override //throw SysError
    {
        runSingleFtpCommand("MKD " + getServerPathInternal(folderPath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
    }

    void removeFile(const RemotePath& filePath) override //throw SysError
    {
        runSingleFtpCommand("DELE " + getServerPathInternal(filePath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
    }

    void removeFolder(const RemotePath& folderPath) override //throw SysError
    {
        runSingleFtpCommand("RMD " + getServerPathInternal(folderPath), true /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol
    }

    void downloadFile(const RemotePath& filePath, //throw SysError, X
                      const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) override
    {
        std::exception_ptr exception;

        auto onBytesReceived = [&](const void* buffer, size_t bytesToWrite)
        {
            try
            {
                writeBlock(buffer, bytesToWrite); //throw X
                //[!] let's NOT use "incomplete write Posix semantics" for libcurl!
                return bytesToWrite;
            }
            catch (...) //X is rethrown below: curl's C stack must not be unwound
            {
                exception = std::current_exception();
                return bytesToWrite + 1; //signal error condition => CURLE_WRITE_ERROR
            }
        };
        curl_write_callback onBytesReceivedWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(onBytesReceived)*>(callbackData))(buffer, size * nitems); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        try
        {
            perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_WRITEDATA, &onBytesReceived},
                {CURLOPT_WRITEFUNCTION, onBytesReceivedWrapper},
                {CURLOPT_IGNORE_CONTENT_LENGTH, 1L}, //skip FTP "SIZE" command before download (=> download until actual EOF if file size changes)
            }, true /*requestUtf8*/); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

    //already existing: overwrite (vsftpd, FileZilla Server, Windows IIS)
    void uploadFile(const RemotePath& filePath, //throw SysError, X
                    const std::function<size_t(void* buffer, size_t bytesToRead)>& readBlock /*throw X*/) override
    {
        std::exception_ptr exception;

        auto getBytesToSend = [&](void* buffer, size_t bytesToRead) -> size_t
        {
            try
            {
                //libcurl calls back until 0 bytes are returned (Posix read() semantics)
                return readBlock(buffer, bytesToRead); //throw X; return "bytesToRead" bytes unless end of stream
            }
            catch (...) //X is rethrown below: curl's C stack must not be unwound
            {
                exception = std::current_exception();
                return CURL_READFUNC_ABORT; //signal error condition => CURLE_ABORTED_BY_CALLBACK
            }
        };
        curl_read_callback getBytesToSendWrapper = [](char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            return (*static_cast<decltype(getBytesToSend)*>(callbackData))(buffer, size * nitems);
        };

        try
        {
            perform(filePath, false /*isDir*/, CURLFTPMETHOD_NOCWD,
            {
                {CURLOPT_UPLOAD, 1L},
                {CURLOPT_READDATA, &getBytesToSend},
                {CURLOPT_READFUNCTION, getBytesToSendWrapper},
            }, true /*requestUtf8*/); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
        }
        catch (const SysError&)
        {
            if (exception)
                std::rethrow_exception(exception);
            throw;
        }
    }

private:
    FtpSession           (const FtpSession&) = delete;
    FtpSession& operator=(const FtpSession&) = delete;

    //returns server response (header data)
    std::string perform(const RemotePath& itemPath, bool isDir, curl_ftpmethod pathMethod,
                        const std::vector<CurlOption>& extraOptions, bool requestUtf8) //throw SysError, SysErrorPassword, SysErrorFtpProtocol, SysErrorTransient
    {
        if (requestUtf8) //avoid endless recursion
            initUtf8(); //throw SysError, SysErrorFtpProtocol

        if (!easyHandle_)
        {
            easyHandle_ = ::curl_easy_init();
            if (!easyHandle_)
                throw SysError(formatSystemError("curl_easy_init", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));
        }
        else
            ::curl_easy_reset(easyHandle_);

        auto setCurlOption = [easyHandle = easyHandle_](const CurlOption& curlOpt) //throw SysError
        {
            if (const CURLcode rc = ::curl_easy_setopt(easyHandle, curlOpt.option, curlOpt.value);
                rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(curlOpt.option)) + ")",
                                                 formatCurlStatusCode(rc), utfTo<std::wstring>(std::string(::curl_easy_strerror(rc)))));
        };

        char curlErrorBuf[CURL_ERROR_SIZE] = {};
        setCurlOption({CURLOPT_ERRORBUFFER, curlErrorBuf}); //throw SysError

        std::string headerData;
        curl_write_callback onHeaderReceived = [](/*const*/ char* buffer, size_t size, size_t nitems, void* callbackData)
        {
            auto& output = *static_cast<std::string*>(callbackData);
            output.append(buffer, size * nitems);
            return size * nitems;
        };
        setCurlOption({CURLOPT_HEADERDATA, &headerData}); //throw SysError
        setCurlOption({CURLOPT_HEADERFUNCTION, onHeaderReceived}); //throw SysError

        setCurlOption({CURLOPT_URL, getCurlUrlPath(itemPath, isDir).c_str()}); //throw SysError

        assert(pathMethod != CURLFTPMETHOD_MULTICWD); //too slow!
        setCurlOption({CURLOPT_FTP_FILEMETHOD, pathMethod}); //throw SysError

        if (!login_.username.empty()) //else: libcurl will default to CURL_DEFAULT_USER("anonymous") and CURL_DEFAULT_PASSWORD("ftp@example.com")
        {
            setCurlOption({CURLOPT_USERNAME, login_.username.c_str()}); //throw SysError
            if (login_.password)
                setCurlOption({CURLOPT_PASSWORD, login_.password->c_str()}); //throw SysError
        }

        setCurlOption({CURLOPT_PORT, login_.port}); //throw SysError

        //thread-safety: https://curl.haxx.se/libcurl/c/threadsafe.html
        setCurlOption({CURLOPT_NOSIGNAL, 1}); //throw SysError

        //allow PASV IP: some FTP servers really use IP different from control connection
        setCurlOption({CURLOPT_FTP_SKIP_PASV_IP, 0}); //throw SysError

        if (login_.activeMode)
            setCurlOption({CURLOPT_FTPPORT, "-"}); //"-": same IP address as the control connection

        setCurlOption({CURLOPT_CONNECTTIMEOUT, login_.timeoutSec}); //throw SysError

        //CURLOPT_TIMEOUT: hard limit for the whole request => not usable for transfers of varying length
        setCurlOption({CURLOPT_LOW_SPEED_TIME, login_.timeoutSec}); //throw SysError
        setCurlOption({CURLOPT_LOW_SPEED_LIMIT, 1 /*[bytes]*/}); //throw SysError
        //can't use "0" which means "inactive", so use some low number

        setCurlOption({CURLOPT_SERVER_RESPONSE_TIMEOUT, login_.timeoutSec}); //throw SysError
        //FTP only; unlike CURLOPT_TIMEOUT, this one is NOT a limit on the total transfer time

        if (login_.activeMode)
            setCurlOption({CURLOPT_ACCEPTTIMEOUT_MS, 1000L * login_.timeoutSec}); //throw SysError

        //long-running file transfers require keep-alives for the TCP control connection
        setCurlOption({CURLOPT_TCP_KEEPALIVE, 1}); //throw SysError

        std::optional<SysError> socketException;
        //libcurl does *not* set FD_CLOEXEC for us! https://github.com/curl/curl/issues/2252
        auto onSocketCreate = [&](curl_socket_t curlfd, curlsocktype purpose)
        {
            if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1) //=> RACE-condition if other thread calls fork/execv before this thread sets FD_CLOEXEC!
            {
                socketException = SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno));
                return CURL_SOCKOPT_ERROR;
            }
            return CURL_SOCKOPT_OK;
        };

        using SocketCbType = decltype(onSocketCreate);
        using SocketCbWrapperType =            int (*)(SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose); //needed for cdecl function pointer cast
        SocketCbWrapperType onSocketCreateWrapper = [](SocketCbType* clientp, curl_socket_t curlfd, curlsocktype purpose)
        {
            return (*clientp)(curlfd, purpose); //free this poor little C-API from its shackles and redirect to a proper lambda
        };

        setCurlOption({CURLOPT_SOCKOPTFUNCTION, onSocketCreateWrapper}); //throw SysError
        setCurlOption({CURLOPT_SOCKOPTDATA, &onSocketCreate}); //throw SysError

        //server certificate is not verified: FTPS here protects against passive eavesdropping only
        setCurlOption({CURLOPT_SSL_VERIFYPEER, 0}); //throw SysError
        setCurlOption({CURLOPT_SSL_VERIFYHOST, 0}); //throw SysError

        if (login_.useTls) //https://tools.ietf.org/html/rfc4217
        {
            //require SSL for both control and data:
            setCurlOption({CURLOPT_USE_SSL,    CURLUSESSL_ALL}); //throw SysError
            //try TLS first, then SSL (currently: CURLFTPAUTH_DEFAULT == CURLFTPAUTH_SSL):
            setCurlOption({CURLOPT_FTPSSLAUTH, CURLFTPAUTH_TLS}); //throw SysError
        }

        for (const CurlOption& option : extraOptions)
            setCurlOption(option); //throw SysError

        //=======================================================================================================
        const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);
        //curl_easy_perform() considers FTP response codes >= 400 as failure; prefix FTP commands with * to continue anyway: https://curl.se/libcurl/c/CURLOPT_QUOTE.html

        if (socketException)
            throw* socketException; //throw SysError
        //=======================================================================================================

        if (rcPerf != CURLE_OK)
        {
            std::wstring errorMsg = trimCpy(utfTo<std::wstring>(std::string(curlErrorBuf))); //optional

            if (const std::vector<std::string_view>& headerLines = splitFtpResponse(headerData);
                !headerLines.empty())
                if (const std::string_view& response = trimCpy(headerLines.back()); //that *should* be the server's error response
                    !response.empty())
                    errorMsg += (errorMsg.empty() ? L"" : L"\n") + utfTo<std::wstring>(response);

            if (rcPerf == CURLE_LOGIN_DENIED)
                throw SysErrorPassword(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));

            long ftpStatusCode = 0; //optional
            if (::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &ftpStatusCode) != CURLE_OK)
                ftpStatusCode = 0;

            //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
            if (400 <= ftpStatusCode && ftpStatusCode < 600 && !isTransientCurlError(rcPerf))
                throw SysErrorFtpProtocol(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf),
                                                            errorMsg + L'\n' + formatFtpStatus(static_cast<int>(ftpStatusCode))), ftpStatusCode);

            if (isTransientCurlError(rcPerf) || ftpStatusCode == 421 /*server closing control connection*/)
            {
                closeConnection(); //don't reuse a broken control connection
                throw SysErrorTransient(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
            }

            throw SysError(formatSystemError("curl_easy_perform", formatCurlStatusCode(rcPerf), errorMsg));
        }

        return headerData;
    }

    //returns server response (header data)
    std::string runSingleFtpCommand(const std::string& ftpCmd, bool requestUtf8) //throw SysError, SysErrorFtpProtocol
    {
        curl_slist* quote = nullptr;
        ZEN_ON_SCOPE_EXIT(::curl_slist_free_all(quote));
        quote = ::curl_slist_append(quote, ftpCmd.c_str());
        if (!quote)
            throw SysError(formatSystemError("curl_slist_append", formatCurlStatusCode(CURLE_OUT_OF_MEMORY), L""));

        return perform(RemotePath(), true /*isDir*/, CURLFTPMETHOD_NOCWD /*avoid needless CWDs*/,
        {
            {CURLOPT_NOBODY, 1L},
            {CURLOPT_QUOTE, quote},
        }, requestUtf8); //throw SysError, SysErrorPassword, SysErrorFtpProtocol
    }

    void ensureBinaryMode() //throw SysError
    {
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == binaryEnabledSocket_)
                return;

        runSingleFtpCommand("TYPE I", false /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        //make sure our binary-enabled session is still there (== libcurl behaves as we expect)
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            binaryEnabledSocket_ = *currentSocket; //remember what we did
        //=> pray libcurl doesn't internally set "TYPE A": https://github.com/curl/curl/issues/4342
        else
            throw SysError(L"Curl failed to cache FTP session.");
    }

    std::string getServerPathInternal(const RemotePath& itemPath) //throw SysError
    {
        const Zstring serverPath = getServerRelPath(itemPath);

        if (itemPath.value.empty()) //endless recursion caveat!! utfToServerEncoding() transitively depends on getServerPathInternal()
            return serverPath;

        return utfToServerEncoding(serverPath); //throw SysError
    }

    Zstring serverToUtfEncoding(const std::string_view& str) //throw SysError
    {
        if (isAsciiString(str)) //fast path
            return {str.begin(), str.end()};

        switch (encoding_) //throw SysError
        {
            case ServerEncoding::unknown:
                //"UTF-8 encodings contain enough internal structure that it is always, in practice, possible to determine
                // whether a UTF-8 or raw encoding has been used" https://www.rfc-editor.org/rfc/rfc3659#section-2.2
                encoding_ = supportsUtf8() || isValidUtf(str) ? ServerEncoding::utf8 : ServerEncoding::ansi;
                return serverToUtfEncoding(str); //throw SysError

            case ServerEncoding::utf8:
                if (!isValidUtf(str))
                    throw SysError(_("Invalid character encoding:") + L' ' + utfTo<std::wstring>(str) + L' ' + _("Expected:") + L" [UTF-8]");
                return Zstring(str);

            case ServerEncoding::ansi:
                return ansiToUtfEncoding(str); //throw SysError
        }
        assert(false);
        return {};
    }

    std::string utfToServerEncoding(const Zstring& str) //throw SysError
    {
        if (isAsciiString(str)) //fast path
            return str;

        switch (encoding_) //throw SysError
        {
            case ServerEncoding::unknown:
                if (!supportsUtf8())
                    throw SysError(_("Failed to auto-detect character encoding:") + L' ' + utfTo<std::wstring>(str)); //might be ANSI or UTF8 with non-compliant server...

                encoding_ = ServerEncoding::utf8;
                return utfToServerEncoding(str); //throw SysError

            case ServerEncoding::utf8:
                if (!isValidUtf(str))
                    throw SysError(_("Invalid character encoding:") + L' ' + utfTo<std::wstring>(str) + L' ' + _("Expected:") + L" [UTF-8]");
                return str;

            case ServerEncoding::ansi:
                return utfToAnsiEncoding(str); //throw SysError
        }
        assert(false);
        return {};
    }

    std::string getCurlUrlPath(const RemotePath& itemPath /*optional*/, bool isDir) //throw SysError
    {
        std::string curlRelPath; //libcurl expects encoded paths (except for '/' char!!!) => bug: https://github.com/curl/curl/pull/4423

        for (const std::string& comp : splitCpy(getServerPathInternal(itemPath), '/', SplitOnEmpty::skip)) //throw SysError
        {
            char* compFmt = ::curl_easy_escape(easyHandle_, comp.c_str(), static_cast<int>(comp.size()));
            if (!compFmt)
                throw SysError(formatSystemError("curl_easy_escape(" + comp + ')', L"", L"Conversion failure"));
            ZEN_ON_SCOPE_EXIT(::curl_free(compFmt));

            if (!curlRelPath.empty())
                curlRelPath += '/';
            curlRelPath += compFmt;
        }

        if (trimCpy(login_.server).empty())
            throw SysError(_("Server name must not be empty."));

        /*  1. CURLFTPMETHOD_NOCWD requires absolute paths to unconditionally skip CWDs: https://github.com/curl/curl/pull/4382
            2. CURLFTPMETHOD_SINGLECWD requires absolute paths to skip one needless "CWD entry path": https://github.com/curl/curl/pull/4332
              => use // because /%2f had bugs: https://curl.se/docs/faq.html#How_do_I_list_the_root_directory    */
        const std::string serverName = contains(login_.server, ':') ? '[' + login_.server + ']' : login_.server; //IPv6 literal
        std::string path = std::string(ftpPrefix) + "//" + serverName + "//" + curlRelPath;

        if (isDir && !endsWith(path, '/')) //curl-FTP needs directory paths to end with a slash
            path += '/';
        return path;
    }

    void initUtf8() //throw SysError, SysErrorFtpProtocol
    {
        /*  1. Some RFC-2640-non-compliant servers require UTF8 to be explicitly enabled, e.g. Microsoft FTP Service
            2. Others do not advertize "UTF8" in "FEAT", but *still* allow enabling it via "OPTS UTF8 ON", e.g. vsFTPd

            "OPTS UTF8 ON" needs to be activated each time libcurl internally creates a new session   */
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            if (*currentSocket == utf8RequestedSocket_) //caveat: a non-UTF8-enabled session might already exist, e.g. from getFeatures()
                return;

        //some servers require "CLNT" before accepting "OPTS UTF8 ON"
        if (getFeatures().clnt) //throw SysError
            runSingleFtpCommand("CLNT FtpStore", false /*requestUtf8*/); //throw SysError, SysErrorFtpProtocol

        //"prefix the command with an asterisk to make libcurl continue even if the command fails"
        //-> ignore if server does not know this legacy command (but report all *other* issues; else getActiveSocket() below won't have a socket and we've hidden the real error!)
        const std::string& optsBuf = runSingleFtpCommand("*OPTS UTF8 ON", false /*requestUtf8*/); //throw SysError, (SysErrorFtpProtocol)

        const std::optional<int> ftpStatusCode = getLastFtpStatusCode(optsBuf);
        socketUsesUtf8_ = ftpStatusCode == 200 || //"200 Always in UTF8 mode."  "200 UTF8 set to on"
                          ftpStatusCode == 202;   //"202 UTF8 mode is always enabled."

        //make sure our Unicode-enabled session is still there (== libcurl behaves as we expect)
        if (std::optional<curl_socket_t> currentSocket = getActiveSocket()) //throw SysError
            utf8RequestedSocket_ = *currentSocket; //remember what we did
        else
            throw SysError(L"Curl failed to cache FTP session.");
    }

    bool supportsUtf8() //throw SysError
    {
        if (getFeatures().utf8) //throw SysError
            return true;

        initUtf8(); //vsFTPd: supports UTF8 via "OPTS UTF8 ON", even if "UTF8" is missing from "FEAT"
        return socketUsesUtf8_;
    }

    std::optional<curl_socket_t> getActiveSocket() //throw SysError
    {
        if (easyHandle_)
        {
            curl_socket_t currentSocket = 0;
            const CURLcode rc = ::curl_easy_getinfo(easyHandle_, CURLINFO_ACTIVESOCKET, &currentSocket);
            if (rc != CURLE_OK)
                throw SysError(formatSystemError("curl_easy_getinfo(CURLINFO_ACTIVESOCKET)", formatCurlStatusCode(rc), utfTo<std::wstring>(std::string(::curl_easy_strerror(rc)))));
            if (currentSocket != CURL_SOCKET_BAD)
                return currentSocket;
        }
        return {};
    }

    const FtpFeatures& getFeatures() //throw SysError
    {
        if (!featureCache_)
            //*: ignore error if server does not support/allow FEAT
            featureCache_ = parseFeatResponse(runSingleFtpCommand("*FEAT", false /*requestUtf8*/)); //throw SysError, (SysErrorFtpProtocol)
        //used by initUtf8()! => requestUtf8 = false!!!
        return *featureCache_;
    }

    const LibcurlInitCookie curlInitCookie_; //throw SysError; must outlive easyHandle_
    const FtpLogin login_;
    CURL* easyHandle_ = nullptr;

    curl_socket_t utf8RequestedSocket_ = CURL_SOCKET_BAD;
    curl_socket_t binaryEnabledSocket_ = CURL_SOCKET_BAD;

    bool socketUsesUtf8_ = false;

    ServerEncoding encoding_ = ServerEncoding::unknown;

    std::optional<FtpFeatures> featureCache_; //server capabilities survive reconnects
};
}


std::unique_ptr<RemoteSession> fst::createFtpSession(const FtpLogin& login) //throw SysError
{
    return std::make_unique<FtpSession>(login); //throw SysError
}
