// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "ftp_listing.h"
#include <zen/time.h>

using namespace zen;
using namespace fst;


namespace
{
class FtpLineParser
{
public:
    explicit FtpLineParser(const std::string_view& line) : line_(line) {}
    /**/     FtpLineParser(std::string_view&&) = delete;

    template <class Function>
    std::string_view readRange(size_t count, Function acceptChar) //throw SysError
    {
        if (count > line_.size() - pos_)
            throw SysError(L"Unexpected end of line.");

        const std::string_view rng = line_.substr(pos_, count);
        if (!std::all_of(rng.begin(), rng.end(), acceptChar))
            throw SysError(L"Expected char type not found.");

        pos_ += count;
        return rng;
    }

    template <class Function> //expects non-empty range!
    std::string_view readRange(Function acceptChar) //throw SysError
    {
        size_t posEnd = pos_;
        while (posEnd < line_.size() && acceptChar(line_[posEnd]))
            ++posEnd;

        if (posEnd == pos_)
            throw SysError(L"Expected char range not found.");

        const std::string_view rng = line_.substr(pos_, posEnd - pos_);
        pos_ = posEnd;
        return rng;
    }

    std::string_view readRest() //throw SysError
    {
        if (pos_ == line_.size())
            throw SysError(L"Unexpected end of line.");

        return line_.substr(std::exchange(pos_, line_.size()));
    }

    char peekNextChar() const { return pos_ == line_.size() ? '\0' : line_[pos_]; }

private:
    const std::string_view line_;
    size_t pos_ = 0;
};


bool isNotWhiteSpace(char c) { return !isWhiteSpace(c); }


bool isDotEntry(const std::string_view& name) { return name == "." || name == ".."; }


int getCurrentYear(time_t utcTimeNow) //throw SysError
{
    const TimeComp tc = getUtcTime(utcTimeNow);
    if (tc == TimeComp())
        throw SysError(L"Failed to determine current time: " + numberTo<std::wstring>(utcTimeNow));
    return tc.year;
}


/*  https://tools.ietf.org/html/rfc3659
    type=cdir;sizd=4096;modify=20170116230740;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c55; .
    type=file;size=4;modify=20170113063314;UNIX.mode=0600;UNIX.uid=874;UNIX.gid=869;unique=902g36e1c5d; readme.txt
    type=dir;sizd=4096;modify=20170117144634;UNIX.mode=0755;UNIX.uid=874;UNIX.gid=869;unique=902g36e418a; folder   */
std::optional<RemoteItem> parseMlstLine(const std::string_view& rawLine, const FtpNameDecoder& decodeName) //throw SysError
{
    try
    {
        std::string_view line = rawLine;
        if (startsWith(line, ' ')) //leading blank is already trimmed if MLSD was processed by curl
            line.remove_prefix(1);

        const size_t posBlank = line.find(' ');
        if (posBlank == std::string_view::npos)
            throw SysError(L"Item name not available.");

        const std::string_view facts   = line.substr(0, posBlank);
        const std::string_view rawName = line.substr(posBlank + 1);

        RemoteItem item;
        std::string_view typeFact;
        std::string_view fileSize;

        for (const std::string_view fact : splitCpy(facts, ';', SplitOnEmpty::skip))
            if (startsWithAsciiNoCase(fact, "type=")) //must be case-insensitive!!!
                typeFact = beforeFirst(afterFirst(fact, '=', IfNotFoundReturn::none), ':', IfNotFoundReturn::all);
            else if (startsWithAsciiNoCase(fact, "size="))
                fileSize = afterFirst(fact, '=', IfNotFoundReturn::none);
            else if (startsWithAsciiNoCase(fact, "modify="))
            {
                std::string_view modifyFact = afterFirst(fact, '=', IfNotFoundReturn::none);
                modifyFact = beforeLast(modifyFact, '.', IfNotFoundReturn::all); //truncate millisecond precision

                const auto [modTime, timeValid] = utcToTimeT(parseTime("%Y%m%d%H%M%S", modifyFact));
                if (!timeValid)
                    throw SysError(L"Modification time is invalid.");
                item.modTime = modTime;
            }

        if (equalAsciiNoCase(typeFact, "cdir") ||
            equalAsciiNoCase(typeFact, "pdir") || isDotEntry(rawName))
            return std::nullopt;

        if (equalAsciiNoCase(typeFact, "dir"))
            item.type = RemoteItemType::folder;
        else if (equalAsciiNoCase(typeFact, "OS.unix=slink") || //the OS.unix=slink:/target syntax often skips the target
                 equalAsciiNoCase(typeFact, "OS.unix=symlink")) //path after the colon: http://www.proftpd.org/docs/modules/mod_facts.html
            item.type = RemoteItemType::symlink;
        //everything else is a file, e.g. "OS.unix=blk"

        if (rawName.empty())
            throw SysError(L"Item name not available.");
        item.itemName = decodeName(rawName); //throw SysError

        if (item.type == RemoteItemType::file)
        {
            if (fileSize.empty() || !std::all_of(fileSize.begin(), fileSize.end(), &isDigit<char>))
                throw SysError(L"File size not available."); //can be "-1" on some servers
            item.fileSize = stringTo<uint64_t>(fileSize);
        }
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") " + e.toString());
    }
}


/*  "ls -l"
        total 4953                                                  <- optional first line
        drwxr-xr-x 1 root root    4096 Jan 10 11:58 version
        -rwxr-xr-x 1 1000  300    2217 Feb 28  2016 win32.manifest
        lrwxr-xr-x 1 root root      18 Apr 26 15:17 Projects -> /mnt/hgfs/Projects

    no group:                       dr-xr-xr-x   2 root       512 Apr  8  1994 etc
    no owner and group, trailing /: drwxrwxrwx 1                0 Jan  1 00:00 dirname/     */
std::optional<RemoteItem> parseUnixLine(const std::string_view& rawLine, time_t utcTimeNow, int utcCurrentYear, int ownerGroupCount,
                                        const FtpNameDecoder& decodeName) //throw SysError
{
    try
    {
        FtpLineParser parser(rawLine);

        //file type: -:file  l:symlink  d:directory  b:block device  p:named pipe  c:char device  s:socket
        const char typeTag = parser.readRange(1, [](char c)
        {
            return c == '-' || c == 'b' || c == 'c' || c == 'd' || c == 'l' || c == 'p' || c == 's';
        })[0]; //throw SysError

        parser.readRange(9, [](char c) //permissions; throw SysError
        {
            return c == '-' || c == 'r' || c == 'w' || c == 'x' || c == 's' || c == 'S' || c == 't' || c == 'T';
        });
        parser.readRange(&isWhiteSpace<char>); //throw SysError

        parser.readRange(&isDigit<char>);      //hard-link count; throw SysError
        parser.readRange(&isWhiteSpace<char>); //

        assert(0 <= ownerGroupCount && ownerGroupCount <= 2);
        for (int i = 0; i < ownerGroupCount; ++i)
        {
            parser.readRange(&isNotWhiteSpace);    //throw SysError
            parser.readRange(&isWhiteSpace<char>); //
        }

        const uint64_t fileSize = stringTo<uint64_t>(parser.readRange(&isDigit<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                          //
        //------------------------------------------------------------------------------------
        const std::string_view monthStr = parser.readRange(&isNotWhiteSpace); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                //

        const char* months[] = {"Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
        auto itMonth = std::find_if(std::begin(months), std::end(months), [&](const char* name) { return equalAsciiNoCase(monthStr, name); });
        if (itMonth == std::end(months))
            throw SysError(L"Failed to parse month name.");

        const int day = stringTo<int>(parser.readRange(&isDigit<char>)); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                           //
        if (day < 1 || day > 31)
            throw SysError(L"Failed to parse day of month.");

        const std::string_view timeOrYear = parser.readRange([](char c) { return c == ':' || isDigit(c); }); //throw SysError
        parser.readRange(&isWhiteSpace<char>);                                                               //

        TimeComp timeComp;
        timeComp.month = 1 + static_cast<int>(itMonth - std::begin(months));
        timeComp.day = day;

        if (contains(timeOrYear, ':'))
        {
            const int hour   = stringTo<int>(beforeFirst(timeOrYear, ':', IfNotFoundReturn::none));
            const int minute = stringTo<int>(afterFirst (timeOrYear, ':', IfNotFoundReturn::none));
            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError(L"Failed to parse modification time.");

            timeComp.hour   = hour;
            timeComp.minute = minute;
            timeComp.year   = utcCurrentYear; //tentatively

            const auto [serverLocalTime, timeValid] = utcToTimeT(timeComp);
            if (!timeValid)
                throw SysError(L"Modification time is invalid.");

            if (serverLocalTime > utcTimeNow + 24 * 3600) //time zones range from UTC-12:00 to UTC+14:00: 1 day tolerance
                --timeComp.year; //most likely from last year
        }
        else if (timeOrYear.size() == 4)
        {
            timeComp.year = stringTo<int>(timeOrYear);
            if (timeComp.year < 1600 || timeComp.year >= 3000)
                throw SysError(L"Failed to parse modification time.");
        }
        else
            throw SysError(L"Failed to parse modification time.");

        //LIST has no time zone: pretend UTC
        const auto [modTime, timeValid] = utcToTimeT(timeComp);
        if (!timeValid)
            throw SysError(L"Modification time is invalid.");
        //------------------------------------------------------------------------------------
        const std::string_view trail = parser.readRest(); //throw SysError
        const std::string_view rawName = typeTag == 'l' ? beforeFirst(trail, " -> ", IfNotFoundReturn::all) : trail;
        if (rawName.empty())
            throw SysError(L"Item name not available.");

        if (isDotEntry(rawName))
            return std::nullopt;

        RemoteItem item;
        if (typeTag == 'd')
            item.type = RemoteItemType::folder;
        else if (typeTag == 'l')
            item.type = RemoteItemType::symlink;
        else
            item.fileSize = fileSize;

        item.itemName = decodeName(rawName); //throw SysError
        if (item.type == RemoteItemType::folder && endsWith(item.itemName, Zstr('/')))
            item.itemName.pop_back();

        item.modTime = modTime;
        return item;
    }
    catch (const SysError& e)
    {
        throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(rawLine) + L") [ownerGroupCount: " + numberTo<std::wstring>(ownerGroupCount) + L"] " + e.toString());
    }
}
}


std::vector<std::string_view> fst::splitFtpResponse(const std::string& buf)
{
    std::vector<std::string_view> lines;

    const std::string_view bufView = buf;
    size_t posFirst = 0;
    for (;;)
    {
        const size_t posLast = bufView.find_first_of(std::string_view("\r\n\0", 3), posFirst);
        const std::string_view line = bufView.substr(posFirst, posLast == std::string_view::npos ? std::string_view::npos : posLast - posFirst);
        if (!line.empty()) //consider Windows' <CR><LF>
            lines.push_back(line);

        if (posLast == std::string_view::npos)
            return lines;
        posFirst = posLast + 1;
    }
}


std::optional<int> fst::getLastFtpStatusCode(const std::string& response)
{
    std::optional<int> statusCode;
    for (const std::string_view& line : splitFtpResponse(response))
        if (line.size() >= 4 &&
            isDigit(line[0]) &&
            isDigit(line[1]) &&
            isDigit(line[2]) &&
            line[3] == ' ')
            statusCode = stringTo<int>(line.substr(0, 3));
    return statusCode;
}


std::wstring fst::formatFtpStatus(int sc)
{
    const wchar_t* statusText = [&] //https://en.wikipedia.org/wiki/List_of_FTP_server_return_codes
    {
        switch (sc)
        {
            //*INDENT-OFF*
            case 400: return L"The command was not accepted but the error condition is temporary.";
            case 421: return L"Service not available, closing control connection.";
            case 425: return L"Cannot open data connection.";
            case 426: return L"Connection closed; transfer aborted.";
            case 430: return L"Invalid username or password.";
            case 450: return L"Requested file action not taken.";
            case 451: return L"Local error in processing.";
            case 452: return L"Insufficient storage space in system. File unavailable, e.g. file busy.";

            case 500: return L"Syntax error, command unrecognized or command line too long.";
            case 501: return L"Syntax error in parameters or arguments.";
            case 502: return L"Command not implemented.";
            case 503: return L"Bad sequence of commands.";
            case 530: return L"User not logged in.";
            case 534: return L"Could not connect to server; issue regarding SSL.";
            case 550: return L"File unavailable, e.g. file not found, no access.";
            case 552: return L"Requested file action aborted. Exceeded storage allocation.";
            case 553: return L"File name not allowed.";

            default:  return L"";
            //*INDENT-ON*
        }
    }();

    if (*statusText == L'\0')
        return replaceCpy<std::wstring>(L"FTP status %x.", L"%x", numberTo<std::wstring>(sc));
    else
        return replaceCpy<std::wstring>(L"FTP status %x: ", L"%x", numberTo<std::wstring>(sc)) + statusText;
}


FtpFeatures fst::parseFeatResponse(const std::string& featResponse)
{
    FtpFeatures output; //FEAT command: https://tools.ietf.org/html/rfc2389#page-4
    const std::vector<std::string_view> lines = splitFtpResponse(featResponse);

    auto it = std::find_if(lines.begin(), lines.end(), [](const std::string_view& line) { return startsWith(line, "211-") || startsWith(line, "211 "); });
    if (it == lines.end())
        return output;

    for (++it; it != lines.end(); ++it)
    {
        if (equalAsciiNoCase     (*it, "211 End") || //Serv-U: "211 End (for details use "HELP commmand" where command is the command of interest)"
            startsWithAsciiNoCase(*it, "211 End "))  //Home Ftp Server: "211 End of extentions."
            break;

        std::string line(*it);
        //ProFTPD with "MultilineRFC2228 = on"
        if (startsWith(line, "211-"))
            line = ' ' + afterFirst(line, '-', IfNotFoundReturn::none);

        //"The presence of the MLST feature indicates that both MLST and MLSD are supported"
        if (equalAsciiNoCase     (line, " MLST")  ||
            startsWithAsciiNoCase(line, " MLST ") || //SP "MLST" [SP factlist] CRLF
            equalAsciiNoCase     (line, " MLSD"))    //non-compliant, but seen in the wild
            output.mlsd = true;

        else if (equalAsciiNoCase(line, " UTF8") ||
                 equalAsciiNoCase(line, " UTF8 ON") || //non-compliant servers
                 equalAsciiNoCase(line, " UTF-8"))     //
            output.utf8 = true;

        else if (equalAsciiNoCase(line, " CLNT"))
            output.clnt = true;
    }
    return output;
}


std::optional<uint64_t> fst::parseSizeResponse(const std::string& sizeResponse) //throw SysError
{
    for (const std::string_view& line : splitFtpResponse(sizeResponse))
        if (startsWith(line, "213 ")) //213<space>[rubbish]<file size>
        {
            if (!isDigit(line.back())) //https://tools.ietf.org/html/rfc3659#section-4
                break;

            size_t posDigits = line.size();
            while (posDigits > 0 && isDigit(line[posDigits - 1]))
                --posDigits;
            return stringTo<uint64_t>(line.substr(posDigits));
        }
        else if (startsWith(line, "550 ")) //e.g. "550 I can only retrieve regular files"
            return std::nullopt;

    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(sizeResponse) + L')');
}


time_t fst::parseMdtmResponse(const std::string& mdtmResponse) //throw SysError
{
    for (const std::string_view& line : splitFtpResponse(mdtmResponse))
        if (startsWith(line, "213 ")) //213<space>YYYYMMDDHHMMSS[.sss]   "Time values are always represented in UTC"
        {
            const std::string_view timeStr = beforeFirst(line.substr(4), '.', IfNotFoundReturn::all);

            if (const auto [modTime, timeValid] = utcToTimeT(parseTime("%Y%m%d%H%M%S", timeStr));
                timeValid)
                return modTime;
            break;
        }
    throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(mdtmResponse) + L')');
}


std::vector<RemoteItem> fst::parseMlsdListing(const std::string& buf, const FtpNameDecoder& decodeName) //throw SysError
{
    std::vector<RemoteItem> output;
    for (const std::string_view& line : splitFtpResponse(buf))
        if (std::optional<RemoteItem> item = parseMlstLine(line, decodeName)) //throw SysError
            output.push_back(std::move(*item));
    return output;
}


std::vector<RemoteItem> fst::parseUnixListing(const std::string& buf, time_t utcTimeNow, const FtpNameDecoder& decodeName) //throw SysError
{
    const std::vector<std::string_view> lines = splitFtpResponse(buf);
    auto it = lines.begin();

    if (it != lines.end() && startsWith(*it, "total "))
        ++it;

    const int utcCurrentYear = getCurrentYear(utcTimeNow); //throw SysError

    //listing format may differ per item type: see "no owner and group" above
    std::optional<int> dirOwnerGroupCount;
    std::optional<int> fileOwnerGroupCount;
    std::optional<int> linkOwnerGroupCount;

    std::vector<RemoteItem> output;

    for (; it != lines.end(); ++it)
    {
        const std::string_view line = *it;

        std::optional<int>& ownerGroupCount = line[0] == 'd' ? dirOwnerGroupCount :
                                              line[0] == 'l' ? linkOwnerGroupCount : fileOwnerGroupCount;
        if (!ownerGroupCount)
        {
            std::optional<SysError> firstError;

            for (int i = 2; i >= 0 && !ownerGroupCount; --i)
                try
                {
                    parseUnixLine(line, utcTimeNow, utcCurrentYear, i, decodeName); //throw SysError
                    ownerGroupCount = i;
                }
                catch (const SysError& e)
                {
                    if (!firstError)
                        firstError = e;
                }

            if (!ownerGroupCount)
                throw* firstError; //most likely the relevant one
        }

        if (std::optional<RemoteItem> item = parseUnixLine(line, utcTimeNow, utcCurrentYear, *ownerGroupCount, decodeName)) //throw SysError
            output.push_back(std::move(*item));
    }
    return output;
}


/*  "dir"
        10-27-15  03:46AM       <DIR>          pub
        04-08-14  03:09PM               11,399 readme.txt

    IIS option "four-digit years"
        06-22-2017  04:25PM       <DIR>          test
        06-20-2017  12:50PM              1875499 zstring.obj        */
std::vector<RemoteItem> fst::parseWindowsListing(const std::string& buf, time_t utcTimeNow, const FtpNameDecoder& decodeName) //throw SysError
{
    const int utcCurrentYear = getCurrentYear(utcTimeNow); //throw SysError

    std::vector<RemoteItem> output;
    for (const std::string_view& line : splitFtpResponse(buf))
        try
        {
            FtpLineParser parser(line);

            const int month = stringTo<int>(parser.readRange(2, &isDigit<char>)); //throw SysError
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //
            const int day = stringTo<int>(parser.readRange(2, &isDigit<char>));   //
            parser.readRange(1, [](char c) { return c == '-' || c == '/'; });     //
            const std::string_view yearString = parser.readRange(&isDigit<char>); //
            parser.readRange(&isWhiteSpace<char>);                                //

            if (month < 1 || month > 12 || day < 1 || day > 31)
                throw SysError(L"Failed to parse modification time.");

            int year = 0;
            if (yearString.size() == 2)
            {
                year = (utcCurrentYear / 100) * 100 + stringTo<int>(yearString);
                if (year > utcCurrentYear + 1 /*local time leeway*/)
                    year -= 100;
            }
            else if (yearString.size() == 4)
                year = stringTo<int>(yearString);
            else
                throw SysError(L"Failed to parse modification time.");
            //------------------------------------------------------------------------------------
            int hour = stringTo<int>(parser.readRange(2, &isDigit<char>));         //throw SysError
            parser.readRange(1, [](char c) { return c == ':'; });                  //
            const int minute = stringTo<int>(parser.readRange(2, &isDigit<char>)); //
            if (!isWhiteSpace(parser.peekNextChar()))
            {
                const std::string_view period = parser.readRange(2, [](char c) { return c == 'A' || c == 'P' || c == 'M'; }); //throw SysError
                if (period == "PM")
                {
                    if (0 <= hour && hour < 12)
                        hour += 12;
                }
                else if (hour == 12)
                    hour = 0;
            }
            parser.readRange(&isWhiteSpace<char>); //throw SysError

            if (hour < 0 || hour > 23 || minute < 0 || minute > 59)
                throw SysError(L"Failed to parse modification time.");

            TimeComp timeComp;
            timeComp.year   = year;
            timeComp.month  = month;
            timeComp.day    = day;
            timeComp.hour   = hour;
            timeComp.minute = minute;

            const auto [modTime, timeValid] = utcToTimeT(timeComp); //pretend UTC
            if (!timeValid)
                throw SysError(L"Modification time is invalid.");
            //------------------------------------------------------------------------------------
            const std::string_view dirTagOrSize = parser.readRange(&isNotWhiteSpace); //throw SysError
            parser.readRange(&isWhiteSpace<char>);                                    //

            const bool isDir = dirTagOrSize == "<DIR>";
            uint64_t fileSize = 0;
            if (!isDir)
            {
                std::string sizeStr(dirTagOrSize);
                replace(sizeStr, ',', "");
                replace(sizeStr, '.', "");
                if (sizeStr.empty() || !std::all_of(sizeStr.begin(), sizeStr.end(), &isDigit<char>))
                    throw SysError(L"Failed to parse file size.");
                fileSize = stringTo<uint64_t>(sizeStr);
            }
            //------------------------------------------------------------------------------------
            const std::string_view rawName = parser.readRest(); //throw SysError

            if (!isDotEntry(rawName))
            {
                RemoteItem item;
                if (isDir)
                    item.type = RemoteItemType::folder;
                item.itemName = decodeName(rawName); //throw SysError
                item.fileSize = fileSize;
                item.modTime  = modTime;

                output.push_back(std::move(item));
            }
        }
        catch (const SysError& e)
        {
            throw SysError(L"Unexpected FTP response. (" + utfTo<std::wstring>(line) + L") " + e.toString());
        }

    return output;
}


std::vector<RemoteItem> fst::parseListListing(const std::string& buf, time_t utcTimeNow, const FtpNameDecoder& decodeName) //throw SysError
{
    if (!buf.empty() && isDigit(buf[0])) //DOS listings start with the date; same test as libcurl
        return parseWindowsListing(buf, utcTimeNow, decodeName); //throw SysError
    return parseUnixListing(buf, utcTimeNow, decodeName);        //
}
