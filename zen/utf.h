// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef UTF_H_5103527039481205437
#define UTF_H_5103527039481205437

#include <cstdint>
#include <optional>
#include "string_tools.h"


namespace zen
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux)
//broken encodings are substituted with U+FFFD
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf(const std::string_view& str); //check for UTF-8 encoding errors

size_t unicodeLength(const std::string_view& str); //number of code points








//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;

const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;

inline
bool isSurrogate(CodePoint cp) { return 0xd800 <= cp && cp <= 0xdfff; }


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a char
{
    if (cp < 0x80)
        writeOutput(static_cast<char>(cp));
    else if (cp < 0x800)
    {
        writeOutput(static_cast<char>((cp >> 6  ) | 0xc0));
        writeOutput(static_cast<char>((cp & 0x3f) | 0x80));
    }
    else if (cp < 0x10000)
    {
        if (isSurrogate(cp))
            return codePointToUtf8(REPLACEMENT_CHAR, writeOutput);

        writeOutput(static_cast<char>(( cp >> 12        ) | 0xe0));
        writeOutput(static_cast<char>(((cp >> 6) & 0x3f) | 0x80));
        writeOutput(static_cast<char>(( cp       & 0x3f) | 0x80));
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<char>(( cp >> 18        ) | 0xf0));
        writeOutput(static_cast<char>(((cp >> 12) & 0x3f) | 0x80));
        writeOutput(static_cast<char>(((cp >> 6 ) & 0x3f) | 0x80));
        writeOutput(static_cast<char>(( cp        & 0x3f) | 0x80));
    }
    else
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
}


class Utf8Decoder
{
public:
    explicit Utf8Decoder(const std::string_view& str) : it_(str.begin()), last_(str.end()) {}

    //no value at end of string; sets "broken" on encoding errors
    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return {};

        const auto ch = static_cast<unsigned char>(*it_++);

        size_t trailCount = 0;
        CodePoint cp = 0;
        if (ch < 0x80)
            return ch;
        else if ((ch & 0xe0) == 0xc0) { trailCount = 1; cp = ch & 0x1f; }
        else if ((ch & 0xf0) == 0xe0) { trailCount = 2; cp = ch & 0x0f; }
        else if ((ch & 0xf8) == 0xf0) { trailCount = 3; cp = ch & 0x07; }
        else
            return broken();

        for (size_t i = 0; i < trailCount; ++i)
        {
            if (it_ == last_ || (static_cast<unsigned char>(*it_) & 0xc0) != 0x80)
                return broken();
            cp = (cp << 6) | (static_cast<unsigned char>(*it_++) & 0x3f);
        }

        if (isSurrogate(cp) || cp > CODE_POINT_MAX)
            return broken();
        return cp;
    }

    bool isBroken() const { return broken_; }

private:
    CodePoint broken() { broken_ = true; return REPLACEMENT_CHAR; }

    std::string_view::const_iterator it_;
    const std::string_view::const_iterator last_;
    bool broken_ = false;
};
}


inline
bool isValidUtf(const std::string_view& str)
{
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ;
    return !decoder.isBroken();
}


inline
size_t unicodeLength(const std::string_view& str)
{
    size_t len = 0;
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ++len;
    return len;
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    using SourceChar = typename SourceString::value_type;
    using TargetChar = typename TargetString::value_type;
    static_assert(sizeof(wchar_t) == 4, "UTF-32 wide strings only");

    if constexpr (std::is_same_v<SourceChar, TargetChar>)
        return TargetString(str.begin(), str.end());
    else if constexpr (std::is_same_v<SourceChar, char>) //UTF-8 -> UTF-32
    {
        TargetString output;
        impl::Utf8Decoder decoder(std::string_view(str.data(), str.size()));
        while (const std::optional<impl::CodePoint> cp = decoder.getNext())
            output += static_cast<TargetChar>(*cp);
        return output;
    }
    else //UTF-32 -> UTF-8
    {
        TargetString output;
        for (const SourceChar c : str)
            impl::codePointToUtf8(static_cast<impl::CodePoint>(c), [&](char ch) { output += ch; });
        return output;
    }
}
}

#endif //UTF_H_5103527039481205437
