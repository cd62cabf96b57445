// *****************************************************************************
// * This file is part of the FtpStore project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRING_TOOLS_H_0924835708234658723
#define STRING_TOOLS_H_0924835708234658723

#include <algorithm>
#include <cstdlib>
#include <compare>
#include <string>
#include <string_view>
#include <vector>
#include <type_traits>
#include "stl_tools.h"


//string helpers working on std::basic_string and std::basic_string_view (S) with terms of the same char type (T)
//T may be a string, a string view, a C-string or a single char
namespace zen
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> bool isAsciiChar (Char c);
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);

template <class S, class T> bool equalAsciiNoCase(const S& lhs, const T& rhs);
template <class S, class T> std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs); //considering A-Z only!

//STL container predicate for std::unordered_set/map: consistent with equalAsciiNoCase()
struct StringHashAsciiNoCase;

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

template <class S> [[nodiscard]] S trimCpy(const S& str);
template <class S>                void trim(S& str);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //returns 0 on garbage input








//---------------------- implementation ----------------------
namespace impl
{
template <class Char>
struct ViewOf
{
    static std::basic_string_view<Char> get(const std::basic_string<Char>& str) { return str; }
    static std::basic_string_view<Char> get(std::basic_string_view<Char>   str) { return str; }
    static std::basic_string_view<Char> get(const Char* str) { return str; }
    static std::basic_string_view<Char> get(const Char& c) { return {&c, 1}; }
};

template <class S, class T> inline
auto strView(const T& term) { return ViewOf<typename S::value_type>::get(term); }
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>(' ' ) || c == static_cast<Char>('\t') || c == static_cast<Char>('\n') ||
           c == static_cast<Char>('\r') || c == static_cast<Char>('\v') || c == static_cast<Char>('\f');
}


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
bool isAsciiChar(Char c) { return static_cast<std::make_unsigned_t<Char>>(c) < 128; }


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::strView<S>(str).find(impl::strView<S>(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto strV    = impl::strView<S>(str);
    const auto prefixV = impl::strView<S>(prefix);
    return strV.size() >= prefixV.size() && strV.compare(0, prefixV.size(), prefixV) == 0;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto strV     = impl::strView<S>(str);
    const auto postfixV = impl::strView<S>(postfix);
    return strV.size() >= postfixV.size() && strV.compare(strV.size() - postfixV.size(), postfixV.size(), postfixV) == 0;
}


template <class S, class T> inline
std::weak_ordering compareAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto lhsV = impl::strView<S>(lhs);
    const auto rhsV = impl::strView<S>(rhs);

    const size_t minLen = std::min(lhsV.size(), rhsV.size());
    for (size_t i = 0; i < minLen; ++i)
    {
        const auto cL = asciiToLower(lhsV[i]);
        const auto cR = asciiToLower(rhsV[i]);
        if (cL != cR)
            return cL < cR ? std::weak_ordering::less : std::weak_ordering::greater;
    }
    return lhsV.size() <=> rhsV.size();
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs) { return compareAsciiNoCase(lhs, rhs) == std::weak_ordering::equivalent; }


struct StringHashAsciiNoCase
{
    template <class String>
    size_t operator()(const String& str) const
    {
        FNV1aHash<size_t> hash;
        for (const auto c : impl::strView<String>(str))
            hash.add(static_cast<size_t>(asciiToLower(c)));
        return hash.get();
    }
};


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto strV    = impl::strView<S>(str);
    const auto prefixV = impl::strView<S>(prefix);
    return strV.size() >= prefixV.size() && equalAsciiNoCase(strV.substr(0, prefixV.size()), prefixV);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto termV = impl::strView<S>(term);
    const size_t pos = impl::strView<S>(str).rfind(termV);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(str.begin() + pos + termV.size(), str.end());
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = impl::strView<S>(str).rfind(impl::strView<S>(term));
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(str.begin(), str.begin() + pos);
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto termV = impl::strView<S>(term);
    const size_t pos = impl::strView<S>(str).find(termV);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(str.begin() + pos + termV.size(), str.end());
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const size_t pos = impl::strView<S>(str).find(impl::strView<S>(term));
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(str.begin(), str.begin() + pos);
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    static_assert(std::is_same_v<typename S::value_type, Char>);
    std::vector<S> output;

    for (auto blockFirst = str.begin();;)
    {
        const auto blockLast = std::find(blockFirst, str.end(), delimiter);
        if (blockFirst != blockLast || soe == SplitOnEmpty::allow)
            output.emplace_back(blockFirst, blockLast);

        if (blockLast == str.end())
            return output;
        blockFirst = blockLast + 1;
    }
}


template <class S> inline
void trim(S& str)
{
    auto itLast = str.end();
    while (itLast != str.begin() && isWhiteSpace(*(itLast - 1)))
        --itLast;

    auto itFirst = str.begin();
    while (itFirst != itLast && isWhiteSpace(*itFirst))
        ++itFirst;

    str = S(itFirst, itLast);
}


template <class S> inline
S trimCpy(const S& str)
{
    S tmp = str;
    trim(tmp);
    return tmp;
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldV = impl::strView<S>(oldTerm);
    const auto newV = impl::strView<S>(newTerm);
    if (oldV.empty())
        return;

    S output;
    size_t posStart = 0;
    for (;;)
    {
        const size_t pos = str.find(oldV, posStart);
        if (pos == S::npos)
            break;
        output.append(str, posStart, pos - posStart);
        output.append(newV);
        posStart = pos + oldV.size();
    }
    if (posStart == 0)
        return;

    output.append(str, posStart);
    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    using Char = typename S::value_type;
    if constexpr (std::is_same_v<Char, wchar_t>)
        return std::to_wstring(number);
    else
        return std::to_string(number);
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    using Char = typename S::value_type;
    const auto strV = impl::strView<S>(str);

    auto it = strV.begin();
    while (it != strV.end() && isWhiteSpace(*it))
        ++it;

    if constexpr (std::is_floating_point_v<Num>)
    {
        std::string tmp; //ASCII subset only
        for (; it != strV.end() && isAsciiChar(*it); ++it)
            tmp += static_cast<char>(*it);
        return static_cast<Num>(std::strtod(tmp.c_str(), nullptr));
    }
    else
    {
        static_assert(std::is_integral_v<Num>);
        bool hasMinusSign = false;
        if (it != strV.end() && (*it == static_cast<Char>('-') || *it == static_cast<Char>('+')))
        {
            hasMinusSign = *it == static_cast<Char>('-');
            ++it;
        }

        Num number = 0;
        for (; it != strV.end() && isDigit(*it); ++it)
            number = static_cast<Num>(number * 10 + (*it - static_cast<Char>('0')));

        if (hasMinusSign)
        {
            if constexpr (std::is_signed_v<Num>)
                return -number;
            else
                return 0;
        }
        return number;
    }
}
}

#endif //STRING_TOOLS_H_0924835708234658723
