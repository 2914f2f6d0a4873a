// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef STRING_TOOLS_H_8812375094561230
#define STRING_TOOLS_H_8812375094561230

#include <cassert>
#include <charconv>
#include <cstdio>  //snprintf
#include <cwchar>  //swprintf
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//non-member helpers for std::string and std::wstring
namespace amr
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> bool isHexDigit  (Char c);
template <class Char> Char asciiToLower(Char c);

//"T" may be a string, string view, string literal or a single char
template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);

template <class S, class T> bool equalAsciiNoCase(const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S>                     void trim(S& str, TrimSide side = TrimSide::both);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

//conversion between numbers and strings
template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str);

std::pair<char, char> hexify  (unsigned char c, bool upperCase = true);
char                  unhexify(char high, char low);

template <class S, class Num> S printNumber(const typename S::value_type* format, const Num& number); //format a single number using std::snprintf()








//---------------------- implementation ----------------------
template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isDigit(Char c)
{
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
bool isHexDigit(Char c)
{
    return (static_cast<Char>('0') <= c && c <= static_cast<Char>('9')) ||
           (static_cast<Char>('A') <= c && c <= static_cast<Char>('F')) ||
           (static_cast<Char>('a') <= c && c <= static_cast<Char>('f'));
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


namespace impl
{
template <class Char> inline
std::basic_string_view<Char> strView(const std::basic_string<Char>& str) { return str; }

template <class Char> inline
std::basic_string_view<Char> strView(std::basic_string_view<Char> str) { return str; }

template <class Char> inline
std::basic_string_view<Char> strView(const Char* str) { return str; }

template <class Char> inline
std::basic_string_view<Char> strView(const Char& ch) { return {&ch, 1}; }
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    using Char = typename S::value_type;
    return impl::strView<Char>(str).find(impl::strView<Char>(term)) != std::basic_string_view<Char>::npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    using Char = typename S::value_type;
    return impl::strView<Char>(str).starts_with(impl::strView<Char>(prefix));
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    using Char = typename S::value_type;
    return impl::strView<Char>(str).ends_with(impl::strView<Char>(postfix));
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    using Char = typename S::value_type;
    const std::basic_string_view<Char> l = impl::strView<Char>(lhs);
    const std::basic_string_view<Char> r = impl::strView<Char>(rhs);

    if (l.size() != r.size())
        return false;

    for (size_t i = 0; i < l.size(); ++i)
        if (asciiToLower(l[i]) != asciiToLower(r[i]))
            return false;
    return true;
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    using Char = typename S::value_type;
    const std::basic_string_view<Char> termView = impl::strView<Char>(term);
    assert(!termView.empty());

    const size_t pos = str.rfind(termView);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(pos + termView.size());
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    using Char = typename S::value_type;
    const std::basic_string_view<Char> termView = impl::strView<Char>(term);
    assert(!termView.empty());

    const size_t pos = str.find(termView);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(pos + termView.size());
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    using Char = typename S::value_type;
    const std::basic_string_view<Char> termView = impl::strView<Char>(term);
    assert(!termView.empty());

    const size_t pos = str.find(termView);
    if (pos == S::npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return str.substr(0, pos);
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    using CharS = typename S::value_type;
    const std::basic_string_view<CharS> view = impl::strView<CharS>(str);

    for (size_t blockStart = 0;;)
    {
        const size_t blockEnd = view.find(static_cast<CharS>(delimiter), blockStart);
        if (blockEnd == std::basic_string_view<CharS>::npos)
        {
            onStringPart(view.substr(blockStart));
            return;
        }
        onStringPart(view.substr(blockStart, blockEnd - blockStart));
        blockStart = blockEnd + 1;
    }
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    size_t first = 0;
    size_t last  = str.size();

    if (side != TrimSide::right)
        while (first < last && isWhiteSpace(str[first]))
            ++first;

    if (side != TrimSide::left)
        while (last > first && isWhiteSpace(str[last - 1]))
            --last;

    return str.substr(first, last - first);
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    str = trimCpy(str, side);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    using Char = typename S::value_type;
    const std::basic_string_view<Char> oldView = impl::strView<Char>(oldTerm);
    const std::basic_string_view<Char> newView = impl::strView<Char>(newTerm);
    assert(!oldView.empty());
    if (oldView.empty())
        return;

    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
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
    static_assert(std::is_arithmetic_v<Num>);

    char buffer[128];
    const std::to_chars_result rv = std::to_chars(std::begin(buffer), std::end(buffer), number);
    assert(rv.ec == std::errc());

    S output;
    for (const char* it = buffer; it != rv.ptr; ++it)
        output += static_cast<typename S::value_type>(*it);
    return output;
}


//leading/trailing whitespace is ignored; returns 0 on parsing error
template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_arithmetic_v<Num>);
    using Char = typename S::value_type;

    std::string ascii;
    for (const Char c : impl::strView<Char>(str))
        ascii += static_cast<char>(c);
    trim(ascii);

    const char* first = ascii.c_str();
    const char* last  = first + ascii.size();
    if constexpr (std::is_unsigned_v<Num>)
        if (first != last && *first == '+') //from_chars() rejects '+'
            ++first;

    Num number = 0;
    if (std::from_chars(first, last, number).ec != std::errc())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);

        if (upperCase)
            return static_cast<char>('A' + (num - 10));
        else
            return static_cast<char>('a' + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') return hex - '0';
        if ('A' <= hex && hex <= 'F') return (hex - 'A') + 10;
        if ('a' <= hex && hex <= 'f') return (hex - 'a') + 10;
        assert(false);
        return 0;
    };
    return static_cast<char>(16 * unhexifyDigit(high) + unhexifyDigit(low));
}


template <class S, class Num> inline
S printNumber(const typename S::value_type* format, const Num& number)
{
    using Char = typename S::value_type;
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);

    Char buffer[128];
    int charsWritten = 0;
    if constexpr (std::is_same_v<Char, char>)
        charsWritten = std::snprintf(buffer, std::size(buffer), format, number);
    else
        charsWritten = std::swprintf(buffer, std::size(buffer), format, number);

    if (charsWritten < 0 || charsWritten >= static_cast<int>(std::size(buffer)))
    {
        assert(false);
        return S();
    }
    return S(buffer, charsWritten);
}
}

#endif //STRING_TOOLS_H_8812375094561230
