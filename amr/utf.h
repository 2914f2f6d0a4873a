// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef UTF_H_4470192837465102
#define UTF_H_4470192837465102

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>


namespace amr
{
//convert between UTF-8 (char) and UTF-32 (wchar_t on Linux):
template <class TargetString> TargetString utfTo(std::string_view  str);
template <class TargetString> TargetString utfTo(std::wstring_view str);

template <class TargetString> TargetString utfTo(const std::string&  str) { return utfTo<TargetString>(std::string_view (str)); }
template <class TargetString> TargetString utfTo(const std::wstring& str) { return utfTo<TargetString>(std::wstring_view(str)); }
template <class TargetString> TargetString utfTo(const char*         str) { return utfTo<TargetString>(std::string_view (str)); }
template <class TargetString> TargetString utfTo(const wchar_t*      str) { return utfTo<TargetString>(std::wstring_view(str)); }


//number of code points for UTF-8 encoded string
size_t unicodeLength(std::string_view str);







//----------------------- implementation ----------------------------------
namespace impl
{
using CodePoint = uint32_t;
using Char8     = uint8_t;

const CodePoint LEAD_SURROGATE      = 0xd800;
const CodePoint TRAIL_SURROGATE_MAX = 0xdfff;
const CodePoint REPLACEMENT_CHAR    = 0xfffd;
const CodePoint CODE_POINT_MAX      = 0x10ffff;

static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");


template <class Function> inline
void codePointToUtf8(CodePoint cp, Function writeOutput) //"writeOutput" is a unary function taking a Char8
{
    if (cp <= 0b111'1111)
        writeOutput(static_cast<Char8>(cp));
    else if (cp <= 0b0111'1111'1111)
    {
        writeOutput(static_cast<Char8>((cp >> 6)        | 0b1100'0000)); //110x xxxx
        writeOutput(static_cast<Char8>((cp & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else if (cp <= 0b1111'1111'1111'1111)
    {
        if (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX)
            codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
        else
        {
            writeOutput(static_cast<Char8>( (cp >> 12)             | 0b1110'0000)); //1110 xxxx
            writeOutput(static_cast<Char8>(((cp >> 6) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
            writeOutput(static_cast<Char8>( (cp       & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        }
    }
    else if (cp <= CODE_POINT_MAX)
    {
        writeOutput(static_cast<Char8>( (cp >> 18)              | 0b1111'0000)); //1111 0xxx
        writeOutput(static_cast<Char8>(((cp >> 12) & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<Char8>(((cp >> 6)  & 0b11'1111) | 0b1000'0000)); //10xx xxxx
        writeOutput(static_cast<Char8>( (cp        & 0b11'1111) | 0b1000'0000)); //10xx xxxx
    }
    else //invalid code point
        codePointToUtf8(REPLACEMENT_CHAR, writeOutput);
}


class Utf8Decoder
{
public:
    explicit Utf8Decoder(std::string_view str) :
        it_(reinterpret_cast<const Char8*>(str.data())),
        last_(reinterpret_cast<const Char8*>(str.data()) + str.size()) {}

    std::optional<CodePoint> getNext()
    {
        if (it_ == last_)
            return std::nullopt;

        const Char8 ch = *it_++;
        CodePoint cp = ch;

        if (ch < 0x80) //1 byte
            ;
        else if (ch >> 5 == 0b110) //2 bytes
        {
            cp &= 0b1'1111;
            if (decodeTrail(cp))
                if (cp <= 0b111'1111) //overlong encoding
                    cp = REPLACEMENT_CHAR;
        }
        else if (ch >> 4 == 0b1110) //3 bytes
        {
            cp &= 0b1111;
            if (decodeTrail(cp) && decodeTrail(cp))
                if (cp <= 0b0111'1111'1111 ||
                    (LEAD_SURROGATE <= cp && cp <= TRAIL_SURROGATE_MAX))
                    cp = REPLACEMENT_CHAR;
        }
        else if (ch >> 3 == 0b11110) //4 bytes
        {
            cp &= 0b111;
            if (decodeTrail(cp) && decodeTrail(cp) && decodeTrail(cp))
                if (cp <= 0b1111'1111'1111'1111 || cp > CODE_POINT_MAX)
                    cp = REPLACEMENT_CHAR;
        }
        else //invalid begin of UTF8 encoding
            cp = REPLACEMENT_CHAR;

        return cp;
    }

private:
    bool decodeTrail(CodePoint& cp)
    {
        if (it_ != last_)
        {
            const Char8 ch = *it_;
            if (ch >> 6 == 0b10) //trail byte expected!
            {
                cp = (cp << 6) + (ch & 0b11'1111);
                ++it_;
                return true;
            }
        }
        cp = REPLACEMENT_CHAR;
        return false;
    }

    const Char8* it_;
    const Char8* const last_;
};
}


template <> inline
std::string utfTo(std::string_view str) { return std::string(str); }


template <> inline
std::wstring utfTo(std::wstring_view str) { return std::wstring(str); }


template <> inline
std::wstring utfTo(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());

    impl::Utf8Decoder decoder(str);
    while (const std::optional<impl::CodePoint> cp = decoder.getNext())
        output += static_cast<wchar_t>(*cp);
    return output;
}


template <> inline
std::string utfTo(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());

    for (const wchar_t c : str)
        impl::codePointToUtf8(static_cast<impl::CodePoint>(c), [&](impl::Char8 ch) { output += static_cast<char>(ch); });
    return output;
}


inline
size_t unicodeLength(std::string_view str)
{
    size_t uniLen = 0;
    impl::Utf8Decoder decoder(str);
    while (decoder.getNext())
        ++uniLen;
    return uniLen;
}
}

#endif //UTF_H_4470192837465102
