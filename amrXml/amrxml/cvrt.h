// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef CVRT_H_6620918374650192
#define CVRT_H_6620918374650192

#include <chrono>
#include <vector>
#include <amr/string_tools.h>


namespace amr
{
/**
\file
\brief Convert text of XML elements and attributes to user data.

Supported by default:
    - std::string, std::wstring
    - bool ("true"/"false")
    - all built-in arithmetic numbers
    - std::chrono::duration (count of ticks)
    - std::vector<T> of the above (structured element: one child element per item)
*/

///Convert text to user data - used by XML elements and attributes
/**
  \return "true" if value was read successfully.
*/
template <class T> bool readText(const std::string& input, T& value);








//------------------------------ implementation -------------------------------------
namespace xml_impl
{
template <class T>
struct IsChronoDuration : std::false_type {};

template <class Rep, class Period>
struct IsChronoDuration<std::chrono::duration<Rep, Period>> : std::true_type {};
}


template <class T> inline
bool readText(const std::string& input, T& value)
{
    if constexpr (std::is_same_v<T, bool>)
    {
        const std::string tmp = trimCpy(input);
        if (tmp == "true")
            value = true;
        else if (tmp == "false")
            value = false;
        else
            return false;
        return true;
    }
    else if constexpr (std::is_same_v<T, std::string>)
    {
        value = input;
        return true;
    }
    else if constexpr (std::is_same_v<T, std::wstring>)
    {
        value = utfTo<std::wstring>(input);
        return true;
    }
    else if constexpr (std::is_arithmetic_v<T>)
    {
        const std::string tmp = trimCpy(input);
        if (tmp.empty())
            return false;
        //stringTo() returns 0 on error => distinguish from a real "0"
        value = stringTo<T>(tmp);
        return value != 0 || tmp.find_first_not_of("+-0.") == std::string::npos;
    }
    else if constexpr (xml_impl::IsChronoDuration<T>::value)
    {
        typename T::rep count = 0;
        if (!readText(input, count))
            return false;
        value = T(count);
        return true;
    }
    else
        static_assert(sizeof(T) == -1, "unsupported type: provide a readText() specialization");
}
}

#endif //CVRT_H_6620918374650192
