// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef TIME_H_9928374651029384
#define TIME_H_9928374651029384

#include <ctime>
#include "string_tools.h"


namespace amr
{
//local time of day, e.g. "14:55:02"; empty string if the time zone conversion fails
std::string formatLocalTime(time_t utc);

//local date and time, e.g. "2001-08-23 14:55:02"
std::string formatLocalDateTime(time_t utc);

//elapsed time: [-][d.]HH:MM:SS, e.g. "1.02:03:04"
std::string formatTimeSpan(int64_t timeInSec);







//############################ implementation ##############################
namespace impl
{
inline
std::string formatLocal(time_t utc, const char* format)
{
    std::tm ctc = {};
    if (::localtime_r(&utc, &ctc) == nullptr)
        return std::string();

    char buf[64] = {};
    const size_t charsWritten = std::strftime(buf, sizeof(buf), format, &ctc);
    return std::string(buf, charsWritten);
}


inline
std::string formatTwoDigits(int64_t num)
{
    return (num < 10 ? "0" : "") + numberTo<std::string>(num);
}
}


inline std::string formatLocalTime    (time_t utc) { return impl::formatLocal(utc, "%H:%M:%S"); }
inline std::string formatLocalDateTime(time_t utc) { return impl::formatLocal(utc, "%Y-%m-%d %H:%M:%S"); }


inline
std::string formatTimeSpan(int64_t timeInSec)
{
    std::string output;
    if (timeInSec < 0)
    {
        output += '-';
        timeInSec = -timeInSec;
    }

    const int secsPerDay = 24 * 3600;
    if (const int64_t days = timeInSec / secsPerDay;
        days > 0)
    {
        output += numberTo<std::string>(days) + '.';
        timeInSec %= secsPerDay;
    }

    return output + impl::formatTwoDigits(timeInSec / 3600) + ':' +
           impl::formatTwoDigits(timeInSec / 60 % 60) + ':' +
           impl::formatTwoDigits(timeInSec % 60);
}
}

#endif //TIME_H_9928374651029384
