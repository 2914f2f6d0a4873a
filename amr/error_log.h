// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef ERROR_LOG_H_6614092837465510
#define ERROR_LOG_H_6614092837465510

#include <ctime>
#include <vector>
#include "time.h"
#include "i18n.h"
#include "utf.h"


namespace amr
{
enum class LogLevel
{
    info,
    warning,
    error,
};

struct LogEntry
{
    time_t   time  = 0;
    LogLevel level = LogLevel::error;
    std::string message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;

inline
void logMsg(ErrorLog& log, const std::wstring& msg, LogLevel level, time_t time = std::time(nullptr))
{
    log.push_back({time, level, utfTo<std::string>(msg)});
}


struct LogLevelCount
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};

inline
LogLevelCount countByLevel(const ErrorLog& log)
{
    LogLevelCount count;
    for (const LogEntry& entry : log)
        ++(entry.level == LogLevel::info    ? count.info :
           entry.level == LogLevel::warning ? count.warning : count.error);
    return count;
}


inline
std::wstring getLogLevelLabel(LogLevel level)
{
    switch (level)
    {
        case LogLevel::info:
            return _("Info");
        case LogLevel::warning:
            return _("Warning");
        case LogLevel::error:
            return _("Error");
    }
    return std::wstring();
}


/* one entry per block, continuation lines aligned below the message start:
      [14:55:02]  Error:  Cannot read file "a.bin".
                          HTTP status 404: Not found.                         */
inline
std::string formatMessage(const LogEntry& entry)
{
    const std::string prefix = '[' + formatLocalTime(entry.time) + "]  " + utfTo<std::string>(getLogLevelLabel(entry.level)) + ":  ";
    const std::string indent(unicodeLength(prefix), ' ');

    std::string output = prefix;
    bool lineStart = false;
    for (const char c : trimCpy(entry.message))
        if (c == '\n')
            lineStart = true; //collapse empty lines
        else
        {
            if (lineStart)
            {
                output += '\n' + indent;
                lineStart = false;
            }
            output += c;
        }
    return output + '\n';
}
}

#endif //ERROR_LOG_H_6614092837465510
