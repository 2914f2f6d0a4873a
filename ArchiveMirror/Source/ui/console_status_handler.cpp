// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "console_status_handler.h"
#include <algorithm>
#include <iostream>
#include <amr/format_unit.h>
#include <amr/scope_guard.h>
#include <amr/utf.h>

using namespace amr;
using namespace mirror;


namespace
{
const size_t PROGRESS_LINE_MAX = 100;
}


ConsoleStatusHandler::ConsoleStatusHandler(bool showProgress) : showProgress_(showProgress) {}


ConsoleStatusHandler::~ConsoleStatusHandler()
{
    clearProgressLine();
}


void ConsoleStatusHandler::clearProgressLine()
{
    if (progressLineLen_ > 0)
    {
        std::cerr << '\r' << std::string(progressLineLen_, ' ') << '\r' << std::flush;
        progressLineLen_ = 0;
    }
}


void ConsoleStatusHandler::flushLog()
{
    const ErrorLog& log = getErrorLog();
    if (printedCount_ < log.size())
    {
        clearProgressLine();
        for (auto it = log.begin() + printedCount_; it != log.end(); ++it)
            std::cout << formatMessage(*it);
        std::cout << std::flush;
        printedCount_ = log.size();
    }
}


void ConsoleStatusHandler::logMessage(const std::wstring& msg, MsgType type) //throw AbortProcess
{
    AMR_ON_SCOPE_EXIT(flushLog()); //entry is logged even if the base class throws AbortProcess
    StatusHandler::logMessage(msg, type); //throw AbortProcess
}


void ConsoleStatusHandler::forceUiUpdateNoThrow()
{
    if (!showProgress_)
        return;

    const ProgressStats current = getStatsCurrent();
    const ProgressStats total   = getStatsTotal();

    std::wstring line = formatNumber(current.items) + L'/' + formatNumber(std::max(total.items, 0)) + L' ' +
                        formatFilesizeShort(current.bytes);
    if (total.bytes > 0)
        line += L" (" + formatProgressPercent(std::min(1.0, static_cast<double>(current.bytes) / total.bytes)) + L')';

    if (!currentStatusText().empty())
        line += L"  " + currentStatusText();

    if (line.size() > PROGRESS_LINE_MAX)
        line = line.substr(0, PROGRESS_LINE_MAX - 3) + L"...";

    const std::string lineUtf8 = utfTo<std::string>(line);
    const size_t lineLen = line.size();

    std::cerr << '\r' << lineUtf8;
    if (lineLen < progressLineLen_)
        std::cerr << std::string(progressLineLen_ - lineLen, ' ');
    std::cerr << std::flush;

    progressLineLen_ = std::max(lineLen, progressLineLen_);
}
