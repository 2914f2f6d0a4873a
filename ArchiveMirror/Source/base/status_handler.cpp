// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "status_handler.h"
#include <algorithm>
#include <amr/extra_log.h>

using namespace amr;
using namespace mirror;


namespace
{
std::chrono::steady_clock::time_point lastExec;
}


bool mirror::uiUpdateDue(bool force)
{
    const auto now = std::chrono::steady_clock::now();

    if (now >= lastExec + UI_UPDATE_INTERVAL || force)
    {
        lastExec = now;
        return true;
    }
    return false;
}


void StatusHandler::requestUiUpdate(bool force) //throw AbortProcess
{
    //abort request is set asynchronously => evaluate on *every* call, not only when uiUpdateDue()
    if (abortRequested_ && !aborted_)
    {
        aborted_ = true;
        forceUiUpdateNoThrow(); //flush to show new cancelled state
        throw AbortProcess();
    }

    if (uiUpdateDue(force))
        forceUiUpdateNoThrow();
}


void StatusHandler::logMessage(const std::wstring& msg, MsgType type) //throw AbortProcess
{
    logMsg(errorLog_.ref(), msg, [&]
    {
        switch (type)
        {
            //*INDENT-OFF*
            case MsgType::info:    return LogLevel::info;
            case MsgType::warning: return LogLevel::warning;
            case MsgType::error:   return LogLevel::error;
            //*INDENT-ON*
        }
        assert(false);
        return LogLevel::error;
    }());
    requestUiUpdate(false /*force*/); //throw AbortProcess
}


StatusHandler::Result StatusHandler::prepareResult()
{
    //cleanup errors raised in destructors: sort into the run log by time
    if (const ErrorLog extraLog = fetchExtraLog();
        !extraLog.empty())
    {
        append(errorLog_.ref(), extraLog);
        std::stable_sort(errorLog_.ref().begin(), errorLog_.ref().end(), [](const LogEntry& lhs, const LogEntry& rhs) { return lhs.time < rhs.time; });
    }

    const SyncResult syncResult = [&]
    {
        if (aborted_)
        {
            logMsg(errorLog_.ref(), _("Stopped"), LogLevel::error);
            return SyncResult::aborted;
        }
        const LogLevelCount logCount = countByLevel(errorLog_.ref());
        if (logCount.error > 0)
            return SyncResult::finishedError;

        if (statsTotal_ == ProgressStats())
            logMsg(errorLog_.ref(), _("Nothing to synchronize"), LogLevel::info);

        return logCount.warning > 0 ? SyncResult::finishedWarning : SyncResult::finishedSuccess;
    }();

    const ProcessSummary summary
    {
        startTime_, syncResult,
        statsCurrent_,
        statsTotal_,
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startTimeSteady_)
    };
    return {summary, errorLog_};
}
