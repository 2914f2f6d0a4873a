// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef STATUS_HANDLER_H_3302918475610294
#define STATUS_HANDLER_H_3302918475610294

#include <atomic>
#include <chrono>
#include <amr/error_log.h>
#include <amr/stl_tools.h>
#include "process_callback.h"
#include "return_codes.h"


namespace mirror
{
bool uiUpdateDue(bool force = false); //test if a specific amount of time is over

//thrown on the main thread once a cancel request was noticed
class AbortProcess {};


struct ProgressStats
{
    int     items = 0;
    int64_t bytes = 0;
};
inline bool operator==(const ProgressStats& lhs, const ProgressStats& rhs) { return lhs.items == rhs.items && lhs.bytes == rhs.bytes; }


struct ProcessSummary
{
    std::chrono::system_clock::time_point startTime;
    SyncResult resultStatus = SyncResult::aborted;
    ProgressStats statsProcessed;
    ProgressStats statsTotal;
    std::chrono::milliseconds totalTime{};
};


/*  common part of the console handler and the test handlers:
    - collects the error log
    - tracks progress statistics
    - throws AbortProcess once userRequestAbort() was called      */
class StatusHandler : public ProcessCallback
{
public:
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override { addDelta(statsCurrent_, itemsDelta, bytesDelta); } //noexcept
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) override { addDelta(statsTotal_,   itemsDelta, bytesDelta); } //

    void requestUiUpdate(bool force) final; //throw AbortProcess

    void updateStatus(std::wstring&& msg) final //throw AbortProcess
    {
        statusText_ = std::move(msg);
        requestUiUpdate(false /*force*/); //throw AbortProcess
    }

    void logMessage(const std::wstring& msg, MsgType type) override; //throw AbortProcess

    //context of signal handler or other thread: does NOT throw immediately, but on next requestUiUpdate()
    void userRequestAbort() { abortRequested_ = true; }

    ProgressStats getStatsCurrent() const { return statsCurrent_; }
    ProgressStats getStatsTotal  () const { return statsTotal_; }
    const std::wstring& currentStatusText() const { return statusText_; }

    struct Result
    {
        ProcessSummary summary;
        amr::SharedRef<amr::ErrorLog> errorLog;
    };
    Result prepareResult(); //call once at end of run

protected:
    virtual void forceUiUpdateNoThrow() = 0; //noexcept

    const amr::ErrorLog& getErrorLog() const { return errorLog_.ref(); }

private:
    static void addDelta(ProgressStats& stats, int itemsDelta, int64_t bytesDelta)
    {
        stats.items += itemsDelta;
        stats.bytes += bytesDelta;
    }

    ProgressStats statsCurrent_;
    ProgressStats statsTotal_;
    std::wstring statusText_;

    std::atomic<bool> abortRequested_{false}; //set asynchronously, e.g. by SIGINT
    bool aborted_ = false; //AbortProcess was thrown

    const std::chrono::system_clock::time_point startTime_ = std::chrono::system_clock::now();
    const std::chrono::steady_clock::time_point startTimeSteady_ = std::chrono::steady_clock::now();
    amr::SharedRef<amr::ErrorLog> errorLog_ = amr::makeSharedRef<amr::ErrorLog>();
};
}

#endif //STATUS_HANDLER_H_3302918475610294
