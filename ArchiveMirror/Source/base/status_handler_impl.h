// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef STATUS_HANDLER_IMPL_H_8820193746501928
#define STATUS_HANDLER_IMPL_H_8820193746501928

#include <map>
#include <vector>
#include <amr/format_unit.h>
#include <amr/i18n.h>
#include <amr/string_tools.h>
#include <amr/thread.h>
#include "process_callback.h"


namespace mirror
{
/*  listing and transfer workers never call the ProcessCallback directly:
        - progress deltas are accumulated lock-free
        - log messages are queued
        - each worker publishes its current status text
    the main thread forwards everything while waiting in waitUntilDone()          */
class AsyncCallback
{
public:
    AsyncCallback() {}

    //context of any thread: non-blocking
    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) { itemsProcessed_ += itemsDelta; bytesProcessed_ += bytesDelta; } //noexcept!
    void updateDataTotal    (int itemsDelta, int64_t bytesDelta) { itemsTotal_     += itemsDelta; bytesTotal_     += bytesDelta; } //

    //context of worker thread
    void updateStatus(std::wstring&& msg) //throw ThreadStopRequest
    {
        statusByThread_.access([&](std::map<std::thread::id, std::wstring>& status) { status[std::this_thread::get_id()] = std::move(msg); });
        amr::interruptionPoint(); //throw ThreadStopRequest
    }

    //context of worker thread
    void logMessage(const std::wstring& msg, ProcessCallback::MsgType type) //throw ThreadStopRequest
    {
        {
            std::lock_guard dummy(lockQueue_);
            logQueue_.push_back({msg, type});
        }
        conditionNewEvent_.notify_all();
        amr::interruptionPoint(); //throw ThreadStopRequest
    }

    //context of worker thread: its task is finished => drop the status text
    void notifyTaskEnd() //noexcept
    {
        statusByThread_.access([](std::map<std::thread::id, std::wstring>& status) { status.erase(std::this_thread::get_id()); });
    }

    //all tasks finished: makes waitUntilDone() return once the queue is drained
    void notifyAllDone() //noexcept
    {
        {
            std::lock_guard dummy(lockQueue_);
            allDone_ = true;
        }
        conditionNewEvent_.notify_all();
    }

    //context of main thread
    void waitUntilDone(std::chrono::milliseconds cbInterval, ProcessCallback& cb) //throw X
    {
        assert(amr::runningOnMainThread());
        for (;;)
        {
            std::vector<LogRequest> logBatch;
            bool allDone = false;
            {
                std::unique_lock dummy(lockQueue_);
                conditionNewEvent_.wait_for(dummy, cbInterval, [this] { return !logQueue_.empty() || allDone_; });
                logBatch.swap(logQueue_);
                allDone = allDone_; //all messages were queued *before* notifyAllDone()
            }

            forwardStats(cb);
            for (const LogRequest& req : logBatch)
                cb.logMessage(req.msg, req.type); //throw X

            if (allDone)
                return;

            cb.updateStatus(getCurrentStatus()); //throw X
        }
    }

private:
    AsyncCallback           (const AsyncCallback&) = delete;
    AsyncCallback& operator=(const AsyncCallback&) = delete;

    //context of main thread
    void forwardStats(ProcessCallback& cb) //noexcept
    {
        //exchange(): deltas may arrive concurrently
        const int     itemsProcessed = itemsProcessed_.exchange(0);
        const int64_t bytesProcessed = bytesProcessed_.exchange(0);
        if (itemsProcessed != 0 || bytesProcessed != 0)
            cb.updateDataProcessed(itemsProcessed, bytesProcessed); //noexcept!

        const int     itemsTotal = itemsTotal_.exchange(0);
        const int64_t bytesTotal = bytesTotal_.exchange(0);
        if (itemsTotal != 0 || bytesTotal != 0)
            cb.updateDataTotal(itemsTotal, bytesTotal); //noexcept!
    }

    //context of main thread
    std::wstring getCurrentStatus()
    {
        return statusByThread_.access([](const std::map<std::thread::id, std::wstring>& status)
        {
            std::wstring statusMsg;
            for (const auto& [threadId, msg] : status)
                if (!msg.empty())
                {
                    statusMsg = msg;
                    break;
                }

            if (status.size() >= 2)
                return L'[' + amr::replaceCpy(_("%x threads"), L"%x", amr::formatNumber(status.size())) + L"] " + statusMsg;
            return statusMsg;
        });
    }

    struct LogRequest
    {
        std::wstring msg;
        ProcessCallback::MsgType type = ProcessCallback::MsgType::error;
    };

    std::mutex lockQueue_;
    std::condition_variable conditionNewEvent_;
    std::vector<LogRequest> logQueue_;
    bool allDone_ = false;

    amr::Protected<std::map<std::thread::id, std::wstring>> statusByThread_;

    std::atomic<int>     itemsProcessed_{0}; //
    std::atomic<int64_t> bytesProcessed_{0}; //std:atomic is uninitialized by default!
    std::atomic<int>     itemsTotal_    {0}; //
    std::atomic<int64_t> bytesTotal_    {0}; //
};


/*  statistics of a single download: the planner already added one item plus the listed size
    (if any) to the total workload => on destruction the estimate is corrected to what was
    actually received, or removed if the download failed                                     */
class DownloadStatReporter
{
public:
    DownloadStatReporter(int64_t bytesExpected, AsyncCallback& acb) : bytesExpected_(bytesExpected), acb_(acb) {}

    ~DownloadStatReporter()
    {
        if (itemDone_)
            acb_.updateDataTotal(0, bytesReceived_ - bytesExpected_); //noexcept!
        else
            acb_.updateDataTotal(-1, -bytesExpected_); //
    }

    void reportBytes(int64_t bytesDelta) //noexcept! negative: rollback after failed attempt
    {
        acb_.updateDataProcessed(0, bytesDelta);
        bytesReceived_ += bytesDelta;
    }

    void reportItemDone() //noexcept!
    {
        acb_.updateDataProcessed(1, 0);
        itemDone_ = true;
    }

private:
    DownloadStatReporter           (const DownloadStatReporter&) = delete;
    DownloadStatReporter& operator=(const DownloadStatReporter&) = delete;

    const int64_t bytesExpected_;
    int64_t bytesReceived_ = 0;
    bool itemDone_ = false;
    AsyncCallback& acb_;
};
}

#endif //STATUS_HANDLER_IMPL_H_8820193746501928
