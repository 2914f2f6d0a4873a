// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "synchronization.h"
#include <algorithm>
#include <atomic>
#include <amr/format_unit.h>
#include <amr/thread.h>
#include <amr/time.h>
#include "file_transfer.h"
#include "local_snapshot.h"
#include "remote_walker.h"
#include "status_handler_impl.h"
#include "sync_plan.h"

using namespace amr;
using namespace mirror;


namespace
{
std::wstring formatAutoRetry(const std::wstring& msg, size_t retryNumber, size_t retryCount)
{
    return msg + L"\n-> " + _("Automatic retry") + L' ' + formatNumber(retryNumber) + L'/' + formatNumber(retryCount);
}


//context of transfer worker thread
class TransferCallbackImpl : public TransferCallback
{
public:
    TransferCallbackImpl(DownloadStatReporter& statReporter, AsyncCallback& acb, size_t retryCount) :
        statReporter_(statReporter), acb_(acb), retryCount_(retryCount) {}

    void reportBytes(int64_t bytesDelta) override { statReporter_.reportBytes(bytesDelta); } //noexcept

    void onAutoRetry(const std::wstring& msg, size_t retryNumber) override //throw ThreadStopRequest
    {
        acb_.logMessage(formatAutoRetry(msg, retryNumber, retryCount_), ProcessCallback::MsgType::info);
    }

    void reportStatus(std::wstring&& msg) override { acb_.updateStatus(std::move(msg)); } //throw ThreadStopRequest

    void logWarning(const std::wstring& msg) override { acb_.logMessage(msg, ProcessCallback::MsgType::warning); } //throw ThreadStopRequest

private:
    DownloadStatReporter& statReporter_;
    AsyncCallback& acb_;
    const size_t retryCount_;
};


/*  run-scoped aggregator:
        listing workers: RemoteWalker => onFile() => planAction() => transfer queue
        transfer workers: transferFile() => statistics
        main thread: AsyncCallback::waitUntilDone()                                    */
class SyncRun : public WalkerCallback
{
public:
    SyncRun(const SyncConfig& cfg, const ExcludeFilter& filter, const RemoteArchive& archive) :
        cfg_(cfg),
        filter_(filter),
        archive_(archive),
        ftSnapshot_(runAsync([targetFolder = cfg.targetFolder]
    {
        setCurrentThreadName(Zstr("Local snapshot"));
        return takeLocalSnapshot(targetFolder);
    }).share()),
    tgTransfer_(std::max<size_t>(cfg.transferParallel, 1), Zstr("Transfer")),
    walker_(archive, filter, cfg.retry, cfg.listingParallel, *this) {}

    SyncStatistics run(ProcessCallback& callback); //throw X

private:
    //WalkerCallback: context of listing worker thread
    void onFile(RemoteNode&& node) override; //throw ThreadStopRequest

    void onFolderExcluded(const Zstring& relPath) override
    {
        stats_.access([](SyncStatistics& st) { ++st.excludedFolders; });
    }

    void onFolderUnreachable(const Zstring& relPath, const std::wstring& msg) override //throw ThreadStopRequest
    {
        stats_.access([&](SyncStatistics& st) { st.unreachableFolders.push_back(relPath); });
        acb_.logMessage(msg, ProcessCallback::MsgType::error); //throw ThreadStopRequest
    }

    void onAutoRetry(const std::wstring& msg, size_t retryNumber) override //throw ThreadStopRequest
    {
        acb_.logMessage(formatAutoRetry(msg, retryNumber, cfg_.retry.retryCount), ProcessCallback::MsgType::info); //throw ThreadStopRequest
    }

    void reportStatus(std::wstring&& msg) override { acb_.updateStatus(std::move(msg)); } //throw ThreadStopRequest

    void onFolderDone() override { acb_.notifyTaskEnd(); } //noexcept

    //context of transfer worker thread
    void runTransfer(const SyncAction& action); //throw ThreadStopRequest

    const LocalSnapshot& waitForSnapshot() const //throw ThreadStopRequest
    {
        while (ftSnapshot_.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
            interruptionPoint(); //throw ThreadStopRequest
        return ftSnapshot_.get();
    }

    const SyncConfig& cfg_;
    const ExcludeFilter& filter_;
    const RemoteArchive& archive_;

    AsyncCallback acb_;
    Protected<SyncStatistics> stats_;
    Protected<std::unordered_set<Zstring>> discoveredFiles_;
    std::atomic<bool> diskFullReported_{false};

    const std::shared_future<LocalSnapshot> ftSnapshot_;

    //destruction order: stop listing workers first (they feed the transfer queue), then transfer workers
    ThreadGroup tgTransfer_;
    RemoteWalker walker_;
};


void SyncRun::onFile(RemoteNode&& node) //throw ThreadStopRequest
{
    const LocalSnapshot& snapshot = waitForSnapshot(); //throw ThreadStopRequest

    discoveredFiles_.access([&](std::unordered_set<Zstring>& files) { files.insert(node.relPath); });

    SyncAction action = planAction(node, snapshot, filter_);
    switch (action.type)
    {
        case SyncActionType::skip:
            stats_.access([](SyncStatistics& st) { ++st.skipped; });
            break;

        case SyncActionType::alreadyExists:
            stats_.access([](SyncStatistics& st) { ++st.alreadyPresent; });
            break;

        case SyncActionType::download:
            acb_.updateDataTotal(1, action.expectedSize ? static_cast<int64_t>(*action.expectedSize) : 0); //noexcept
            //queue only: never wait for transfers => listing continues at full speed
            tgTransfer_.run([this, action = std::move(action)] { runTransfer(action); });
            break;
    }
}


void SyncRun::runTransfer(const SyncAction& action) //throw ThreadStopRequest
{
    AMR_ON_SCOPE_EXIT(acb_.notifyTaskEnd());

    DownloadStatReporter statReporter(action.expectedSize ? static_cast<int64_t>(*action.expectedSize) : 0, acb_);
    TransferCallbackImpl transferCb(statReporter, acb_, cfg_.retry.retryCount);

    TransferResult result = transferFile(archive_, action, cfg_.targetFolder, cfg_.retry, transferCb); //throw ThreadStopRequest

    if (result.outcome != TransferOutcome::failed)
    {
        statReporter.reportItemDone();
        acb_.logMessage(replaceCpy(replaceCpy(_("Downloaded file %x (%y)"), L"%x", fmtPath(action.relPath)),
                                           L"%y", formatFilesizeShort(result.bytes)), ProcessCallback::MsgType::info); //throw ThreadStopRequest
    }
    else
    {
        acb_.logMessage(result.failReason, ProcessCallback::MsgType::error); //throw ThreadStopRequest

        if (result.diskFull && !diskFullReported_.exchange(true)) //all following writes will likely fail, too
            acb_.logMessage(replaceCpy(_("The disk is full: not enough free space to store %x."), L"%x", fmtPath(cfg_.targetFolder)) + L"\n\n" +
                            _("The remaining files will most likely fail, too."), ProcessCallback::MsgType::warning); //throw ThreadStopRequest
    }

    stats_.access([&](SyncStatistics& st)
    {
        switch (result.outcome)
        {
            case TransferOutcome::retried:
                ++st.retried;
                [[fallthrough]];
            case TransferOutcome::success:
                ++st.downloaded;
                st.bytesDownloaded += result.bytes;
                break;
            case TransferOutcome::failed:
                ++st.failed;
                st.diskFull = st.diskFull || result.diskFull;
                break;
        }
        st.transfers.push_back(std::move(result));
    });
}


SyncStatistics SyncRun::run(ProcessCallback& callback) //throw X
{
    walker_.start();

    walker_.notifyWhenDone([this]
    {
        //all listings done => all downloads are queued
        tgTransfer_.notifyWhenDone([this] { acb_.notifyAllDone(); }); //noexcept
    });

    acb_.waitUntilDone(UI_UPDATE_INTERVAL / 2, callback); //throw X

    //no files discovered => snapshot might still be running
    while (ftSnapshot_.wait_for(UI_UPDATE_INTERVAL / 2) != std::future_status::ready)
        callback.requestUiUpdate(); //throw X

    const LocalSnapshot& snapshot = ftSnapshot_.get();
    for (const std::wstring& errorMsg : snapshot.errors)
        callback.logMessage(errorMsg, ProcessCallback::MsgType::error); //throw X

    SyncStatistics stats = stats_.access([](SyncStatistics& st) { return std::move(st); });
    std::sort(stats.unreachableFolders.begin(), stats.unreachableFolders.end());

    if (cfg_.reportOrphans)
    {
        stats.orphans = discoveredFiles_.access([&](const std::unordered_set<Zstring>& files)
        {
            return findOrphans(snapshot, files, stats.unreachableFolders, filter_);
        });

        if (!stats.orphans.empty())
        {
            std::wstring msg = replaceCpy(_("Local files not found in the archive: %x"), L"%x", formatNumber(stats.orphans.size()));
            for (const Zstring& relPath : stats.orphans)
                msg += L"\n    " + utfTo<std::wstring>(relPath);
            callback.logMessage(msg, ProcessCallback::MsgType::info); //throw X
        }
    }
    return stats;
}
}


SyncStatistics mirror::synchronize(const SyncConfig& cfg,
                                   const ExcludeFilter& filter,
                                   const RemoteArchive& archive,
                                   ProcessCallback& callback) //throw X
{
    const std::chrono::steady_clock::time_point startTime = std::chrono::steady_clock::now();

    callback.logMessage(replaceCpy(replaceCpy(_("Mirroring %x to %y"), L"%x", fmtPath(archive.getDisplayPath(Zstring()))),
                                   L"%y", fmtPath(cfg.targetFolder)), ProcessCallback::MsgType::info); //throw X

    //total workload starts at zero: it grows as the remote walk discovers files

    SyncStatistics stats;
    {
        SyncRun syncRun(cfg, filter, archive);
        stats = syncRun.run(callback); //throw X
    }

    const auto duration = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::now() - startTime);

    callback.logMessage(getSyncSummary(stats) + L'\n' + replaceCpy(_("Total time: %x"), L"%x", utfTo<std::wstring>(formatTimeSpan(duration.count()))),
                        ProcessCallback::MsgType::info); //throw X
    return stats;
}
