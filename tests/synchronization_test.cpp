// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <algorithm>
#include <gtest/gtest.h>
#include <amr/thread.h>
#include <base/status_handler.h>
#include <base/synchronization.h>
#include "fake_archive.h"
#include "test_util.h"

using namespace amr;
using namespace mirror;
using mirror::test::FakeArchive;
using mirror::test::fileEntry;
using mirror::test::folderEntry;
using mirror::test::fastRetry;


namespace
{
class SilentStatusHandler : public StatusHandler
{
public:
    void forceUiUpdateNoThrow() override {}

    size_t countMessages(LogLevel level) const
    {
        return std::count_if(getErrorLog().begin(), getErrorLog().end(), [&](const LogEntry& e) { return e.level == level; });
    }

    bool hasMessage(const std::wstring& text) const
    {
        return std::any_of(getErrorLog().begin(), getErrorLog().end(), [&](const LogEntry& e) { return contains(e.message, utfTo<std::string>(text)); });
    }
};


SyncConfig makeConfig(const Zstring& targetFolder)
{
    SyncConfig cfg;
    cfg.baseUrl = "https://archive.example/files";
    cfg.targetFolder = targetFolder;
    cfg.listingParallel  = 2;
    cfg.transferParallel = 3;
    cfg.retry = fastRetry(2);
    return cfg;
}


//first half of "big.bin" arrives, then the connection stalls until the transfer is cancelled
class StallingArchive : public RemoteArchive
{
public:
    std::vector<ListingEntry> getFolderContent(const Zstring& relPath) const override //throw FileError, ErrorTransient
    {
        if (!relPath.empty())
            throw FileError(L"Cannot read directory " + getDisplayPath(relPath), L"HTTP status 404: Not found.");
        return {fileEntry("big.bin", 8)};
    }

    StreamAttributes downloadFile(const Zstring& relPath,
                                  const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) const override //throw FileError, ErrorTransient, X
    {
        writeBlock("1234", 4); //throw X
        for (int i = 0; i < 1000; ++i) //give up after 10 sec: the test has failed anyway
            interruptibleSleep(std::chrono::milliseconds(10)); //throw ThreadStopRequest
        return {8, std::nullopt};
    }

    std::wstring getDisplayPath(const Zstring& relPath) const override { return L"stall://" + utfTo<std::wstring>(relPath); }
};


class AbortOnProgressHandler : public SilentStatusHandler
{
public:
    explicit AbortOnProgressHandler(int64_t abortAtBytes) : abortAtBytes_(abortAtBytes) {}

    void updateDataProcessed(int itemsDelta, int64_t bytesDelta) override
    {
        SilentStatusHandler::updateDataProcessed(itemsDelta, bytesDelta);
        if (getStatsCurrent().bytes >= abortAtBytes_)
            userRequestAbort();
    }

private:
    const int64_t abortAtBytes_;
};


void setupArchive(FakeArchive& archive)
{
    archive.addFolder("", {fileEntry("a.zip", 3), folderEntry("b"), fileEntry("c.bin", 4)});
    archive.addFolder("b", {fileEntry("c.rom"), fileEntry("d.zip", 3)});
    archive.addFile("a.zip", "zip");
    archive.addFile("b/c.rom", "romrom");
    archive.addFile("b/d.zip", "zip");
    archive.addFile("c.bin", "1234");
}
}


TEST(Synchronize, MirrorsTreeWithExclusions)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "c.bin", "old content"); //presence only: never re-downloaded
    test::writeTestFile(tmp / "orphan.txt", "");

    FakeArchive archive;
    archive.addFolder("", {fileEntry("a.zip", 3), folderEntry("b"), fileEntry("c.bin", 4)});
    archive.addFolder("b", {fileEntry("c.rom", 6), fileEntry("d.zip", 3)});
    archive.addFile("b/c.rom", "romrom");

    SilentStatusHandler handler;
    const SyncStatistics stats = synchronize(makeConfig(tmp.path()), ExcludeFilter({"*.zip"}), archive, handler);

    EXPECT_EQ(stats.downloaded, 1);
    EXPECT_EQ(stats.skipped, 2);
    EXPECT_EQ(stats.alreadyPresent, 1);
    EXPECT_EQ(stats.failed, 0);
    EXPECT_EQ(stats.fileNodesTotal(), 4);
    EXPECT_EQ(stats.bytesDownloaded, 6);
    EXPECT_EQ(stats.orphans, std::vector<Zstring>({"orphan.txt"}));
    EXPECT_TRUE(stats.unreachableFolders.empty());

    EXPECT_EQ(archive.getRequestCount("a.zip"), 0u);
    EXPECT_EQ(archive.getRequestCount("c.bin"), 0u);
    EXPECT_EQ(test::readTestFile(tmp / "b/c.rom"), "romrom");
    EXPECT_EQ(test::readTestFile(tmp / "c.bin"), "old content");
    EXPECT_EQ(test::listTree(tmp.path()), std::set<std::string>({"b/", "b/c.rom", "c.bin", "orphan.txt"}));

    EXPECT_EQ(handler.getStatsCurrent(), (ProgressStats{1, 6}));
    EXPECT_EQ(handler.getStatsTotal(),   (ProgressStats{1, 6}));

    const StatusHandler::Result result = handler.prepareResult();
    EXPECT_EQ(result.summary.resultStatus, SyncResult::finishedSuccess);
    EXPECT_TRUE(handler.hasMessage(L"orphan.txt"));
}


TEST(Synchronize, SecondRunIsNoOp)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    setupArchive(archive);

    {
        SilentStatusHandler handler;
        const SyncStatistics stats = synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler);
        EXPECT_EQ(stats.downloaded, 4);
        EXPECT_EQ(stats.bytesDownloaded, 3 + 6 + 3 + 4);
        EXPECT_EQ(handler.getStatsCurrent(), handler.getStatsTotal());
    }
    {
        SilentStatusHandler handler;
        const SyncStatistics stats = synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler);
        EXPECT_EQ(stats.downloaded, 0);
        EXPECT_EQ(stats.alreadyPresent, 4);
        EXPECT_TRUE(stats.orphans.empty());

        EXPECT_EQ(handler.prepareResult().summary.resultStatus, SyncResult::finishedSuccess);
        EXPECT_TRUE(handler.hasMessage(L"Nothing to synchronize"));
    }
    EXPECT_EQ(archive.getRequestCount("c.bin"), 1u);
}


TEST(Synchronize, FailuresAreReportedNotThrown)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFolder("", {folderEntry("good"), folderEntry("missing"), fileEntry("gone.bin"), fileEntry("flaky.bin", 2)});
    archive.addFolder("good", {fileEntry("x.bin", 1)});
    archive.addFile("good/x.bin", "x");
    archive.addFile("flaky.bin", "ok");
    archive.failNext("flaky.bin", FakeArchive::Fail::transient);

    test::writeTestFile(tmp / "missing/local.bin", ""); //below unreachable folder => no orphan

    SilentStatusHandler handler;
    const SyncStatistics stats = synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler);

    EXPECT_EQ(stats.downloaded, 2);
    EXPECT_EQ(stats.retried, 1);
    EXPECT_EQ(stats.failed, 1);
    EXPECT_EQ(stats.unreachableFolders, std::vector<Zstring>({"missing"}));
    EXPECT_TRUE(stats.orphans.empty());
    EXPECT_EQ(stats.transfers.size(), 3u);

    EXPECT_EQ(handler.countMessages(LogLevel::error), 2u); //unreachable folder + failed download

    const StatusHandler::Result result = handler.prepareResult();
    EXPECT_EQ(result.summary.resultStatus, SyncResult::finishedError);
    EXPECT_EQ(mapToReturnCode(result.summary.resultStatus), AMR_RC_ERROR);
}


TEST(Synchronize, UnreachableRootReportsNoOrphans)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "a.bin", "");

    FakeArchive archive; //root listing: 404

    SilentStatusHandler handler;
    const SyncStatistics stats = synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler);

    EXPECT_EQ(stats.fileNodesTotal(), 0);
    EXPECT_EQ(stats.unreachableFolders, std::vector<Zstring>({""}));
    EXPECT_TRUE(stats.orphans.empty());
    EXPECT_EQ(handler.prepareResult().summary.resultStatus, SyncResult::finishedError);
}


TEST(Synchronize, AbortRequest)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    setupArchive(archive);

    SilentStatusHandler handler;
    handler.userRequestAbort();

    EXPECT_THROW(synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler), AbortProcess);

    const StatusHandler::Result result = handler.prepareResult();
    EXPECT_EQ(result.summary.resultStatus, SyncResult::aborted);
    EXPECT_EQ(mapToReturnCode(result.summary.resultStatus), AMR_RC_ABORTED);
}


TEST(Synchronize, AbortDuringDownloadLeavesNoFile)
{
    const test::TempFolder tmp;
    StallingArchive archive;

    AbortOnProgressHandler handler(4);
    EXPECT_THROW(synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler), AbortProcess);

    EXPECT_EQ(handler.getStatsCurrent().bytes, 4);
    EXPECT_TRUE(test::listTree(tmp.path()).empty()); //neither "big.bin" nor its temporary file
    EXPECT_EQ(handler.prepareResult().summary.resultStatus, SyncResult::aborted);
}


TEST(Synchronize, WarningsOnlyRunSucceeds)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    setupArchive(archive);

    SilentStatusHandler handler;
    const SyncStatistics stats = synchronize(makeConfig(tmp.path()), ExcludeFilter(), archive, handler);
    EXPECT_EQ(stats.downloaded, 4);
    EXPECT_EQ(stats.failed, 0);

    //e.g. modification time could not be set
    handler.logMessage(L"Cannot write modification time of \"a.zip\".", ProcessCallback::MsgType::warning);

    const StatusHandler::Result result = handler.prepareResult();
    EXPECT_EQ(result.summary.resultStatus, SyncResult::finishedWarning);
    EXPECT_EQ(mapToReturnCode(result.summary.resultStatus), AMR_RC_SUCCESS);
    EXPECT_EQ(getFinalStatusLabel(result.summary.resultStatus), L"Completed with warnings");
}
