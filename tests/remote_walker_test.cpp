// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <gtest/gtest.h>
#include <base/remote_walker.h>
#include "fake_archive.h"

using namespace amr;
using namespace mirror;
using mirror::test::FakeArchive;
using mirror::test::fileEntry;
using mirror::test::folderEntry;
using mirror::test::fastRetry;


namespace
{
class WalkerRecorder : public WalkerCallback
{
public:
    void onFile(RemoteNode&& node) override
    {
        std::lock_guard dummy(lock_);
        EXPECT_TRUE(files_.emplace(node.relPath, node.sizeHint).second) << node.relPath;
    }

    void onFolderExcluded(const Zstring& relPath) override
    {
        std::lock_guard dummy(lock_);
        excluded_.insert(relPath);
    }

    void onFolderUnreachable(const Zstring& relPath, const std::wstring& msg) override
    {
        std::lock_guard dummy(lock_);
        unreachable_.emplace(relPath, msg);
    }

    void onAutoRetry(const std::wstring& msg, size_t retryNumber) override
    {
        std::lock_guard dummy(lock_);
        retries_.push_back(retryNumber);
    }

    void reportStatus(std::wstring&& msg) override {}

    void onFolderDone() override { ++foldersDone_; }

    std::map<Zstring, std::optional<uint64_t>> files() const { std::lock_guard dummy(lock_); return files_; }
    std::set<Zstring> excluded() const { std::lock_guard dummy(lock_); return excluded_; }
    std::map<Zstring, std::wstring> unreachable() const { std::lock_guard dummy(lock_); return unreachable_; }
    std::vector<size_t> retries() const { std::lock_guard dummy(lock_); return retries_; }
    int foldersDone() const { return foldersDone_; }

private:
    mutable std::mutex lock_;
    std::map<Zstring, std::optional<uint64_t>> files_;
    std::set<Zstring> excluded_;
    std::map<Zstring, std::wstring> unreachable_;
    std::vector<size_t> retries_;
    std::atomic<int> foldersDone_{0};
};


void walk(const FakeArchive& archive, const ExcludeFilter& filter, const RetryPolicy& rp, WalkerCallback& cb)
{
    RemoteWalker walker(archive, filter, rp, 3 /*parallelOps*/, cb);
    walker.start();
    walker.wait();
}
}


TEST(RemoteWalker, ReportsAllFilesOfTheTree)
{
    FakeArchive archive;
    archive.addFolder("", {fileEntry("a.zip", 3), folderEntry("b")});
    archive.addFolder("b", {fileEntry("c.rom", 5), fileEntry("d.zip"), folderEntry("e")});
    archive.addFolder("b/e", {fileEntry("f.bin")});

    WalkerRecorder rec;
    walk(archive, ExcludeFilter({"*.zip"}), fastRetry(), rec);

    //files are reported even if excluded: planning decides about them
    const std::map<Zstring, std::optional<uint64_t>> expected
    {
        {"a.zip", 3},
        {"b/c.rom", 5},
        {"b/d.zip", std::nullopt},
        {"b/e/f.bin", std::nullopt},
    };
    EXPECT_EQ(rec.files(), expected);
    EXPECT_TRUE(rec.unreachable().empty());
    EXPECT_EQ(rec.foldersDone(), 3);
}


TEST(RemoteWalker, ExcludedFolderIsNotListed)
{
    FakeArchive archive;
    archive.addFolder("", {folderEntry("Redump"), folderEntry("No-Intro")});
    archive.addFolder("Redump", {fileEntry("big.iso")});
    archive.addFolder("No-Intro", {fileEntry("small.zip")});

    WalkerRecorder rec;
    walk(archive, ExcludeFilter({"/Redump"}), fastRetry(), rec);

    EXPECT_EQ(archive.getRequestCount("Redump"), 0u);
    EXPECT_EQ(rec.excluded(), std::set<Zstring>({"Redump"}));
    EXPECT_EQ(rec.files().size(), 1u);
    EXPECT_TRUE(rec.files().contains("No-Intro/small.zip"));
}


TEST(RemoteWalker, TransientListingErrorIsRetried)
{
    FakeArchive archive;
    archive.addFolder("", {folderEntry("flaky")});
    archive.addFolder("flaky", {fileEntry("x.bin")});
    archive.failNext("flaky", FakeArchive::Fail::transient, 3);

    const RetryPolicy rp = fastRetry(3);
    const auto startTime = std::chrono::steady_clock::now();

    WalkerRecorder rec;
    walk(archive, ExcludeFilter(), rp, rec);

    //three backoff waits: 1 + 2 + 4 ms
    const auto backoffTotal = getRetryDelay(rp, 1) + getRetryDelay(rp, 2) + getRetryDelay(rp, 3);
    EXPECT_EQ(backoffTotal, std::chrono::milliseconds(7));
    EXPECT_GE(std::chrono::steady_clock::now() - startTime, backoffTotal);

    EXPECT_EQ(archive.getRequestCount("flaky"), 4u);
    EXPECT_EQ(rec.retries(), std::vector<size_t>({1, 2, 3}));
    EXPECT_TRUE(rec.files().contains("flaky/x.bin"));
    EXPECT_TRUE(rec.unreachable().empty());
}


TEST(RemoteWalker, RetriesExhausted)
{
    FakeArchive archive;
    archive.addFolder("", {folderEntry("flaky"), fileEntry("ok.bin")});
    archive.addFolder("flaky", {fileEntry("x.bin")});
    archive.failNext("flaky", FakeArchive::Fail::transient, 10);

    WalkerRecorder rec;
    walk(archive, ExcludeFilter(), fastRetry(2), rec);

    EXPECT_EQ(archive.getRequestCount("flaky"), 3u);
    EXPECT_TRUE(rec.unreachable().contains("flaky"));
    EXPECT_TRUE(rec.files().contains("ok.bin"));
}


TEST(RemoteWalker, UnreachableFolderDoesNotStopSiblings)
{
    FakeArchive archive;
    archive.addFolder("", {folderEntry("missing"), folderEntry("forbidden"), folderEntry("good")});
    archive.addFolder("good", {fileEntry("x.bin")});
    archive.addFolder("forbidden", {fileEntry("y.bin")});
    archive.failNext("forbidden", FakeArchive::Fail::terminal);

    WalkerRecorder rec;
    walk(archive, ExcludeFilter(), fastRetry(), rec);

    const std::map<Zstring, std::wstring> unreachable = rec.unreachable();
    ASSERT_EQ(unreachable.size(), 2u);
    EXPECT_NE(unreachable.at("missing").find(L"404"), std::wstring::npos);
    EXPECT_NE(unreachable.at("forbidden").find(L"403"), std::wstring::npos);

    EXPECT_EQ(archive.getRequestCount("missing"), 1u); //terminal: no retry
    EXPECT_EQ(archive.getRequestCount("forbidden"), 1u);
    EXPECT_TRUE(rec.files().contains("good/x.bin"));
    EXPECT_TRUE(rec.retries().empty());
    EXPECT_EQ(rec.foldersDone(), 4);
}


TEST(RemoteWalker, RootUnreachable)
{
    FakeArchive archive;

    WalkerRecorder rec;
    walk(archive, ExcludeFilter(), fastRetry(), rec);

    EXPECT_TRUE(rec.unreachable().contains(""));
    EXPECT_TRUE(rec.files().empty());
}


TEST(RemoteWalker, SelfReferenceIsReportedAndNotFollowed)
{
    FakeArchive archive;
    archive.addFolder("", {folderEntry("sub")});
    archive.addFolder("sub", {folderEntry(".."), folderEntry("."), fileEntry("a.bin")});

    WalkerRecorder rec;
    walk(archive, ExcludeFilter(), fastRetry(), rec);

    EXPECT_EQ(archive.getRequestCount(""), 1u);
    EXPECT_EQ(archive.getRequestCount("sub"), 1u);
    EXPECT_TRUE(rec.unreachable().contains("sub/.."));
    EXPECT_TRUE(rec.unreachable().contains("sub/."));
    EXPECT_TRUE(rec.files().contains("sub/a.bin"));
}


TEST(RemoteWalker, DuplicateEntriesAreReportedOnce)
{
    FakeArchive archive;
    archive.addFolder("", {fileEntry("a.bin"), fileEntry("a.bin"), folderEntry("sub"), folderEntry("sub")});
    archive.addFolder("sub", {fileEntry("b.bin")});

    WalkerRecorder rec; //fails on duplicate onFile()
    walk(archive, ExcludeFilter(), fastRetry(), rec);

    EXPECT_EQ(rec.files().size(), 2u);
    EXPECT_EQ(archive.getRequestCount("sub"), 1u);
}
