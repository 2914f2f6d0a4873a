// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <climits> //NAME_MAX
#include <filesystem>
#include <mutex>
#include <gtest/gtest.h>
#include <sys/stat.h>
#include <unistd.h>
#include <amr/file_io.h>
#include <base/file_transfer.h>
#include "fake_archive.h"
#include "test_util.h"

using namespace amr;
using namespace mirror;
using mirror::test::FakeArchive;
using mirror::test::fastRetry;


namespace
{
class TransferRecorder : public TransferCallback
{
public:
    void reportBytes(int64_t bytesDelta) override { bytes_ += bytesDelta; }

    void onAutoRetry(const std::wstring& msg, size_t retryNumber) override
    {
        std::lock_guard dummy(lock_);
        retries_.push_back(retryNumber);
    }

    void reportStatus(std::wstring&& msg) override {}

    void logWarning(const std::wstring& msg) override
    {
        std::lock_guard dummy(lock_);
        warnings_.push_back(msg);
    }

    int64_t bytes() const { return bytes_; }
    std::vector<size_t> retries() const { std::lock_guard dummy(lock_); return retries_; }
    std::vector<std::wstring> warnings() const { std::lock_guard dummy(lock_); return warnings_; }

private:
    mutable std::mutex lock_;
    std::atomic<int64_t> bytes_{0};
    std::vector<size_t> retries_;
    std::vector<std::wstring> warnings_;
};


SyncAction download(const Zstring& relPath, std::optional<uint64_t> expectedSize = std::nullopt)
{
    return {SyncActionType::download, relPath, expectedSize};
}
}


TEST(FileTransfer, Success)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("dir/sub/a.bin", "hello world", 1500000000);

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("dir/sub/a.bin", 11), tmp.path(), fastRetry(), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::success);
    EXPECT_EQ(result.relPath, "dir/sub/a.bin");
    EXPECT_EQ(result.bytes, 11u);
    EXPECT_EQ(result.retries, 0u);
    EXPECT_TRUE(result.failReason.empty());
    EXPECT_EQ(rec.bytes(), 11);

    EXPECT_EQ(test::readTestFile(tmp / "dir/sub/a.bin"), "hello world");
    EXPECT_EQ(test::listTree(tmp.path()), std::set<std::string>({"dir/", "dir/sub/", "dir/sub/a.bin"}));

    struct stat fileInfo = {};
    ASSERT_EQ(::stat((tmp / "dir/sub/a.bin").c_str(), &fileInfo), 0);
    EXPECT_EQ(fileInfo.st_mtime, 1500000000);
}


TEST(FileTransfer, EmptyFile)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("empty.bin", "");

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("empty.bin", 0), tmp.path(), fastRetry(), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::success);
    EXPECT_EQ(test::listTree(tmp.path()), std::set<std::string>({"empty.bin"}));
}


TEST(FileTransfer, SizeMismatchWithListingFails)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("short.bin", "abc");

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("short.bin", 10), tmp.path(), fastRetry(2), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::failed);
    EXPECT_EQ(result.retries, 2u);
    EXPECT_EQ(archive.getRequestCount("short.bin"), 3u);
    EXPECT_FALSE(result.failReason.empty());
    EXPECT_TRUE(test::listTree(tmp.path()).empty()); //neither final nor temporary file
    EXPECT_EQ(rec.bytes(), 0); //failed attempts are rolled back
}


TEST(FileTransfer, SizeMismatchWithContentLengthFails)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("short.bin", "abc");
    archive.setAnnouncedSize("short.bin", 100);

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("short.bin"), tmp.path(), fastRetry(0), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::failed);
    EXPECT_TRUE(test::listTree(tmp.path()).empty());
}


TEST(FileTransfer, NotFoundIsNotRetried)
{
    const test::TempFolder tmp;
    FakeArchive archive;

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("gone.bin"), tmp.path(), fastRetry(3), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::failed);
    EXPECT_EQ(result.retries, 0u);
    EXPECT_EQ(archive.getRequestCount("gone.bin"), 1u);
    EXPECT_NE(result.failReason.find(L"404"), std::wstring::npos);
    EXPECT_TRUE(rec.retries().empty());
    EXPECT_TRUE(test::listTree(tmp.path()).empty());
}


TEST(FileTransfer, TransientErrorIsRetried)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("busy.bin", "0123456789");
    archive.failNext("busy.bin", FakeArchive::Fail::transient, 2);

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("busy.bin", 10), tmp.path(), fastRetry(3), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::retried);
    EXPECT_EQ(result.retries, 2u);
    EXPECT_EQ(rec.retries(), std::vector<size_t>({1, 2}));
    EXPECT_EQ(archive.getRequestCount("busy.bin"), 3u);
    EXPECT_EQ(test::readTestFile(tmp / "busy.bin"), "0123456789");
}


TEST(FileTransfer, InterruptedStreamLeavesNoPartialFile)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("dir/big.bin", "0123456789abcdef");
    archive.failNext("dir/big.bin", FakeArchive::Fail::transientMidStream);

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("dir/big.bin", 16), tmp.path(), fastRetry(0), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::failed);
    EXPECT_EQ(test::listTree(tmp.path()), std::set<std::string>({"dir/"}));
    EXPECT_EQ(rec.bytes(), 0);

    //next run picks up where the first one failed
    TransferRecorder rec2;
    const TransferResult result2 = transferFile(archive, download("dir/big.bin", 16), tmp.path(), fastRetry(0), rec2);

    EXPECT_EQ(result2.outcome, TransferOutcome::success);
    EXPECT_EQ(test::readTestFile(tmp / "dir/big.bin"), "0123456789abcdef");
    EXPECT_EQ(test::listTree(tmp.path()), std::set<std::string>({"dir/", "dir/big.bin"}));
}


TEST(FileTransfer, InterruptedStreamIsRetried)
{
    const test::TempFolder tmp;
    FakeArchive archive;
    archive.addFile("big.bin", "0123456789abcdef");
    archive.failNext("big.bin", FakeArchive::Fail::transientMidStream);

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("big.bin", 16), tmp.path(), fastRetry(1), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::retried);
    EXPECT_EQ(rec.bytes(), 16);
    EXPECT_EQ(test::readTestFile(tmp / "big.bin"), "0123456789abcdef");
}


TEST(FileTransfer, SymlinkAtTargetIsReplaced)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "elsewhere.bin", "keep");
    ASSERT_EQ(::symlink((tmp / "elsewhere.bin").c_str(), (tmp / "a.bin").c_str()), 0);

    FakeArchive archive;
    archive.addFile("a.bin", "new");

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download("a.bin", 3), tmp.path(), fastRetry(), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::success);
    EXPECT_FALSE(std::filesystem::is_symlink(tmp / "a.bin"));
    EXPECT_EQ(test::readTestFile(tmp / "a.bin"), "new");
    EXPECT_EQ(test::readTestFile(tmp / "elsewhere.bin"), "keep");
}


TEST(FileTransfer, NameNearLengthLimit)
{
    const test::TempFolder tmp;
    const Zstring longName = Zstring(250, 'n') + ".bin"; //254 bytes: no room for a temp suffix

    FakeArchive archive;
    archive.addFile(longName, "data");

    TransferRecorder rec;
    const TransferResult result = transferFile(archive, download(longName, 4), tmp.path(), fastRetry(), rec);

    EXPECT_EQ(result.outcome, TransferOutcome::success);
    EXPECT_EQ(test::listTree(tmp.path()), std::set<std::string>({longName}));
}


TEST(TempFileName, Layout)
{
    const Zstring tmpPath = getPathWithTempName("/mirror/dir/a.bin");
    EXPECT_TRUE(startsWith(tmpPath, "/mirror/dir/a.bin.~"));
    EXPECT_EQ(tmpPath.size(), std::string("/mirror/dir/a.bin.~").size() + 4);
    EXPECT_TRUE(isTempFileName(getItemName(tmpPath)));

    EXPECT_TRUE(startsWith(getPathWithTempName("a.bin"), "a.bin.~"));

    EXPECT_FALSE(isTempFileName("a.bin"));
    EXPECT_FALSE(isTempFileName(".~abcd"));
    EXPECT_FALSE(isTempFileName("a.~ABCD"));
    EXPECT_FALSE(isTempFileName("a.~abc"));
    EXPECT_FALSE(isTempFileName("a.bin.tmp"));
}


TEST(TempFileName, LongNamesAreShortened)
{
    const Zstring asciiName(NAME_MAX, 'a');
    const Zstring asciiTmp = getItemName(getPathWithTempName("/mirror/" + asciiName));
    EXPECT_EQ(asciiTmp.size(), static_cast<size_t>(NAME_MAX));
    EXPECT_TRUE(startsWith(asciiTmp, Zstring(NAME_MAX - 6, 'a') + ".~"));

    Zstring utf8Name; //"ä" x 127 = 254 bytes
    for (int i = 0; i < 127; ++i)
        utf8Name += "\xc3\xa4";
    const Zstring utf8Tmp = getItemName(getPathWithTempName("/mirror/" + utf8Name));
    EXPECT_LE(utf8Tmp.size(), static_cast<size_t>(NAME_MAX));
    EXPECT_TRUE(startsWith(utf8Tmp, utf8Name.substr(0, 248) + ".~")); //cut between two characters
    EXPECT_TRUE(isTempFileName(utf8Tmp));
}


TEST(FileWriteError, DiskFullCodes)
{
    EXPECT_THROW(throwFileWriteError(L"Cannot write file \"a.bin\".", "write", ENOSPC), ErrorDiskFull);
    EXPECT_THROW(throwFileWriteError(L"Cannot write file \"a.bin\".", "close", EDQUOT), ErrorDiskFull);
    EXPECT_THROW(throwFileWriteError(L"Cannot rename \"a.bin.~1234\" to \"a.bin\".", "rename", ENOSPC), ErrorDiskFull);

    try
    {
        throwFileWriteError(L"Cannot write file \"a.bin\".", "close", EIO);
        ADD_FAILURE();
    }
    catch (const ErrorDiskFull&) { ADD_FAILURE(); }
    catch (const FileError& e) { EXPECT_TRUE(contains(e.toString(), L"EIO")); }
}

