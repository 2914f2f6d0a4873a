// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FAKE_ARCHIVE_H_1102938475610293
#define FAKE_ARCHIVE_H_1102938475610293

#include <deque>
#include <map>
#include <mutex>
#include <amr/string_tools.h>
#include <base/remote_archive.h>


namespace mirror::test
{
/*  in-memory remote archive with scripted failures:
        archive.addFolder("a", {{"b.zip", false, 3}});
        archive.addFile("a/b.zip", "abc");
        archive.failNext("a/b.zip", FakeArchive::Fail::transient, 2); //503, 503, then 200

    unknown paths answer with a terminal "404" error                                     */
class FakeArchive : public RemoteArchive
{
public:
    enum class Fail
    {
        transient,          //e.g. 503 before any data
        terminal,           //e.g. 403
        transientMidStream, //connection reset after half the data
    };

    struct FileDef
    {
        std::string content;
        std::optional<uint64_t> announcedSize; //Content-Length
        std::optional<time_t> modTime;
    };

    void addFolder(const Zstring& relPath, const std::vector<ListingEntry>& entries)
    {
        std::lock_guard dummy(lock_);
        folders_[relPath] = entries;
    }

    void addFile(const Zstring& relPath, const std::string& content, std::optional<time_t> modTime = std::nullopt)
    {
        std::lock_guard dummy(lock_);
        files_[relPath] = {content, content.size(), modTime};
    }

    void setAnnouncedSize(const Zstring& relPath, std::optional<uint64_t> size)
    {
        std::lock_guard dummy(lock_);
        files_[relPath].announcedSize = size;
    }

    void failNext(const Zstring& relPath, Fail kind, size_t count = 1)
    {
        std::lock_guard dummy(lock_);
        for (size_t i = 0; i < count; ++i)
            failures_[relPath].push_back(kind);
    }

    size_t getRequestCount(const Zstring& relPath) const
    {
        std::lock_guard dummy(lock_);
        auto it = requestCount_.find(relPath);
        return it != requestCount_.end() ? it->second : 0;
    }

    std::vector<ListingEntry> getFolderContent(const Zstring& relPath) const override //throw FileError, ErrorTransient
    {
        std::lock_guard dummy(lock_);
        ++requestCount_[relPath];
        throwScriptedFailure(relPath); //throw FileError, ErrorTransient

        auto it = folders_.find(relPath);
        if (it == folders_.end())
            throw amr::FileError(L"Cannot read directory " + getDisplayPath(relPath), L"HTTP status 404: Not found.");
        return it->second;
    }

    StreamAttributes downloadFile(const Zstring& relPath,
                                  const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock) const override //throw FileError, ErrorTransient, X
    {
        FileDef file;
        bool failMidStream = false;
        {
            std::lock_guard dummy(lock_);
            ++requestCount_[relPath];

            if (auto itF = failures_.find(relPath);
                itF != failures_.end() && !itF->second.empty() && itF->second.front() == Fail::transientMidStream)
            {
                itF->second.pop_front();
                failMidStream = true;
            }
            else
                throwScriptedFailure(relPath); //throw FileError, ErrorTransient

            auto it = files_.find(relPath);
            if (it == files_.end())
                throw amr::FileError(L"Cannot read file " + getDisplayPath(relPath), L"HTTP status 404: Not found.");
            file = it->second;
        }

        if (failMidStream)
        {
            writeBlock(file.content.data(), file.content.size() / 2); //throw X
            throw ErrorTransient(L"Cannot read file " + getDisplayPath(relPath), L"Connection reset by peer.");
        }

        //deliver in small blocks
        for (size_t pos = 0; pos < file.content.size(); pos += 4)
            writeBlock(file.content.data() + pos, std::min<size_t>(4, file.content.size() - pos)); //throw X

        return {file.announcedSize, file.modTime};
    }

    std::wstring getDisplayPath(const Zstring& relPath) const override
    {
        return L"fake://archive/" + amr::utfTo<std::wstring>(relPath);
    }

private:
    void throwScriptedFailure(const Zstring& relPath) const //call while holding "lock_"
    {
        auto it = failures_.find(relPath);
        if (it == failures_.end() || it->second.empty())
            return;

        const Fail kind = it->second.front();
        it->second.pop_front();

        if (kind == Fail::terminal)
            throw amr::FileError(L"Cannot access " + getDisplayPath(relPath), L"HTTP status 403: Forbidden.");
        throw ErrorTransient(L"Cannot access " + getDisplayPath(relPath), L"HTTP status 503: Service unavailable.");
    }

    mutable std::mutex lock_;
    std::map<Zstring, std::vector<ListingEntry>> folders_;
    std::map<Zstring, FileDef> files_;
    mutable std::map<Zstring, std::deque<Fail>> failures_;
    mutable std::map<Zstring, size_t> requestCount_;
};


inline
ListingEntry fileEntry(const Zstring& name, std::optional<uint64_t> sizeHint = std::nullopt) { return {name, false, sizeHint}; }

inline
ListingEntry folderEntry(const Zstring& name) { return {name, true, std::nullopt}; }


inline
RetryPolicy fastRetry(size_t retryCount = 3)
{
    RetryPolicy rp;
    rp.retryCount = retryCount;
    rp.retryDelay    = std::chrono::milliseconds(1);
    rp.retryDelayMax = std::chrono::milliseconds(8);
    return rp;
}
}

#endif //FAKE_ARCHIVE_H_1102938475610293
