// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef STRUCTURES_H_8820019283746510
#define STRUCTURES_H_8820019283746510

#include <chrono>
#include <optional>
#include <unordered_map>
#include <vector>
#include <amr/file_error.h>
#include <amr/zstring.h>


namespace mirror
{
//network or server hiccup: worth another attempt after some delay
DEFINE_NEW_FILE_ERROR(ErrorTransient)


enum class NodeKind
{
    file,
    folder,
};

//discovered by the remote walk; relative to the archive root, '/'-separated, never empty
struct RemoteNode
{
    Zstring relPath;
    NodeKind kind = NodeKind::file;
    std::optional<uint64_t> sizeHint; //as shown by the listing (if at all)
};


//entry of a remote folder listing: a single path segment
struct ListingEntry
{
    Zstring name;
    bool isFolder = false;
    std::optional<uint64_t> sizeHint;
};


struct LocalEntry
{
    Zstring relPath;
    uint64_t sizeOnDisk = 0;
};

//regular files found below the target folder (relative path => entry)
struct LocalSnapshot
{
    std::unordered_map<Zstring, LocalEntry> files;
    std::vector<std::wstring> errors; //folders that could not be read completely

    bool contains(const Zstring& relPath) const { return files.contains(relPath); }
};


enum class SyncActionType
{
    download,
    skip,          //excluded by pattern
    alreadyExists, //present locally: presence is all that counts
};

struct SyncAction
{
    SyncActionType type = SyncActionType::download;
    Zstring relPath;
    std::optional<uint64_t> expectedSize; //download only
};


enum class TransferOutcome
{
    success,
    retried, //success after at least one automatic retry
    failed,
};

struct TransferResult
{
    Zstring relPath;
    TransferOutcome outcome = TransferOutcome::failed;
    std::wstring failReason; //failed only
    size_t retries = 0;
    uint64_t bytes = 0;
    bool diskFull = false;
};


struct RetryPolicy
{
    size_t retryCount = 3; //automatic retries *after* the first attempt
    std::chrono::milliseconds retryDelay{std::chrono::seconds(2)}; //doubles with each retry
    std::chrono::milliseconds retryDelayMax{std::chrono::seconds(60)};
};

//retryNumber: 1-based
std::chrono::milliseconds getRetryDelay(const RetryPolicy& rp, size_t retryNumber);


const char DEFAULT_BASE_URL[] = "https://myrient.erista.me/files";

struct SyncConfig
{
    std::string baseUrl = DEFAULT_BASE_URL;
    Zstring targetFolder;

    std::vector<Zstring> excludePatterns;
    std::vector<Zstring> excludeFiles;

    size_t listingParallel  = 4;
    size_t transferParallel = 4;

    RetryPolicy retry;
    int timeoutSec = 20;

    bool reportOrphans = true;
    Zstring logFilePath; //optional
};


struct SyncStatistics
{
    int downloaded     = 0; //including retried
    int retried        = 0;
    int skipped        = 0;
    int alreadyPresent = 0;
    int failed         = 0;
    int excludedFolders = 0; //not listed at all
    int64_t bytesDownloaded = 0;
    bool diskFull = false;

    std::vector<Zstring> unreachableFolders;
    std::vector<Zstring> orphans;
    std::vector<TransferResult> transfers;

    int fileNodesTotal() const { return downloaded + failed + skipped + alreadyPresent; }
};

std::wstring getSyncSummary(const SyncStatistics& st);
}

#endif //STRUCTURES_H_8820019283746510
