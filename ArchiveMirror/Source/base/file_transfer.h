// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FILE_TRANSFER_H_0019283746510293
#define FILE_TRANSFER_H_0019283746510293

#include "remote_archive.h"


namespace mirror
{
//called from transfer worker threads, possibly concurrently => must be thread-safe
struct TransferCallback
{
    virtual ~TransferCallback() {}

    virtual void reportBytes(int64_t bytesDelta) = 0; //noexcept! negative: rollback after failed attempt
    virtual void onAutoRetry(const std::wstring& msg, size_t retryNumber) = 0; //throw ThreadStopRequest
    virtual void reportStatus(std::wstring&& msg) = 0; //throw ThreadStopRequest
    virtual void logWarning(const std::wstring& msg) = 0; //throw ThreadStopRequest
};


/*  download a single file to "targetFolder/relPath":
        1. create parent folders (if missing)
        2. stream to "<final name>.~<random>"
        3. verify size: expected size from listing, else Content-Length
        4. set modification time from Last-Modified (failure => warning only)
        5. rename into place (replacing whatever is there, e.g. a symlink)

    - transient errors are retried with exponential backoff; everything else fails at once
    - the final path never holds a partial file: the temporary file is deleted on any error (and on ThreadStopRequest)
    - errors are *not* thrown but returned as TransferResult::failReason                               */
TransferResult transferFile(const RemoteArchive& archive,
                            const SyncAction& action,
                            const Zstring& targetFolder,
                            const RetryPolicy& retry,
                            TransferCallback& cb); //throw ThreadStopRequest
}

#endif //FILE_TRANSFER_H_0019283746510293
