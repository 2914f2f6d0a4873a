// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "file_transfer.h"
#include <amr/extra_log.h>
#include <amr/file_io.h>
#include <amr/file_path.h>
#include <amr/format_unit.h>
#include <amr/scope_guard.h>
#include "retry.h"

using namespace amr;
using namespace mirror;


namespace
{
//throw FileError, ErrorTransient, ThreadStopRequest
uint64_t downloadOnce(const RemoteArchive& archive, const SyncAction& action, const Zstring& targetPath, TransferCallback& cb)
{
    if (const std::optional<Zstring> parentPath = getParentFolderPath(targetPath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    const Zstring tmpPath = getPathWithTempName(targetPath);

    int64_t bytesReported = 0;
    AMR_ON_SCOPE_FAIL(cb.reportBytes(-bytesReported)); //failed attempt: data will be transferred again

    FileOutputPlain fileOut(tmpPath); //throw FileError
    //=> ~FileOutputPlain() deletes temporary file unless closed!

    const RemoteArchive::StreamAttributes attr = archive.downloadFile(action.relPath, [&](const void* buffer, size_t bytesToWrite)
    {
        if (bytesToWrite > 0)
        {
            fileOut.write(buffer, bytesToWrite); //throw FileError, ErrorDiskFull
            bytesReported += bytesToWrite;
            cb.reportBytes(bytesToWrite); //noexcept
        }
        interruptionPoint(); //throw ThreadStopRequest
    }); //throw FileError, ErrorTransient, ThreadStopRequest

    const uint64_t bytesWritten = fileOut.getBytesWritten();

    //connection dropped without error? => verify: don't trust libcurl or the server to notice
    if (const std::optional<uint64_t> expectedSize = action.expectedSize ? action.expectedSize : attr.fileSize;
        expectedSize && *expectedSize != bytesWritten)
        throw ErrorTransient(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(archive.getDisplayPath(action.relPath))),
                             replaceCpy(replaceCpy(_("Unexpected size of data stream.\nExpected: %x bytes\nActual: %y bytes"),
                                                   L"%x", formatNumber(*expectedSize)),
                                        L"%y", formatNumber(bytesWritten)));
    fileOut.close(); //throw FileError, ErrorDiskFull

    AMR_ON_SCOPE_FAIL(try { removeFilePlain(tmpPath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    if (attr.modTime)
        try
        {
            setFileTime(tmpPath, *attr.modTime); //throw FileError
        }
        catch (const FileError& e) { cb.logWarning(e.toString()); } //throw ThreadStopRequest

    renameItem(tmpPath, targetPath); //throw FileError, ErrorDiskFull
    return bytesWritten;
}
}


TransferResult mirror::transferFile(const RemoteArchive& archive,
                                    const SyncAction& action,
                                    const Zstring& targetFolder,
                                    const RetryPolicy& retry,
                                    TransferCallback& cb) //throw ThreadStopRequest
{
    assert(action.type == SyncActionType::download);

    TransferResult result;
    result.relPath = action.relPath;

    cb.reportStatus(replaceCpy(_("Downloading file %x..."), L"%x", fmtPath(archive.getDisplayPath(action.relPath)))); //throw ThreadStopRequest

    const Zstring targetPath = appendPath(targetFolder, action.relPath);
    try
    {
        result.bytes = runWithRetry(retry, [&] { return downloadOnce(archive, action, targetPath, cb); }, //throw FileError, ErrorTransient, ThreadStopRequest
                                    [&](const ErrorTransient& e, size_t retryNumber)
        {
            result.retries = retryNumber;
            cb.onAutoRetry(e.toString(), retryNumber); //throw ThreadStopRequest
        });

        result.outcome = result.retries > 0 ? TransferOutcome::retried : TransferOutcome::success;
    }
    catch (const ErrorDiskFull& e)
    {
        result.outcome = TransferOutcome::failed;
        result.failReason = e.toString();
        result.diskFull = true;
    }
    catch (const FileError& e) //terminal, or retries exhausted
    {
        result.outcome = TransferOutcome::failed;
        result.failReason = e.toString();
    }
    return result;
}
