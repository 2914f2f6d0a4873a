// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef REMOTE_ARCHIVE_H_7710293846510293
#define REMOTE_ARCHIVE_H_7710293846510293

#include <functional>
#include "structures.h"


namespace mirror
{
/*  read-only view of the remote archive; paths are relative to the archive root ('/'-separated, empty for root)

    error classes:  ErrorTransient => try again later (connection reset, timeout, 5xx, 408, 429)
                    FileError      => terminal (404, 403, other 4xx, malformed response)

    implementations must be thread-safe: listing and transfer workers call concurrently */
class RemoteArchive
{
public:
    virtual ~RemoteArchive() {}

    virtual std::vector<ListingEntry> getFolderContent(const Zstring& relPath) const = 0; //throw FileError, ErrorTransient

    struct StreamAttributes
    {
        std::optional<uint64_t> fileSize; //announced by server (Content-Length), if at all
        std::optional<time_t> modTime;    //Last-Modified, if at all
    };
    //streams the file content block-wise; writeBlock() is not called for error responses
    virtual StreamAttributes downloadFile(const Zstring& relPath,
                                          const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) const = 0; //throw FileError, ErrorTransient, X

    virtual std::wstring getDisplayPath(const Zstring& relPath) const = 0;
};
}

#endif //REMOTE_ARCHIVE_H_7710293846510293
