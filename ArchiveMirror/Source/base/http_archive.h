// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef HTTP_ARCHIVE_H_3309182746501928
#define HTTP_ARCHIVE_H_3309182746501928

#include <ctime>
#include <memory>
#include <optional>
#include <string_view>
#include "remote_archive.h"


namespace mirror
{
//headers of the most recent response: libcurl reports the headers of *every* hop of a redirect chain
struct HttpResponseInfo
{
    int statusCode = 0;
    std::optional<uint64_t> contentLength;
    std::optional<time_t> lastModified;
};
//a status line ("HTTP/1.1 302 Found") starts a new response and discards the previous headers
void parseHttpHeaderLine(const std::string_view& headerLine, HttpResponseInfo& info);

inline bool isSuccessStatus(int statusCode) { return 200 <= statusCode && statusCode < 300; }

//2XX: no-op; 5XX, 408, 429: ErrorTransient; anything else: FileError
void checkHttpStatus(int statusCode, const std::wstring& errorMsg); //throw FileError, ErrorTransient


//archive served as HTML folder index pages via HTTP(S)
class HttpArchive : public RemoteArchive
{
public:
    HttpArchive(const std::string& baseUrl, int timeoutSec, const std::string& caCertFilePath /*optional*/);
    ~HttpArchive();

    std::vector<ListingEntry> getFolderContent(const Zstring& relPath) const override; //throw FileError, ErrorTransient

    StreamAttributes downloadFile(const Zstring& relPath,
                                  const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) const override; //throw FileError, ErrorTransient, X

    std::wstring getDisplayPath(const Zstring& relPath) const override;

private:
    HttpArchive           (const HttpArchive&) = delete;
    HttpArchive& operator=(const HttpArchive&) = delete;

    HttpResponseInfo performGet(const std::string& url, const std::wstring& errorMsg,
                                const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBody) const; //throw FileError, ErrorTransient, X

    class SessionPool;
    const std::unique_ptr<SessionPool> sessionPool_;

    const std::string baseUrl_;
    const int timeoutSec_;
};
}

#endif //HTTP_ARCHIVE_H_3309182746501928
