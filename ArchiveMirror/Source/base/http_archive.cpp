// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "http_archive.h"
#include <algorithm>
#include <amr/http.h>
#include <amr/thread.h>
#include <libcurl/curl_wrap.h> //DON'T include <curl/curl.h> directly!
#include "listing_parser.h"

using namespace amr;
using namespace mirror;


namespace
{
//keep at most this many idle connections: one per worker thread is enough
const size_t SESSION_POOL_MAX = 32;

//servers close idle keep-alive connections sooner or later: don't bother reusing stale ones
const std::chrono::seconds SESSION_IDLE_TIME_MAX(20);
}


void mirror::parseHttpHeaderLine(const std::string_view& headerLine, HttpResponseInfo& info)
{
    const std::string_view header = trimCpy(headerLine);

    if (startsWith(header, "HTTP/")) //"HTTP/1.1 200 OK", "HTTP/2 503"
    {
        info = HttpResponseInfo();
        const std::string_view statusCode = beforeFirst(afterFirst(header, ' ', IfNotFoundReturn::none), ' ', IfNotFoundReturn::all);
        if (statusCode.size() == 3 && std::all_of(statusCode.begin(), statusCode.end(), [](char c) { return isDigit(c); }))
            info.statusCode = stringTo<int>(statusCode);
        return;
    }

    const std::string_view name  = trimCpy(beforeFirst(header, ':', IfNotFoundReturn::none));
    const std::string_view value = trimCpy(afterFirst (header, ':', IfNotFoundReturn::none));

    if (equalAsciiNoCase(name, "Content-Length"))
    {
        if (!value.empty() && std::all_of(value.begin(), value.end(), [](char c) { return isDigit(c); }))
            info.contentLength = stringTo<uint64_t>(value);
        else
            info.contentLength.reset(); //garbage: rather verify nothing than the wrong size
    }
    else if (equalAsciiNoCase(name, "Last-Modified"))
        info.lastModified = parseHttpDate(std::string(value));
}


void mirror::checkHttpStatus(int statusCode, const std::wstring& errorMsg) //throw FileError, ErrorTransient
{
    if (isSuccessStatus(statusCode))
        return;

    if (isTransientHttpStatus(statusCode))
        throw ErrorTransient(errorMsg, formatHttpError(statusCode));
    throw FileError(errorMsg, formatHttpError(statusCode));
}


class HttpArchive::SessionPool
{
public:
    explicit SessionPool(const std::string& caCertFilePath) : caCertFilePath_(caCertFilePath) {}

    //reuse idle sessions: keeps TCP/TLS connections alive across requests
    std::unique_ptr<HttpSession> take()
    {
        std::unique_ptr<HttpSession> session = idleSessions_.access([](std::vector<std::unique_ptr<HttpSession>>& sessions)
        {
            std::erase_if(sessions, [now = std::chrono::steady_clock::now()](const std::unique_ptr<HttpSession>& s)
            { return now > s->getLastUseTime() + SESSION_IDLE_TIME_MAX; });

            std::unique_ptr<HttpSession> s;
            if (!sessions.empty())
            {
                s = std::move(sessions.back());
                sessions.pop_back();
            }
            return s;
        });
        if (!session)
            session = std::make_unique<HttpSession>(caCertFilePath_);
        return session;
    }

    void giveBack(std::unique_ptr<HttpSession>&& session)
    {
        idleSessions_.access([&](std::vector<std::unique_ptr<HttpSession>>& sessions)
        {
            if (sessions.size() < SESSION_POOL_MAX)
                sessions.push_back(std::move(session));
        });
    }

private:
    const std::string caCertFilePath_;
    Protected<std::vector<std::unique_ptr<HttpSession>>> idleSessions_;
};


HttpArchive::HttpArchive(const std::string& baseUrl, int timeoutSec, const std::string& caCertFilePath) :
    sessionPool_(std::make_unique<SessionPool>(caCertFilePath)),
    baseUrl_(baseUrl),
    timeoutSec_(timeoutSec) {}


HttpArchive::~HttpArchive() {}


HttpResponseInfo HttpArchive::performGet(const std::string& url, const std::wstring& errorMsg,
                                         const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBody) const //throw FileError, ErrorTransient, X
{
    HttpResponseInfo info;
    int statusCode = 0;
    try
    {
        std::unique_ptr<HttpSession> session = sessionPool_->take();

        statusCode = session->get(url, [&](std::string_view headerLine) { parseHttpHeaderLine(headerLine, info); },
                                  [&](std::span<const char> buf)
        {
            if (isSuccessStatus(info.statusCode)) //don't store error pages or redirect bodies
                writeBody(buf.data(), buf.size()); //throw X
        }, timeoutSec_); //throw SysErrorCurl, SysError, ThreadStopRequest, X

        sessionPool_->giveBack(std::move(session)); //not reached on exception: connection state unknown => don't reuse
    }
    catch (const SysErrorCurl& e)
    {
        if (isTransientCurlError(e.curlCode))
            throw ErrorTransient(errorMsg, e.toString());
        throw FileError(errorMsg, e.toString());
    }
    catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }

    checkHttpStatus(statusCode, errorMsg); //throw FileError, ErrorTransient
    info.statusCode = statusCode;
    return info;
}


std::vector<ListingEntry> HttpArchive::getFolderContent(const Zstring& relPath) const //throw FileError, ErrorTransient
{
    std::string url = buildUrl(baseUrl_, relPath);
    if (!endsWith(url, '/'))
        url += '/'; //avoid redirect round-trip

    std::string html;
    performGet(url, replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(relPath))), [&](const void* buffer, size_t bytesToWrite)
    {
        html.append(static_cast<const char*>(buffer), bytesToWrite);
    }); //throw FileError, ErrorTransient

    return parseListing(html);
}


RemoteArchive::StreamAttributes HttpArchive::downloadFile(const Zstring& relPath,
                                                          const std::function<void(const void* buffer, size_t bytesToWrite)>& writeBlock /*throw X*/) const //throw FileError, ErrorTransient, X
{
    const HttpResponseInfo info = performGet(buildUrl(baseUrl_, relPath),
                                             replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(relPath))), writeBlock); //throw FileError, ErrorTransient, X
    return {info.contentLength, info.lastModified};
}


std::wstring HttpArchive::getDisplayPath(const Zstring& relPath) const
{
    std::string displayPath = baseUrl_;
    if (!relPath.empty())
    {
        if (!endsWith(displayPath, '/'))
            displayPath += '/';
        displayPath += relPath;
    }
    return utfTo<std::wstring>(displayPath);
}
