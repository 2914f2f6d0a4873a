// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef CURL_WRAP_H_7730129846512093847561
#define CURL_WRAP_H_7730129846512093847561

#include <chrono>
#include <functional>
#include <optional>
#include <span>
#include <string_view>
#include <amr/sys_error.h>


//-------------------------------------------------
#include <curl/curl.h>
//-------------------------------------------------

#ifndef CURLINC_CURL_H
    #error curl.h header guard changed
#endif

namespace amr
{
//process-wide setup: call on the main thread before any HttpSession is created
void libcurlInit();
void libcurlTearDown();


//curl_easy_perform() failed: carries the status code for retry decisions
struct SysErrorCurl : public SysError
{
    SysErrorCurl(const std::wstring& msg, CURLcode sc) : SysError(msg), curlCode(sc) {}

    const CURLcode curlCode;
};

//connection-level problems which may go away when trying again
bool isTransientCurlError(CURLcode sc);


/*  one reusable easy handle: keeps the connection open between requests to the same host
    - not thread-safe: one session per thread at a time
    - redirects are followed; header lines of every response in the chain are reported   */
class HttpSession
{
public:
    explicit HttpSession(const std::string& caCertFilePath /*optional: empty => system default*/);
    ~HttpSession();

    //returns the final HTTP status: 4XX/5XX are *not* reported as error
    int get(const std::string& url,
            const std::function<void(std::string_view headerLine)>& onHeaderLine, /*throw X*/
            const std::function<void(std::span<const char> buf)>& onBody, /*throw X*/
            int timeoutSec); //throw SysErrorCurl, SysError, ThreadStopRequest, X

    std::chrono::steady_clock::time_point getLastUseTime() const { return lastUseTime_; }

private:
    HttpSession           (const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;

    const std::string caCertFilePath_;
    CURL* easyHandle_ = nullptr;
    std::chrono::steady_clock::time_point lastUseTime_ = std::chrono::steady_clock::now();
};


//RFC 7231 HTTP-date => time_t; nullopt if unparsable
std::optional<time_t> parseHttpDate(const std::string& httpDate);
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //CURL_WRAP_H_7730129846512093847561
