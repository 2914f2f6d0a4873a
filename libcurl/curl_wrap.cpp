// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "curl_wrap.h"
#include <exception>
#include <fcntl.h>
#include <amr/extra_log.h>
#include <amr/http.h>
#include <amr/thread.h>

using namespace amr;


void amr::libcurlInit()
{
    assert(runningOnMainThread()); //curl_global_init() is not thread-safe
    if (const CURLcode rc = ::curl_global_init(CURL_GLOBAL_DEFAULT);
        rc != CURLE_OK)
        logExtraError(_("Error during process initialization.") + L"\n\n" +
                      formatSystemError("curl_global_init", L"CURLE " + numberTo<std::wstring>(static_cast<int>(rc)), utfTo<std::wstring>(::curl_easy_strerror(rc))));
}


void amr::libcurlTearDown()
{
    assert(runningOnMainThread());
    ::curl_global_cleanup();
}


bool amr::isTransientCurlError(CURLcode sc)
{
    switch (sc)
    {
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_RESOLVE_HOST: //DNS hiccups are common on flaky networks
        case CURLE_COULDNT_CONNECT:
        case CURLE_WEIRD_SERVER_REPLY:
        case CURLE_HTTP2:
        case CURLE_PARTIAL_FILE: //connection dropped mid-body
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_AGAIN:
        case CURLE_NO_CONNECTION_AVAILABLE:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}


namespace
{
//"CURLE 7: Couldn't connect to server"
std::wstring formatCurlCode(CURLcode rc)
{
    return L"CURLE " + numberTo<std::wstring>(static_cast<int>(rc)) + L": " + utfTo<std::wstring>(::curl_easy_strerror(rc));
}


template <class T>
void setOption(CURL* easyHandle, CURLoption option, T value) //throw SysError
{
    if (const CURLcode rc = ::curl_easy_setopt(easyHandle, option, value);
        rc != CURLE_OK)
        throw SysError(formatSystemError("curl_easy_setopt(" + numberTo<std::string>(static_cast<int>(option)) + ')', formatCurlCode(rc), L""));
}


/*  libcurl invokes plain C callbacks: forward to the std::functions of the current request
    - exceptions must not unwind through libcurl: park them and make libcurl abort the transfer */
struct RequestContext
{
    const std::function<void(std::string_view headerLine)>& onHeaderLine;
    const std::function<void(std::span<const char> buf)>& onBody;
    std::exception_ptr callbackError;

    template <class Function>
    size_t run(Function fun, size_t len)
    {
        try
        {
            fun(); //throw X
            return len;
        }
        catch (...) //rethrown after curl_easy_perform()
        {
            callbackError = std::current_exception();
            return len + 1; //=> CURLE_WRITE_ERROR
        }
    }

    static size_t onHeaderData(char* buffer, size_t size, size_t nitems, void* userData)
    {
        auto& ctx = *static_cast<RequestContext*>(userData);
        return ctx.run([&] { if (ctx.onHeaderLine) ctx.onHeaderLine({buffer, size * nitems}); }, size * nitems);
    }

    static size_t onBodyData(char* buffer, size_t size, size_t nitems, void* userData)
    {
        auto& ctx = *static_cast<RequestContext*>(userData);
        return ctx.run([&] { if (ctx.onBody) ctx.onBody({buffer, size * nitems}); }, size * nitems);
    }

    //called periodically, also while waiting for the server: the worker's cancellation point
    static int onProgress(void* userData, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/, curl_off_t /*ultotal*/, curl_off_t /*ulnow*/)
    {
        auto& ctx = *static_cast<RequestContext*>(userData);
        try
        {
            interruptionPoint(); //throw ThreadStopRequest
            return 0;
        }
        catch (const ThreadStopRequest&)
        {
            ctx.callbackError = std::current_exception();
            return 1; //=> CURLE_ABORTED_BY_CALLBACK
        }
    }

    //libcurl does not set FD_CLOEXEC
    static int onSocketCreated(void* userData, curl_socket_t curlfd, curlsocktype /*purpose*/)
    {
        if (::fcntl(curlfd, F_SETFD, FD_CLOEXEC) == -1)
        {
            static_cast<RequestContext*>(userData)->callbackError = std::make_exception_ptr(SysError(formatSystemError("fcntl(FD_CLOEXEC)", errno)));
            return CURL_SOCKOPT_ERROR;
        }
        return CURL_SOCKOPT_OK;
    }
};
}


HttpSession::HttpSession(const std::string& caCertFilePath) :
    caCertFilePath_(caCertFilePath) {}


HttpSession::~HttpSession()
{
    if (easyHandle_)
        ::curl_easy_cleanup(easyHandle_);
}


int HttpSession::get(const std::string& url,
                     const std::function<void(std::string_view headerLine)>& onHeaderLine, /*throw X*/
                     const std::function<void(std::span<const char> buf)>& onBody, /*throw X*/
                     int timeoutSec) //throw SysErrorCurl, SysError, ThreadStopRequest, X
{
    if (easyHandle_)
        ::curl_easy_reset(easyHandle_); //drop options of the previous request, keep its connection
    else if (!(easyHandle_ = ::curl_easy_init()))
        throw SysError(formatSystemError("curl_easy_init", formatCurlCode(CURLE_OUT_OF_MEMORY), L""));

    RequestContext ctx{onHeaderLine, onBody, nullptr};
    char curlErrorBuf[CURL_ERROR_SIZE] = {};

    setOption(easyHandle_, CURLOPT_ERRORBUFFER, curlErrorBuf); //throw SysError
    setOption(easyHandle_, CURLOPT_URL, url.c_str());          //
    setOption(easyHandle_, CURLOPT_USERAGENT, "ArchiveMirror"); //
    setOption(easyHandle_, CURLOPT_FOLLOWLOCATION, 1L);        //
    setOption(easyHandle_, CURLOPT_MAXREDIRS, 10L);            //
    setOption(easyHandle_, CURLOPT_NOSIGNAL, 1L);              //required for multi-threaded use

    //a hard CURLOPT_TIMEOUT would break large downloads: time out on stalls instead
    setOption(easyHandle_, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeoutSec)); //throw SysError
    setOption(easyHandle_, CURLOPT_LOW_SPEED_TIME, static_cast<long>(timeoutSec)); //
    setOption(easyHandle_, CURLOPT_LOW_SPEED_LIMIT, 1L /*[bytes/s]*/);             //

    if (!caCertFilePath_.empty())
        setOption(easyHandle_, CURLOPT_CAINFO, caCertFilePath_.c_str()); //throw SysError

    setOption(easyHandle_, CURLOPT_SOCKOPTFUNCTION, &RequestContext::onSocketCreated); //throw SysError
    setOption(easyHandle_, CURLOPT_SOCKOPTDATA, &ctx);                                //
    setOption(easyHandle_, CURLOPT_XFERINFOFUNCTION, &RequestContext::onProgress);    //
    setOption(easyHandle_, CURLOPT_XFERINFODATA, &ctx);                               //
    setOption(easyHandle_, CURLOPT_NOPROGRESS, 0L);                                   //
    setOption(easyHandle_, CURLOPT_HEADERFUNCTION, &RequestContext::onHeaderData);    //
    setOption(easyHandle_, CURLOPT_HEADERDATA, &ctx);                                 //
    setOption(easyHandle_, CURLOPT_WRITEFUNCTION, &RequestContext::onBodyData);       //
    setOption(easyHandle_, CURLOPT_WRITEDATA, &ctx);                                  //

    const CURLcode rcPerf = ::curl_easy_perform(easyHandle_);

    if (ctx.callbackError)
        std::rethrow_exception(ctx.callbackError); //throw SysError, ThreadStopRequest, X

    long httpStatus = 0;
    ::curl_easy_getinfo(easyHandle_, CURLINFO_RESPONSE_CODE, &httpStatus); //stays 0 if no response was received

    if (rcPerf != CURLE_OK)
    {
        std::wstring details = trimCpy(utfTo<std::wstring>(curlErrorBuf));
        if (httpStatus != 0)
            details += (details.empty() ? L"" : L"\n") + formatHttpError(httpStatus);

        throw SysErrorCurl(formatSystemError("curl_easy_perform", formatCurlCode(rcPerf), details), rcPerf);
    }

    lastUseTime_ = std::chrono::steady_clock::now();
    return static_cast<int>(httpStatus);
}


std::optional<time_t> amr::parseHttpDate(const std::string& httpDate)
{
    if (const time_t modTime = ::curl_getdate(httpDate.c_str(), nullptr);
        modTime != -1)
        return modTime;
    return std::nullopt;
}
