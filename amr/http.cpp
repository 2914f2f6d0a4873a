// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "http.h"
#include <utility>
#include "string_tools.h"

using namespace amr;


namespace
{
//statuses an archive server typically answers with; others are shown by number only
const std::pair<int, const wchar_t*> httpStatusDescriptions[] =
{
    {301, L"Moved permanently."},
    {302, L"Moved temporarily."},
    {400, L"Bad request."},
    {401, L"Unauthorized."},
    {403, L"Forbidden."},
    {404, L"Not found."},
    {408, L"Request timeout."},
    {410, L"Gone."},
    {429, L"Too many requests."},
    {500, L"Internal server error."},
    {502, L"Bad gateway."},
    {503, L"Service unavailable."},
    {504, L"Gateway timeout."},
};
}


std::wstring amr::formatHttpError(int httpStatus)
{
    std::wstring description;
    for (const auto& [status, text] : httpStatusDescriptions)
        if (status == httpStatus)
            description = text;

    return formatSystemError("", L"HTTP status " + numberTo<std::wstring>(httpStatus), description);
}


bool amr::isTransientHttpStatus(int httpStatus)
{
    return httpStatus >= 500 ||
           httpStatus == 408 || //request timeout
           httpStatus == 429;   //too many requests
}


std::string amr::encodeUrlSegment(const std::string_view& segment)
{
    std::string output;
    for (const char c : segment)
        if (('0' <= c && c <= '9') ||
            ('A' <= c && c <= 'Z') ||
            ('a' <= c && c <= 'z') ||
            c == '-' || c == '.' || c == '_' || c == '~')
            output += c;
        else
        {
            const auto [high, low] = hexify(c);
            output += '%';
            output += high;
            output += low;
        }
    return output;
}


std::string amr::encodeUrlPath(const std::string_view& relPath)
{
    std::string output;
    bool first = true;
    split(relPath, '/', [&](const std::string_view segment)
    {
        if (!first)
            output += '/';
        first = false;
        output += encodeUrlSegment(segment);
    });
    return output;
}


std::string amr::decodeUrlSegment(const std::string_view& str)
{
    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
    {
        const char c = str[i];
        if (c == '%' && str.size() - i >= 3 &&
            isHexDigit(str[i + 1]) &&
            isHexDigit(str[i + 2]))
        {
            output += unhexify(str[i + 1], str[i + 2]);
            i += 2;
        }
        else
            output += c;
    }
    return output;
}


std::string amr::buildUrl(const std::string_view& baseUrl, const std::string_view& relPath)
{
    std::string url(baseUrl);
    while (endsWith(url, '/'))
        url.pop_back();

    if (relPath.empty())
        return url + '/';

    url += '/';
    url += encodeUrlPath(relPath);
    return url;
}
