// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef HTTP_H_8810293746510293
#define HTTP_H_8810293746510293

#include "sys_error.h"


namespace amr
{
//"HTTP status 503: Service unavailable."
std::wstring formatHttpError(int httpStatus);

//status codes a server may answer differently when asked again later
bool isTransientHttpStatus(int httpStatus);

//RFC 3986: percent-encode everything except unreserved characters
std::string encodeUrlSegment(const std::string_view& segment);
std::string encodeUrlPath   (const std::string_view& relPath); //keeps '/' separators

//decode %XX escapes; '+' is left as is (no form encoding)
std::string decodeUrlSegment(const std::string_view& str);

//"https://host/files" + "a b/c.zip" => "https://host/files/a%20b/c.zip"
std::string buildUrl(const std::string_view& baseUrl, const std::string_view& relPath);
}

#endif //HTTP_H_8810293746510293
