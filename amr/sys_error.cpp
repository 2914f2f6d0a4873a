// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "sys_error.h"
#include <cstring> //strerrorname_np, strerrordesc_np

using namespace amr;


std::wstring amr::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    //both return nullptr for unknown codes and leave errno alone
    const char* name = ::strerrorname_np(ec);
    const char* desc = ::strerrordesc_np(ec);

    return formatSystemError(functionName,
                             name ? utfTo<std::wstring>(name) : L"Error code " + numberTo<std::wstring>(ec),
                             desc ? utfTo<std::wstring>(desc) : L"");
}


//"ENOSPC: No space left on device [write]"
std::wstring amr::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::vector<std::wstring> parts;
    for (const std::wstring& part : {trimCpy(errorCode), trimCpy(errorMsg)})
        if (!part.empty())
            parts.push_back(part);

    std::wstring output;
    for (const std::wstring& part : parts)
        output += (output.empty() ? L"" : L": ") + part;

    if (!functionName.empty())
        output += (output.empty() ? L"[" : L" [") + utfTo<std::wstring>(functionName) + L']';
    return output;
}
