// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FILE_ERROR_H_6620194837102934
#define FILE_ERROR_H_6620194837102934

#include "sys_error.h" //we'll need this later anyway!


namespace amr
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public amr::FileError { X(const std::wstring& msg) : FileError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorDiskFull) //no space left on device: likely affects all following writes, too


//failed write(), close() or rename(): ENOSPC and EDQUOT become ErrorDiskFull
[[noreturn]] inline
void throwFileWriteError(const std::wstring& msg, const std::string& functionName, ErrorCode ec) //throw FileError, ErrorDiskFull
{
    if (ec == ENOSPC || ec == EDQUOT)
        throw ErrorDiskFull(msg, formatSystemError(functionName, ec));
    throw FileError(msg, formatSystemError(functionName, ec));
}


//CAVEAT: errno is easily overwritten => evaluate *before* making any (indirect) system calls:
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const amr::ErrorCode ecInternal = amr::getLastError(); throw amr::FileError(msg, amr::formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_6620194837102934
