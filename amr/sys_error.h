// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef SYS_ERROR_H_1190283746502918
#define SYS_ERROR_H_1190283746502918

#include <cerrno>
#include "i18n.h"
#include "utf.h"
#include "zstring.h"


namespace amr
{
/* Untranslated low-level error detail: an OS, libcurl or HTTP failure, before
   it is wrapped into a translated FileError naming the affected path.        */
class SysError
{
public:
    explicit SysError(const std::wstring& msg) : msg_(msg) {}
    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_SYS_ERROR(X) struct X : public amr::SysError { X(const std::wstring& msg) : SysError(msg) {} };


using ErrorCode = int;

inline ErrorCode getLastError() { return errno; }

//"<code>: <description> [<function>]", each part optional
std::wstring formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg);
std::wstring formatSystemError(const std::string& functionName, ErrorCode ec);


#define THROW_LAST_SYS_ERROR(functionName) \
    do { const amr::ErrorCode ecInternal = amr::getLastError(); throw amr::SysError(amr::formatSystemError(functionName, ecInternal)); } while (false)

//throw SysError naming the failed expression
#define ASSERT_SYSERROR(expr) ASSERT_SYSERROR_IMPL(expr, #expr)
#define ASSERT_SYSERROR_IMPL(expr, exprStr) \
    do { if (!(expr)) throw amr::SysError(L"Assertion failed: \"" L ## exprStr L"\""); } while (false)
}

#endif //SYS_ERROR_H_1190283746502918
