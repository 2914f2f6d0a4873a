// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef EXTRA_LOG_H_3301928475610928
#define EXTRA_LOG_H_3301928475610928

#include "error_log.h"
#include <utility>
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - while an exception is in flight
    - cleanup errors in destructors (e.g. failure to delete an incomplete temporary file)

    the sync run collects these via fetchExtraLog() and merges them into its own log   */

namespace amr
{
namespace impl
{
inline
Protected<ErrorLog>& refGlobalExtraLog()
{
    static Protected<ErrorLog> extraLog; //thread-safe init: C++11 magic statics
    return extraLog;
}
}


inline
ErrorLog fetchExtraLog()
{
    return impl::refGlobalExtraLog().access([](ErrorLog& log) { return std::exchange(log, ErrorLog()); });
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::refGlobalExtraLog().access([&](ErrorLog& log) { logMsg(log, msg, LogLevel::error); });
}
}

#endif //EXTRA_LOG_H_3301928475610928
