// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef LOG_FILE_H_7720193847561092
#define LOG_FILE_H_7720193847561092

#include <amr/error_log.h>
#include <amr/zstring.h>
#include "status_handler.h"


namespace mirror
{
//summary header + one line (or block) per log entry
std::string formatLogAsText(const ProcessSummary& summary, const amr::ErrorLog& log);

//replaces an existing file; missing parent folders are created
void saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const amr::ErrorLog& log); //throw FileError
}

#endif //LOG_FILE_H_7720193847561092
