// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "log_file.h"
#include <amr/file_io.h>
#include <amr/file_path.h>
#include <amr/format_unit.h>
#include <amr/time.h>

using namespace amr;
using namespace mirror;


namespace
{
const int SEPARATION_LINE_LEN = 40;


std::string generateLogHeaderTxt(const ProcessSummary& s, const ErrorLog& log)
{
    const std::string tabSpace(4, ' ');

    std::string headerLine = "ArchiveMirror " + formatLocalDateTime(std::chrono::system_clock::to_time_t(s.startTime));
    headerLine += " [" + utfTo<std::string>(getFinalStatusLabel(s.resultStatus)) + ']';

    std::vector<std::string> results;

    const LogLevelCount logCount = countByLevel(log);
    if (logCount.error > 0)
        results.push_back(utfTo<std::string>(_("Errors:") + L' ' + formatNumber(logCount.error)));
    if (logCount.warning > 0)
        results.push_back(utfTo<std::string>(_("Warnings:") + L' ' + formatNumber(logCount.warning)));

    std::wstring itemsProc = formatNumber(s.statsProcessed.items); //show always, even if 0!
    if (s.statsProcessed.bytes != 0)
        itemsProc += L" (" + formatFilesizeShort(s.statsProcessed.bytes) + L')';
    results.push_back(utfTo<std::string>(_("Items processed:") + L' ' + itemsProc));

    if ((s.statsTotal.items < 0 && s.statsTotal.bytes < 0) || //no total items/bytes: e.g. for pure folder comparison
        s.statsProcessed == s.statsTotal) //...if everything was processed successfully
        ;
    else
        results.push_back(utfTo<std::string>(_("Items remaining:") + L' ' +
                                             formatNumber(s.statsTotal.items - s.statsProcessed.items) + L" (" +
                                             formatFilesizeShort(s.statsTotal.bytes - s.statsProcessed.bytes) + L')'));

    const int64_t totalTimeSec = std::chrono::duration_cast<std::chrono::seconds>(s.totalTime).count();
    results.push_back(utfTo<std::string>(_("Total time:") + L' ' + utfTo<std::wstring>(formatTimeSpan(totalTimeSec))));

    std::string output = headerLine + '\n';
    for (const std::string& str : results)
        output += '|' + tabSpace + str + '\n';

    output += std::string(SEPARATION_LINE_LEN, '_') + "\n\n";
    return output;
}
}


std::string mirror::formatLogAsText(const ProcessSummary& summary, const ErrorLog& log)
{
    std::string output = generateLogHeaderTxt(summary, log);

    for (const LogEntry& entry : log)
    {
        output += formatMessage(entry);
        output += '\n';
    }
    return output;
}


void mirror::saveLogFile(const Zstring& logFilePath, const ProcessSummary& summary, const ErrorLog& log) //throw FileError
{
    if (const std::optional<Zstring> parentPath = getParentFolderPath(logFilePath))
        createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    setFileContent(logFilePath, formatLogAsText(summary, log)); //throw FileError
}
