// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "structures.h"
#include <algorithm>
#include <amr/format_unit.h>

using namespace amr;
using namespace mirror;


std::chrono::milliseconds mirror::getRetryDelay(const RetryPolicy& rp, size_t retryNumber)
{
    assert(retryNumber >= 1);
    std::chrono::milliseconds delay = rp.retryDelay;
    for (size_t i = 1; i < retryNumber; ++i)
    {
        if (delay >= rp.retryDelayMax) //avoid overflow
            break;
        delay *= 2;
    }
    return std::min(delay, rp.retryDelayMax);
}


std::wstring mirror::getSyncSummary(const SyncStatistics& st)
{
    std::wstring summary = replaceCpy(replaceCpy(replaceCpy(replaceCpy(_("Downloaded %x files (%y skipped, %z already present, %w failed)"),
                                                                       L"%x", formatNumber(st.downloaded)),
                                                            L"%y", formatNumber(st.skipped)),
                                                 L"%z", formatNumber(st.alreadyPresent)),
                                      L"%w", formatNumber(st.failed));

    summary += L", " + formatFilesizeShort(st.bytesDownloaded);

    if (st.retried > 0)
        summary += L'\n' + replaceCpy(_("Succeeded after automatic retry: %x"), L"%x", formatNumber(st.retried));

    if (!st.unreachableFolders.empty())
    {
        summary += L'\n' + replaceCpy(_("Unreachable folders: %x"), L"%x", formatNumber(st.unreachableFolders.size()));
        for (const Zstring& relPath : st.unreachableFolders)
            summary += L"\n    " + utfTo<std::wstring>(relPath);
    }
    return summary;
}
