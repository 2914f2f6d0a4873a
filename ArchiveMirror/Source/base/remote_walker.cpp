// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "remote_walker.h"
#include <algorithm>
#include "retry.h"

using namespace amr;
using namespace mirror;


RemoteWalker::RemoteWalker(const RemoteArchive& archive, const ExcludeFilter& filter, const RetryPolicy& retry, size_t parallelOps, WalkerCallback& cb) :
    archive_(archive),
    filter_(filter),
    retry_(retry),
    cb_(cb),
    tg_(std::max<size_t>(parallelOps, 1), Zstr("Listing")) {}


void RemoteWalker::start()
{
    visitedFolders_.access([](std::unordered_set<Zstring>& visited) { visited.insert(Zstring()); });
    scheduleFolder(Zstring());
}


void RemoteWalker::wait() //throw ThreadStopRequest
{
    tg_.wait(); //throw ThreadStopRequest
}


void RemoteWalker::scheduleFolder(const Zstring& relPath)
{
    tg_.run([this, relPath] { processFolder(relPath); });
}


void RemoteWalker::processFolder(const Zstring& relPath) //throw ThreadStopRequest
{
    AMR_ON_SCOPE_EXIT(cb_.onFolderDone());

    cb_.reportStatus(replaceCpy(_("Scanning: %x"), L"%x", fmtPath(archive_.getDisplayPath(relPath)))); //throw ThreadStopRequest

    std::vector<ListingEntry> entries;
    try
    {
        entries = runWithRetry(retry_, [&] { return archive_.getFolderContent(relPath); }, //throw FileError, ErrorTransient
                               [&](const ErrorTransient& e, size_t retryNumber) { cb_.onAutoRetry(e.toString(), retryNumber); }); //throw ThreadStopRequest
    }
    catch (const FileError& e) //terminal, or retries exhausted
    {
        cb_.onFolderUnreachable(relPath, e.toString()); //throw ThreadStopRequest
        return;
    }

    std::unordered_set<Zstring> itemNames; //some servers list an item twice

    for (ListingEntry& entry : entries)
    {
        if (entry.name.empty() || contains(entry.name, Zstr('/'))) //not a single path segment
            continue;

        if (!itemNames.insert(entry.name).second)
            continue;

        const Zstring childPath = relPath.empty() ? entry.name : relPath + Zstr('/') + entry.name;

        if (entry.name == Zstr(".") || entry.name == Zstr(".."))
        {
            //listing refers to itself or a parent: following it would never end
            if (entry.isFolder)
                cb_.onFolderUnreachable(childPath, replaceCpy(_("The folder listing of %x refers back to itself."), L"%x",
                                                              fmtPath(archive_.getDisplayPath(relPath)))); //throw ThreadStopRequest
            continue;
        }

        if (entry.isFolder)
        {
            if (filter_.isExcluded(childPath, true /*isFolder*/))
            {
                cb_.onFolderExcluded(childPath); //throw ThreadStopRequest
                continue;
            }

            if (visitedFolders_.access([&](std::unordered_set<Zstring>& visited) { return visited.insert(childPath).second; }))
                scheduleFolder(childPath);
            //else: listed twice => already scheduled
        }
        else
            cb_.onFile({childPath, NodeKind::file, entry.sizeHint}); //throw ThreadStopRequest
    }
}
