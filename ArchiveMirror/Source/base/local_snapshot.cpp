// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "local_snapshot.h"
#include <amr/file_access.h>
#include <amr/file_io.h>
#include <amr/file_path.h>
#include <amr/file_traverser.h>
#include <amr/thread.h>

using namespace amr;
using namespace mirror;


LocalSnapshot mirror::takeLocalSnapshot(const Zstring& targetFolder) //throw ThreadStopRequest
{
    LocalSnapshot snapshot;
    try
    {
        if (!itemExists(targetFolder)) //throw FileError
            return snapshot; //first run: nothing downloaded yet
    }
    catch (const FileError& e)
    {
        snapshot.errors.push_back(e.toString());
        return snapshot;
    }

    std::vector<std::pair<Zstring /*folderPath*/, Zstring /*relPath*/>> workload{{targetFolder, Zstring()}};

    while (!workload.empty())
    {
        interruptionPoint(); //throw ThreadStopRequest

        auto [folderPath, relPathParent] = std::move(workload.back());
        workload.pop_back();

        auto getRelPath = [&relPathParent = relPathParent](const Zstring& itemName)
        {
            return relPathParent.empty() ? itemName : relPathParent + Zstr('/') + itemName;
        };

        try
        {
            for (const DirItem& item : readDirectory(folderPath)) //throw FileError
                if (item.type == DirItemType::folder)
                    workload.emplace_back(appendPath(folderPath, item.name), getRelPath(item.name));
                else if (item.type == DirItemType::file && !isTempFileName(item.name)) //leftover of an interrupted run: neither present nor orphaned
                {
                    Zstring relPath = getRelPath(item.name);
                    snapshot.files.emplace(relPath, LocalEntry{relPath, item.fileSize});
                }
        }
        catch (const FileError& e) { snapshot.errors.push_back(e.toString()); } //continue with remaining folders
    }
    return snapshot;
}
