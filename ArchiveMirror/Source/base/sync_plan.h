// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef SYNC_PLAN_H_1209384756102938
#define SYNC_PLAN_H_1209384756102938

#include <unordered_set>
#include "exclude_filter.h"
#include "structures.h"


namespace mirror
{
//pure function of (remote file, local snapshot, exclusion rules): independent from walk order and other files
SyncAction planAction(const RemoteNode& node, const LocalSnapshot& snapshot, const ExcludeFilter& filter);

//local files never seen remotely: reported, but never deleted
std::vector<Zstring> findOrphans(const LocalSnapshot& snapshot,
                                 const std::unordered_set<Zstring>& discoveredFiles,
                                 const std::vector<Zstring>& unreachableFolders, //contents unknown => nothing there is an orphan
                                 const ExcludeFilter& filter);

struct SyncPlan
{
    std::vector<SyncAction> actions; //one per file node
    std::vector<Zstring> orphans;
};
//plan a complete, already discovered tree
SyncPlan planSync(const std::vector<RemoteNode>& nodes, const LocalSnapshot& snapshot, const ExcludeFilter& filter);
}

#endif //SYNC_PLAN_H_1209384756102938
