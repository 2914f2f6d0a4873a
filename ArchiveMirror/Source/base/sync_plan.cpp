// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "sync_plan.h"
#include <algorithm>

using namespace amr;
using namespace mirror;


SyncAction mirror::planAction(const RemoteNode& node, const LocalSnapshot& snapshot, const ExcludeFilter& filter)
{
    assert(node.kind == NodeKind::file);

    if (filter.isExcluded(node.relPath, false /*isFolder*/))
        return {SyncActionType::skip, node.relPath, std::nullopt};

    if (snapshot.contains(node.relPath)) //presence only: size and time are not compared
        return {SyncActionType::alreadyExists, node.relPath, std::nullopt};

    return {SyncActionType::download, node.relPath, node.sizeHint};
}


std::vector<Zstring> mirror::findOrphans(const LocalSnapshot& snapshot,
                                         const std::unordered_set<Zstring>& discoveredFiles,
                                         const std::vector<Zstring>& unreachableFolders,
                                         const ExcludeFilter& filter)
{
    auto isBelowUnreachable = [&](const Zstring& relPath)
    {
        return std::any_of(unreachableFolders.begin(), unreachableFolders.end(), [&](const Zstring& folderPath)
        {
            return folderPath.empty() || //root listing failed
                   (startsWith(relPath, folderPath) && relPath.size() > folderPath.size() && relPath[folderPath.size()] == Zstr('/'));
        });
    };

    std::vector<Zstring> orphans;
    for (const auto& [relPath, entry] : snapshot.files)
        if (!discoveredFiles.contains(relPath) &&
            !filter.isExcluded(relPath, false /*isFolder*/) &&
            !isBelowUnreachable(relPath))
            orphans.push_back(relPath);

    std::sort(orphans.begin(), orphans.end());
    return orphans;
}


SyncPlan mirror::planSync(const std::vector<RemoteNode>& nodes, const LocalSnapshot& snapshot, const ExcludeFilter& filter)
{
    SyncPlan plan;
    std::unordered_set<Zstring> discoveredFiles;

    for (const RemoteNode& node : nodes)
        if (node.kind == NodeKind::file)
        {
            plan.actions.push_back(planAction(node, snapshot, filter));
            discoveredFiles.insert(node.relPath);
        }

    plan.orphans = findOrphans(snapshot, discoveredFiles, {}, filter);
    return plan;
}
