// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef SYNCHRONIZATION_H_8829103746510293
#define SYNCHRONIZATION_H_8829103746510293

#include "exclude_filter.h"
#include "process_callback.h"
#include "remote_archive.h"


namespace mirror
{
/*  mirror the remote archive into SyncConfig::targetFolder:
      - local snapshot, remote walk and downloads run concurrently
      - downloads start while the walk continues
      - per-file and per-folder errors are logged, never thrown
      - final summary is logged as info

    all run state is local to this call => independent runs may execute in parallel  */
SyncStatistics synchronize(const SyncConfig& cfg,
                           const ExcludeFilter& filter,
                           const RemoteArchive& archive,
                           ProcessCallback& callback); //throw X
}

#endif //SYNCHRONIZATION_H_8829103746510293
