// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef LOCAL_SNAPSHOT_H_9920183746501928
#define LOCAL_SNAPSHOT_H_9920183746501928

#include "structures.h"


namespace mirror
{
/*  inventory of regular files below the target folder (relative paths, '/'-separated)
    - symlinks, devices, pipes and sockets are ignored => such items are replaced by a download
    - target folder not existing: empty snapshot
    - unreadable folders don't abort the scan, but are listed in LocalSnapshot::errors           */
LocalSnapshot takeLocalSnapshot(const Zstring& targetFolder); //throw ThreadStopRequest
}

#endif //LOCAL_SNAPSHOT_H_9920183746501928
