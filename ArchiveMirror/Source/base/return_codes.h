// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef RETURN_CODES_H_2201938475610293
#define RETURN_CODES_H_2201938475610293

#include <cassert>
#include <amr/i18n.h>


namespace mirror
{
enum AmrReturnCode //as returned after process exit
{
    AMR_RC_SUCCESS = 0, //including runs with warnings only: every file was transferred or is already present
    AMR_RC_ERROR,       //failed file or unreachable folder
    AMR_RC_ABORTED, //user cancel or invalid configuration
};


inline
void raiseReturnCode(AmrReturnCode& rc, AmrReturnCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}


enum class SyncResult
{
    finishedSuccess,
    finishedWarning,
    finishedError,
    aborted,
};


inline
AmrReturnCode mapToReturnCode(SyncResult syncStatus)
{
    switch (syncStatus)
    {
        case SyncResult::finishedSuccess:
        case SyncResult::finishedWarning:
            return AMR_RC_SUCCESS;
        case SyncResult::finishedError:
            return AMR_RC_ERROR;
        case SyncResult::aborted:
            return AMR_RC_ABORTED;
    }
    assert(false);
    return AMR_RC_ABORTED;
}


inline
std::wstring getFinalStatusLabel(SyncResult finalStatus)
{
    switch (finalStatus)
    {
        case SyncResult::finishedSuccess:
            return _("Completed successfully");
        case SyncResult::finishedWarning:
            return _("Completed with warnings");
        case SyncResult::finishedError:
            return _("Completed with errors");
        case SyncResult::aborted:
            return _("Stopped");
    }
    assert(false);
    return std::wstring();
}
}

#endif //RETURN_CODES_H_2201938475610293
