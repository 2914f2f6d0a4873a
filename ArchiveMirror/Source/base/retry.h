// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef RETRY_H_6650192837465019
#define RETRY_H_6650192837465019

#include <amr/thread.h>
#include "structures.h"


namespace mirror
{
/*  run "fun" until it succeeds or fails terminally:
    - ErrorTransient => wait (exponential backoff) and try again, at most RetryPolicy::retryCount times
    - FileError      => terminal, no retry
    - retries exhausted: the last ErrorTransient is rethrown (caller treats it as terminal)

    onRetry(const ErrorTransient& e, size_t retryNumber) is called before each wait  */
template <class Function, class OnRetry>
auto runWithRetry(const RetryPolicy& rp, Function fun /*throw FileError, ErrorTransient*/, OnRetry onRetry /*throw X*/) //throw FileError, ErrorTransient, ThreadStopRequest, X
{
    for (size_t retryNumber = 1;; ++retryNumber)
    {
        std::optional<ErrorTransient> lastError;
        try
        {
            return fun(); //throw FileError, ErrorTransient
        }
        catch (const ErrorTransient& e)
        {
            if (retryNumber > rp.retryCount)
                throw;
            lastError = e;
        }
        onRetry(*lastError, retryNumber); //throw X
        amr::interruptibleSleep(getRetryDelay(rp, retryNumber)); //throw ThreadStopRequest
    }
}
}

#endif //RETRY_H_6650192837465019
