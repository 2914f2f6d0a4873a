// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef PROCESS_CALLBACK_H_5510293847561029
#define PROCESS_CALLBACK_H_5510293847561029

#include <string>
#include <cstdint>
#include <chrono>


namespace mirror
{
//report status during synchronization: called on the main thread only
struct ProcessCallback
{
    virtual ~ProcessCallback() {}

    /*  the total workload is unknown up front and grows *during* sync:
            1. each download planned by the remote walk adds an item (plus its size, if the listing shows one)
            2. finished download: the estimate is replaced by the number of bytes actually received
            3. failed download: item and bytes are removed again

        must NOT throw: called from destructors to undo statistics!   */
    virtual void updateDataProcessed(int itemsDelta, int64_t bytesDelta) = 0; //noexcept!
    virtual void updateDataTotal    (int itemsDelta, int64_t bytesDelta) = 0; //

    //opportunity to abort: called at least every UI_UPDATE_INTERVAL while the sync is running
    virtual void requestUiUpdate(bool force = false) = 0; //throw X

    //transient UI info: not logged
    virtual void updateStatus(std::wstring&& msg) = 0; //throw X

    enum class MsgType
    {
        info,
        warning, //reported prominently, but does not fail the run
        error,
    };
    virtual void logMessage(const std::wstring& msg, MsgType type) = 0; //throw X
};


//console updates are not more often than necessary
constexpr std::chrono::milliseconds UI_UPDATE_INTERVAL(100);
}

#endif //PROCESS_CALLBACK_H_5510293847561029
