// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef REMOTE_WALKER_H_5520193847561029
#define REMOTE_WALKER_H_5520193847561029

#include <unordered_set>
#include <amr/thread.h>
#include "exclude_filter.h"
#include "remote_archive.h"


namespace mirror
{
//all methods are called from listing worker threads, possibly concurrently => must be thread-safe
struct WalkerCallback
{
    virtual ~WalkerCallback() {}

    virtual void onFile(RemoteNode&& node) = 0; //throw ThreadStopRequest
    virtual void onFolderExcluded(const Zstring& relPath) = 0; //throw ThreadStopRequest
    virtual void onFolderUnreachable(const Zstring& relPath, const std::wstring& msg) = 0; //throw ThreadStopRequest
    virtual void onAutoRetry(const std::wstring& msg, size_t retryNumber) = 0; //throw ThreadStopRequest
    virtual void reportStatus(std::wstring&& msg) = 0; //throw ThreadStopRequest
    virtual void onFolderDone() = 0; //noexcept! listing task finished (successfully or not)
};


/*  discover the remote folder tree with bounded parallelism:
    - each folder listing is one task; file nodes are reported as soon as their folder is listed
    - folders matching an exclude pattern are not listed at all
    - transient listing errors are retried; terminal errors mark the folder unreachable, siblings continue
    - no stable order!

    ~RemoteWalker() stops all workers: in-flight listings see ThreadStopRequest                    */
class RemoteWalker
{
public:
    RemoteWalker(const RemoteArchive& archive, const ExcludeFilter& filter, const RetryPolicy& retry, size_t parallelOps, WalkerCallback& cb);

    void start(); //list archive root; non-blocking

    void wait(); //throw ThreadStopRequest

    //runs on a worker thread (or immediately if already done): call *after* start()!
    void notifyWhenDone(const std::function<void()>& onCompletion /*noexcept!*/) { tg_.notifyWhenDone(onCompletion); }

private:
    RemoteWalker           (const RemoteWalker&) = delete;
    RemoteWalker& operator=(const RemoteWalker&) = delete;

    void scheduleFolder(const Zstring& relPath);
    void processFolder(const Zstring& relPath); //throw ThreadStopRequest

    const RemoteArchive& archive_;
    const ExcludeFilter& filter_;
    const RetryPolicy retry_;
    WalkerCallback& cb_;

    amr::Protected<std::unordered_set<Zstring>> visitedFolders_; //relative paths

    amr::ThreadGroup tg_; //declare last: destroy workers *first*
};
}

#endif //REMOTE_WALKER_H_5520193847561029
