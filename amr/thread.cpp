// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "thread.h"
#include <stdexcept>
#include <utility>
#include <sys/prctl.h>
#include "string_tools.h"

using namespace amr;


void amr::setCurrentThreadName(const Zstring& threadName)
{
    //Linux limits thread names to 15 chars + null: longer names are truncated
    ::prctl(PR_SET_NAME, threadName.substr(0, 15).c_str(), 0, 0, 0);
}


namespace
{
//don't make this a function-scope static (avoid code-gen for "magic static")
const std::thread::id globalMainThreadId = std::this_thread::get_id();
}


bool amr::runningOnMainThread()
{
    if (globalMainThreadId == std::thread::id()) //if called during static initialization!
        return true;

    return std::this_thread::get_id() == globalMainThreadId;
}


ThreadGroup::ThreadGroup(size_t threadCountMax, const Zstring& groupName) :
    threadCountMax_(threadCountMax),
    groupName_(groupName)
{
    if (threadCountMax == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


ThreadGroup::~ThreadGroup()
{
    std::vector<Worker> workers;
    {
        std::lock_guard dummy(workLoad_->lock);
        workLoad_->shuttingDown = true; //workers calling run() must not start new threads from now on
        workers.swap(workers_);
    }
    for (Worker& w : workers) //stop *all* before joining the first: don't wait for each task to notice one after another
        w.stopState->requestStop();

    for (Worker& w : workers)
        w.thread.join();
}


void ThreadGroup::run(Task&& task)
{
    {
        std::lock_guard dummy(workLoad_->lock);

        workLoad_->tasks.push_back(std::move(task));
        const size_t tasksPending = ++workLoad_->tasksPending;

        if (!workLoad_->shuttingDown && workers_.size() < std::min(tasksPending, threadCountMax_))
            addWorker();
    }
    workLoad_->conditionNewTask.notify_all();
}


void ThreadGroup::addWorker() //call while holding WorkLoad::lock
{
    const Zstring threadName = groupName_ + Zstr('[') + numberTo<Zstring>(workers_.size() + 1) + Zstr('/') + numberTo<Zstring>(threadCountMax_) + Zstr(']');
    auto stopState = std::make_shared<impl::StopState>();

    std::thread thread([workLoad = workLoad_, stopState, threadName] //don't capture "this": workers must not depend on ThreadGroup's lifetime
    {
        setCurrentThreadName(threadName);
        impl::threadStopState = stopState.get();
        try
        {
            workerLoop(*workLoad); //throw ThreadStopRequest
        }
        catch (ThreadStopRequest&) {}
    });
    workers_.push_back({std::move(thread), std::move(stopState)});
}


void ThreadGroup::workerLoop(WorkLoad& wl) //throw ThreadStopRequest
{
    std::unique_lock dummy(wl.lock);
    for (;;)
    {
        interruptibleWait(wl.conditionNewTask, dummy, [&wl] { return !wl.tasks.empty(); }); //throw ThreadStopRequest

        Task task = std::move(wl.tasks.front());
        wl.tasks.pop_front();

        dummy.unlock();
        task(); //throw ThreadStopRequest
        dummy.lock();

        if (--wl.tasksPending == 0 && !wl.onCompletionCallbacks.empty())
        {
            const std::vector<std::function<void()>> callbacks = std::exchange(wl.onCompletionCallbacks, {});

            dummy.unlock();
            for (const auto& onCompletion : callbacks)
                onCompletion(); //noexcept!
            dummy.lock();
        }
    }
}


void ThreadGroup::wait() //throw ThreadStopRequest
{
    auto promDone = std::make_shared<std::promise<void>>();
    std::future<void> futDone = promDone->get_future();

    notifyWhenDone([promDone] { promDone->set_value(); }); //std::function needs a copyable callable => shared_ptr

    while (futDone.wait_for(std::chrono::milliseconds(50)) != std::future_status::ready)
        interruptionPoint(); //throw ThreadStopRequest
}


void ThreadGroup::notifyWhenDone(const std::function<void()>& onCompletion)
{
    std::unique_lock dummy(workLoad_->lock);

    if (workLoad_->tasksPending == 0)
    {
        dummy.unlock();
        onCompletion();
    }
    else
        workLoad_->onCompletionCallbacks.push_back(onCompletion);
}
