// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef THREAD_H_5501928374650129
#define THREAD_H_5501928374650129

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>
#include "scope_guard.h"
#include "string_tools.h"
#include "zstring.h"


namespace amr
{
//thrown inside worker threads once their ThreadGroup is being destroyed: let it pass, never catch in user code!
class ThreadStopRequest {};

//context of worker thread: outside a ThreadGroup worker these are plain checks/waits without interruption
void interruptionPoint(); //throw ThreadStopRequest

template <class Predicate>
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred); //throw ThreadStopRequest

template <class Rep, class Period>
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime); //throw ThreadStopRequest

void setCurrentThreadName(const Zstring& threadName);

bool runningOnMainThread();


//run on a detached thread: unlike std::async(), the returned future does not block in its destructor
template <class Function>
auto runAsync(Function&& fun);


//value associated with mutex and guaranteed protected access:
template <class T>
class Protected
{
public:
    Protected() {}

    template <class Function>
    auto access(Function fun) //-> decltype(fun(std::declval<T&>()))
    {
        std::lock_guard dummy(lockValue_);
        return fun(value_);
    }

private:
    Protected           (const Protected&) = delete;
    Protected& operator=(const Protected&) = delete;

    std::mutex lockValue_;
    T value_{};
};


namespace impl { class StopState; }

/*  at most "threadCountMax" workers sharing one FIFO task queue of unlimited size:
      - run() never blocks: producers (e.g. the remote walk queueing downloads) are not throttled
      - workers are started on demand
      - ~ThreadGroup() stops all workers: queued tasks are discarded, running tasks see ThreadStopRequest  */
class ThreadGroup
{
public:
    using Task = std::function<void()>;

    ThreadGroup(size_t threadCountMax, const Zstring& groupName);
    ~ThreadGroup();

    //context of controlling OR worker thread, non-blocking
    void run(Task&& task /*throw ThreadStopRequest*/);

    //context of controlling thread: wait until the queue is empty and no task is running
    void wait(); //throw ThreadStopRequest

    //non-blocking alternative to wait(): "onCompletion" runs on the worker finishing the last task (or immediately if idle)
    void notifyWhenDone(const std::function<void()>& onCompletion /*noexcept!*/);

private:
    ThreadGroup           (const ThreadGroup&) = delete;
    ThreadGroup& operator=(const ThreadGroup&) = delete;

    struct WorkLoad
    {
        std::mutex lock;
        std::condition_variable conditionNewTask;
        std::deque<Task> tasks;
        size_t tasksPending = 0; //queued + running
        std::vector<std::function<void()>> onCompletionCallbacks;
        bool shuttingDown = false;
    };
    struct Worker
    {
        std::thread thread;
        std::shared_ptr<impl::StopState> stopState;
    };

    void addWorker(); //call while holding WorkLoad::lock

    static void workerLoop(WorkLoad& wl); //throw ThreadStopRequest

    const size_t threadCountMax_;
    const Zstring groupName_;
    const std::shared_ptr<WorkLoad> workLoad_ = std::make_shared<WorkLoad>(); //shared with workers
    std::vector<Worker> workers_; //protected by WorkLoad::lock
};








//###################### implementation ######################

namespace impl
{
class StopState
{
public:
    //context of controlling thread
    void requestStop()
    {
        stopRequested_ = true;
        {
            std::lock_guard dummy(lockSleep_); //a sleeper between predicate check and wait must not miss the signal
        }
        conditionSleep_.notify_all();

        std::lock_guard dummy(lockWaitCondition_);
        if (waitCondition_)
            waitCondition_->notify_all(); //may still get lost => wait() polls
    }

    //context of worker thread
    void throwIfStopped() const //throw ThreadStopRequest
    {
        if (stopRequested_)
            throw ThreadStopRequest();
    }

    template <class Predicate>
    void wait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
    {
        setWaitCondition(&cv);
        AMR_ON_SCOPE_EXIT(setWaitCondition(nullptr));

        //"stopRequested_" is not guarded by cv's mutex: notify_all() may come between predicate check and wait
        while (!cv.wait_for(lock, std::chrono::milliseconds(1), [&] { return stopRequested_ || pred(); }))
            ;
        throwIfStopped(); //throw ThreadStopRequest
    }

    template <class Rep, class Period>
    void sleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
    {
        std::unique_lock dummy(lockSleep_);
        if (conditionSleep_.wait_for(dummy, relTime, [this] { return stopRequested_.load(); }))
            throw ThreadStopRequest();
    }

private:
    void setWaitCondition(std::condition_variable* cv)
    {
        std::lock_guard dummy(lockWaitCondition_);
        waitCondition_ = cv;
    }

    std::atomic<bool> stopRequested_{false};

    std::mutex lockWaitCondition_;
    std::condition_variable* waitCondition_ = nullptr;

    std::mutex lockSleep_;
    std::condition_variable conditionSleep_;
};


//set for ThreadGroup workers only
inline thread_local StopState* threadStopState = nullptr;
}


inline
void interruptionPoint() //throw ThreadStopRequest
{
    if (impl::threadStopState)
        impl::threadStopState->throwIfStopped(); //throw ThreadStopRequest
}


template <class Predicate> inline
void interruptibleWait(std::condition_variable& cv, std::unique_lock<std::mutex>& lock, Predicate pred) //throw ThreadStopRequest
{
    if (impl::threadStopState)
        impl::threadStopState->wait(cv, lock, pred); //throw ThreadStopRequest
    else
        cv.wait(lock, pred);
}


template <class Rep, class Period> inline
void interruptibleSleep(const std::chrono::duration<Rep, Period>& relTime) //throw ThreadStopRequest
{
    if (impl::threadStopState)
        impl::threadStopState->sleep(relTime); //throw ThreadStopRequest
    else
        std::this_thread::sleep_for(relTime);
}


template <class Function> inline
auto runAsync(Function&& fun)
{
    std::packaged_task<decltype(fun())()> task(std::forward<Function>(fun));
    auto fut = task.get_future();
    std::thread(std::move(task)).detach(); //~thread() calls std::terminate() if still joinable
    return fut;
}
}

#endif //THREAD_H_5501928374650129
