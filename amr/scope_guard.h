// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef SCOPE_GUARD_H_2309845710293847
#define SCOPE_GUARD_H_2309845710293847

#include <cassert>
#include <exception> //std::uncaught_exceptions
#include <type_traits>


namespace amr
{
/*  Scope Exit:
        AMR_ON_SCOPE_EXIT(CleanUp());
        AMR_ON_SCOPE_FAIL(UndoTemporaryWork());        */

enum class ScopeGuardRunMode
{
    onExit,
    onFail
};


template <ScopeGuardRunMode runMode, typename F>
class ScopeGuard
{
public:
    explicit ScopeGuard(const F&  fun) : fun_(fun) {}
    explicit ScopeGuard(      F&& fun) : fun_(std::move(fun)) {}

    ScopeGuard(ScopeGuard&& tmp) :
        fun_(std::move(tmp.fun_)),
        exeptionCount_(tmp.exeptionCount_),
        dismissed_(tmp.dismissed_) { tmp.dismissed_ = true; }

    ~ScopeGuard() noexcept(runMode == ScopeGuardRunMode::onFail)
    {
        if (!dismissed_)
        {
            const bool failed = std::uncaught_exceptions() > exeptionCount_;

            if constexpr (runMode == ScopeGuardRunMode::onExit)
            {
                if (!failed)
                    fun_(); //throw X
                else
                    try { fun_(); }
                    catch (...) { assert(false); } //must not throw while another exception is in flight
            }
            else
            {
                if (failed)
                    try { fun_(); }
                    catch (...) { assert(false); }
            }
        }
    }

private:
    ScopeGuard           (const ScopeGuard&) = delete;
    ScopeGuard& operator=(const ScopeGuard&) = delete;

    const F fun_;
    const int exeptionCount_ = std::uncaught_exceptions();
    bool dismissed_ = false;
};


template <ScopeGuardRunMode runMode, class F> inline
auto makeGuard(F&& fun) { return ScopeGuard<runMode, std::decay_t<F>>(std::forward<F>(fun)); }
}

#define AMR_CONCAT_SUB(X, Y) X ## Y
#define AMR_CONCAT(X, Y) AMR_CONCAT_SUB(X, Y)


#define AMR_ON_SCOPE_EXIT(X) [[maybe_unused]] auto AMR_CONCAT(scopeGuard, __LINE__) = amr::makeGuard<amr::ScopeGuardRunMode::onExit   >([&]{ X; });
#define AMR_ON_SCOPE_FAIL(X) [[maybe_unused]] auto AMR_CONCAT(scopeGuard, __LINE__) = amr::makeGuard<amr::ScopeGuardRunMode::onFail   >([&]{ X; });

#endif //SCOPE_GUARD_H_2309845710293847
