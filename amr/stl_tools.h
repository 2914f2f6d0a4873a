// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef STL_TOOLS_H_3390128475610293
#define STL_TOOLS_H_3390128475610293

#include <algorithm>
#include <cassert>
#include <memory>
#include <vector>


namespace amr
{
template <class T, class Alloc>
void append(std::vector<T, Alloc>& v, const std::vector<T, Alloc>& other);


template <class T>
class SharedRef //why is there no std::shared_ref???
{
public:
    SharedRef() = delete; //no surprise memory allocations!

    explicit SharedRef(std::shared_ptr<T> ptr) : ref_(std::move(ptr)) { assert(ref_); }

    template <class U>
    SharedRef(const SharedRef<U>& other) : ref_(other.ref_) {}

    /**/  T& ref()       { return *ref_; };
    const T& ref() const { return *ref_; };

    std::shared_ptr<      T> ptr()       { return ref_; };
    std::shared_ptr<const T> ptr() const { return ref_; };

private:
    template <class U> friend class SharedRef;

    std::shared_ptr<T> ref_; //always bound
};

template <class T, class... Args> inline
SharedRef<T> makeSharedRef(Args&& ... args) { return SharedRef<T>(std::make_shared<T>(std::forward<Args>(args)...)); }







//######################## implementation ########################

template <class T, class Alloc> inline
void append(std::vector<T, Alloc>& v, const std::vector<T, Alloc>& other)
{
    v.insert(v.end(), other.begin(), other.end());
}
}

#endif //STL_TOOLS_H_3390128475610293
