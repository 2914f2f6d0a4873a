// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef I18N_H_7730918245561092
#define I18N_H_7730918245561092

#include <cstdint>
#include <cstdlib>
#include "string_tools.h"


//minimal text layer: all user-visible messages go through _() so that a translation can be plugged in later

#define AMR_TRANS_CONCAT_SUB(X, Y) X ## Y
#define _(s)        amr::translate(AMR_TRANS_CONCAT_SUB(L, s))
#define _P(s, p, n) amr::translate(AMR_TRANS_CONCAT_SUB(L, s), AMR_TRANS_CONCAT_SUB(L, p), n)
//source and translation are required to use %x as number placeholder
//for plural form, which will be substituted automatically!!!

namespace amr
{
inline
std::wstring translate(const std::wstring& text)
{
    return text;
}


//translate plural forms: "%x file" "%x files"
template <class T> inline
std::wstring translate(const std::wstring& singular, const std::wstring& plural, T n)
{
    static_assert(sizeof(n) <= sizeof(int64_t));
    const auto n64 = static_cast<int64_t>(n);

    assert(contains(plural, L"%x"));
    return replaceCpy(std::abs(n64) == 1 ? singular : plural, L"%x", numberTo<std::wstring>(n64));
}
}

#endif //I18N_H_7730918245561092
