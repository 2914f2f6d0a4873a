// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef ZSTRING_H_5128734098237452
#define ZSTRING_H_5128734098237452

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <string>
#include <string_view>
#include "utf.h"


using Zchar = char;
#define Zstr(x) x

//native file system strings: UTF-8 on Linux
using Zstring = std::basic_string<Zchar>;

using ZstringView = std::basic_string_view<Zchar>;


const Zchar FILE_NAME_SEPARATOR = '/';

//common Unicode characters
const wchar_t* const ELLIPSIS = L"…"; //…
const wchar_t* const TAB_SPACE = L"    ";

#endif //ZSTRING_H_5128734098237452
