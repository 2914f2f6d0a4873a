// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FILE_PATH_H_1102938475601928
#define FILE_PATH_H_1102938475601928

#include <optional>
#include "string_tools.h"
#include "zstring.h"


namespace amr
{
//no value for root folder "/" or a single relative item name
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath);

inline Zstring getItemName(const Zstring& itemPath) { return afterLast(itemPath, FILE_NAME_SEPARATOR, IfNotFoundReturn::all); }

//"a/b/c": no leading, trailing or double separators
bool isValidRelPath(const Zstring& relPath);

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);
}

#endif //FILE_PATH_H_1102938475601928
