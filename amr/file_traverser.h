// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FILE_TRAVERSER_H_8810293847561029
#define FILE_TRAVERSER_H_8810293847561029

#include <vector>
#include "file_error.h"


namespace amr
{
enum class DirItemType
{
    file,   //regular file
    folder,
    other,  //symlink (not followed), device, pipe, socket
};

struct DirItem
{
    Zstring name;
    DirItemType type = DirItemType::other;
    uint64_t fileSize = 0; //regular files only
};

//direct children of "dirPath" without "." and ".."; no particular order
std::vector<DirItem> readDirectory(const Zstring& dirPath); //throw FileError
}

#endif //FILE_TRAVERSER_H_8810293847561029
