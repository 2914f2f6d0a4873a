// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "file_traverser.h"
#include "file_path.h"
#include "scope_guard.h"
#include <sys/stat.h>
#include <fcntl.h> //AT_SYMLINK_NOFOLLOW
#include <dirent.h>

using namespace amr;


std::vector<DirItem> amr::readDirectory(const Zstring& dirPath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(dirPath));

    DIR* folder = ::opendir(dirPath.c_str());
    if (!folder)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open directory %x."), L"%x", fmtPath(dirPath)), "opendir");
    AMR_ON_SCOPE_EXIT(::closedir(folder));

    std::vector<DirItem> items;
    for (;;)
    {
        errno = 0; //readdir() returns nullptr both at the end and on error
        const dirent* entry = ::readdir(folder);
        if (!entry)
        {
            if (errno != 0)
                THROW_LAST_FILE_ERROR(errorMsg, "readdir");
            return items;
        }

        const std::string_view name = entry->d_name;
        if (name == "." || name == "..")
            continue;
        if (name.empty())
            throw FileError(errorMsg, formatSystemError("readdir", L"", L"Folder contains an item without name."));

        struct stat itemInfo = {};
        if (::fstatat(::dirfd(folder), entry->d_name, &itemInfo, AT_SYMLINK_NOFOLLOW) != 0)
            THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(appendPath(dirPath, Zstring(name)))), "fstatat");

        DirItem& item = items.emplace_back();
        item.name = name;
        if (S_ISREG(itemInfo.st_mode))
        {
            item.type = DirItemType::file;
            item.fileSize = static_cast<uint64_t>(itemInfo.st_size);
        }
        else if (S_ISDIR(itemInfo.st_mode))
            item.type = DirItemType::folder;
    }
}
