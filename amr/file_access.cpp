// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "file_access.h"
#include <sys/stat.h>
#include <fcntl.h> //AT_FDCWD
#include <unistd.h>
#include <ctime>

using namespace amr;


bool amr::itemExists(const Zstring& itemPath) //throw FileError
{
    struct stat itemInfo = {};
    if (::lstat(itemPath.c_str(), &itemInfo) == 0)
        return true;

    if (errno == ENOENT || errno == ENOTDIR)
        return false;
    THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath)), "lstat");
}


void amr::setFileTime(const Zstring& filePath, time_t modTime) //throw FileError
{
    const timespec newTimes[2]
    {
        {.tv_sec = ::time(nullptr)}, //access time
        {.tv_sec = modTime},
    };
    if (::utimensat(AT_FDCWD, filePath.c_str(), newTimes, 0) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write modification time of %x."), L"%x", fmtPath(filePath)), "utimensat");
}


void amr::removeFilePlain(const Zstring& filePath) //throw FileError
{
    if (::unlink(filePath.c_str()) != 0)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), "unlink");
}


void amr::renameItem(const Zstring& pathFrom, const Zstring& pathTo) //throw FileError, ErrorDiskFull
{
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const ErrorCode ec = getLastError();
        //a new directory entry may need a new directory block => ENOSPC
        throwFileWriteError(replaceCpy(replaceCpy(_("Cannot rename %x to %y."),
                                                  L"%x", fmtPath(pathFrom)),
                                       L"%y", fmtPath(getItemName(pathTo))), "rename", ec);
    }
}


void amr::createDirectoryIfMissingRecursion(const Zstring& dirPath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(dirPath));

    const auto tryCreate = [&] //throw FileError; false: parent folder missing
    {
        if (::mkdir(dirPath.c_str(), S_IRWXU | S_IRWXG | S_IRWXO) == 0) //0777 => umask applies
            return true;

        const ErrorCode ec = getLastError();
        if (ec == ENOENT)
            return false;

        if (ec == EEXIST) //created by a concurrent worker, or a name clash
        {
            struct stat itemInfo = {};
            if (::stat(dirPath.c_str(), &itemInfo) == 0 && S_ISDIR(itemInfo.st_mode)) //accept symlinks to folders
                return true;
            throw FileError(errorMsg, replaceCpy(_("The name %x is already used by another item."), L"%x", fmtPath(getItemName(dirPath))));
        }
        throw FileError(errorMsg, formatSystemError("mkdir", ec));
    };

    if (tryCreate()) //throw FileError
        return;

    const std::optional<Zstring> parentPath = getParentFolderPath(dirPath);
    if (!parentPath) //device root or relative single-component path
        throw FileError(errorMsg, formatSystemError("mkdir", ENOENT));

    createDirectoryIfMissingRecursion(*parentPath); //throw FileError

    if (!tryCreate()) //throw FileError; parent removed in the meantime
        throw FileError(errorMsg, formatSystemError("mkdir", ENOENT));
}
