// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FILE_ACCESS_H_7781029384756102
#define FILE_ACCESS_H_7781029384756102

#include "file_path.h"
#include "file_error.h"


namespace amr
{
//false only if the item is not existing for sure; access errors are reported
bool itemExists(const Zstring& itemPath); //throw FileError

//follows symlinks
void setFileTime(const Zstring& filePath, time_t modTime); //throw FileError

void removeFilePlain(const Zstring& filePath); //throw FileError; ERROR if not existing

//atomically replaces an existing item at "pathTo"; both paths on the same device
void renameItem(const Zstring& pathFrom, const Zstring& pathTo); //throw FileError, ErrorDiskFull

/* no error if already existing, even when called concurrently for overlapping paths;
   fails if the path or one of its parents is taken by a file                        */
void createDirectoryIfMissingRecursion(const Zstring& dirPath); //throw FileError
}

#endif //FILE_ACCESS_H_7781029384756102
