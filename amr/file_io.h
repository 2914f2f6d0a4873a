// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef FILE_IO_H_2238401928374651
#define FILE_IO_H_2238401928374651

#include <string_view>
#include "file_access.h"


namespace amr
{
/*  unbuffered sequential writer for a new file (fails if the path exists)
    - close() when done, or else the file is considered incomplete and deleted by the destructor
    - ENOSPC/EDQUOT from write() or close() => ErrorDiskFull                                       */
class FileOutputPlain
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw FileError
    ~FileOutputPlain();

    //write all bytes, continuing after short writes
    void write(const void* buffer, size_t bytesToWrite); //throw FileError, ErrorDiskFull

    void close(); //throw FileError, ErrorDiskFull

    uint64_t getBytesWritten() const { return bytesWritten_; }
    const Zstring& getFilePath() const { return filePath_; }

private:
    FileOutputPlain           (const FileOutputPlain&) = delete;
    FileOutputPlain& operator=(const FileOutputPlain&) = delete;

    int fd_ = -1;
    bool closed_ = false;
    const Zstring filePath_;
    uint64_t bytesWritten_ = 0;
};

/* sibling path for writing "filePath" before it is renamed into place: "<item name>.~<4 hex>"
   - item names close to NAME_MAX are shortened so that the suffix still fits      */
Zstring getPathWithTempName(const Zstring& filePath);
bool isTempFileName(const Zstring& itemName);

[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw FileError

//write to a temporary file first, then replace "filePath" atomically
void setFileContent(const Zstring& filePath, std::string_view bytes); //throw FileError
}

#endif //FILE_IO_H_2238401928374651
