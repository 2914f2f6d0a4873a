// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "file_io.h"
#include <algorithm>
#include <climits> //NAME_MAX
#include <stdexcept>
#include <utility>
#include <sys/stat.h>
#include <fcntl.h>  //open
#include <unistd.h> //close, read, write, getentropy
#include "extra_log.h"
#include "scope_guard.h"

using namespace amr;


FileOutputPlain::FileOutputPlain(const Zstring& filePath) : filePath_(filePath)
{
    fd_ = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC,
                 S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH); //0666 => umask applies
    if (fd_ == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), "open");
}


FileOutputPlain::~FileOutputPlain()
{
    if (!closed_) //not finalized => incomplete
    {
        if (fd_ != -1)
            ::close(fd_);
        try { removeFilePlain(filePath_); /*throw FileError*/ }
        catch (const FileError& e) { logExtraError(e.toString()); }
    }
}


void FileOutputPlain::write(const void* buffer, size_t bytesToWrite) //throw FileError, ErrorDiskFull
{
    auto it = static_cast<const char*>(buffer);
    while (bytesToWrite > 0)
    {
        const ssize_t bytesWritten = ::write(fd_, it, bytesToWrite);
        if (bytesWritten < 0)
        {
            if (errno == EINTR)
                continue;
            throwFileWriteError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "write", getLastError());
        }
        if (bytesWritten == 0) //no progress: buggy drivers, treat as full device
            throwFileWriteError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "write", ENOSPC);

        it            += bytesWritten;
        bytesToWrite  -= bytesWritten;
        bytesWritten_ += bytesWritten;
    }
}


void FileOutputPlain::close() //throw FileError, ErrorDiskFull
{
    if (closed_ || fd_ == -1)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");

    //NFS and quota-enforcing file systems may report ENOSPC/EDQUOT only here
    if (::close(std::exchange(fd_, -1)) != 0) //descriptor is released even on error
        throwFileWriteError(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath_)), "close", getLastError()); //not finalized: destructor deletes the file
    closed_ = true;
}

//----------------------------------------------------------------------------------------------------

namespace
{
const size_t TEMP_NAME_SUFFIX_LEN = 6; //".~" + 4 hex digits

bool isLowerHexDigit(Zchar c) { return ('0' <= c && c <= '9') || ('a' <= c && c <= 'f'); }
}


bool amr::isTempFileName(const Zstring& itemName)
{
    if (itemName.size() <= TEMP_NAME_SUFFIX_LEN)
        return false;
    const Zstring suffix = itemName.substr(itemName.size() - TEMP_NAME_SUFFIX_LEN);
    return startsWith(suffix, Zstr(".~")) && std::all_of(suffix.begin() + 2, suffix.end(), isLowerHexDigit);
}


Zstring amr::getPathWithTempName(const Zstring& filePath)
{
    unsigned char randomBytes[2] = {};
    if (::getentropy(randomBytes, sizeof(randomBytes)) != 0)
        throw std::runtime_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Failed to generate random file name." + "\n\n" +
                                 utfTo<std::string>(formatSystemError("getentropy", errno)));
    Zstring suffix = Zstr(".~");
    for (const unsigned char c : randomBytes)
    {
        const auto [high, low] = hexify(c, false /*upperCase*/);
        suffix += high;
        suffix += low;
    }

    //the suffix must not push the item name beyond NAME_MAX: shorten the name, keeping UTF-8 sequences intact
    const size_t nameStart = filePath.rfind(FILE_NAME_SEPARATOR) + 1; //npos + 1 == 0
    Zstring itemName = filePath.substr(nameStart);
    if (itemName.size() + suffix.size() > NAME_MAX)
    {
        size_t len = NAME_MAX - suffix.size();
        while (len > 0 && (static_cast<unsigned char>(itemName[len]) & 0xc0) == 0x80) //continuation byte
            --len;
        itemName.resize(len);
    }
    return filePath.substr(0, nameStart) + itemName + suffix;
}


std::string amr::getFileContent(const Zstring& filePath) //throw FileError
{
    const std::wstring errorMsg = replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(filePath));

    const int fd = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1)
        THROW_LAST_FILE_ERROR(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), "open");
    AMR_ON_SCOPE_EXIT(::close(fd));

    std::string content;
    char buffer[64 * 1024];
    for (;;)
    {
        const ssize_t bytesRead = ::read(fd, buffer, sizeof(buffer));
        if (bytesRead < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_FILE_ERROR(errorMsg, "read"); //EISDIR for folders
        }
        if (bytesRead == 0) //end of file
            return content;
        content.append(buffer, bytesRead);
    }
}


void amr::setFileContent(const Zstring& filePath, std::string_view bytes) //throw FileError
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);
    {
        FileOutputPlain tmpFile(tmpFilePath); //throw FileError
        tmpFile.write(bytes.data(), bytes.size()); //throw FileError, ErrorDiskFull
        tmpFile.close(); //throw FileError, ErrorDiskFull
    }
    AMR_ON_SCOPE_FAIL(try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    renameItem(tmpFilePath, filePath); //throw FileError, ErrorDiskFull
}
