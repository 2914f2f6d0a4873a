// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef TEST_UTIL_H_6610293847561920
#define TEST_UTIL_H_6610293847561920

#include <filesystem>
#include <fstream>
#include <iterator>
#include <set>
#include <stdlib.h> //mkdtemp
#include <amr/zstring.h>


namespace mirror::test
{
//unique folder below the system temp folder: deleted recursively on destruction
class TempFolder
{
public:
    TempFolder()
    {
        std::string pathTmpl = (std::filesystem::temp_directory_path() / "archive_mirror_test.XXXXXX").string();
        if (!::mkdtemp(pathTmpl.data()))
            throw std::runtime_error("mkdtemp failed");
        path_ = pathTmpl;
    }

    ~TempFolder()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    const Zstring& path() const { return path_; }

    Zstring operator/(const Zstring& relPath) const { return path_ + Zstr('/') + relPath; }

private:
    TempFolder           (const TempFolder&) = delete;
    TempFolder& operator=(const TempFolder&) = delete;

    Zstring path_;
};


inline
void writeTestFile(const Zstring& filePath, const std::string& content)
{
    std::filesystem::create_directories(std::filesystem::path(filePath).parent_path());
    std::ofstream(filePath, std::ios::binary) << content;
}


inline
std::string readTestFile(const Zstring& filePath)
{
    std::ifstream in(filePath, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}


//all items below "folderPath": relative paths, folders with trailing '/'
inline
std::set<std::string> listTree(const Zstring& folderPath)
{
    std::set<std::string> items;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(folderPath))
    {
        std::string relPath = std::filesystem::relative(entry.path(), folderPath).string();
        if (entry.is_directory() && !entry.is_symlink())
            relPath += '/';
        items.insert(relPath);
    }
    return items;
}
}

#endif //TEST_UTIL_H_6610293847561920
