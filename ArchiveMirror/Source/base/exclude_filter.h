// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#ifndef EXCLUDE_FILTER_H_2093847561029384
#define EXCLUDE_FILTER_H_2093847561029384

#include <unordered_set>
#include <vector>
#include <amr/file_error.h>


namespace mirror
{
/*  Semantics of ExcludeFilter:
    - paths are relative to the archive root and '/'-separated; matching is case-sensitive
    - '*' matches zero or more characters within a single segment, never '/'; all other characters are literal
    - pattern without '/'         => matches a single segment at any depth, e.g. "*.zip" excludes "a.zip" and "b/d.zip"
    - pattern with '/' inside     => anchored at the archive root, e.g. "Sony/PS2" or "/Nintendo"
    - pattern with '/' at the end => matches folders only
    - an excluded folder excludes everything beneath it

    compilation rejects empty patterns and empty, "." or ".." segments                      */
class ExcludeFilter
{
public:
    ExcludeFilter() {} //null filter: excludes nothing
    explicit ExcludeFilter(const std::vector<Zstring>& patterns); //throw FileError

    bool isExcluded(const Zstring& relPath, bool isFolder) const; //considers all parent folders!

    bool isNull() const { return fileMasks_.empty() && folderMasks_.empty(); }

private:
    class MaskMatcher
    {
    public:
        void insert(const std::vector<Zstring>& segments, bool anchored);

        //segments: relative path split at '/'; check path *as is*, not its parents
        bool matches(const std::vector<ZstringView>& segments) const;

        bool empty() const { return floatingNames_.empty() && floatingMasks_.empty() && anchoredPaths_.empty() && anchoredMasks_.empty(); }

    private:
        std::unordered_set<Zstring> floatingNames_; //single segment, never containing '*'
        std::vector<Zstring>        floatingMasks_; //single segment, always containing '*'
        std::unordered_set<Zstring> anchoredPaths_; //never containing '*'
        std::vector<std::vector<Zstring>> anchoredMasks_; //at least one segment containing '*'
    };

    MaskMatcher fileMasks_;
    MaskMatcher folderMasks_;
};


//exclude file format: UTF-8, one pattern per line, blank lines and lines starting with '#' are ignored
std::vector<Zstring> parseExcludeList(const std::string_view& content);

std::vector<Zstring> readExcludeFile(const Zstring& filePath); //throw FileError
}

#endif //EXCLUDE_FILTER_H_2093847561029384
