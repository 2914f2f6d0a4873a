// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "exclude_filter.h"
#include <algorithm>
#include <amr/file_io.h>

using namespace amr;
using namespace mirror;


namespace
{
const Zchar PATH_SEP = Zstr('/');


//"true" if a single path segment matches the mask: '*' is the only wildcard
bool matchesSegment(const Zchar* name, const Zchar* const nameEnd, const Zchar* mask, const Zchar* const maskEnd)
{
    for (;; ++mask, ++name)
    {
        if (mask == maskEnd)
            return name == nameEnd;

        const Zchar m = *mask;
        if (m == Zstr('*'))
        {
            do //advance mask to next non-* char
                ++mask;
            while (mask != maskEnd && *mask == Zstr('*'));

            if (mask == maskEnd) //mask ends with '*':
                return true;

            for (; name != nameEnd; ++name)
                if (*name == *mask)
                    if (matchesSegment(name + 1, nameEnd, mask + 1, maskEnd))
                        return true;
            return false;
        }

        if (name == nameEnd || *name != m)
            return false;
    }
}

inline
bool matchesSegment(const ZstringView name, const Zstring& mask)
{
    return matchesSegment(name.data(), name.data() + name.size(), mask.data(), mask.data() + mask.size());
}


std::vector<ZstringView> splitPath(const ZstringView relPath)
{
    std::vector<ZstringView> segments;
    split(relPath, PATH_SEP, [&](const ZstringView seg) { segments.push_back(seg); });
    return segments;
}
}


void ExcludeFilter::MaskMatcher::insert(const std::vector<Zstring>& segments, bool anchored)
{
    assert(!segments.empty());
    const bool haveWildcards = std::any_of(segments.begin(), segments.end(), [](const Zstring& seg) { return contains(seg, Zstr('*')); });

    if (anchored)
    {
        if (haveWildcards)
            anchoredMasks_.push_back(segments);
        else
        {
            Zstring relPath;
            for (const Zstring& seg : segments)
            {
                if (!relPath.empty())
                    relPath += PATH_SEP;
                relPath += seg;
            }
            anchoredPaths_.insert(relPath);
        }
    }
    else
    {
        assert(segments.size() == 1);
        if (haveWildcards)
            floatingMasks_.push_back(segments[0]);
        else
            floatingNames_.insert(segments[0]);
    }
}


bool ExcludeFilter::MaskMatcher::matches(const std::vector<ZstringView>& segments) const
{
    assert(!segments.empty());
    const ZstringView itemName = segments.back();

    if (!floatingNames_.empty() && floatingNames_.contains(Zstring(itemName)))
        return true;

    if (std::any_of(floatingMasks_.begin(), floatingMasks_.end(), [&](const Zstring& mask) { return matchesSegment(itemName, mask); }))
        return true;

    if (!anchoredPaths_.empty())
    {
        const ZstringView relPath(segments.front().data(), segments.back().data() + segments.back().size() - segments.front().data());
        if (anchoredPaths_.contains(Zstring(relPath)))
            return true;
    }

    return std::any_of(anchoredMasks_.begin(), anchoredMasks_.end(), [&](const std::vector<Zstring>& mask)
    {
        if (mask.size() != segments.size())
            return false;

        for (size_t i = 0; i < mask.size(); ++i)
            if (!matchesSegment(segments[i], mask[i]))
                return false;
        return true;
    });
}


ExcludeFilter::ExcludeFilter(const std::vector<Zstring>& patterns) //throw FileError
{
    for (const Zstring& pattern : patterns)
    {
        auto throwInvalid = [&](const std::wstring& details)
        {
            throw FileError(replaceCpy(_("Invalid exclude pattern %x."), L"%x", fmtPath(pattern)), details);
        };

        ZstringView phrase = trimCpy(ZstringView(pattern));
        if (phrase.empty())
            throwInvalid(_("The pattern is empty."));

        bool anchored   = false;
        bool folderOnly = false;

        if (startsWith(phrase, PATH_SEP)) // /abc
        {
            anchored = true;
            phrase.remove_prefix(1);
        }
        if (endsWith(phrase, PATH_SEP)) // abc/
        {
            folderOnly = true;
            phrase.remove_suffix(1);
        }
        if (contains(phrase, PATH_SEP)) // abc/def
            anchored = true;

        std::vector<Zstring> segments;
        for (const ZstringView seg : splitPath(phrase))
        {
            if (seg.empty())
                throwInvalid(_("The pattern contains an empty path segment."));
            if (seg == Zstr(".") || seg == Zstr(".."))
                throwInvalid(_("Relative path segments \".\" and \"..\" are not supported."));
            segments.emplace_back(seg);
        }

        folderMasks_.insert(segments, anchored);
        if (!folderOnly)
            fileMasks_.insert(segments, anchored);
    }
}


bool ExcludeFilter::isExcluded(const Zstring& relPath, bool isFolder) const
{
    assert(!relPath.empty() && !startsWith(relPath, PATH_SEP) && !endsWith(relPath, PATH_SEP));
    if (isNull())
        return false;

    std::vector<ZstringView> segments = splitPath(relPath);

    //check parent folders first: excluding a folder excludes its whole subtree
    if (!folderMasks_.empty())
        for (size_t count = 1; count < segments.size(); ++count)
            if (folderMasks_.matches({segments.begin(), segments.begin() + count}))
                return true;

    return (isFolder ? folderMasks_ : fileMasks_).matches(segments);
}


std::vector<Zstring> mirror::parseExcludeList(const std::string_view& content)
{
    std::string_view text = content;
    if (startsWith(text, "\xEF\xBB\xBF")) //UTF-8 byte order mark
        text.remove_prefix(3);

    std::vector<Zstring> patterns;
    split(text, '\n', [&](const std::string_view line)
    {
        const std::string_view pattern = trimCpy(line); //also removes '\r' of Windows line endings
        if (!pattern.empty() && !startsWith(pattern, '#'))
            patterns.emplace_back(pattern);
    });
    return patterns;
}


std::vector<Zstring> mirror::readExcludeFile(const Zstring& filePath) //throw FileError
{
    const std::string content = getFileContent(filePath); //throw FileError
    return parseExcludeList(content);
}
