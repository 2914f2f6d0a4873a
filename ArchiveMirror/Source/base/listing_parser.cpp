// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include "listing_parser.h"
#include <algorithm>
#include <amr/http.h>
#include <amrxml/parser.h>

using namespace amr;
using namespace mirror;


namespace
{
size_t findAsciiNoCase(const std::string_view str, const std::string_view term, size_t pos)
{
    assert(!term.empty());
    for (; pos + term.size() <= str.size(); ++pos)
        if (equalAsciiNoCase(str.substr(pos, term.size()), term))
            return pos;
    return std::string_view::npos;
}


//tag: text between '<' and '>'
std::string_view getTagName(const std::string_view tag)
{
    size_t len = 0;
    while (len < tag.size() && !isWhiteSpace(tag[len]) && tag[len] != '/')
        ++len;
    return tag.substr(0, len);
}


std::optional<std::string_view> getAttribute(const std::string_view tag, const std::string_view attrName)
{
    for (size_t pos = getTagName(tag).size(); pos < tag.size();)
    {
        while (pos < tag.size() && (isWhiteSpace(tag[pos]) || tag[pos] == '/'))
            ++pos;

        const size_t nameBegin = pos;
        while (pos < tag.size() && !isWhiteSpace(tag[pos]) && tag[pos] != '=' && tag[pos] != '/')
            ++pos;
        const std::string_view name = tag.substr(nameBegin, pos - nameBegin);

        while (pos < tag.size() && isWhiteSpace(tag[pos]))
            ++pos;

        std::string_view value;
        if (pos < tag.size() && tag[pos] == '=')
        {
            ++pos;
            while (pos < tag.size() && isWhiteSpace(tag[pos]))
                ++pos;

            if (pos < tag.size() && (tag[pos] == '"' || tag[pos] == '\''))
            {
                const char quote = tag[pos++];
                const size_t valueEnd = std::min(tag.find(quote, pos), tag.size());
                value = tag.substr(pos, valueEnd - pos);
                pos = valueEnd + 1;
            }
            else
            {
                const size_t valueBegin = pos;
                while (pos < tag.size() && !isWhiteSpace(tag[pos]))
                    ++pos;
                value = tag.substr(valueBegin, pos - valueBegin);
            }
        }

        if (!name.empty() && equalAsciiNoCase(name, attrName))
            return value;
        if (name.empty() && pos == nameBegin) //no progress
            ++pos;
    }
    return std::nullopt;
}


bool hasClass(const std::string_view classList, const std::string_view className)
{
    bool found = false;
    split(classList, ' ', [&](const std::string_view cls) { found = found || trimCpy(cls) == className; });
    return found;
}


std::string_view stripTags(const std::string_view html, std::string& buf)
{
    buf.clear();
    for (size_t pos = 0; pos < html.size();)
        if (html[pos] == '<')
        {
            const size_t tagEnd = html.find('>', pos);
            if (tagEnd == std::string_view::npos)
                break;
            pos = tagEnd + 1;
        }
        else
            buf += html[pos++];
    return trimCpy(std::string_view(buf));
}


std::optional<uint64_t> parseExactByteCount(const std::string_view text)
{
    if (text.empty() || text.size() > 19 || !std::all_of(text.begin(), text.end(), [](char c) { return isDigit(c); }))
        return std::nullopt;
    return stringTo<uint64_t>(text);
}


void parseLinkCell(const std::string_view cell, std::vector<ListingEntry>& output)
{
    for (size_t pos = 0;;)
    {
        pos = cell.find('<', pos);
        if (pos == std::string_view::npos)
            return;
        const size_t tagEnd = cell.find('>', pos);
        if (tagEnd == std::string_view::npos)
            return;

        const std::string_view tag = cell.substr(pos + 1, tagEnd - pos - 1);
        pos = tagEnd + 1;

        if (!equalAsciiNoCase(getTagName(tag), "a"))
            continue;

        const std::optional<std::string_view> hrefRaw = getAttribute(tag, "href");
        if (!hrefRaw)
            continue;

        std::string href = xml_impl::decodeEntities(*hrefRaw);

        if (href.empty() ||
            startsWith(href, '/') || startsWith(href, '?') || startsWith(href, '#') ||
            contains(href, "://") || contains(href, '?') || contains(href, '#'))
            continue; //absolute, query or fragment link: not a child item

        const bool isFolder = endsWith(href, '/');
        if (isFolder)
            href.pop_back();

        const std::string name = decodeUrlSegment(href);
        if (name.empty() || name == "." || name == ".." ||
            contains(name, '/') || contains(name, '\0'))
            continue;

        output.push_back({name, isFolder, std::nullopt});
    }
}
}


std::vector<ListingEntry> mirror::parseListing(const std::string_view& html)
{
    std::vector<ListingEntry> output;
    size_t rowBegin = 0; //first entry of the current table row
    std::string buf;

    for (size_t pos = 0;;)
    {
        pos = html.find('<', pos);
        if (pos == std::string_view::npos)
            break;
        const size_t tagEnd = html.find('>', pos);
        if (tagEnd == std::string_view::npos)
            break;

        const std::string_view tag = html.substr(pos + 1, tagEnd - pos - 1);
        const std::string_view tagName = getTagName(tag);
        pos = tagEnd + 1;

        if (equalAsciiNoCase(tagName, "tr"))
            rowBegin = output.size();
        else if (equalAsciiNoCase(tagName, "td"))
        {
            const size_t cellEnd = std::min(findAsciiNoCase(html, "</td", pos), html.size());
            const std::string_view cell = html.substr(pos, cellEnd - pos);
            pos = cellEnd;

            if (const std::optional<std::string_view> classList = getAttribute(tag, "class"))
            {
                if (hasClass(*classList, "link"))
                    parseLinkCell(cell, output);
                else if (hasClass(*classList, "size"))
                {
                    if (output.size() > rowBegin)
                        if (!output.back().sizeHint)
                            output.back().sizeHint = parseExactByteCount(stripTags(cell, buf));
                }
            }
        }
    }
    return output;
}
