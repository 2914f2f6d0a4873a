// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <gtest/gtest.h>
#include <base/listing_parser.h>

using namespace amr;
using namespace mirror;


namespace
{
const char* const sampleListing = R"(<!DOCTYPE html>
<html><head><title>Index of /files/No-Intro/</title></head>
<body>
<table id="list">
<thead><tr><th><a href="?C=N&amp;O=A">File Name</a></th><th><a href="?C=S&amp;O=A">File Size</a></th><th>Date</th></tr></thead>
<tbody>
<tr><td class="link"><a href="../">Parent directory/</a></td><td class="size">-</td><td class="date">-</td></tr>
<tr><td class="link"><a href="Atari%20-%202600/" title="Atari - 2600">Atari - 2600/</a></td><td class="size">-</td><td class="date">01-Jan-2024 10:00</td></tr>
<tr><td class="link"><a href="Game%20%28USA%29.zip">Game (USA).zip</a></td><td class="size">123456</td><td class="date">01-Jan-2024 10:00</td></tr>
<tr><td class="link"><a href="Tom%20&amp;%20Jerry.zip">Tom &amp; Jerry.zip</a></td><td class="size">1.2 MiB</td><td class="date">01-Jan-2024 10:00</td></tr>
<tr><td class="link"><a href="/absolute/link.zip">x</a></td><td class="size">1</td></tr>
<tr><td class="link"><a href="https://elsewhere.example/a.zip">x</a></td><td class="size">1</td></tr>
</tbody></table>
</body></html>)";
}


TEST(ListingParser, TypicalIndexPage)
{
    const std::vector<ListingEntry> entries = parseListing(sampleListing);

    ASSERT_EQ(entries.size(), 3u);

    EXPECT_EQ(entries[0].name, "Atari - 2600");
    EXPECT_TRUE(entries[0].isFolder);
    EXPECT_FALSE(entries[0].sizeHint);

    EXPECT_EQ(entries[1].name, "Game (USA).zip");
    EXPECT_FALSE(entries[1].isFolder);
    EXPECT_EQ(entries[1].sizeHint, 123456u);

    EXPECT_EQ(entries[2].name, "Tom & Jerry.zip");
    EXPECT_FALSE(entries[2].sizeHint); //not an exact byte count
}


TEST(ListingParser, SizeCellBelongsToSameRow)
{
    const std::vector<ListingEntry> entries = parseListing(R"(
<tr><td class="link"><a href="a.bin">a.bin</a></td></tr>
<tr><td class="size">42</td></tr>
<tr><td class="link"><a href="b.bin">b.bin</a></td><td class="size"> 7 </td></tr>)");

    ASSERT_EQ(entries.size(), 2u);
    EXPECT_FALSE(entries[0].sizeHint);
    EXPECT_EQ(entries[1].sizeHint, 7u);
}


TEST(ListingParser, DropsSelfParentAndSlashNames)
{
    const std::vector<ListingEntry> entries = parseListing(R"(
<tr><td class="link"><a href="./">.</a></td></tr>
<tr><td class="link"><a href="%2E%2E/">..</a></td></tr>
<tr><td class="link"><a href="a%2Fb.zip">a/b</a></td></tr>
<tr><td class="link"><a href="#top">top</a></td></tr>
<tr><td class="link"><a href="ok.zip">ok</a></td></tr>)");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "ok.zip");
}


TEST(ListingParser, MalformedMarkupDoesNotFail)
{
    EXPECT_TRUE(parseListing("").empty());
    EXPECT_TRUE(parseListing("<html><body>no table").empty());
    EXPECT_TRUE(parseListing("<tr><td class=\"link\"><a href=\"x.zip\"").empty());
    EXPECT_TRUE(parseListing("<td class=link><a>no href</a></td>").empty());
}


TEST(ListingParser, UnquotedAttributes)
{
    const std::vector<ListingEntry> entries = parseListing("<tr><TD CLASS=link><A HREF=file.iso>file.iso</A></TD><td class=\"size\">99</td></tr>");

    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, "file.iso");
    EXPECT_EQ(entries[0].sizeHint, 99u);
}
