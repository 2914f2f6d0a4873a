// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <gtest/gtest.h>
#include <base/exclude_filter.h>
#include "test_util.h"

using namespace amr;
using namespace mirror;


TEST(ExcludeFilter, NullFilterExcludesNothing)
{
    const ExcludeFilter filter;
    EXPECT_TRUE(filter.isNull());
    EXPECT_FALSE(filter.isExcluded("a.zip", false));
    EXPECT_FALSE(filter.isExcluded("a/b", true));
}


TEST(ExcludeFilter, FloatingPatternMatchesAtAnyDepth)
{
    const ExcludeFilter filter({"*.zip"});

    EXPECT_TRUE (filter.isExcluded("a.zip",   false));
    EXPECT_FALSE(filter.isExcluded("b/c.rom", false));
    EXPECT_TRUE (filter.isExcluded("b/d.zip", false));
    EXPECT_FALSE(filter.isExcluded("b", true));
}


TEST(ExcludeFilter, WildcardStaysWithinSegment)
{
    const ExcludeFilter filter({"Sony/*"});

    EXPECT_TRUE (filter.isExcluded("Sony/PS2", true));
    EXPECT_TRUE (filter.isExcluded("Sony/PS2/game.iso", false)); //parent folder excluded
    EXPECT_FALSE(filter.isExcluded("Sony", true));
    EXPECT_FALSE(filter.isExcluded("Nintendo/Sony/x", false)); //anchored at root
}


TEST(ExcludeFilter, AnchoredPattern)
{
    const ExcludeFilter filter({"/Redump", "No-Intro/Atari"});

    EXPECT_TRUE (filter.isExcluded("Redump", true));
    EXPECT_TRUE (filter.isExcluded("Redump/Sony/game.iso", false));
    EXPECT_FALSE(filter.isExcluded("Other/Redump", true));

    EXPECT_TRUE (filter.isExcluded("No-Intro/Atari", true));
    EXPECT_TRUE (filter.isExcluded("No-Intro/Atari/pong.zip", false));
    EXPECT_FALSE(filter.isExcluded("No-Intro/Atari 7800", true));
    EXPECT_FALSE(filter.isExcluded("Mirror/No-Intro/Atari", true));
}


TEST(ExcludeFilter, FolderOnlyPattern)
{
    const ExcludeFilter filter({"BIOS/"});

    EXPECT_TRUE (filter.isExcluded("BIOS", true));
    EXPECT_TRUE (filter.isExcluded("x/BIOS", true));
    EXPECT_TRUE (filter.isExcluded("x/BIOS/scph1001.bin", false));
    EXPECT_FALSE(filter.isExcluded("BIOS", false)); //a file named like the folder
}


TEST(ExcludeFilter, CaseSensitiveAndLiteral)
{
    const ExcludeFilter filter({"*(Japan)*", "a?c"});

    EXPECT_TRUE (filter.isExcluded("Game (Japan).zip", false));
    EXPECT_FALSE(filter.isExcluded("Game (JAPAN).zip", false));

    EXPECT_TRUE (filter.isExcluded("a?c", false)); //'?' is no wildcard
    EXPECT_FALSE(filter.isExcluded("abc", false));
}


TEST(ExcludeFilter, MultipleStars)
{
    const ExcludeFilter filter({"*Demo*Beta*"});

    EXPECT_TRUE (filter.isExcluded("Game (Demo) (Beta).zip", false));
    EXPECT_TRUE (filter.isExcluded("DemoBeta", false));
    EXPECT_FALSE(filter.isExcluded("Game (Beta) (Demo).zip", false));
}


TEST(ExcludeFilter, PatternIsTrimmed)
{
    const ExcludeFilter filter({"  *.txt \t"});
    EXPECT_TRUE(filter.isExcluded("readme.txt", false));
}


TEST(ExcludeFilter, InvalidPatterns)
{
    EXPECT_THROW(ExcludeFilter({""}),        FileError);
    EXPECT_THROW(ExcludeFilter({"   "}),     FileError);
    EXPECT_THROW(ExcludeFilter({"/"}),       FileError);
    EXPECT_THROW(ExcludeFilter({"a//b"}),    FileError);
    EXPECT_THROW(ExcludeFilter({"a/../b"}),  FileError);
    EXPECT_THROW(ExcludeFilter({"./a"}),     FileError);
    EXPECT_NO_THROW(ExcludeFilter({"a/b/"}));
}


TEST(ExcludeFilter, ParseExcludeList)
{
    const std::vector<Zstring> patterns = parseExcludeList("\xEF\xBB\xBF" "*.zip\r\n"
                                                           "# comment\n"
                                                           "\n"
                                                           "   \n"
                                                           "  /Redump  \n"
                                                           "BIOS/");
    EXPECT_EQ(patterns, std::vector<Zstring>({"*.zip", "/Redump", "BIOS/"}));
}


TEST(ExcludeFilter, ReadExcludeFile)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "excludes.txt", "*.7z\n#*.zip\n");

    EXPECT_EQ(readExcludeFile(tmp / "excludes.txt"), std::vector<Zstring>({"*.7z"}));
    EXPECT_THROW(readExcludeFile(tmp / "missing.txt"), FileError);
}
