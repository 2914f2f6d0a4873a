// *****************************************************************************
// * This file is part of the ArchiveMirror project. It is distributed under   *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The ArchiveMirror Authors - All Rights Reserved             *
// *****************************************************************************

#include <filesystem>
#include <gtest/gtest.h>
#include <unistd.h>
#include <base/local_snapshot.h>
#include "test_util.h"

using namespace amr;
using namespace mirror;


TEST(LocalSnapshot, MissingTargetFolderIsEmpty)
{
    const test::TempFolder tmp;

    const LocalSnapshot snapshot = takeLocalSnapshot(tmp / "not-yet-created");
    EXPECT_TRUE(snapshot.files.empty());
    EXPECT_TRUE(snapshot.errors.empty());
}


TEST(LocalSnapshot, RegularFilesWithRelativePaths)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "a.bin", "12345");
    test::writeTestFile(tmp / "x/y/z.bin", "");
    std::filesystem::create_directories(tmp / "empty/folder");

    const LocalSnapshot snapshot = takeLocalSnapshot(tmp.path());

    ASSERT_EQ(snapshot.files.size(), 2u);
    ASSERT_TRUE(snapshot.contains("a.bin"));
    EXPECT_EQ(snapshot.files.at("a.bin").sizeOnDisk, 5u);
    EXPECT_TRUE(snapshot.contains("x/y/z.bin"));
    EXPECT_FALSE(snapshot.contains("x/y"));
    EXPECT_TRUE(snapshot.errors.empty());
}


TEST(LocalSnapshot, SymlinksAreIgnored)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "real.bin", "data");
    ASSERT_EQ(::symlink((tmp / "real.bin").c_str(), (tmp / "link.bin").c_str()), 0);
    ASSERT_EQ(::symlink(tmp.path().c_str(), (tmp / "loop").c_str()), 0);

    const LocalSnapshot snapshot = takeLocalSnapshot(tmp.path());

    EXPECT_TRUE (snapshot.contains("real.bin"));
    EXPECT_FALSE(snapshot.contains("link.bin"));
    EXPECT_FALSE(snapshot.contains("loop/real.bin"));
}


TEST(LocalSnapshot, LeftoverTempFilesAreIgnored)
{
    const test::TempFolder tmp;
    test::writeTestFile(tmp / "a.bin", "12345");
    test::writeTestFile(tmp / "a.bin.~3fa9", "12"); //interrupted download of a previous run
    test::writeTestFile(tmp / "sub/b.bin.~00ff", "");
    test::writeTestFile(tmp / "notes.~txt", "kept");

    const LocalSnapshot snapshot = takeLocalSnapshot(tmp.path());

    EXPECT_EQ(snapshot.files.size(), 2u);
    EXPECT_TRUE(snapshot.contains("a.bin"));
    EXPECT_TRUE(snapshot.contains("notes.~txt"));
    EXPECT_FALSE(snapshot.contains("a.bin.~3fa9"));
    EXPECT_FALSE(snapshot.contains("sub/b.bin.~00ff"));
}
