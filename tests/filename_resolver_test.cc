/**
 * @file filename_resolver_test.cc
 * @brief Unit tests for collision-free save path selection
 */

#include "test_util.h"
#include <core/util/filename_resolver.h>
#include <gtest/gtest.h>
#include <set>
#include <thread>

using namespace filerelay::core;
using filerelay::test::TempDir;
using filerelay::test::WriteFileContents;

//=============================================================================
// CandidateName
//=============================================================================

TEST(CandidateNameTest, ZeroKeepsRequestedName) {
    EXPECT_EQ(CandidateName("report.txt", 0), "report.txt");
}

TEST(CandidateNameTest, CounterGoesBeforeExtension) {
    EXPECT_EQ(CandidateName("report.txt", 1), "report (1).txt");
    EXPECT_EQ(CandidateName("report.txt", 12), "report (12).txt");
}

/**
 * @test Only the last extension is kept after the counter
 */
TEST(CandidateNameTest, MultipleDotsUseLastExtension) {
    EXPECT_EQ(CandidateName("archive.tar.gz", 2), "archive.tar (2).gz");
}

TEST(CandidateNameTest, NoExtensionAppendsCounter) {
    EXPECT_EQ(CandidateName("Makefile", 3), "Makefile (3)");
}

//=============================================================================
// ResolveSavePath
//=============================================================================

TEST(ResolveSavePathTest, FreeNameIsUsedAsIs) {
    TempDir dir;
    auto resolved = ResolveSavePath(dir.path(), "a.txt");

    EXPECT_EQ(resolved.path, dir / "a.txt");
    EXPECT_FALSE(resolved.renamed);
    EXPECT_FALSE(std::filesystem::exists(resolved.path));
}

/**
 * @test Smallest free counter wins, gaps included
 */
TEST(ResolveSavePathTest, PicksSmallestFreeCounter) {
    TempDir dir;
    WriteFileContents(dir / "a.txt", "x");
    WriteFileContents(dir / "a (1).txt", "x");
    WriteFileContents(dir / "a (3).txt", "x");

    auto resolved = ResolveSavePath(dir.path(), "a.txt");

    EXPECT_EQ(resolved.path, dir / "a (2).txt");
    EXPECT_TRUE(resolved.renamed);
}

//=============================================================================
// ReserveSavePath
//=============================================================================

TEST(ReserveSavePathTest, CreatesMissingDirectoryAndFile) {
    TempDir dir;
    auto nested = dir.path() / "deeper" / "still";

    auto reserved = ReserveSavePath(nested, "a.txt");

    ASSERT_TRUE(reserved.has_value()) << reserved.error().message;
    EXPECT_EQ(reserved->path, nested / "a.txt");
    EXPECT_FALSE(reserved->renamed);
    EXPECT_TRUE(std::filesystem::exists(reserved->path));
    EXPECT_NE(reserved->file, nullptr);
}

/**
 * @test Existing file is never truncated
 */
TEST(ReserveSavePathTest, ExistingFileIsLeftAlone) {
    TempDir dir;
    WriteFileContents(dir / "a.txt", "original");

    auto reserved = ReserveSavePath(dir.path(), "a.txt");

    ASSERT_TRUE(reserved.has_value());
    EXPECT_EQ(reserved->path, dir / "a (1).txt");
    EXPECT_TRUE(reserved->renamed);
    EXPECT_EQ(filerelay::test::ReadFileContents(dir / "a.txt"), "original");
}

/**
 * @test Concurrent reservations of one name all get distinct files
 */
TEST(ReserveSavePathTest, ConcurrentCallersGetDistinctFiles) {
    TempDir dir;
    constexpr int kCallers = 8;
    std::vector<std::filesystem::path> paths(kCallers);
    std::vector<std::thread> threads;

    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back([&, i]() {
            auto reserved = ReserveSavePath(dir.path(), "same.bin");
            if (reserved) {
                paths[i] = reserved->path;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::set<std::filesystem::path> unique(paths.begin(), paths.end());
    EXPECT_EQ(unique.size(), static_cast<std::size_t>(kCallers));
    EXPECT_EQ(unique.count(std::filesystem::path{}), 0u);
    EXPECT_EQ(filerelay::test::CountFiles(dir.path()), static_cast<std::size_t>(kCallers));
}
