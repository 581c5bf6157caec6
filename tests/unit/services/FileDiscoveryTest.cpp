/**
 * @file FileDiscoveryTest.cpp
 * @brief Unit tests for path expansion and copy planning
 */

#include <gtest/gtest.h>

#include "fixtures/TestFixtures.hpp"
#include "services/FileDiscovery.hpp"

namespace fs = std::filesystem;

class FileDiscoveryTest : public TempDirFixture {};

// ============================================================================
// expand_paths
// ============================================================================

TEST_F(FileDiscoveryTest, ExpandPaths_Directory_ReturnsSortedRegularFiles) {
    WriteFile("root/b.txt", "b");
    WriteFile("root/a.txt", "a");
    WriteFile("root/sub/c.txt", "c");
    fs::create_directories(temp_dir / "root" / "empty");

    auto files = file_discovery::expand_paths({temp_dir / "root"});

    ASSERT_EQ(files.size(), 3U);
    EXPECT_EQ(files[0], temp_dir / "root" / "a.txt");
    EXPECT_EQ(files[1], temp_dir / "root" / "b.txt");
    EXPECT_EQ(files[2], temp_dir / "root" / "sub" / "c.txt");
}

TEST_F(FileDiscoveryTest, ExpandPaths_OverlappingInputs_Deduplicated) {
    const auto file = WriteFile("root/a.txt", "a");

    auto files = file_discovery::expand_paths({temp_dir / "root", file, temp_dir / "root/./a.txt"});

    ASSERT_EQ(files.size(), 1U);
    EXPECT_EQ(files[0], file);
}

TEST_F(FileDiscoveryTest, ExpandPaths_MissingFile_KeptForReporting) {
    auto files = file_discovery::expand_paths({temp_dir / "missing.bin"});

    ASSERT_EQ(files.size(), 1U);
    EXPECT_EQ(files[0], temp_dir / "missing.bin");
}

TEST_F(FileDiscoveryTest, ExpandPaths_EmptyDirectory_ReturnsNothing) {
    fs::create_directories(temp_dir / "empty");
    EXPECT_TRUE(file_discovery::expand_paths({temp_dir / "empty"}).empty());
}

// ============================================================================
// common_root / relative_to
// ============================================================================

TEST_F(FileDiscoveryTest, CommonRoot_FilesInSiblingDirectories_ReturnsParent) {
    const auto a = WriteFile("case/disk1/a.bin", "a");
    const auto b = WriteFile("case/disk2/b.bin", "b");

    EXPECT_EQ(file_discovery::common_root({a, b}), temp_dir / "case");
}

TEST_F(FileDiscoveryTest, CommonRoot_SingleDirectory_ReturnsItself) {
    fs::create_directories(temp_dir / "case");
    EXPECT_EQ(file_discovery::common_root({temp_dir / "case/"}), temp_dir / "case");
}

TEST_F(FileDiscoveryTest, RelativeTo_OutsideRoot_FallsBackToFileName) {
    EXPECT_EQ(file_discovery::relative_to(temp_dir / "a/b/c.txt", temp_dir / "a"),
              fs::path{"b/c.txt"});
    EXPECT_EQ(file_discovery::relative_to(temp_dir / "x/c.txt", temp_dir / "a"),
              fs::path{"c.txt"});
}

// ============================================================================
// plan_copy
// ============================================================================

TEST_F(FileDiscoveryTest, PlanCopy_PreserveStructure_KeepsDirectoryName) {
    WriteFile("evidence/logs/sys.log", "log");
    WriteFile("evidence/img.dd", "image");
    const auto loose = WriteFile("notes.txt", "notes");
    const auto dest = temp_dir / "out";

    auto plan = file_discovery::plan_copy({temp_dir / "evidence", loose}, dest, true);

    EXPECT_TRUE(plan.errors.empty());
    ASSERT_EQ(plan.items.size(), 3U);
    EXPECT_EQ(plan.items[0].destination, dest / "evidence" / "img.dd");
    EXPECT_EQ(plan.items[1].destination, dest / "evidence" / "logs" / "sys.log");
    EXPECT_EQ(plan.items[2].destination, dest / "notes.txt");
    EXPECT_EQ(plan.items[0].size_bytes, 5U);
    EXPECT_EQ(plan.source_root, temp_dir);
}

TEST_F(FileDiscoveryTest, PlanCopy_Flat_DuplicateNameBecomesError) {
    WriteFile("a/same.txt", "first");
    WriteFile("b/same.txt", "second");
    const auto dest = temp_dir / "out";

    auto plan = file_discovery::plan_copy({temp_dir / "a", temp_dir / "b"}, dest, false);

    ASSERT_EQ(plan.items.size(), 1U);
    EXPECT_EQ(plan.items[0].source, temp_dir / "a" / "same.txt");
    EXPECT_EQ(plan.items[0].destination, dest / "same.txt");
    ASSERT_EQ(plan.errors.size(), 1U);
    EXPECT_EQ(plan.errors[0].source, temp_dir / "b" / "same.txt");
    EXPECT_EQ(plan.errors[0].error.code, EEXIST);
}

TEST_F(FileDiscoveryTest, PlanCopy_MissingSource_RecordedAsError) {
    auto plan = file_discovery::plan_copy({temp_dir / "gone.bin"}, temp_dir / "out", true);

    EXPECT_TRUE(plan.items.empty());
    ASSERT_EQ(plan.errors.size(), 1U);
    EXPECT_EQ(plan.errors[0].error.code, ENOENT);
    EXPECT_EQ(plan.errors[0].error.kind, util::ErrorKind::Copy);
}
