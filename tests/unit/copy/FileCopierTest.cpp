/**
 * @file FileCopierTest.cpp
 * @brief Unit tests for the partial-file commit path shared by the strategies
 */

#include <gtest/gtest.h>

#include "copy/FileCopier.hpp"
#include "copy/ICopyStrategy.hpp"
#include "fixtures/TestFixtures.hpp"
#include "services/Digest.hpp"

namespace fs = std::filesystem;

namespace {

auto DigestOf(const std::string& content) -> std::string {
    return digest::hash_bytes(HashAlgorithm::SHA256,
                              {reinterpret_cast<const uint8_t*>(content.data()), content.size()})
        .value();
}

}  // namespace

class FileCopierTest : public TempDirFixture {
protected:
    CopyContext context;

    CopyItem MakeItem(const std::string& content) {
        CopyItem item{
            .source = WriteFile("src/evidence.bin", content),
            .destination = temp_dir / "dst" / "evidence.bin",
            .size_bytes = content.size(),
        };
        fs::create_directories(item.destination.parent_path());
        return item;
    }
};

TEST_F(FileCopierTest, PartialPath_AppendsSuffixBesideDestination) {
    const auto partial = file_copier::partial_path(temp_dir / "dst" / "disk.img");

    EXPECT_EQ(partial.parent_path(), temp_dir / "dst");
    EXPECT_EQ(partial.filename(), "disk.img.partial");
}

TEST_F(FileCopierTest, CommitCopy_DigestMismatch_LeavesNeitherDestinationNorPartial) {
    const auto item = MakeItem("original bytes");
    WriteFile("dst/evidence.bin.partial", "corrupted bytes");

    auto committed = file_copier::commit_copy(item, DigestOf("original bytes"), context);

    ASSERT_FALSE(committed.has_value());
    EXPECT_EQ(committed.error().kind, util::ErrorKind::Copy);
    EXPECT_EQ(committed.error().code, EIO);
    EXPECT_FALSE(fs::exists(item.destination));
    EXPECT_FALSE(fs::exists(file_copier::partial_path(item.destination)));
}

TEST_F(FileCopierTest, CommitCopy_DigestMatches_RenamesPartialOverDestination) {
    const auto item = MakeItem("original bytes");
    WriteFile("dst/evidence.bin", "stale copy from an earlier run");
    WriteFile("dst/evidence.bin.partial", "original bytes");

    auto committed = file_copier::commit_copy(item, DigestOf("original bytes"), context);

    ASSERT_TRUE(committed.has_value()) << committed.error().message;
    EXPECT_TRUE(committed->verified);
    EXPECT_EQ(committed->destination_digest, DigestOf("original bytes"));
    EXPECT_EQ(ReadFile(item.destination), "original bytes");
    EXPECT_FALSE(fs::exists(file_copier::partial_path(item.destination)));
}

TEST_F(FileCopierTest, CommitCopy_NoPartial_ReportsErrorWithoutDestination) {
    const auto item = MakeItem("original bytes");

    auto committed = file_copier::commit_copy(item, DigestOf("original bytes"), context);

    ASSERT_FALSE(committed.has_value());
    EXPECT_FALSE(fs::exists(item.destination));
}

TEST_F(FileCopierTest, CommitCopy_VerifyOff_RenamesWithoutReadBack) {
    const auto item = MakeItem("original bytes");
    WriteFile("dst/evidence.bin.partial", "original bytes");
    context.verify = false;

    auto committed = file_copier::commit_copy(item, "", context);

    ASSERT_TRUE(committed.has_value());
    EXPECT_FALSE(committed->verified);
    EXPECT_TRUE(committed->destination_digest.empty());
    EXPECT_EQ(ReadFile(item.destination), "original bytes");
}

TEST_F(FileCopierTest, CopyFile_Success_NoPartialLeftBehind) {
    const auto item = MakeItem("evidence content");

    auto copied = file_copier::copy_file(item, context, nullptr);

    ASSERT_TRUE(copied.has_value()) << copied.error().message;
    EXPECT_TRUE(copied->verified);
    EXPECT_EQ(ReadFile(item.destination), "evidence content");
    EXPECT_FALSE(fs::exists(file_copier::partial_path(item.destination)));
}

TEST_F(FileCopierTest, CopyFile_SourceMissing_NoPartialLeftBehind) {
    const auto item = MakeItem("evidence content");
    fs::remove(item.source);

    auto copied = file_copier::copy_file(item, context, nullptr);

    ASSERT_FALSE(copied.has_value());
    EXPECT_FALSE(fs::exists(item.destination));
    EXPECT_FALSE(fs::exists(file_copier::partial_path(item.destination)));
}

TEST_F(FileCopierTest, CopyTracker_CallbackQueriesTracker_DoesNotBlock) {
    const auto item = MakeItem(std::string(100, 'x'));
    context.files = {item};
    context.destination_root = temp_dir / "dst";

    file_copier::CopyTracker* tracker_ref = nullptr;
    std::vector<uint64_t> seen;
    context.progress = [&](const OperationProgress&) {
        if (tracker_ref != nullptr) {
            seen.push_back(tracker_ref->bytes_copied());
        }
    };
    file_copier::CopyTracker tracker{context, false};
    tracker_ref = &tracker;

    tracker.add_bytes(100);
    tracker.file_copied(CopiedFile{.source = item.source, .destination = item.destination,
                                   .size_bytes = 100});
    const auto result = tracker.finish(CopyStrategyKind::SEQUENTIAL, 1);

    EXPECT_TRUE(result.success);
    ASSERT_FALSE(seen.empty());
    EXPECT_EQ(seen.back(), 100U);
}
