/**
 * @file CopyStrategyTest.cpp
 * @brief Behaviour shared by every copy strategy, plus strategy specifics
 */

#include <gtest/gtest.h>

#include <format>
#include <memory>

#include "copy/CrossDeviceCopyStrategy.hpp"
#include "copy/ParallelCopyStrategy.hpp"
#include "copy/SequentialCopyStrategy.hpp"
#include "fixtures/TestFixtures.hpp"
#include "services/Digest.hpp"
#include "services/FileDiscovery.hpp"

namespace fs = std::filesystem;

namespace {

auto ExpectedDigest(const std::string& content) -> std::string {
    return digest::hash_bytes(HashAlgorithm::SHA256,
                              {reinterpret_cast<const uint8_t*>(content.data()), content.size()})
        .value();
}

}  // namespace

class CopyStrategyFixture : public TempDirFixture {
protected:
    std::atomic<bool> cancel{false};
    ProgressCapture capture;

    CopyContext MakeContext(const std::vector<fs::path>& sources, bool verify = true) {
        auto plan = file_discovery::plan_copy(sources, temp_dir / "dst", true);
        EXPECT_TRUE(plan.errors.empty());
        fs::create_directories(temp_dir / "dst");

        CopyContext context;
        context.files = std::move(plan.items);
        context.source_root = plan.source_root;
        context.destination_root = temp_dir / "dst";
        context.verify = verify;
        context.cancel_flag = &cancel;
        context.progress = capture.Callback();
        return context;
    }

    size_t CountPartials() const {
        size_t count = 0;
        if (!fs::exists(temp_dir / "dst")) {
            return 0;
        }
        for (const auto& entry : fs::recursive_directory_iterator(temp_dir / "dst")) {
            if (entry.path().extension() == ".partial") {
                ++count;
            }
        }
        return count;
    }

    void WriteEvidenceSet() {
        WriteRandomFile("src/evidence/disk.img", 3 * 1024 * 1024 + 17, 1);
        WriteRandomFile("src/evidence/logs/a.log", 12345, 2);
        WriteRandomFile("src/evidence/logs/b.log", 1, 3);
        WriteFile("src/evidence/empty.txt", "");
        for (uint32_t i = 0; i < 8; ++i) {
            WriteRandomFile(std::format("src/evidence/bulk/f{}.bin", i), 64 * 1024 + i, 10 + i);
        }
    }
};

// ============================================================================
// Shared behaviour, run for every strategy
// ============================================================================

enum class StrategyUnderTest { SEQUENTIAL, PARALLEL, CROSS_DEVICE };

class CopyStrategyTest : public CopyStrategyFixture,
                         public ::testing::WithParamInterface<StrategyUnderTest> {
protected:
    std::unique_ptr<ICopyStrategy> MakeStrategy() const {
        switch (GetParam()) {
            case StrategyUnderTest::SEQUENTIAL:
                return std::make_unique<SequentialCopyStrategy>();
            case StrategyUnderTest::PARALLEL:
                return std::make_unique<ParallelCopyStrategy>(4);
            case StrategyUnderTest::CROSS_DEVICE:
                return std::make_unique<CrossDeviceCopyStrategy>(4, 256 * 1024);
        }
        return nullptr;
    }
};

TEST_P(CopyStrategyTest, Execute_DirectoryTree_CopiesAndVerifiesEveryFile) {
    WriteEvidenceSet();
    auto context = MakeContext({temp_dir / "src" / "evidence"});
    auto strategy = MakeStrategy();

    auto result = strategy->execute(context);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->success);
    EXPECT_TRUE(result->per_file_errors.empty());
    EXPECT_EQ(result->files_copied, context.files.size());
    EXPECT_EQ(result->bytes_copied, context.total_bytes());
    EXPECT_EQ(result->strategy_name, strategy->name());
    EXPECT_EQ(result->thread_count, strategy->thread_count());

    for (const auto& item : context.files) {
        ASSERT_TRUE(fs::exists(item.destination)) << item.destination;
        EXPECT_EQ(ReadFile(item.destination), ReadFile(item.source)) << item.destination;
    }
    ASSERT_EQ(result->copied_files.size(), context.files.size());
    for (const auto& copied : result->copied_files) {
        EXPECT_TRUE(copied.verified);
        EXPECT_EQ(copied.source_digest, copied.destination_digest);
        EXPECT_EQ(copied.source_digest, ExpectedDigest(ReadFile(copied.source)));
    }
    EXPECT_TRUE(fs::exists(temp_dir / "dst" / "evidence" / "logs" / "a.log"));
    EXPECT_EQ(CountPartials(), 0U);

    EXPECT_TRUE(capture.IsNonDecreasing());
    EXPECT_EQ(capture.LastPercent(), 100);
}

TEST_P(CopyStrategyTest, Execute_PreservesPermissionsAndModificationTime) {
    const auto source = WriteFile("src/script.sh", "#!/bin/sh\necho ok\n");
    fs::permissions(source, fs::perms::owner_read | fs::perms::owner_write |
                                fs::perms::owner_exec | fs::perms::group_read);
    const auto mtime = fs::file_time_type::clock::now() - std::chrono::hours{24};
    fs::last_write_time(source, mtime);
    WriteFile("src/other.txt", "second file");

    auto context = MakeContext({temp_dir / "src"});
    auto result = MakeStrategy()->execute(context);

    ASSERT_TRUE(result.has_value());
    const auto copy = temp_dir / "dst" / "src" / "script.sh";
    EXPECT_EQ(fs::status(copy).permissions(), fs::status(source).permissions());
    EXPECT_EQ(fs::last_write_time(copy), mtime);
}

TEST_P(CopyStrategyTest, Execute_WithoutVerify_LeavesDestinationDigestEmpty) {
    WriteFile("src/a.txt", "alpha");
    WriteFile("src/b.txt", "beta");
    auto context = MakeContext({temp_dir / "src"}, false);

    auto result = MakeStrategy()->execute(context);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    for (const auto& copied : result->copied_files) {
        EXPECT_FALSE(copied.verified);
        EXPECT_TRUE(copied.destination_digest.empty());
    }
}

TEST_P(CopyStrategyTest, Execute_MissingSource_PerFileErrorAndNoHundredPercent) {
    WriteFile("src/present.txt", "present");
    WriteFile("src/vanishing.txt", "gone soon");
    auto context = MakeContext({temp_dir / "src"});
    fs::remove(temp_dir / "src" / "vanishing.txt");

    auto result = MakeStrategy()->execute(context);

    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->files_copied, 1U);
    ASSERT_EQ(result->per_file_errors.size(), 1U);
    EXPECT_EQ(result->per_file_errors[0].source, temp_dir / "src" / "vanishing.txt");
    EXPECT_EQ(result->per_file_errors[0].error.kind, util::ErrorKind::Copy);
    EXPECT_FALSE(fs::exists(temp_dir / "dst" / "src" / "vanishing.txt"));
    EXPECT_EQ(CountPartials(), 0U);
    EXPECT_LT(capture.LastPercent(), 100);
}

TEST_P(CopyStrategyTest, Execute_DestinationRootGone_ReturnsDestinationUnavailable) {
    WriteFile("src/a.txt", "alpha");
    WriteFile("src/b.txt", "beta");
    auto context = MakeContext({temp_dir / "src"});
    fs::remove(temp_dir / "src" / "a.txt");
    context.destination_root = temp_dir / "unmounted";

    auto result = MakeStrategy()->execute(context);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::DestinationUnavailable);
}

TEST_P(CopyStrategyTest, Execute_CancelledBeforeStart_ReturnsCancelledAndLeavesNoFiles) {
    WriteEvidenceSet();
    auto context = MakeContext({temp_dir / "src" / "evidence"});
    cancel.store(true);

    auto result = MakeStrategy()->execute(context);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_cancelled());
    EXPECT_FALSE(fs::exists(temp_dir / "dst" / "evidence" / "disk.img"));
    EXPECT_LT(capture.LastPercent(), 100);
}

TEST_P(CopyStrategyTest, Execute_CancelledMidCopy_StopsWithoutPartialFiles) {
    WriteRandomFile("src/big.bin", 8 * 1024 * 1024, 7);
    WriteRandomFile("src/big2.bin", 8 * 1024 * 1024, 8);
    auto context = MakeContext({temp_dir / "src"});
    context.buffer_size = 64 * 1024;
    context.progress = [this](const OperationProgress& progress) {
        if (progress.bytes_processed == 0) {
            // Outlast the throttle interval so the first data event is delivered
            std::this_thread::sleep_for(std::chrono::milliseconds{150});
            return;
        }
        cancel.store(true);
    };

    auto result = MakeStrategy()->execute(context);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_cancelled());
    for (const auto& item : context.files) {
        if (fs::exists(item.destination)) {
            // Only completely copied files may remain
            EXPECT_EQ(fs::file_size(item.destination), item.size_bytes);
        }
    }
    EXPECT_EQ(CountPartials(), 0U);
}

INSTANTIATE_TEST_SUITE_P(AllStrategies, CopyStrategyTest,
                         ::testing::Values(StrategyUnderTest::SEQUENTIAL,
                                           StrategyUnderTest::PARALLEL,
                                           StrategyUnderTest::CROSS_DEVICE),
                         [](const ::testing::TestParamInfo<StrategyUnderTest>& info) {
                             switch (info.param) {
                                 case StrategyUnderTest::SEQUENTIAL:
                                     return std::string{"Sequential"};
                                 case StrategyUnderTest::PARALLEL:
                                     return std::string{"Parallel"};
                                 case StrategyUnderTest::CROSS_DEVICE:
                                     return std::string{"CrossDevice"};
                             }
                             return std::string{"Unknown"};
                         });

// ============================================================================
// Strategy specifics
// ============================================================================

class CrossDeviceCopyStrategyTest : public CopyStrategyFixture {};

TEST_F(CrossDeviceCopyStrategyTest, Execute_LargeFiles_NeverExceedsPoolSize) {
    WriteRandomFile("src/one.bin", 5 * 1024 * 1024, 1);
    WriteRandomFile("src/two.bin", 3 * 1024 * 1024 + 5, 2);
    auto context = MakeContext({temp_dir / "src"});

    CrossDeviceCopyStrategy strategy{4, 128 * 1024};
    auto result = strategy.execute(context);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_GE(strategy.last_peak_buffers(), 1U);
    EXPECT_LE(strategy.last_peak_buffers(), 4U);
}

TEST_F(CrossDeviceCopyStrategyTest, Execute_SingleBufferPool_StillCompletes) {
    WriteRandomFile("src/one.bin", 1024 * 1024, 1);
    WriteRandomFile("src/two.bin", 1024 * 1024, 2);
    auto context = MakeContext({temp_dir / "src"});

    CrossDeviceCopyStrategy strategy{1, 64 * 1024, std::chrono::milliseconds{5000}};
    auto result = strategy.execute(context);

    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->success);
    EXPECT_EQ(strategy.last_peak_buffers(), 1U);
}

TEST_F(CrossDeviceCopyStrategyTest, Execute_LongVerificationOfLargeFile_DoesNotStarveReader) {
    // Read-back of the first file takes far longer than the acquire timeout
    CreateSparseFile("src/a_large.img", 256ULL * 1024 * 1024);
    WriteRandomFile("src/b_next.bin", 16 * 1024 * 1024, 3);
    auto context = MakeContext({temp_dir / "src"});

    CrossDeviceCopyStrategy strategy{4, 1024 * 1024, std::chrono::milliseconds{150}};
    auto result = strategy.execute(context);

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->files_copied, 2U);
    for (const auto& copied : result->copied_files) {
        EXPECT_TRUE(copied.verified) << copied.destination;
    }
    EXPECT_EQ(fs::file_size(temp_dir / "dst" / "src" / "a_large.img"), 256ULL * 1024 * 1024);
    EXPECT_EQ(ReadFile(temp_dir / "dst" / "src" / "b_next.bin"),
              ReadFile(temp_dir / "src" / "b_next.bin"));
    EXPECT_EQ(CountPartials(), 0U);
}

class ParallelCopyStrategyTest : public CopyStrategyFixture {};

TEST_F(ParallelCopyStrategyTest, Execute_MoreThreadsThanFiles_ReportsConfiguredThreads) {
    WriteFile("src/a.txt", "a");
    WriteFile("src/b.txt", "b");
    auto context = MakeContext({temp_dir / "src"});

    ParallelCopyStrategy strategy{16};
    auto result = strategy.execute(context);

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->thread_count, 16);
    EXPECT_EQ(result->files_copied, 2U);
}
