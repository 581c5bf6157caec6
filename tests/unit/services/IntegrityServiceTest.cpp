/**
 * @file IntegrityServiceTest.cpp
 * @brief Unit tests for IntegrityService job submission and JobHandle lifecycle
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <format>
#include <stdexcept>

#include "fixtures/TestFixtures.hpp"
#include "mocks/MockSettingsProvider.hpp"
#include "mocks/MockStorageDetector.hpp"
#include "services/IntegrityService.hpp"

using namespace std::chrono_literals;
using ::testing::Return;

namespace fs = std::filesystem;

class IntegrityServiceTest : public TempDirFixture {
protected:
    std::shared_ptr<MockStorageDetector> detector = MockStorageDetector::CreateNiceMock();

    IntegrityService MakeService(EngineSettings settings = {}) {
        return IntegrityService{detector, MockSettingsProvider::CreateNiceMock(settings), 8};
    }
};

// ============================================================================
// Option resolution
// ============================================================================

TEST_F(IntegrityServiceTest, ResolveCopyOptions_UnsetFields_TakenFromSettings) {
    EngineSettings settings;
    settings.default_algorithm = HashAlgorithm::SHA1;
    settings.verify_copies = false;
    settings.preserve_structure = false;
    settings.thread_override = 6;
    settings.buffer_size_override = 512 * 1024;
    auto service = MakeService(settings);

    const auto options = service.resolve_copy_options(CopyJobOptions{});

    EXPECT_EQ(options.algorithm, HashAlgorithm::SHA1);
    EXPECT_FALSE(options.verify);
    EXPECT_FALSE(options.preserve_structure);
    EXPECT_EQ(options.thread_override, 6);
    EXPECT_EQ(options.buffer_size_override, 512U * 1024);
}

TEST_F(IntegrityServiceTest, ResolveCopyOptions_CallerValues_WinOverSettings) {
    EngineSettings settings;
    settings.thread_override = 6;
    settings.verify_copies = false;
    auto service = MakeService(settings);

    CopyJobOptions job;
    job.algorithm = HashAlgorithm::MD5;
    job.verify = true;
    job.thread_override = 2;
    const auto options = service.resolve_copy_options(job);

    EXPECT_EQ(options.algorithm, HashAlgorithm::MD5);
    EXPECT_TRUE(options.verify);
    EXPECT_EQ(options.thread_override, 2);
}

TEST_F(IntegrityServiceTest, ResolveHashOptions_ZeroOverrides_TakenFromSettings) {
    EngineSettings settings;
    settings.thread_override = 4;
    settings.buffer_size_override = 65536;
    auto service = MakeService(settings);

    const auto from_settings = service.resolve_hash_options(HashOptions{});
    HashOptions explicit_options;
    explicit_options.thread_override = 2;
    const auto from_caller = service.resolve_hash_options(explicit_options);

    EXPECT_EQ(from_settings.thread_override, 4);
    EXPECT_EQ(from_settings.buffer_size_override, 65536U);
    EXPECT_EQ(from_caller.thread_override, 2);
}

TEST_F(IntegrityServiceTest, SubmitJob_PullsSettingsPerSubmission) {
    auto settings = std::make_shared<testing::NiceMock<MockSettingsProvider>>();
    EXPECT_CALL(*settings, get_settings()).Times(testing::AtLeast(2))
        .WillRepeatedly(Return(EngineSettings{}));
    IntegrityService service{detector, settings, 8};
    const auto file = WriteFile("a.txt", "a");

    auto first = service.submit_hash_job({file});
    auto second = service.submit_hash_job({file});

    EXPECT_TRUE(first.result().has_value());
    EXPECT_TRUE(second.result().has_value());
}

// ============================================================================
// Jobs
// ============================================================================

TEST_F(IntegrityServiceTest, SubmitHashJob_ProgressMonotonicAndEndsAtHundred) {
    for (int i = 0; i < 5; ++i) {
        WriteRandomFile(std::format("data/f{}.bin", i), 256 * 1024, static_cast<uint32_t>(i));
    }
    auto service = MakeService();
    ProgressCapture capture;

    auto job = service.submit_hash_job({temp_dir / "data"}, HashAlgorithm::SHA256);
    job.on_progress(capture.Callback());
    auto result = job.result();

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(result->results.size(), 5U);
    EXPECT_EQ(result->failed_count(), 0U);
    EXPECT_TRUE(job.is_finished());
    EXPECT_TRUE(capture.IsNonDecreasing());
    EXPECT_EQ(capture.LastPercent(), 100);
}

TEST_F(IntegrityServiceTest, OnProgress_LateSubscriber_ReceivesLatestEvent) {
    const auto file = WriteFile("a.txt", "hello");
    auto service = MakeService();

    auto job = service.submit_hash_job({file});
    ASSERT_TRUE(job.result().has_value());

    ProgressCapture capture;
    job.on_progress(capture.Callback());

    ASSERT_EQ(capture.Events().size(), 1U);
    EXPECT_EQ(capture.LastPercent(), 100);
}

TEST_F(IntegrityServiceTest, SubmitVerifyJob_ReportsOutcomes) {
    WriteFile("left/same.txt", "same");
    WriteFile("right/same.txt", "same");
    WriteFile("left/changed.txt", "before");
    WriteFile("right/changed.txt", "after");
    auto service = MakeService();

    auto job = service.submit_verify_job({temp_dir / "left"}, {temp_dir / "right"});
    auto report = job.result();

    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->algorithm, HashAlgorithm::SHA256);
    EXPECT_EQ(report->count(VerificationOutcome::EXACT_MATCH), 1U);
    EXPECT_EQ(report->count(VerificationOutcome::MISMATCH), 1U);
    EXPECT_FALSE(report->all_matched());
}

TEST_F(IntegrityServiceTest, SubmitCopyJob_CopiesWithSettingsAlgorithm) {
    EngineSettings settings;
    settings.default_algorithm = HashAlgorithm::SHA1;
    auto service = MakeService(settings);
    WriteFile("src/a.txt", "alpha");
    WriteFile("src/b.txt", "beta");

    auto job = service.submit_copy_job({temp_dir / "src"}, temp_dir / "dst");
    auto result = job.result();

    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->files_copied, 2U);
    ASSERT_FALSE(result->copied_files.empty());
    EXPECT_EQ(result->copied_files[0].source_digest.size(), 40U);
    EXPECT_EQ(ReadFile(temp_dir / "dst" / "src" / "b.txt"), "beta");
}

TEST_F(IntegrityServiceTest, SubmitCopyJob_InvalidInput_TerminalError) {
    auto service = MakeService();

    auto job = service.submit_copy_job({}, temp_dir / "dst");
    auto result = job.result();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::InvalidInput);
}

TEST_F(IntegrityServiceTest, CancelAndWait_RunningHashJob_TerminatesCancelled) {
    for (int i = 0; i < 4; ++i) {
        CreateSparseFile(std::format("big/f{}.bin", i), 256ULL * 1024 * 1024);
    }
    auto service = MakeService();

    auto job = service.submit_hash_job({temp_dir / "big"});
    auto result = job.cancel_and_wait(5s);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_cancelled());
    EXPECT_TRUE(job.is_finished());
}

// ============================================================================
// JobHandle lifecycle
// ============================================================================

TEST(JobHandleTest, Launch_WorkThrows_GenericError) {
    auto job = JobHandle<int>::launch(
        "throwing job",
        [](const std::atomic<bool>&, const ProgressCallback&) -> std::expected<int, util::Error> {
            throw std::runtime_error("boom");
        });

    auto result = job.result();

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::Generic);
    EXPECT_NE(result.error().message.find("boom"), std::string::npos);
}

TEST(JobHandleTest, CancelAndWait_WorkerIgnoresCancel_AbnormalTermination) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto job = JobHandle<int>::launch(
        "stuck job", [release](const std::atomic<bool>&, const ProgressCallback&)
                         -> std::expected<int, util::Error> {
            while (!release->load()) {
                std::this_thread::sleep_for(5ms);
            }
            return 7;
        });

    auto result = job.cancel_and_wait(100ms);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, util::ErrorKind::AbnormalTermination);

    // The late value from the abandoned worker is dropped
    release->store(true);
    std::this_thread::sleep_for(50ms);
    auto after = job.result();
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().kind, util::ErrorKind::AbnormalTermination);
}

TEST(JobHandleTest, Result_CooperativeWork_ReturnsValueAndProgress) {
    auto job = JobHandle<int>::launch(
        "counting job", [](const std::atomic<bool>& cancel, const ProgressCallback& progress)
                            -> std::expected<int, util::Error> {
            for (int p = 0; p <= 100; p += 25) {
                if (cancel.load()) {
                    return std::unexpected(util::cancelled_error("counting"));
                }
                OperationProgress update;
                update.percent = p;
                progress(update);
            }
            return 42;
        });

    auto result = job.result();
    ProgressCapture capture;
    job.on_progress(capture.Callback());

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, 42);
    EXPECT_EQ(capture.LastPercent(), 100);
}

TEST(JobHandleTest, WaitFor_UnfinishedJob_TimesOut) {
    auto job = JobHandle<int>::launch(
        "waiting job", [](const std::atomic<bool>& cancel, const ProgressCallback&)
                           -> std::expected<int, util::Error> {
            while (!cancel.load()) {
                std::this_thread::sleep_for(5ms);
            }
            return std::unexpected(util::cancelled_error("waiting"));
        });

    EXPECT_FALSE(job.wait_for(50ms));
    EXPECT_FALSE(job.is_finished());

    auto result = job.cancel_and_wait(2s);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is_cancelled());
}

TEST(JobHandleTest, Destructor_RunningJob_CancelsAndJoins) {
    std::atomic<bool> observed_cancel{false};
    {
        auto job = JobHandle<int>::launch(
            "scoped job", [&observed_cancel](const std::atomic<bool>& cancel, const ProgressCallback&)
                              -> std::expected<int, util::Error> {
                while (!cancel.load()) {
                    std::this_thread::sleep_for(5ms);
                }
                observed_cancel.store(true);
                return std::unexpected(util::cancelled_error("scoped"));
            });
    }
    EXPECT_TRUE(observed_cancel.load());
}
