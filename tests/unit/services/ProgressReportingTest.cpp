/**
 * @file ProgressReportingTest.cpp
 * @brief Unit tests for progress throttling, weighting and throughput tracking
 */

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <thread>

#include "fixtures/TestFixtures.hpp"
#include "services/ProgressReporting.hpp"

using namespace std::chrono_literals;

// ============================================================================
// ThrottledProgress
// ============================================================================

TEST(ThrottledProgressTest, Report_FirstEventAlwaysDelivered) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 1h};

    reporter.report(OperationProgress{.percent = 5, .message = "start"});
    reporter.report(OperationProgress{.percent = 10, .message = "more"});

    ASSERT_EQ(capture.Events().size(), 1U);
    EXPECT_EQ(capture.LastPercent(), 5);
}

TEST(ThrottledProgressTest, Flush_DeliversSuppressedEvent) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 1h};

    reporter.report(OperationProgress{.percent = 5});
    reporter.report(OperationProgress{.percent = 10});
    reporter.report(OperationProgress{.percent = 20});
    reporter.flush();

    EXPECT_EQ(capture.Percents(), (std::vector<int>{5, 20}));
}

TEST(ThrottledProgressTest, Report_PercentNeverDecreases) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 0ms};

    reporter.report(OperationProgress{.percent = 40, .message = "a"});
    reporter.report(OperationProgress{.percent = 10, .message = "b"});
    reporter.report(OperationProgress{.percent = 60, .message = "c"});

    EXPECT_EQ(capture.Percents(), (std::vector<int>{40, 40, 60}));
    EXPECT_TRUE(capture.IsNonDecreasing());
}

TEST(ThrottledProgressTest, Report_CapsBelowHundredUntilComplete) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 0ms};

    reporter.report(OperationProgress{.percent = 100, .message = "almost"});
    EXPECT_EQ(capture.LastPercent(), 99);

    reporter.complete("done");
    EXPECT_EQ(capture.LastPercent(), 100);
    EXPECT_EQ(capture.Events().back().message, "done");

    reporter.report(OperationProgress{.percent = 50, .message = "late"});
    EXPECT_EQ(capture.Events().size(), 2U);
}

TEST(ThrottledProgressTest, Report_IdenticalEventDropped) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 0ms};

    reporter.report(OperationProgress{.percent = 30, .message = "same"});
    reporter.report(OperationProgress{.percent = 30, .message = "same"});

    EXPECT_EQ(capture.Events().size(), 1U);
}

TEST(ThrottledProgressTest, Complete_FillsFileAndByteCounters) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 0ms};

    reporter.report(OperationProgress{.percent = 50,
                                      .bytes_processed = 10,
                                      .total_bytes = 20,
                                      .files_processed = 1,
                                      .total_files = 2});
    reporter.complete("done");

    const auto final_event = capture.Events().back();
    EXPECT_EQ(final_event.bytes_processed, 20U);
    EXPECT_EQ(final_event.files_processed, 2U);
}

TEST(ThrottledProgressTest, Report_FromManyThreads_StaysMonotonic) {
    ProgressCapture capture;
    ThrottledProgress reporter{capture.Callback(), 0ms};
    std::atomic<int> counter{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 50; ++i) {
                const int value = counter.fetch_add(1) / 2;
                reporter.report(OperationProgress{.percent = value,
                                                  .message = std::to_string(value)});
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    reporter.complete("done");

    EXPECT_TRUE(capture.IsNonDecreasing());
    EXPECT_EQ(capture.LastPercent(), 100);
}

TEST(ThrottledProgressTest, Callback_QueriesReporter_SeesDeliveredPercent) {
    ThrottledProgress* reporter_ref = nullptr;
    std::vector<int> seen;
    ThrottledProgress reporter{[&](const OperationProgress&) {
                                   seen.push_back(reporter_ref->last_percent());
                               },
                               0ms};
    reporter_ref = &reporter;

    reporter.report(OperationProgress{.percent = 10, .message = "a"});
    reporter.complete("done");

    EXPECT_EQ(seen, (std::vector<int>{10, 100}));
}

TEST(ThrottledProgressTest, Report_WhileCallbackRuns_OtherThreadNotBlocked) {
    std::atomic<bool> in_callback{false};
    std::atomic<bool> release{false};
    ThrottledProgress reporter{[&](const OperationProgress&) {
                                   in_callback.store(true);
                                   while (!release.load()) {
                                       std::this_thread::sleep_for(1ms);
                                   }
                               },
                               1h};

    std::thread first([&]() { reporter.report(OperationProgress{.percent = 5}); });
    while (!in_callback.load()) {
        std::this_thread::sleep_for(1ms);
    }

    auto second = std::async(std::launch::async, [&]() {
        reporter.report(OperationProgress{.percent = 20});
        return reporter.last_percent();
    });
    const bool returned = second.wait_for(2s) == std::future_status::ready;
    release.store(true);
    first.join();

    ASSERT_TRUE(returned);
    EXPECT_EQ(second.get(), 5);
}

// ============================================================================
// WeightedProgress
// ============================================================================

TEST(WeightedProgressTest, Update_WeightsByPart) {
    WeightedProgress progress{{3.0, 1.0}};

    EXPECT_DOUBLE_EQ(progress.update(0, 100.0), 75.0);
    EXPECT_DOUBLE_EQ(progress.update(1, 100.0), 100.0);
}

TEST(WeightedProgressTest, Update_ZeroWeights_AveragesParts) {
    WeightedProgress progress{{0.0, 0.0}};

    EXPECT_DOUBLE_EQ(progress.update(0, 50.0), 25.0);
    EXPECT_DOUBLE_EQ(progress.combined(), 25.0);
}

TEST(WeightedProgressTest, Update_ClampsPercent) {
    WeightedProgress progress{{1.0}};

    EXPECT_DOUBLE_EQ(progress.update(0, 250.0), 100.0);
    EXPECT_DOUBLE_EQ(progress.update(0, -5.0), 0.0);
}

// ============================================================================
// ThroughputMonitor
// ============================================================================

TEST(ThroughputMonitorTest, Record_SteadyRate_NoDrop) {
    const auto start = std::chrono::steady_clock::time_point{};
    ThroughputMonitor monitor{start};

    for (int i = 1; i <= 8; ++i) {
        EXPECT_FALSE(monitor.record(static_cast<uint64_t>(i) * 1'000'000, start + i * 1s));
    }

    EXPECT_EQ(monitor.average_bytes_per_sec(), 1'000'000U);
    EXPECT_EQ(monitor.peak_bytes_per_sec(), 1'000'000U);
    EXPECT_FALSE(monitor.drop_detected());
}

TEST(ThroughputMonitorTest, Record_SharpSlowdown_WarnsOnce) {
    const auto start = std::chrono::steady_clock::time_point{};
    ThroughputMonitor monitor{start};

    uint64_t total = 0;
    auto now = start;
    for (int i = 0; i < 5; ++i) {
        total += 100'000'000;
        now += 1s;
        EXPECT_FALSE(monitor.record(total, now));
    }

    int warnings = 0;
    for (int i = 0; i < 10; ++i) {
        total += 1'000'000;
        now += 1s;
        if (auto warning = monitor.record(total, now)) {
            ++warnings;
            EXPECT_NE(warning->find("contention"), std::string::npos);
        }
    }

    EXPECT_EQ(warnings, 1);
    EXPECT_TRUE(monitor.drop_detected());
    EXPECT_LT(monitor.average_bytes_per_sec(), monitor.peak_bytes_per_sec());
}

TEST(ThroughputMonitorTest, Record_TooSoon_Ignored) {
    const auto start = std::chrono::steady_clock::time_point{};
    ThroughputMonitor monitor{start};

    EXPECT_FALSE(monitor.record(1'000'000, start + 10ms));
    EXPECT_EQ(monitor.average_bytes_per_sec(), 0U);
}
