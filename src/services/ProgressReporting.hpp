/**
 * @file ProgressReporting.hpp
 * @brief Progress throttling, weighted aggregation and throughput monitoring
 */

#pragma once

#include "models/OperationTypes.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

/**
 * @class ThrottledProgress
 * @brief Rate-limited, monotonic forwarding of progress events
 *
 * - the first event is always delivered
 * - at most one event per interval, the latest suppressed one is kept pending
 * - percent never goes down and stays below 100 until complete()
 * - identical consecutive events are dropped
 *
 * Thread-safe. Events are staged under the state lock and delivered after
 * it is released, so the callback may query the throttler and reporting
 * threads never wait on caller code to update state. Delivery is serialized
 * and an event older than one already delivered is dropped, keeping the
 * caller's sequence in order.
 */
class ThrottledProgress {
public:
    static constexpr auto DEFAULT_INTERVAL = std::chrono::milliseconds{100};

    explicit ThrottledProgress(ProgressCallback callback,
                               std::chrono::milliseconds interval = DEFAULT_INTERVAL);

    void report(OperationProgress progress);

    /**
     * @brief Deliver the suppressed event, if any
     */
    void flush();

    /**
     * @brief Deliver the final 100% event; later reports are ignored
     */
    void complete(std::string message);

    [[nodiscard]] auto last_percent() const -> int;

private:
    struct Staged {
        uint64_t sequence = 0;
        OperationProgress progress;
    };

    auto stage_locked(OperationProgress progress) -> Staged;
    void deliver(const Staged& staged);

    mutable std::mutex mutex_;
    ProgressCallback callback_;
    std::chrono::milliseconds interval_;
    std::chrono::steady_clock::time_point last_emit_{};
    std::optional<OperationProgress> last_emitted_;
    std::optional<OperationProgress> pending_;
    bool completed_ = false;
    uint64_t staged_sequence_ = 0;

    std::mutex delivery_mutex_;
    uint64_t delivered_sequence_ = 0;
};

/**
 * @class WeightedProgress
 * @brief Combines per-part percentages by weight (e.g. file counts per side)
 */
class WeightedProgress {
public:
    explicit WeightedProgress(std::vector<double> weights);

    /**
     * @brief Update one part and return the combined percentage
     */
    auto update(size_t part, double percent) -> double;

    [[nodiscard]] auto combined() const -> double;

private:
    [[nodiscard]] auto combined_locked() const -> double;

    mutable std::mutex mutex_;
    std::vector<double> weights_;
    std::vector<double> percents_;
};

/**
 * @class ThroughputMonitor
 * @brief Rolling-average speed with peak tracking
 *
 * Flags contention when the rolling average falls more than DROP_THRESHOLD
 * below the observed peak. It only reports; it never throttles or aborts.
 */
class ThroughputMonitor {
public:
    static constexpr size_t MAX_SAMPLES = 10;
    static constexpr size_t MIN_SAMPLES_FOR_DROP = 3;
    static constexpr double DROP_THRESHOLD = 0.30;
    static constexpr auto MIN_SAMPLE_INTERVAL = std::chrono::milliseconds{100};

    explicit ThroughputMonitor(
        std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now());

    /**
     * @brief Record cumulative bytes at a point in time
     * @return Warning text when a drop below the threshold starts
     */
    auto record(uint64_t total_bytes,
                std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now())
        -> std::optional<std::string>;

    [[nodiscard]] auto average_bytes_per_sec() const -> uint64_t;
    [[nodiscard]] auto peak_bytes_per_sec() const -> uint64_t;
    [[nodiscard]] auto drop_detected() const -> bool;

private:
    [[nodiscard]] auto average_locked() const -> uint64_t;

    mutable std::mutex mutex_;
    std::deque<uint64_t> samples_;
    std::chrono::steady_clock::time_point last_time_;
    uint64_t last_bytes_ = 0;
    uint64_t peak_ = 0;
    bool in_drop_ = false;
    bool drop_seen_ = false;
};
