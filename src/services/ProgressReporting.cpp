/**
 * @file ProgressReporting.cpp
 * @brief Progress helpers implementation
 */

#include "services/ProgressReporting.hpp"

#include <algorithm>
#include <format>
#include <numeric>

// ============================================================================
// ThrottledProgress
// ============================================================================

ThrottledProgress::ThrottledProgress(ProgressCallback callback,
                                     std::chrono::milliseconds interval)
    : callback_(std::move(callback)), interval_(interval) {}

void ThrottledProgress::report(OperationProgress progress) {
    std::optional<Staged> staged;
    {
        std::lock_guard lock{mutex_};
        if (completed_) {
            return;
        }

        progress.percent = std::clamp(progress.percent, 0, 99);
        if (last_emitted_) {
            progress.percent = std::max(progress.percent, last_emitted_->percent);
            if (progress.percent == last_emitted_->percent &&
                progress.message == last_emitted_->message) {
                return;
            }
        }

        const auto now = std::chrono::steady_clock::now();
        if (!last_emitted_ || now - last_emit_ >= interval_) {
            staged = stage_locked(std::move(progress));
            last_emit_ = now;
            pending_.reset();
        } else {
            pending_ = std::move(progress);
        }
    }
    if (staged) {
        deliver(*staged);
    }
}

void ThrottledProgress::flush() {
    std::optional<Staged> staged;
    {
        std::lock_guard lock{mutex_};
        if (pending_ && !completed_) {
            staged = stage_locked(std::move(*pending_));
            last_emit_ = std::chrono::steady_clock::now();
            pending_.reset();
        }
    }
    if (staged) {
        deliver(*staged);
    }
}

void ThrottledProgress::complete(std::string message) {
    Staged staged;
    {
        std::lock_guard lock{mutex_};
        if (completed_) {
            return;
        }
        OperationProgress final_event =
            pending_.value_or(last_emitted_.value_or(OperationProgress{}));
        final_event.percent = 100;
        final_event.message = std::move(message);
        if (final_event.total_files > 0) {
            final_event.files_processed = final_event.total_files;
        }
        if (final_event.total_bytes > 0) {
            final_event.bytes_processed = final_event.total_bytes;
        }
        staged = stage_locked(std::move(final_event));
        pending_.reset();
        completed_ = true;
    }
    deliver(staged);
}

auto ThrottledProgress::last_percent() const -> int {
    std::lock_guard lock{mutex_};
    return last_emitted_ ? last_emitted_->percent : -1;
}

auto ThrottledProgress::stage_locked(OperationProgress progress) -> Staged {
    last_emitted_ = progress;
    return Staged{++staged_sequence_, std::move(progress)};
}

void ThrottledProgress::deliver(const Staged& staged) {
    if (!callback_) {
        return;
    }
    std::lock_guard lock{delivery_mutex_};
    // A newer event already went out; delivering this one would step backwards
    if (staged.sequence <= delivered_sequence_) {
        return;
    }
    delivered_sequence_ = staged.sequence;
    callback_(staged.progress);
}

// ============================================================================
// WeightedProgress
// ============================================================================

WeightedProgress::WeightedProgress(std::vector<double> weights)
    : weights_(std::move(weights)), percents_(weights_.size(), 0.0) {}

auto WeightedProgress::update(size_t part, double percent) -> double {
    std::lock_guard lock{mutex_};
    if (part < percents_.size()) {
        percents_[part] = std::clamp(percent, 0.0, 100.0);
    }
    return combined_locked();
}

auto WeightedProgress::combined() const -> double {
    std::lock_guard lock{mutex_};
    return combined_locked();
}

auto WeightedProgress::combined_locked() const -> double {
    const double total_weight = std::accumulate(weights_.begin(), weights_.end(), 0.0);
    if (total_weight <= 0.0) {
        if (percents_.empty()) {
            return 0.0;
        }
        return std::accumulate(percents_.begin(), percents_.end(), 0.0) /
               static_cast<double>(percents_.size());
    }
    double weighted = 0.0;
    for (size_t i = 0; i < weights_.size(); ++i) {
        weighted += weights_[i] * percents_[i];
    }
    return weighted / total_weight;
}

// ============================================================================
// ThroughputMonitor
// ============================================================================

ThroughputMonitor::ThroughputMonitor(std::chrono::steady_clock::time_point start)
    : last_time_(start) {}

auto ThroughputMonitor::record(uint64_t total_bytes, std::chrono::steady_clock::time_point now)
    -> std::optional<std::string> {
    std::lock_guard lock{mutex_};

    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(now - last_time_);
    if (elapsed < MIN_SAMPLE_INTERVAL || total_bytes < last_bytes_) {
        return std::nullopt;
    }

    const double seconds = static_cast<double>(elapsed.count()) / 1000.0;
    const auto speed =
        static_cast<uint64_t>(static_cast<double>(total_bytes - last_bytes_) / seconds);
    last_time_ = now;
    last_bytes_ = total_bytes;

    samples_.push_back(speed);
    if (samples_.size() > MAX_SAMPLES) {
        samples_.pop_front();
    }

    const auto average = average_locked();
    peak_ = std::max(peak_, average);

    const bool dropped = samples_.size() >= MIN_SAMPLES_FOR_DROP &&
                         static_cast<double>(average) <
                             static_cast<double>(peak_) * (1.0 - DROP_THRESHOLD);
    if (dropped && !in_drop_) {
        in_drop_ = true;
        drop_seen_ = true;
        constexpr double MB = 1024.0 * 1024.0;
        return std::format("Throughput dropped to {:.1f} MB/s from a peak of {:.1f} MB/s, "
                           "possible I/O contention",
                           static_cast<double>(average) / MB, static_cast<double>(peak_) / MB);
    }
    if (!dropped) {
        in_drop_ = false;
    }
    return std::nullopt;
}

auto ThroughputMonitor::average_bytes_per_sec() const -> uint64_t {
    std::lock_guard lock{mutex_};
    return average_locked();
}

auto ThroughputMonitor::peak_bytes_per_sec() const -> uint64_t {
    std::lock_guard lock{mutex_};
    return peak_;
}

auto ThroughputMonitor::drop_detected() const -> bool {
    std::lock_guard lock{mutex_};
    return drop_seen_;
}

auto ThroughputMonitor::average_locked() const -> uint64_t {
    if (samples_.empty()) {
        return 0;
    }
    const uint64_t total = std::accumulate(samples_.begin(), samples_.end(), uint64_t{0});
    return total / samples_.size();
}
