/**
 * @file JobHandle.hpp
 * @brief Background job with a progress stream and exactly one terminal result
 */

#pragma once

#include "models/OperationTypes.hpp"
#include "util/Logger.hpp"
#include "util/Result.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <expected>
#include <format>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

/**
 * @class JobHandle
 * @brief Owner-side view of a job running on its own thread
 *
 * The job state is shared with the worker, so a worker abandoned after the
 * cancellation grace period never touches freed memory. Destroying the
 * handle cancels the job and waits for it, up to DEFAULT_GRACE.
 */
template<typename T>
class JobHandle {
public:
    using Outcome = std::expected<T, util::Error>;
    using Work = std::function<Outcome(const std::atomic<bool>&, const ProgressCallback&)>;

    static constexpr auto DEFAULT_GRACE = std::chrono::seconds{5};

    /**
     * @brief Start work on a new thread
     * @param name Job description used in log messages
     */
    static auto launch(std::string name, Work work) -> JobHandle {
        JobHandle handle;
        handle.state_ = std::make_shared<State>();
        handle.state_->name = std::move(name);

        handle.worker_ = std::thread([state = handle.state_, work = std::move(work)]() {
            const ProgressCallback progress = [state](const OperationProgress& update) {
                state->publish(update);
            };
            try {
                state->finish(work(state->cancel_requested, progress));
            } catch (const std::exception& e) {
                LOG_ERROR("JobHandle", std::format("{} threw: {}", state->name, e.what()));
                state->finish(std::unexpected(util::Error{
                    std::format("{} failed: {}", state->name, e.what()), 0,
                    util::ErrorKind::Generic}));
            }
        });
        return handle;
    }

    JobHandle() = default;

    ~JobHandle() {
        if (!state_) {
            return;
        }
        if (!is_finished()) {
            (void)cancel_and_wait(DEFAULT_GRACE);
        }
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    JobHandle(const JobHandle&) = delete;
    JobHandle& operator=(const JobHandle&) = delete;
    JobHandle(JobHandle&&) noexcept = default;
    JobHandle& operator=(JobHandle&& other) noexcept {
        if (this != &other) {
            JobHandle discarded{std::move(*this)};
            state_ = std::move(other.state_);
            worker_ = std::move(other.worker_);
        }
        return *this;
    }

    /**
     * @brief Subscribe to progress; the latest event is replayed immediately
     */
    void on_progress(ProgressCallback callback) {
        std::lock_guard delivery{state_->delivery_mutex};
        std::optional<OperationProgress> latest;
        {
            std::lock_guard lock{state_->mutex};
            latest = state_->last_progress;
            state_->callbacks.push_back(callback);
        }
        if (latest) {
            callback(*latest);
        }
    }

    /**
     * @brief Request cooperative cancellation
     */
    void cancel() {
        if (state_ && !state_->cancel_requested.exchange(true)) {
            LOG_INFO("JobHandle", std::format("Cancellation requested for {}", state_->name));
        }
    }

    [[nodiscard]] auto is_finished() const -> bool {
        std::lock_guard lock{state_->mutex};
        return state_->result.has_value();
    }

    /**
     * @return true if the job finished within the timeout
     */
    auto wait_for(std::chrono::milliseconds timeout) const -> bool {
        std::unique_lock lock{state_->mutex};
        return state_->finished.wait_for(lock, timeout,
                                         [this] { return state_->result.has_value(); });
    }

    /**
     * @brief Block until the terminal result is available
     */
    [[nodiscard]] auto result() const -> Outcome {
        std::unique_lock lock{state_->mutex};
        state_->finished.wait(lock, [this] { return state_->result.has_value(); });
        return *state_->result;
    }

    [[nodiscard]] auto result_for(std::chrono::milliseconds timeout) const
        -> std::optional<Outcome> {
        std::unique_lock lock{state_->mutex};
        if (!state_->finished.wait_for(lock, timeout,
                                       [this] { return state_->result.has_value(); })) {
            return std::nullopt;
        }
        return *state_->result;
    }

    /**
     * @brief Cancel, then wait at most grace for the worker to stop
     *
     * A worker still running after the grace period is abandoned and the
     * terminal result becomes AbnormalTermination.
     */
    auto cancel_and_wait(std::chrono::milliseconds grace = DEFAULT_GRACE) -> Outcome {
        cancel();
        if (auto outcome = result_for(grace)) {
            return *outcome;
        }

        LOG_ERROR("JobHandle", std::format("{} did not stop within {} ms, abandoning worker",
                                           state_->name, grace.count()));
        state_->finish(std::unexpected(util::Error{
            std::format("{} abandoned after {} ms without stopping", state_->name, grace.count()),
            0, util::ErrorKind::AbnormalTermination}));
        if (worker_.joinable()) {
            worker_.detach();
        }
        return result();
    }

private:
    struct State {
        std::string name;
        std::atomic<bool> cancel_requested{false};

        std::mutex mutex;
        std::mutex delivery_mutex;  ///< Keeps replay and live events in order
        std::condition_variable finished;
        std::vector<ProgressCallback> callbacks;
        std::optional<OperationProgress> last_progress;
        std::optional<Outcome> result;

        void publish(const OperationProgress& update) {
            std::lock_guard delivery{delivery_mutex};
            std::vector<ProgressCallback> targets;
            {
                std::lock_guard lock{mutex};
                if (result) {
                    return;
                }
                last_progress = update;
                targets = callbacks;
            }
            for (const auto& callback : targets) {
                callback(update);
            }
        }

        /// First result wins; a late result from an abandoned worker is dropped
        void finish(Outcome outcome) {
            {
                std::lock_guard lock{mutex};
                if (result) {
                    return;
                }
                result = std::move(outcome);
            }
            finished.notify_all();
        }
    };

    std::shared_ptr<State> state_;
    std::thread worker_;
};
