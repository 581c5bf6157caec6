/**
 * @file TestFixtures.hpp
 * @brief Common test fixtures for forensic-copy tests
 */

#pragma once

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include "models/OperationTypes.hpp"

/**
 * @brief Fixture owning a fresh temporary directory per test
 */
class TempDirFixture : public ::testing::Test {
protected:
    std::filesystem::path temp_dir;

    void SetUp() override {
        std::string pattern =
            (std::filesystem::temp_directory_path() / "forensic-copy-test-XXXXXX").string();
        ASSERT_NE(mkdtemp(pattern.data()), nullptr);
        temp_dir = pattern;
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::permissions(temp_dir, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(temp_dir, ec);
    }

    // Write text content, creating parent directories
    std::filesystem::path WriteFile(const std::filesystem::path& relative,
                                    const std::string& content) {
        auto path = temp_dir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path;
    }

    // Write pseudo-random bytes (deterministic per seed)
    std::filesystem::path WriteRandomFile(const std::filesystem::path& relative, size_t size,
                                          uint32_t seed = 42) {
        auto path = temp_dir / relative;
        std::filesystem::create_directories(path.parent_path());
        std::mt19937 rng(seed);
        std::vector<char> data(size);
        std::generate(data.begin(), data.end(), [&rng]() { return static_cast<char>(rng()); });
        std::ofstream out(path, std::ios::binary);
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        return path;
    }

    // Sparse file of the given size, cheap to create even when large
    std::filesystem::path CreateSparseFile(const std::filesystem::path& relative, uint64_t size) {
        auto path = temp_dir / relative;
        std::filesystem::create_directories(path.parent_path());
        { std::ofstream out(path, std::ios::binary); }
        std::filesystem::resize_file(path, size);
        return path;
    }

    static std::string ReadFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }
};

/**
 * @brief Thread-safe recorder of progress events
 */
class ProgressCapture {
public:
    ProgressCallback Callback() {
        return [this](const OperationProgress& progress) {
            std::lock_guard lock(mutex_);
            events_.push_back(progress);
        };
    }

    std::vector<OperationProgress> Events() const {
        std::lock_guard lock(mutex_);
        return events_;
    }

    std::vector<int> Percents() const {
        std::lock_guard lock(mutex_);
        std::vector<int> percents;
        for (const auto& event : events_) {
            percents.push_back(event.percent);
        }
        return percents;
    }

    bool IsNonDecreasing() const {
        auto percents = Percents();
        return std::is_sorted(percents.begin(), percents.end());
    }

    int LastPercent() const {
        std::lock_guard lock(mutex_);
        return events_.empty() ? -1 : events_.back().percent;
    }

private:
    mutable std::mutex mutex_;
    std::vector<OperationProgress> events_;
};

/**
 * @brief Helper for testing threaded operations with timeouts
 */
class ThreadingTestHelper {
public:
    template<typename Callable>
    static bool WaitFor(Callable&& callable,
                        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) {
        auto future = std::async(std::launch::async, std::forward<Callable>(callable));
        return future.wait_for(timeout) == std::future_status::ready;
    }

    template<typename Predicate>
    static bool WaitUntil(Predicate&& predicate,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds{5000},
                          std::chrono::milliseconds poll_interval = std::chrono::milliseconds{10}) {
        auto start = std::chrono::steady_clock::now();
        while (std::chrono::steady_clock::now() - start < timeout) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(poll_interval);
        }
        return false;
    }
};
