/**
 * @file IStorageDetector.hpp
 * @brief Interface for classifying the storage behind a filesystem path
 */

#pragma once

#include "models/StorageInfo.hpp"

#include <filesystem>

/**
 * @class IStorageDetector
 * @brief Abstract storage classification
 *
 * Implementations never fail: when nothing can be determined they return the
 * conservative slowest class with confidence 0. A single long-lived instance
 * is injected into the engines so its cache is shared across jobs of one
 * session.
 */
class IStorageDetector {
public:
    virtual ~IStorageDetector() = default;

    /**
     * @brief Classify the device backing a path
     * @param path File or directory; need not exist yet
     * @return Always-populated StorageInfo
     */
    [[nodiscard]] virtual auto analyze(const std::filesystem::path& path) -> StorageInfo = 0;

    /**
     * @brief Forget cached classifications
     */
    virtual void clear_cache() = 0;
};
