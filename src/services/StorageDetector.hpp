/**
 * @file StorageDetector.hpp
 * @brief Tiered classification of the device behind a path
 *
 * Tiers, each tried only if the previous one is inconclusive:
 *  - network filesystem lookup in the mount table
 *  - Tier 0: sysfs inventory (bus from the device path, media from queue/rotational)
 *  - Tier 1: rotational (seek penalty) flag of the device or its dm/md slaves
 *  - Tier 2: timed write/read probe in the target directory
 *  - conservative fallback (EXTERNAL_HDD, confidence 0)
 */

#pragma once

#include "interfaces/IStorageDetector.hpp"

#include <sys/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

/**
 * @struct DetectorOptions
 * @brief Where to read system state from and how hard to probe
 */
struct DetectorOptions {
    std::filesystem::path sysfs_root{"/sys"};
    std::filesystem::path mount_table{"/proc/mounts"};
    bool enable_io_probe = true;
    uint64_t probe_size_bytes = 10 * 1024 * 1024;
    std::chrono::milliseconds probe_budget{200};
};

/**
 * @struct MountEntry
 */
struct MountEntry {
    std::string device;
    std::string mount_point;
    std::string filesystem;
};

/**
 * @struct ProbeMeasurement
 * @brief Throughput observed by the timed probe, in MB/s
 */
struct ProbeMeasurement {
    double write_mbps = 0.0;
    double read_mbps = 0.0;
};

/**
 * @class StorageDetector
 * @brief sysfs-backed IStorageDetector with a per-device cache
 *
 * The cache is keyed by the major:minor of the filesystem device and lives as
 * long as this object. It is never invalidated automatically; hot-swapping a
 * device under the same numbers requires clear_cache().
 */
class StorageDetector final : public IStorageDetector {
public:
    explicit StorageDetector(DetectorOptions options = {});

    [[nodiscard]] auto analyze(const std::filesystem::path& path) -> StorageInfo override;
    void clear_cache() override;

    [[nodiscard]] auto cache_size() const -> size_t;

    /**
     * @brief Classify probe throughput
     *
     * Write speed is the reliable signal; cached reads make HDDs look fast.
     */
    [[nodiscard]] static auto classify_probe(const ProbeMeasurement& measurement, bool removable)
        -> StorageInfo;

    [[nodiscard]] static auto is_network_filesystem(std::string_view fs_type) -> bool;

    /**
     * @brief Conservative result used when nothing else worked
     */
    [[nodiscard]] static auto conservative_fallback(std::string_view reason,
                                                    std::string device_id = {}) -> StorageInfo;

private:
    struct DeviceProperties {
        std::string name;
        std::string sys_path;           ///< Canonical sysfs path of the whole disk
        BusType bus = BusType::UNKNOWN;
        std::optional<bool> rotational;
        bool removable = false;
        std::vector<std::filesystem::path> slaves;
    };

    [[nodiscard]] auto detect_uncached(const std::filesystem::path& existing, dev_t device,
                                       const std::string& device_id) -> StorageInfo;

    [[nodiscard]] auto parse_mount_table() const -> std::vector<MountEntry>;
    [[nodiscard]] auto find_mount(const std::filesystem::path& path) const
        -> std::optional<MountEntry>;

    [[nodiscard]] auto read_device_properties(dev_t device) const
        -> std::optional<DeviceProperties>;

    [[nodiscard]] static auto detect_from_inventory(const DeviceProperties& props)
        -> std::optional<StorageInfo>;
    [[nodiscard]] static auto detect_from_seek_penalty(const DeviceProperties& props)
        -> std::optional<StorageInfo>;

    [[nodiscard]] auto run_io_probe(const std::filesystem::path& directory) const
        -> std::optional<ProbeMeasurement>;

    DetectorOptions options_;
    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::string, StorageInfo> cache_;
};
