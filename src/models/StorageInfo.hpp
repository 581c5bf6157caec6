/**
 * @file StorageInfo.hpp
 * @brief Classification of the storage device backing a path
 */

#pragma once

#include <string>
#include <string_view>

/**
 * @enum DriveType
 * @brief Storage class used for thread and strategy decisions
 */
enum class DriveType {
    UNKNOWN,
    HDD,
    SSD,
    NVME,
    EXTERNAL_HDD,
    EXTERNAL_SSD,
    NETWORK
};

/**
 * @enum BusType
 * @brief Transport between the host and the device
 */
enum class BusType {
    UNKNOWN,
    SATA,
    SCSI,
    SAS,
    NVME,
    USB,
    MMC,
    VIRTUAL,
    RAID,
    NETWORK
};

[[nodiscard]] inline auto drive_type_name(DriveType type) -> std::string_view {
    switch (type) {
        case DriveType::UNKNOWN:
            return "Unknown";
        case DriveType::HDD:
            return "HDD";
        case DriveType::SSD:
            return "SSD";
        case DriveType::NVME:
            return "NVMe";
        case DriveType::EXTERNAL_HDD:
            return "External HDD";
        case DriveType::EXTERNAL_SSD:
            return "External SSD";
        case DriveType::NETWORK:
            return "Network";
    }
    return "Unknown";
}

[[nodiscard]] inline auto bus_type_name(BusType type) -> std::string_view {
    switch (type) {
        case BusType::UNKNOWN:
            return "Unknown";
        case BusType::SATA:
            return "SATA";
        case BusType::SCSI:
            return "SCSI";
        case BusType::SAS:
            return "SAS";
        case BusType::NVME:
            return "NVMe";
        case BusType::USB:
            return "USB";
        case BusType::MMC:
            return "MMC";
        case BusType::VIRTUAL:
            return "Virtual";
        case BusType::RAID:
            return "RAID";
        case BusType::NETWORK:
            return "Network";
    }
    return "Unknown";
}

/**
 * @brief Relative speed class, 5 fastest, 1 slowest
 */
[[nodiscard]] constexpr auto performance_class_for(DriveType type) -> int {
    switch (type) {
        case DriveType::NVME:
            return 5;
        case DriveType::SSD:
            return 4;
        case DriveType::EXTERNAL_SSD:
            return 3;
        case DriveType::HDD:
            return 2;
        case DriveType::EXTERNAL_HDD:
        case DriveType::NETWORK:
        case DriveType::UNKNOWN:
            return 1;
    }
    return 1;
}

/**
 * @struct StorageInfo
 * @brief Result of a detection call, always fully populated
 *
 * On total detection failure the detector returns EXTERNAL_HDD with
 * confidence 0, never a faster class.
 */
struct StorageInfo {
    DriveType drive_type = DriveType::EXTERNAL_HDD;
    BusType bus_type = BusType::UNKNOWN;
    double confidence = 0.0;          ///< 0.0 (guess) to 1.0
    std::string detection_method;     ///< e.g. "sysfs_inventory", "io_probe"
    std::string device_id;            ///< major:minor of the backing filesystem
    std::string device_name;          ///< Kernel block device name if known, e.g. "nvme0n1"
    int performance_class = 1;
    bool is_removable = false;
    double probe_write_mbps = 0.0;    ///< Only set by the timed probe
    double probe_read_mbps = 0.0;

    auto operator==(const StorageInfo&) const -> bool = default;

    [[nodiscard]] auto describe() const -> std::string {
        std::string text(drive_type_name(drive_type));
        if (!device_name.empty()) {
            text += " (" + device_name + ")";
        }
        return text;
    }
};
