/**
 * @file StorageDetector.cpp
 * @brief Tiered storage classification from the mount table, sysfs and a timed probe
 */

#include "services/StorageDetector.hpp"

#include "util/FileDescriptor.hpp"
#include "util/IoHelpers.hpp"
#include "util/Logger.hpp"
#include "util/RandomBuffer.hpp"

// Standard library
#include <algorithm>
#include <array>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <format>
#include <fstream>
#include <memory>
#include <mutex>
#include <ranges>
#include <vector>

// System headers
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <unistd.h>

#include <mntent.h>

namespace fs = std::filesystem;
namespace rng = std::ranges;

namespace {
constexpr auto COMPONENT = "StorageDetector";

constexpr auto PROBE_CHUNK_SIZE = size_t{1024 * 1024};

constexpr double INVENTORY_CONFIDENCE = 0.9;
constexpr double SEEK_PENALTY_HDD_CONFIDENCE = 0.9;
constexpr double SEEK_PENALTY_SSD_CONFIDENCE = 0.8;
constexpr double NETWORK_CONFIDENCE = 0.9;

constexpr double PROBE_HDD_WRITE_MBPS = 50.0;
constexpr double PROBE_NVME_WRITE_MBPS = 100.0;
constexpr double PROBE_NVME_READ_MBPS = 200.0;

constexpr std::array NETWORK_FILESYSTEMS{
    std::string_view{"nfs"},   std::string_view{"nfs4"},       std::string_view{"cifs"},
    std::string_view{"smb3"},  std::string_view{"smbfs"},      std::string_view{"sshfs"},
    std::string_view{"fuse.sshfs"}, std::string_view{"9p"},    std::string_view{"afs"},
    std::string_view{"ceph"},  std::string_view{"glusterfs"},  std::string_view{"davfs"},
    std::string_view{"fuse.davfs"}};

auto read_sysfs_value(const fs::path& file) -> std::optional<std::string> {
    std::ifstream in{file};
    if (!in) {
        return std::nullopt;
    }
    std::string value;
    std::getline(in, value);
    while (!value.empty() && (value.back() == ' ' || value.back() == '\n')) {
        value.pop_back();
    }
    return value;
}

/**
 * @brief Nearest ancestor (or the path itself) that exists
 */
auto nearest_existing(const fs::path& path) -> std::optional<fs::path> {
    std::error_code ec;
    auto current = fs::absolute(path, ec);
    if (ec) {
        return std::nullopt;
    }
    while (true) {
        if (fs::exists(current, ec)) {
            return current;
        }
        if (!current.has_relative_path()) {
            return std::nullopt;
        }
        current = current.parent_path();
    }
}

auto is_path_prefix(const fs::path& prefix, const fs::path& path) -> bool {
    const auto [prefix_it, path_it] =
        std::mismatch(prefix.begin(), prefix.end(), path.begin(), path.end());
    return prefix_it == prefix.end();
}

/**
 * @brief Bus from the canonical sysfs path and the kernel device name
 *
 * USB is checked first: a USB enclosure around an NVMe or SATA drive shows up
 * as sdX below a usb node.
 */
auto bus_from_sysfs(std::string_view sys_path, std::string_view name) -> BusType {
    if (sys_path.contains("/usb")) {
        return BusType::USB;
    }
    if (name.starts_with("nvme") || sys_path.contains("/nvme/")) {
        return BusType::NVME;
    }
    if (name.starts_with("mmcblk") || sys_path.contains("/mmc_host/")) {
        return BusType::MMC;
    }
    if (name.starts_with("dm-") || name.starts_with("md")) {
        return BusType::RAID;
    }
    if (name.starts_with("vd") || name.starts_with("xvd") || name.starts_with("loop") ||
        sys_path.contains("/virtio")) {
        return BusType::VIRTUAL;
    }
    if (sys_path.contains("/ata")) {
        return BusType::SATA;
    }
    if (sys_path.contains("/sas_") || sys_path.contains("/end_device-")) {
        return BusType::SAS;
    }
    if (name.starts_with("sd")) {
        return BusType::SCSI;
    }
    return BusType::UNKNOWN;
}

/**
 * @brief Canonical sysfs directory of the whole disk for a block device entry
 */
auto whole_disk_dir(const fs::path& entry) -> std::optional<fs::path> {
    std::error_code ec;
    auto dir = fs::canonical(entry, ec);
    if (ec) {
        return std::nullopt;
    }
    if (fs::exists(dir / "partition", ec)) {
        dir = dir.parent_path();
    }
    return dir;
}

auto make_info(DriveType drive, BusType bus, double confidence, std::string method,
               bool removable) -> StorageInfo {
    StorageInfo info;
    info.drive_type = drive;
    info.bus_type = bus;
    info.confidence = confidence;
    info.detection_method = std::move(method);
    info.performance_class = performance_class_for(drive);
    info.is_removable = removable;
    return info;
}

auto elapsed_seconds(std::chrono::steady_clock::time_point since) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - since).count();
}

auto to_mbps(uint64_t bytes, double seconds) -> double {
    constexpr double BYTES_PER_MB = 1024.0 * 1024.0;
    return static_cast<double>(bytes) / BYTES_PER_MB / std::max(seconds, 1e-6);
}

}  // namespace

// ============================================================================
// StorageDetector implementation
// ============================================================================

StorageDetector::StorageDetector(DetectorOptions options) : options_(std::move(options)) {}

auto StorageDetector::analyze(const fs::path& path) -> StorageInfo {
    const auto existing = nearest_existing(path);
    if (!existing) {
        LOG_WARNING(COMPONENT, std::format("No existing ancestor for {}", path.string()));
        return conservative_fallback("path_not_found");
    }

    struct stat st{};
    if (::stat(existing->c_str(), &st) != 0) {
        LOG_WARNING(COMPONENT, std::format("stat({}) failed: {}", existing->string(),
                                           std::strerror(errno)));
        return conservative_fallback("stat_failed");
    }

    const auto device_id = std::format("{}:{}", major(st.st_dev), minor(st.st_dev));

    {
        std::shared_lock lock{cache_mutex_};
        if (auto it = cache_.find(device_id); it != cache_.end()) {
            return it->second;
        }
    }

    auto info = detect_uncached(*existing, st.st_dev, device_id);
    info.device_id = device_id;

    LOG_INFO(COMPONENT, std::format("{} -> {} via {} (bus={}, confidence={:.2f}, device={})",
                                    path.string(), drive_type_name(info.drive_type),
                                    info.detection_method, bus_type_name(info.bus_type),
                                    info.confidence, device_id));

    std::unique_lock lock{cache_mutex_};
    cache_.insert_or_assign(device_id, info);
    return info;
}

void StorageDetector::clear_cache() {
    std::unique_lock lock{cache_mutex_};
    cache_.clear();
}

auto StorageDetector::cache_size() const -> size_t {
    std::shared_lock lock{cache_mutex_};
    return cache_.size();
}

auto StorageDetector::detect_uncached(const fs::path& existing, dev_t device,
                                      const std::string& device_id) -> StorageInfo {
    if (const auto mount = find_mount(existing);
        mount && is_network_filesystem(mount->filesystem)) {
        auto info = make_info(DriveType::NETWORK, BusType::NETWORK, NETWORK_CONFIDENCE,
                              "mount_table", false);
        info.device_name = mount->device;
        return info;
    }

    const auto props = read_device_properties(device);
    if (props) {
        if (auto info = detect_from_inventory(*props)) {
            info->device_name = props->name;
            return *info;
        }
        LOG_DEBUG(COMPONENT, std::format("Inventory inconclusive for {} (bus={})", props->name,
                                         bus_type_name(props->bus)));

        if (auto info = detect_from_seek_penalty(*props)) {
            info->device_name = props->name;
            return *info;
        }
        LOG_DEBUG(COMPONENT, std::format("No seek penalty information for {}", props->name));
    } else {
        LOG_DEBUG(COMPONENT, std::format("No sysfs entry for device {}", device_id));
    }

    if (!options_.enable_io_probe) {
        return conservative_fallback("probe_disabled", device_id);
    }

    std::error_code ec;
    const auto directory = fs::is_directory(existing, ec) ? existing : existing.parent_path();
    const auto measurement = run_io_probe(directory);
    if (!measurement) {
        return conservative_fallback("all_methods_failed", device_id);
    }

    auto info = classify_probe(*measurement, props ? props->removable : false);
    if (props) {
        info.device_name = props->name;
        if (props->bus != BusType::UNKNOWN) {
            info.bus_type = props->bus;
        }
    }
    return info;
}

auto StorageDetector::conservative_fallback(std::string_view reason, std::string device_id)
    -> StorageInfo {
    auto info = make_info(DriveType::EXTERNAL_HDD, BusType::UNKNOWN, 0.0,
                          std::format("conservative_fallback_{}", reason), true);
    info.device_id = std::move(device_id);
    LOG_WARNING(COMPONENT, std::format("Assuming slowest storage class ({})", reason));
    return info;
}

auto StorageDetector::is_network_filesystem(std::string_view fs_type) -> bool {
    return rng::find(NETWORK_FILESYSTEMS, fs_type) != NETWORK_FILESYSTEMS.end();
}

// ============================================================================
// Mount table
// ============================================================================

auto StorageDetector::parse_mount_table() const -> std::vector<MountEntry> {
    std::vector<MountEntry> entries;

    auto mtab_deleter = [](FILE* f) {
        if (f)
            ::endmntent(f);
    };

    std::unique_ptr<FILE, decltype(mtab_deleter)> mtab{
        ::setmntent(options_.mount_table.c_str(), "r"), mtab_deleter};
    if (!mtab) {
        return entries;
    }

    while (auto* entry = ::getmntent(mtab.get())) {
        entries.push_back(MountEntry{
            .device = entry->mnt_fsname,
            .mount_point = entry->mnt_dir,
            .filesystem = entry->mnt_type,
        });
    }
    return entries;
}

auto StorageDetector::find_mount(const fs::path& path) const -> std::optional<MountEntry> {
    std::error_code ec;
    const auto canonical = fs::canonical(path, ec);
    const auto& target = ec ? path : canonical;

    std::optional<MountEntry> best;
    size_t best_depth = 0;
    for (auto& entry : parse_mount_table()) {
        const fs::path mount_point{entry.mount_point};
        if (!is_path_prefix(mount_point, target)) {
            continue;
        }
        const auto depth = static_cast<size_t>(std::distance(mount_point.begin(), mount_point.end()));
        // Later entries shadow earlier ones at the same mount point
        if (!best || depth >= best_depth) {
            best = std::move(entry);
            best_depth = depth;
        }
    }
    return best;
}

// ============================================================================
// Tier 0 / Tier 1: sysfs
// ============================================================================

auto StorageDetector::read_device_properties(dev_t device) const
    -> std::optional<DeviceProperties> {
    const auto entry = options_.sysfs_root / "dev" / "block" /
                       std::format("{}:{}", major(device), minor(device));
    const auto disk_dir = whole_disk_dir(entry);
    if (!disk_dir) {
        return std::nullopt;
    }

    DeviceProperties props;
    props.name = disk_dir->filename().string();
    props.sys_path = disk_dir->string();
    props.bus = bus_from_sysfs(props.sys_path, props.name);

    if (auto value = read_sysfs_value(*disk_dir / "queue" / "rotational")) {
        if (*value == "0" || *value == "1") {
            props.rotational = (*value == "1");
        }
    }
    if (auto value = read_sysfs_value(*disk_dir / "removable")) {
        props.removable = (*value == "1");
    }

    std::error_code ec;
    for (const auto& slave : fs::directory_iterator{*disk_dir / "slaves", ec}) {
        if (auto slave_disk = whole_disk_dir(slave.path())) {
            props.slaves.push_back(*slave_disk);
        }
    }

    return props;
}

auto StorageDetector::detect_from_inventory(const DeviceProperties& props)
    -> std::optional<StorageInfo> {
    constexpr auto METHOD = "sysfs_inventory";

    switch (props.bus) {
        case BusType::NVME:
            return props.removable
                       ? make_info(DriveType::EXTERNAL_SSD, BusType::NVME, INVENTORY_CONFIDENCE,
                                   METHOD, true)
                       : make_info(DriveType::NVME, BusType::NVME, INVENTORY_CONFIDENCE, METHOD,
                                   false);
        case BusType::USB:
            if (!props.rotational) {
                return std::nullopt;
            }
            return make_info(*props.rotational ? DriveType::EXTERNAL_HDD : DriveType::EXTERNAL_SSD,
                             BusType::USB, INVENTORY_CONFIDENCE, METHOD, true);
        case BusType::SATA:
        case BusType::SAS:
            if (!props.rotational) {
                return std::nullopt;
            }
            if (*props.rotational) {
                return make_info(props.removable ? DriveType::EXTERNAL_HDD : DriveType::HDD,
                                 props.bus, INVENTORY_CONFIDENCE, METHOD, props.removable);
            }
            return make_info(props.removable ? DriveType::EXTERNAL_SSD : DriveType::SSD, props.bus,
                             INVENTORY_CONFIDENCE, METHOD, props.removable);
        case BusType::MMC:
            return make_info(props.removable ? DriveType::EXTERNAL_SSD : DriveType::SSD,
                             BusType::MMC, INVENTORY_CONFIDENCE, METHOD, props.removable);
        case BusType::SCSI:
        case BusType::VIRTUAL:
        case BusType::RAID:
        case BusType::NETWORK:
        case BusType::UNKNOWN:
            return std::nullopt;
    }
    return std::nullopt;
}

auto StorageDetector::detect_from_seek_penalty(const DeviceProperties& props)
    -> std::optional<StorageInfo> {
    constexpr auto METHOD = "seek_penalty";

    // Stacked devices (dm, md) spin if any member spins
    std::optional<bool> rotational;
    if (!props.slaves.empty()) {
        for (const auto& slave : props.slaves) {
            auto value = read_sysfs_value(slave / "queue" / "rotational");
            if (!value || (*value != "0" && *value != "1")) {
                rotational.reset();
                break;
            }
            rotational = rotational.value_or(false) || *value == "1";
        }
    }
    if (!rotational) {
        rotational = props.rotational;
    }
    if (!rotational) {
        return std::nullopt;
    }

    if (*rotational) {
        return make_info(props.removable ? DriveType::EXTERNAL_HDD : DriveType::HDD, props.bus,
                         SEEK_PENALTY_HDD_CONFIDENCE, METHOD, props.removable);
    }
    return make_info(props.removable ? DriveType::EXTERNAL_SSD : DriveType::SSD, props.bus,
                     SEEK_PENALTY_SSD_CONFIDENCE, METHOD, props.removable);
}

// ============================================================================
// Tier 2: timed I/O probe
// ============================================================================

auto StorageDetector::classify_probe(const ProbeMeasurement& measurement, bool removable)
    -> StorageInfo {
    constexpr auto METHOD = "io_probe";

    StorageInfo info;
    if (measurement.write_mbps < PROBE_HDD_WRITE_MBPS) {
        info = make_info(removable ? DriveType::EXTERNAL_HDD : DriveType::HDD, BusType::UNKNOWN,
                         0.8, METHOD, removable);
    } else if (measurement.write_mbps > PROBE_NVME_WRITE_MBPS &&
               measurement.read_mbps > PROBE_NVME_READ_MBPS) {
        info = make_info(removable ? DriveType::EXTERNAL_SSD : DriveType::NVME, BusType::UNKNOWN,
                         0.8, METHOD, removable);
    } else {
        info = make_info(removable ? DriveType::EXTERNAL_SSD : DriveType::SSD, BusType::UNKNOWN,
                         0.7, METHOD, removable);
    }
    info.probe_write_mbps = measurement.write_mbps;
    info.probe_read_mbps = measurement.read_mbps;
    return info;
}

auto StorageDetector::run_io_probe(const fs::path& directory) const
    -> std::optional<ProbeMeasurement> {
    if (::access(directory.c_str(), W_OK) != 0) {
        LOG_DEBUG(COMPONENT, std::format("Probe skipped, {} not writable", directory.string()));
        return std::nullopt;
    }

    auto name_template = (directory / ".storage_probe_XXXXXX").string();
    util::FileDescriptor fd{::mkstemp(name_template.data())};
    if (!fd) {
        LOG_DEBUG(COMPONENT, std::format("Probe file creation failed in {}: {}",
                                         directory.string(), std::strerror(errno)));
        return std::nullopt;
    }
    // Unlinked immediately; the data lives until fd closes
    ::unlink(name_template.c_str());

    std::vector<uint8_t> chunk(PROBE_CHUNK_SIZE);
    util::fill_random(chunk);

    const auto half_budget = options_.probe_budget / 2;

    // Write phase: stop early at half the budget, throughput from what got through
    const auto write_start = std::chrono::steady_clock::now();
    uint64_t written = 0;
    while (written < options_.probe_size_bytes) {
        if (!util::write_all(fd.get(), chunk.data(), chunk.size())) {
            LOG_DEBUG(COMPONENT, std::format("Probe write failed: {}", std::strerror(errno)));
            return std::nullopt;
        }
        written += chunk.size();
        if (std::chrono::steady_clock::now() - write_start > half_budget) {
            break;
        }
    }
    if (::fsync(fd.get()) != 0) {
        LOG_DEBUG(COMPONENT, std::format("Probe fsync failed: {}", std::strerror(errno)));
        return std::nullopt;
    }
    const double write_seconds = elapsed_seconds(write_start);

    util::drop_page_cache(fd.get());
    if (::lseek(fd.get(), 0, SEEK_SET) != 0) {
        return std::nullopt;
    }

    const auto read_start = std::chrono::steady_clock::now();
    uint64_t read_total = 0;
    while (read_total < written) {
        const auto got = util::read_full(fd.get(), chunk.data(), chunk.size());
        if (got < 0) {
            LOG_DEBUG(COMPONENT, std::format("Probe read failed: {}", std::strerror(errno)));
            return std::nullopt;
        }
        if (got == 0) {
            break;
        }
        read_total += static_cast<uint64_t>(got);
        if (std::chrono::steady_clock::now() - read_start > half_budget) {
            break;
        }
    }
    const double read_seconds = elapsed_seconds(read_start);

    ProbeMeasurement measurement{
        .write_mbps = to_mbps(written, write_seconds),
        .read_mbps = to_mbps(read_total, read_seconds),
    };
    LOG_DEBUG(COMPONENT, std::format("Probe in {}: write {:.1f} MB/s, read {:.1f} MB/s",
                                     directory.string(), measurement.write_mbps,
                                     measurement.read_mbps));
    return measurement;
}
