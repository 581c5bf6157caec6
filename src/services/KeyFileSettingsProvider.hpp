/**
 * @file KeyFileSettingsProvider.hpp
 * @brief Settings read from a GLib key file
 */

#pragma once

#include "interfaces/ISettingsProvider.hpp"

#include <filesystem>
#include <mutex>

/**
 * @class KeyFileSettingsProvider
 * @brief Reads the [engine] group of an INI-style key file
 *
 * @code
 * [engine]
 * algorithm=sha256
 * threads=0
 * buffer_size=0
 * preserve_structure=true
 * verify=true
 * log_level=info
 * @endcode
 *
 * A missing file yields defaults. Invalid values are logged and replaced by
 * their defaults. The file is never written.
 */
class KeyFileSettingsProvider final : public ISettingsProvider {
public:
    static constexpr auto GROUP = "engine";

    explicit KeyFileSettingsProvider(std::filesystem::path path = default_path());

    [[nodiscard]] auto get_settings() const -> EngineSettings override;

    /**
     * @brief Re-read the file
     * @return false if the file exists but could not be parsed
     */
    auto reload() -> bool;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

    /// $XDG_CONFIG_HOME/forensic-copy/settings.ini
    [[nodiscard]] static auto default_path() -> std::filesystem::path;

private:
    std::filesystem::path path_;
    mutable std::mutex mutex_;
    EngineSettings settings_;
};
