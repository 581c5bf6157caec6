/**
 * @file KeyFileSettingsProvider.cpp
 * @brief GKeyFile parsing
 */

#include "services/KeyFileSettingsProvider.hpp"

#include "services/Digest.hpp"
#include "util/Logger.hpp"

#include <glib.h>

#include <format>
#include <memory>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace {
constexpr auto COMPONENT = "Settings";

struct KeyFileDeleter {
    void operator()(GKeyFile* key_file) const { g_key_file_free(key_file); }
};
using KeyFilePtr = std::unique_ptr<GKeyFile, KeyFileDeleter>;

auto read_string(GKeyFile* key_file, const char* key) -> std::optional<std::string> {
    GError* error = nullptr;
    gchar* value = g_key_file_get_string(key_file, KeyFileSettingsProvider::GROUP, key, &error);
    if (!value) {
        g_clear_error(&error);
        return std::nullopt;
    }
    std::string result{value};
    g_free(value);
    return result;
}

auto read_integer(GKeyFile* key_file, const char* key) -> std::optional<gint64> {
    if (!g_key_file_has_key(key_file, KeyFileSettingsProvider::GROUP, key, nullptr)) {
        return std::nullopt;
    }
    GError* error = nullptr;
    const gint64 value = g_key_file_get_int64(key_file, KeyFileSettingsProvider::GROUP, key, &error);
    if (error) {
        LOG_WARNING(COMPONENT, std::format("Ignoring {}: {}", key, error->message));
        g_clear_error(&error);
        return std::nullopt;
    }
    return value;
}

auto read_boolean(GKeyFile* key_file, const char* key) -> std::optional<bool> {
    if (!g_key_file_has_key(key_file, KeyFileSettingsProvider::GROUP, key, nullptr)) {
        return std::nullopt;
    }
    GError* error = nullptr;
    const gboolean value =
        g_key_file_get_boolean(key_file, KeyFileSettingsProvider::GROUP, key, &error);
    if (error) {
        LOG_WARNING(COMPONENT, std::format("Ignoring {}: {}", key, error->message));
        g_clear_error(&error);
        return std::nullopt;
    }
    return value != FALSE;
}

auto parse_settings(GKeyFile* key_file) -> EngineSettings {
    EngineSettings settings;

    if (auto text = read_string(key_file, "algorithm")) {
        if (auto algorithm = digest::parse_algorithm(*text)) {
            settings.default_algorithm = *algorithm;
        } else {
            LOG_WARNING(COMPONENT, std::format("Ignoring unknown algorithm '{}'", *text));
        }
    }

    if (auto threads = read_integer(key_file, "threads")) {
        if (*threads >= 0 && *threads <= 1024) {
            settings.thread_override = static_cast<int>(*threads);
        } else {
            LOG_WARNING(COMPONENT, std::format("Ignoring thread count {}", *threads));
        }
    }

    if (auto buffer = read_integer(key_file, "buffer_size")) {
        if (*buffer >= 0) {
            settings.buffer_size_override = static_cast<size_t>(*buffer);
        } else {
            LOG_WARNING(COMPONENT, std::format("Ignoring buffer size {}", *buffer));
        }
    }

    if (auto preserve = read_boolean(key_file, "preserve_structure")) {
        settings.preserve_structure = *preserve;
    }
    if (auto verify = read_boolean(key_file, "verify")) {
        settings.verify_copies = *verify;
    }

    if (auto level = read_string(key_file, "log_level")) {
        if (util::parse_log_level(*level)) {
            settings.log_level = *level;
        } else {
            LOG_WARNING(COMPONENT, std::format("Ignoring log level '{}'", *level));
        }
    }
    return settings;
}

}  // namespace

KeyFileSettingsProvider::KeyFileSettingsProvider(fs::path path) : path_(std::move(path)) {
    (void)reload();
}

auto KeyFileSettingsProvider::default_path() -> fs::path {
    return fs::path(g_get_user_config_dir()) / "forensic-copy" / "settings.ini";
}

auto KeyFileSettingsProvider::get_settings() const -> EngineSettings {
    std::lock_guard lock{mutex_};
    return settings_;
}

auto KeyFileSettingsProvider::reload() -> bool {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        LOG_DEBUG(COMPONENT, std::format("No settings file at {}, using defaults", path_.string()));
        std::lock_guard lock{mutex_};
        settings_ = EngineSettings{};
        return true;
    }

    KeyFilePtr key_file{g_key_file_new()};
    GError* error = nullptr;
    if (!g_key_file_load_from_file(key_file.get(), path_.c_str(), G_KEY_FILE_NONE, &error)) {
        LOG_WARNING(COMPONENT, std::format("Cannot parse {}: {}", path_.string(),
                                           error ? error->message : "unknown error"));
        g_clear_error(&error);
        std::lock_guard lock{mutex_};
        settings_ = EngineSettings{};
        return false;
    }

    auto parsed = parse_settings(key_file.get());
    LOG_INFO(COMPONENT, std::format("Loaded settings from {}", path_.string()));
    std::lock_guard lock{mutex_};
    settings_ = std::move(parsed);
    return true;
}
