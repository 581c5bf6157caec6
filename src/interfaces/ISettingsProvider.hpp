/**
 * @file ISettingsProvider.hpp
 * @brief Pull-only source of user preferences for the engines
 */

#pragma once

#include "models/OperationTypes.hpp"

#include <utility>

/**
 * @class ISettingsProvider
 * @brief Read-only settings source; the engine never writes settings back
 */
class ISettingsProvider {
public:
    virtual ~ISettingsProvider() = default;

    [[nodiscard]] virtual auto get_settings() const -> EngineSettings = 0;
};

/**
 * @class StaticSettingsProvider
 * @brief Fixed settings, for hosts that manage preferences themselves
 */
class StaticSettingsProvider final : public ISettingsProvider {
public:
    explicit StaticSettingsProvider(EngineSettings settings = {}) : settings_(std::move(settings)) {}

    [[nodiscard]] auto get_settings() const -> EngineSettings override { return settings_; }

private:
    EngineSettings settings_;
};
