/**
 * @file MockSettingsProvider.hpp
 * @brief Google Mock implementation of ISettingsProvider
 */

#pragma once

#include "interfaces/ISettingsProvider.hpp"

#include <gmock/gmock.h>

#include <memory>

class MockSettingsProvider : public ISettingsProvider {
public:
    MOCK_METHOD(EngineSettings, get_settings, (), (const, override));

    static std::shared_ptr<MockSettingsProvider> CreateNiceMock(EngineSettings settings = {}) {
        auto mock = std::make_shared<testing::NiceMock<MockSettingsProvider>>();
        ON_CALL(*mock, get_settings()).WillByDefault(testing::Return(settings));
        return mock;
    }
};
