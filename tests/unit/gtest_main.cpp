#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"
#include "TestEnv.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        wtc::log::Registry::initConsole(spdlog::level::warn);
        wtc::config::ConfigRegistry::init(wtc::test::makeConfig(wtc::test::scratchDir("registry")));
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize wtc test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
