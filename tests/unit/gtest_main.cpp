#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        ms::config::ConfigRegistry::init(std::nullopt);
        ms::logging::LogRegistry::init(spdlog::level::off);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize monosync test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
