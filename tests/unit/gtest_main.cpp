#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>
#include <unistd.h>

#include "config/ConfigRegistry.hpp"
#include "log/Registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        cw::config::Config cfg;
        cfg.logging.log_dir = fs::temp_directory_path() / ("credwallet-tests-" + std::to_string(::getpid()));
        cfg.logging.levels.console_log_level = spdlog::level::warn;
        cfg.logging.levels.subsystem_levels.db = spdlog::level::warn;

        cw::config::ConfigRegistry::init(cfg);
        cw::log::Registry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize credwallet test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
