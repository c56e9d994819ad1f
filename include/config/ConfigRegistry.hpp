#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <mutex>

namespace cw::config {

// $CREDWALLET_CONFIG if set, otherwise /etc/credwallet/config.yaml
std::filesystem::path defaultConfigPath();

class ConfigRegistry {
public:
    static void init(const std::filesystem::path& path = defaultConfigPath());
    static void init(const Config& config);
    static const Config& get();

private:
    static void ensureInitialized();

    static inline Config config_;
    static inline bool initialized_ = false;
    static inline std::once_flag init_flag_;
};

} // namespace cw::config
