#include "config/ConfigRegistry.hpp"

#include <cstdlib>
#include <stdexcept>

namespace cw::config {

std::filesystem::path defaultConfigPath() {
    if (const char* env = std::getenv("CREDWALLET_CONFIG"); env && *env) return env;
    return "/etc/credwallet/config.yaml";
}

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path.string());
        initialized_ = true;
    });
}

void ConfigRegistry::init(const Config& config) {
    std::call_once(init_flag_, [&]() {
        config_ = config;
        initialized_ = true;
    });
}

const Config& ConfigRegistry::get() {
    ensureInitialized();
    return config_;
}

void ConfigRegistry::ensureInitialized() {
    if (!initialized_)
        throw std::runtime_error("ConfigRegistry accessed before initialization. Call ConfigRegistry::init() first.");
}

} // namespace cw::config
