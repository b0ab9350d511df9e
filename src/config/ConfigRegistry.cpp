#include "config/ConfigRegistry.hpp"

#include <stdexcept>

namespace wtc::config {

void ConfigRegistry::init(const std::filesystem::path& path) {
    std::call_once(init_flag_, [&]() {
        config_ = loadConfig(path);
        initialized_ = true;
    });
}

void ConfigRegistry::init(Config cfg) {
    std::call_once(init_flag_, [&]() {
        cfg.resolvePaths();
        config_ = std::move(cfg);
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

} // namespace wtc::config
