#include "coord/Reaper.hpp"
#include "coord/LockRegistry.hpp"
#include "log/Registry.hpp"

wtc::coord::Reaper::Reaper(std::shared_ptr<LockRegistry> registry, const std::chrono::seconds interval)
    : AsyncService("Reaper"), registry_(std::move(registry)), interval_(interval) {}

wtc::coord::Reaper::~Reaper() { stop(); }

void wtc::coord::Reaper::runLoop() {
    while (!shouldStop()) {
        try {
            if (const auto n = registry_->reclaimStale(); n > 0)
                log::Registry::registry()->info("[Reaper] Reclaimed {} stale lock(s)", n);
        } catch (const std::exception& e) {
            log::Registry::registry()->warn("[Reaper] Stale lock sweep failed: {}", e.what());
        }

        lazySleep(interval_);
    }
}
