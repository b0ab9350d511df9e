#include "services/ServiceManager.hpp"
#include "coord/LockRegistry.hpp"
#include "coord/Reaper.hpp"
#include "metrics/Recorder.hpp"
#include "predict/PatternPredictor.hpp"
#include "sched/PriorityScheduler.hpp"
#include "protocols/ctl/Server.hpp"
#include "log/Registry.hpp"

using namespace wtc::services;

ServiceManager::ServiceManager(const config::Config& cfg)
    : recorder_(std::make_shared<metrics::Recorder>(cfg.metrics)),
      registry_(std::make_shared<coord::LockRegistry>(cfg.coordinator.stale_ttl, cfg.backoff,
                                                      std::make_shared<coord::ProcessProbe>(), recorder_)),
      predictor_(std::make_shared<predict::PatternPredictor>(cfg.predictor)),
      scheduler_(std::make_shared<sched::PriorityScheduler>(cfg, registry_, predictor_, recorder_)),
      reaper_(std::make_shared<coord::Reaper>(registry_, cfg.coordinator.reclaim_interval)),
      server_(std::make_shared<protocols::ctl::Server>(cfg.server, scheduler_, registry_, recorder_))
{
    services_["MetricsRecorder"] = recorder_;
    services_["PatternPredictor"] = predictor_;
    services_["PriorityScheduler"] = scheduler_;
    services_["Reaper"] = reaper_;
    services_["CtlServer"] = server_;
}

ServiceManager::~ServiceManager() { stopAll(); }

void ServiceManager::startAll() {
    log::Registry::wtc()->debug("[ServiceManager] Starting all services...");
    try {
        std::lock_guard lock(mutex_);
        tryStart("MetricsRecorder", recorder_);
        tryStart("PatternPredictor", predictor_);
        tryStart("PriorityScheduler", scheduler_);
        tryStart("Reaper", reaper_);
        tryStart("CtlServer", server_);
    } catch (const std::exception&) {
        stopAll();
        throw;
    }
    log::Registry::wtc()->debug("[ServiceManager] All services started.");
}

void ServiceManager::stopAll() {
    log::Registry::wtc()->debug("[ServiceManager] Stopping all services...");
    std::lock_guard lock(mutex_);
    // front door first, recorder last so it flushes every event
    stopService("CtlServer", server_);
    stopService("Reaper", reaper_);
    stopService("PriorityScheduler", scheduler_);
    stopService("PatternPredictor", predictor_);
    stopService("MetricsRecorder", recorder_);
    log::Registry::wtc()->debug("[ServiceManager] All services stopped.");
}

bool ServiceManager::allRunning() const {
    std::lock_guard lock(mutex_);
    for (const auto& [name, svc] : services_)
        if (!svc->isRunning()) return false;
    return true;
}

void ServiceManager::tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;
    log::Registry::wtc()->debug("[ServiceManager] Starting service: {}", name);
    try {
        svc->start();
    } catch (const std::exception& e) {
        log::Registry::wtc()->error("[ServiceManager] Failed to start {}: {}", name, e.what());
        throw;
    }
}

void ServiceManager::stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc) {
    if (!svc) return;

    log::Registry::wtc()->debug("[ServiceManager] Stopping service: {}", name);
    try {
        svc->stop();
    } catch (const std::exception& e) {
        log::Registry::wtc()->error("[ServiceManager] Failed to stop {} gracefully: {}", name, e.what());
    }
}
