#pragma once

#include "config/Config.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace wtc::concurrency { class AsyncService; }
namespace wtc::coord { class LockRegistry; class Reaper; }
namespace wtc::metrics { class Recorder; }
namespace wtc::predict { class PatternPredictor; }
namespace wtc::sched { class PriorityScheduler; }
namespace wtc::protocols::ctl { class Server; }

namespace wtc::services {

// Wires the coordinator together and owns the lifecycle of its background services.
class ServiceManager {
public:
    explicit ServiceManager(const config::Config& cfg);
    ~ServiceManager();

    ServiceManager(const ServiceManager&) = delete;
    ServiceManager& operator=(const ServiceManager&) = delete;

    // Throws if a service fails to start; already started services are stopped first.
    void startAll();
    void stopAll();

    [[nodiscard]] bool allRunning() const;

    [[nodiscard]] std::shared_ptr<coord::LockRegistry> registry() const { return registry_; }
    [[nodiscard]] std::shared_ptr<metrics::Recorder> recorder() const { return recorder_; }
    [[nodiscard]] std::shared_ptr<predict::PatternPredictor> predictor() const { return predictor_; }
    [[nodiscard]] std::shared_ptr<sched::PriorityScheduler> scheduler() const { return scheduler_; }
    [[nodiscard]] std::shared_ptr<protocols::ctl::Server> server() const { return server_; }

private:
    std::shared_ptr<metrics::Recorder> recorder_;
    std::shared_ptr<coord::LockRegistry> registry_;
    std::shared_ptr<predict::PatternPredictor> predictor_;
    std::shared_ptr<sched::PriorityScheduler> scheduler_;
    std::shared_ptr<coord::Reaper> reaper_;
    std::shared_ptr<protocols::ctl::Server> server_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<concurrency::AsyncService>> services_;

    static void tryStart(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
    static void stopService(const std::string& name, const std::shared_ptr<concurrency::AsyncService>& svc);
};

}
