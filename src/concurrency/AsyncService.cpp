#include "concurrency/AsyncService.hpp"
#include "log/Registry.hpp"

using namespace wtc::concurrency;

AsyncService::AsyncService(std::string serviceName)
    : serviceName_(std::move(serviceName)) {}

AsyncService::~AsyncService() {
    // Derived classes stop() in their own destructors; this only joins a stray thread.
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) {
        interruptFlag_.store(true, std::memory_order_release);
        sleepCv_.notify_all();
        worker_.join();
    }
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            log::Registry::wtc()->error("[{}] Service error: {}", serviceName_, e.what());
        } catch (...) {
            log::Registry::wtc()->error("[{}] Service error: unknown exception.", serviceName_);
        }

        running_.store(false, std::memory_order_release);
    });

    log::Registry::wtc()->debug("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    log::Registry::wtc()->debug("[{}] Stopping service...", serviceName_);
    {
        std::scoped_lock lock(sleepMutex_);
        interruptFlag_.store(true, std::memory_order_release);
    }
    sleepCv_.notify_all();
    onStop();

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    log::Registry::wtc()->debug("[{}] Service stopped.", serviceName_);
}

void AsyncService::lazySleep(const std::chrono::milliseconds d) {
    std::unique_lock lock(sleepMutex_);
    sleepCv_.wait_for(lock, d, [this] { return shouldStop(); });
}
