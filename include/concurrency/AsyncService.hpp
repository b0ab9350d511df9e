#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace wtc::concurrency {

class AsyncService {
public:
    explicit AsyncService(std::string serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

    [[nodiscard]] const std::string& name() const noexcept { return serviceName_; }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Called from stop() before join, e.g. to close a listener blocking in accept().
    virtual void onStop() {}

    [[nodiscard]] bool shouldStop() const { return interruptFlag_.load(std::memory_order_acquire); }

    // Sleeps up to d, returns early when stop() is called.
    void lazySleep(std::chrono::milliseconds d);

private:
    std::mutex sleepMutex_;
    std::condition_variable sleepCv_;
};

}
