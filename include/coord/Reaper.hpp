#pragma once

#include "concurrency/AsyncService.hpp"

#include <chrono>
#include <memory>

namespace wtc::coord {

class LockRegistry;

// Periodically reclaims locks whose TTL lapsed and whose holder process is gone.
class Reaper final : public concurrency::AsyncService {
public:
    Reaper(std::shared_ptr<LockRegistry> registry, std::chrono::seconds interval);
    ~Reaper() override;

protected:
    void runLoop() override;

private:
    std::shared_ptr<LockRegistry> registry_;
    std::chrono::seconds interval_;
};

}
