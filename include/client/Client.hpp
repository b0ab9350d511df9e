#pragma once

#include "config/Config.hpp"
#include "types/Operation.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <nlohmann/json.hpp>

namespace wtc::client {

struct ClientOptions {
    std::filesystem::path socket_path;
    std::filesystem::path lock_dir;
    config::BackoffConfig backoff;
    std::chrono::seconds degraded_timeout{30};
    bool allow_degraded = true;

    static ClientOptions fromConfig(const config::Config& cfg);
};

/**
 * Synchronous client of the coordinator's control socket.
 *
 * submit() blocks until the coordinator grants the scope, runs the caller's
 * operation, reports its exit code and returns the terminal result. When the
 * socket cannot be reached it falls back to DirectLock (no queueing, no
 * prediction) and marks the result as degraded.
 */
class Client {
public:
    // Runs while the scope is held; returns the operation's exit code.
    using Body = std::function<int()>;

    explicit Client(ClientOptions opts);

    types::OperationResult submit(const types::OperationRequest& request, const Body& body) const;

    bool cancel(const std::string& requestId) const;
    nlohmann::json summary() const;
    nlohmann::json status() const;
    size_t reclaim() const;

    // Throws SchedulerUnavailable when nothing listens on the socket.
    [[nodiscard]] int connect() const;

private:
    ClientOptions opts_;

    nlohmann::json roundTrip(const nlohmann::json& request) const;
    types::OperationResult submitRemote(int fd, const types::OperationRequest& request, const Body& body) const;
    types::OperationResult submitDegraded(const types::OperationRequest& request, const Body& body) const;
};

}
