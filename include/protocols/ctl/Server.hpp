#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <sys/types.h>
#include <nlohmann/json_fwd.hpp>

namespace wtc::coord { class LockRegistry; }
namespace wtc::metrics { class Recorder; }
namespace wtc::sched { class PriorityScheduler; }

namespace wtc::protocols::ctl {

struct Peer {
    uid_t uid;
    gid_t gid;
    pid_t pid;
};

/**
 * Control socket of the coordinator.
 *
 * Each accepted connection carries one request and is served on the
 * connection pool. A submit holds the connection open for the life of the
 * operation: queued, then granted, then the client sends complete and gets
 * the result. A hangup while queued cancels the entry; a hangup while the
 * operation runs leaves the lock for the reaper.
 */
class Server final : public concurrency::AsyncService {
public:
    Server(config::ServerConfig cfg,
           std::shared_ptr<sched::PriorityScheduler> scheduler,
           std::shared_ptr<coord::LockRegistry> registry,
           std::shared_ptr<metrics::Recorder> recorder);

    ~Server() override;

    // Binds the listener before the accept thread starts; throws if another coordinator is listening.
    void start() override;
    void stop() override;

    [[nodiscard]] const std::filesystem::path& socketPath() const noexcept { return cfg_.socket_path; }

protected:
    void runLoop() override;
    void onStop() override; // shut the listener down to break accept()

private:
    config::ServerConfig cfg_;
    std::shared_ptr<sched::PriorityScheduler> scheduler_;
    std::shared_ptr<coord::LockRegistry> registry_;
    std::shared_ptr<metrics::Recorder> recorder_;

    concurrency::ThreadPool connections_;
    std::atomic<int> listenFd_{-1};
    std::atomic<bool> stopping_{false};

    void bindListener();
    void closeListener();

    void handle(int fd, const Peer& peer);
    void handleSubmit(int fd, const nlohmann::json& req, const Peer& peer);
};

}
