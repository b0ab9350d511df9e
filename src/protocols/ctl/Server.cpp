#include "protocols/ctl/Server.hpp"
#include "protocols/ctl/SocketIO.hpp"
#include "coord/LockRegistry.hpp"
#include "coord/ScopeResolver.hpp"
#include "coord/errors.hpp"
#include "metrics/Recorder.hpp"
#include "sched/PriorityScheduler.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <string>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

using nlohmann::json;
using namespace wtc::protocols::ctl;
using namespace std::chrono;

namespace {

constexpr auto POLL_TICK = milliseconds(200);

Peer peercred(const int fd) {
    ucred c{};
    socklen_t len = sizeof(c);
    if (getsockopt(fd, SOL_SOCKET, SO_PEERCRED, &c, &len) != 0) throw std::runtime_error("SO_PEERCRED failed");
    return {c.uid, c.gid, c.pid};
}

sockaddr_un addressOf(const std::filesystem::path& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.string().size() >= sizeof(addr.sun_path))
        throw std::runtime_error("socket path too long: " + path.string());
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());
    return addr;
}

bool someoneListening(const std::filesystem::path& path) {
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return false;
    auto addr = addressOf(path);
    const bool ok = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0;
    ::close(fd);
    return ok;
}

bool trySend(const int fd, const json& j) {
    try {
        SocketIO::send_json(fd, j);
        return true;
    } catch (const std::exception& e) {
        wtc::log::Registry::ctl()->debug("[CtlServer] Dropped '{}' frame: {}", j.value("type", ""), e.what());
        return false;
    }
}

json errorFrame(const std::string& message) {
    return {{"type", "error"}, {"message", message}};
}

// Serializes the connection between the handler thread (while queued) and the worker slot (once granted).
struct Connection {
    int fd = -1;
    std::mutex io;
    bool granted = false;
    bool hungUp = false;
};

}

Server::Server(config::ServerConfig cfg,
               std::shared_ptr<sched::PriorityScheduler> scheduler,
               std::shared_ptr<coord::LockRegistry> registry,
               std::shared_ptr<metrics::Recorder> recorder)
    : AsyncService("CtlServer"),
      cfg_(std::move(cfg)),
      scheduler_(std::move(scheduler)),
      registry_(std::move(registry)),
      recorder_(std::move(recorder)),
      connections_("ctl", cfg_.max_connections) {}

Server::~Server() { stop(); }

void Server::start() {
    if (isRunning()) return;
    stopping_ = false;
    bindListener();
    AsyncService::start();
}

void Server::stop() {
    stopping_ = true;
    AsyncService::stop();
    connections_.stop();
    closeListener();
}

void Server::onStop() {
    if (const int fd = listenFd_.load(); fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void Server::bindListener() {
    const auto& path = cfg_.socket_path;
    if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path());

    if (std::filesystem::exists(path)) {
        if (someoneListening(path))
            throw std::runtime_error("another coordinator is already listening on " + path.string());
        ::unlink(path.c_str());
    }

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw std::runtime_error(std::string("socket(): ") + std::strerror(errno));

    auto addr = addressOf(path);
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0) {
        const auto err = errno;
        ::close(fd);
        throw std::runtime_error("bind(" + path.string() + "): " + std::strerror(err));
    }
    ::chmod(path.c_str(), 0600);

    if (::listen(fd, 64) != 0) {
        const auto err = errno;
        ::close(fd);
        throw std::runtime_error(std::string("listen(): ") + std::strerror(err));
    }

    listenFd_ = fd;
    log::Registry::ctl()->info("[CtlServer] Listening on {}", path.string());
}

void Server::closeListener() {
    if (const int fd = listenFd_.exchange(-1); fd >= 0) {
        ::close(fd);
        ::unlink(cfg_.socket_path.c_str());
    }
}

void Server::runLoop() {
    while (!shouldStop()) {
        const int cfd = ::accept4(listenFd_.load(), nullptr, nullptr, SOCK_CLOEXEC);
        if (cfd < 0) {
            if (shouldStop()) break;
            if (errno == EINTR || errno == ECONNABORTED) continue;
            log::Registry::ctl()->warn("[CtlServer] accept() failed: {}", std::strerror(errno));
            lazySleep(milliseconds(50));
            continue;
        }

        try {
            const auto peer = peercred(cfd);
            if (connections_.queueDepth() >= cfg_.max_connections) {
                log::Registry::ctl()->warn("[CtlServer] Rejecting PID {}: {} connections pending", peer.pid,
                                           connections_.queueDepth());
                trySend(cfd, errorFrame("coordinator busy"));
                ::close(cfd);
                continue;
            }

            connections_.submit(concurrency::makeTask([this, cfd, peer] {
                handle(cfd, peer);
                ::close(cfd);
            }));
        } catch (const std::exception& e) {
            log::Registry::ctl()->warn("[CtlServer] Dropping connection: {}", e.what());
            trySend(cfd, errorFrame(e.what()));
            ::close(cfd);
        }
    }
}

void Server::handle(const int fd, const Peer& peer) {
    try {
        const auto req = SocketIO::recv_json(fd);
        const auto type = req.value("type", std::string{});
        log::Registry::ctl()->debug("[CtlServer] '{}' from UID {} (PID {})", type, peer.uid, peer.pid);

        if (type == "submit") {
            handleSubmit(fd, req, peer);
        } else if (type == "cancel") {
            const auto id = req.at("id").get<std::string>();
            SocketIO::send_json(fd, {{"type", "cancel"}, {"id", id}, {"ok", scheduler_->cancel(id)}});
        } else if (type == "summary") {
            json reply = recorder_->summary();
            reply["type"] = "summary";
            SocketIO::send_json(fd, reply);
        } else if (type == "status") {
            json reply = scheduler_->snapshot();
            reply["type"] = "status";
            SocketIO::send_json(fd, reply);
        } else if (type == "reclaim") {
            SocketIO::send_json(fd, {{"type", "reclaim"}, {"reclaimed", registry_->reclaimStale()}});
        } else {
            SocketIO::send_json(fd, errorFrame("unknown request type '" + type + "'"));
        }
    } catch (const ConnectionClosed& e) {
        log::Registry::ctl()->debug("[CtlServer] PID {} disconnected: {}", peer.pid, e.what());
    } catch (const json::exception& e) {
        log::Registry::ctl()->warn("[CtlServer] Malformed request from PID {}: {}", peer.pid, e.what());
        trySend(fd, errorFrame(std::string("malformed request: ") + e.what()));
    } catch (const std::exception& e) {
        log::Registry::ctl()->warn("[CtlServer] Request from PID {} failed: {}", peer.pid, e.what());
        trySend(fd, errorFrame(e.what()));
    }
}

void Server::handleSubmit(const int fd, const json& req, const Peer& peer) {
    auto request = types::makeRequest(req.at("verb").get<std::string>(),
                                      req.value("target", std::string{}),
                                      req.value("priority", 5),
                                      req.value("caller_id", std::string{}),
                                      peer.pid);
    request.acquire_timeout = milliseconds(std::max<int64_t>(0, req.value("timeout_ms", int64_t{0})));
    if (request.verb.empty()) {
        SocketIO::send_json(fd, errorFrame("verb is required"));
        return;
    }

    const auto id = request.id;
    const auto submittedAt = request.submitted_at;
    const auto scope = coord::ScopeResolver::resolve(request.verb, request.target);
    const auto conn = std::make_shared<Connection>();
    conn->fd = fd;

    auto body = [this, conn, id, submittedAt](const coord::Lock& lock) -> int {
        {
            std::scoped_lock io(conn->io);
            if (conn->hungUp) throw std::runtime_error("client went away before the grant");
            conn->granted = true;
            SocketIO::send_json(conn->fd, {
                {"type", "granted"},
                {"id", id},
                {"scope", lock.scope_id},
                {"generation", lock.generation},
                {"waited_ms", duration_cast<milliseconds>(lock.acquired_at - submittedAt).count()}
            });
        }

        // The client runs its operation now and reports back on the same connection.
        while (true) {
            if (stopping_) throw coord::HolderAbandoned("coordinator shutting down while " + id + " runs");
            if (!SocketIO::readable(conn->fd, POLL_TICK)) continue;

            json msg;
            try {
                msg = SocketIO::recv_json(conn->fd);
            } catch (const ConnectionClosed&) {
                throw coord::HolderAbandoned("client hung up while holding " + lock.scope_id);
            }

            if (msg.value("type", std::string{}) == "complete" && msg.value("id", id) == id)
                return msg.value("exit_code", 0);
            log::Registry::ctl()->debug("[CtlServer] Ignoring '{}' frame while {} runs", msg.value("type", ""), id);
        }
    };

    auto future = scheduler_->submit(std::move(request), std::move(body));
    {
        std::scoped_lock io(conn->io);
        if (!conn->granted) SocketIO::send_json(fd, {{"type", "queued"}, {"id", id}, {"scope", scope.id()}});
    }

    while (future.wait_for(POLL_TICK) != std::future_status::ready) {
        std::unique_lock io(conn->io);
        if (conn->granted) continue;

        if (stopping_) {
            conn->hungUp = true;
            io.unlock();
            scheduler_->cancel(id);
            trySend(fd, errorFrame("coordinator shutting down"));
            return;
        }
        if (conn->hungUp || !SocketIO::readable(fd, milliseconds(0))) continue;

        try {
            const auto msg = SocketIO::recv_json(fd);
            if (msg.value("type", std::string{}) == "cancel") {
                io.unlock();
                scheduler_->cancel(id);
            }
        } catch (const ConnectionClosed&) {
            conn->hungUp = true;
            io.unlock();
            if (scheduler_->cancel(id))
                log::Registry::ctl()->info("[CtlServer] PID {} hung up, cancelled queued {}", peer.pid, id);
        }
    }

    json reply = future.get();
    reply["type"] = "result";
    std::scoped_lock io(conn->io);
    if (!conn->hungUp) trySend(fd, reply);
}
