#include "client/Client.hpp"
#include "client/DirectLock.hpp"
#include "coord/ScopeResolver.hpp"
#include "coord/errors.hpp"
#include "protocols/ctl/SocketIO.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace wtc::client;
using namespace wtc::types;
using namespace wtc::protocols::ctl;
using nlohmann::json;
using namespace std::chrono;

namespace {

struct FdGuard {
    int fd;
    ~FdGuard() { if (fd >= 0) ::close(fd); }
};

uint64_t millisSince(const Clock::time_point start) {
    return static_cast<uint64_t>(duration_cast<milliseconds>(Clock::now() - start).count());
}

}

ClientOptions ClientOptions::fromConfig(const config::Config& cfg) {
    return {
        .socket_path = cfg.server.socket_path,
        .lock_dir = cfg.state_dir / "locks",
        .backoff = cfg.backoff,
        .degraded_timeout = cfg.coordinator.acquire_timeout,
        .allow_degraded = true
    };
}

Client::Client(ClientOptions opts) : opts_(std::move(opts)) {}

int Client::connect() const {
    const auto& path = opts_.socket_path;
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.string().size() >= sizeof(addr.sun_path))
        throw coord::SchedulerUnavailable("socket path too long: " + path.string());
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) throw coord::SchedulerUnavailable(std::string("socket(): ") + std::strerror(errno));

    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(sa_family_t) + std::strlen(addr.sun_path) + 1) != 0) {
        const auto err = errno;
        ::close(fd);
        throw coord::SchedulerUnavailable("connect(" + path.string() + "): " + std::strerror(err));
    }
    return fd;
}

json Client::roundTrip(const json& request) const {
    FdGuard fd{connect()};
    try {
        SocketIO::send_json(fd.fd, request);
        auto reply = SocketIO::recv_json(fd.fd);
        if (reply.value("type", std::string{}) == "error")
            throw std::runtime_error(reply.value("message", std::string{"coordinator error"}));
        return reply;
    } catch (const ConnectionClosed& e) {
        throw coord::SchedulerUnavailable(e.what());
    }
}

bool Client::cancel(const std::string& requestId) const {
    return roundTrip({{"type", "cancel"}, {"id", requestId}}).value("ok", false);
}

json Client::summary() const {
    auto reply = roundTrip({{"type", "summary"}});
    reply.erase("type");
    return reply;
}

json Client::status() const {
    auto reply = roundTrip({{"type", "status"}});
    reply.erase("type");
    return reply;
}

size_t Client::reclaim() const {
    return roundTrip({{"type", "reclaim"}}).value("reclaimed", size_t{0});
}

OperationResult Client::submit(const OperationRequest& request, const Body& body) const {
    try {
        FdGuard fd{connect()};
        return submitRemote(fd.fd, request, body);
    } catch (const coord::SchedulerUnavailable& e) {
        if (!opts_.allow_degraded) throw;
        log::Registry::client()->warn("[Client] Coordinator unavailable ({}); falling back to direct locks", e.what());
        return submitDegraded(request, body);
    }
}

OperationResult Client::submitRemote(const int fd, const OperationRequest& request, const Body& body) const {
    std::string id;
    bool ran = false;
    int exitCode = 0;

    try {
        SocketIO::send_json(fd, {
            {"type", "submit"},
            {"verb", request.verb},
            {"target", request.target},
            {"priority", request.priority},
            {"caller_id", request.caller_id},
            {"pid", request.pid},
            {"timeout_ms", request.acquire_timeout.count()}
        });

        while (true) {
            const auto msg = SocketIO::recv_json(fd);
            const auto type = msg.value("type", std::string{});

            if (type == "queued") {
                id = msg.value("id", std::string{});
                log::Registry::client()->debug("[Client] {} queued for {}", id, msg.value("scope", ""));
            } else if (type == "granted") {
                id = msg.value("id", id);
                log::Registry::client()->debug("[Client] {} granted {} after {} ms", id,
                                               msg.value("scope", ""), msg.value("waited_ms", 0));
                try {
                    exitCode = body();
                } catch (const std::exception&) {
                    // report the failure so the scope is released, then surface it
                    SocketIO::send_json(fd, {{"type", "complete"}, {"id", id}, {"exit_code", 1}});
                    throw;
                }
                ran = true;
                SocketIO::send_json(fd, {{"type", "complete"}, {"id", id}, {"exit_code", exitCode}});
            } else if (type == "result") {
                auto result = msg.get<OperationResult>();
                if (ran) result.exit_code = exitCode;
                return result;
            } else if (type == "error") {
                throw std::runtime_error(msg.value("message", std::string{"coordinator error"}));
            }
        }
    } catch (const ConnectionClosed& e) {
        if (!ran) throw coord::SchedulerUnavailable(std::string("coordinator went away: ") + e.what());

        log::Registry::client()->warn("[Client] Lost coordinator after {} completed: {}", id, e.what());
        OperationResult r;
        r.request_id = id;
        r.status = OperationResult::Status::Success;
        r.scope_used = coord::ScopeResolver::resolve(request.verb, request.target).id();
        r.exit_code = exitCode;
        r.message = "coordinator connection lost after completion";
        return r;
    }
}

OperationResult Client::submitDegraded(const OperationRequest& request, const Body& body) const {
    const auto start = Clock::now();
    const auto scope = coord::ScopeResolver::resolve(request.verb, request.target);

    OperationResult r;
    r.request_id = request.id;
    r.scope_used = scope.id();
    r.degraded = true;

    DirectLock lock(opts_.lock_dir, opts_.backoff);
    try {
        const auto timeout = request.acquire_timeout.count() > 0
            ? request.acquire_timeout : duration_cast<milliseconds>(opts_.degraded_timeout);
        lock.acquire(scope, timeout);
    } catch (const coord::AcquisitionTimeout& e) {
        r.status = OperationResult::Status::Unavailable;
        r.holder = e.holder();
        r.waited_ms = e.waitedMs();
        r.duration_ms = millisSince(start);
        r.message = std::string("direct lock failed: ") + e.what();
        log::Registry::client()->warn("[Client] {}", r.message);
        return r;
    } catch (const std::system_error& e) {
        r.status = OperationResult::Status::Unavailable;
        r.duration_ms = millisSince(start);
        r.message = std::string("direct lock failed: ") + e.what();
        log::Registry::client()->warn("[Client] {}", r.message);
        return r;
    }

    r.waited_ms = millisSince(start);
    r.exit_code = body();
    lock.release();

    r.status = OperationResult::Status::Success;
    r.duration_ms = millisSince(start);
    return r;
}
