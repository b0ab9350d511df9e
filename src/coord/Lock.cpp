#include "coord/Lock.hpp"
#include "coord/HolderProbe.hpp"

#include <cerrno>
#include <csignal>
#include <chrono>
#include <nlohmann/json.hpp>

using namespace wtc::coord;

void wtc::coord::to_json(nlohmann::json& j, const Lock& l) {
    using namespace std::chrono;
    const auto now = types::Clock::now();
    j = {
        {"scope_id", l.scope_id},
        {"holder_id", l.holder_id},
        {"owner", l.owner},
        {"verb", l.verb},
        {"pid", l.pid},
        {"held_ms", duration_cast<milliseconds>(now - l.acquired_at).count()},
        {"ttl_remaining_ms", duration_cast<milliseconds>(l.ttl_deadline - now).count()},
        {"generation", l.generation},
        {"advisory", l.advisory}
    };
}

bool ProcessProbe::isAlive(const Lock& lock) const {
    if (lock.pid <= 0) return true;
    if (::kill(lock.pid, 0) == 0) return true;
    return errno == EPERM;  // exists, owned by someone else
}
