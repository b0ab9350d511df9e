#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wtc::coord {

// Scope stayed busy past the acquisition timeout. Never retried by the registry.
class AcquisitionTimeout : public std::runtime_error {
public:
    AcquisitionTimeout(std::string scope, std::string holder, uint64_t waitedMs);

    [[nodiscard]] const std::string& scope() const noexcept { return scope_; }
    [[nodiscard]] const std::string& holder() const noexcept { return holder_; }
    [[nodiscard]] uint64_t waitedMs() const noexcept { return waitedMs_; }

private:
    std::string scope_, holder_;
    uint64_t waitedMs_;
};

// A caller asked for global while owning a worktree lock (or the reverse).
class ScopeConflictDetected : public std::runtime_error {
public:
    ScopeConflictDetected(std::string requested, std::string held);

    [[nodiscard]] const std::string& requested() const noexcept { return requested_; }
    [[nodiscard]] const std::string& held() const noexcept { return held_; }

private:
    std::string requested_, held_;
};

class SchedulerUnavailable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The caller owning a running operation went away; its lock is left for reclaimStale().
class HolderAbandoned : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}
