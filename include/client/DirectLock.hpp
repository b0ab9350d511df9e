#pragma once

#include "config/Config.hpp"
#include "types/Scope.hpp"

#include <chrono>
#include <filesystem>
#include <string>

namespace wtc::client {

/**
 * flock(2) locks under <state_dir>/locks/, used when no coordinator answers.
 *
 * global takes global.lock exclusively. worktree:<id> takes global.lock
 * shared plus worktree-<id>.lock exclusively, so the same exclusion rules
 * hold between degraded callers. Locks go away with the process.
 */
class DirectLock {
public:
    DirectLock(std::filesystem::path lockDir, const config::BackoffConfig& backoff);
    ~DirectLock();

    DirectLock(const DirectLock&) = delete;
    DirectLock& operator=(const DirectLock&) = delete;

    // Throws AcquisitionTimeout once timeout elapses, std::system_error on I/O failure.
    void acquire(const types::ScopeRequirement& scope, std::chrono::milliseconds timeout);
    void release();

    [[nodiscard]] bool held() const noexcept { return globalFd_ >= 0; }

    static std::filesystem::path lockFileFor(const std::filesystem::path& lockDir, const types::ScopeRequirement& scope);

private:
    std::filesystem::path lockDir_;
    config::BackoffConfig backoff_;
    int globalFd_ = -1;
    int worktreeFd_ = -1;

    static int openLockFile(const std::filesystem::path& path);
};

}
