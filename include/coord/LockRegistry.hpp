#pragma once

#include "config/Config.hpp"
#include "coord/EventSink.hpp"
#include "coord/HolderProbe.hpp"
#include "coord/Lock.hpp"
#include "types/Operation.hpp"
#include "types/Scope.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace wtc::coord {

/**
 * LockRegistry - the table of scopes to their current holder.
 *
 * At most one lock exists per scope. A global lock excludes every worktree
 * lock: a global request first marks the registry as draining, which refuses
 * new worktree acquisitions, and waits for held worktree locks to be released.
 * A worktree request needs the global scope free and no drain in progress.
 *
 * Waiters block on a per-scope condition variable. release() wakes a single
 * waiter of the released scope; between wakeups waiters re-poll with
 * exponential backoff so a missed notification costs at most one backoff step.
 *
 * Every transition is reported to the EventSink, which must only enqueue.
 */
class LockRegistry {
public:
    LockRegistry(std::chrono::seconds staleTtl,
                 const config::BackoffConfig& backoff,
                 std::shared_ptr<HolderProbe> probe = std::make_shared<ProcessProbe>(),
                 std::shared_ptr<EventSink> sink = nullptr);

    LockRegistry(const LockRegistry&) = delete;
    LockRegistry& operator=(const LockRegistry&) = delete;

    // Blocks up to timeout. Throws AcquisitionTimeout or ScopeConflictDetected.
    Lock tryAcquire(const types::ScopeRequirement& scope,
                    const types::OperationRequest& request,
                    std::chrono::milliseconds timeout);

    // Non-blocking; no waited/timed_out events. Used for advisory pre-acquisition.
    std::optional<Lock> tryAcquireNow(const types::ScopeRequirement& scope,
                                      const std::string& holderId,
                                      const std::string& owner,
                                      const std::string& verb,
                                      pid_t pid,
                                      bool advisory);

    // Hands a lock held by fromHolder to request without freeing the scope.
    std::optional<Lock> adopt(const std::string& scopeId,
                              const std::string& fromHolder,
                              const types::OperationRequest& request);

    // False when lock is not the live holder of its scope (stale generation).
    bool release(const Lock& lock);

    // Releases every lock held by holderId; returns how many.
    size_t releaseHolder(const std::string& holderId);

    // Force-releases expired locks whose holder is dead, extends TTL of live ones.
    size_t reclaimStale();

    [[nodiscard]] bool isAvailable(const types::ScopeRequirement& scope) const;
    [[nodiscard]] std::optional<Lock> holderOf(const std::string& scopeId) const;
    [[nodiscard]] std::vector<Lock> snapshot() const;
    [[nodiscard]] bool isDraining() const;
    [[nodiscard]] size_t heldCount() const;

    void setEventSink(std::shared_ptr<EventSink> sink);

    [[nodiscard]] std::chrono::seconds staleTtl() const noexcept { return staleTtl_; }

private:
    struct ScopeState {
        std::optional<Lock> lock;
        std::condition_variable cv;
        size_t waiters = 0;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<ScopeState>> scopes_;
    std::optional<std::string> drainer_;   // request id of the global request draining worktrees
    size_t worktreeHeld_ = 0;
    uint64_t generation_ = 0;

    std::chrono::seconds staleTtl_;
    config::BackoffConfig backoff_;
    std::shared_ptr<HolderProbe> probe_;
    std::shared_ptr<EventSink> sink_;

    ScopeState& stateFor(const std::string& scopeId);
    void maybeErase(const std::string& scopeId);

    [[nodiscard]] bool globalHeld() const;
    [[nodiscard]] bool canAcquire(const types::ScopeRequirement& scope, const std::string& holderId) const;
    [[nodiscard]] std::string blockerFor(const types::ScopeRequirement& scope) const;
    void checkConflict(const types::ScopeRequirement& scope, const std::string& owner) const;

    Lock grant(ScopeState& st, const types::ScopeRequirement& scope, const std::string& holderId,
               const std::string& owner, const std::string& verb, pid_t pid, bool advisory);

    // Frees the scope and wakes the right waiters. Caller holds mutex_.
    Lock releaseLocked(const std::string& scopeId);

    void wakeBlockedWorktrees();

    void emit(types::MetricEvent::Type type, const std::string& scopeId, uint64_t durationMs,
              const std::string& verb) const;
};

}
