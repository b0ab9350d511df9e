#include "coord/LockRegistry.hpp"
#include "coord/Backoff.hpp"
#include "coord/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>

using namespace wtc::coord;
using namespace wtc::types;
using namespace std::chrono;

namespace {

uint64_t millisSince(const Clock::time_point start, const Clock::time_point end = Clock::now()) {
    return static_cast<uint64_t>(std::max<int64_t>(0, duration_cast<milliseconds>(end - start).count()));
}

}

LockRegistry::LockRegistry(const seconds staleTtl,
                           const config::BackoffConfig& backoff,
                           std::shared_ptr<HolderProbe> probe,
                           std::shared_ptr<EventSink> sink)
    : staleTtl_(staleTtl), backoff_(backoff), probe_(std::move(probe)), sink_(std::move(sink)) {
    if (!probe_) probe_ = std::make_shared<ProcessProbe>();
}

void LockRegistry::setEventSink(std::shared_ptr<EventSink> sink) {
    std::scoped_lock lock(mutex_);
    sink_ = std::move(sink);
}

LockRegistry::ScopeState& LockRegistry::stateFor(const std::string& scopeId) {
    auto& slot = scopes_[scopeId];
    if (!slot) slot = std::make_unique<ScopeState>();
    return *slot;
}

void LockRegistry::maybeErase(const std::string& scopeId) {
    const auto it = scopes_.find(scopeId);
    if (it != scopes_.end() && !it->second->lock && it->second->waiters == 0) scopes_.erase(it);
}

bool LockRegistry::globalHeld() const {
    const auto it = scopes_.find(std::string(GLOBAL_SCOPE));
    return it != scopes_.end() && it->second->lock.has_value();
}

bool LockRegistry::canAcquire(const ScopeRequirement& scope, const std::string& holderId) const {
    if (scope.isGlobal())
        return !globalHeld() && worktreeHeld_ == 0 && (!drainer_ || *drainer_ == holderId);

    if (globalHeld() || drainer_) return false;
    const auto it = scopes_.find(scope.id());
    return it == scopes_.end() || !it->second->lock;
}

std::string LockRegistry::blockerFor(const ScopeRequirement& scope) const {
    if (const auto it = scopes_.find(scope.id()); it != scopes_.end() && it->second->lock)
        return it->second->lock->holder_id;

    if (scope.isGlobal()) {
        for (const auto& [id, st] : scopes_)
            if (st->lock) return st->lock->holder_id + " (" + id + ")";
        return {};
    }

    if (const auto it = scopes_.find(std::string(GLOBAL_SCOPE)); it != scopes_.end() && it->second->lock)
        return it->second->lock->holder_id + " (global)";
    if (drainer_) return *drainer_ + " (global, draining)";
    return {};
}

void LockRegistry::checkConflict(const ScopeRequirement& scope, const std::string& owner) const {
    if (owner.empty()) return;
    for (const auto& [id, st] : scopes_) {
        if (!st->lock || st->lock->advisory || st->lock->owner != owner) continue;
        if (scope.isGlobal() != isGlobalScopeId(id)) throw ScopeConflictDetected(scope.id(), id);
    }
}

Lock LockRegistry::grant(ScopeState& st, const ScopeRequirement& scope, const std::string& holderId,
                         const std::string& owner, const std::string& verb, const pid_t pid,
                         const bool advisory) {
    const auto now = Clock::now();
    Lock l{
        .scope_id = scope.id(),
        .holder_id = holderId,
        .owner = owner,
        .verb = verb,
        .pid = pid,
        .acquired_at = now,
        .ttl_deadline = now + staleTtl_,
        .generation = ++generation_,
        .advisory = advisory
    };
    st.lock = l;

    if (scope.isGlobal()) {
        if (drainer_ && *drainer_ == holderId) drainer_.reset();
    } else {
        ++worktreeHeld_;
    }
    return l;
}

Lock LockRegistry::tryAcquire(const ScopeRequirement& scope,
                              const OperationRequest& request,
                              const milliseconds timeout) {
    const auto scopeId = scope.id();
    const auto start = Clock::now();
    const auto deadline = start + timeout;
    Backoff backoff(backoff_);
    bool waited = false;

    std::unique_lock lk(mutex_);
    checkConflict(scope, request.caller_id);

    auto& st = stateFor(scopeId);
    ++st.waiters;

    while (true) {
        if (canAcquire(scope, request.id)) {
            --st.waiters;
            auto l = grant(st, scope, request.id, request.caller_id, request.verb, request.pid, false);
            const auto waitedMs = millisSince(start);
            emit(MetricEvent::Type::Acquired, scopeId, waitedMs, request.verb);
            log::Registry::registry()->debug("[LockRegistry] {} acquired by {} ({}) after {} ms, generation {}",
                                             scopeId, request.id, request.caller_id, waitedMs, l.generation);
            return l;
        }

        if (!waited) {
            waited = true;
            emit(MetricEvent::Type::Waited, scopeId, 0, request.verb);
        }

        if (scope.isGlobal() && !drainer_) {
            drainer_ = request.id;
            log::Registry::registry()->info("[LockRegistry] Global request {} draining {} worktree lock(s)",
                                            request.id, worktreeHeld_);
        }

        const auto now = Clock::now();
        if (now >= deadline) {
            --st.waiters;
            const auto blocker = blockerFor(scope);
            if (scope.isGlobal() && drainer_ && *drainer_ == request.id) {
                drainer_.reset();
                wakeBlockedWorktrees();
            }
            maybeErase(scopeId);

            const auto waitedMs = millisSince(start, now);
            emit(MetricEvent::Type::TimedOut, scopeId, waitedMs, request.verb);
            log::Registry::registry()->warn("[LockRegistry] {} timed out waiting for {} after {} ms (holder: {})",
                                            request.id, scopeId, waitedMs, blocker.empty() ? "<none>" : blocker);
            throw AcquisitionTimeout(scopeId, blocker, waitedMs);
        }

        const auto step = std::min<Clock::duration>(backoff.next(), deadline - now);
        st.cv.wait_for(lk, step);
    }
}

std::optional<Lock> LockRegistry::tryAcquireNow(const ScopeRequirement& scope,
                                                const std::string& holderId,
                                                const std::string& owner,
                                                const std::string& verb,
                                                const pid_t pid,
                                                const bool advisory) {
    std::scoped_lock lk(mutex_);
    if (!canAcquire(scope, holderId)) return std::nullopt;

    auto l = grant(stateFor(scope.id()), scope, holderId, owner, verb, pid, advisory);
    if (!advisory) emit(MetricEvent::Type::Acquired, l.scope_id, 0, verb);
    log::Registry::registry()->debug("[LockRegistry] {} taken without waiting by {}{}",
                                     l.scope_id, holderId, advisory ? " (advisory)" : "");
    return l;
}

std::optional<Lock> LockRegistry::adopt(const std::string& scopeId,
                                        const std::string& fromHolder,
                                        const OperationRequest& request) {
    std::scoped_lock lk(mutex_);
    const auto it = scopes_.find(scopeId);
    if (it == scopes_.end() || !it->second->lock || it->second->lock->holder_id != fromHolder)
        return std::nullopt;

    auto& l = *it->second->lock;
    const auto now = Clock::now();
    l.holder_id = request.id;
    l.owner = request.caller_id;
    l.verb = request.verb;
    l.pid = request.pid;
    l.acquired_at = now;
    l.ttl_deadline = now + staleTtl_;
    l.generation = ++generation_;
    l.advisory = false;

    emit(MetricEvent::Type::Acquired, scopeId, 0, request.verb);
    log::Registry::registry()->debug("[LockRegistry] {} handed from {} to {}", scopeId, fromHolder, request.id);
    return l;
}

void LockRegistry::wakeBlockedWorktrees() {
    for (const auto& [id, st] : scopes_)
        if (!isGlobalScopeId(id) && st->waiters > 0) st->cv.notify_one();
}

Lock LockRegistry::releaseLocked(const std::string& scopeId) {
    auto& st = *scopes_.at(scopeId);
    Lock released = *st.lock;
    st.lock.reset();
    ++generation_;

    if (isGlobalScopeId(scopeId)) {
        wakeBlockedWorktrees();
    } else if (--worktreeHeld_ == 0 && drainer_) {
        if (const auto g = scopes_.find(std::string(GLOBAL_SCOPE)); g != scopes_.end()) g->second->cv.notify_one();
    }

    st.cv.notify_one();
    maybeErase(scopeId);
    return released;
}

bool LockRegistry::release(const Lock& lock) {
    std::scoped_lock lk(mutex_);
    const auto it = scopes_.find(lock.scope_id);
    if (it == scopes_.end() || !it->second->lock || it->second->lock->generation != lock.generation) {
        log::Registry::registry()->warn("[LockRegistry] Ignoring release of stale lock {} (generation {}) by {}",
                                        lock.scope_id, lock.generation, lock.holder_id);
        return false;
    }

    const auto released = releaseLocked(lock.scope_id);
    if (!released.advisory)
        emit(MetricEvent::Type::Released, released.scope_id, millisSince(released.acquired_at), released.verb);
    log::Registry::registry()->debug("[LockRegistry] {} released by {}", released.scope_id, released.holder_id);
    return true;
}

size_t LockRegistry::releaseHolder(const std::string& holderId) {
    std::scoped_lock lk(mutex_);
    std::vector<std::string> owned;
    for (const auto& [id, st] : scopes_)
        if (st->lock && st->lock->holder_id == holderId) owned.push_back(id);

    for (const auto& id : owned) {
        const auto released = releaseLocked(id);
        if (!released.advisory)
            emit(MetricEvent::Type::Released, released.scope_id, millisSince(released.acquired_at), released.verb);
    }
    return owned.size();
}

size_t LockRegistry::reclaimStale() {
    std::vector<Lock> expired;
    {
        std::scoped_lock lk(mutex_);
        const auto now = Clock::now();
        for (const auto& [id, st] : scopes_)
            if (st->lock && st->lock->ttl_deadline <= now) expired.push_back(*st->lock);
    }
    if (expired.empty()) return 0;

    // Liveness probes run without the registry mutex.
    std::vector<std::pair<Lock, bool>> verdicts;
    verdicts.reserve(expired.size());
    for (auto& l : expired) {
        const bool alive = probe_->isAlive(l);
        verdicts.emplace_back(std::move(l), alive);
    }

    size_t reclaimed = 0;
    std::scoped_lock lk(mutex_);
    const auto now = Clock::now();
    for (const auto& [l, alive] : verdicts) {
        const auto it = scopes_.find(l.scope_id);
        if (it == scopes_.end() || !it->second->lock || it->second->lock->generation != l.generation) continue;

        if (alive) {
            it->second->lock->ttl_deadline = now + staleTtl_;
            log::Registry::registry()->debug("[LockRegistry] {} held by live {} past TTL, extending",
                                             l.scope_id, l.holder_id);
            continue;
        }

        const auto released = releaseLocked(l.scope_id);
        const auto heldMs = millisSince(released.acquired_at, now);
        emit(MetricEvent::Type::StaleReclaimed, released.scope_id, heldMs, released.verb);
        log::Registry::registry()->warn("[LockRegistry] Reclaimed stale lock {} from dead holder {} (pid {}, held {} ms)",
                                        released.scope_id, released.holder_id, released.pid, heldMs);
        ++reclaimed;
    }
    return reclaimed;
}

bool LockRegistry::isAvailable(const ScopeRequirement& scope) const {
    std::scoped_lock lk(mutex_);
    return canAcquire(scope, {});
}

std::optional<Lock> LockRegistry::holderOf(const std::string& scopeId) const {
    std::scoped_lock lk(mutex_);
    const auto it = scopes_.find(scopeId);
    if (it == scopes_.end()) return std::nullopt;
    return it->second->lock;
}

std::vector<Lock> LockRegistry::snapshot() const {
    std::scoped_lock lk(mutex_);
    std::vector<Lock> out;
    for (const auto& [id, st] : scopes_)
        if (st->lock) out.push_back(*st->lock);
    std::ranges::sort(out, {}, &Lock::scope_id);
    return out;
}

bool LockRegistry::isDraining() const {
    std::scoped_lock lk(mutex_);
    return drainer_.has_value();
}

size_t LockRegistry::heldCount() const {
    std::scoped_lock lk(mutex_);
    return static_cast<size_t>(std::ranges::count_if(scopes_, [](const auto& kv) { return kv.second->lock.has_value(); }));
}

void LockRegistry::emit(const MetricEvent::Type type, const std::string& scopeId, const uint64_t durationMs,
                        const std::string& verb) const {
    if (sink_) sink_->record(MetricEvent::now(type, scopeId, durationMs, verb));
}
