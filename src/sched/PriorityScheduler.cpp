#include "sched/PriorityScheduler.hpp"
#include "coord/LockRegistry.hpp"
#include "coord/ScopeResolver.hpp"
#include "coord/errors.hpp"
#include "metrics/Recorder.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <unordered_set>
#include <nlohmann/json.hpp>

using namespace wtc::sched;
using namespace wtc::types;
using namespace wtc::coord;
using namespace std::chrono;

namespace {

constexpr auto DISPATCH_TICK = milliseconds(100);

}

PriorityScheduler::PriorityScheduler(const config::Config& cfg,
                                     std::shared_ptr<LockRegistry> registry,
                                     std::shared_ptr<predict::PatternPredictor> predictor,
                                     std::shared_ptr<metrics::Recorder> recorder)
    : AsyncService("PriorityScheduler"),
      cfg_(cfg.coordinator),
      predictorCfg_(cfg.predictor),
      registry_(std::move(registry)),
      predictor_(std::move(predictor)),
      recorder_(std::move(recorder)),
      workers_("scheduler", cfg.coordinator.worker_slots) {
    if (!registry_) throw std::invalid_argument("PriorityScheduler requires a lock registry");
}

PriorityScheduler::~PriorityScheduler() { stop(); }

std::future<OperationResult> PriorityScheduler::submit(OperationRequest request, OperationBody body) {
    if (!isRunning() || shouldStop()) throw SchedulerUnavailable("scheduler is not running");
    if (!body) throw std::invalid_argument("operation body is required");

    if (request.id.empty()) request.id = newRequestId();
    if (request.submitted_at == Clock::time_point{}) request.submitted_at = Clock::now();
    request.priority = std::clamp(request.priority, OperationRequest::MIN_PRIORITY, OperationRequest::MAX_PRIORITY);

    auto entry = std::make_shared<QueueEntry>();
    entry->scope = ScopeResolver::resolve(request.verb, request.target);
    entry->request = std::move(request);
    entry->body = std::move(body);
    entry->enqueue_time = Clock::now();

    auto future = entry->promise.get_future();
    {
        std::scoped_lock lock(mutex_);
        entry->sequence = ++sequence_;
        queue_.push_back(entry);
        wake_ = true;
    }
    cv_.notify_one();

    log::Registry::scheduler()->debug("[PriorityScheduler] Queued {} '{}' from {} for {} at priority {}",
                                      entry->request.id, entry->request.verb, entry->request.caller_id,
                                      entry->scope.id(), entry->request.priority);
    return future;
}

bool PriorityScheduler::cancel(const std::string& requestId) {
    std::shared_ptr<QueueEntry> entry;
    {
        std::scoped_lock lock(mutex_);
        const auto it = std::ranges::find_if(queue_, [&](const auto& e) { return e->request.id == requestId; });
        if (it == queue_.end() || (*it)->state != EntryState::Queued) return false;
        entry = *it;
        queue_.erase(it);
        entry->state = EntryState::Cancelled;
        entry->done = true;
    }

    auto r = entry->makeResult(OperationResult::Status::Cancelled);
    r.message = "cancelled while queued";
    entry->promise.set_value(std::move(r));
    log::Registry::scheduler()->info("[PriorityScheduler] Cancelled queued request {}", requestId);
    return true;
}

void PriorityScheduler::runLoop() {
    while (!shouldStop()) {
        {
            std::unique_lock lock(mutex_);
            cv_.wait_for(lock, DISPATCH_TICK, [this] { return wake_ || shouldStop(); });
            wake_ = false;
            if (shouldStop()) break;
            dispatchPass(lock);
        }
        expireAdvisories();
    }
}

void PriorityScheduler::onStop() {
    {
        std::scoped_lock lock(mutex_);
        wake_ = true;
    }
    cv_.notify_all();
}

void PriorityScheduler::stop() {
    AsyncService::stop();
    workers_.stop();
    failQueued("coordinator is shutting down");
    releaseAllAdvisories();
}

bool PriorityScheduler::scopeBusy(const ScopeRequirement& scope) const {
    for (const auto& [id, e] : inFlight_) {
        if (e->scope.isGlobal()) return true;
        if (!scope.isGlobal() && e->scope == scope) return true;
    }
    return !scope.isGlobal() && registry_->isDraining();
}

void PriorityScheduler::dispatchPass(std::unique_lock<std::mutex>&) {
    if (queue_.empty()) return;

    const EntryOrder order{Clock::now(), cfg_.aging_interval};
    auto heap = queue_;
    std::ranges::make_heap(heap, order);

    std::unordered_set<std::string> skipped;
    while (!heap.empty() && inFlight_.size() < cfg_.worker_slots) {
        std::ranges::pop_heap(heap, order);
        auto entry = std::move(heap.back());
        heap.pop_back();

        const auto scopeId = entry->scope.id();
        if (skipped.contains(scopeId)) continue;
        if (scopeBusy(entry->scope)) {
            skipped.insert(scopeId);
            continue;
        }

        std::erase(queue_, entry);
        entry->state = EntryState::Dispatched;
        ++entry->attempts;
        inFlight_[entry->request.id] = entry;

        log::Registry::scheduler()->debug("[PriorityScheduler] Dispatching {} '{}' on {} (effective priority {}, attempt {})",
                                          entry->request.id, entry->request.verb, scopeId,
                                          entry->effectivePriority(order.now, cfg_.aging_interval), entry->attempts);

        workers_.submit(concurrency::makeTask([this, entry] { execute(entry); }));
    }
}

void PriorityScheduler::execute(const std::shared_ptr<QueueEntry>& entry) {
    const auto& req = entry->request;

    auto lock = claimAdvisory(*entry);
    const auto start = Clock::now();
    if (!lock) {
        try {
            const auto timeout = req.acquire_timeout.count() > 0
                ? req.acquire_timeout : duration_cast<milliseconds>(cfg_.acquire_timeout);
            lock = registry_->tryAcquire(entry->scope, req, timeout);
        } catch (const AcquisitionTimeout& e) {
            entry->waited_ms += e.waitedMs();
            if (entry->attempts < 2) {
                log::Registry::scheduler()->info("[PriorityScheduler] {} timed out on {}, requeueing with boost {}",
                                                 req.id, e.scope(), cfg_.retry_boost);
                requeue(entry);
                return;
            }

            auto r = entry->makeResult(OperationResult::Status::Timeout);
            r.scope_used = e.scope();
            r.holder = e.holder();
            r.message = e.what();
            finish(entry, EntryState::TimedOut, std::move(r));
            return;
        } catch (const ScopeConflictDetected& e) {
            auto r = entry->makeResult(OperationResult::Status::Conflict);
            r.holder = e.held();
            r.message = e.what();
            log::Registry::scheduler()->warn("[PriorityScheduler] {} rejected: {}", req.id, e.what());
            finish(entry, EntryState::Conflict, std::move(r));
            return;
        }
    }
    entry->waited_ms += static_cast<uint64_t>(duration_cast<milliseconds>(Clock::now() - start).count());

    {
        std::scoped_lock guard(mutex_);
        entry->state = EntryState::Running;
    }

    const auto hint = predictNext(*entry);
    const bool sameScope = hint && hint->scope == entry->scope;
    if (hint && !sameScope) preAcquire(*entry, *hint);

    int exitCode = 0;
    std::string message;
    bool abandoned = false;
    try {
        exitCode = entry->body(*lock);
    } catch (const HolderAbandoned& e) {
        abandoned = true;
        message = e.what();
        log::Registry::scheduler()->warn("[PriorityScheduler] Holder of {} abandoned {}: {}; leaving lock for reclaim",
                                         req.id, lock->scope_id, e.what());
    } catch (const std::exception& e) {
        exitCode = 1;
        message = e.what();
        log::Registry::scheduler()->warn("[PriorityScheduler] Operation {} '{}' failed: {}", req.id, req.verb, e.what());
    }

    if (abandoned) {
        auto r = entry->makeResult(OperationResult::Status::Cancelled);
        r.message = message;
        finish(entry, EntryState::Cancelled, std::move(r));
        return;
    }

    registry_->release(*lock);
    if (sameScope) preAcquire(*entry, *hint);
    if (predictor_ && predictorCfg_.enabled) predictor_->observe(req.caller_id, req.verb);

    auto r = entry->makeResult(OperationResult::Status::Success);
    r.exit_code = exitCode;
    r.message = message;
    finish(entry, EntryState::Completed, std::move(r));
}

void PriorityScheduler::requeue(const std::shared_ptr<QueueEntry>& entry) {
    {
        std::scoped_lock lock(mutex_);
        inFlight_.erase(entry->request.id);
        entry->boost += static_cast<int>(cfg_.retry_boost);
        entry->state = EntryState::Queued;
        queue_.push_back(entry);
        wake_ = true;
    }
    cv_.notify_one();
}

void PriorityScheduler::finish(const std::shared_ptr<QueueEntry>& entry, const EntryState state, OperationResult result) {
    {
        std::scoped_lock lock(mutex_);
        if (entry->done) return;
        entry->done = true;
        entry->state = state;
        inFlight_.erase(entry->request.id);
        wake_ = true;
    }
    cv_.notify_one();

    log::Registry::scheduler()->debug("[PriorityScheduler] {} '{}' finished as {} on {} after {} ms (waited {} ms)",
                                      result.request_id, entry->request.verb, to_string(result.status),
                                      result.scope_used, result.duration_ms, result.waited_ms);
    entry->promise.set_value(std::move(result));
}

void PriorityScheduler::failQueued(const std::string& reason) {
    std::vector<std::shared_ptr<QueueEntry>> orphans;
    {
        std::scoped_lock lock(mutex_);
        orphans.swap(queue_);
        for (auto& [id, e] : inFlight_) orphans.push_back(e);
        inFlight_.clear();

        std::erase_if(orphans, [](const auto& e) { return e->done; });
        for (const auto& e : orphans) e->done = true;
    }

    for (const auto& e : orphans) {
        auto r = e->makeResult(OperationResult::Status::Unavailable);
        r.message = reason;
        e->promise.set_value(std::move(r));
    }

    if (!orphans.empty())
        log::Registry::scheduler()->warn("[PriorityScheduler] Failed {} pending request(s): {}", orphans.size(), reason);
}

std::optional<Lock> PriorityScheduler::claimAdvisory(const QueueEntry& entry) {
    const auto& caller = entry.request.caller_id;
    const auto scopeId = entry.scope.id();

    std::optional<Lock> ours;
    std::vector<Lock> misfires;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = advisory_.begin(); it != advisory_.end();) {
            const auto& held = it->second.lock;
            const bool own = !caller.empty() && it->first == caller;
            if (own && held.scope_id == scopeId) {
                ours = held;
                it = advisory_.erase(it);
                continue;
            }

            // a caller moving to another scope, or anyone else needing the scope, voids the hint
            if (own || entry.scope.isGlobal() || held.scope_id == scopeId || isGlobalScopeId(held.scope_id)) {
                misfires.push_back(held);
                it = advisory_.erase(it);
                continue;
            }
            ++it;
        }
    }

    for (const auto& l : misfires) releaseAdvisory(l, true);

    if (!ours) return std::nullopt;
    auto adopted = registry_->adopt(scopeId, ours->holder_id, entry.request);
    if (adopted) {
        if (recorder_) recorder_->recordPredictorHit();
        log::Registry::scheduler()->debug("[PriorityScheduler] {} adopted advisory lock on {}", entry.request.id, scopeId);
    }
    return adopted;
}

void PriorityScheduler::releaseAdvisory(const Lock& lock, const bool misfire) {
    registry_->release(lock);
    if (misfire && recorder_) recorder_->recordPredictorMisfire();
    log::Registry::scheduler()->debug("[PriorityScheduler] Released advisory lock {} held for {}{}",
                                      lock.scope_id, lock.owner, misfire ? " (misfire)" : "");
}

std::optional<wtc::predict::ScopeHint> PriorityScheduler::predictNext(const QueueEntry& entry) {
    if (!predictor_ || !predictorCfg_.enabled || entry.request.caller_id.empty()) return std::nullopt;

    std::vector<std::string> recent;
    {
        std::scoped_lock lock(mutex_);
        auto& history = recent_[entry.request.caller_id];
        history.push_back(entry.request.verb);
        while (history.size() > predictor_->sequenceLength()) history.pop_front();
        recent.assign(history.begin(), history.end());
    }

    return predictor_->predict(recent, entry.request.target);
}

void PriorityScheduler::preAcquire(const QueueEntry& entry, const predict::ScopeHint& hint) {
    const auto& caller = entry.request.caller_id;
    {
        std::scoped_lock lock(mutex_);
        if (advisory_.contains(caller) || shouldStop()) return;
    }

    auto held = registry_->tryAcquireNow(hint.scope, advisoryHolderFor(caller), caller, hint.verb,
                                         entry.request.pid, true);
    if (!held) return;

    bool duplicate = false;
    {
        std::scoped_lock lock(mutex_);
        duplicate = !advisory_.try_emplace(caller, AdvisoryHold{*held, Clock::now() + predictorCfg_.grace_window}).second;
    }
    if (duplicate) {
        registry_->release(*held);
        return;
    }

    log::Registry::scheduler()->debug("[PriorityScheduler] Pre-acquired {} for {} (predicted '{}', confidence {:.2f})",
                                      held->scope_id, caller, hint.verb, hint.confidence);
}

void PriorityScheduler::expireAdvisories() {
    std::vector<Lock> expired;
    {
        std::scoped_lock lock(mutex_);
        const auto now = Clock::now();
        for (auto it = advisory_.begin(); it != advisory_.end();) {
            if (it->second.expires <= now) {
                expired.push_back(it->second.lock);
                it = advisory_.erase(it);
            } else ++it;
        }
    }
    for (const auto& l : expired) releaseAdvisory(l, true);
}

void PriorityScheduler::releaseAllAdvisories() {
    std::vector<Lock> held;
    {
        std::scoped_lock lock(mutex_);
        for (const auto& [caller, hold] : advisory_) held.push_back(hold.lock);
        advisory_.clear();
    }
    for (const auto& l : held) releaseAdvisory(l, false);
}

SchedulerSnapshot PriorityScheduler::snapshot() const {
    SchedulerSnapshot s;
    {
        std::scoped_lock lock(mutex_);
        const EntryOrder order{Clock::now(), cfg_.aging_interval};

        auto queued = queue_;
        std::ranges::sort(queued, [&](const auto& a, const auto& b) { return order(b, a); });
        for (const auto& e : queued) s.queued.push_back(e->view(order.now, cfg_.aging_interval));
        for (const auto& [id, e] : inFlight_) s.running.push_back(e->view(order.now, cfg_.aging_interval));
    }
    s.locks = registry_->snapshot();
    s.draining = registry_->isDraining();
    return s;
}

size_t PriorityScheduler::queueDepth() const {
    std::scoped_lock lock(mutex_);
    return queue_.size();
}

size_t PriorityScheduler::inFlightCount() const {
    std::scoped_lock lock(mutex_);
    return inFlight_.size();
}

void wtc::sched::to_json(nlohmann::json& j, const SchedulerSnapshot& s) {
    j = {
        {"queue", s.queued},
        {"running", s.running},
        {"locks", s.locks},
        {"draining", s.draining}
    };
}
