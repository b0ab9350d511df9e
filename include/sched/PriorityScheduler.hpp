#pragma once

#include "concurrency/AsyncService.hpp"
#include "concurrency/ThreadPool.hpp"
#include "config/Config.hpp"
#include "coord/Lock.hpp"
#include "predict/PatternPredictor.hpp"
#include "sched/QueueEntry.hpp"

#include <condition_variable>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace wtc::coord { class LockRegistry; }
namespace wtc::metrics { class Recorder; }

namespace wtc::sched {

struct SchedulerSnapshot {
    std::vector<EntryView> queued;
    std::vector<EntryView> running;
    std::vector<coord::Lock> locks;
    bool draining = false;
};

void to_json(nlohmann::json& j, const SchedulerSnapshot& s);

/**
 * PriorityScheduler - orders requests and hands them to worker slots.
 *
 * A single dispatcher thread owns the queue. Each pass re-keys every entry by
 * its aged priority and walks them best-first, skipping entries whose scope
 * is already in flight. Once an entry for a scope is skipped, later entries
 * for that scope are skipped too, so in-scope order never changes while
 * unrelated scopes proceed in parallel.
 *
 * Worker slots acquire the lock, run the caller's body, release, and resolve
 * the entry's future. A first acquisition timeout requeues the entry with a
 * priority boost; the second is terminal.
 */
class PriorityScheduler final : public concurrency::AsyncService {
public:
    PriorityScheduler(const config::Config& cfg,
                      std::shared_ptr<coord::LockRegistry> registry,
                      std::shared_ptr<predict::PatternPredictor> predictor = nullptr,
                      std::shared_ptr<metrics::Recorder> recorder = nullptr);

    ~PriorityScheduler() override;

    void stop() override;

    // Throws SchedulerUnavailable when not running.
    std::future<types::OperationResult> submit(types::OperationRequest request, OperationBody body);

    // Only Queued entries can be cancelled.
    bool cancel(const std::string& requestId);

    [[nodiscard]] SchedulerSnapshot snapshot() const;
    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] size_t inFlightCount() const;

protected:
    void runLoop() override;
    void onStop() override;

private:
    struct AdvisoryHold {
        coord::Lock lock;
        types::Clock::time_point expires;
    };

    config::CoordinatorConfig cfg_;
    config::PredictorConfig predictorCfg_;

    std::shared_ptr<coord::LockRegistry> registry_;
    std::shared_ptr<predict::PatternPredictor> predictor_;
    std::shared_ptr<metrics::Recorder> recorder_;

    concurrency::ThreadPool workers_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool wake_ = false;
    uint64_t sequence_ = 0;

    std::vector<std::shared_ptr<QueueEntry>> queue_;
    std::unordered_map<std::string, std::shared_ptr<QueueEntry>> inFlight_;   // by request id
    std::unordered_map<std::string, AdvisoryHold> advisory_;                 // by caller id
    std::unordered_map<std::string, std::deque<std::string>> recent_;        // by caller id

    void dispatchPass(std::unique_lock<std::mutex>& lock);
    [[nodiscard]] bool scopeBusy(const types::ScopeRequirement& scope) const;

    void execute(const std::shared_ptr<QueueEntry>& entry);
    void requeue(const std::shared_ptr<QueueEntry>& entry);
    void finish(const std::shared_ptr<QueueEntry>& entry, EntryState state, types::OperationResult result);

    // Advisory pre-acquisition
    std::optional<coord::Lock> claimAdvisory(const QueueEntry& entry);
    void releaseAdvisory(const coord::Lock& lock, bool misfire);
    std::optional<predict::ScopeHint> predictNext(const QueueEntry& entry);
    void preAcquire(const QueueEntry& entry, const predict::ScopeHint& hint);
    void expireAdvisories();
    void releaseAllAdvisories();

    void failQueued(const std::string& reason);
};

}
