#include "sched/QueueEntry.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace wtc::sched;
using namespace wtc::types;
using namespace std::chrono;

std::string wtc::sched::to_string(const EntryState state) {
    switch (state) {
        case EntryState::Queued: return "queued";
        case EntryState::Dispatched: return "dispatched";
        case EntryState::Running: return "running";
        case EntryState::Completed: return "completed";
        case EntryState::TimedOut: return "timed_out";
        case EntryState::Cancelled: return "cancelled";
        case EntryState::Conflict: return "conflict";
        default: return "unknown";
    }
}

int QueueEntry::effectivePriority(const Clock::time_point now, const seconds agingInterval) const {
    const auto waited = now > enqueue_time ? now - enqueue_time : Clock::duration::zero();
    const auto aging = agingInterval.count() > 0 ? waited / agingInterval : 0;
    const auto eff = static_cast<int64_t>(request.priority) + boost + aging;
    return static_cast<int>(std::min<int64_t>(OperationRequest::MAX_PRIORITY, eff));
}

EntryView QueueEntry::view(const Clock::time_point now, const seconds agingInterval) const {
    return {
        .id = request.id,
        .verb = request.verb,
        .caller_id = request.caller_id,
        .scope = scope.id(),
        .state = to_string(state),
        .priority = request.priority,
        .effective_priority = effectivePriority(now, agingInterval),
        .age_ms = static_cast<uint64_t>(duration_cast<milliseconds>(now - request.submitted_at).count()),
        .attempts = attempts
    };
}

OperationResult QueueEntry::makeResult(const OperationResult::Status status) const {
    OperationResult r;
    r.request_id = request.id;
    r.status = status;
    r.scope_used = scope.id();
    r.duration_ms = static_cast<uint64_t>(
        std::max<int64_t>(0, duration_cast<milliseconds>(Clock::now() - request.submitted_at).count()));
    r.waited_ms = waited_ms;
    return r;
}

bool EntryOrder::operator()(const std::shared_ptr<QueueEntry>& a, const std::shared_ptr<QueueEntry>& b) const {
    // std heaps are max-heaps; "less" means lower dispatch precedence
    const auto pa = a->effectivePriority(now, agingInterval);
    const auto pb = b->effectivePriority(now, agingInterval);
    if (pa != pb) return pa < pb;
    if (a->enqueue_time != b->enqueue_time) return a->enqueue_time > b->enqueue_time;
    return a->sequence > b->sequence;
}

void wtc::sched::to_json(nlohmann::json& j, const EntryView& v) {
    j = {
        {"id", v.id},
        {"verb", v.verb},
        {"caller_id", v.caller_id},
        {"scope", v.scope},
        {"state", v.state},
        {"priority", v.priority},
        {"effective_priority", v.effective_priority},
        {"age_ms", v.age_ms},
        {"attempts", v.attempts}
    };
}
