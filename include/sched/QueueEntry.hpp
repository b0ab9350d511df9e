#pragma once

#include "coord/Lock.hpp"
#include "types/Operation.hpp"
#include "types/Scope.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace wtc::sched {

enum class EntryState { Queued, Dispatched, Running, Completed, TimedOut, Cancelled, Conflict };

std::string to_string(EntryState state);

// The caller-owned operation, run on a worker slot while the lock is held. Returns its exit code.
using OperationBody = std::function<int(const coord::Lock&)>;

struct EntryView {
    std::string id, verb, caller_id, scope, state;
    int priority = 0;
    int effective_priority = 0;
    uint64_t age_ms = 0;
    unsigned int attempts = 0;
};

struct QueueEntry {
    types::OperationRequest request;
    types::ScopeRequirement scope;
    types::Clock::time_point enqueue_time{};
    uint64_t sequence = 0;          // FIFO tie-break for equal enqueue times
    int boost = 0;                  // retry boost
    unsigned int attempts = 0;
    uint64_t waited_ms = 0;         // summed over attempts
    EntryState state{EntryState::Queued};
    bool done = false;

    OperationBody body;
    std::promise<types::OperationResult> promise;

    // min(10, priority + boost + floor(wait / aging_interval))
    [[nodiscard]] int effectivePriority(types::Clock::time_point now, std::chrono::seconds agingInterval) const;

    [[nodiscard]] EntryView view(types::Clock::time_point now, std::chrono::seconds agingInterval) const;

    [[nodiscard]] types::OperationResult makeResult(types::OperationResult::Status status) const;
};

// Heap order: higher effective priority first, then earlier enqueue.
struct EntryOrder {
    types::Clock::time_point now;
    std::chrono::seconds agingInterval;

    bool operator()(const std::shared_ptr<QueueEntry>& a, const std::shared_ptr<QueueEntry>& b) const;
};

void to_json(nlohmann::json& j, const EntryView& v);

}
