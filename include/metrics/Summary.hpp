#pragma once

#include "types/MetricEvent.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace wtc::metrics {

struct Distribution {
    uint64_t count = 0;
    double avg_ms = 0.0;
    uint64_t p50_ms = 0, p95_ms = 0, p99_ms = 0, max_ms = 0;
};

// Nearest-rank percentile over an ascending sample; 0 for an empty one.
uint64_t nearestRank(const std::vector<uint64_t>& sorted, double percent);

Distribution distributionOf(std::vector<uint64_t> samples);

struct EventCounts {
    uint64_t acquires = 0;
    uint64_t releases = 0;
    uint64_t waits = 0;
    uint64_t timeouts = 0;
    uint64_t stale_reclaims = 0;
};

struct Summary {
    int64_t generated_at_ms = 0;
    uint64_t total_operations = 0;

    Distribution acquisition;                           // every acquired event
    std::map<std::string, Distribution> by_scope_type;  // "global", "worktree"
    std::map<std::string, uint64_t> scope_distribution; // scope type -> acquisitions

    EventCounts events;
    std::map<std::string, uint64_t> contention;         // scope id -> waits + timeouts
    std::map<std::string, uint64_t> stale_reclaims;     // scope id -> reclaims
    std::vector<std::pair<std::string, uint64_t>> top_operations;

    uint64_t predictor_hits = 0;
    uint64_t predictor_misfires = 0;
};

Summary computeSummary(const std::vector<types::MetricEvent>& events, size_t topN = 5);

void to_json(nlohmann::json& j, const Distribution& d);
void to_json(nlohmann::json& j, const EventCounts& e);
void to_json(nlohmann::json& j, const Summary& s);

}
