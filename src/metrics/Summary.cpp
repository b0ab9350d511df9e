#include "metrics/Summary.hpp"
#include "types/Scope.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <unordered_map>
#include <nlohmann/json.hpp>

using namespace wtc::metrics;
using namespace wtc::types;

uint64_t wtc::metrics::nearestRank(const std::vector<uint64_t>& sorted, const double percent) {
    if (sorted.empty()) return 0;
    const auto rank = static_cast<size_t>(std::ceil(percent / 100.0 * static_cast<double>(sorted.size())));
    return sorted[std::clamp<size_t>(rank, 1, sorted.size()) - 1];
}

Distribution wtc::metrics::distributionOf(std::vector<uint64_t> samples) {
    Distribution d;
    if (samples.empty()) return d;

    std::ranges::sort(samples);
    d.count = samples.size();
    d.avg_ms = static_cast<double>(std::accumulate(samples.begin(), samples.end(), uint64_t{0})) /
               static_cast<double>(d.count);
    d.p50_ms = nearestRank(samples, 50);
    d.p95_ms = nearestRank(samples, 95);
    d.p99_ms = nearestRank(samples, 99);
    d.max_ms = samples.back();
    return d;
}

Summary wtc::metrics::computeSummary(const std::vector<MetricEvent>& events, const size_t topN) {
    Summary s;
    s.generated_at_ms = epochMillisNow();

    std::vector<uint64_t> all;
    std::map<std::string, std::vector<uint64_t>> byType;
    std::unordered_map<std::string, uint64_t> verbs;

    for (const auto& e : events) {
        switch (e.type) {
            case MetricEvent::Type::Acquired: {
                ++s.events.acquires;
                const auto type = scopeType(e.scope_id);
                all.push_back(e.duration_ms);
                byType[type].push_back(e.duration_ms);
                ++s.scope_distribution[type];
                if (!e.verb.empty()) ++verbs[e.verb];
                break;
            }
            case MetricEvent::Type::Released:
                ++s.events.releases;
                break;
            case MetricEvent::Type::Waited:
                ++s.events.waits;
                ++s.contention[e.scope_id];
                break;
            case MetricEvent::Type::TimedOut:
                ++s.events.timeouts;
                ++s.contention[e.scope_id];
                break;
            case MetricEvent::Type::StaleReclaimed:
                ++s.events.stale_reclaims;
                ++s.stale_reclaims[e.scope_id];
                break;
        }
    }

    s.total_operations = s.events.acquires;
    s.acquisition = distributionOf(std::move(all));
    for (auto& [type, samples] : byType) s.by_scope_type[type] = distributionOf(std::move(samples));

    s.top_operations.assign(verbs.begin(), verbs.end());
    std::ranges::sort(s.top_operations, [](const auto& a, const auto& b) {
        return a.second != b.second ? a.second > b.second : a.first < b.first;
    });
    if (s.top_operations.size() > topN) s.top_operations.resize(topN);

    return s;
}

void wtc::metrics::to_json(nlohmann::json& j, const Distribution& d) {
    j = {
        {"count", d.count},
        {"avg_ms", d.avg_ms},
        {"p50_ms", d.p50_ms},
        {"p95_ms", d.p95_ms},
        {"p99_ms", d.p99_ms},
        {"max_ms", d.max_ms}
    };
}

void wtc::metrics::to_json(nlohmann::json& j, const EventCounts& e) {
    j = {
        {"acquires", e.acquires},
        {"releases", e.releases},
        {"waits", e.waits},
        {"timeouts", e.timeouts},
        {"stale_removals", e.stale_reclaims}
    };
}

void wtc::metrics::to_json(nlohmann::json& j, const Summary& s) {
    auto top = nlohmann::json::array();
    for (const auto& [verb, count] : s.top_operations) top.push_back({{"verb", verb}, {"count", count}});

    j = {
        {"generated_at_ms", s.generated_at_ms},
        {"total_operations", s.total_operations},
        {"acquisition_stats", s.acquisition},
        {"by_scope_type", s.by_scope_type},
        {"scope_distribution", s.scope_distribution},
        {"events", s.events},
        {"contention", s.contention},
        {"stale_reclaims", s.stale_reclaims},
        {"top_operations", top},
        {"predictor", {{"hits", s.predictor_hits}, {"misfires", s.predictor_misfires}}}
    };
}
