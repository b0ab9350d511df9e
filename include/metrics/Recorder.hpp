#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "coord/EventSink.hpp"
#include "metrics/Summary.hpp"

#include <atomic>
#include <deque>
#include <mutex>
#include <vector>

namespace wtc::metrics {

/**
 * Recorder - buffers lock events and persists them off the hot path.
 *
 * record() only appends to an in-memory buffer. The flusher thread drains the
 * buffer every flush_interval into the CSV log, drops events older than the
 * retention window and rewrites the summary JSON file. Storage failures are
 * logged and otherwise ignored.
 */
class Recorder final : public coord::EventSink, public concurrency::AsyncService {
public:
    explicit Recorder(config::MetricsConfig cfg);
    ~Recorder() override;

    void record(const types::MetricEvent& event) override;

    void recordPredictorHit() { predictorHits_.fetch_add(1, std::memory_order_relaxed); }
    void recordPredictorMisfire() { predictorMisfires_.fetch_add(1, std::memory_order_relaxed); }

    // Loads the retained tail of the existing log before the flusher starts.
    void start() override;
    void stop() override;

    // Synchronous flush, also run once more on stop().
    void flush();

    [[nodiscard]] Summary summary() const;

    [[nodiscard]] size_t pendingCount() const;

protected:
    void runLoop() override;

private:
    config::MetricsConfig cfg_;

    mutable std::mutex bufferMutex_;
    std::vector<types::MetricEvent> buffer_;

    mutable std::mutex retainedMutex_;
    std::deque<types::MetricEvent> retained_;
    bool rewriteLog_ = false;

    std::mutex flushMutex_;

    std::atomic<uint64_t> predictorHits_{0};
    std::atomic<uint64_t> predictorMisfires_{0};

    void loadLog();
    [[nodiscard]] int64_t retentionCutoff() const;
    void writeLog(const std::vector<types::MetricEvent>& fresh, bool rewrite);
    void writeSummary(const Summary& s) const;
};

}
