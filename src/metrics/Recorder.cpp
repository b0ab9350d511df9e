#include "metrics/Recorder.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace wtc::metrics;
using namespace wtc::types;

Recorder::Recorder(config::MetricsConfig cfg)
    : AsyncService("MetricsRecorder"), cfg_(std::move(cfg)) {}

Recorder::~Recorder() { stop(); }

void Recorder::record(const MetricEvent& event) {
    std::scoped_lock lock(bufferMutex_);
    buffer_.push_back(event);
}

size_t Recorder::pendingCount() const {
    std::scoped_lock lock(bufferMutex_);
    return buffer_.size();
}

void Recorder::start() {
    if (isRunning()) return;
    loadLog();
    AsyncService::start();
}

void Recorder::stop() {
    const bool started = worker_.joinable();
    AsyncService::stop();
    if (started) flush();
}

void Recorder::runLoop() {
    while (!shouldStop()) {
        lazySleep(cfg_.flush_interval);
        flush();
    }
}

int64_t Recorder::retentionCutoff() const {
    return epochMillisNow() - std::chrono::duration_cast<std::chrono::milliseconds>(cfg_.retention_days).count();
}

void Recorder::loadLog() {
    if (cfg_.log_file.empty() || !std::filesystem::exists(cfg_.log_file)) return;

    std::ifstream in(cfg_.log_file);
    if (!in) {
        log::Registry::metrics()->warn("[MetricsRecorder] Unable to read metrics log {}", cfg_.log_file.string());
        return;
    }

    const auto cutoff = retentionCutoff();
    size_t loaded = 0, dropped = 0;
    std::deque<MetricEvent> events;

    std::string line;
    while (std::getline(in, line)) {
        if (line.empty()) continue;
        const auto e = MetricEvent::fromCsvLine(line);
        if (!e || e->timestamp_ms < cutoff) {
            ++dropped;
            continue;
        }
        events.push_back(*e);
        ++loaded;
    }

    std::scoped_lock lock(retainedMutex_);
    retained_ = std::move(events);
    rewriteLog_ = dropped > 0;
    log::Registry::metrics()->debug("[MetricsRecorder] Loaded {} retained events ({} expired or malformed)",
                                    loaded, dropped);
}

void Recorder::flush() {
    std::scoped_lock flushLock(flushMutex_);

    std::vector<MetricEvent> fresh;
    {
        std::scoped_lock lock(bufferMutex_);
        fresh.swap(buffer_);
    }

    bool rewrite = false;
    {
        std::scoped_lock lock(retainedMutex_);
        retained_.insert(retained_.end(), fresh.begin(), fresh.end());

        const auto cutoff = retentionCutoff();
        while (!retained_.empty() && retained_.front().timestamp_ms < cutoff) {
            retained_.pop_front();
            rewriteLog_ = true;
        }
        rewrite = rewriteLog_;
        rewriteLog_ = false;
    }

    if (!fresh.empty() || rewrite) writeLog(fresh, rewrite);
    writeSummary(summary());
}

void Recorder::writeLog(const std::vector<MetricEvent>& fresh, const bool rewrite) {
    if (cfg_.log_file.empty()) return;

    try {
        if (cfg_.log_file.has_parent_path()) std::filesystem::create_directories(cfg_.log_file.parent_path());

        if (!rewrite) {
            std::ofstream out(cfg_.log_file, std::ios::app);
            if (!out) throw std::runtime_error("cannot open for append");
            for (const auto& e : fresh) out << e.toCsvLine() << '\n';
            return;
        }

        std::vector<MetricEvent> snapshot;
        {
            std::scoped_lock lock(retainedMutex_);
            snapshot.assign(retained_.begin(), retained_.end());
        }

        const auto tmp = cfg_.log_file.string() + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) throw std::runtime_error("cannot open " + tmp);
            for (const auto& e : snapshot) out << e.toCsvLine() << '\n';
        }
        std::filesystem::rename(tmp, cfg_.log_file);
    } catch (const std::exception& e) {
        log::Registry::metrics()->warn("[MetricsRecorder] Failed to write metrics log {}: {}",
                                       cfg_.log_file.string(), e.what());
        // retry the full rewrite on the next flush
        if (rewrite) {
            std::scoped_lock lock(retainedMutex_);
            rewriteLog_ = true;
        }
    }
}

void Recorder::writeSummary(const Summary& s) const {
    if (cfg_.summary_file.empty()) return;

    try {
        if (cfg_.summary_file.has_parent_path()) std::filesystem::create_directories(cfg_.summary_file.parent_path());
        const auto tmp = cfg_.summary_file.string() + ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) throw std::runtime_error("cannot open " + tmp);
            out << nlohmann::json(s).dump(2) << '\n';
        }
        std::filesystem::rename(tmp, cfg_.summary_file);
    } catch (const std::exception& e) {
        log::Registry::metrics()->warn("[MetricsRecorder] Failed to write summary {}: {}",
                                       cfg_.summary_file.string(), e.what());
    }
}

Summary Recorder::summary() const {
    std::vector<MetricEvent> events;
    {
        std::scoped_lock lock(retainedMutex_);
        events.assign(retained_.begin(), retained_.end());
    }
    {
        std::scoped_lock lock(bufferMutex_);
        events.insert(events.end(), buffer_.begin(), buffer_.end());
    }

    auto s = computeSummary(events);
    s.predictor_hits = predictorHits_.load(std::memory_order_relaxed);
    s.predictor_misfires = predictorMisfires_.load(std::memory_order_relaxed);
    return s;
}
