#include "predict/PatternPredictor.hpp"
#include "coord/ScopeResolver.hpp"
#include "log/Registry.hpp"

#include <fstream>
#include <sstream>

using namespace wtc::predict;
using namespace std::chrono_literals;

PatternPredictor::PatternPredictor(config::PredictorConfig cfg)
    : AsyncService("PatternPredictor"), cfg_(std::move(cfg)) {}

PatternPredictor::~PatternPredictor() { stop(); }

std::string PatternPredictor::keyOf(const std::vector<std::string>::const_iterator first,
                                    const std::vector<std::string>::const_iterator last) {
    std::string key;
    for (auto it = first; it != last; ++it) {
        if (!key.empty()) key += ' ';
        key += *it;
    }
    return key;
}

void PatternPredictor::start() {
    if (isRunning()) return;
    replay();
    AsyncService::start();
}

void PatternPredictor::replay() {
    if (cfg_.patterns_file.empty() || !std::filesystem::exists(cfg_.patterns_file)) return;

    std::ifstream in(cfg_.patterns_file);
    if (!in) {
        log::Registry::predictor()->warn("[PatternPredictor] Unable to read pattern log {}",
                                         cfg_.patterns_file.string());
        return;
    }

    size_t n = 0;
    std::string line;
    while (std::getline(in, line)) {
        const auto tab = line.find('\t');
        if (tab == std::string::npos || tab == 0 || tab + 1 >= line.size()) continue;

        // only windows of the configured length are meaningful
        const auto key = line.substr(0, tab);
        std::istringstream words(key);
        unsigned int len = 0;
        for (std::string w; words >> w;) ++len;
        if (len != cfg_.sequence_length) continue;

        apply(key, line.substr(tab + 1));
        ++n;
    }

    log::Registry::predictor()->info("[PatternPredictor] Replayed {} observations into {} antecedents",
                                     n, antecedentCount());
}

void PatternPredictor::learn(const std::vector<std::string>& sequence) {
    const auto n = cfg_.sequence_length;
    if (sequence.size() < n + 1) return;

    const auto last = std::prev(sequence.end());
    const auto key = keyOf(last - n, last);
    apply(key, *last);
    append(key, *last);
}

void PatternPredictor::apply(const std::string& key, const std::string& successor) {
    std::unique_lock lock(tableMutex_);
    auto& s = table_[key];
    ++s.counts[successor];
    ++s.total;
}

void PatternPredictor::append(const std::string& key, const std::string& successor) {
    if (cfg_.patterns_file.empty()) return;

    std::scoped_lock lock(logMutex_);
    try {
        if (cfg_.patterns_file.has_parent_path())
            std::filesystem::create_directories(cfg_.patterns_file.parent_path());
        std::ofstream out(cfg_.patterns_file, std::ios::app);
        if (!out) throw std::runtime_error("cannot open for append");
        out << key << '\t' << successor << '\n';
    } catch (const std::exception& e) {
        log::Registry::predictor()->warn("[PatternPredictor] Failed to persist pattern to {}: {}",
                                         cfg_.patterns_file.string(), e.what());
    }
}

void PatternPredictor::observe(const std::string& callerId, const std::string& verb) {
    {
        std::scoped_lock lock(queueMutex_);
        pending_.emplace_back(callerId, verb);
    }
    queueCv_.notify_one();
}

void PatternPredictor::runLoop() {
    while (!shouldStop()) {
        std::deque<std::pair<std::string, std::string>> batch;
        {
            std::unique_lock lock(queueMutex_);
            queueCv_.wait_for(lock, 500ms, [this] { return !pending_.empty() || shouldStop(); });
            batch.swap(pending_);
            busy_ = !batch.empty();
        }

        if (!batch.empty()) {
            try {
                process(batch);
            } catch (const std::exception& e) {
                log::Registry::predictor()->warn("[PatternPredictor] Dropped {} observations: {}",
                                                 batch.size(), e.what());
            }
        }

        {
            std::scoped_lock lock(queueMutex_);
            busy_ = false;
        }
        idleCv_.notify_all();
    }
}

void PatternPredictor::onStop() {
    queueCv_.notify_all();
}

void PatternPredictor::process(const std::deque<std::pair<std::string, std::string>>& batch) {
    const size_t window = cfg_.sequence_length + 1;
    for (const auto& [caller, verb] : batch) {
        auto& h = history_[caller];
        h.push_back(verb);
        while (h.size() > window) h.pop_front();
        if (h.size() == window) learn(std::vector<std::string>(h.begin(), h.end()));
    }
}

void PatternPredictor::drain() {
    if (!isRunning()) {
        std::deque<std::pair<std::string, std::string>> batch;
        {
            std::scoped_lock lock(queueMutex_);
            batch.swap(pending_);
        }
        process(batch);
        return;
    }

    std::unique_lock lock(queueMutex_);
    queueCv_.notify_one();
    idleCv_.wait(lock, [this] { return (pending_.empty() && !busy_) || !isRunning(); });
}

std::optional<ScopeHint> PatternPredictor::predict(const std::vector<std::string>& recent,
                                                   const std::string& target) const {
    if (!cfg_.enabled) return std::nullopt;

    const auto n = cfg_.sequence_length;
    if (recent.size() < n) return std::nullopt;
    const auto key = keyOf(recent.end() - n, recent.end());

    std::string best;
    uint64_t bestCount = 0, total = 0;
    {
        std::shared_lock lock(tableMutex_);
        const auto it = table_.find(key);
        if (it == table_.end() || it->second.total == 0) return std::nullopt;
        total = it->second.total;
        // map order breaks ties alphabetically
        for (const auto& [verb, count] : it->second.counts)
            if (count > bestCount) { best = verb; bestCount = count; }
    }

    const double confidence = static_cast<double>(bestCount) / static_cast<double>(total);
    if (confidence < cfg_.confidence_threshold) return std::nullopt;

    return ScopeHint{coord::ScopeResolver::resolve(best, target), best, confidence};
}

std::vector<PatternEntry> PatternPredictor::patternsFor(const std::vector<std::string>& antecedent) const {
    std::vector<PatternEntry> out;
    std::shared_lock lock(tableMutex_);
    const auto it = table_.find(keyOf(antecedent.begin(), antecedent.end()));
    if (it == table_.end()) return out;

    for (const auto& [verb, count] : it->second.counts)
        out.push_back({antecedent, verb, count,
                       static_cast<double>(count) / static_cast<double>(it->second.total)});
    return out;
}

size_t PatternPredictor::antecedentCount() const {
    std::shared_lock lock(tableMutex_);
    return table_.size();
}
