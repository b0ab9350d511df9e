#pragma once

#include "concurrency/AsyncService.hpp"
#include "config/Config.hpp"
#include "types/Scope.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace wtc::predict {

struct ScopeHint {
    types::ScopeRequirement scope;
    std::string verb;
    double confidence = 0.0;
};

struct PatternEntry {
    std::vector<std::string> antecedent;
    std::string successor;
    uint64_t observed_count = 0;
    double confidence = 0.0;
};

/**
 * PatternPredictor - learns which verb tends to follow a run of N verbs.
 *
 * Completed operations arrive through observe(), which only enqueues. The
 * learner thread keeps a short per-caller history and feeds every full window
 * to learn(). Each learned observation is appended to the pattern log as
 * "antecedent<TAB>successor" (antecedent verbs space separated) and the log
 * is replayed on start.
 */
class PatternPredictor final : public concurrency::AsyncService {
public:
    explicit PatternPredictor(config::PredictorConfig cfg);
    ~PatternPredictor() override;

    void start() override;

    // The last verb is the successor of the N verbs before it.
    void learn(const std::vector<std::string>& sequence);

    void observe(const std::string& callerId, const std::string& verb);

    // Hint for the verb most likely to follow the last N verbs of recent.
    [[nodiscard]] std::optional<ScopeHint> predict(const std::vector<std::string>& recent,
                                                   const std::string& target) const;

    [[nodiscard]] std::vector<PatternEntry> patternsFor(const std::vector<std::string>& antecedent) const;
    [[nodiscard]] size_t antecedentCount() const;
    [[nodiscard]] unsigned int sequenceLength() const noexcept { return cfg_.sequence_length; }
    [[nodiscard]] double threshold() const noexcept { return cfg_.confidence_threshold; }

    // Blocks until every observation queued so far has been learned.
    void drain();

protected:
    void runLoop() override;
    void onStop() override;

private:
    struct Successors {
        std::map<std::string, uint64_t> counts;
        uint64_t total = 0;
    };

    config::PredictorConfig cfg_;

    mutable std::shared_mutex tableMutex_;
    std::unordered_map<std::string, Successors> table_;

    std::mutex queueMutex_;
    std::condition_variable queueCv_, idleCv_;
    std::deque<std::pair<std::string, std::string>> pending_;
    bool busy_ = false;

    // learner-thread only
    std::unordered_map<std::string, std::deque<std::string>> history_;

    std::mutex logMutex_;

    void process(const std::deque<std::pair<std::string, std::string>>& batch);
    void apply(const std::string& key, const std::string& successor);
    void append(const std::string& key, const std::string& successor);
    void replay();

    static std::string keyOf(std::vector<std::string>::const_iterator first,
                             std::vector<std::string>::const_iterator last);
};

}
