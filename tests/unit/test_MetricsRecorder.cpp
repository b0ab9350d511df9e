#include <gtest/gtest.h>
#include "metrics/Recorder.hpp"
#include "metrics/Summary.hpp"
#include "TestEnv.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

using namespace wtc;
using namespace wtc::metrics;
using namespace wtc::types;
using Type = MetricEvent::Type;

namespace {

std::vector<std::string> readLines(const std::filesystem::path& path) {
    std::vector<std::string> lines;
    std::ifstream in(path);
    for (std::string line; std::getline(in, line);)
        if (!line.empty()) lines.push_back(line);
    return lines;
}

}

class MetricsRecorderTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    config::MetricsConfig cfg;

    void SetUp() override {
        dir = test::scratchDir("metrics");
        cfg.log_file = dir / "metrics.csv";
        cfg.summary_file = dir / "metrics-summary.json";
        cfg.flush_interval = std::chrono::milliseconds(50);
    }

    void TearDown() override { std::filesystem::remove_all(dir); }
};

TEST(SummaryTest, NearestRankPercentilesOverOneToHundred) {
    std::vector<MetricEvent> events;
    for (uint64_t ms = 100; ms >= 1; --ms)
        events.push_back(MetricEvent::now(Type::Acquired, "worktree:a", ms, "commit"));

    const auto s = computeSummary(events);
    EXPECT_EQ(s.acquisition.count, 100u);
    EXPECT_EQ(s.acquisition.p50_ms, 50u);
    EXPECT_EQ(s.acquisition.p95_ms, 95u);
    EXPECT_EQ(s.acquisition.p99_ms, 99u);
    EXPECT_EQ(s.acquisition.max_ms, 100u);
    EXPECT_DOUBLE_EQ(s.acquisition.avg_ms, 50.5);
    EXPECT_EQ(s.total_operations, 100u);
}

TEST(SummaryTest, NearestRankEdges) {
    EXPECT_EQ(nearestRank({}, 50), 0u);
    EXPECT_EQ(nearestRank({7}, 99), 7u);
    EXPECT_EQ(nearestRank({1, 2}, 50), 1u);
    EXPECT_EQ(nearestRank({1, 2}, 51), 2u);
}

TEST(SummaryTest, CountsContentionReclaimsAndTopVerbs) {
    std::vector<MetricEvent> events = {
        MetricEvent::now(Type::Acquired, "global", 30, "merge"),
        MetricEvent::now(Type::Acquired, "worktree:a", 10, "commit"),
        MetricEvent::now(Type::Acquired, "worktree:b", 20, "commit"),
        MetricEvent::now(Type::Released, "worktree:a", 5, "commit"),
        MetricEvent::now(Type::Waited, "worktree:a", 0, "status"),
        MetricEvent::now(Type::TimedOut, "worktree:a", 100, "status"),
        MetricEvent::now(Type::StaleReclaimed, "worktree:b", 9000, "commit"),
    };

    const auto s = computeSummary(events);
    EXPECT_EQ(s.events.acquires, 3u);
    EXPECT_EQ(s.events.releases, 1u);
    EXPECT_EQ(s.events.waits, 1u);
    EXPECT_EQ(s.events.timeouts, 1u);
    EXPECT_EQ(s.events.stale_reclaims, 1u);
    EXPECT_EQ(s.contention.at("worktree:a"), 2u);
    EXPECT_EQ(s.stale_reclaims.at("worktree:b"), 1u);
    EXPECT_EQ(s.scope_distribution.at("worktree"), 2u);
    EXPECT_EQ(s.scope_distribution.at("global"), 1u);
    EXPECT_EQ(s.by_scope_type.at("global").max_ms, 30u);
    ASSERT_FALSE(s.top_operations.empty());
    EXPECT_EQ(s.top_operations.front().first, "commit");
    EXPECT_EQ(s.top_operations.front().second, 2u);

    const nlohmann::json j = s;
    EXPECT_EQ(j["events"]["stale_removals"], 1);
    EXPECT_EQ(j["acquisition_stats"]["count"], 3);
    EXPECT_EQ(j["top_operations"][0]["verb"], "commit");
}

TEST(MetricEventTest, CsvLineFormat) {
    MetricEvent e{1700000000000, Type::TimedOut, "worktree:a", 250, "commit, amend"};
    EXPECT_EQ(e.toCsvLine(), "1700000000000,timed_out,worktree:a,250,commit  amend");

    const auto parsed = MetricEvent::fromCsvLine("1700000000000,stale_reclaimed,global,12,merge");
    ASSERT_TRUE(parsed);
    EXPECT_EQ(parsed->type, Type::StaleReclaimed);
    EXPECT_EQ(parsed->scope_id, "global");
    EXPECT_EQ(parsed->duration_ms, 12u);
    EXPECT_EQ(parsed->verb, "merge");

    EXPECT_FALSE(MetricEvent::fromCsvLine("garbage"));
    EXPECT_FALSE(MetricEvent::fromCsvLine("1,not_an_event,global,1,merge"));
}

TEST_F(MetricsRecorderTest, FlushAppendsCsvAndWritesSummary) {
    Recorder rec(cfg);
    rec.record(MetricEvent::now(Type::Acquired, "worktree:a", 12, "commit"));
    rec.record(MetricEvent::now(Type::Released, "worktree:a", 40, "commit"));
    EXPECT_EQ(rec.pendingCount(), 2u);

    rec.flush();
    EXPECT_EQ(rec.pendingCount(), 0u);

    const auto lines = readLines(cfg.log_file);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(",acquired,worktree:a,12,commit"), std::string::npos);
    EXPECT_NE(lines[1].find(",released,worktree:a,40,commit"), std::string::npos);

    rec.record(MetricEvent::now(Type::Waited, "worktree:a", 0, "status"));
    rec.flush();
    EXPECT_EQ(readLines(cfg.log_file).size(), 3u);

    std::ifstream in(cfg.summary_file);
    ASSERT_TRUE(in.good());
    const auto summary = nlohmann::json::parse(in);
    EXPECT_EQ(summary["total_operations"], 1);
    EXPECT_EQ(summary["events"]["waits"], 1);
    EXPECT_EQ(summary["contention"]["worktree:a"], 1);
}

TEST_F(MetricsRecorderTest, RetentionDropsOldEventsOnLoad) {
    const auto old = epochMillisNow() - std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::days(8)).count();
    {
        std::ofstream out(cfg.log_file);
        out << MetricEvent{old, Type::Acquired, "worktree:a", 5, "commit"}.toCsvLine() << '\n';
        out << MetricEvent{epochMillisNow(), Type::Acquired, "worktree:b", 7, "status"}.toCsvLine() << '\n';
        out << "not,a,valid\n";
    }

    Recorder rec(cfg);
    rec.start();
    rec.stop();

    EXPECT_EQ(rec.summary().total_operations, 1u);
    const auto lines = readLines(cfg.log_file);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("worktree:b"), std::string::npos);
}

TEST_F(MetricsRecorderTest, BackgroundFlusherPersistsEvents) {
    Recorder rec(cfg);
    rec.start();
    rec.record(MetricEvent::now(Type::Acquired, "global", 3, "fetch"));

    EXPECT_TRUE(test::waitFor([&] { return readLines(cfg.log_file).size() == 1; }));
    rec.stop();
}

TEST_F(MetricsRecorderTest, PredictorCountersShowInSummary) {
    Recorder rec(cfg);
    rec.recordPredictorHit();
    rec.recordPredictorHit();
    rec.recordPredictorMisfire();

    const auto s = rec.summary();
    EXPECT_EQ(s.predictor_hits, 2u);
    EXPECT_EQ(s.predictor_misfires, 1u);
    EXPECT_EQ(nlohmann::json(s)["predictor"]["hits"], 2);
}

TEST_F(MetricsRecorderTest, UnwritableLogDoesNotThrow) {
    cfg.log_file = "/proc/wtc-does-not-exist/metrics.csv";
    cfg.summary_file = "/proc/wtc-does-not-exist/summary.json";
    Recorder rec(cfg);
    rec.record(MetricEvent::now(Type::Acquired, "global", 1, "fetch"));
    EXPECT_NO_THROW(rec.flush());
    EXPECT_EQ(rec.summary().total_operations, 1u);
}
