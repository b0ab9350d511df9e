#include <gtest/gtest.h>
#include "sched/PriorityScheduler.hpp"
#include "coord/LockRegistry.hpp"
#include "coord/errors.hpp"
#include "metrics/Recorder.hpp"
#include "predict/PatternPredictor.hpp"
#include "TestEnv.hpp"

#include <future>
#include <thread>

using namespace wtc;
using namespace wtc::sched;
using namespace wtc::coord;
using namespace wtc::types;
using namespace std::chrono;
using Status = OperationResult::Status;

namespace {

// Body that blocks until open() is called.
class Gate {
public:
    OperationBody body() {
        return [this](const Lock&) {
            entered_ = true;
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this] { return open_; });
            return 0;
        };
    }

    void open() {
        {
            std::scoped_lock lock(mutex_);
            open_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool entered() const { return entered_; }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool open_ = false;
    std::atomic<bool> entered_{false};
};

OperationBody sleeping(const milliseconds d, const int exitCode = 0) {
    return [d, exitCode](const Lock&) {
        std::this_thread::sleep_for(d);
        return exitCode;
    };
}

}

class PrioritySchedulerTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    config::Config cfg;
    std::shared_ptr<test::CollectingSink> sink = std::make_shared<test::CollectingSink>();
    std::shared_ptr<LockRegistry> registry;
    std::shared_ptr<metrics::Recorder> recorder;
    std::shared_ptr<predict::PatternPredictor> predictor;
    std::unique_ptr<PriorityScheduler> scheduler;

    void SetUp() override {
        dir = test::scratchDir("sched");
        cfg = test::makeConfig(dir);
    }

    void TearDown() override {
        if (scheduler) scheduler->stop();
        std::filesystem::remove_all(dir);
    }

    void startScheduler(const bool withPredictor = false) {
        registry = std::make_shared<LockRegistry>(cfg.coordinator.stale_ttl, cfg.backoff,
                                                  std::make_shared<ProcessProbe>(), sink);
        recorder = std::make_shared<metrics::Recorder>(cfg.metrics);
        if (withPredictor) predictor = std::make_shared<predict::PatternPredictor>(cfg.predictor);
        scheduler = std::make_unique<PriorityScheduler>(cfg, registry, predictor, recorder);
        scheduler->start();
    }

    std::future<OperationResult> submit(const std::string& verb, const std::string& target,
                                        const int priority, OperationBody body,
                                        const std::string& caller = "tester") const {
        return scheduler->submit(makeRequest(verb, target, priority, caller), std::move(body));
    }

    // Occupies every scope until the gate opens.
    std::future<OperationResult> blockWithGlobal(Gate& gate) const {
        auto f = submit("fetch", "", 5, gate.body(), "blocker");
        EXPECT_TRUE(test::waitFor([&] { return gate.entered(); }));
        return f;
    }

    static OperationResult await(std::future<OperationResult>& f, const seconds timeout = seconds(10)) {
        EXPECT_EQ(f.wait_for(timeout), std::future_status::ready);
        return f.get();
    }
};

TEST(QueueEntryTest, AgingRaisesEffectivePriorityUpToCap) {
    QueueEntry e;
    e.request.priority = 1;
    const auto now = Clock::now();
    e.enqueue_time = now - seconds(12);

    EXPECT_EQ(e.effectivePriority(now, seconds(5)), 3);
    e.boost = 2;
    EXPECT_EQ(e.effectivePriority(now, seconds(5)), 5);
    e.enqueue_time = now - seconds(600);
    EXPECT_EQ(e.effectivePriority(now, seconds(5)), OperationRequest::MAX_PRIORITY);
}

TEST(QueueEntryTest, OrderPrefersPriorityThenAge) {
    const auto now = Clock::now();
    auto older = std::make_shared<QueueEntry>();
    older->request.priority = 5;
    older->enqueue_time = now - milliseconds(10);
    older->sequence = 1;

    auto newer = std::make_shared<QueueEntry>();
    newer->request.priority = 5;
    newer->enqueue_time = now;
    newer->sequence = 2;

    auto urgent = std::make_shared<QueueEntry>();
    urgent->request.priority = 9;
    urgent->enqueue_time = now;
    urgent->sequence = 3;

    const EntryOrder order{now, seconds(5)};
    EXPECT_TRUE(order(newer, older));
    EXPECT_FALSE(order(older, newer));
    EXPECT_TRUE(order(older, urgent));
}

TEST_F(PrioritySchedulerTest, SubmitBeforeStartIsUnavailable) {
    registry = std::make_shared<LockRegistry>(cfg.coordinator.stale_ttl, cfg.backoff);
    PriorityScheduler idle(cfg, registry);
    EXPECT_THROW(idle.submit(makeRequest("commit", "a", 5, "c"), sleeping(milliseconds(1))), SchedulerUnavailable);
}

TEST_F(PrioritySchedulerTest, RunsBodyUnderLockAndReleases) {
    startScheduler();
    std::string seenScope;
    auto f = submit("commit", "wt1", 5, [&](const Lock& l) {
        seenScope = l.scope_id;
        return 7;
    });

    const auto r = await(f);
    EXPECT_EQ(r.status, Status::Success);
    EXPECT_EQ(r.exit_code, 7);
    EXPECT_EQ(r.scope_used, "worktree:wt1");
    EXPECT_EQ(seenScope, "worktree:wt1");
    EXPECT_EQ(registry->heldCount(), 0u);
    EXPECT_EQ(sink->count(MetricEvent::Type::Acquired), 1u);
    EXPECT_EQ(sink->count(MetricEvent::Type::Released), 1u);
}

TEST_F(PrioritySchedulerTest, HigherPriorityDispatchesFirst) {
    cfg.coordinator.worker_slots = 1;
    startScheduler();

    Gate gate;
    auto blocker = blockWithGlobal(gate);

    std::mutex m;
    std::vector<std::string> order;
    auto record = [&](const std::string& name) {
        return [&, name](const Lock&) {
            std::scoped_lock lock(m);
            order.push_back(name);
            return 0;
        };
    };

    auto low = submit("commit", "a", 1, record("low"));
    auto high = submit("commit", "b", 9, record("high"));
    auto mid = submit("commit", "c", 5, record("mid"));
    auto mid2 = submit("commit", "d", 5, record("mid2"));

    EXPECT_EQ(scheduler->queueDepth(), 4u);
    gate.open();

    for (auto* f : {&blocker, &low, &high, &mid, &mid2}) EXPECT_EQ(await(*f).status, Status::Success);
    EXPECT_EQ(order, (std::vector<std::string>{"high", "mid", "mid2", "low"}));
}

TEST_F(PrioritySchedulerTest, PriorityIsClamped) {
    cfg.coordinator.worker_slots = 1;
    startScheduler();
    Gate gate;
    auto blocker = blockWithGlobal(gate);

    auto f = submit("commit", "a", 42, sleeping(milliseconds(1)));
    const auto snap = scheduler->snapshot();
    ASSERT_EQ(snap.queued.size(), 1u);
    EXPECT_EQ(snap.queued[0].priority, OperationRequest::MAX_PRIORITY);
    ASSERT_EQ(snap.running.size(), 1u);
    EXPECT_EQ(snap.running[0].verb, "fetch");

    gate.open();
    EXPECT_EQ(await(f).status, Status::Success);
    EXPECT_EQ(await(blocker).status, Status::Success);
}

// Scenario A
TEST_F(PrioritySchedulerTest, DistinctWorktreesRunInParallel) {
    startScheduler();
    constexpr int N = 11;
    constexpr auto work = milliseconds(300);

    const auto start = steady_clock::now();
    std::vector<std::future<OperationResult>> futures;
    for (int i = 0; i < N; ++i)
        futures.push_back(submit("commit", "wt" + std::to_string(i), 10, sleeping(work), "agent-" + std::to_string(i)));

    for (auto& f : futures) EXPECT_EQ(await(f).status, Status::Success);
    const auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);

    EXPECT_LT(elapsed, work * 4) << "operations were serialized";
    EXPECT_EQ(registry->heldCount(), 0u);
}

TEST_F(PrioritySchedulerTest, SameWorktreeIsSerialized) {
    startScheduler();
    std::atomic<int> concurrent{0}, peak{0};
    auto body = [&](const Lock&) {
        const int now = ++concurrent;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}
        std::this_thread::sleep_for(milliseconds(50));
        --concurrent;
        return 0;
    };

    std::vector<std::future<OperationResult>> futures;
    for (int i = 0; i < 4; ++i) futures.push_back(submit("commit", "same", 5, body, "agent-" + std::to_string(i)));
    for (auto& f : futures) EXPECT_EQ(await(f).status, Status::Success);
    EXPECT_EQ(peak.load(), 1);
}

// Scenario B
TEST_F(PrioritySchedulerTest, GlobalWaitsForHeldWorktreesAndBlocksNewOnes) {
    startScheduler();
    std::vector<Lock> held;
    for (const auto* id : {"a", "b", "c"}) {
        auto l = registry->tryAcquireNow(ScopeRequirement::forWorktree(id), std::string("ext-") + id,
                                         std::string("ext-") + id, "commit", 0, false);
        ASSERT_TRUE(l);
        held.push_back(*l);
    }

    std::atomic<int64_t> mergeEnd{0}, commitStart{0};
    auto merge = submit("merge", "", 5, [&](const Lock&) {
        mergeEnd = steady_clock::now().time_since_epoch().count();
        return 0;
    }, "merger");

    ASSERT_TRUE(test::waitFor([&] { return registry->isDraining(); }));
    EXPECT_TRUE(scheduler->snapshot().draining);

    auto commit = submit("commit", "d", 10, [&](const Lock&) {
        commitStart = steady_clock::now().time_since_epoch().count();
        return 0;
    }, "committer");

    std::this_thread::sleep_for(milliseconds(100));
    EXPECT_EQ(mergeEnd.load(), 0);
    EXPECT_EQ(commitStart.load(), 0);
    EXPECT_FALSE(registry->isAvailable(ScopeRequirement::forWorktree("d")));

    for (const auto& l : held) EXPECT_TRUE(registry->release(l));

    EXPECT_EQ(await(merge).status, Status::Success);
    EXPECT_EQ(await(commit).status, Status::Success);
    EXPECT_LE(mergeEnd.load(), commitStart.load());
}

// Scenario C
TEST_F(PrioritySchedulerTest, PredictedSuccessorIsPreAcquiredAndAdopted) {
    cfg.predictor.sequence_length = 1;
    cfg.predictor.grace_window = seconds(5);
    startScheduler(true);
    for (int i = 0; i < 20; ++i) predictor->learn({"checkout", "status"});

    auto checkout = submit("checkout", "wt1", 5, sleeping(milliseconds(1)), "agent");
    EXPECT_EQ(await(checkout).status, Status::Success);

    const auto advisory = registry->holderOf("worktree:wt1");
    ASSERT_TRUE(advisory);
    EXPECT_TRUE(advisory->advisory);
    EXPECT_EQ(advisory->holder_id, advisoryHolderFor("agent"));

    // someone else cannot take the scope without voiding the hint first
    EXPECT_FALSE(registry->isAvailable(ScopeRequirement::forWorktree("wt1")));

    std::string holder;
    const auto req = makeRequest("status", "wt1", 5, "agent");
    auto status = scheduler->submit(req, [&](const Lock& l) {
        holder = l.holder_id;
        return 0;
    });
    const auto r = await(status);
    EXPECT_EQ(r.status, Status::Success);
    EXPECT_EQ(holder, req.id);
    EXPECT_EQ(recorder->summary().predictor_hits, 1u);
    EXPECT_EQ(recorder->summary().predictor_misfires, 0u);
}

TEST_F(PrioritySchedulerTest, LearnedCycleIsPreAcquiredAtDefaultWindow) {
    startScheduler(true);
    ASSERT_EQ(predictor->sequenceLength(), 2u);

    for (int i = 0; i < 20; ++i) {
        for (const auto* verb : {"checkout", "status"}) {
            auto f = submit(verb, "wt1", 5, sleeping(milliseconds(1)), "agent");
            ASSERT_EQ(await(f).status, Status::Success);
        }
    }
    predictor->drain();

    const auto learned = predictor->patternsFor({"status", "checkout"});
    ASSERT_FALSE(learned.empty());
    EXPECT_EQ(learned[0].successor, "status");
    EXPECT_GE(learned[0].confidence, cfg.predictor.confidence_threshold);

    auto checkout = submit("checkout", "wt1", 5, sleeping(milliseconds(1)), "agent");
    EXPECT_EQ(await(checkout).status, Status::Success);

    const auto advisory = registry->holderOf("worktree:wt1");
    ASSERT_TRUE(advisory);
    EXPECT_TRUE(advisory->advisory);
    EXPECT_EQ(advisory->holder_id, advisoryHolderFor("agent"));

    const auto hitsBefore = recorder->summary().predictor_hits;
    auto status = submit("status", "wt1", 5, sleeping(milliseconds(1)), "agent");
    EXPECT_EQ(await(status).status, Status::Success);
    EXPECT_EQ(recorder->summary().predictor_hits, hitsBefore + 1);
}

TEST_F(PrioritySchedulerTest, UnusedAdvisoryExpiresAsMisfire) {
    cfg.predictor.sequence_length = 1;
    cfg.predictor.grace_window = milliseconds(100);
    startScheduler(true);
    for (int i = 0; i < 20; ++i) predictor->learn({"checkout", "status"});

    auto checkout = submit("checkout", "wt1", 5, sleeping(milliseconds(1)), "agent");
    EXPECT_EQ(await(checkout).status, Status::Success);

    EXPECT_TRUE(test::waitFor([&] { return !registry->holderOf("worktree:wt1"); }));
    EXPECT_EQ(recorder->summary().predictor_misfires, 1u);
    EXPECT_EQ(recorder->summary().predictor_hits, 0u);
}

TEST_F(PrioritySchedulerTest, AdvisoryYieldsToOtherCallers) {
    cfg.predictor.sequence_length = 1;
    cfg.predictor.grace_window = seconds(30);
    startScheduler(true);
    for (int i = 0; i < 20; ++i) predictor->learn({"checkout", "status"});

    auto checkout = submit("checkout", "wt1", 5, sleeping(milliseconds(1)), "agent");
    EXPECT_EQ(await(checkout).status, Status::Success);
    ASSERT_TRUE(registry->holderOf("worktree:wt1"));

    auto other = submit("commit", "wt1", 5, sleeping(milliseconds(1)), "someone-else");
    const auto r = await(other, seconds(3));
    EXPECT_EQ(r.status, Status::Success);
    EXPECT_LT(r.waited_ms, 1000u);
    EXPECT_EQ(recorder->summary().predictor_misfires, 1u);
}

TEST_F(PrioritySchedulerTest, CancelOnlyAffectsQueuedEntries) {
    cfg.coordinator.worker_slots = 1;
    startScheduler();
    Gate gate;
    const auto blockerReq = makeRequest("fetch", "", 5, "blocker");
    auto blocker = scheduler->submit(blockerReq, gate.body());
    ASSERT_TRUE(test::waitFor([&] { return gate.entered(); }));

    bool ran = false;
    const auto req = makeRequest("commit", "a", 5, "c");
    auto f = scheduler->submit(req, [&](const Lock&) { ran = true; return 0; });

    EXPECT_FALSE(scheduler->cancel(blockerReq.id));
    EXPECT_TRUE(scheduler->cancel(req.id));
    EXPECT_FALSE(scheduler->cancel(req.id));
    EXPECT_FALSE(scheduler->cancel("no-such-request"));

    const auto r = await(f);
    EXPECT_EQ(r.status, Status::Cancelled);

    gate.open();
    EXPECT_EQ(await(blocker).status, Status::Success);
    EXPECT_FALSE(ran);
}

TEST_F(PrioritySchedulerTest, TimesOutAfterOneBoostedRetry) {
    cfg.coordinator.acquire_timeout = seconds(1);
    startScheduler();

    const auto foreign = registry->tryAcquireNow(ScopeRequirement::forWorktree("a"), "foreign", "foreign",
                                                 "commit", 0, false);
    ASSERT_TRUE(foreign);

    bool ran = false;
    auto f = submit("commit", "a", 5, [&](const Lock&) { ran = true; return 0; });
    const auto r = await(f, seconds(10));

    EXPECT_EQ(r.status, Status::Timeout);
    EXPECT_EQ(r.scope_used, "worktree:a");
    EXPECT_EQ(r.holder, "foreign");
    EXPECT_GE(r.waited_ms, 2000u);
    EXPECT_FALSE(ran);
    EXPECT_EQ(sink->count(MetricEvent::Type::TimedOut), 2u);
    EXPECT_TRUE(registry->release(*foreign));
}

TEST_F(PrioritySchedulerTest, RequestTimeoutOverridesConfiguredOne) {
    startScheduler();
    const auto foreign = registry->tryAcquireNow(ScopeRequirement::forWorktree("a"), "foreign", "foreign",
                                                 "commit", 0, false);
    ASSERT_TRUE(foreign);

    auto req = makeRequest("commit", "a", 5, "impatient");
    req.acquire_timeout = milliseconds(200);
    auto f = scheduler->submit(req, sleeping(milliseconds(1)));
    const auto r = await(f, seconds(5));

    EXPECT_EQ(r.status, Status::Timeout);
    EXPECT_GE(r.waited_ms, 400u);
    EXPECT_LT(r.waited_ms, 1500u);
    EXPECT_TRUE(registry->release(*foreign));
}

TEST_F(PrioritySchedulerTest, ScopeConflictIsReported) {
    startScheduler();
    const auto held = registry->tryAcquireNow(ScopeRequirement::forWorktree("a"), "h", "agent", "commit", 0, false);
    ASSERT_TRUE(held);

    auto f = submit("merge", "", 5, sleeping(milliseconds(1)), "agent");
    const auto r = await(f);
    EXPECT_EQ(r.status, Status::Conflict);
    EXPECT_EQ(r.holder, "worktree:a");
    EXPECT_FALSE(registry->isDraining());
    EXPECT_TRUE(registry->release(*held));
}

TEST_F(PrioritySchedulerTest, FailingBodyStillReleases) {
    startScheduler();
    auto f = submit("commit", "a", 5, [](const Lock&) -> int { throw std::runtime_error("boom"); });
    const auto r = await(f);
    EXPECT_EQ(r.status, Status::Success);
    EXPECT_EQ(r.exit_code, 1);
    EXPECT_EQ(r.message, "boom");
    EXPECT_TRUE(registry->isAvailable(ScopeRequirement::forWorktree("a")));
}

TEST_F(PrioritySchedulerTest, AbandonedHolderLeavesLockForReaper) {
    startScheduler();
    auto f = submit("commit", "a", 5, [](const Lock&) -> int { throw HolderAbandoned("client went away"); });
    const auto r = await(f);
    EXPECT_EQ(r.status, Status::Cancelled);
    EXPECT_FALSE(registry->isAvailable(ScopeRequirement::forWorktree("a")));
}

TEST_F(PrioritySchedulerTest, StopFailsQueuedEntries) {
    cfg.coordinator.worker_slots = 1;
    startScheduler();

    auto running = submit("fetch", "", 5, sleeping(milliseconds(200)), "blocker");
    ASSERT_TRUE(test::waitFor([&] { return scheduler->inFlightCount() == 1; }));
    auto queued = submit("commit", "a", 5, sleeping(milliseconds(1)));

    scheduler->stop();
    EXPECT_EQ(await(running).status, Status::Success);
    EXPECT_EQ(await(queued).status, Status::Unavailable);
    EXPECT_THROW(submit("commit", "a", 5, sleeping(milliseconds(1))), SchedulerUnavailable);
}

TEST_F(PrioritySchedulerTest, AgedLowPriorityEntryRunsDespiteSteadyHighPriorityArrivals) {
    cfg.coordinator.worker_slots = 1;
    cfg.coordinator.aging_interval = seconds(1);
    startScheduler();

    constexpr int lowPriority = 6;
    const auto bound = cfg.coordinator.aging_interval * (OperationRequest::MAX_PRIORITY - lowPriority);

    Gate gate;
    auto blocker = blockWithGlobal(gate);

    const auto submitted = steady_clock::now();
    std::atomic<int64_t> lowRanAfterMs{-1};
    std::atomic<size_t> queuedBehindLow{0};
    auto low = submit("commit", "low", lowPriority, [&](const Lock&) {
        lowRanAfterMs = duration_cast<milliseconds>(steady_clock::now() - submitted).count();
        queuedBehindLow = scheduler->queueDepth();
        return 0;
    }, "patient");

    std::atomic<bool> flooding{true};
    std::vector<std::future<OperationResult>> urgent;
    std::thread feeder([&] {
        for (int i = 0; flooding; ++i) {
            urgent.push_back(submit("commit", "hot" + std::to_string(i), OperationRequest::MAX_PRIORITY,
                                    sleeping(milliseconds(25)), "busy-" + std::to_string(i)));
            std::this_thread::sleep_for(milliseconds(15));
        }
    });

    std::this_thread::sleep_for(milliseconds(50));
    gate.open();

    const auto r = await(low, bound + seconds(5));
    flooding = false;
    feeder.join();

    EXPECT_EQ(r.status, Status::Success);
    EXPECT_GE(lowRanAfterMs.load(), duration_cast<milliseconds>(bound).count() - 1000);
    EXPECT_LT(lowRanAfterMs.load(), duration_cast<milliseconds>(bound + milliseconds(1500)).count());
    EXPECT_GT(queuedBehindLow.load(), 0u) << "high-priority work was not still pending";

    EXPECT_EQ(await(blocker).status, Status::Success);
    for (auto& f : urgent) EXPECT_EQ(await(f, seconds(30)).status, Status::Success);
}
