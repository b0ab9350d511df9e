#include <gtest/gtest.h>
#include "coord/LockRegistry.hpp"
#include "coord/Reaper.hpp"
#include "coord/errors.hpp"
#include "TestEnv.hpp"

#include <future>
#include <thread>

using namespace wtc;
using namespace wtc::coord;
using namespace wtc::types;
using namespace std::chrono;
using Type = MetricEvent::Type;

class LockRegistryTest : public ::testing::Test {
protected:
    std::shared_ptr<test::FakeProbe> probe = std::make_shared<test::FakeProbe>();
    std::shared_ptr<test::CollectingSink> sink = std::make_shared<test::CollectingSink>();
    config::BackoffConfig backoff{milliseconds(5), 2.0, milliseconds(40)};

    std::unique_ptr<LockRegistry> makeRegistry(const seconds ttl = seconds(30)) const {
        return std::make_unique<LockRegistry>(ttl, backoff, probe, sink);
    }

    static OperationRequest request(const std::string& verb, const std::string& target = "",
                                    const std::string& caller = "") {
        return makeRequest(verb, target, 5, caller.empty() ? "caller-" + verb + target : caller);
    }

    static ScopeRequirement wt(const std::string& id) { return ScopeRequirement::forWorktree(id); }
};

TEST_F(LockRegistryTest, AcquireAndRelease) {
    const auto reg = makeRegistry();
    const auto req = request("commit", "a");
    const auto lock = reg->tryAcquire(wt("a"), req, milliseconds(100));

    EXPECT_EQ(lock.scope_id, "worktree:a");
    EXPECT_EQ(lock.holder_id, req.id);
    EXPECT_FALSE(reg->isAvailable(wt("a")));
    EXPECT_TRUE(reg->isAvailable(wt("b")));
    EXPECT_FALSE(reg->isAvailable(ScopeRequirement::global()));
    ASSERT_TRUE(reg->holderOf("worktree:a"));
    EXPECT_EQ(reg->holderOf("worktree:a")->holder_id, req.id);

    EXPECT_TRUE(reg->release(lock));
    EXPECT_TRUE(reg->isAvailable(wt("a")));
    EXPECT_EQ(reg->heldCount(), 0u);
    EXPECT_EQ(sink->count(Type::Acquired), 1u);
    EXPECT_EQ(sink->count(Type::Released), 1u);
}

TEST_F(LockRegistryTest, DistinctWorktreesDoNotBlock) {
    const auto reg = makeRegistry();
    const auto a = reg->tryAcquire(wt("a"), request("commit", "a"), milliseconds(50));
    const auto b = reg->tryAcquire(wt("b"), request("commit", "b"), milliseconds(50));
    EXPECT_EQ(reg->heldCount(), 2u);
    EXPECT_EQ(sink->count(Type::Waited), 0u);
    EXPECT_TRUE(reg->release(a));
    EXPECT_TRUE(reg->release(b));
}

TEST_F(LockRegistryTest, SameScopeTimesOutWithHolder) {
    const auto reg = makeRegistry();
    const auto first = request("commit", "a");
    const auto lock = reg->tryAcquire(wt("a"), first, milliseconds(50));

    try {
        (void)reg->tryAcquire(wt("a"), request("status", "a"), milliseconds(60));
        FAIL() << "expected AcquisitionTimeout";
    } catch (const AcquisitionTimeout& e) {
        EXPECT_EQ(e.scope(), "worktree:a");
        EXPECT_EQ(e.holder(), first.id);
        EXPECT_GE(e.waitedMs(), 50u);
    }

    EXPECT_EQ(sink->count(Type::Waited), 1u);
    EXPECT_EQ(sink->count(Type::TimedOut), 1u);
    EXPECT_TRUE(reg->release(lock));
}

TEST_F(LockRegistryTest, WaiterIsWokenByRelease) {
    const auto reg = makeRegistry();
    const auto lock = reg->tryAcquire(wt("a"), request("commit", "a"), milliseconds(50));

    auto waiter = std::async(std::launch::async, [&] {
        return reg->tryAcquire(wt("a"), request("status", "a"), seconds(5));
    });

    ASSERT_TRUE(test::waitFor([&] { return sink->count(Type::Waited) == 1; }));
    EXPECT_TRUE(reg->release(lock));

    const auto next = waiter.get();
    EXPECT_EQ(next.verb, "status");
    EXPECT_GT(next.generation, lock.generation);
    EXPECT_TRUE(reg->release(next));
}

// Scenario B
TEST_F(LockRegistryTest, GlobalDrainsHeldWorktreesAndBlocksNewOnes) {
    const auto reg = makeRegistry();
    std::vector<Lock> held;
    for (const auto* id : {"a", "b", "c"})
        held.push_back(reg->tryAcquire(wt(id), request("commit", id), milliseconds(50)));

    std::atomic<bool> mergeDone{false};
    auto merge = std::async(std::launch::async, [&] {
        auto l = reg->tryAcquire(ScopeRequirement::global(), request("merge"), seconds(5));
        mergeDone = true;
        return l;
    });

    ASSERT_TRUE(test::waitFor([&] { return reg->isDraining(); }));

    // no new worktree acquisition while draining
    EXPECT_THROW((void)reg->tryAcquire(wt("d"), request("commit", "d"), milliseconds(60)), AcquisitionTimeout);
    EXPECT_FALSE(reg->isAvailable(wt("d")));

    EXPECT_TRUE(reg->release(held[0]));
    EXPECT_TRUE(reg->release(held[1]));
    std::this_thread::sleep_for(milliseconds(50));
    EXPECT_FALSE(mergeDone);

    EXPECT_TRUE(reg->release(held[2]));
    const auto global = merge.get();
    EXPECT_EQ(global.scope_id, "global");
    EXPECT_FALSE(reg->isDraining());
    EXPECT_FALSE(reg->isAvailable(wt("a")));

    EXPECT_TRUE(reg->release(global));
    EXPECT_TRUE(reg->isAvailable(wt("a")));
}

TEST_F(LockRegistryTest, GlobalTimeoutEndsDrain) {
    const auto reg = makeRegistry();
    const auto lock = reg->tryAcquire(wt("a"), request("commit", "a"), milliseconds(50));

    EXPECT_THROW((void)reg->tryAcquire(ScopeRequirement::global(), request("fetch"), milliseconds(60)),
                 AcquisitionTimeout);
    EXPECT_FALSE(reg->isDraining());
    EXPECT_TRUE(reg->isAvailable(wt("b")));
    EXPECT_TRUE(reg->release(lock));
}

TEST_F(LockRegistryTest, ReleaseOfStaleGenerationIsIgnored) {
    const auto reg = makeRegistry();
    const auto first = reg->tryAcquire(wt("a"), request("commit", "a"), milliseconds(50));
    EXPECT_TRUE(reg->release(first));

    const auto second = reg->tryAcquire(wt("a"), request("status", "a"), milliseconds(50));
    EXPECT_NE(first.generation, second.generation);

    EXPECT_FALSE(reg->release(first));
    ASSERT_TRUE(reg->holderOf("worktree:a"));
    EXPECT_EQ(reg->holderOf("worktree:a")->generation, second.generation);
    EXPECT_TRUE(reg->release(second));
}

TEST_F(LockRegistryTest, CallerHoldingWorktreeCannotRequestGlobal) {
    const auto reg = makeRegistry();
    const auto lock = reg->tryAcquire(wt("a"), request("commit", "a", "agent-1"), milliseconds(50));

    EXPECT_THROW((void)reg->tryAcquire(ScopeRequirement::global(), request("merge", "", "agent-1"), milliseconds(50)),
                 ScopeConflictDetected);
    EXPECT_FALSE(reg->isDraining());
    EXPECT_TRUE(reg->release(lock));
}

// Scenario D
TEST_F(LockRegistryTest, DeadHolderPastTtlIsReclaimedOnce) {
    const auto reg = makeRegistry(seconds(0));
    const auto req = request("commit", "a");
    const auto lock = reg->tryAcquire(wt("a"), req, milliseconds(50));
    probe->kill(req.id);

    EXPECT_EQ(reg->reclaimStale(), 1u);
    EXPECT_EQ(reg->reclaimStale(), 0u);
    EXPECT_TRUE(reg->isAvailable(wt("a")));
    EXPECT_EQ(sink->count(Type::StaleReclaimed), 1u);

    // the late release from the dead holder is a no-op
    EXPECT_FALSE(reg->release(lock));
    EXPECT_EQ(sink->count(Type::Released), 0u);
}

TEST_F(LockRegistryTest, LiveHolderPastTtlIsExtended) {
    const auto reg = makeRegistry(seconds(0));
    const auto lock = reg->tryAcquire(wt("a"), request("commit", "a"), milliseconds(50));

    EXPECT_EQ(reg->reclaimStale(), 0u);
    EXPECT_GE(probe->probes.load(), 1u);
    ASSERT_TRUE(reg->holderOf("worktree:a"));
    EXPECT_GE(reg->holderOf("worktree:a")->ttl_deadline, lock.ttl_deadline);
    EXPECT_EQ(sink->count(Type::StaleReclaimed), 0u);
    EXPECT_TRUE(reg->release(lock));
}

TEST_F(LockRegistryTest, FreshLocksAreNotProbed) {
    const auto reg = makeRegistry(seconds(30));
    const auto lock = reg->tryAcquire(wt("a"), request("commit", "a"), milliseconds(50));
    EXPECT_EQ(reg->reclaimStale(), 0u);
    EXPECT_EQ(probe->probes.load(), 0u);
    EXPECT_TRUE(reg->release(lock));
}

TEST_F(LockRegistryTest, AdvisoryLockCanBeAdopted) {
    const auto reg = makeRegistry();
    const auto advisory = reg->tryAcquireNow(wt("a"), advisoryHolderFor("agent"), "agent", "status", 0, true);
    ASSERT_TRUE(advisory);
    EXPECT_TRUE(advisory->advisory);
    EXPECT_EQ(sink->count(Type::Acquired), 0u);

    // occupied for everyone else
    EXPECT_FALSE(reg->tryAcquireNow(wt("a"), "other", "other", "status", 0, true));

    const auto req = request("status", "a", "agent");
    const auto adopted = reg->adopt("worktree:a", advisoryHolderFor("agent"), req);
    ASSERT_TRUE(adopted);
    EXPECT_FALSE(adopted->advisory);
    EXPECT_EQ(adopted->holder_id, req.id);
    EXPECT_GT(adopted->generation, advisory->generation);
    EXPECT_FALSE(reg->release(*advisory));
    EXPECT_TRUE(reg->release(*adopted));
    EXPECT_EQ(sink->count(Type::Acquired), 1u);
    EXPECT_EQ(sink->count(Type::Released), 1u);
}

TEST_F(LockRegistryTest, ReleaseHolderDropsEverythingItOwns) {
    const auto reg = makeRegistry();
    ASSERT_TRUE(reg->tryAcquireNow(wt("a"), "h1", "c", "commit", 0, false));
    ASSERT_TRUE(reg->tryAcquireNow(wt("b"), "h1", "c", "commit", 0, false));
    ASSERT_TRUE(reg->tryAcquireNow(wt("c"), "h2", "c", "commit", 0, false));

    EXPECT_EQ(reg->releaseHolder("h1"), 2u);
    EXPECT_EQ(reg->heldCount(), 1u);
    const auto snap = reg->snapshot();
    ASSERT_EQ(snap.size(), 1u);
    EXPECT_EQ(snap[0].scope_id, "worktree:c");
}

TEST_F(LockRegistryTest, ReaperSweepsPeriodically) {
    std::shared_ptr<LockRegistry> reg = makeRegistry(seconds(0));
    const auto req = request("commit", "a");
    (void)reg->tryAcquire(wt("a"), req, milliseconds(50));
    probe->kill(req.id);

    Reaper reaper(reg, seconds(1));
    reaper.start();
    EXPECT_TRUE(test::waitFor([&] { return reg->heldCount() == 0; }, seconds(5)));
    reaper.stop();
    EXPECT_EQ(sink->count(Type::StaleReclaimed), 1u);
}
