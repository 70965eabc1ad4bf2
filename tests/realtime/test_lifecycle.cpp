/*
rtmlink - Lifecycle Tests
Role: Verify ConnectionStateMachine transitions and ShutdownCoordinator signalling in isolation
Coverage: legal edges, check-then-act claims, guarded mutations, loop-exit path, one-shot completion
*/
#include <gtest/gtest.h>
#include "realtime/lifecycle/ConnectionStateMachine.hpp"
#include "realtime/lifecycle/ShutdownCoordinator.hpp"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace rtmlink;
using namespace std::chrono_literals;

namespace {

using Edge = std::pair<RunState, RunState>;

class StateMachineTest : public ::testing::Test {
protected:
    std::vector<Edge> seen;
    ConnectionStateMachine machine{[this](RunState from, RunState to) { seen.emplace_back(from, to); }};
};

} // namespace

// =============================================================================
// ConnectionStateMachine
// =============================================================================

TEST_F(StateMachineTest, StartsStopped) {
    EXPECT_EQ(machine.state(), RunState::Stopped);
}

TEST_F(StateMachineTest, FullCycleNotifiesEveryEdge) {
    EXPECT_FALSE(machine.tryTransition(RunState::Stopped, RunState::Starting));
    EXPECT_FALSE(machine.tryTransition(RunState::Starting, RunState::Started));
    EXPECT_FALSE(machine.tryTransition(RunState::Started, RunState::Stopping));
    EXPECT_FALSE(machine.tryTransition(RunState::Stopping, RunState::Stopped));

    EXPECT_EQ(seen, (std::vector<Edge>{
        {RunState::Stopped, RunState::Starting},
        {RunState::Starting, RunState::Started},
        {RunState::Started, RunState::Stopping},
        {RunState::Stopping, RunState::Stopped}}));
}

TEST_F(StateMachineTest, FailedClaimReportsObservedStateAndChangesNothing) {
    ASSERT_FALSE(machine.tryTransition(RunState::Stopped, RunState::Starting));
    seen.clear();

    const auto observed = machine.tryTransition(RunState::Stopped, RunState::Starting);
    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(*observed, RunState::Starting);
    EXPECT_EQ(machine.state(), RunState::Starting);
    EXPECT_TRUE(seen.empty());
}

TEST_F(StateMachineTest, IllegalEdgesThrow) {
    EXPECT_THROW((void)machine.tryTransition(RunState::Stopped, RunState::Started), std::logic_error);
    EXPECT_THROW((void)machine.tryTransition(RunState::Started, RunState::Stopped), std::logic_error);
    EXPECT_THROW((void)machine.tryTransition(RunState::Stopping, RunState::Started), std::logic_error);
    EXPECT_EQ(machine.state(), RunState::Stopped);
}

TEST(ConnectionStateMachine, ClaimActionRunsBeforeObserversAndOnlyOnSuccess) {
    std::vector<std::string> order;
    ConnectionStateMachine tracked{[&](RunState, RunState) { order.push_back("observer"); }};

    ASSERT_FALSE(tracked.tryTransition(RunState::Stopped, RunState::Starting, [&] {
        EXPECT_EQ(tracked.state(), RunState::Starting);
        order.push_back("claimed");
    }));
    EXPECT_EQ(order, (std::vector<std::string>{"claimed", "observer"}));

    order.clear();
    const auto observed = tracked.tryTransition(RunState::Stopped, RunState::Starting, [&] { order.push_back("claimed"); });
    ASSERT_TRUE(observed.has_value());
    EXPECT_EQ(*observed, RunState::Starting);
    EXPECT_TRUE(order.empty());
}

TEST(ConnectionStateMachine, OnlyHandshakeRevertGoesBackwards) {
    EXPECT_TRUE(ConnectionStateMachine::isLegal(RunState::Starting, RunState::Stopped));
    EXPECT_FALSE(ConnectionStateMachine::isLegal(RunState::Started, RunState::Starting));
    EXPECT_FALSE(ConnectionStateMachine::isLegal(RunState::Stopping, RunState::Starting));
    EXPECT_FALSE(ConnectionStateMachine::isLegal(RunState::Stopped, RunState::Stopping));
}

TEST_F(StateMachineTest, FinishStoppingFromStartedPassesThroughStopping) {
    ASSERT_FALSE(machine.tryTransition(RunState::Stopped, RunState::Starting));
    ASSERT_FALSE(machine.tryTransition(RunState::Starting, RunState::Started));
    seen.clear();

    machine.finishStopping();

    EXPECT_EQ(machine.state(), RunState::Stopped);
    EXPECT_EQ(seen, (std::vector<Edge>{
        {RunState::Started, RunState::Stopping},
        {RunState::Stopping, RunState::Stopped}}));
}

TEST_F(StateMachineTest, FinishStoppingIsIdempotent) {
    machine.finishStopping();
    EXPECT_TRUE(seen.empty());

    ASSERT_FALSE(machine.tryTransition(RunState::Stopped, RunState::Starting));
    ASSERT_FALSE(machine.tryTransition(RunState::Starting, RunState::Started));
    ASSERT_FALSE(machine.tryTransition(RunState::Started, RunState::Stopping));
    seen.clear();

    machine.finishStopping();
    machine.finishStopping();
    EXPECT_EQ(seen, (std::vector<Edge>{{RunState::Stopping, RunState::Stopped}}));
}

TEST_F(StateMachineTest, GuardedRunsOnlyInRequiredState) {
    int applied = 0;
    machine.guarded(RunState::Stopped, "setter", [&] { ++applied; });
    EXPECT_EQ(applied, 1);

    ASSERT_FALSE(machine.tryTransition(RunState::Stopped, RunState::Starting));
    try {
        machine.guarded(RunState::Stopped, "setter", [&] { ++applied; });
        FAIL() << "expected InvalidRunningStateError";
    } catch (const InvalidRunningStateError& e) {
        EXPECT_EQ(e.state(), RunState::Starting);
        EXPECT_NE(std::string(e.what()).find("Starting"), std::string::npos);
    }
    EXPECT_EQ(applied, 1);
}

TEST(ConnectionStateMachine, ConcurrentClaimsHaveOneWinner) {
    ConnectionStateMachine machine;
    std::atomic<int> winners{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (!machine.tryTransition(RunState::Stopped, RunState::Starting)) ++winners;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(machine.state(), RunState::Starting);
}

// =============================================================================
// ShutdownCoordinator
// =============================================================================

TEST(ShutdownCoordinator, StopRequestIsVisibleThroughToken) {
    ShutdownCoordinator sc;
    const auto token = sc.stopToken();
    EXPECT_FALSE(token.stop_requested());

    EXPECT_TRUE(sc.requestStop());
    EXPECT_FALSE(sc.requestStop());
    EXPECT_TRUE(token.stop_requested());
    EXPECT_TRUE(sc.stopRequested());
}

TEST(ShutdownCoordinator, CompletionIsOneShot) {
    ShutdownCoordinator sc;
    EXPECT_FALSE(sc.completed());
    EXPECT_FALSE(sc.waitCompletedFor(10ms));

    EXPECT_TRUE(sc.markCompleted());
    EXPECT_FALSE(sc.markCompleted());
    EXPECT_TRUE(sc.completed());
    EXPECT_TRUE(sc.waitCompletedFor(0ms));
}

TEST(ShutdownCoordinator, WaiterResumesWhenLoopCompletes) {
    ShutdownCoordinator sc;
    std::atomic<bool> loopExited{false};

    std::thread loop([&] {
        const auto token = sc.stopToken();
        while (!token.stop_requested()) std::this_thread::sleep_for(1ms);
        loopExited = true;
        sc.markCompleted();
    });

    sc.requestStop();
    sc.waitCompleted();
    EXPECT_TRUE(loopExited.load());
    loop.join();
}
