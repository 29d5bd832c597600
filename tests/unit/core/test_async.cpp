#include <gtest/gtest.h>
#include "vellum/core/cancellation.hpp"
#include "vellum/core/future.hpp"
#include "vellum/core/signal.hpp"
#include <string>
#include <vector>

using namespace vellum;

// ============================================================================
// Signal Tests
// ============================================================================

TEST(SignalTest, EmitsToHandlersInConnectionOrder) {
    Signal<int> signal;
    std::vector<std::string> calls;

    signal.connect([&](int v) { calls.push_back("a" + std::to_string(v)); });
    signal.connect([&](int v) { calls.push_back("b" + std::to_string(v)); });
    signal.emit(1);

    EXPECT_EQ(calls, (std::vector<std::string>{"a1", "b1"}));
}

TEST(SignalTest, DisconnectStopsDelivery) {
    Signal<> signal;
    int count = 0;

    auto id = signal.connect([&] { ++count; });
    signal.emit();
    EXPECT_TRUE(signal.disconnect(id));
    EXPECT_FALSE(signal.disconnect(id));
    signal.emit();

    EXPECT_EQ(count, 1);
    EXPECT_EQ(signal.connection_count(), 0u);
}

TEST(SignalTest, HandlerConnectedDuringEmitWaitsForNextEmit) {
    Signal<> signal;
    int late_calls = 0;

    signal.connect([&] {
        signal.connect([&] { ++late_calls; });
    });

    signal.emit();
    EXPECT_EQ(late_calls, 0);

    signal.emit();
    EXPECT_EQ(late_calls, 1);
}

TEST(SignalTest, HandlerDisconnectedDuringEmitIsSkipped) {
    Signal<> signal;
    int second_calls = 0;
    ConnectionId second = 0;

    signal.connect([&] { signal.disconnect(second); });
    second = signal.connect([&] { ++second_calls; });

    signal.emit();
    EXPECT_EQ(second_calls, 0);
}

// ============================================================================
// Cancellation Tests
// ============================================================================

TEST(CancellationTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_FALSE(token.can_be_cancelled());
}

TEST(CancellationTest, CallbacksRunOnceOnCancel) {
    CancellationSource source;
    int calls = 0;

    source.token().on_cancel([&] { ++calls; });
    source.cancel();
    source.cancel();

    EXPECT_TRUE(source.token().is_cancelled());
    EXPECT_EQ(calls, 1);
}

TEST(CancellationTest, CallbackOnCancelledTokenRunsImmediately) {
    CancellationSource source;
    source.cancel();

    bool ran = false;
    source.token().on_cancel([&] { ran = true; });
    EXPECT_TRUE(ran);
}

TEST(CancellationTest, LinkedSourceFollowsParent) {
    CancellationSource parent;
    CancellationSource child(parent.token());
    bool child_notified = false;

    child.token().on_cancel([&] { child_notified = true; });
    parent.cancel();

    EXPECT_TRUE(child.is_cancelled());
    EXPECT_TRUE(child_notified);
}

TEST(CancellationTest, ChildCancelDoesNotReachParent) {
    CancellationSource parent;
    CancellationSource child(parent.token());

    child.cancel();
    EXPECT_TRUE(child.is_cancelled());
    EXPECT_FALSE(parent.is_cancelled());
}

TEST(CancellationTest, DestroyedChildIsUnlinked) {
    CancellationSource parent;
    {
        CancellationSource child(parent.token());
    }
    EXPECT_NO_THROW(parent.cancel());
}

// ============================================================================
// Future Tests
// ============================================================================

TEST(FutureTest, ContinuationRunsAsMicrotask) {
    ManualClock clock;
    EventLoop loop(clock);
    Promise<int> promise(loop);
    int observed = 0;

    promise.future().then([&](const ResourceResult<int>& r) { observed = r.value(); });
    promise.resolve(5);
    EXPECT_EQ(observed, 0);

    loop.run_until_idle();
    EXPECT_EQ(observed, 5);
}

TEST(FutureTest, ThenOnSettledFutureStillDefers) {
    ManualClock clock;
    EventLoop loop(clock);
    auto future = make_ready_future(loop, std::string("ready"));
    std::string observed;

    future.then([&](const ResourceResult<std::string>& r) { observed = r.value(); });
    EXPECT_TRUE(observed.empty());

    loop.run_until_idle();
    EXPECT_EQ(observed, "ready");
}

TEST(FutureTest, FirstSettlementWins) {
    ManualClock clock;
    EventLoop loop(clock);
    Promise<int> promise(loop);

    EXPECT_TRUE(promise.reject(ResourceError::cancelled()));
    EXPECT_FALSE(promise.resolve(1));

    auto future = promise.future();
    ASSERT_TRUE(future.is_ready());
    EXPECT_TRUE(future.result().error().is_cancelled());
}

TEST(FutureTest, ResultBeforeSettleThrows) {
    ManualClock clock;
    EventLoop loop(clock);
    Promise<int> promise(loop);

    EXPECT_THROW((void)promise.future().result(), std::logic_error);
}

TEST(FutureTest, CopiesShareState) {
    ManualClock clock;
    EventLoop loop(clock);
    Promise<int> promise(loop);
    auto a = promise.future();
    auto b = promise.future();

    EXPECT_TRUE(a.shares_state_with(b));
    promise.resolve(3);
    EXPECT_EQ(b.result().value(), 3);
}
