/*
Vigil — Deadline Tests
Role: Verify time budgets, cancellation chains and bounded waiting
Testing Strategy: Short real-time budgets; futures that are never fulfilled
Coverage: remaining()/expired() agreement, child budgets, cancellation scope, waitFor
*/
#include <gtest/gtest.h>
#include "marketintel/model/Deadline.hpp"
#include <future>

using namespace Vigil;
using namespace std::chrono_literals;

// =============================================================================
// Budget
// =============================================================================

TEST(Deadline, DefaultNeverExpires) {
    Deadline d;
    EXPECT_FALSE(d.expired());
    EXPECT_EQ(d.remaining(), std::chrono::milliseconds::max());
}

TEST(Deadline, RemainingIsZeroOnlyOnceExpired) {
    for (int i = 0; i < 200; ++i) {
        auto d = Deadline::at(Deadline::Clock::now() + 700us);
        auto left = d.remaining();
        if (left == 0ms) {
            EXPECT_TRUE(d.expired());
        } else {
            EXPECT_GE(left, 1ms);
        }
    }
}

TEST(Deadline, ChildBudgetIsNeverLooserThanParent) {
    auto parent = Deadline::after(100ms);
    EXPECT_LE(parent.child(50ms).expiresAt(), parent.expiresAt());
    EXPECT_EQ(parent.child(10s).expiresAt(), parent.expiresAt());
    EXPECT_EQ(parent.child().expiresAt(), parent.expiresAt());
    EXPECT_EQ(Deadline{}.child(std::chrono::milliseconds::max()).expiresAt(), Deadline::Clock::time_point::max());
}

// =============================================================================
// Cancellation
// =============================================================================

TEST(Deadline, CancellationFlowsDownNotUp) {
    auto parent = Deadline::after(1s);
    auto child = parent.child();
    auto grandchild = child.child(500ms);
    auto sibling = parent.child();

    child.cancel();
    EXPECT_TRUE(child.expired());
    EXPECT_TRUE(grandchild.cancelled());
    EXPECT_EQ(grandchild.remaining(), 0ms);
    EXPECT_FALSE(parent.cancelled());
    EXPECT_FALSE(sibling.cancelled());

    parent.cancel();
    EXPECT_TRUE(sibling.cancelled());
}

// =============================================================================
// waitFor
// =============================================================================

TEST(Deadline, WaitForUsesTheWholeBudget) {
    for (int i = 0; i < 20; ++i) {
        std::promise<int> never;
        auto f = never.get_future();
        auto d = Deadline::at(Deadline::Clock::now() + 1500us);
        EXPECT_FALSE(waitFor(f, d));
        EXPECT_TRUE(d.expired());
    }
}

TEST(Deadline, WaitForReturnsReadyFuture) {
    std::promise<int> p;
    auto f = p.get_future();
    p.set_value(3);
    EXPECT_TRUE(waitFor(f, Deadline::after(0ms)));
}

TEST(Deadline, WaitForStopsOnCancel) {
    std::promise<int> never;
    auto f = never.get_future();
    auto d = Deadline::after(5s);
    d.cancel();
    const auto start = Deadline::Clock::now();
    EXPECT_FALSE(waitFor(f, d));
    EXPECT_LT(Deadline::Clock::now() - start, 100ms);
}
