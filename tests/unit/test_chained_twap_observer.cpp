#include <gtest/gtest.h>
#include "observer/ChainedTwapObserver.hpp"
#include "observer/TickAccumulator.hpp"

#include <cmath>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace observer;

TEST(TickAccumulatorTest, CumulativeIsPiecewiseLinear) {
    TickAccumulator acc(100, 5);
    EXPECT_EQ(acc.tick_cumulative(100), 0);
    EXPECT_EQ(acc.tick_cumulative(110), 50);
    acc.set_tick(110, -3);
    EXPECT_EQ(acc.tick_cumulative(120), 20);
    EXPECT_EQ(acc.current_tick(), -3);
    EXPECT_THROW(acc.set_tick(105, 0), std::invalid_argument);
    EXPECT_THROW(acc.tick_cumulative(109), std::invalid_argument);
}

TEST(ChainedTwapObserverTest, ZeroTickIsParity) {
    auto oracle = std::make_shared<TickAccumulator>(0, 0);
    ChainedTwapObserver twap({{oracle, false}}, 0);
    TwapQuote q = twap.get_twap_since_last_checkpoint(60, 1'000'000);
    EXPECT_EQ(q.out_amount, 1'000'000);
    EXPECT_EQ(q.duration, 60);
}

TEST(ChainedTwapObserverTest, TickPriceIsOnePointZeroZeroZeroOneToTheTick) {
    auto oracle = std::make_shared<TickAccumulator>(0, 6932);  // ~2.0
    ChainedTwapObserver twap({{oracle, false}}, 0);
    TwapQuote q = twap.get_twap_since_last_checkpoint(600, 1'000'000'000);
    EXPECT_NEAR(static_cast<double>(q.out_amount), 1'000'000'000.0 * std::pow(1.0001, 6932), 10.0);
    EXPECT_GT(q.out_amount, 1'999'000'000);
}

TEST(ChainedTwapObserverTest, AverageTickRoundsTowardNegativeInfinity) {
    // -1 for 5s then -2 for 5s: mean -1.5, floored to -2.
    auto varying = std::make_shared<TickAccumulator>(0, -1);
    ChainedTwapObserver observed({{varying, false}}, 0);
    varying->set_tick(5, -2);

    auto constant = std::make_shared<TickAccumulator>(0, -2);
    ChainedTwapObserver reference({{constant, false}}, 0);

    EXPECT_EQ(observed.get_twap_since_last_checkpoint(10, 123'456'789).out_amount,
              reference.get_twap_since_last_checkpoint(10, 123'456'789).out_amount);
}

TEST(ChainedTwapObserverTest, InverseHopUndoesForwardHop) {
    auto ab = std::make_shared<TickAccumulator>(0, 2000);
    auto cb = std::make_shared<TickAccumulator>(0, 2000);
    ChainedTwapObserver twap({{ab, false}, {cb, true}}, 0);
    TwapQuote q = twap.get_twap_since_last_checkpoint(30, 1'000'000);
    EXPECT_NEAR(static_cast<double>(q.out_amount), 1'000'000.0, 2.0);
    EXPECT_LE(q.out_amount, 1'000'000);
}

TEST(ChainedTwapObserverTest, CheckpointResetsTheWindow) {
    auto oracle = std::make_shared<TickAccumulator>(0, 100);
    ChainedTwapObserver twap({{oracle, false}}, 0);
    oracle->set_tick(50, 0);
    twap.create_checkpoint(50);
    EXPECT_EQ(twap.checkpoint_time(), 50);
    EXPECT_EQ(twap.get_duration_since_last_checkpoint(80), 30);
    EXPECT_EQ(twap.get_twap_since_last_checkpoint(80, 777).out_amount, 777);
}

TEST(ChainedTwapObserverTest, ZeroDurationUsesCurrentTick) {
    auto oracle = std::make_shared<TickAccumulator>(0, 0);
    ChainedTwapObserver twap({{oracle, false}}, 0);
    oracle->set_tick(20, 6932);
    twap.create_checkpoint(20);
    TwapQuote q = twap.get_twap_since_last_checkpoint(20, 1000);
    EXPECT_EQ(q.duration, 0);
    EXPECT_GE(q.out_amount, 1999);
}

TEST(ChainedTwapObserverTest, RejectsBadInput) {
    auto oracle = std::make_shared<TickAccumulator>(0, 0);
    EXPECT_THROW(ChainedTwapObserver({}, 0), std::invalid_argument);
    EXPECT_THROW(ChainedTwapObserver({{nullptr, false}}, 0), std::invalid_argument);

    ChainedTwapObserver twap({{oracle, false}}, 10);
    EXPECT_THROW(twap.create_checkpoint(9), std::invalid_argument);
    EXPECT_THROW(twap.get_duration_since_last_checkpoint(9), std::invalid_argument);
    EXPECT_THROW(twap.get_twap_since_last_checkpoint(20, -1), std::invalid_argument);
}

TEST(ChainedTwapObserverTest, OutOfRangeQuoteIsRejected) {
    auto oracle = std::make_shared<TickAccumulator>(0, 800'000);
    ChainedTwapObserver twap({{oracle, false}}, 0);
    EXPECT_THROW(twap.get_twap_since_last_checkpoint(10, 1'000'000), std::overflow_error);
}
