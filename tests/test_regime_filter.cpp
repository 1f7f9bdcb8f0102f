#include <gtest/gtest.h>
#include "scanner/regime/regime_filter.hpp"
#include "test_fixtures.hpp"

using namespace SwingScanner::Core;
using namespace SwingScanner::Testing;
using SwingScanner::Config::RegimeConfig;

TEST(RegimeFilterTest, BenchmarkAboveEmaIsBullish) {
    RegimeSnapshot regime = check_market_regime(make_rising_bars(60, 400.0, 0.002), RegimeConfig());

    EXPECT_TRUE(regime.is_bullish);
    EXPECT_EQ(regime.label, "BULLISH");
    EXPECT_GT(regime.benchmark_close, regime.benchmark_ema20);
    EXPECT_GT(regime.benchmark_ema20, 0.0);
}

TEST(RegimeFilterTest, BenchmarkBelowEmaIsBearish) {
    RegimeSnapshot regime = check_market_regime(make_falling_bars(60, 400.0, 0.002), RegimeConfig());

    EXPECT_FALSE(regime.is_bullish);
    EXPECT_EQ(regime.label, "BEARISH");
    EXPECT_LT(regime.benchmark_close, regime.benchmark_ema20);
}

TEST(RegimeFilterTest, NoBarsFailsClosed) {
    RegimeSnapshot regime = check_market_regime({}, RegimeConfig());

    EXPECT_FALSE(regime.is_bullish);
    EXPECT_EQ(regime.label, "ERROR: No benchmark data");
    EXPECT_EQ(regime.benchmark_close, 0.0);
    EXPECT_EQ(regime.benchmark_ema20, 0.0);
}

TEST(RegimeFilterTest, TooFewBarsFailsClosed) {
    RegimeSnapshot regime = check_market_regime(make_rising_bars(10, 400.0, 0.002), RegimeConfig());

    EXPECT_FALSE(regime.is_bullish);
    EXPECT_EQ(regime.label, "ERROR: Insufficient benchmark data: 10 bars");
}

TEST(RegimeFilterTest, UndefinedClosesDoNotCount) {
    std::vector<PriceBar> bars = make_rising_bars(25, 400.0, 0.002);
    for (int bar_index = 0; bar_index < 5; ++bar_index) {
        bars[bar_index].adjusted_close = UNDEFINED_VALUE;
    }

    RegimeSnapshot regime = check_market_regime(bars, RegimeConfig());
    EXPECT_FALSE(regime.is_bullish);
    EXPECT_EQ(regime.label, "ERROR: Insufficient benchmark data: 20 bars");
}
