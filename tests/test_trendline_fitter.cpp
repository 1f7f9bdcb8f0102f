#include <gtest/gtest.h>
#include "scanner/breakout/trendline_fitter.hpp"
#include "scanner/breakout/watchlist_detector.hpp"
#include "test_fixtures.hpp"

using namespace SwingScanner::Core;
using namespace SwingScanner::Testing;
using SwingScanner::Config::BreakoutConfig;
using SwingScanner::Config::StrategyConfig;

namespace {
    // Flat highs at 90 with two spikes placed inside the trailing 120-bar window
    std::vector<PriceBar> make_spiked_bars(double first_spike_high, double second_spike_high) {
        std::vector<PriceBar> bars;
        for (int bar_index = 0; bar_index < 150; ++bar_index) {
            PriceBar bar = make_bar(bar_index, 89.0, 0.0, BASE_VOLUME);
            bar.high_price = 90.0;
            bar.low_price = 88.0;
            bars.push_back(bar);
        }
        bars[50].high_price = first_spike_high;
        bars[100].high_price = second_spike_high;
        return bars;
    }
}

TEST(TrendlineFitterTest, DescendingLineThroughTwoMostProminentHighs) {
    BreakoutConfig breakout_config;
    std::vector<PriceBar> bars = make_spiked_bars(110.0, 105.0);

    std::optional<TrendlineFit> trendline = fit_descending_trendline(bars, breakout_config);
    ASSERT_TRUE(trendline.has_value());
    EXPECT_EQ(trendline->window_start_index, 30);
    EXPECT_EQ(trendline->first_anchor_index, 50);
    EXPECT_EQ(trendline->second_anchor_index, 100);
    EXPECT_EQ(trendline->first_anchor_date, bars[50].date);
    EXPECT_NEAR(trendline->first_anchor_price, 110.0, 1e-9);
    EXPECT_NEAR(trendline->second_anchor_price, 105.0, 1e-9);
    EXPECT_NEAR(trendline->slope_per_bar, -0.1, 1e-9);
    EXPECT_EQ(trendline->touch_count, 2);
    EXPECT_NEAR(trendline->current_value, 110.0 - 0.1 * 99.0, 1e-9);
    EXPECT_NEAR(trendline->value_at(100), 105.0, 1e-9);
}

TEST(TrendlineFitterTest, AscendingHighsAreRejected) {
    EXPECT_FALSE(fit_descending_trendline(make_spiked_bars(105.0, 110.0), BreakoutConfig()).has_value());
}

TEST(TrendlineFitterTest, SingleProminentHighIsRejected) {
    EXPECT_FALSE(fit_descending_trendline(make_spiked_bars(110.0, 90.0), BreakoutConfig()).has_value());
}

TEST(TrendlineFitterTest, FlatHighsAreRejected) {
    EXPECT_FALSE(fit_descending_trendline(make_spiked_bars(90.0, 90.0), BreakoutConfig()).has_value());
}

TEST(TrendlineFitterTest, MoreTouchesRequiredThanTheLineHas) {
    BreakoutConfig breakout_config;
    breakout_config.trendline_minimum_touches = 3;
    EXPECT_FALSE(fit_descending_trendline(make_spiked_bars(110.0, 105.0), breakout_config).has_value());
}

class WatchlistTest : public ::testing::Test {
protected:
    StrategyConfig strategy_config;
    const std::string ticker = "NEAR";
    std::vector<PriceBar> bars = make_bars({97.0, 98.0, 98.8}, 0.005, BASE_VOLUME);
    std::vector<Zone> zones{Zone(95.0, 95.5, 94.5, ZoneType::SUPPORT, 2.5),
                            Zone(99.5, 100.0, 99.0, ZoneType::RESISTANCE, 2.5)};
    RSStats rs_stats;

    void SetUp() override {
        rs_stats.is_blue_dot = true;
    }
};

TEST_F(WatchlistTest, ResistanceZoneUpperBound) {
    SetupOutcome setup_outcome = scan_near_breakout(PatternScanRequest(ticker, bars, zones, rs_stats, 0.0), std::nullopt, strategy_config);
    ASSERT_TRUE(setup_outcome.has_value());
    const SwingScanner::Core::Setup& setup = *setup_outcome.value;
    EXPECT_EQ(setup.setup_type, SetupType::WATCHLIST);
    ASSERT_TRUE(setup.watchlist.has_value());
    EXPECT_EQ(setup.watchlist->level_type, WatchLevelType::ZONE);
    EXPECT_NEAR(setup.watchlist->trigger_level, 100.0, 1e-9);
    EXPECT_NEAR(setup.watchlist->distance_pct, 1.2, 1e-5);
    EXPECT_TRUE(setup.watchlist->rs_blue_dot);
    EXPECT_NEAR(setup.entry, 100.0, 1e-9);
    EXPECT_EQ(setup.stop_loss, 0.0);
    EXPECT_EQ(setup.take_profit, 0.0);
    EXPECT_EQ(setup.setup_date, bars.back().date);
}

TEST_F(WatchlistTest, BlueDotFlagFollowsTheRsStats) {
    rs_stats.is_blue_dot = false;
    SetupOutcome setup_outcome = scan_near_breakout(PatternScanRequest(ticker, bars, zones, rs_stats, 0.0), std::nullopt, strategy_config);
    ASSERT_TRUE(setup_outcome.has_value());
    EXPECT_FALSE(setup_outcome.value->watchlist->rs_blue_dot);
}

TEST_F(WatchlistTest, CloserTrendlineWins) {
    TrendlineFit trendline;
    trendline.current_value = 99.5;
    SetupOutcome setup_outcome = scan_near_breakout(PatternScanRequest(ticker, bars, zones, rs_stats, 0.0), trendline, strategy_config);
    ASSERT_TRUE(setup_outcome.has_value());
    EXPECT_EQ(setup_outcome.value->watchlist->level_type, WatchLevelType::TRENDLINE);
    EXPECT_NEAR(setup_outcome.value->watchlist->trigger_level, 99.5, 1e-9);
}

TEST_F(WatchlistTest, LevelsAlreadyClearedOrOutOfReach) {
    std::vector<Zone> distant_zones{Zone(104.5, 105.0, 104.0, ZoneType::RESISTANCE, 2.5),
                                    Zone(97.5, 98.0, 97.0, ZoneType::RESISTANCE, 2.5)};
    SetupOutcome setup_outcome = scan_near_breakout(PatternScanRequest(ticker, bars, distant_zones, rs_stats, 0.0), std::nullopt, strategy_config);
    EXPECT_FALSE(setup_outcome.has_value());
    EXPECT_EQ(setup_outcome.reason, OutcomeReason::NO_SIGNAL);
}

TEST_F(WatchlistTest, SupportZonesAreIgnored) {
    std::vector<Zone> support_only{Zone(99.5, 100.0, 99.0, ZoneType::SUPPORT, 2.5)};
    EXPECT_FALSE(scan_near_breakout(PatternScanRequest(ticker, bars, support_only, rs_stats, 0.0), std::nullopt, strategy_config).has_value());
}
