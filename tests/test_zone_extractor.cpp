#include <gtest/gtest.h>
#include "scanner/zones/zone_extractor.hpp"
#include "test_fixtures.hpp"
#include <cmath>

using namespace SwingScanner::Core;
using namespace SwingScanner::Testing;
using SwingScanner::Config::StrategyConfig;

namespace {
    // Price rotates between three shelves for 30 bars each
    std::vector<PriceBar> make_shelf_bars() {
        const double shelf_levels[3] = {40.0, 50.0, 60.0};
        std::vector<double> closes;
        for (int bar_index = 0; bar_index < 300; ++bar_index) {
            closes.push_back(shelf_levels[(bar_index / 30) % 3] * (1.0 + 0.002 * std::sin(static_cast<double>(bar_index))));
        }
        return make_bars(closes, 0.01, BASE_VOLUME);
    }
}

TEST(ZoneExtractorTest, WeeklyResampleGroupsMondayToSunday) {
    std::vector<PriceBar> bars = make_bars({10.0, 11.0, 12.0, 11.5, 10.5, 9.0, 9.5}, 0.01, BASE_VOLUME);
    std::vector<WeeklyBar> weekly_bars = resample_weekly(bars);

    ASSERT_EQ(weekly_bars.size(), 2u);
    EXPECT_NEAR(weekly_bars[0].close, 10.5, 1e-9);
    EXPECT_NEAR(weekly_bars[0].high, 12.0 * 1.01, 1e-9);
    EXPECT_NEAR(weekly_bars[0].low, 10.0 * 0.99, 1e-9);
    EXPECT_NEAR(weekly_bars[1].close, 9.5, 1e-9);
    EXPECT_EQ(weekly_bars[1].week_index, weekly_bars[0].week_index + 1);
}

TEST(ZoneExtractorTest, ZonesAreSortedSpacedAndClassified) {
    StrategyConfig strategy_config;
    std::vector<PriceBar> bars = make_shelf_bars();

    ZoneOutcome zone_outcome = calculate_sr_zones(bars, strategy_config);
    ASSERT_TRUE(zone_outcome.has_value());
    const std::vector<Zone>& zones = *zone_outcome.value;
    ASSERT_GE(zones.size(), 2u);

    double latest_close = bars.back().adjusted_close;
    for (size_t zone_index = 0; zone_index < zones.size(); ++zone_index) {
        const Zone& zone = zones[zone_index];
        EXPECT_GT(zone.atr, 0.0);
        EXPECT_NEAR(zone.upper - zone.level, 0.2 * zone.atr, 1e-9);
        EXPECT_NEAR(zone.level - zone.lower, 0.2 * zone.atr, 1e-9);
        EXPECT_EQ(zone.type == ZoneType::RESISTANCE, zone.level > latest_close);
        if (zone_index > 0) {
            EXPECT_GT(zone.level, zones[zone_index - 1].level);
            EXPECT_GE(zone.level - zones[zone_index - 1].level, zone.atr * strategy_config.zones.merge_distance_atr_multiplier);
        }
    }
}

TEST(ZoneExtractorTest, FlatZeroRangeSeriesHasNoZones) {
    std::vector<PriceBar> bars = make_bars(std::vector<double>(200, 25.0), 0.0, BASE_VOLUME);
    ZoneOutcome zone_outcome;
    ASSERT_NO_THROW(zone_outcome = calculate_sr_zones(bars, StrategyConfig()));
    EXPECT_FALSE(zone_outcome.has_value());
    EXPECT_EQ(zone_outcome.reason, OutcomeReason::INSUFFICIENT_DATA);
}

TEST(ZoneExtractorTest, ShortHistoryHasNoZones) {
    ZoneOutcome zone_outcome = calculate_sr_zones(make_rising_bars(30, 10.0, 0.01), StrategyConfig());
    EXPECT_FALSE(zone_outcome.has_value());
    EXPECT_EQ(zone_outcome.reason, OutcomeReason::INSUFFICIENT_DATA);
}

TEST(ZoneExtractorTest, TooFewWeeksHasNoZones) {
    StrategyConfig strategy_config;
    strategy_config.zones.minimum_weekly_bars = 100;

    ZoneOutcome zone_outcome = calculate_sr_zones(make_shelf_bars(), strategy_config);
    EXPECT_FALSE(zone_outcome.has_value());
    EXPECT_EQ(zone_outcome.reason, OutcomeReason::INSUFFICIENT_DATA);
}
