#include <gtest/gtest.h>
#include "scanner/relative_strength/rs_engine.hpp"
#include "test_fixtures.hpp"
#include <cmath>

using namespace SwingScanner::Core;
using namespace SwingScanner::Testing;
using SwingScanner::Config::RelativeStrengthConfig;

TEST(RsEngineTest, LeadingTickerSitsAtItsHigh) {
    RelativeStrengthConfig rs_config;
    std::vector<PriceBar> ticker_bars = make_rising_bars(300, 20.0, 0.004);
    std::vector<PriceBar> benchmark_bars = make_rising_bars(300, 400.0, 0.001);

    std::optional<RSLine> rs_line = calculate_rs_line(ticker_bars, benchmark_bars, rs_config);
    ASSERT_TRUE(rs_line.has_value());
    EXPECT_EQ(rs_line->ratios.size(), 252u);
    EXPECT_EQ(rs_line->dates.size(), 252u);
    EXPECT_EQ(rs_line->dates.back(), ticker_bars.back().date);
    EXPECT_NEAR(rs_line->ratios.back(), ticker_bars.back().adjusted_close / benchmark_bars.back().adjusted_close, 1e-12);

    RSStats rs_stats = get_rs_stats(rs_line, rs_config);
    EXPECT_TRUE(rs_stats.available);
    EXPECT_TRUE(rs_stats.is_blue_dot);
    EXPECT_EQ(rs_stats.trend, RSTrend::UP);
    EXPECT_DOUBLE_EQ(rs_stats.rs_today, rs_stats.rs_52w_high);
}

TEST(RsEngineTest, LaggingTickerHasNoBlueDot) {
    RelativeStrengthConfig rs_config;
    std::optional<RSLine> rs_line = calculate_rs_line(make_rising_bars(300, 20.0, 0.001),
                                                      make_rising_bars(300, 400.0, 0.004), rs_config);
    ASSERT_TRUE(rs_line.has_value());

    RSStats rs_stats = get_rs_stats(rs_line, rs_config);
    EXPECT_FALSE(rs_stats.is_blue_dot);
    EXPECT_EQ(rs_stats.trend, RSTrend::DOWN);
    EXPECT_LT(rs_stats.rs_today, rs_stats.rs_52w_high);
}

class RsAlignmentTest : public ::testing::Test {
protected:
    RelativeStrengthConfig rs_config;
    std::vector<PriceBar> ticker_bars = make_rising_bars(300, 20.0, 0.002);
    std::vector<PriceBar> benchmark_bars = make_rising_bars(300, 400.0, 0.001);
};

TEST_F(RsAlignmentTest, EnoughOverlap) {
    std::vector<PriceBar> partial_benchmark(benchmark_bars.begin() + 40, benchmark_bars.end());
    std::optional<RSLine> rs_line = calculate_rs_line(ticker_bars, partial_benchmark, rs_config);
    ASSERT_TRUE(rs_line.has_value());
    EXPECT_EQ(rs_line->ratios.size(), 252u);
}

TEST_F(RsAlignmentTest, FewerThanAYearOfCommonDatesIsUnavailable) {
    std::vector<PriceBar> partial_benchmark(benchmark_bars.begin() + 60, benchmark_bars.end());
    std::optional<RSLine> rs_line = calculate_rs_line(ticker_bars, partial_benchmark, rs_config);
    EXPECT_FALSE(rs_line.has_value());

    RSStats rs_stats = get_rs_stats(rs_line, rs_config);
    EXPECT_FALSE(rs_stats.available);
    EXPECT_FALSE(rs_stats.is_blue_dot);
    EXPECT_EQ(rs_stats.trend, RSTrend::UNKNOWN);
}

TEST_F(RsAlignmentTest, EmptyInputs) {
    EXPECT_FALSE(calculate_rs_line({}, benchmark_bars, rs_config).has_value());
    EXPECT_FALSE(calculate_rs_line(ticker_bars, {}, rs_config).has_value());
}

TEST(RsEngineTest, BlueDotToleranceBand) {
    RelativeStrengthConfig rs_config;
    RSLine rs_line;
    rs_line.ratios = {0.5, 1.0, 0.8};

    rs_line.ratios.back() = 0.996;
    EXPECT_TRUE(detect_rs_blue_dot(rs_line, rs_config));

    rs_line.ratios.back() = 0.994;
    EXPECT_FALSE(detect_rs_blue_dot(rs_line, rs_config));

    EXPECT_FALSE(detect_rs_blue_dot(RSLine(), rs_config));
}

TEST(RsEngineTest, BenchmarkThreeMonthReturn) {
    std::vector<PriceBar> benchmark_bars = make_rising_bars(100, 400.0, 0.001);

    EXPECT_NEAR(calculate_benchmark_return(benchmark_bars, 63), std::pow(1.001, 63) - 1.0, 1e-9);
    EXPECT_EQ(calculate_benchmark_return(make_rising_bars(63, 400.0, 0.001), 63), 0.0);
}
