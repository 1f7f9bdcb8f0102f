#include <gtest/gtest.h>
#include "scanner/indicators/indicators.hpp"
#include "test_fixtures.hpp"

using namespace SwingScanner::Core;

namespace {
    IndicatorSeries counting_series(int count, double start_value, double step) {
        IndicatorSeries values;
        for (int value_index = 0; value_index < count; ++value_index) {
            values.push_back(start_value + step * value_index);
        }
        return values;
    }
}

TEST(IndicatorsTest, EmaSeedsWithFirstValueAndWaitsForLength) {
    IndicatorSeries ema_values = ema(counting_series(10, 1.0, 1.0), 3);

    ASSERT_EQ(ema_values.size(), 10u);
    EXPECT_FALSE(is_defined(ema_values[0]));
    EXPECT_FALSE(is_defined(ema_values[1]));
    // alpha 0.5: 1 -> 1.5 -> 2.25
    EXPECT_NEAR(ema_values[2], 2.25, 1e-9);
    EXPECT_NEAR(ema_values[3], 3.125, 1e-9);
}

TEST(IndicatorsTest, EmaSkipsUndefinedInputs) {
    IndicatorSeries values{1.0, UNDEFINED_VALUE, 3.0, 5.0};
    IndicatorSeries ema_values = ema(values, 2);

    EXPECT_FALSE(is_defined(ema_values[1]));
    // alpha 2/3 over the defined inputs 1, 3, 5
    EXPECT_NEAR(ema_values[2], 1.0 / 3.0 + 2.0, 1e-9);
    EXPECT_NEAR(ema_values[3], (1.0 / 3.0 + 2.0) / 3.0 + 10.0 / 3.0, 1e-9);
}

TEST(IndicatorsTest, SmaIsUndefinedUntilWindowFills) {
    IndicatorSeries sma_values = sma(IndicatorSeries{1.0, 2.0, 3.0, 4.0, 5.0}, 3);

    EXPECT_FALSE(is_defined(sma_values[0]));
    EXPECT_FALSE(is_defined(sma_values[1]));
    EXPECT_NEAR(sma_values[2], 2.0, 1e-9);
    EXPECT_NEAR(sma_values[3], 3.0, 1e-9);
    EXPECT_NEAR(sma_values[4], 4.0, 1e-9);
}

TEST(IndicatorsTest, SmaUndefinedValuePoisonsItsWindows) {
    IndicatorSeries gapped_values = sma(IndicatorSeries{1.0, UNDEFINED_VALUE, 3.0, 4.0, 5.0}, 2);

    EXPECT_FALSE(is_defined(gapped_values[1]));
    EXPECT_FALSE(is_defined(gapped_values[2]));
    EXPECT_NEAR(gapped_values[3], 3.5, 1e-9);
}

TEST(IndicatorsTest, TrueRangeUsesPreviousClose) {
    IndicatorSeries highs{10.0, 12.0, 11.0};
    IndicatorSeries lows{9.0, 11.5, 8.0};
    IndicatorSeries closes{9.5, 11.8, 9.0};

    IndicatorSeries true_range_values = true_range(highs, lows, closes);
    EXPECT_FALSE(is_defined(true_range_values[0]));
    EXPECT_NEAR(true_range_values[1], 2.5, 1e-9);   // gap up over 9.5
    EXPECT_NEAR(true_range_values[2], 3.8, 1e-9);   // 11.8 down to 8
}

TEST(IndicatorsTest, AtrOfConstantRangeEqualsThatRange) {
    IndicatorSeries closes(40, 10.0);
    IndicatorSeries highs(40, 11.0);
    IndicatorSeries lows(40, 9.0);

    IndicatorSeries atr_values = atr(highs, lows, closes, 14);
    EXPECT_FALSE(is_defined(atr_values[13]));
    EXPECT_NEAR(atr_values[14], 2.0, 1e-9);
    EXPECT_NEAR(last_value(atr_values), 2.0, 1e-9);
}

TEST(IndicatorsTest, CciOfFlatPricesStaysUndefined) {
    IndicatorSeries flat(30, 50.0);
    EXPECT_EQ(count_defined(cci(flat, flat, flat, 20)), 0);
}

TEST(IndicatorsTest, CciOfSteadyRampIsConstant) {
    IndicatorSeries ramp = counting_series(30, 100.0, 1.0);
    IndicatorSeries cci_values = cci(ramp, ramp, ramp, 20);

    EXPECT_FALSE(is_defined(cci_values[18]));
    // 9.5 steps above the mean over a mean deviation of 5 steps
    EXPECT_NEAR(cci_values[19], 9.5 / (0.015 * 5.0), 1e-6);
    EXPECT_NEAR(last_value(cci_values), 9.5 / (0.015 * 5.0), 1e-6);
}

TEST(IndicatorsTest, CciShorterThanPeriodIsAllUndefined) {
    IndicatorSeries short_series = counting_series(5, 1.0, 1.0);
    EXPECT_EQ(count_defined(cci(short_series, short_series, short_series, 20)), 0);
}

TEST(IndicatorsTest, SeriesHelpers) {
    IndicatorSeries values{UNDEFINED_VALUE, 2.0, 4.0, UNDEFINED_VALUE};

    EXPECT_FALSE(is_defined(last_value(values)));
    EXPECT_DOUBLE_EQ(last_defined_value(values), 4.0);
    EXPECT_DOUBLE_EQ(value_from_end(values, 1), 4.0);
    EXPECT_FALSE(is_defined(value_from_end(values, 4)));
    EXPECT_EQ(count_defined(values), 2);
    EXPECT_EQ(drop_undefined(values), (IndicatorSeries{2.0, 4.0}));
    EXPECT_FALSE(is_defined(last_value(IndicatorSeries{})));

    IndicatorSeries ramp{1.0, 2.0, 3.0, 4.0};
    EXPECT_DOUBLE_EQ(tail_mean(ramp, 2), 3.5);
    EXPECT_FALSE(is_defined(tail_mean(ramp, 5)));
    EXPECT_DOUBLE_EQ(range_mean(ramp, 0, 2), 1.5);
    EXPECT_DOUBLE_EQ(range_max(ramp, 1, 3), 3.0);
    EXPECT_DOUBLE_EQ(range_min(ramp, 1, 3), 2.0);
    EXPECT_FALSE(is_defined(range_mean(ramp, 2, 2)));
}

TEST(IndicatorsTest, TrailingReturn) {
    IndicatorSeries closes{100.0, 105.0, 110.0};

    EXPECT_NEAR(trailing_return(closes, 2), 0.10, 1e-12);
    EXPECT_NEAR(trailing_return(closes, 1), 110.0 / 105.0 - 1.0, 1e-12);
    EXPECT_FALSE(is_defined(trailing_return(closes, 3)));
    EXPECT_FALSE(is_defined(trailing_return(IndicatorSeries{0.0, 5.0}, 1)));
}

TEST(IndicatorsTest, OutputsStayAlignedWithBars) {
    std::vector<PriceBar> bars = SwingScanner::Testing::make_rising_bars(80, 20.0, 0.002);
    IndicatorSeries closes = extract_closes(bars);
    IndicatorSeries highs = extract_highs(bars);
    IndicatorSeries lows = extract_lows(bars);

    EXPECT_EQ(ema(closes, 20).size(), bars.size());
    EXPECT_EQ(sma(closes, 50).size(), bars.size());
    EXPECT_EQ(atr(highs, lows, closes, 14).size(), bars.size());
    EXPECT_EQ(cci(highs, lows, closes, 20).size(), bars.size());
    EXPECT_EQ(count_defined(sma(closes, 50)), 31);

    // Recomputing yields the same values
    EXPECT_EQ(ema(closes, 8), ema(closes, 8));
}
