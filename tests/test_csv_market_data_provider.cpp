#include <gtest/gtest.h>
#include "api/csv/csv_market_data_provider.hpp"
#include <stdexcept>
#include <string>

using SwingScanner::API::CsvMarketDataProvider;
using SwingScanner::Core::DailyBarRequest;
using SwingScanner::Core::PriceBar;

namespace {
    const std::string bars_directory = std::string(SWING_SCANNER_TEST_DATA_DIR) + "/bars";
}

class CsvBarsFileTest : public ::testing::Test {
protected:
    std::vector<PriceBar> bars = CsvMarketDataProvider::read_bars_file(bars_directory + "/AAPL.csv");
};

TEST_F(CsvBarsFileTest, ParsesAnyColumnOrderAndSortsByDate) {
    ASSERT_EQ(bars.size(), 8u);
    EXPECT_EQ(bars.front().date, "2024-01-02");
    EXPECT_EQ(bars.back().date, "2024-01-12");
    for (size_t bar_index = 1; bar_index < bars.size(); ++bar_index) {
        EXPECT_LT(bars[bar_index - 1].date, bars[bar_index].date);
    }

    const PriceBar& latest_bar = bars.back();
    EXPECT_DOUBLE_EQ(latest_bar.open_price, 186.10);
    EXPECT_DOUBLE_EQ(latest_bar.high_price, 188.20);
    EXPECT_DOUBLE_EQ(latest_bar.low_price, 185.90);
    EXPECT_DOUBLE_EQ(latest_bar.close_price, 187.50);
    EXPECT_DOUBLE_EQ(latest_bar.adjusted_close, 187.00);
    EXPECT_DOUBLE_EQ(latest_bar.volume, 1500000.0);
}

TEST_F(CsvBarsFileTest, RepeatedDateKeepsTheLastRow) {
    ASSERT_EQ(bars.size(), 8u);
    EXPECT_EQ(bars[2].date, "2024-01-05");
    EXPECT_DOUBLE_EQ(bars[2].close_price, 180.30);
    EXPECT_DOUBLE_EQ(bars[2].adjusted_close, 179.80);
}

TEST_F(CsvBarsFileTest, UnparseableRowsAreSkipped) {
    ASSERT_EQ(bars.size(), 8u);
    EXPECT_EQ(bars[4].date, "2024-01-09");
    EXPECT_DOUBLE_EQ(bars[4].volume, 1200000.0);
    EXPECT_EQ(bars[1].date, "2024-01-04");
}

TEST_F(CsvBarsFileTest, EmptyAdjustedCloseFallsBackToClose) {
    ASSERT_FALSE(bars.empty());
    EXPECT_DOUBLE_EQ(bars.front().adjusted_close, 177.50);
}

TEST(CsvMarketDataProviderTest, OptionalAdjustedCloseAndTimestamps) {
    std::vector<PriceBar> bars = CsvMarketDataProvider::read_bars_file(bars_directory + "/NOADJ.csv");

    ASSERT_EQ(bars.size(), 2u);
    EXPECT_EQ(bars[0].date, "2024-02-01");
    EXPECT_DOUBLE_EQ(bars[0].adjusted_close, 10.20);
    EXPECT_DOUBLE_EQ(bars[1].adjusted_close, bars[1].close_price);
}

TEST(CsvMarketDataProviderTest, Failures) {
    CsvMarketDataProvider provider(bars_directory);

    EXPECT_EQ(provider.get_provider_name(), "csv");
    EXPECT_TRUE(provider.get_daily_bars(DailyBarRequest("MISSING", 365)).empty());
    EXPECT_THROW(provider.get_daily_bars(DailyBarRequest("BROKEN", 365)), std::runtime_error);
    EXPECT_THROW(provider.get_daily_bars(DailyBarRequest("", 365)), std::runtime_error);
    EXPECT_THROW(CsvMarketDataProvider(""), std::runtime_error);
}

TEST(CsvMarketDataProviderTest, LookbackCountsBackFromTheLatestBar) {
    CsvMarketDataProvider provider(bars_directory);

    std::vector<PriceBar> recent_bars = provider.get_daily_bars(DailyBarRequest("AAPL", 3));
    ASSERT_EQ(recent_bars.size(), 4u);
    EXPECT_EQ(recent_bars.front().date, "2024-01-09");

    EXPECT_EQ(provider.get_daily_bars(DailyBarRequest("AAPL", 730)).size(), 8u);
}
