#include <gtest/gtest.h>
#include "scanner/config_loader/config_loader.hpp"
#include "scanner/config_loader/universe_loader.hpp"
#include <stdexcept>
#include <string>

using SwingScanner::Config::SystemConfig;

namespace {
    const std::string test_data_directory = SWING_SCANNER_TEST_DATA_DIR;
}

TEST(ConfigLoaderTest, DefaultsAreValid) {
    SystemConfig config;
    std::string error_message;

    EXPECT_TRUE(validate_config(config, error_message));
    EXPECT_TRUE(error_message.empty());
    EXPECT_DOUBLE_EQ(config.strategy.breakout.confirmed_volume_ratio, 1.5);
    EXPECT_DOUBLE_EQ(config.strategy.risk.max_risk_pct, 0.15);
    EXPECT_EQ(config.scanner.benchmark_symbol, "SPY");
    EXPECT_EQ(config.scanner.sector_highlight_threshold, 3);
}

TEST(ConfigLoaderTest, FilesOverrideDefaults) {
    SystemConfig config;
    ASSERT_EQ(load_system_config(config, test_data_directory + "/config_valid"), 0);

    EXPECT_DOUBLE_EQ(config.strategy.breakout.confirmed_volume_ratio, 1.6);
    EXPECT_DOUBLE_EQ(config.strategy.base.minimum_quality_score, 30.0);
    EXPECT_DOUBLE_EQ(config.strategy.risk.max_risk_pct, 0.12);
    EXPECT_EQ(config.scanner.benchmark_symbol, "QQQ");
    EXPECT_EQ(config.scanner.concurrency_limit, 4);
    EXPECT_EQ(config.data_source.csv_directory, "tests/data/bars");
    EXPECT_FALSE(config.data_source.enable_ssl_verification);
    EXPECT_TRUE(config.logging.log_rejected_tickers);
    EXPECT_EQ(config.logging.logging_poll_interval_ms, 100);

    // Untouched keys keep their defaults
    EXPECT_DOUBLE_EQ(config.strategy.breakout.level_volume_ratio, 1.15);
    EXPECT_EQ(config.strategy.indicators.cci_period, 20);
}

TEST(ConfigLoaderTest, UnknownKeyFailsTheLoad) {
    SystemConfig config;
    EXPECT_NE(load_system_config(config, test_data_directory + "/config_unknown_key"), 0);
}

TEST(ConfigLoaderTest, KeyWithoutAValueFailsTheLoad) {
    SystemConfig config;
    EXPECT_NE(load_system_config(config, test_data_directory + "/config_missing_value"), 0);
}

TEST(ConfigLoaderTest, MissingDirectoryFailsTheLoad) {
    SystemConfig config;
    EXPECT_NE(load_system_config(config, test_data_directory + "/no_such_directory"), 0);
    EXPECT_FALSE(load_config_from_csv(config, test_data_directory + "/no_such_directory/strategy_config.csv"));
}

TEST(ConfigLoaderTest, SingleSettings) {
    SystemConfig config;

    EXPECT_TRUE(apply_config_setting(config, "pullback.cci_oversold_level", "-120"));
    EXPECT_DOUBLE_EQ(config.strategy.pullback.cci_oversold_level, -120.0);
    EXPECT_TRUE(apply_config_setting(config, "logging.log_zone_tables", "yes"));
    EXPECT_TRUE(config.logging.log_zone_tables);

    EXPECT_FALSE(apply_config_setting(config, "pullback.no_such_key", "1"));
    EXPECT_ANY_THROW(apply_config_setting(config, "scanner.concurrency_limit", "many"));
    EXPECT_THROW(apply_config_setting(config, "logging.log_zone_tables", "maybe"), std::runtime_error);
}

class ConfigValidationTest : public ::testing::Test {
protected:
    SystemConfig config;
    std::string error_message;
};

TEST_F(ConfigValidationTest, ConcurrencyOutOfRange) {
    config.scanner.concurrency_limit = 0;
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("concurrency_limit"), std::string::npos);

    config.scanner.concurrency_limit = 65;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST_F(ConfigValidationTest, UnknownProvider) {
    config.data_source.provider = "ftp";
    EXPECT_FALSE(validate_config(config, error_message));
    EXPECT_NE(error_message.find("ftp"), std::string::npos);
}

TEST_F(ConfigValidationTest, AlpacaNeedsCredentials) {
    config.data_source.provider = "alpaca";
    EXPECT_FALSE(validate_config(config, error_message));

    config.data_source.api_key = "key";
    config.data_source.api_secret = "secret";
    EXPECT_TRUE(validate_config(config, error_message));
}

TEST_F(ConfigValidationTest, InvertedPercentageBand) {
    config.strategy.breakout.confirmed_min_above_pct = 0.05;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST_F(ConfigValidationTest, NonPositivePeriod) {
    config.strategy.indicators.atr_period = 0;
    EXPECT_FALSE(validate_config(config, error_message));
}

TEST(UniverseLoaderTest, ReadsSymbolsAndSectorsInFileOrder) {
    std::vector<SwingScanner::Core::UniverseEntry> universe = SwingScanner::Core::load_universe(test_data_directory + "/universe.csv");

    ASSERT_EQ(universe.size(), 4u);
    EXPECT_EQ(universe[0].symbol, "AAPL");
    EXPECT_EQ(universe[0].sector, "Technology");
    EXPECT_EQ(universe[1].symbol, "MSFT");
    EXPECT_EQ(universe[1].sector, "Technology");
    EXPECT_EQ(universe[2].symbol, "JPM");
    EXPECT_EQ(universe[3].symbol, "XOM");
    EXPECT_TRUE(universe[3].sector.empty());
}

TEST(UniverseLoaderTest, MissingFileThrows) {
    EXPECT_THROW(SwingScanner::Core::load_universe(test_data_directory + "/no_such_universe.csv"), std::runtime_error);
}
