#include <gtest/gtest.h>
#include "logging/logger/csv_setup_logger.hpp"
#include "scanner/output/scan_result_writer.hpp"
#include "scanner/pipeline/scan_pipeline.hpp"
#include "test_fixtures.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>

using namespace SwingScanner::Core;
using namespace SwingScanner::Testing;
using SwingScanner::Config::SystemConfig;

namespace {

SystemConfig make_scan_config() {
    SystemConfig config;
    config.scanner.benchmark_symbol = "SPY";
    config.scanner.concurrency_limit = 4;
    return config;
}

Setup make_setup(const std::string& ticker, const std::string& sector, SetupType setup_type) {
    Setup setup;
    setup.ticker = ticker;
    setup.sector = sector;
    setup.setup_type = setup_type;
    return setup;
}

int count_setups_of_type(const ScanReport& report, SetupType setup_type) {
    int type_count = 0;
    for (const Setup& setup : report.setups) {
        if (setup.setup_type == setup_type) type_count++;
    }
    return type_count;
}

} // anonymous namespace

TEST(ScanPipelineTest, BearishRegimeSkipsEveryTicker) {
    SystemConfig config = make_scan_config();
    SwingScanner::Logging::LoggingContext logging_context;
    InMemoryMarketDataProvider provider;
    provider.set_bars("SPY", make_falling_bars(300, 100.0, 0.002));
    provider.set_bars("AAPL", make_rising_bars(300, 30.0, 0.004));

    ScanState scan_state;
    ScanPipeline scan_pipeline(config, provider, logging_context);
    ScanReport report = scan_pipeline.run_scan({UniverseEntry("AAPL", "Technology")}, scan_state);

    EXPECT_FALSE(report.regime.is_bullish);
    EXPECT_EQ(report.regime.label, "BEARISH");
    EXPECT_TRUE(report.ticker_results.empty());
    EXPECT_TRUE(report.setups.empty());
    EXPECT_EQ(provider.get_requested_symbols(), (std::set<std::string>{"SPY"}));
    EXPECT_FALSE(scan_state.snapshot().in_progress);
}

TEST(ScanPipelineTest, MissingBenchmarkReportsARegimeError) {
    SystemConfig config = make_scan_config();
    SwingScanner::Logging::LoggingContext logging_context;
    InMemoryMarketDataProvider provider;
    provider.set_failure("SPY", "connection refused");

    ScanState scan_state;
    ScanPipeline scan_pipeline(config, provider, logging_context);
    ScanReport report = scan_pipeline.run_scan({UniverseEntry("AAPL", "Technology")}, scan_state);

    EXPECT_FALSE(report.regime.is_bullish);
    EXPECT_EQ(report.regime.label.rfind("ERROR", 0), 0u);
    EXPECT_TRUE(report.ticker_results.empty());
    EXPECT_FALSE(scan_state.snapshot().last_error.empty());
}

class BullishScanTest : public ::testing::Test {
protected:
    SystemConfig config = make_scan_config();
    SwingScanner::Logging::LoggingContext logging_context;
    InMemoryMarketDataProvider provider;
    ScanState scan_state;
    std::vector<UniverseEntry> universe = {
        UniverseEntry("STDY", "Industrials"),
        UniverseEntry("CUPX", "Technology"),
        UniverseEntry("TINY", ""),
        UniverseEntry("BADX", "Energy"),
        UniverseEntry("NONE", "Energy")
    };
    ScanReport report;

    void SetUp() override {
        provider.set_bars("SPY", make_rising_bars(300, 400.0, 0.0001));
        provider.set_bars("CUPX", make_cup_handle_bars());
        provider.set_bars("STDY", make_rising_bars(300, 30.0, 0.004));
        provider.set_bars("TINY", make_rising_bars(20, 10.0, 0.004));
        provider.set_failure("BADX", "symbol delisted");

        ScanPipeline scan_pipeline(config, provider, logging_context);
        report = scan_pipeline.run_scan(universe, scan_state);
        ASSERT_EQ(report.ticker_results.size(), universe.size());
    }
};

TEST_F(BullishScanTest, AnalyzesTickersInUniverseOrder) {
    EXPECT_TRUE(report.regime.is_bullish);
    EXPECT_EQ(report.regime.label, "BULLISH");
    EXPECT_FALSE(report.cancelled);
    for (size_t universe_index = 0; universe_index < universe.size(); ++universe_index) {
        EXPECT_EQ(report.ticker_results[universe_index].ticker, universe[universe_index].symbol);
    }
}

TEST_F(BullishScanTest, SteadyAdvanceYieldsNoActionableSetup) {
    const TickerScanResult& steady_result = report.ticker_results[0];
    EXPECT_TRUE(steady_result.analyzed);
    for (const SwingScanner::Core::Setup& setup : steady_result.setups) {
        EXPECT_EQ(setup.setup_type, SetupType::WATCHLIST);
    }
}

TEST_F(BullishScanTest, CupWithHandleSurfacesAsABaseSetup) {
    const TickerScanResult& cup_result = report.ticker_results[1];
    EXPECT_TRUE(cup_result.analyzed);
    EXPECT_TRUE(cup_result.error_message.empty());

    bool found_cup = false;
    for (const SwingScanner::Core::Setup& setup : cup_result.setups) {
        if (setup.setup_type == SetupType::BASE && setup.base && setup.base->base_type == BaseType::CUP_HANDLE) {
            found_cup = true;
            EXPECT_EQ(setup.sector, "Technology");
            EXPECT_GE(setup.base->quality_score, config.strategy.base.minimum_quality_score);
        }
    }
    EXPECT_TRUE(found_cup);
    EXPECT_GE(count_setups_of_type(report, SetupType::BASE), 1);
    ASSERT_EQ(report.setup_type_counts.count("BASE"), 1u);
    EXPECT_GE(report.setup_type_counts.at("BASE"), 1);
}

TEST_F(BullishScanTest, ShortHistoriesFetchFailuresAndMissingSymbolsAreSkipped) {
    EXPECT_FALSE(report.ticker_results[2].analyzed);
    EXPECT_FALSE(report.ticker_results[2].skip_reason.empty());
    EXPECT_EQ(report.ticker_results[2].sector, config.scanner.default_sector);

    EXPECT_FALSE(report.ticker_results[3].analyzed);
    EXPECT_EQ(report.ticker_results[3].skip_reason, "Fetch failed: symbol delisted");

    EXPECT_FALSE(report.ticker_results[4].analyzed);
    EXPECT_TRUE(report.ticker_results[4].setups.empty());
}

TEST_F(BullishScanTest, ProgressCoversEveryTicker) {
    ScanStateSnapshot state_snapshot = scan_state.snapshot();
    EXPECT_FALSE(state_snapshot.in_progress);
    EXPECT_EQ(state_snapshot.progress, static_cast<int>(universe.size()));
    EXPECT_TRUE(state_snapshot.last_error.empty());
}

TEST_F(BullishScanTest, JsonReportCarriesEverySection) {
    nlohmann::json report_json = ScanResultWriter::report_to_json(report);
    EXPECT_EQ(report_json["scan_id"].get<std::string>(), report.scan_id);
    EXPECT_TRUE(report_json.contains("started_at"));
    EXPECT_TRUE(report_json.contains("completed_at"));
    EXPECT_FALSE(report_json["cancelled"].get<bool>());
    EXPECT_TRUE(report_json["regime"]["is_bullish"].get<bool>());
    EXPECT_EQ(report_json["regime"]["label"].get<std::string>(), "BULLISH");
    EXPECT_TRUE(report_json["regime"].contains("benchmark_close"));
    EXPECT_TRUE(report_json["regime"].contains("benchmark_ema20"));
    EXPECT_TRUE(report_json.contains("benchmark_3m_return"));
    EXPECT_EQ(report_json["tickers"].size(), universe.size());
    EXPECT_EQ(report_json["setups"].size(), report.setups.size());
    EXPECT_TRUE(report_json.contains("setup_type_counts"));
    EXPECT_TRUE(report_json["sector_summary"].is_array());
}

TEST(ScanPipelineTest, CancellationMarksUnstartedTickers) {
    SystemConfig config = make_scan_config();
    SwingScanner::Logging::LoggingContext logging_context;
    InMemoryMarketDataProvider provider;
    provider.set_bars("SPY", make_rising_bars(300, 400.0, 0.0001));
    provider.set_bars("AAPL", make_rising_bars(300, 30.0, 0.004));
    provider.set_bars("MSFT", make_rising_bars(300, 40.0, 0.004));

    ScanState scan_state;
    scan_state.request_cancel();
    ScanPipeline scan_pipeline(config, provider, logging_context);
    ScanReport report = scan_pipeline.run_scan({UniverseEntry("AAPL", "Technology"), UniverseEntry("MSFT", "")}, scan_state);

    EXPECT_TRUE(report.cancelled);
    ASSERT_EQ(report.ticker_results.size(), 2u);
    EXPECT_EQ(report.ticker_results[0].skip_reason, "Scan cancelled");
    EXPECT_EQ(report.ticker_results[1].skip_reason, "Scan cancelled");
    EXPECT_EQ(report.ticker_results[1].sector, config.scanner.default_sector);
    EXPECT_TRUE(report.setups.empty());
    EXPECT_EQ(scan_state.snapshot().last_error, "Scan cancelled");
    EXPECT_EQ(provider.get_requested_symbols(), (std::set<std::string>{"SPY"}));
}

TEST(ScanPipelineTest, FailingSetupLogKeepsTickerResults) {
    SystemConfig config = make_scan_config();
    config.logging.log_rejected_tickers = true;
    SwingScanner::Logging::LoggingContext logging_context;
    const std::string csv_path = (std::filesystem::temp_directory_path() / "swing_scanner_failing_setup_log.csv").string();
    auto open_setup_logger = std::make_shared<SwingScanner::Logging::CSVSetupLogger>(csv_path);
    auto moved_setup_logger = std::make_shared<SwingScanner::Logging::CSVSetupLogger>(std::move(*open_setup_logger));
    // Every write through the moved-from logger throws
    logging_context.csv_setup_logger = open_setup_logger;

    InMemoryMarketDataProvider provider;
    provider.set_bars("SPY", make_rising_bars(300, 400.0, 0.0001));
    provider.set_bars("CUPX", make_cup_handle_bars());

    ScanState scan_state;
    ScanPipeline scan_pipeline(config, provider, logging_context);
    ScanReport report;
    ASSERT_NO_THROW(report = scan_pipeline.run_scan({UniverseEntry("CUPX", "Technology")}, scan_state));

    ASSERT_EQ(report.ticker_results.size(), 1u);
    EXPECT_EQ(report.ticker_results[0].ticker, "CUPX");
    EXPECT_TRUE(report.ticker_results[0].analyzed);
    EXPECT_FALSE(report.ticker_results[0].rejections.empty());
    EXPECT_GE(count_setups_of_type(report, SetupType::BASE), 1);
    EXPECT_TRUE(scan_state.snapshot().last_error.empty());

    moved_setup_logger.reset();
    std::filesystem::remove(csv_path);
}

TEST(ScanPipelineTest, OneScanAtATime) {
    SystemConfig config = make_scan_config();
    SwingScanner::Logging::LoggingContext logging_context;
    InMemoryMarketDataProvider provider;
    provider.set_bars("SPY", make_rising_bars(300, 400.0, 0.0001));

    ScanState scan_state;
    ASSERT_TRUE(scan_state.try_begin(1, "2024-01-01T00:00:00Z"));

    ScanPipeline scan_pipeline(config, provider, logging_context);
    EXPECT_THROW(scan_pipeline.run_scan({UniverseEntry("AAPL", "Technology")}, scan_state), std::runtime_error);
    EXPECT_TRUE(provider.get_requested_symbols().empty());
}

TEST(ScanPipelineTest, UniverseIsCapped) {
    SystemConfig config = make_scan_config();
    config.scanner.max_tickers_per_scan = 1;
    SwingScanner::Logging::LoggingContext logging_context;
    InMemoryMarketDataProvider provider;
    provider.set_bars("SPY", make_rising_bars(300, 400.0, 0.0001));
    provider.set_bars("AAPL", make_rising_bars(300, 30.0, 0.004));
    provider.set_bars("MSFT", make_rising_bars(300, 40.0, 0.004));

    ScanState scan_state;
    ScanPipeline scan_pipeline(config, provider, logging_context);
    ScanReport report = scan_pipeline.run_scan({UniverseEntry("AAPL", "Technology"), UniverseEntry("MSFT", "Technology")}, scan_state);

    ASSERT_EQ(report.ticker_results.size(), 1u);
    EXPECT_EQ(report.ticker_results[0].ticker, "AAPL");
    EXPECT_EQ(provider.get_requested_symbols().count("MSFT"), 0u);
}

class SetupSummaryTest : public ::testing::Test {
protected:
    ScanReport report;

    void SetUp() override {
        report.setups = {
            make_setup("AAA", "Technology", SetupType::BREAKOUT),
            make_setup("BBB", "Energy", SetupType::PULLBACK),
            make_setup("CCC", "Technology", SetupType::BREAKOUT),
            make_setup("DDD", "Health Care", SetupType::BASE),
            make_setup("EEE", "Technology", SetupType::WATCHLIST),
            make_setup("FFF", "Health Care", SetupType::BASE)
        };
        ScanPipeline::summarize_setups(report, 2);
    }
};

TEST_F(SetupSummaryTest, CountsByTypeAndSector) {
    EXPECT_EQ(report.setup_type_counts.at("BREAKOUT"), 2);
    EXPECT_EQ(report.setup_type_counts.at("PULLBACK"), 1);
    EXPECT_EQ(report.setup_type_counts.at("BASE"), 2);
    EXPECT_EQ(report.setup_type_counts.at("WATCHLIST"), 1);

    ASSERT_EQ(report.sector_counts.size(), 3u);
    EXPECT_EQ(report.sector_counts[0], std::make_pair(std::string("Technology"), 3));
    EXPECT_EQ(report.sector_counts[1], std::make_pair(std::string("Health Care"), 2));
    EXPECT_EQ(report.sector_counts[2], std::make_pair(std::string("Energy"), 1));
    EXPECT_EQ(report.hot_sectors, (std::vector<std::string>{"Technology", "Health Care"}));
}

TEST_F(SetupSummaryTest, SummariesAreRebuiltFromScratch) {
    report.setups.resize(1);
    ScanPipeline::summarize_setups(report, 3);
    EXPECT_EQ(report.setup_type_counts.size(), 1u);
    EXPECT_EQ(report.sector_counts.size(), 1u);
    EXPECT_TRUE(report.hot_sectors.empty());
}
