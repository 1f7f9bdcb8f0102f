#include "scan_pipeline.hpp"
#include "logging/logger/csv_setup_logger.hpp"
#include "logging/logs/config_logs.hpp"
#include "logging/logs/engine_logs.hpp"
#include "logging/logs/scan_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "scanner/regime/regime_filter.hpp"
#include "scanner/relative_strength/rs_engine.hpp"
#include "threads/scan_worker_pool.hpp"
#include "ticker_analyzer.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

namespace SwingScanner {
namespace Core {

namespace {

// Progress line every this many tickers
constexpr int PROGRESS_LOG_INTERVAL = 25;

} // anonymous namespace

ScanContext ScanPipeline::build_scan_context(const std::string& scan_id) const {
    ScanContext scan_context;
    scan_context.scan_id = scan_id;
    scan_context.benchmark_symbol = config.scanner.benchmark_symbol;

    try {
        scan_context.benchmark_bars = provider.get_daily_bars(
            DailyBarRequest(config.scanner.benchmark_symbol, config.data_source.lookback_calendar_days));
        scan_context.regime = check_market_regime(scan_context.benchmark_bars, config.strategy.regime);
    } catch (const std::exception& fetch_exception) {
        Logging::ScanLogs::log_benchmark_fetch_failed(config.scanner.benchmark_symbol, fetch_exception.what());
        scan_context.benchmark_bars.clear();
        scan_context.regime = RegimeSnapshot();
        scan_context.regime.label = std::string("ERROR: ") + fetch_exception.what();
    }
    return scan_context;
}

TickerScanResult ScanPipeline::scan_ticker(const UniverseEntry& universe_entry, const ScanContext& scan_context) const {
    std::vector<PriceBar> ticker_bars;
    try {
        ticker_bars = provider.get_daily_bars(DailyBarRequest(universe_entry.symbol, config.data_source.lookback_calendar_days));
    } catch (const std::exception& fetch_exception) {
        TickerScanResult fetch_failed_result;
        fetch_failed_result.ticker = universe_entry.symbol;
        fetch_failed_result.sector = universe_entry.sector.empty() ? config.scanner.default_sector : universe_entry.sector;
        fetch_failed_result.skip_reason = std::string("Fetch failed: ") + fetch_exception.what();
        return fetch_failed_result;
    }

    TickerAnalyzer ticker_analyzer(config);
    try {
        return ticker_analyzer.analyze(universe_entry, ticker_bars, scan_context);
    } catch (const std::exception& analysis_exception) {
        TickerScanResult failed_result;
        failed_result.ticker = universe_entry.symbol;
        failed_result.sector = universe_entry.sector.empty() ? config.scanner.default_sector : universe_entry.sector;
        failed_result.error_message = analysis_exception.what();
        return failed_result;
    }
}

void ScanPipeline::log_ticker_result(const std::string& scan_id, const TickerScanResult& ticker_result) const {
    if (!ticker_result.skip_reason.empty()) {
        Logging::ScanLogs::log_ticker_skipped(ticker_result.ticker, ticker_result.skip_reason);
        return;
    }
    if (!ticker_result.error_message.empty()) {
        Logging::ScanLogs::log_ticker_error(ticker_result.ticker, ticker_result.error_message);
        return;
    }

    if (config.logging.log_zone_tables) {
        Logging::EngineLogs::log_zone_table(ticker_result.ticker, ticker_result.zones, ticker_result.rs_stats);
    }
    for (const Setup& setup : ticker_result.setups) {
        Logging::EngineLogs::log_setup_found(setup);
    }

    if (!config.logging.log_rejected_tickers) {
        return;
    }
    std::shared_ptr<Logging::CSVSetupLogger> csv_setup_logger = logging_context.csv_setup_logger;
    for (const EngineRejection& rejection : ticker_result.rejections) {
        Logging::EngineLogs::log_engine_rejection(ticker_result.ticker, rejection.engine_name, rejection.reason, rejection.detail);
        if (csv_setup_logger) {
            csv_setup_logger->log_rejection(TimeUtils::get_current_iso_time_with_z(), scan_id, ticker_result.ticker,
                                            rejection.engine_name, rejection.reason, rejection.detail);
        }
    }
}

void ScanPipeline::summarize_setups(ScanReport& report, int sector_highlight_threshold) {
    report.setup_type_counts.clear();
    report.sector_counts.clear();
    report.hot_sectors.clear();

    std::map<std::string, int> setups_per_sector;
    for (const Setup& setup : report.setups) {
        report.setup_type_counts[to_string(setup.setup_type)]++;
        setups_per_sector[setup.sector]++;
    }

    report.sector_counts.assign(setups_per_sector.begin(), setups_per_sector.end());
    std::stable_sort(report.sector_counts.begin(), report.sector_counts.end(),
                     [](const std::pair<std::string, int>& left, const std::pair<std::string, int>& right) {
                         return left.second > right.second;
                     });
    for (const auto& sector_count : report.sector_counts) {
        if (sector_count.second >= sector_highlight_threshold) {
            report.hot_sectors.push_back(sector_count.first);
        }
    }
}

ScanReport ScanPipeline::run_scan(const std::vector<UniverseEntry>& universe, ScanState& scan_state) {
    ScanReport report;
    report.scan_id = TimeUtils::get_current_scan_id();
    report.started_at = TimeUtils::get_current_iso_time_with_z();

    std::vector<UniverseEntry> scan_universe = universe;
    if (static_cast<int>(scan_universe.size()) > config.scanner.max_tickers_per_scan) {
        Logging::ConfigLogs::log_universe_truncated(static_cast<int>(scan_universe.size()), config.scanner.max_tickers_per_scan);
        scan_universe.resize(config.scanner.max_tickers_per_scan);
    }

    if (!scan_state.try_begin(static_cast<int>(scan_universe.size()), report.started_at)) {
        Logging::ScanLogs::log_scan_already_running();
        throw std::runtime_error("A scan is already in progress");
    }

    try {
        Logging::ScanLogs::log_scan_started(report.scan_id, static_cast<int>(scan_universe.size()));

        // ── Regime gate ──────────────────────────────────────────────────
        ScanContext scan_context = build_scan_context(report.scan_id);
        report.regime = scan_context.regime;
        Logging::ScanLogs::log_regime(scan_context.regime);

        if (!scan_context.regime.is_bullish) {
            Logging::ScanLogs::log_bearish_regime_skip();
            scan_state.set_total(0);
            report.completed_at = TimeUtils::get_current_iso_time_with_z();
            summarize_setups(report, config.scanner.sector_highlight_threshold);
            Logging::ScanLogs::log_scan_summary(report);
            std::string regime_error = scan_context.regime.label.rfind("ERROR", 0) == 0 ? scan_context.regime.label : "";
            scan_state.finish(report.completed_at, regime_error);
            return report;
        }

        scan_context.benchmark_3m_return = calculate_benchmark_return(scan_context.benchmark_bars,
                                                                      config.strategy.indicators.return_lookback_bars);
        report.benchmark_3m_return = scan_context.benchmark_3m_return;
        Logging::ScanLogs::log_benchmark_return(scan_context.benchmark_symbol, scan_context.benchmark_3m_return);

        // ── Tickers on the worker pool, results by universe index ────────
        const int ticker_total = static_cast<int>(scan_universe.size());
        report.ticker_results.resize(scan_universe.size());
        std::vector<char> ticker_started(scan_universe.size(), 0);   // char: written concurrently by workers

        int worker_count = std::max(1, std::min(config.scanner.concurrency_limit, ticker_total));
        {
            Threads::ScanWorkerPool worker_pool(worker_count, logging_context);
            Logging::SystemLogs::log_worker_pool_started(worker_pool.get_worker_count());

            for (int universe_index = 0; universe_index < ticker_total; ++universe_index) {
                worker_pool.submit([this, universe_index, ticker_total, &scan_universe, &scan_context, &report, &ticker_started, &scan_state]() {
                    if (scan_state.is_cancel_requested()) {
                        return;
                    }
                    ticker_started[universe_index] = 1;

                    report.ticker_results[universe_index] = scan_ticker(scan_universe[universe_index], scan_context);
                    try {
                        log_ticker_result(scan_context.scan_id, report.ticker_results[universe_index]);
                    } catch (const std::exception& logging_exception_error) {
                        Logging::ScanLogs::log_result_logging_failed(scan_universe[universe_index].symbol, logging_exception_error.what());
                    }

                    scan_state.record_ticker_completed();
                    int completed_count = scan_state.snapshot().progress;
                    if (completed_count % PROGRESS_LOG_INTERVAL == 0 || completed_count == ticker_total) {
                        Logging::ScanLogs::log_progress(completed_count, ticker_total);
                    }
                });
            }
            worker_pool.wait_for_all();
            worker_pool.shutdown();
        }

        // ── Aggregate in universe order ──────────────────────────────────
        for (int universe_index = 0; universe_index < ticker_total; ++universe_index) {
            TickerScanResult& ticker_result = report.ticker_results[universe_index];
            if (!ticker_started[universe_index]) {
                ticker_result.ticker = scan_universe[universe_index].symbol;
                ticker_result.sector = scan_universe[universe_index].sector.empty() ? config.scanner.default_sector
                                                                                    : scan_universe[universe_index].sector;
                ticker_result.skip_reason = "Scan cancelled";
                report.cancelled = true;
                continue;
            }
            report.setups.insert(report.setups.end(), ticker_result.setups.begin(), ticker_result.setups.end());
        }
        if (report.cancelled) {
            Logging::ScanLogs::log_scan_cancelled(scan_state.snapshot().progress, ticker_total);
        }

        std::shared_ptr<Logging::CSVSetupLogger> csv_setup_logger = logging_context.csv_setup_logger;
        if (csv_setup_logger) {
            try {
                for (const Setup& setup : report.setups) {
                    csv_setup_logger->log_setup(report.started_at, report.scan_id, setup);
                }
            } catch (const std::exception& csv_exception_error) {
                Logging::ScanLogs::log_result_logging_failed("setup CSV", csv_exception_error.what());
            }
        }

        summarize_setups(report, config.scanner.sector_highlight_threshold);
        report.completed_at = TimeUtils::get_current_iso_time_with_z();
        Logging::ScanLogs::log_scan_summary(report);
        scan_state.finish(report.completed_at, report.cancelled ? "Scan cancelled" : "");
        return report;
    } catch (const std::exception& scan_exception) {
        scan_state.finish(TimeUtils::get_current_iso_time_with_z(), scan_exception.what());
        throw;
    }
}

} // namespace Core
} // namespace SwingScanner
