#include "scan_logs.hpp"
#include "engine_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <algorithm>

namespace SwingScanner {
namespace Logging {

void ScanLogs::log_scan_started(const std::string& scan_id, int universe_size) {
    LOG_SCAN_HEADER(scan_id);
    log_message("SCAN: " + std::to_string(universe_size) + " tickers queued", "");
}

void ScanLogs::log_scan_already_running() {
    log_message("WARNING: A scan is already in progress, request ignored", "");
}

void ScanLogs::log_regime(const Core::RegimeSnapshot& regime) {
    TABLE_HEADER_30("Market Regime", regime.label);
    TABLE_ROW_30("Benchmark Close", EngineLogs::format_price(regime.benchmark_close));
    TABLE_ROW_30("Benchmark EMA20", EngineLogs::format_price(regime.benchmark_ema20));
    TABLE_ROW_30("Bullish", regime.is_bullish ? "YES" : "NO");
    TABLE_FOOTER_30();
}

void ScanLogs::log_bearish_regime_skip() {
    log_message("SCAN: Regime is not bullish, no tickers analyzed", "");
}

void ScanLogs::log_benchmark_return(const std::string& benchmark_symbol, double benchmark_return) {
    log_message("SCAN: " + benchmark_symbol + " 3-month return " + EngineLogs::format_percentage(benchmark_return), "");
}

void ScanLogs::log_benchmark_fetch_failed(const std::string& benchmark_symbol, const std::string& error_message) {
    log_message("ERROR: Failed to fetch benchmark " + benchmark_symbol + ": " + error_message, "");
}

void ScanLogs::log_progress(int completed_count, int total_count) {
    log_message("SCAN: " + std::to_string(completed_count) + "/" + std::to_string(total_count) + " tickers analyzed", "");
}

void ScanLogs::log_ticker_skipped(const std::string& ticker, const std::string& skip_reason) {
    log_message(ticker + " skipped: " + skip_reason, "");
}

void ScanLogs::log_ticker_error(const std::string& ticker, const std::string& error_message) {
    log_message("ERROR: " + ticker + " analysis failed: " + error_message, "");
}

void ScanLogs::log_result_logging_failed(const std::string& subject, const std::string& error_message) {
    log_message("ERROR: Logging " + subject + " results failed: " + error_message, "");
}

void ScanLogs::log_scan_cancelled(int completed_count, int total_count) {
    log_message("SCAN: Cancelled after " + std::to_string(completed_count) + "/" + std::to_string(total_count) + " tickers", "");
}

void ScanLogs::log_scan_summary(const Core::ScanReport& report) {
    TABLE_HEADER_30("Scan Summary", report.scan_id);
    TABLE_ROW_30("Regime", report.regime.label);
    TABLE_ROW_30("Tickers", std::to_string(report.ticker_results.size()));
    TABLE_ROW_30("Setups", std::to_string(report.setups.size()));
    for (const auto& setup_type_count : report.setup_type_counts) {
        TABLE_ROW_30(setup_type_count.first, std::to_string(setup_type_count.second));
    }
    TABLE_FOOTER_30();

    if (report.sector_counts.empty()) {
        return;
    }
    TABLE_HEADER_30("Sector", "Setups");
    for (const auto& sector_count : report.sector_counts) {
        bool is_hot_sector = std::find(report.hot_sectors.begin(), report.hot_sectors.end(), sector_count.first) != report.hot_sectors.end();
        TABLE_ROW_30(sector_count.first, std::to_string(sector_count.second) + (is_hot_sector ? "  HOT" : ""));
    }
    TABLE_FOOTER_30();
}

void ScanLogs::log_results_written(const std::string& output_path) {
    log_message("SCAN: Results written to " + output_path, "");
}

} // namespace Logging
} // namespace SwingScanner
