#ifndef SCAN_LOGS_HPP
#define SCAN_LOGS_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <string>

namespace SwingScanner {
namespace Logging {

/**
 * Scan lifecycle logging: regime gate, progress, per-ticker failures and the closing summary.
 */
class ScanLogs {
public:
    static void log_scan_started(const std::string& scan_id, int universe_size);
    static void log_scan_already_running();
    static void log_regime(const Core::RegimeSnapshot& regime);
    static void log_bearish_regime_skip();
    static void log_benchmark_return(const std::string& benchmark_symbol, double benchmark_return);
    static void log_benchmark_fetch_failed(const std::string& benchmark_symbol, const std::string& error_message);
    static void log_progress(int completed_count, int total_count);
    static void log_ticker_skipped(const std::string& ticker, const std::string& skip_reason);
    static void log_ticker_error(const std::string& ticker, const std::string& error_message);
    static void log_result_logging_failed(const std::string& subject, const std::string& error_message);
    static void log_scan_cancelled(int completed_count, int total_count);
    static void log_scan_summary(const Core::ScanReport& report);
    static void log_results_written(const std::string& output_path);
};

} // namespace Logging
} // namespace SwingScanner

#endif // SCAN_LOGS_HPP
