// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

namespace SwingScanner {
namespace Config {

struct LoggingConfig {
    std::string log_file;                            // Base log filename inside the run folder
    std::string runtime_log_directory;               // Parent directory for run folders
    std::string setups_csv_file;                     // Base filename of the setup CSV log
    int logging_poll_interval_ms;                    // Logging thread flush interval
    bool log_rejected_tickers;                       // Log the reason every engine produced nothing
    bool log_zone_tables;                            // Log the zone table per ticker

    LoggingConfig()
        : log_file("swing_scanner.log"), runtime_log_directory("runtime_logs"), setups_csv_file("setups"),
          logging_poll_interval_ms(200), log_rejected_tickers(false), log_zone_tables(false) {}
};

} // namespace Config
} // namespace SwingScanner

#endif // LOGGING_CONFIG_HPP
