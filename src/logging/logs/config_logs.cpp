#include "config_logs.hpp"
#include "logging/logger/async_logger.hpp"

namespace SwingScanner {
namespace Logging {

void ConfigLogs::log_config_file_loaded(const std::string& config_path) {
    log_message("CONFIG: Loaded " + config_path, "");
}

void ConfigLogs::log_config_parse_error(const std::string& config_line, const std::string& error_message) {
    log_message("CRITICAL: Error parsing config line: " + config_line + " - " + error_message, "");
}

void ConfigLogs::log_config_load_failed(const std::string& config_path, const std::string& error_message) {
    log_message("ERROR: Failed to load config CSV from " + config_path + ": " + error_message, "");
}

void ConfigLogs::log_config_validation_failed(const std::string& error_message) {
    log_message("CONFIG_VALIDATION: " + error_message, "");
}

void ConfigLogs::log_universe_loaded(const std::string& universe_path, int symbol_count, int duplicate_count) {
    std::string universe_message = "UNIVERSE: " + std::to_string(symbol_count) + " symbols from " + universe_path;
    if (duplicate_count > 0) {
        universe_message += " (" + std::to_string(duplicate_count) + " duplicates dropped)";
    }
    log_message(universe_message, "");
}

void ConfigLogs::log_universe_truncated(int universe_size, int max_tickers) {
    log_message("WARNING: Universe has " + std::to_string(universe_size) + " symbols, scanning the first " +
                std::to_string(max_tickers), "");
}

} // namespace Logging
} // namespace SwingScanner
