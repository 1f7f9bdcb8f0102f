#ifndef CONFIG_LOGS_HPP
#define CONFIG_LOGS_HPP

#include <string>

namespace SwingScanner {
namespace Logging {

class ConfigLogs {
public:
    static void log_config_file_loaded(const std::string& config_path);
    static void log_config_parse_error(const std::string& config_line, const std::string& error_message);
    static void log_config_load_failed(const std::string& config_path, const std::string& error_message);
    static void log_config_validation_failed(const std::string& error_message);
    static void log_universe_loaded(const std::string& universe_path, int symbol_count, int duplicate_count);
    static void log_universe_truncated(int universe_size, int max_tickers);
};

} // namespace Logging
} // namespace SwingScanner

#endif // CONFIG_LOGS_HPP
