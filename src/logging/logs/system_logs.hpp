#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

namespace SwingScanner {
namespace Logging {

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_startup_banner(const std::string& version, const std::string& config_directory);
    static void log_startup_complete(const std::string& run_folder, const std::string& provider_name);
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_shutdown_requested(int signal_number);
    static void log_shutdown_complete();
    static void log_fatal_error(const std::string& error_message);

    // Logging thread
    static void log_logging_thread_exception(const std::string& error_message);
    static void log_logging_thread_exited();

    // Worker pool
    static void log_worker_pool_started(int worker_count);
    static void log_worker_task_exception(const std::string& error_message);
};

} // namespace Logging
} // namespace SwingScanner

#endif // SYSTEM_LOGS_HPP
