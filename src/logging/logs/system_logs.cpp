#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

namespace SwingScanner {
namespace Logging {

void SystemLogs::log_startup_banner(const std::string& version, const std::string& config_directory) {
    LOG_THREAD_SECTION_HEADER("SWING SCANNER " + version);
    LOG_THREAD_CONTENT("Config directory: " + config_directory);
    LOG_THREAD_SECTION_FOOTER();
}

void SystemLogs::log_startup_complete(const std::string& run_folder, const std::string& provider_name) {
    log_message("SYSTEM_STARTUP: Startup completed (run folder " + run_folder + ", data provider " + provider_name + ")", "");
}

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SHUTDOWN: Signal " + std::to_string(signal_number) + " received, cancelling scan", "");
}

void SystemLogs::log_shutdown_complete() {
    log_message("SHUTDOWN: Scanner stopped", "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_logging_thread_exception(const std::string& error_message) {
    log_message("LoggingThread exception: " + error_message, "");
}

void SystemLogs::log_logging_thread_exited() {
    log_message("LoggingThread exited", "");
}

void SystemLogs::log_worker_pool_started(int worker_count) {
    log_message("THREAD_STARTUP: " + std::to_string(worker_count) + " scan workers started", "");
}

void SystemLogs::log_worker_task_exception(const std::string& error_message) {
    log_message("ERROR: Scan worker task failed: " + error_message, "");
}

} // namespace Logging
} // namespace SwingScanner
