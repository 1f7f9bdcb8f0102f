#include "logging_thread.hpp"
#include "logging/logs/system_logs.hpp"
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace SwingScanner {
namespace Threads {

void LoggingThread::operator()() {
    try {
        Logging::set_logging_context(logging_context);
        Logging::set_log_thread_tag("LOGGER");

        std::ofstream log_file(scan_logger->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            throw std::runtime_error("Failed to open log file: " + scan_logger->get_file_path());
        }

        while (scan_logger->is_running()) {
            try {
                scan_logger->drain_with_timeout(log_file, poll_interval_ms);
            } catch (const std::exception& drain_exception) {
                Logging::SystemLogs::log_logging_thread_exception(drain_exception.what());
            }
        }

        Logging::SystemLogs::log_logging_thread_exited();
        scan_logger->drain_remaining(log_file);
    } catch (const std::exception& thread_exception) {
        // The logger itself failed; stderr is the only channel left
        std::cerr << "LoggingThread exception: " << thread_exception.what() << std::endl;
    }
}

} // namespace Threads
} // namespace SwingScanner
