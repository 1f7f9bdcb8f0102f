#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "configs/system_config.hpp"
#include "csv_setup_logger.hpp"

namespace SwingScanner {
namespace Logging {

// Width of the [TAG] column in every log line
constexpr size_t LOG_TAG_WIDTH = 6;

/**
 * Line queue between the scan threads and the logging thread.
 * Producers only enqueue; the logging thread writes each line to the console and the run log.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path), running(false) {}

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    const std::string& get_file_path() const { return file_path; }

    void start() { running.store(true); }
    void stop();
    bool is_running() const { return running.load(); }

    void enqueue(const std::string& formatted_line);

    // Waits up to poll_interval_ms for lines, then writes everything queued. Returns the number written.
    size_t drain_with_timeout(std::ofstream& log_file, int poll_interval_ms);
    // Writes whatever is still queued without waiting
    size_t drain_remaining(std::ofstream& log_file);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_condition;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running;

    void write_line(const std::string& log_line, std::ofstream& log_file);
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::shared_ptr<CSVSetupLogger> csv_setup_logger;
    std::mutex console_mutex;
    std::string run_folder;
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;

    // "MAIN  " for threads that never tagged themselves
    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);
};

// Tag for the calling thread, padded or cut to LOG_TAG_WIDTH
void set_log_thread_tag(const std::string& thread_tag_value);

// "<time> [TAG   ]   message". Goes to the async logger when one is installed, else straight to the console
// (and to log_file_path when given).
void log_message(const std::string& message, const std::string& log_file_path);

// Throws std::runtime_error when the calling thread has no context
LoggingContext* get_logging_context();
void set_logging_context(LoggingContext& context);

// Validates the config, creates runtime_logs/run_<stamp>_<commit>/ and installs the async logger on the context
std::shared_ptr<AsyncLogger> initialize_run_logging(const SwingScanner::Config::SystemConfig& config);

// Setup CSV inside the run folder; requires initialize_run_logging first
std::shared_ptr<CSVSetupLogger> initialize_csv_setup_logger(const std::string& base_filename);

} // namespace Logging
} // namespace SwingScanner

#endif // ASYNC_LOGGER_HPP
