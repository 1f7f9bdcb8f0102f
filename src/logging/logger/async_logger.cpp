#include "async_logger.hpp"
#include "scanner/config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <array>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace SwingScanner {
namespace Logging {

namespace {

thread_local LoggingContext* current_logging_context = nullptr;

std::string normalize_thread_tag(const std::string& tag_value) {
    std::string tag_string = tag_value.substr(0, LOG_TAG_WIDTH);
    tag_string.resize(LOG_TAG_WIDTH, ' ');
    return tag_string;
}

// Short commit of the working tree the scanner runs from, "nogit" outside a checkout
std::string read_commit_hash() {
    std::unique_ptr<FILE, int (*)(FILE*)> git_pipe(popen("git rev-parse --short HEAD 2>/dev/null", "r"), pclose);
    if (!git_pipe) {
        return "nogit";
    }

    std::string commit_hash;
    std::array<char, 64> read_buffer;
    while (fgets(read_buffer.data(), static_cast<int>(read_buffer.size()), git_pipe.get()) != nullptr) {
        commit_hash += read_buffer.data();
    }
    while (!commit_hash.empty() && (commit_hash.back() == '\n' || commit_hash.back() == '\r')) {
        commit_hash.pop_back();
    }
    return commit_hash.empty() ? "nogit" : commit_hash;
}

// "setups.csv" -> "<folder>/setups_<scan stamp>.csv"
std::string stamped_path_in_folder(const std::string& folder, const std::string& configured_name, const std::string& default_extension) {
    std::filesystem::path file_name = std::filesystem::path(configured_name).filename();
    std::string extension = file_name.has_extension() ? file_name.extension().string() : default_extension;
    std::string stem = file_name.stem().string();
    return (std::filesystem::path(folder) / (stem + "_" + TimeUtils::get_current_scan_id() + extension)).string();
}

std::string create_run_folder(const std::string& runtime_log_directory) {
    std::filesystem::path run_folder = std::filesystem::path(runtime_log_directory) /
                                       ("run_" + TimeUtils::get_current_scan_id() + "_" + read_commit_hash());
    std::error_code filesystem_error;
    std::filesystem::create_directories(run_folder, filesystem_error);
    if (filesystem_error) {
        throw std::runtime_error("Failed to create run folder " + run_folder.string() + ": " + filesystem_error.message());
    }
    return run_folder.string();
}

} // anonymous namespace

// ========================================================================
// CONTEXT
// ========================================================================

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    auto thread_tag_iterator = thread_tags.find(std::this_thread::get_id());
    return thread_tag_iterator != thread_tags.end() ? thread_tag_iterator->second : "MAIN  ";
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> thread_tag_lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = normalize_thread_tag(tag_value);
}

LoggingContext* get_logging_context() {
    if (!current_logging_context) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }
    return current_logging_context;
}

void set_logging_context(LoggingContext& context) {
    current_logging_context = &context;
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    get_logging_context()->set_thread_tag(thread_tag_value);
}

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* logging_context = get_logging_context();

        std::ostringstream line_stream;
        line_stream << TimeUtils::get_current_human_readable_time() << " [" << logging_context->get_thread_tag() << "]   " << message << '\n';
        const std::string formatted_line = line_stream.str();

        if (logging_context->async_logger) {
            logging_context->async_logger->enqueue(formatted_line);
            return;
        }

        {
            std::lock_guard<std::mutex> console_lock(logging_context->console_mutex);
            std::cout << formatted_line << std::flush;
        }
        if (!log_file_path.empty()) {
            std::ofstream log_file_stream(log_file_path, std::ios::app);
            if (!log_file_stream.is_open()) {
                std::cerr << "ERROR: Failed to open log file: " << log_file_path << std::endl;
                return;
            }
            log_file_stream << formatted_line;
        }
    } catch (const std::exception& logging_exception) {
        std::cerr << "CRITICAL ERROR: Logging system failure: " << logging_exception.what() << '\n' << message << std::endl;
    }
}

// ========================================================================
// ASYNC LOGGER
// ========================================================================

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        running.store(false);
    }
    queue_condition.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_condition.notify_one();
}

void AsyncLogger::write_line(const std::string& log_line, std::ofstream& log_file) {
    {
        std::lock_guard<std::mutex> console_lock(get_logging_context()->console_mutex);
        std::cout << log_line << std::flush;
    }
    if (log_file.is_open()) {
        log_file << log_line;
        log_file.flush();
    }
}

size_t AsyncLogger::drain_with_timeout(std::ofstream& log_file, int poll_interval_ms) {
    std::deque<std::string> ready_lines;
    {
        std::unique_lock<std::mutex> queue_lock(queue_mutex);
        // Timed wait so stop() is noticed on a quiet queue
        queue_condition.wait_for(queue_lock, std::chrono::milliseconds(poll_interval_ms),
                                 [this]() { return !pending_lines.empty() || !running.load(); });
        ready_lines.swap(pending_lines);
    }
    for (const std::string& log_line : ready_lines) {
        write_line(log_line, log_file);
    }
    return ready_lines.size();
}

size_t AsyncLogger::drain_remaining(std::ofstream& log_file) {
    std::deque<std::string> ready_lines;
    {
        std::lock_guard<std::mutex> queue_lock(queue_mutex);
        ready_lines.swap(pending_lines);
    }
    for (const std::string& log_line : ready_lines) {
        write_line(log_line, log_file);
    }
    return ready_lines.size();
}

// ========================================================================
// RUN SETUP
// ========================================================================

std::shared_ptr<AsyncLogger> initialize_run_logging(const SwingScanner::Config::SystemConfig& config) {
    LoggingContext* logging_context = get_logging_context();

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        std::cerr << "ERROR: Config error: " << configuration_error_message << std::endl;
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    logging_context->run_folder = create_run_folder(config.logging.runtime_log_directory);

    auto scan_logger = std::make_shared<AsyncLogger>(stamped_path_in_folder(logging_context->run_folder, config.logging.log_file, ".log"));
    logging_context->async_logger = scan_logger;
    set_log_thread_tag("MAIN");
    return scan_logger;
}

std::shared_ptr<CSVSetupLogger> initialize_csv_setup_logger(const std::string& base_filename) {
    LoggingContext* logging_context = get_logging_context();
    if (logging_context->run_folder.empty()) {
        throw std::runtime_error("Run folder not initialized - call initialize_run_logging first");
    }

    auto setup_logger = std::make_shared<CSVSetupLogger>(stamped_path_in_folder(logging_context->run_folder, base_filename, ".csv"));
    logging_context->csv_setup_logger = setup_logger;
    return setup_logger;
}

} // namespace Logging
} // namespace SwingScanner
