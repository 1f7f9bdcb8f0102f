#ifndef CSV_SETUP_LOGGER_HPP
#define CSV_SETUP_LOGGER_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <fstream>
#include <string>
#include <mutex>
#include <memory>

namespace SwingScanner {
namespace Logging {

/**
 * CSV logger for scan output.
 * One row per setup and one row per engine rejection, appended to runtime_logs/run_<id>/setups_<id>.csv
 */
class CSVSetupLogger {
private:
    std::string file_path;
    std::ofstream file_stream;
    std::mutex file_mutex;
    bool initialized = false;

    void write_header();
    void ensure_initialized();

public:
    explicit CSVSetupLogger(const std::string& log_file_path);
    ~CSVSetupLogger();

    // No default constructor - system must fail if not properly initialized
    CSVSetupLogger() = delete;

    CSVSetupLogger(const CSVSetupLogger&) = delete;
    CSVSetupLogger& operator=(const CSVSetupLogger&) = delete;

    CSVSetupLogger(CSVSetupLogger&& other) noexcept;
    CSVSetupLogger& operator=(CSVSetupLogger&& other) noexcept;

    const std::string& get_file_path() const { return file_path; }

    /**
     * Log a setup produced by one of the engines
     */
    void log_setup(const std::string& timestamp, const std::string& scan_id, const Core::Setup& setup);

    /**
     * Log why an engine produced nothing for a ticker
     */
    void log_rejection(const std::string& timestamp, const std::string& scan_id, const std::string& ticker,
                       const std::string& engine_name, Core::OutcomeReason reason, const std::string& detail);
};

// Short variant label written to the detail column (path, base type and signal, or watch level)
std::string describe_setup_variant(const Core::Setup& setup);

} // namespace Logging
} // namespace SwingScanner

#endif // CSV_SETUP_LOGGER_HPP
