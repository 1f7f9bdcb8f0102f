#include "csv_setup_logger.hpp"
#include <iomanip>
#include <stdexcept>

namespace SwingScanner {
namespace Logging {

namespace {

// Commas would break the column layout
std::string sanitize_csv_field(const std::string& field_value) {
    std::string sanitized_value = field_value;
    for (char& field_character : sanitized_value) {
        if (field_character == ',' || field_character == '\n') {
            field_character = ';';
        }
    }
    return sanitized_value;
}

} // anonymous namespace

CSVSetupLogger::CSVSetupLogger(const std::string& log_file_path) : file_path(log_file_path) {
    file_stream.open(file_path, std::ios::out | std::ios::app);
    if (!file_stream.is_open()) {
        throw std::runtime_error("Failed to open CSV setup log file: " + file_path);
    }

    // Write header if file is empty
    file_stream.seekp(0, std::ios::end);
    if (file_stream.tellp() == 0) {
        write_header();
    }

    initialized = true;
}

CSVSetupLogger::~CSVSetupLogger() {
    if (file_stream.is_open()) {
        file_stream.close();
    }
}

CSVSetupLogger::CSVSetupLogger(CSVSetupLogger&& other) noexcept
    : file_path(std::move(other.file_path)),
      file_stream(std::move(other.file_stream)),
      file_mutex(),
      initialized(other.initialized) {
    other.initialized = false;
}

CSVSetupLogger& CSVSetupLogger::operator=(CSVSetupLogger&& other) noexcept {
    if (this != &other) {
        if (file_stream.is_open()) {
            file_stream.close();
        }

        file_path = std::move(other.file_path);
        file_stream = std::move(other.file_stream);
        initialized = other.initialized;
        other.initialized = false;
    }
    return *this;
}

void CSVSetupLogger::write_header() {
    file_stream << "timestamp,scan_id,ticker,sector,event_type,setup_type,detail,entry,stop_loss,take_profit,risk_reward,setup_date\n";
    file_stream.flush();
}

void CSVSetupLogger::ensure_initialized() {
    if (!initialized || !file_stream.is_open()) {
        throw std::runtime_error("CSV setup logger not properly initialized");
    }
}

void CSVSetupLogger::log_setup(const std::string& timestamp, const std::string& scan_id, const Core::Setup& setup) {
    ensure_initialized();
    std::lock_guard<std::mutex> lock(file_mutex);

    file_stream << timestamp << ","
                << scan_id << ","
                << setup.ticker << ","
                << sanitize_csv_field(setup.sector) << ","
                << "SETUP" << ","
                << Core::to_string(setup.setup_type) << ","
                << describe_setup_variant(setup) << ","
                << std::fixed << std::setprecision(2) << setup.entry << ","
                << setup.stop_loss << ","
                << setup.take_profit << ","
                << setup.risk_reward << ","
                << setup.setup_date << "\n";

    file_stream.flush();
}

void CSVSetupLogger::log_rejection(const std::string& timestamp, const std::string& scan_id, const std::string& ticker,
                                   const std::string& engine_name, Core::OutcomeReason reason, const std::string& detail) {
    ensure_initialized();
    std::lock_guard<std::mutex> lock(file_mutex);

    file_stream << timestamp << ","
                << scan_id << ","
                << ticker << ",,"
                << Core::to_string(reason) << ","
                << engine_name << ","
                << sanitize_csv_field(detail) << ",,,,," << "\n";

    file_stream.flush();
}

std::string describe_setup_variant(const Core::Setup& setup) {
    if (setup.breakout) {
        return Core::to_string(setup.breakout->path);
    }
    if (setup.pullback) {
        return setup.pullback->is_relaxed ? "RELAXED" : "STRICT";
    }
    if (setup.base) {
        return Core::to_string(setup.base->base_type) + "_" + Core::to_string(setup.base->signal);
    }
    if (setup.watchlist) {
        return Core::to_string(setup.watchlist->level_type);
    }
    return "";
}

} // namespace Logging
} // namespace SwingScanner
