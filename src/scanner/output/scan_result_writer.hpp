#ifndef SCAN_RESULT_WRITER_HPP
#define SCAN_RESULT_WRITER_HPP

#include <string>
#include <nlohmann/json.hpp>
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * JSON rendering of a scan report. Prices are rounded to cents here and nowhere else.
 */
class ScanResultWriter {
public:
    static nlohmann::json setup_to_json(const Setup& setup);
    static nlohmann::json report_to_json(const ScanReport& report);

    // Writes report_to_json to path; throws std::runtime_error when the file cannot be written
    static void write_json(const ScanReport& report, const std::string& output_path);
};

// Cents for prices, two decimals for percentages and ratios
double round_to_cents(double value);

} // namespace Core
} // namespace SwingScanner

#endif // SCAN_RESULT_WRITER_HPP
