#ifndef ENGINE_LOGS_HPP
#define ENGINE_LOGS_HPP

#include "scanner/data_structures/data_structures.hpp"
#include <string>
#include <vector>

namespace SwingScanner {
namespace Logging {

/**
 * Per-ticker engine output: setups found, zone tables and rejection reasons.
 */
class EngineLogs {
public:
    static void log_setup_found(const Core::Setup& setup);
    static void log_engine_rejection(const std::string& ticker, const std::string& engine_name,
                                     Core::OutcomeReason reason, const std::string& detail);
    static void log_zone_table(const std::string& ticker, const std::vector<Core::Zone>& zones, const Core::RSStats& rs_stats);

    static std::string format_price(double price_value);
    static std::string format_percentage(double fraction_value);
};

} // namespace Logging
} // namespace SwingScanner

#endif // ENGINE_LOGS_HPP
