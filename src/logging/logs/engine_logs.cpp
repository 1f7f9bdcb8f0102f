#include "engine_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/csv_setup_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include <iomanip>
#include <sstream>

namespace SwingScanner {
namespace Logging {

std::string EngineLogs::format_price(double price_value) {
    if (!Core::is_defined(price_value)) {
        return "n/a";
    }
    std::ostringstream price_stream;
    price_stream << std::fixed << std::setprecision(2) << price_value;
    return price_stream.str();
}

std::string EngineLogs::format_percentage(double fraction_value) {
    if (!Core::is_defined(fraction_value)) {
        return "n/a";
    }
    std::ostringstream percentage_stream;
    percentage_stream << std::fixed << std::setprecision(2) << fraction_value * 100.0 << "%";
    return percentage_stream.str();
}

void EngineLogs::log_setup_found(const Core::Setup& setup) {
    TABLE_HEADER_30(setup.ticker, Core::to_string(setup.setup_type) + " " + describe_setup_variant(setup));
    TABLE_ROW_30("Setup Date", setup.setup_date);
    TABLE_ROW_30("Entry", format_price(setup.entry));
    if (setup.setup_type != Core::SetupType::WATCHLIST) {
        TABLE_ROW_30("Stop Loss", format_price(setup.stop_loss));
        TABLE_ROW_30("Take Profit", format_price(setup.take_profit));
        TABLE_ROW_30("Risk/Reward", format_price(setup.risk_reward));
    }
    if (setup.base) {
        TABLE_ROW_30("Quality Score", std::to_string(setup.base->quality_score));
    }
    if (setup.watchlist) {
        std::ostringstream distance_stream;
        distance_stream << std::fixed << std::setprecision(2) << setup.watchlist->distance_pct << "% below";
        TABLE_ROW_30("Trigger Distance", distance_stream.str());
    }
    TABLE_FOOTER_30();
}

void EngineLogs::log_engine_rejection(const std::string& ticker, const std::string& engine_name,
                                      Core::OutcomeReason reason, const std::string& detail) {
    log_message(ticker + " " + engine_name + ": " + Core::to_string(reason) + (detail.empty() ? "" : " - " + detail), "");
}

void EngineLogs::log_zone_table(const std::string& ticker, const std::vector<Core::Zone>& zones, const Core::RSStats& rs_stats) {
    TABLE_HEADER_48(ticker, "S/R zones (" + std::to_string(zones.size()) + "), RS trend " + Core::to_string(rs_stats.trend) +
                            (rs_stats.is_blue_dot ? ", blue dot" : ""));
    for (const Core::Zone& zone : zones) {
        TABLE_ROW_48(Core::to_string(zone.type), format_price(zone.lower) + " - " + format_price(zone.upper) +
                                                 " (level " + format_price(zone.level) + ")");
    }
    TABLE_FOOTER_48();
}

} // namespace Logging
} // namespace SwingScanner
