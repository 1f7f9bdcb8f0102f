#ifndef ZONE_EXTRACTOR_HPP
#define ZONE_EXTRACTOR_HPP

#include <vector>
#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

struct WeeklyBar {
    long long week_index;
    double close;
    double high;
    double low;

    WeeklyBar() : week_index(0), close(0.0), high(0.0), low(0.0) {}
};

// Monday-to-Sunday weeks: last adjusted close, max high, min low. Incomplete weeks are dropped.
std::vector<WeeklyBar> resample_weekly(const std::vector<PriceBar>& bars);

/**
 * Support/resistance map of one ticker.
 * Density peaks over weekly closes and pivots become ATR-sized zones, sorted ascending by level.
 * Every failure leaves the outcome without a value; callers treat that as an empty zone list.
 */
ZoneOutcome calculate_sr_zones(const std::vector<PriceBar>& bars, const Config::StrategyConfig& strategy_config);

} // namespace Core
} // namespace SwingScanner

#endif // ZONE_EXTRACTOR_HPP
