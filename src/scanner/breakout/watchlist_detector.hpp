#ifndef WATCHLIST_DETECTOR_HPP
#define WATCHLIST_DETECTOR_HPP

#include <optional>
#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Near-breakout check for tickers without a breakout setup.
 * The trigger is the nearer of a resistance zone's upper bound and today's trendline value,
 * and the close must sit at most watchlist_proximity_pct below it. No risk math is applied.
 */
SetupOutcome scan_near_breakout(const PatternScanRequest& request, const std::optional<TrendlineFit>& trendline,
                                const Config::StrategyConfig& strategy_config);

} // namespace Core
} // namespace SwingScanner

#endif // WATCHLIST_DETECTOR_HPP
