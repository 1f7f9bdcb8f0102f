#include "watchlist_detector.hpp"
#include <limits>

namespace SwingScanner {
namespace Core {

namespace {
    // Fraction the close sits below the level, undefined when above it
    double distance_below(double level, double close) {
        if (!(level > 0.0) || close > level) {
            return UNDEFINED_VALUE;
        }
        return (level - close) / level;
    }
}

SetupOutcome scan_near_breakout(const PatternScanRequest& request, const std::optional<TrendlineFit>& trendline,
                                const Config::StrategyConfig& strategy_config) {
    double proximity_pct = strategy_config.breakout.watchlist_proximity_pct;
    if (request.bars.empty()) {
        return SetupOutcome::insufficient_data("No bars");
    }
    double close = request.bars.back().adjusted_close;
    if (!is_defined(close)) {
        return SetupOutcome::insufficient_data("Latest close undefined");
    }

    WatchlistMetadata best_candidate;
    double best_distance = std::numeric_limits<double>::infinity();

    for (const Zone& zone : request.zones) {
        if (zone.type != ZoneType::RESISTANCE) {
            continue;
        }
        double distance = distance_below(zone.upper, close);
        if (is_defined(distance) && distance <= proximity_pct && distance < best_distance) {
            best_distance = distance;
            best_candidate.level_type = WatchLevelType::ZONE;
            best_candidate.trigger_level = zone.upper;
            best_candidate.distance_pct = distance * 100.0;
        }
    }

    if (trendline) {
        double distance = distance_below(trendline->current_value, close);
        if (is_defined(distance) && distance <= proximity_pct && distance < best_distance) {
            best_distance = distance;
            best_candidate.level_type = WatchLevelType::TRENDLINE;
            best_candidate.trigger_level = trendline->current_value;
            best_candidate.distance_pct = distance * 100.0;
        }
    }

    if (best_distance == std::numeric_limits<double>::infinity()) {
        return SetupOutcome::no_signal("No trigger level within reach");
    }

    best_candidate.rs_blue_dot = request.rs_stats.is_blue_dot;

    Setup setup;
    setup.ticker = request.ticker;
    setup.setup_type = SetupType::WATCHLIST;
    setup.entry = best_candidate.trigger_level;
    setup.setup_date = request.bars.back().date;
    setup.watchlist = best_candidate;
    return SetupOutcome::found(setup);
}

} // namespace Core
} // namespace SwingScanner
