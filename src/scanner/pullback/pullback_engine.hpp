#ifndef PULLBACK_ENGINE_HPP
#define PULLBACK_ENGINE_HPP

#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Strict pullback: low penetrates EMA8 or EMA20 inside a support zone, closes back above EMA20,
 * and CCI hooks up from below the oversold level.
 */
SetupOutcome scan_pullback(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

/**
 * Relaxed pullback, tried only when the strict path found nothing: close near EMA8 or EMA20,
 * CCI turning up from below zero, quiet volume. Stop sits under the lowest support zone or the 50 SMA.
 */
SetupOutcome scan_relaxed_pullback(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

} // namespace Core
} // namespace SwingScanner

#endif // PULLBACK_ENGINE_HPP
