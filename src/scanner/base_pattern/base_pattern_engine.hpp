#ifndef BASE_PATTERN_ENGINE_HPP
#define BASE_PATTERN_ENGINE_HPP

#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Cup & handle on a Stage-2 stock.
 * The cup and handle are located on the bars before the latest one; the latest bar is the signal bar
 * (BRK above the rim on volume, DRY just below it).
 */
SetupOutcome scan_cup_handle(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

// Flat base: longest trailing 25-60 bar window with a tight high-low range, quiet volume, close near the top.
SetupOutcome scan_flat_base(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

// Higher-scoring of the two sub-patterns, dropped when below minimum_quality_score
SetupOutcome scan_base_pattern(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

} // namespace Core
} // namespace SwingScanner

#endif // BASE_PATTERN_ENGINE_HPP
