#ifndef BREAKOUT_ENGINE_HPP
#define BREAKOUT_ENGINE_HPP

#include "configs/strategy_config.hpp"
#include "scanner/breakout/breakout_paths.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Breakout / consolidation scan over the five paths in priority order.
 * The first path whose predicate matches decides the outcome, including a rejection by risk limits.
 */
SetupOutcome scan_breakout(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

// Runs the rules on prepared inputs; exposed for path priority tests
SetupOutcome evaluate_breakout_rules(const BreakoutInputs& inputs, const Config::StrategyConfig& strategy_config);

} // namespace Core
} // namespace SwingScanner

#endif // BREAKOUT_ENGINE_HPP
