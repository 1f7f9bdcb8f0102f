#ifndef REGIME_FILTER_HPP
#define REGIME_FILTER_HPP

#include <vector>
#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Market switch: benchmark close against its EMA.
 * Fails closed - missing data or any internal error reports a non-bullish snapshot with an ERROR label.
 */
RegimeSnapshot check_market_regime(const std::vector<PriceBar>& benchmark_bars, const Config::RegimeConfig& regime_config);

} // namespace Core
} // namespace SwingScanner

#endif // REGIME_FILTER_HPP
