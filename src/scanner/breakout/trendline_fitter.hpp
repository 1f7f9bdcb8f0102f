#ifndef TRENDLINE_FITTER_HPP
#define TRENDLINE_FITTER_HPP

#include <optional>
#include <vector>
#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Descending resistance line through the two most prominent highs of the trailing window.
 * Returns nothing when fewer than two peaks qualify, the line is not descending,
 * fewer than trendline_minimum_touches highs sit on it, or it projects to a non-positive price.
 */
std::optional<TrendlineFit> fit_descending_trendline(const std::vector<PriceBar>& bars, const Config::BreakoutConfig& breakout_config);

} // namespace Core
} // namespace SwingScanner

#endif // TRENDLINE_FITTER_HPP
