#ifndef RS_ENGINE_HPP
#define RS_ENGINE_HPP

#include <optional>
#include <vector>
#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Ticker / benchmark adjusted close ratio over their common dates.
 * Returns nothing when fewer than rs_line_length dates align; otherwise the most recent rs_line_length ratios.
 */
std::optional<RSLine> calculate_rs_line(const std::vector<PriceBar>& ticker_bars, const std::vector<PriceBar>& benchmark_bars,
                                        const Config::RelativeStrengthConfig& rs_config);

// Latest ratio within the tolerance band below the window high
bool detect_rs_blue_dot(const RSLine& rs_line, const Config::RelativeStrengthConfig& rs_config);

RSStats get_rs_stats(const std::optional<RSLine>& rs_line, const Config::RelativeStrengthConfig& rs_config);

// Benchmark return over return_lookback_bars, 0.0 when the history is too short
double calculate_benchmark_return(const std::vector<PriceBar>& benchmark_bars, int lookback_bars);

} // namespace Core
} // namespace SwingScanner

#endif // RS_ENGINE_HPP
