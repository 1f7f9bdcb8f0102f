#ifndef INDICATORS_HPP
#define INDICATORS_HPP

#include <vector>
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

// Column extraction. Closes are adjusted closes; high/low/volume are raw.
IndicatorSeries extract_closes(const std::vector<PriceBar>& bars);
IndicatorSeries extract_highs(const std::vector<PriceBar>& bars);
IndicatorSeries extract_lows(const std::vector<PriceBar>& bars);
IndicatorSeries extract_volumes(const std::vector<PriceBar>& bars);

// Pure transforms, every output aligned to its input. Undefined inputs yield undefined outputs.
IndicatorSeries ema(const IndicatorSeries& series, int length);
IndicatorSeries sma(const IndicatorSeries& series, int length);
IndicatorSeries true_range(const IndicatorSeries& highs, const IndicatorSeries& lows, const IndicatorSeries& closes);
IndicatorSeries atr(const IndicatorSeries& highs, const IndicatorSeries& lows, const IndicatorSeries& closes, int length);
IndicatorSeries cci(const IndicatorSeries& highs, const IndicatorSeries& lows, const IndicatorSeries& closes,
                    int length, double constant = 0.015);

// Series helpers
double last_value(const IndicatorSeries& series);
double value_from_end(const IndicatorSeries& series, int offset_from_end);
double last_defined_value(const IndicatorSeries& series);
int count_defined(const IndicatorSeries& series);
IndicatorSeries drop_undefined(const IndicatorSeries& series);
double tail_mean(const IndicatorSeries& series, int count);
double range_mean(const IndicatorSeries& series, int begin_index, int end_index);
double range_max(const IndicatorSeries& series, int begin_index, int end_index);
double range_min(const IndicatorSeries& series, int begin_index, int end_index);
double trailing_return(const IndicatorSeries& closes, int bars);

} // namespace Core
} // namespace SwingScanner

#endif // INDICATORS_HPP
