#include "trendline_fitter.hpp"
#include "scanner/indicators/indicators.hpp"
#include "scanner/indicators/numerical_toolkit.hpp"
#include <algorithm>
#include <cmath>

namespace SwingScanner {
namespace Core {

std::optional<TrendlineFit> fit_descending_trendline(const std::vector<PriceBar>& bars, const Config::BreakoutConfig& breakout_config) {
    int bar_count = static_cast<int>(bars.size());
    int window_length = std::min(breakout_config.trendline_lookback_bars, bar_count);
    if (window_length < 3) {
        return std::nullopt;
    }
    int window_start = bar_count - window_length;

    std::vector<double> window_highs;
    window_highs.reserve(static_cast<size_t>(window_length));
    for (int bar_index = window_start; bar_index < bar_count; ++bar_index) {
        if (!is_defined(bars[bar_index].high_price)) {
            return std::nullopt;
        }
        window_highs.push_back(bars[bar_index].high_price);
    }

    double window_std = population_std(window_highs);
    if (!(window_std > 0.0)) {
        return std::nullopt;
    }

    std::vector<PeakCandidate> peaks = find_prominent_peaks(window_highs, breakout_config.trendline_peak_distance,
                                                            breakout_config.trendline_prominence_std_fraction * window_std);
    if (peaks.size() < 2) {
        return std::nullopt;
    }

    std::stable_sort(peaks.begin(), peaks.end(), [](const PeakCandidate& left, const PeakCandidate& right) {
        return left.prominence > right.prominence;
    });
    int first_local = std::min(peaks[0].index, peaks[1].index);
    int second_local = std::max(peaks[0].index, peaks[1].index);

    TrendlineFit trendline;
    trendline.window_start_index = window_start;
    trendline.first_anchor_index = window_start + first_local;
    trendline.second_anchor_index = window_start + second_local;
    trendline.first_anchor_date = bars[trendline.first_anchor_index].date;
    trendline.second_anchor_date = bars[trendline.second_anchor_index].date;
    trendline.first_anchor_price = window_highs[first_local];
    trendline.second_anchor_price = window_highs[second_local];
    trendline.slope_per_bar = (trendline.second_anchor_price - trendline.first_anchor_price) /
                              static_cast<double>(second_local - first_local);
    if (trendline.slope_per_bar >= 0.0) {
        return std::nullopt;
    }

    int touch_count = 0;
    for (int local_index = 0; local_index < window_length; ++local_index) {
        double line_value = trendline.value_at(window_start + local_index);
        if (line_value <= 0.0) {
            continue;
        }
        if (std::abs(window_highs[local_index] - line_value) / line_value <= breakout_config.trendline_touch_tolerance_pct) {
            touch_count++;
        }
    }
    trendline.touch_count = touch_count;
    if (touch_count < breakout_config.trendline_minimum_touches) {
        return std::nullopt;
    }

    trendline.current_value = trendline.value_at(bar_count - 1);
    if (trendline.current_value <= 0.0) {
        return std::nullopt;
    }
    return trendline;
}

} // namespace Core
} // namespace SwingScanner
