#include "indicators.hpp"
#include <algorithm>
#include <cmath>

namespace SwingScanner {
namespace Core {

namespace {

IndicatorSeries extract_column(const std::vector<PriceBar>& bars, double PriceBar::*member) {
    IndicatorSeries column_values;
    column_values.reserve(bars.size());
    for (const PriceBar& bar : bars) {
        column_values.push_back(bar.*member);
    }
    return column_values;
}

// Recursive smoothing with y0 = first defined input and yt = (1 - alpha) * y(t-1) + alpha * xt.
// Outputs stay undefined until min_observations defined inputs were seen.
IndicatorSeries exponential_smoothing(const IndicatorSeries& series, double alpha, int min_observations) {
    IndicatorSeries smoothed_values(series.size(), UNDEFINED_VALUE);
    double running_value = UNDEFINED_VALUE;
    int observation_count = 0;

    for (size_t value_index = 0; value_index < series.size(); ++value_index) {
        double input_value = series[value_index];
        if (!is_defined(input_value)) {
            continue;
        }
        if (observation_count == 0) {
            running_value = input_value;
        } else {
            running_value = (1.0 - alpha) * running_value + alpha * input_value;
        }
        observation_count++;
        if (observation_count >= min_observations) {
            smoothed_values[value_index] = running_value;
        }
    }
    return smoothed_values;
}

} // anonymous namespace

IndicatorSeries extract_closes(const std::vector<PriceBar>& bars) {
    return extract_column(bars, &PriceBar::adjusted_close);
}

IndicatorSeries extract_highs(const std::vector<PriceBar>& bars) {
    return extract_column(bars, &PriceBar::high_price);
}

IndicatorSeries extract_lows(const std::vector<PriceBar>& bars) {
    return extract_column(bars, &PriceBar::low_price);
}

IndicatorSeries extract_volumes(const std::vector<PriceBar>& bars) {
    return extract_column(bars, &PriceBar::volume);
}

IndicatorSeries ema(const IndicatorSeries& series, int length) {
    if (length <= 0) {
        return IndicatorSeries(series.size(), UNDEFINED_VALUE);
    }
    double smoothing_factor = 2.0 / (static_cast<double>(length) + 1.0);
    return exponential_smoothing(series, smoothing_factor, length);
}

IndicatorSeries sma(const IndicatorSeries& series, int length) {
    IndicatorSeries average_values(series.size(), UNDEFINED_VALUE);
    if (length <= 0) {
        return average_values;
    }

    size_t window_length = static_cast<size_t>(length);
    for (size_t end_index = window_length; end_index <= series.size(); ++end_index) {
        double window_sum = 0.0;
        bool window_complete = true;
        for (size_t window_index = end_index - window_length; window_index < end_index; ++window_index) {
            if (!is_defined(series[window_index])) {
                window_complete = false;
                break;
            }
            window_sum += series[window_index];
        }
        if (window_complete) {
            average_values[end_index - 1] = window_sum / static_cast<double>(length);
        }
    }
    return average_values;
}

IndicatorSeries true_range(const IndicatorSeries& highs, const IndicatorSeries& lows, const IndicatorSeries& closes) {
    size_t bar_count = std::min({highs.size(), lows.size(), closes.size()});
    IndicatorSeries true_range_values(bar_count, UNDEFINED_VALUE);

    for (size_t bar_index = 1; bar_index < bar_count; ++bar_index) {
        double high_value = highs[bar_index];
        double low_value = lows[bar_index];
        double previous_close = closes[bar_index - 1];
        if (!is_defined(high_value) || !is_defined(low_value) || !is_defined(previous_close)) {
            continue;
        }
        true_range_values[bar_index] = std::max({high_value - low_value,
                                                 std::abs(high_value - previous_close),
                                                 std::abs(low_value - previous_close)});
    }
    return true_range_values;
}

IndicatorSeries atr(const IndicatorSeries& highs, const IndicatorSeries& lows, const IndicatorSeries& closes, int length) {
    IndicatorSeries true_range_values = true_range(highs, lows, closes);
    if (length <= 0) {
        return IndicatorSeries(true_range_values.size(), UNDEFINED_VALUE);
    }
    // Wilder smoothing
    return exponential_smoothing(true_range_values, 1.0 / static_cast<double>(length), length);
}

IndicatorSeries cci(const IndicatorSeries& highs, const IndicatorSeries& lows, const IndicatorSeries& closes,
                    int length, double constant) {
    size_t bar_count = std::min({highs.size(), lows.size(), closes.size()});
    IndicatorSeries cci_values(bar_count, UNDEFINED_VALUE);
    if (length <= 0 || bar_count < static_cast<size_t>(length)) {
        return cci_values;
    }

    IndicatorSeries typical_prices(bar_count, UNDEFINED_VALUE);
    for (size_t bar_index = 0; bar_index < bar_count; ++bar_index) {
        typical_prices[bar_index] = (highs[bar_index] + lows[bar_index] + closes[bar_index]) / 3.0;
    }
    IndicatorSeries typical_price_average = sma(typical_prices, length);

    size_t window_length = static_cast<size_t>(length);
    for (size_t end_index = window_length; end_index <= bar_count; ++end_index) {
        double window_average = typical_price_average[end_index - 1];
        if (!is_defined(window_average)) {
            continue;
        }
        double deviation_sum = 0.0;
        for (size_t window_index = end_index - window_length; window_index < end_index; ++window_index) {
            deviation_sum += std::abs(typical_prices[window_index] - window_average);
        }
        double mean_deviation = deviation_sum / static_cast<double>(length);
        double denominator = constant * mean_deviation;
        // Zero deviation means no signal
        if (denominator == 0.0) {
            continue;
        }
        cci_values[end_index - 1] = (typical_prices[end_index - 1] - window_average) / denominator;
    }
    return cci_values;
}

double last_value(const IndicatorSeries& series) {
    return series.empty() ? UNDEFINED_VALUE : series.back();
}

double value_from_end(const IndicatorSeries& series, int offset_from_end) {
    if (offset_from_end < 0 || static_cast<size_t>(offset_from_end) >= series.size()) {
        return UNDEFINED_VALUE;
    }
    return series[series.size() - 1 - static_cast<size_t>(offset_from_end)];
}

double last_defined_value(const IndicatorSeries& series) {
    for (auto value_iterator = series.rbegin(); value_iterator != series.rend(); ++value_iterator) {
        if (is_defined(*value_iterator)) {
            return *value_iterator;
        }
    }
    return UNDEFINED_VALUE;
}

int count_defined(const IndicatorSeries& series) {
    return static_cast<int>(std::count_if(series.begin(), series.end(), [](double value) { return is_defined(value); }));
}

IndicatorSeries drop_undefined(const IndicatorSeries& series) {
    IndicatorSeries defined_values;
    defined_values.reserve(series.size());
    for (double value : series) {
        if (is_defined(value)) {
            defined_values.push_back(value);
        }
    }
    return defined_values;
}

double tail_mean(const IndicatorSeries& series, int count) {
    if (count <= 0 || static_cast<size_t>(count) > series.size()) {
        return UNDEFINED_VALUE;
    }
    int series_length = static_cast<int>(series.size());
    return range_mean(series, series_length - count, series_length);
}

double range_mean(const IndicatorSeries& series, int begin_index, int end_index) {
    if (begin_index < 0 || end_index > static_cast<int>(series.size()) || begin_index >= end_index) {
        return UNDEFINED_VALUE;
    }
    double range_sum = 0.0;
    for (int value_index = begin_index; value_index < end_index; ++value_index) {
        if (!is_defined(series[value_index])) {
            return UNDEFINED_VALUE;
        }
        range_sum += series[value_index];
    }
    return range_sum / static_cast<double>(end_index - begin_index);
}

double range_max(const IndicatorSeries& series, int begin_index, int end_index) {
    if (begin_index < 0 || end_index > static_cast<int>(series.size()) || begin_index >= end_index) {
        return UNDEFINED_VALUE;
    }
    double maximum_value = UNDEFINED_VALUE;
    for (int value_index = begin_index; value_index < end_index; ++value_index) {
        double value = series[value_index];
        if (is_defined(value) && (!is_defined(maximum_value) || value > maximum_value)) {
            maximum_value = value;
        }
    }
    return maximum_value;
}

double range_min(const IndicatorSeries& series, int begin_index, int end_index) {
    if (begin_index < 0 || end_index > static_cast<int>(series.size()) || begin_index >= end_index) {
        return UNDEFINED_VALUE;
    }
    double minimum_value = UNDEFINED_VALUE;
    for (int value_index = begin_index; value_index < end_index; ++value_index) {
        double value = series[value_index];
        if (is_defined(value) && (!is_defined(minimum_value) || value < minimum_value)) {
            minimum_value = value;
        }
    }
    return minimum_value;
}

double trailing_return(const IndicatorSeries& closes, int bars) {
    if (bars <= 0 || closes.size() < static_cast<size_t>(bars) + 1) {
        return UNDEFINED_VALUE;
    }
    double latest_close = last_value(closes);
    double base_close = value_from_end(closes, bars);
    if (!is_defined(latest_close) || !is_defined(base_close) || base_close <= 0.0) {
        return UNDEFINED_VALUE;
    }
    return latest_close / base_close - 1.0;
}

} // namespace Core
} // namespace SwingScanner
