#include "rs_engine.hpp"
#include "scanner/indicators/indicators.hpp"
#include <algorithm>
#include <unordered_map>

namespace SwingScanner {
namespace Core {

std::optional<RSLine> calculate_rs_line(const std::vector<PriceBar>& ticker_bars, const std::vector<PriceBar>& benchmark_bars,
                                        const Config::RelativeStrengthConfig& rs_config) {
    if (ticker_bars.empty() || benchmark_bars.empty()) {
        return std::nullopt;
    }

    std::unordered_map<std::string, double> benchmark_close_by_date;
    for (const PriceBar& benchmark_bar : benchmark_bars) {
        if (is_defined(benchmark_bar.adjusted_close) && benchmark_bar.adjusted_close > 0.0) {
            benchmark_close_by_date[benchmark_bar.date] = benchmark_bar.adjusted_close;
        }
    }

    RSLine rs_line;
    for (const PriceBar& ticker_bar : ticker_bars) {
        if (!is_defined(ticker_bar.adjusted_close)) {
            continue;
        }
        auto benchmark_entry = benchmark_close_by_date.find(ticker_bar.date);
        if (benchmark_entry == benchmark_close_by_date.end()) {
            continue;
        }
        rs_line.dates.push_back(ticker_bar.date);
        rs_line.ratios.push_back(ticker_bar.adjusted_close / benchmark_entry->second);
    }

    size_t line_length = static_cast<size_t>(std::max(rs_config.rs_line_length, 1));
    if (rs_line.ratios.size() < line_length) {
        return std::nullopt;
    }

    size_t first_kept = rs_line.ratios.size() - line_length;
    rs_line.dates.erase(rs_line.dates.begin(), rs_line.dates.begin() + static_cast<long>(first_kept));
    rs_line.ratios.erase(rs_line.ratios.begin(), rs_line.ratios.begin() + static_cast<long>(first_kept));
    return rs_line;
}

bool detect_rs_blue_dot(const RSLine& rs_line, const Config::RelativeStrengthConfig& rs_config) {
    if (rs_line.ratios.empty()) {
        return false;
    }
    double window_high = *std::max_element(rs_line.ratios.begin(), rs_line.ratios.end());
    return rs_line.ratios.back() >= (1.0 - rs_config.blue_dot_tolerance_pct) * window_high;
}

RSStats get_rs_stats(const std::optional<RSLine>& rs_line, const Config::RelativeStrengthConfig& rs_config) {
    RSStats rs_stats;
    if (!rs_line || rs_line->ratios.empty()) {
        return rs_stats;
    }

    const std::vector<double>& ratios = rs_line->ratios;
    rs_stats.available = true;
    rs_stats.rs_today = ratios.back();
    rs_stats.rs_52w_high = *std::max_element(ratios.begin(), ratios.end());
    rs_stats.is_blue_dot = detect_rs_blue_dot(*rs_line, rs_config);

    if (ratios.size() >= 2) {
        double previous_ratio = ratios[ratios.size() - 2];
        if (rs_stats.rs_today > previous_ratio) {
            rs_stats.trend = RSTrend::UP;
        } else if (rs_stats.rs_today < previous_ratio) {
            rs_stats.trend = RSTrend::DOWN;
        } else {
            rs_stats.trend = RSTrend::FLAT;
        }
    }
    return rs_stats;
}

double calculate_benchmark_return(const std::vector<PriceBar>& benchmark_bars, int lookback_bars) {
    double benchmark_return = trailing_return(extract_closes(benchmark_bars), lookback_bars);
    return is_defined(benchmark_return) ? benchmark_return : 0.0;
}

} // namespace Core
} // namespace SwingScanner
