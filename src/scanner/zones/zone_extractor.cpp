#include "zone_extractor.hpp"
#include "scanner/indicators/indicators.hpp"
#include "scanner/indicators/numerical_toolkit.hpp"
#include "utils/time_utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace SwingScanner {
namespace Core {

std::vector<WeeklyBar> resample_weekly(const std::vector<PriceBar>& bars) {
    std::vector<WeeklyBar> weekly_bars;
    bool week_open = false;
    WeeklyBar current_week;
    current_week.close = UNDEFINED_VALUE;
    current_week.high = UNDEFINED_VALUE;
    current_week.low = UNDEFINED_VALUE;

    auto close_week = [&]() {
        if (week_open && is_defined(current_week.close) && is_defined(current_week.high) && is_defined(current_week.low)) {
            weekly_bars.push_back(current_week);
        }
    };

    for (const PriceBar& bar : bars) {
        long long bar_week = TimeUtils::week_index_since_epoch(bar.date);
        if (!week_open || bar_week != current_week.week_index) {
            close_week();
            current_week = WeeklyBar();
            current_week.week_index = bar_week;
            current_week.close = UNDEFINED_VALUE;
            current_week.high = UNDEFINED_VALUE;
            current_week.low = UNDEFINED_VALUE;
            week_open = true;
        }
        if (is_defined(bar.adjusted_close)) {
            current_week.close = bar.adjusted_close;
        }
        if (is_defined(bar.high_price) && (!is_defined(current_week.high) || bar.high_price > current_week.high)) {
            current_week.high = bar.high_price;
        }
        if (is_defined(bar.low_price) && (!is_defined(current_week.low) || bar.low_price < current_week.low)) {
            current_week.low = bar.low_price;
        }
    }
    close_week();
    return weekly_bars;
}

ZoneOutcome calculate_sr_zones(const std::vector<PriceBar>& bars, const Config::StrategyConfig& strategy_config) {
    const Config::ZoneConfig& zone_config = strategy_config.zones;

    try {
        if (static_cast<int>(bars.size()) < zone_config.minimum_daily_bars) {
            return ZoneOutcome::insufficient_data("Zone extraction needs " + std::to_string(zone_config.minimum_daily_bars) +
                                                  " bars, have " + std::to_string(bars.size()));
        }

        IndicatorSeries closes = extract_closes(bars);
        IndicatorSeries atr_values = atr(extract_highs(bars), extract_lows(bars), closes, strategy_config.indicators.atr_period);
        double daily_atr = last_defined_value(atr_values);
        if (!is_defined(daily_atr) || daily_atr <= 0.0) {
            return ZoneOutcome::insufficient_data("Daily ATR undefined or not positive");
        }
        double zone_half_width = zone_config.zone_half_width_atr_multiplier * daily_atr;

        // ── Weekly resample ──────────────────────────────────────────────
        std::vector<WeeklyBar> weekly_bars = resample_weekly(bars);
        if (static_cast<int>(weekly_bars.size()) < zone_config.minimum_weekly_bars) {
            return ZoneOutcome::insufficient_data("Only " + std::to_string(weekly_bars.size()) + " weekly bars");
        }

        // ── Pivot highs / lows (adaptive window) ─────────────────────────
        int pivot_order = std::max(zone_config.pivot_order_minimum,
                                   static_cast<int>(weekly_bars.size()) / zone_config.pivot_order_divisor);
        std::vector<double> weekly_highs;
        std::vector<double> weekly_lows;
        std::vector<double> price_points;
        for (const WeeklyBar& weekly_bar : weekly_bars) {
            weekly_highs.push_back(weekly_bar.high);
            weekly_lows.push_back(weekly_bar.low);
            price_points.push_back(weekly_bar.close);
        }
        for (int pivot_index : find_relative_maxima(weekly_highs, pivot_order, false)) {
            price_points.push_back(weekly_highs[pivot_index]);
        }
        for (int pivot_index : find_relative_minima(weekly_lows, pivot_order, false)) {
            price_points.push_back(weekly_lows[pivot_index]);
        }
        price_points.erase(std::remove_if(price_points.begin(), price_points.end(),
                                          [](double price) { return !is_defined(price) || price <= 0.0; }),
                           price_points.end());
        if (static_cast<int>(price_points.size()) < zone_config.minimum_price_points) {
            return ZoneOutcome::insufficient_data("Only " + std::to_string(price_points.size()) + " price points");
        }

        // ── Density estimate ─────────────────────────────────────────────
        GaussianKde price_density(price_points);
        auto price_bounds = std::minmax_element(price_points.begin(), price_points.end());
        std::vector<double> price_grid = linspace(*price_bounds.first * zone_config.density_grid_lower_factor,
                                                  *price_bounds.second * zone_config.density_grid_upper_factor,
                                                  zone_config.density_grid_points);
        std::vector<double> density_values = price_density.evaluate(price_grid);

        std::vector<int> peak_indices = find_relative_maxima(density_values, zone_config.density_peak_order, true);
        if (peak_indices.empty()) {
            return ZoneOutcome::no_signal("No density peaks");
        }

        std::vector<double> peak_densities;
        for (int peak_index : peak_indices) {
            peak_densities.push_back(density_values[peak_index]);
        }
        double density_threshold = percentile_linear(peak_densities, zone_config.density_peak_percentile);

        std::vector<double> peak_prices;
        for (int peak_index : peak_indices) {
            if (density_values[peak_index] >= density_threshold) {
                peak_prices.push_back(price_grid[peak_index]);
            }
        }
        std::sort(peak_prices.begin(), peak_prices.end());

        // ── Merge peaks closer than the merge distance to the open cluster mean ──
        double merge_distance = zone_config.merge_distance_atr_multiplier * daily_atr;
        std::vector<double> merged_levels;
        double cluster_sum = 0.0;
        int cluster_size = 0;
        for (double peak_price : peak_prices) {
            if (cluster_size > 0 && peak_price - cluster_sum / cluster_size >= merge_distance) {
                merged_levels.push_back(cluster_sum / cluster_size);
                cluster_sum = 0.0;
                cluster_size = 0;
            }
            cluster_sum += peak_price;
            cluster_size++;
        }
        if (cluster_size > 0) {
            merged_levels.push_back(cluster_sum / cluster_size);
        }

        // ── Build zones ──────────────────────────────────────────────────
        double current_price = last_defined_value(closes);
        std::vector<Zone> zones;
        for (double level : merged_levels) {
            ZoneType zone_type = level > current_price ? ZoneType::RESISTANCE : ZoneType::SUPPORT;
            zones.emplace_back(level, level + zone_half_width, level - zone_half_width, zone_type, daily_atr);
        }
        std::sort(zones.begin(), zones.end(), [](const Zone& left, const Zone& right) { return left.level < right.level; });

        return ZoneOutcome::found(zones);
    } catch (const std::exception& exception_error) {
        return ZoneOutcome::computation_error(exception_error.what());
    }
}

} // namespace Core
} // namespace SwingScanner
