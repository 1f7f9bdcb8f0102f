#ifndef STRATEGY_CONFIG_HPP
#define STRATEGY_CONFIG_HPP

namespace SwingScanner {
namespace Config {

struct IndicatorConfig {
    int ema_short_period;                            // Short EMA period (8)
    int ema_long_period;                             // Long EMA period (20)
    int sma_long_period;                             // Trend SMA period (50)
    int sma_base_period;                             // Stage-2 SMA period (200)
    int atr_period;                                  // ATR period (14)
    int cci_period;                                  // CCI period (20)
    double cci_constant;                             // CCI scaling constant (0.015)
    int volume_sma_period;                           // Average volume period (50)
    int return_lookback_bars;                        // Bars for 3-month return comparison (63)

    IndicatorConfig()
        : ema_short_period(8), ema_long_period(20), sma_long_period(50), sma_base_period(200),
          atr_period(14), cci_period(20), cci_constant(0.015), volume_sma_period(50),
          return_lookback_bars(63) {}
};

struct RegimeConfig {
    int ema_period;                                  // Benchmark EMA period (20)
    int minimum_bars;                                // Minimum benchmark bars (22)

    RegimeConfig() : ema_period(20), minimum_bars(22) {}
};

struct ZoneConfig {
    int minimum_daily_bars;                          // Minimum daily bars for zone extraction (60)
    int minimum_weekly_bars;                         // Minimum weekly bars after resampling (10)
    int minimum_price_points;                        // Minimum points in the price cloud (10)
    int pivot_order_divisor;                         // Pivot window = max(minimum, weeks / divisor)
    int pivot_order_minimum;                         // Smallest pivot window (2)
    int density_grid_points;                         // KDE evaluation grid size (600)
    double density_grid_lower_factor;                // Grid lower bound = min * factor (0.98)
    double density_grid_upper_factor;                // Grid upper bound = max * factor (1.02)
    int density_peak_order;                          // Minimum separation of density peaks in grid points (8)
    double density_peak_percentile;                  // Discard peaks below this density percentile (30)
    double zone_half_width_atr_multiplier;           // Zone half width as ATR fraction (0.2)
    double merge_distance_atr_multiplier;            // Peaks closer than this many ATRs merge (1.0)

    ZoneConfig()
        : minimum_daily_bars(60), minimum_weekly_bars(10), minimum_price_points(10),
          pivot_order_divisor(20), pivot_order_minimum(2), density_grid_points(600),
          density_grid_lower_factor(0.98), density_grid_upper_factor(1.02), density_peak_order(8),
          density_peak_percentile(30.0), zone_half_width_atr_multiplier(0.2),
          merge_distance_atr_multiplier(1.0) {}
};

struct RelativeStrengthConfig {
    int rs_line_length;                              // Aligned trading days kept in the RS line (252)
    double blue_dot_tolerance_pct;                   // Blue dot band below the 52-week high (0.005)

    RelativeStrengthConfig() : rs_line_length(252), blue_dot_tolerance_pct(0.005) {}
};

struct BreakoutConfig {
    int minimum_bars;                                // Minimum bars for the breakout engine (60)
    int minimum_valid_closes;                        // Minimum non-undefined closes (55)

    // Confirmed breakout
    double confirmed_volume_ratio;                   // Volume / 50-day average (1.5)
    double confirmed_min_above_pct;                  // Close above zone upper, lower band (0.005)
    double confirmed_max_above_pct;                  // Close above zone upper, upper band (0.03)

    // Trendline breakout
    double trendline_volume_ratio;                   // Volume / 50-day average (1.2)
    int trendline_lookback_bars;                     // Trendline window (120)
    double trendline_prominence_std_fraction;        // Peak prominence as fraction of window std (0.3)
    int trendline_peak_distance;                     // Minimum bars between peaks (5)
    double trendline_touch_tolerance_pct;            // High within this distance of the line counts as a touch (0.008)
    int trendline_minimum_touches;                   // Minimum touches (2)
    double trendline_stop_factor;                    // Stop base = trendline * factor (0.98)

    // Horizontal level breakout
    double level_volume_ratio;                       // Volume / 50-day average (1.15)
    double level_min_above_pct;                      // Close above zone upper, lower band (0.001)
    double level_max_above_pct;                      // Close above zone upper, upper band (0.025)

    // RS-led early breakout
    double rs_lead_proximity_pct;                    // Close within this distance below zone upper (0.03)

    // Dry coiled-spring base
    int contraction_recent_bars;                     // Recent true range window (5)
    int contraction_prior_bars;                      // Prior true range window (20)
    int u_shape_lookback_bars;                       // Quadratic fit window (15)
    double u_shape_min_curvature;                    // Minimum standardized curvature (0.005)
    int dry_volume_bars;                             // Dry-up average window (3)
    double dry_resistance_proximity_pct;             // Close within this distance below zone level (0.05)
    double dry_breakout_volume_ratio;                // At-zone breakout volume ratio (1.5)

    // Watchlist
    double watchlist_proximity_pct;                  // Close within this distance below trigger level (0.015)

    BreakoutConfig()
        : minimum_bars(60), minimum_valid_closes(55),
          confirmed_volume_ratio(1.5), confirmed_min_above_pct(0.005), confirmed_max_above_pct(0.03),
          trendline_volume_ratio(1.2), trendline_lookback_bars(120), trendline_prominence_std_fraction(0.3),
          trendline_peak_distance(5), trendline_touch_tolerance_pct(0.008), trendline_minimum_touches(2),
          trendline_stop_factor(0.98),
          level_volume_ratio(1.15), level_min_above_pct(0.001), level_max_above_pct(0.025),
          rs_lead_proximity_pct(0.03),
          contraction_recent_bars(5), contraction_prior_bars(20), u_shape_lookback_bars(15),
          u_shape_min_curvature(0.005), dry_volume_bars(3), dry_resistance_proximity_pct(0.05),
          dry_breakout_volume_ratio(1.5),
          watchlist_proximity_pct(0.015) {}
};

struct PullbackConfig {
    int minimum_bars;                                // Minimum bars for the pullback engine (60)
    int minimum_valid_closes;                        // Minimum non-undefined closes (55)
    double support_low_tolerance_pct;                // Tolerance around the support band for the low (0.005)
    double cci_oversold_level;                       // Strict hook requires yesterday below this (-100)
    double relaxed_ema_proximity_pct;                // Relaxed path: close within this distance of an EMA (0.008)
    double relaxed_cci_level;                        // Relaxed hook requires yesterday below this (0)
    int relaxed_volume_bars;                         // Relaxed path volume window (3)

    PullbackConfig()
        : minimum_bars(60), minimum_valid_closes(55), support_low_tolerance_pct(0.005),
          cci_oversold_level(-100.0), relaxed_ema_proximity_pct(0.008), relaxed_cci_level(0.0),
          relaxed_volume_bars(3) {}
};

struct BasePatternConfig {
    int minimum_bars;                                // Minimum bars for the base engine (60)
    int minimum_valid_closes;                        // Minimum non-undefined closes (55)
    double stage_two_low_multiple;                   // Close >= 52-week low * multiple (1.30)
    int stage_two_low_lookback;                      // 52-week low window (252)
    int sma_rising_lookback;                         // 200-SMA must exceed its value this many bars ago (20)

    // Cup & handle
    int cup_lookback_bars;                           // Cup search window (120)
    int cup_minimum_window;                          // Minimum window for a cup (30)
    double cup_min_depth_pct;                        // Minimum cup depth (0.12)
    double cup_max_depth_pct;                        // Maximum cup depth (0.35)
    double cup_rim_recovery_pct;                     // Rim within this distance of the left peak (0.10)
    int cup_minimum_length;                          // Minimum bars from left peak to rim (20)
    int handle_max_bars;                             // Handle search window after the rim (26)
    double handle_min_pullback_pct;                  // Minimum handle pullback (0.03)
    double handle_max_pullback_pct;                  // Maximum handle pullback (0.15)
    double five_day_volume_max_ratio;                // 5-day average volume / 50-day average cap (0.85)

    // Flat base
    int flat_max_lookback;                           // Longest flat window (60)
    int flat_min_lookback;                           // Shortest flat window (25)
    double flat_max_depth_pct;                       // Maximum flat base depth (0.12)
    double flat_min_range_position;                  // Close position inside the range (0.75)
    int flat_short_volume_bars;                      // Short volume window (10)
    double flat_volume_max_ratio;                    // Short / 50-day volume cap (0.75)

    // Signal
    double breakout_volume_ratio;                    // BRK volume / 50-day average (1.2)
    double pivot_proximity_pct;                      // DRY when close within this distance below pivot (0.010)

    // Quality score
    double minimum_quality_score;                    // Discard candidates below this score (25)
    double score_rs_full_credit;                     // RS outperformance for full credit (0.05)
    double score_tight_depth_pct;                    // Depth for full tightness credit (0.08)
    double score_volume_full_credit;                 // Volume dry-up ratio for full credit (0.30)

    BasePatternConfig()
        : minimum_bars(60), minimum_valid_closes(55), stage_two_low_multiple(1.30),
          stage_two_low_lookback(252), sma_rising_lookback(20),
          cup_lookback_bars(120), cup_minimum_window(30), cup_min_depth_pct(0.12), cup_max_depth_pct(0.35),
          cup_rim_recovery_pct(0.10), cup_minimum_length(20), handle_max_bars(26),
          handle_min_pullback_pct(0.03), handle_max_pullback_pct(0.15), five_day_volume_max_ratio(0.85),
          flat_max_lookback(60), flat_min_lookback(25), flat_max_depth_pct(0.12),
          flat_min_range_position(0.75), flat_short_volume_bars(10), flat_volume_max_ratio(0.75),
          breakout_volume_ratio(1.2), pivot_proximity_pct(0.010),
          minimum_quality_score(25.0), score_rs_full_credit(0.05), score_tight_depth_pct(0.08),
          score_volume_full_credit(0.30) {}
};

struct RiskConfig {
    double entry_multiplier;                         // Entry = reference price * multiplier (1.001)
    double stop_atr_multiplier;                      // Stop = base - multiplier * ATR (0.2)
    double reward_multiple;                          // Take profit = entry + multiple * risk (2.0)
    double max_risk_pct;                             // Reject when risk exceeds this share of entry (0.15)

    RiskConfig() : entry_multiplier(1.001), stop_atr_multiplier(0.2), reward_multiple(2.0), max_risk_pct(0.15) {}
};

/**
 * Every numeric threshold used by the pattern engines.
 * Defaults are the production values; strategy_config.csv overrides them.
 */
struct StrategyConfig {
    StrategyConfig() {}

    IndicatorConfig indicators;
    RegimeConfig regime;
    ZoneConfig zones;
    RelativeStrengthConfig relative_strength;
    BreakoutConfig breakout;
    PullbackConfig pullback;
    BasePatternConfig base;
    RiskConfig risk;
};

} // namespace Config
} // namespace SwingScanner

#endif // STRATEGY_CONFIG_HPP
