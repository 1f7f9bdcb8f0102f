#include "config_loader.hpp"
#include "logging/logs/config_logs.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <stdexcept>
#include <vector>

using SwingScanner::Logging::ConfigLogs;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value;
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(), ::tolower);
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::runtime_error("Invalid boolean value: " + input_value);
    }

bool apply_strategy_setting(SwingScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    // Indicator periods
    if (config_key_string == "indicators.ema_short_period") cfg.strategy.indicators.ema_short_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.ema_long_period") cfg.strategy.indicators.ema_long_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.sma_long_period") cfg.strategy.indicators.sma_long_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.sma_base_period") cfg.strategy.indicators.sma_base_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.atr_period") cfg.strategy.indicators.atr_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.cci_period") cfg.strategy.indicators.cci_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.cci_constant") cfg.strategy.indicators.cci_constant = std::stod(config_value_string);
    else if (config_key_string == "indicators.volume_sma_period") cfg.strategy.indicators.volume_sma_period = std::stoi(config_value_string);
    else if (config_key_string == "indicators.return_lookback_bars") cfg.strategy.indicators.return_lookback_bars = std::stoi(config_value_string);

    // Market regime
    else if (config_key_string == "regime.ema_period") cfg.strategy.regime.ema_period = std::stoi(config_value_string);
    else if (config_key_string == "regime.minimum_bars") cfg.strategy.regime.minimum_bars = std::stoi(config_value_string);

    // Support/resistance zones
    else if (config_key_string == "zones.minimum_daily_bars") cfg.strategy.zones.minimum_daily_bars = std::stoi(config_value_string);
    else if (config_key_string == "zones.minimum_weekly_bars") cfg.strategy.zones.minimum_weekly_bars = std::stoi(config_value_string);
    else if (config_key_string == "zones.minimum_price_points") cfg.strategy.zones.minimum_price_points = std::stoi(config_value_string);
    else if (config_key_string == "zones.pivot_order_divisor") cfg.strategy.zones.pivot_order_divisor = std::stoi(config_value_string);
    else if (config_key_string == "zones.pivot_order_minimum") cfg.strategy.zones.pivot_order_minimum = std::stoi(config_value_string);
    else if (config_key_string == "zones.density_grid_points") cfg.strategy.zones.density_grid_points = std::stoi(config_value_string);
    else if (config_key_string == "zones.density_grid_lower_factor") cfg.strategy.zones.density_grid_lower_factor = std::stod(config_value_string);
    else if (config_key_string == "zones.density_grid_upper_factor") cfg.strategy.zones.density_grid_upper_factor = std::stod(config_value_string);
    else if (config_key_string == "zones.density_peak_order") cfg.strategy.zones.density_peak_order = std::stoi(config_value_string);
    else if (config_key_string == "zones.density_peak_percentile") cfg.strategy.zones.density_peak_percentile = std::stod(config_value_string);
    else if (config_key_string == "zones.zone_half_width_atr_multiplier") cfg.strategy.zones.zone_half_width_atr_multiplier = std::stod(config_value_string);
    else if (config_key_string == "zones.merge_distance_atr_multiplier") cfg.strategy.zones.merge_distance_atr_multiplier = std::stod(config_value_string);

    // Relative strength
    else if (config_key_string == "rs.rs_line_length") cfg.strategy.relative_strength.rs_line_length = std::stoi(config_value_string);
    else if (config_key_string == "rs.blue_dot_tolerance_pct") cfg.strategy.relative_strength.blue_dot_tolerance_pct = std::stod(config_value_string);

    // Breakout engine
    else if (config_key_string == "breakout.minimum_bars") cfg.strategy.breakout.minimum_bars = std::stoi(config_value_string);
    else if (config_key_string == "breakout.minimum_valid_closes") cfg.strategy.breakout.minimum_valid_closes = std::stoi(config_value_string);
    else if (config_key_string == "breakout.confirmed_volume_ratio") cfg.strategy.breakout.confirmed_volume_ratio = std::stod(config_value_string);
    else if (config_key_string == "breakout.confirmed_min_above_pct") cfg.strategy.breakout.confirmed_min_above_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.confirmed_max_above_pct") cfg.strategy.breakout.confirmed_max_above_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.trendline_volume_ratio") cfg.strategy.breakout.trendline_volume_ratio = std::stod(config_value_string);
    else if (config_key_string == "breakout.trendline_lookback_bars") cfg.strategy.breakout.trendline_lookback_bars = std::stoi(config_value_string);
    else if (config_key_string == "breakout.trendline_prominence_std_fraction") cfg.strategy.breakout.trendline_prominence_std_fraction = std::stod(config_value_string);
    else if (config_key_string == "breakout.trendline_peak_distance") cfg.strategy.breakout.trendline_peak_distance = std::stoi(config_value_string);
    else if (config_key_string == "breakout.trendline_touch_tolerance_pct") cfg.strategy.breakout.trendline_touch_tolerance_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.trendline_minimum_touches") cfg.strategy.breakout.trendline_minimum_touches = std::stoi(config_value_string);
    else if (config_key_string == "breakout.trendline_stop_factor") cfg.strategy.breakout.trendline_stop_factor = std::stod(config_value_string);
    else if (config_key_string == "breakout.level_volume_ratio") cfg.strategy.breakout.level_volume_ratio = std::stod(config_value_string);
    else if (config_key_string == "breakout.level_min_above_pct") cfg.strategy.breakout.level_min_above_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.level_max_above_pct") cfg.strategy.breakout.level_max_above_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.rs_lead_proximity_pct") cfg.strategy.breakout.rs_lead_proximity_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.contraction_recent_bars") cfg.strategy.breakout.contraction_recent_bars = std::stoi(config_value_string);
    else if (config_key_string == "breakout.contraction_prior_bars") cfg.strategy.breakout.contraction_prior_bars = std::stoi(config_value_string);
    else if (config_key_string == "breakout.u_shape_lookback_bars") cfg.strategy.breakout.u_shape_lookback_bars = std::stoi(config_value_string);
    else if (config_key_string == "breakout.u_shape_min_curvature") cfg.strategy.breakout.u_shape_min_curvature = std::stod(config_value_string);
    else if (config_key_string == "breakout.dry_volume_bars") cfg.strategy.breakout.dry_volume_bars = std::stoi(config_value_string);
    else if (config_key_string == "breakout.dry_resistance_proximity_pct") cfg.strategy.breakout.dry_resistance_proximity_pct = std::stod(config_value_string);
    else if (config_key_string == "breakout.dry_breakout_volume_ratio") cfg.strategy.breakout.dry_breakout_volume_ratio = std::stod(config_value_string);
    else if (config_key_string == "breakout.watchlist_proximity_pct") cfg.strategy.breakout.watchlist_proximity_pct = std::stod(config_value_string);

    // Pullback engine
    else if (config_key_string == "pullback.minimum_bars") cfg.strategy.pullback.minimum_bars = std::stoi(config_value_string);
    else if (config_key_string == "pullback.minimum_valid_closes") cfg.strategy.pullback.minimum_valid_closes = std::stoi(config_value_string);
    else if (config_key_string == "pullback.support_low_tolerance_pct") cfg.strategy.pullback.support_low_tolerance_pct = std::stod(config_value_string);
    else if (config_key_string == "pullback.cci_oversold_level") cfg.strategy.pullback.cci_oversold_level = std::stod(config_value_string);
    else if (config_key_string == "pullback.relaxed_ema_proximity_pct") cfg.strategy.pullback.relaxed_ema_proximity_pct = std::stod(config_value_string);
    else if (config_key_string == "pullback.relaxed_cci_level") cfg.strategy.pullback.relaxed_cci_level = std::stod(config_value_string);
    else if (config_key_string == "pullback.relaxed_volume_bars") cfg.strategy.pullback.relaxed_volume_bars = std::stoi(config_value_string);

    // Base patterns
    else if (config_key_string == "base.minimum_bars") cfg.strategy.base.minimum_bars = std::stoi(config_value_string);
    else if (config_key_string == "base.minimum_valid_closes") cfg.strategy.base.minimum_valid_closes = std::stoi(config_value_string);
    else if (config_key_string == "base.stage_two_low_multiple") cfg.strategy.base.stage_two_low_multiple = std::stod(config_value_string);
    else if (config_key_string == "base.stage_two_low_lookback") cfg.strategy.base.stage_two_low_lookback = std::stoi(config_value_string);
    else if (config_key_string == "base.sma_rising_lookback") cfg.strategy.base.sma_rising_lookback = std::stoi(config_value_string);
    else if (config_key_string == "base.cup_lookback_bars") cfg.strategy.base.cup_lookback_bars = std::stoi(config_value_string);
    else if (config_key_string == "base.cup_minimum_window") cfg.strategy.base.cup_minimum_window = std::stoi(config_value_string);
    else if (config_key_string == "base.cup_min_depth_pct") cfg.strategy.base.cup_min_depth_pct = std::stod(config_value_string);
    else if (config_key_string == "base.cup_max_depth_pct") cfg.strategy.base.cup_max_depth_pct = std::stod(config_value_string);
    else if (config_key_string == "base.cup_rim_recovery_pct") cfg.strategy.base.cup_rim_recovery_pct = std::stod(config_value_string);
    else if (config_key_string == "base.cup_minimum_length") cfg.strategy.base.cup_minimum_length = std::stoi(config_value_string);
    else if (config_key_string == "base.handle_max_bars") cfg.strategy.base.handle_max_bars = std::stoi(config_value_string);
    else if (config_key_string == "base.handle_min_pullback_pct") cfg.strategy.base.handle_min_pullback_pct = std::stod(config_value_string);
    else if (config_key_string == "base.handle_max_pullback_pct") cfg.strategy.base.handle_max_pullback_pct = std::stod(config_value_string);
    else if (config_key_string == "base.five_day_volume_max_ratio") cfg.strategy.base.five_day_volume_max_ratio = std::stod(config_value_string);
    else if (config_key_string == "base.flat_max_lookback") cfg.strategy.base.flat_max_lookback = std::stoi(config_value_string);
    else if (config_key_string == "base.flat_min_lookback") cfg.strategy.base.flat_min_lookback = std::stoi(config_value_string);
    else if (config_key_string == "base.flat_max_depth_pct") cfg.strategy.base.flat_max_depth_pct = std::stod(config_value_string);
    else if (config_key_string == "base.flat_min_range_position") cfg.strategy.base.flat_min_range_position = std::stod(config_value_string);
    else if (config_key_string == "base.flat_short_volume_bars") cfg.strategy.base.flat_short_volume_bars = std::stoi(config_value_string);
    else if (config_key_string == "base.flat_volume_max_ratio") cfg.strategy.base.flat_volume_max_ratio = std::stod(config_value_string);
    else if (config_key_string == "base.breakout_volume_ratio") cfg.strategy.base.breakout_volume_ratio = std::stod(config_value_string);
    else if (config_key_string == "base.pivot_proximity_pct") cfg.strategy.base.pivot_proximity_pct = std::stod(config_value_string);
    else if (config_key_string == "base.minimum_quality_score") cfg.strategy.base.minimum_quality_score = std::stod(config_value_string);
    else if (config_key_string == "base.score_rs_full_credit") cfg.strategy.base.score_rs_full_credit = std::stod(config_value_string);
    else if (config_key_string == "base.score_tight_depth_pct") cfg.strategy.base.score_tight_depth_pct = std::stod(config_value_string);
    else if (config_key_string == "base.score_volume_full_credit") cfg.strategy.base.score_volume_full_credit = std::stod(config_value_string);

    // Risk levels
    else if (config_key_string == "risk.entry_multiplier") cfg.strategy.risk.entry_multiplier = std::stod(config_value_string);
    else if (config_key_string == "risk.stop_atr_multiplier") cfg.strategy.risk.stop_atr_multiplier = std::stod(config_value_string);
    else if (config_key_string == "risk.reward_multiple") cfg.strategy.risk.reward_multiple = std::stod(config_value_string);
    else if (config_key_string == "risk.max_risk_pct") cfg.strategy.risk.max_risk_pct = std::stod(config_value_string);
    else return false;
    return true;
}

bool apply_scanner_setting(SwingScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    if (config_key_string == "scanner.benchmark_symbol") cfg.scanner.benchmark_symbol = config_value_string;
    else if (config_key_string == "scanner.universe_file") cfg.scanner.universe_file = config_value_string;
    else if (config_key_string == "scanner.output_directory") cfg.scanner.output_directory = config_value_string;
    else if (config_key_string == "scanner.concurrency_limit") cfg.scanner.concurrency_limit = std::stoi(config_value_string);
    else if (config_key_string == "scanner.max_tickers_per_scan") cfg.scanner.max_tickers_per_scan = std::stoi(config_value_string);
    else if (config_key_string == "scanner.minimum_ticker_bars") cfg.scanner.minimum_ticker_bars = std::stoi(config_value_string);
    else if (config_key_string == "scanner.default_sector") cfg.scanner.default_sector = config_value_string;
    else if (config_key_string == "scanner.sector_highlight_threshold") cfg.scanner.sector_highlight_threshold = std::stoi(config_value_string);
    else return false;
    return true;
}

bool apply_data_source_setting(SwingScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    if (config_key_string == "data_source.provider") cfg.data_source.provider = config_value_string;
    else if (config_key_string == "data_source.lookback_calendar_days") cfg.data_source.lookback_calendar_days = std::stoi(config_value_string);
    else if (config_key_string == "data_source.csv_directory") cfg.data_source.csv_directory = config_value_string;
    else if (config_key_string == "data_source.base_url") cfg.data_source.base_url = config_value_string;
    else if (config_key_string == "data_source.bars_endpoint") cfg.data_source.bars_endpoint = config_value_string;
    else if (config_key_string == "data_source.api_key") cfg.data_source.api_key = config_value_string;
    else if (config_key_string == "data_source.api_secret") cfg.data_source.api_secret = config_value_string;
    else if (config_key_string == "data_source.feed") cfg.data_source.feed = config_value_string;
    else if (config_key_string == "data_source.page_limit") cfg.data_source.page_limit = std::stoi(config_value_string);
    else if (config_key_string == "data_source.retry_count") cfg.data_source.retry_count = std::stoi(config_value_string);
    else if (config_key_string == "data_source.timeout_seconds") cfg.data_source.timeout_seconds = std::stoi(config_value_string);
    else if (config_key_string == "data_source.rate_limit_delay_ms") cfg.data_source.rate_limit_delay_ms = std::stoi(config_value_string);
    else if (config_key_string == "data_source.enable_ssl_verification") cfg.data_source.enable_ssl_verification = to_bool(config_value_string);
    else return false;
    return true;
}

bool apply_logging_setting(SwingScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    if (config_key_string == "logging.log_file") cfg.logging.log_file = config_value_string;
    else if (config_key_string == "logging.runtime_log_directory") cfg.logging.runtime_log_directory = config_value_string;
    else if (config_key_string == "logging.setups_csv_file") cfg.logging.setups_csv_file = config_value_string;
    else if (config_key_string == "logging.logging_poll_interval_ms") cfg.logging.logging_poll_interval_ms = std::stoi(config_value_string);
    else if (config_key_string == "logging.log_rejected_tickers") cfg.logging.log_rejected_tickers = to_bool(config_value_string);
    else if (config_key_string == "logging.log_zone_tables") cfg.logging.log_zone_tables = to_bool(config_value_string);
    else return false;
    return true;
}

}

bool apply_config_setting(SwingScanner::Config::SystemConfig& cfg, const std::string& config_key_string, const std::string& config_value_string) {
    if (apply_strategy_setting(cfg, config_key_string, config_value_string)) return true;
    if (apply_scanner_setting(cfg, config_key_string, config_value_string)) return true;
    if (apply_data_source_setting(cfg, config_key_string, config_value_string)) return true;
    return apply_logging_setting(cfg, config_key_string, config_value_string);
}

bool load_config_from_csv(SwingScanner::Config::SystemConfig& cfg, const std::string& csv_path) {
    try {
        std::ifstream config_file_stream(csv_path);
        if (!config_file_stream.is_open()) {
            ConfigLogs::log_config_load_failed(csv_path, "file could not be opened");
            return false;
        }

        std::string config_line_string;
        while (std::getline(config_file_stream, config_line_string)) {
            config_line_string = trim(config_line_string);
            if (config_line_string.empty() || config_line_string[0] == '#') continue;

            std::stringstream config_line_stream(config_line_string);
            std::string config_key_string, config_value_string;
            if (!std::getline(config_line_stream, config_key_string, ',')) continue;
            if (!std::getline(config_line_stream, config_value_string)) {
                throw std::runtime_error("Missing value for key " + trim(config_key_string));
            }
            config_key_string = trim(config_key_string);
            config_value_string = trim(config_value_string);

            try {
                if (!apply_config_setting(cfg, config_key_string, config_value_string)) {
                    throw std::runtime_error("Unknown configuration key: " + config_key_string);
                }
            } catch (const std::exception& line_exception_error) {
                ConfigLogs::log_config_parse_error(config_line_string, line_exception_error.what());
                throw;
            }
        }
        ConfigLogs::log_config_file_loaded(csv_path);
        return true;
    } catch (const std::exception& exception_error) {
        ConfigLogs::log_config_load_failed(csv_path, exception_error.what());
        return false;
    }
}

int load_system_config(SwingScanner::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/strategy_config.csv",
        config_directory + "/scanner_config.csv",
        config_directory + "/logging_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            return 1;
        }
    }

    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        ConfigLogs::log_config_validation_failed(validation_error);
        return 1;
    }

    return 0;
}

bool validate_config(const SwingScanner::Config::SystemConfig& config, std::string& error_message) {
    const SwingScanner::Config::IndicatorConfig& indicators = config.strategy.indicators;
    if (indicators.ema_short_period < 1 || indicators.ema_long_period < 1 || indicators.sma_long_period < 1 ||
        indicators.sma_base_period < 1 || indicators.atr_period < 1 || indicators.cci_period < 1 ||
        indicators.volume_sma_period < 1 || indicators.return_lookback_bars < 1) {
        error_message = "indicators.* periods must be >= 1";
        return false;
    }
    if (indicators.cci_constant <= 0.0) {
        error_message = "indicators.cci_constant must be > 0";
        return false;
    }
    if (config.strategy.regime.ema_period < 1 || config.strategy.regime.minimum_bars < 2) {
        error_message = "regime.ema_period must be >= 1 and regime.minimum_bars >= 2";
        return false;
    }

    const SwingScanner::Config::ZoneConfig& zones = config.strategy.zones;
    if (zones.density_grid_points < 3 || zones.density_peak_order < 1 || zones.pivot_order_minimum < 1 || zones.pivot_order_divisor < 1) {
        error_message = "zones.density_grid_points must be >= 3 and zone pivot/peak orders >= 1";
        return false;
    }
    if (zones.density_peak_percentile < 0.0 || zones.density_peak_percentile > 100.0) {
        error_message = "zones.density_peak_percentile must be within [0, 100]";
        return false;
    }
    if (zones.density_grid_lower_factor <= 0.0 || zones.density_grid_lower_factor >= zones.density_grid_upper_factor) {
        error_message = "zones.density_grid_lower_factor must be > 0 and below zones.density_grid_upper_factor";
        return false;
    }

    if (config.strategy.relative_strength.rs_line_length < 2) {
        error_message = "rs.rs_line_length must be >= 2";
        return false;
    }

    const SwingScanner::Config::BreakoutConfig& breakout = config.strategy.breakout;
    if (breakout.confirmed_min_above_pct > breakout.confirmed_max_above_pct || breakout.level_min_above_pct > breakout.level_max_above_pct) {
        error_message = "breakout.*_min_above_pct must not exceed the matching *_max_above_pct";
        return false;
    }
    if (breakout.trendline_minimum_touches < 2 || breakout.trendline_lookback_bars < 2) {
        error_message = "breakout.trendline_minimum_touches and breakout.trendline_lookback_bars must be >= 2";
        return false;
    }
    if (breakout.u_shape_lookback_bars < 3) {
        error_message = "breakout.u_shape_lookback_bars must be >= 3 for a quadratic fit";
        return false;
    }

    const SwingScanner::Config::BasePatternConfig& base = config.strategy.base;
    if (base.flat_min_lookback < 2 || base.flat_min_lookback > base.flat_max_lookback) {
        error_message = "base.flat_min_lookback must be >= 2 and not exceed base.flat_max_lookback";
        return false;
    }
    if (base.cup_min_depth_pct >= base.cup_max_depth_pct || base.handle_min_pullback_pct >= base.handle_max_pullback_pct) {
        error_message = "base cup depth and handle pullback bands must have min < max";
        return false;
    }
    if (base.minimum_quality_score < 0.0 || base.minimum_quality_score > 100.0) {
        error_message = "base.minimum_quality_score must be within [0, 100]";
        return false;
    }

    const SwingScanner::Config::RiskConfig& risk = config.strategy.risk;
    if (risk.reward_multiple <= 0.0 || risk.max_risk_pct <= 0.0 || risk.entry_multiplier <= 0.0 || risk.stop_atr_multiplier < 0.0) {
        error_message = "risk.* multipliers must be positive";
        return false;
    }

    if (config.scanner.benchmark_symbol.empty()) {
        error_message = "scanner.benchmark_symbol is required";
        return false;
    }
    if (config.scanner.concurrency_limit < 1 || config.scanner.concurrency_limit > 64) {
        error_message = "scanner.concurrency_limit must be within [1, 64]";
        return false;
    }
    if (config.scanner.max_tickers_per_scan < 1) {
        error_message = "scanner.max_tickers_per_scan must be >= 1";
        return false;
    }
    if (config.scanner.sector_highlight_threshold < 1) {
        error_message = "scanner.sector_highlight_threshold must be >= 1";
        return false;
    }

    if (config.data_source.provider != "csv" && config.data_source.provider != "alpaca") {
        error_message = "data_source.provider must be csv or alpaca (got '" + config.data_source.provider + "')";
        return false;
    }
    if (config.data_source.lookback_calendar_days < 1) {
        error_message = "data_source.lookback_calendar_days must be >= 1";
        return false;
    }
    if (config.data_source.provider == "csv" && config.data_source.csv_directory.empty()) {
        error_message = "data_source.csv_directory is required for the csv provider";
        return false;
    }
    if (config.data_source.provider == "alpaca") {
        if (config.data_source.api_key.empty() || config.data_source.api_secret.empty()) {
            error_message = "data_source.api_key and data_source.api_secret are required for the alpaca provider";
            return false;
        }
        if (config.data_source.retry_count < 1 || config.data_source.timeout_seconds < 1 || config.data_source.page_limit < 1) {
            error_message = "data_source.retry_count, timeout_seconds and page_limit must be >= 1";
            return false;
        }
    }

    if (config.logging.runtime_log_directory.empty() || config.logging.log_file.empty()) {
        error_message = "logging.runtime_log_directory and logging.log_file are required";
        return false;
    }
    if (config.logging.logging_poll_interval_ms < 1) {
        error_message = "logging.logging_poll_interval_ms must be >= 1";
        return false;
    }

    return true;
}
