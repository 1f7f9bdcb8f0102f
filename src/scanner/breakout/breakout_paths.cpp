#include "breakout_paths.hpp"
#include "scanner/breakout/trendline_fitter.hpp"
#include "scanner/indicators/indicators.hpp"
#include "scanner/indicators/numerical_toolkit.hpp"
#include "scanner/risk/risk_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace SwingScanner {
namespace Core {

namespace {
    // Zones still overhead before the signal bar: classified resistance, or not yet cleared by the prior close.
    // Zone types are assigned against the latest close, so a zone cleared on the signal bar reads as support.
    bool was_resistance_before_signal(const Zone& zone, const BreakoutInputs& inputs) {
        if (zone.type == ZoneType::RESISTANCE) {
            return true;
        }
        return is_defined(inputs.previous_close) && inputs.previous_close <= zone.upper;
    }

    const Zone* find_highest_prior_resistance(const BreakoutInputs& inputs) {
        const Zone* highest_zone = nullptr;
        for (const Zone& zone : inputs.zones) {
            if (was_resistance_before_signal(zone, inputs) && (highest_zone == nullptr || zone.level > highest_zone->level)) {
                highest_zone = &zone;
            }
        }
        return highest_zone;
    }

    const Zone* find_highest_resistance(const std::vector<Zone>& zones) {
        const Zone* highest_zone = nullptr;
        for (const Zone& zone : zones) {
            if (zone.type == ZoneType::RESISTANCE && (highest_zone == nullptr || zone.level > highest_zone->level)) {
                highest_zone = &zone;
            }
        }
        return highest_zone;
    }

    // Highest prior resistance whose upper bound the close cleared
    const Zone* find_highest_cleared_zone(const BreakoutInputs& inputs) {
        const Zone* cleared_zone = nullptr;
        for (const Zone& zone : inputs.zones) {
            if (zone.upper < inputs.close && was_resistance_before_signal(zone, inputs) &&
                (cleared_zone == nullptr || zone.level > cleared_zone->level)) {
                cleared_zone = &zone;
            }
        }
        return cleared_zone;
    }

    BreakoutPathMatch make_match(const BreakoutInputs& inputs, BreakoutPath path, double stop_base_price) {
        BreakoutPathMatch match;
        match.stop_base_price = stop_base_price;
        match.metadata.path = path;
        match.metadata.volume_ratio = inputs.volume_ratio;
        match.metadata.rs_vs_benchmark = is_defined(inputs.rs_vs_benchmark) ? inputs.rs_vs_benchmark : 0.0;
        return match;
    }

    bool is_u_shaped(const IndicatorSeries& closes, int lookback_bars, double min_curvature) {
        if (lookback_bars < 3 || static_cast<int>(closes.size()) < lookback_bars) {
            return false;
        }
        std::vector<double> recent_closes(closes.end() - lookback_bars, closes.end());
        for (double close_value : recent_closes) {
            if (!is_defined(close_value)) {
                return false;
            }
        }

        double close_mean = mean_value(recent_closes);
        double close_std = population_std(recent_closes);
        if (close_std < 1e-8) {
            return false;
        }

        std::vector<double> x_values;
        std::vector<double> standardized_closes;
        for (int bar_offset = 0; bar_offset < lookback_bars; ++bar_offset) {
            x_values.push_back(static_cast<double>(bar_offset));
            standardized_closes.push_back((recent_closes[bar_offset] - close_mean) / close_std);
        }

        QuadraticFit parabola = fit_quadratic(x_values, standardized_closes);
        double vertex_x = std::abs(parabola.a) > 1e-8 ? parabola.vertex_x() : -1.0;
        return parabola.a > min_curvature && vertex_x >= 0.0 && vertex_x <= static_cast<double>(lookback_bars);
    }
}

EngineOutcome<BreakoutInputs> prepare_breakout_inputs(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    const Config::BreakoutConfig& breakout_config = strategy_config.breakout;
    const Config::IndicatorConfig& indicator_config = strategy_config.indicators;
    const std::vector<PriceBar>& bars = request.bars;

    if (static_cast<int>(bars.size()) < breakout_config.minimum_bars) {
        return EngineOutcome<BreakoutInputs>::insufficient_data("Only " + std::to_string(bars.size()) + " bars");
    }

    BreakoutInputs inputs;
    inputs.ticker = request.ticker;
    inputs.setup_date = bars.back().date;
    inputs.closes = extract_closes(bars);
    inputs.highs = extract_highs(bars);
    inputs.lows = extract_lows(bars);
    inputs.volumes = extract_volumes(bars);

    if (count_defined(inputs.closes) < breakout_config.minimum_valid_closes) {
        return EngineOutcome<BreakoutInputs>::insufficient_data("Too few valid closes");
    }

    inputs.close = last_value(inputs.closes);
    inputs.previous_close = value_from_end(inputs.closes, 1);
    inputs.high = last_value(inputs.highs);
    inputs.low = last_value(inputs.lows);
    inputs.volume = last_value(inputs.volumes);
    inputs.ema_short = last_value(ema(inputs.closes, indicator_config.ema_short_period));
    inputs.ema_long = last_value(ema(inputs.closes, indicator_config.ema_long_period));
    inputs.sma_long = last_value(sma(inputs.closes, indicator_config.sma_long_period));
    inputs.atr = last_value(atr(inputs.highs, inputs.lows, inputs.closes, indicator_config.atr_period));

    for (double required_value : {inputs.close, inputs.high, inputs.low, inputs.ema_short, inputs.ema_long, inputs.sma_long, inputs.atr}) {
        if (!is_defined(required_value)) {
            return EngineOutcome<BreakoutInputs>::insufficient_data("Indicator warm-up incomplete");
        }
    }

    if (!(inputs.ema_short > inputs.ema_long && inputs.close > inputs.sma_long)) {
        return EngineOutcome<BreakoutInputs>::no_signal("Trend filter failed");
    }

    inputs.volume_average = last_value(sma(inputs.volumes, indicator_config.volume_sma_period));
    if (!is_defined(inputs.volume_average) || inputs.volume_average <= 0.0 || !is_defined(inputs.volume)) {
        return EngineOutcome<BreakoutInputs>::insufficient_data("Volume average undefined");
    }
    inputs.volume_ratio = inputs.volume / inputs.volume_average;

    inputs.stock_return = trailing_return(inputs.closes, indicator_config.return_lookback_bars);
    inputs.benchmark_return = request.benchmark_3m_return;
    inputs.rs_vs_benchmark = is_defined(inputs.stock_return) ? inputs.stock_return - inputs.benchmark_return : UNDEFINED_VALUE;

    inputs.zones = request.zones;
    inputs.rs_stats = request.rs_stats;
    inputs.trendline = fit_descending_trendline(bars, breakout_config);
    return EngineOutcome<BreakoutInputs>::found(inputs);
}

std::optional<BreakoutPathMatch> match_confirmed_breakout(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config) {
    if (inputs.volume_ratio < breakout_config.confirmed_volume_ratio) {
        return std::nullopt;
    }
    if (!is_defined(inputs.rs_vs_benchmark) || inputs.rs_vs_benchmark <= 0.0) {
        return std::nullopt;
    }

    const Zone* cleared_zone = find_highest_cleared_zone(inputs);
    if (cleared_zone == nullptr) {
        return std::nullopt;
    }
    double above_pct = (inputs.close - cleared_zone->upper) / cleared_zone->upper;
    if (above_pct < breakout_config.confirmed_min_above_pct || above_pct > breakout_config.confirmed_max_above_pct) {
        return std::nullopt;
    }

    BreakoutPathMatch match = make_match(inputs, BreakoutPath::CONFIRMED_BREAKOUT, cleared_zone->lower);
    match.metadata.is_breakout = true;
    match.metadata.resistance_level = cleared_zone->level;
    return match;
}

std::optional<BreakoutPathMatch> match_trendline_breakout(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config) {
    if (!inputs.trendline || inputs.volume_ratio < breakout_config.trendline_volume_ratio) {
        return std::nullopt;
    }
    double trendline_value = inputs.trendline->current_value;
    if (!(inputs.close > trendline_value)) {
        return std::nullopt;
    }

    BreakoutPathMatch match = make_match(inputs, BreakoutPath::TRENDLINE_BREAKOUT,
                                         trendline_value * breakout_config.trendline_stop_factor);
    match.metadata.is_breakout = true;
    match.metadata.resistance_level = trendline_value;
    match.metadata.trendline_value = trendline_value;
    return match;
}

std::optional<BreakoutPathMatch> match_level_breakout(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config) {
    const Zone* highest_zone = find_highest_prior_resistance(inputs);
    if (highest_zone == nullptr || inputs.volume_ratio < breakout_config.level_volume_ratio) {
        return std::nullopt;
    }
    if (!is_defined(inputs.rs_vs_benchmark) || inputs.rs_vs_benchmark < 0.0) {
        return std::nullopt;
    }

    double above_pct = (inputs.close - highest_zone->upper) / highest_zone->upper;
    if (above_pct < breakout_config.level_min_above_pct || above_pct > breakout_config.level_max_above_pct) {
        return std::nullopt;
    }

    BreakoutPathMatch match = make_match(inputs, BreakoutPath::LEVEL_BREAKOUT, highest_zone->lower);
    match.metadata.is_breakout = true;
    match.metadata.resistance_level = highest_zone->level;
    return match;
}

std::optional<BreakoutPathMatch> match_rs_lead(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config) {
    if (!inputs.rs_stats.is_blue_dot) {
        return std::nullopt;
    }
    const Zone* resistance_zone = find_highest_resistance(inputs.zones);
    if (resistance_zone == nullptr) {
        return std::nullopt;
    }

    double below_pct = (resistance_zone->upper - inputs.close) / resistance_zone->upper;
    if (below_pct < 0.0 || below_pct > breakout_config.rs_lead_proximity_pct) {
        return std::nullopt;
    }

    BreakoutPathMatch match = make_match(inputs, BreakoutPath::RS_LEAD, resistance_zone->lower);
    match.metadata.is_breakout = false;
    match.metadata.is_rs_lead = true;
    match.metadata.resistance_level = resistance_zone->level;
    return match;
}

std::optional<BreakoutPathMatch> match_dry_base(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config) {
    // Volatility contraction
    IndicatorSeries true_ranges = drop_undefined(true_range(inputs.highs, inputs.lows, inputs.closes));
    int recent_bars = breakout_config.contraction_recent_bars;
    int prior_bars = breakout_config.contraction_prior_bars;
    if (static_cast<int>(true_ranges.size()) < recent_bars + prior_bars + 1) {
        return std::nullopt;
    }
    int range_count = static_cast<int>(true_ranges.size());
    double recent_range = range_mean(true_ranges, range_count - recent_bars, range_count);
    double prior_range = range_mean(true_ranges, range_count - recent_bars - prior_bars, range_count - recent_bars);
    if (!(recent_range < prior_range)) {
        return std::nullopt;
    }

    int u_shape_bars = std::min(breakout_config.u_shape_lookback_bars, static_cast<int>(inputs.closes.size()) - 5);
    if (!is_u_shaped(inputs.closes, u_shape_bars, breakout_config.u_shape_min_curvature)) {
        return std::nullopt;
    }

    // Nearest resistance at most dry_resistance_proximity_pct above the close
    const Zone* nearest_resistance = nullptr;
    double nearest_distance = std::numeric_limits<double>::infinity();
    for (const Zone& zone : inputs.zones) {
        if (zone.type != ZoneType::RESISTANCE) {
            continue;
        }
        double distance = zone.level - inputs.close;
        if (distance >= 0.0 && distance <= zone.level * breakout_config.dry_resistance_proximity_pct && distance < nearest_distance) {
            nearest_distance = distance;
            nearest_resistance = &zone;
        }
    }
    if (nearest_resistance == nullptr) {
        return std::nullopt;
    }

    double recent_volume = tail_mean(inputs.volumes, breakout_config.dry_volume_bars);
    bool is_dry = is_defined(recent_volume) && recent_volume < inputs.volume_average;
    bool is_breakout_volume = inputs.volume_ratio >= breakout_config.dry_breakout_volume_ratio;
    bool at_breakout = inputs.close >= nearest_resistance->lower && is_breakout_volume;
    bool in_dry_up = inputs.close < nearest_resistance->lower && is_dry;
    if (!(at_breakout || in_dry_up)) {
        return std::nullopt;
    }

    BreakoutPathMatch match = make_match(inputs, BreakoutPath::DRY_BASE, nearest_resistance->lower);
    match.metadata.is_breakout = at_breakout;
    match.metadata.resistance_level = nearest_resistance->level;
    match.metadata.tr_contraction_pct = (1.0 - recent_range / prior_range) * 100.0;
    return match;
}

SetupOutcome build_breakout_setup(const BreakoutInputs& inputs, const BreakoutPathMatch& match, const Config::StrategyConfig& strategy_config) {
    RiskRequest risk_request(inputs.high, std::min(inputs.low, match.stop_base_price), inputs.atr);
    std::optional<RiskLevels> risk_levels = calculate_risk_levels(risk_request, strategy_config.risk);
    if (!risk_levels) {
        return SetupOutcome::no_signal(to_string(match.metadata.path) + " rejected by risk limits");
    }

    Setup setup;
    setup.ticker = inputs.ticker;
    setup.setup_type = SetupType::BREAKOUT;
    setup.entry = risk_levels->entry;
    setup.stop_loss = risk_levels->stop_loss;
    setup.take_profit = risk_levels->take_profit;
    setup.risk_reward = risk_levels->risk_reward;
    setup.setup_date = inputs.setup_date;
    setup.breakout = match.metadata;
    return SetupOutcome::found(setup);
}

const std::vector<BreakoutPathRule>& get_breakout_path_rules() {
    static const std::vector<BreakoutPathRule> breakout_path_rules = {
        BreakoutPathRule(BreakoutPath::CONFIRMED_BREAKOUT, match_confirmed_breakout, build_breakout_setup),
        BreakoutPathRule(BreakoutPath::TRENDLINE_BREAKOUT, match_trendline_breakout, build_breakout_setup),
        BreakoutPathRule(BreakoutPath::LEVEL_BREAKOUT, match_level_breakout, build_breakout_setup),
        BreakoutPathRule(BreakoutPath::RS_LEAD, match_rs_lead, build_breakout_setup),
        BreakoutPathRule(BreakoutPath::DRY_BASE, match_dry_base, build_breakout_setup),
    };
    return breakout_path_rules;
}

} // namespace Core
} // namespace SwingScanner
