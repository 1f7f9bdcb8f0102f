#include "base_pattern_engine.hpp"
#include "quality_score.hpp"
#include "scanner/indicators/indicators.hpp"
#include "scanner/indicators/numerical_toolkit.hpp"
#include "scanner/risk/risk_calculator.hpp"
#include <algorithm>
#include <optional>
#include <stdexcept>

namespace SwingScanner {
namespace Core {

namespace {
    // Latest-bar values and series shared by both sub-patterns
    struct BaseSnapshot {
        IndicatorSeries closes;
        IndicatorSeries highs;
        IndicatorSeries lows;
        IndicatorSeries volumes;
        double close;
        double volume;
        double atr;
        double volume_average;
        double rs_vs_benchmark;

        BaseSnapshot() : close(0.0), volume(0.0), atr(0.0), volume_average(0.0), rs_vs_benchmark(0.0) {}

        int bar_count() const { return static_cast<int>(closes.size()); }
    };

    struct CupCandidate {
        int left_peak_index;               // Absolute bar indices
        int cup_bottom_index;
        int right_rim_index;
        double left_peak;
        double cup_bottom;
        double right_rim;
        double depth;

        CupCandidate()
            : left_peak_index(0), cup_bottom_index(0), right_rim_index(0), left_peak(0.0), cup_bottom(0.0),
              right_rim(0.0), depth(0.0) {}
    };

    struct HandleCandidate {
        double handle_high;
        double handle_low;

        HandleCandidate() : handle_high(0.0), handle_low(0.0) {}
    };

    // Index of the first maximum / minimum in [begin, end)
    int argmax_in_range(const IndicatorSeries& values, int begin_index, int end_index) {
        int best_index = begin_index;
        for (int value_index = begin_index + 1; value_index < end_index; ++value_index) {
            if (values[value_index] > values[best_index]) {
                best_index = value_index;
            }
        }
        return best_index;
    }

    int argmin_in_range(const IndicatorSeries& values, int begin_index, int end_index) {
        int best_index = begin_index;
        for (int value_index = begin_index + 1; value_index < end_index; ++value_index) {
            if (values[value_index] < values[best_index]) {
                best_index = value_index;
            }
        }
        return best_index;
    }

    bool range_is_defined(const IndicatorSeries& values, int begin_index, int end_index) {
        for (int value_index = begin_index; value_index < end_index; ++value_index) {
            if (!is_defined(values[value_index])) {
                return false;
            }
        }
        return true;
    }

    // Stage-2 checks: above the 50 and 200 SMA, well off the yearly low, 200 SMA rising
    EngineOutcome<BaseSnapshot> prepare_snapshot(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
        const Config::BasePatternConfig& base_config = strategy_config.base;
        const Config::IndicatorConfig& indicator_config = strategy_config.indicators;
        const std::vector<PriceBar>& bars = request.bars;

        if (static_cast<int>(bars.size()) < base_config.minimum_bars) {
            return EngineOutcome<BaseSnapshot>::insufficient_data("Only " + std::to_string(bars.size()) + " bars");
        }

        BaseSnapshot snapshot;
        snapshot.closes = extract_closes(bars);
        snapshot.highs = extract_highs(bars);
        snapshot.lows = extract_lows(bars);
        snapshot.volumes = extract_volumes(bars);
        if (count_defined(snapshot.closes) < base_config.minimum_valid_closes) {
            return EngineOutcome<BaseSnapshot>::insufficient_data("Too few valid closes");
        }

        snapshot.close = last_value(snapshot.closes);
        snapshot.volume = last_value(snapshot.volumes);
        if (!is_defined(snapshot.close) || !is_defined(snapshot.volume)) {
            return EngineOutcome<BaseSnapshot>::insufficient_data("Latest bar undefined");
        }

        IndicatorSeries base_sma = sma(snapshot.closes, indicator_config.sma_base_period);
        double latest_base_sma = last_value(base_sma);
        double latest_long_sma = last_value(sma(snapshot.closes, indicator_config.sma_long_period));
        if (is_defined(latest_base_sma) && snapshot.close < latest_base_sma) {
            return EngineOutcome<BaseSnapshot>::no_signal("Close below 200 SMA");
        }
        if (is_defined(latest_long_sma) && snapshot.close < latest_long_sma) {
            return EngineOutcome<BaseSnapshot>::no_signal("Close below 50 SMA");
        }

        int low_window = std::min(base_config.stage_two_low_lookback, snapshot.bar_count());
        double yearly_low = range_min(snapshot.lows, snapshot.bar_count() - low_window, snapshot.bar_count());
        if (is_defined(yearly_low) && yearly_low > 0.0 && snapshot.close < yearly_low * base_config.stage_two_low_multiple) {
            return EngineOutcome<BaseSnapshot>::no_signal("No prior advance off the yearly low");
        }

        double previous_base_sma = value_from_end(base_sma, base_config.sma_rising_lookback);
        if (is_defined(latest_base_sma) && is_defined(previous_base_sma) && latest_base_sma <= previous_base_sma) {
            return EngineOutcome<BaseSnapshot>::no_signal("200 SMA not rising");
        }

        snapshot.atr = last_value(atr(snapshot.highs, snapshot.lows, snapshot.closes, indicator_config.atr_period));
        if (!is_defined(snapshot.atr) || snapshot.atr <= 0.0) {
            return EngineOutcome<BaseSnapshot>::insufficient_data("ATR undefined or not positive");
        }
        snapshot.volume_average = last_value(sma(snapshot.volumes, indicator_config.volume_sma_period));
        if (!is_defined(snapshot.volume_average) || snapshot.volume_average <= 0.0) {
            return EngineOutcome<BaseSnapshot>::insufficient_data("Volume average undefined");
        }

        double stock_return = trailing_return(snapshot.closes, indicator_config.return_lookback_bars);
        snapshot.rs_vs_benchmark = is_defined(stock_return) ? stock_return - request.benchmark_3m_return : 0.0;
        return EngineOutcome<BaseSnapshot>::found(snapshot);
    }

    // Cup search over [window_begin, window_end), the bars before the signal bar
    std::optional<CupCandidate> find_cup(const IndicatorSeries& closes, int window_begin, int window_end,
                                         const Config::BasePatternConfig& base_config) {
        int window_length = window_end - window_begin;
        if (window_length < base_config.cup_minimum_window || !range_is_defined(closes, window_begin, window_end)) {
            return std::nullopt;
        }

        int left_search_length = window_length * 2 / 3;
        if (left_search_length < 10) {
            return std::nullopt;
        }

        CupCandidate cup;
        cup.left_peak_index = argmax_in_range(closes, window_begin, window_begin + left_search_length);
        cup.left_peak = closes[cup.left_peak_index];
        if (window_end - cup.left_peak_index < 5 || cup.left_peak <= 0.0) {
            return std::nullopt;
        }

        cup.cup_bottom_index = argmin_in_range(closes, cup.left_peak_index, window_end);
        cup.cup_bottom = closes[cup.cup_bottom_index];
        cup.depth = (cup.left_peak - cup.cup_bottom) / cup.left_peak;
        if (cup.depth < base_config.cup_min_depth_pct || cup.depth > base_config.cup_max_depth_pct) {
            return std::nullopt;
        }

        if (window_end - cup.cup_bottom_index < 5) {
            return std::nullopt;
        }
        cup.right_rim_index = argmax_in_range(closes, cup.cup_bottom_index, window_end);
        cup.right_rim = closes[cup.right_rim_index];
        if ((cup.left_peak - cup.right_rim) / cup.left_peak > base_config.cup_rim_recovery_pct) {
            return std::nullopt;
        }

        if (cup.right_rim_index - cup.left_peak_index < base_config.cup_minimum_length) {
            return std::nullopt;
        }
        return cup;
    }

    bool is_cup_u_shaped(const IndicatorSeries& closes, const CupCandidate& cup) {
        std::vector<double> x_values;
        std::vector<double> cup_closes;
        for (int bar_index = cup.left_peak_index; bar_index <= cup.right_rim_index; ++bar_index) {
            x_values.push_back(static_cast<double>(bar_index - cup.left_peak_index));
            cup_closes.push_back(closes[bar_index]);
        }
        if (cup_closes.size() < 6) {
            return false;
        }
        return fit_quadratic(x_values, cup_closes).a > 0.0;
    }

    std::optional<HandleCandidate> find_handle(const BaseSnapshot& snapshot, const CupCandidate& cup, int window_end,
                                               const Config::BasePatternConfig& base_config) {
        int after_rim_length = window_end - cup.right_rim_index;
        if (after_rim_length < 6) {
            return std::nullopt;
        }

        int handle_end = cup.right_rim_index + std::min(base_config.handle_max_bars, after_rim_length);
        int search_begin = cup.right_rim_index + 1;
        if (handle_end - search_begin < 4) {
            return std::nullopt;
        }

        HandleCandidate handle;
        handle.handle_high = cup.right_rim;
        handle.handle_low = snapshot.closes[argmin_in_range(snapshot.closes, search_begin, handle_end)];

        double pullback = (cup.right_rim - handle.handle_low) / cup.right_rim;
        if (pullback < base_config.handle_min_pullback_pct || pullback > base_config.handle_max_pullback_pct) {
            return std::nullopt;
        }

        double cup_midpoint = (cup.left_peak + cup.cup_bottom) / 2.0;
        if (handle.handle_low < cup_midpoint) {
            return std::nullopt;
        }

        // Early handle volume (bars 1-3 after the rim) below the 50-day average
        double handle_volume = range_mean(snapshot.volumes, search_begin, search_begin + 3);
        if (!is_defined(handle_volume) || handle_volume >= snapshot.volume_average) {
            return std::nullopt;
        }
        return handle;
    }

    // BRK above the pivot on volume, DRY just below it
    std::optional<BaseSignal> classify_signal(const BaseSnapshot& snapshot, double pivot_price, const Config::BasePatternConfig& base_config) {
        double volume_ratio = snapshot.volume / snapshot.volume_average;
        double distance_to_pivot = pivot_price > 0.0 ? (pivot_price - snapshot.close) / pivot_price : 1.0;
        if (snapshot.close > pivot_price && volume_ratio >= base_config.breakout_volume_ratio) {
            return BaseSignal::BRK;
        }
        if (distance_to_pivot <= base_config.pivot_proximity_pct) {
            return BaseSignal::DRY;
        }
        return std::nullopt;
    }

    Setup make_base_setup(const PatternScanRequest& request, const RiskLevels& risk_levels, const BaseMetadata& base_metadata) {
        Setup setup;
        setup.ticker = request.ticker;
        setup.setup_type = SetupType::BASE;
        setup.entry = risk_levels.entry;
        setup.stop_loss = risk_levels.stop_loss;
        setup.take_profit = risk_levels.take_profit;
        setup.risk_reward = risk_levels.risk_reward;
        setup.setup_date = request.bars.back().date;
        setup.base = base_metadata;
        return setup;
    }
}

SetupOutcome scan_cup_handle(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    const Config::BasePatternConfig& base_config = strategy_config.base;

    try {
        EngineOutcome<BaseSnapshot> prepared_snapshot = prepare_snapshot(request, strategy_config);
        if (!prepared_snapshot.has_value()) {
            return SetupOutcome::rejected(prepared_snapshot.reason, prepared_snapshot.detail);
        }
        const BaseSnapshot& snapshot = *prepared_snapshot.value;

        int window_end = snapshot.bar_count() - 1;
        int window_begin = window_end - std::min(base_config.cup_lookback_bars, window_end);

        std::optional<CupCandidate> cup = find_cup(snapshot.closes, window_begin, window_end, base_config);
        if (!cup) {
            return SetupOutcome::no_signal("No cup");
        }
        if (!is_cup_u_shaped(snapshot.closes, *cup)) {
            return SetupOutcome::no_signal("Cup is not U-shaped");
        }

        std::optional<HandleCandidate> handle = find_handle(snapshot, *cup, window_end, base_config);
        if (!handle) {
            return SetupOutcome::no_signal("No handle");
        }

        std::optional<BaseSignal> base_signal = classify_signal(snapshot, handle->handle_high, base_config);
        if (!base_signal) {
            return SetupOutcome::no_signal("Close not at the handle pivot");
        }

        std::optional<RiskLevels> risk_levels =
            calculate_risk_levels(RiskRequest(handle->handle_high, handle->handle_low, snapshot.atr), strategy_config.risk);
        if (!risk_levels) {
            return SetupOutcome::no_signal("Cup & handle rejected by risk limits");
        }

        double volume_dry_ratio = tail_mean(snapshot.volumes, 5) / snapshot.volume_average;
        if (!is_defined(volume_dry_ratio) || volume_dry_ratio > base_config.five_day_volume_max_ratio) {
            return SetupOutcome::no_signal("No volume contraction");
        }

        QualityScoreRequest score_request;
        score_request.depth_pct = cup->depth;
        score_request.max_depth_pct = base_config.cup_max_depth_pct;
        score_request.volume_dry_ratio = volume_dry_ratio;
        score_request.rs_vs_benchmark = snapshot.rs_vs_benchmark;
        score_request.rs_blue_dot = request.rs_stats.is_blue_dot;

        CupGeometry cup_geometry;
        cup_geometry.left_peak_date = request.bars[cup->left_peak_index].date;
        cup_geometry.left_peak_price = cup->left_peak;
        cup_geometry.cup_bottom_date = request.bars[cup->cup_bottom_index].date;
        cup_geometry.cup_bottom_price = cup->cup_bottom;
        cup_geometry.right_rim_date = request.bars[cup->right_rim_index].date;
        cup_geometry.right_rim_price = cup->right_rim;
        cup_geometry.handle_high = handle->handle_high;
        cup_geometry.handle_low = handle->handle_low;

        BaseMetadata base_metadata;
        base_metadata.base_type = BaseType::CUP_HANDLE;
        base_metadata.signal = *base_signal;
        base_metadata.quality_score = calculate_quality_score(score_request, base_config);
        base_metadata.base_depth_pct = cup->depth * 100.0;
        base_metadata.base_length_days = std::max(0, snapshot.bar_count() - 1 - cup->left_peak_index);
        base_metadata.volume_dry_pct = volume_dry_ratio * 100.0;
        base_metadata.rs_vs_benchmark = snapshot.rs_vs_benchmark;
        base_metadata.cup_geometry = cup_geometry;

        return SetupOutcome::found(make_base_setup(request, *risk_levels, base_metadata));
    } catch (const std::exception& exception_error) {
        return SetupOutcome::computation_error(exception_error.what());
    }
}

SetupOutcome scan_flat_base(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    const Config::BasePatternConfig& base_config = strategy_config.base;

    try {
        EngineOutcome<BaseSnapshot> prepared_snapshot = prepare_snapshot(request, strategy_config);
        if (!prepared_snapshot.has_value()) {
            return SetupOutcome::rejected(prepared_snapshot.reason, prepared_snapshot.detail);
        }
        const BaseSnapshot& snapshot = *prepared_snapshot.value;

        // Longest trailing window before the signal bar whose range stays within the depth cap
        int window_end = snapshot.bar_count() - 1;
        int max_lookback = std::min(base_config.flat_max_lookback, window_end);
        int base_lookback = 0;
        double base_high_price = 0.0;
        double base_low_price = 0.0;
        for (int lookback = max_lookback; lookback >= base_config.flat_min_lookback; --lookback) {
            double window_high = range_max(snapshot.highs, window_end - lookback, window_end);
            double window_low = range_min(snapshot.lows, window_end - lookback, window_end);
            if (!is_defined(window_high) || !is_defined(window_low) || window_high <= 0.0) {
                continue;
            }
            if ((window_high - window_low) / window_high <= base_config.flat_max_depth_pct) {
                base_lookback = lookback;
                base_high_price = window_high;
                base_low_price = window_low;
                break;
            }
        }
        if (base_lookback == 0) {
            return SetupOutcome::no_signal("No flat window");
        }
        int base_start = window_end - base_lookback;
        double depth = (base_high_price - base_low_price) / base_high_price;

        // Pivot is the highest close of the window
        double pivot_price = range_max(snapshot.closes, base_start, window_end);
        if (!is_defined(pivot_price)) {
            return SetupOutcome::insufficient_data("Undefined closes in the base");
        }

        double range_span = base_high_price - base_low_price;
        if (range_span > 0.0 && (snapshot.close - base_low_price) / range_span < base_config.flat_min_range_position) {
            return SetupOutcome::no_signal("Close in the lower part of the base");
        }

        double short_volume_average = tail_mean(snapshot.volumes, base_config.flat_short_volume_bars);
        if (!is_defined(short_volume_average)) {
            return SetupOutcome::insufficient_data("Short volume average undefined");
        }
        double volume_dry_ratio = short_volume_average / snapshot.volume_average;
        if (volume_dry_ratio > base_config.flat_volume_max_ratio) {
            return SetupOutcome::no_signal("No volume contraction");
        }

        std::optional<BaseSignal> base_signal = classify_signal(snapshot, pivot_price, base_config);
        if (!base_signal) {
            return SetupOutcome::no_signal("Close not at the base pivot");
        }

        std::optional<RiskLevels> risk_levels =
            calculate_risk_levels(RiskRequest(pivot_price, base_low_price, snapshot.atr), strategy_config.risk);
        if (!risk_levels) {
            return SetupOutcome::no_signal("Flat base rejected by risk limits");
        }

        QualityScoreRequest score_request;
        score_request.depth_pct = depth;
        score_request.max_depth_pct = base_config.flat_max_depth_pct;
        score_request.volume_dry_ratio = volume_dry_ratio;
        score_request.rs_vs_benchmark = snapshot.rs_vs_benchmark;
        score_request.rs_blue_dot = request.rs_stats.is_blue_dot;

        FlatGeometry flat_geometry;
        flat_geometry.start_date = request.bars[base_start].date;
        flat_geometry.end_date = request.bars.back().date;
        flat_geometry.base_high = base_high_price;
        flat_geometry.base_low = base_low_price;

        BaseMetadata base_metadata;
        base_metadata.base_type = BaseType::FLAT_BASE;
        base_metadata.signal = *base_signal;
        base_metadata.quality_score = calculate_quality_score(score_request, base_config);
        base_metadata.base_depth_pct = depth * 100.0;
        base_metadata.base_length_days = base_lookback;
        base_metadata.volume_dry_pct = volume_dry_ratio * 100.0;
        base_metadata.rs_vs_benchmark = snapshot.rs_vs_benchmark;
        base_metadata.flat_geometry = flat_geometry;

        return SetupOutcome::found(make_base_setup(request, *risk_levels, base_metadata));
    } catch (const std::exception& exception_error) {
        return SetupOutcome::computation_error(exception_error.what());
    }
}

SetupOutcome scan_base_pattern(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    SetupOutcome cup_outcome = scan_cup_handle(request, strategy_config);
    SetupOutcome flat_outcome = scan_flat_base(request, strategy_config);

    const Setup* best_setup = nullptr;
    for (const SetupOutcome* candidate : {&cup_outcome, &flat_outcome}) {
        if (!candidate->has_value() || candidate->value->base->quality_score < strategy_config.base.minimum_quality_score) {
            continue;
        }
        if (best_setup == nullptr || candidate->value->base->quality_score > best_setup->base->quality_score) {
            best_setup = &*candidate->value;
        }
    }
    if (best_setup != nullptr) {
        return SetupOutcome::found(*best_setup);
    }

    // Report the most informative failure: an error beats insufficient data beats no signal
    for (OutcomeReason reason : {OutcomeReason::COMPUTATION_ERROR, OutcomeReason::INSUFFICIENT_DATA}) {
        for (const SetupOutcome* candidate : {&cup_outcome, &flat_outcome}) {
            if (candidate->reason == reason) {
                return SetupOutcome::rejected(reason, candidate->detail);
            }
        }
    }
    if (cup_outcome.has_value() || flat_outcome.has_value()) {
        return SetupOutcome::no_signal("Quality score below minimum");
    }
    if (cup_outcome.detail == flat_outcome.detail) {
        return SetupOutcome::no_signal(cup_outcome.detail);
    }
    return SetupOutcome::no_signal(cup_outcome.detail + "; " + flat_outcome.detail);
}

} // namespace Core
} // namespace SwingScanner
