#include "pullback_engine.hpp"
#include "scanner/indicators/indicators.hpp"
#include "scanner/risk/risk_calculator.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace SwingScanner {
namespace Core {

namespace {
    // Latest-bar values both pullback paths read
    struct PullbackSnapshot {
        double close;
        double high;
        double low;
        double ema_short;
        double ema_long;
        double sma_long;
        double atr;
        double cci_today;
        double cci_yesterday;
        IndicatorSeries volumes;

        PullbackSnapshot()
            : close(0.0), high(0.0), low(0.0), ema_short(0.0), ema_long(0.0), sma_long(0.0), atr(0.0),
              cci_today(0.0), cci_yesterday(0.0) {}
    };

    EngineOutcome<PullbackSnapshot> prepare_snapshot(const std::vector<PriceBar>& bars, const Config::StrategyConfig& strategy_config) {
        const Config::PullbackConfig& pullback_config = strategy_config.pullback;
        const Config::IndicatorConfig& indicator_config = strategy_config.indicators;

        if (static_cast<int>(bars.size()) < pullback_config.minimum_bars) {
            return EngineOutcome<PullbackSnapshot>::insufficient_data("Only " + std::to_string(bars.size()) + " bars");
        }

        IndicatorSeries closes = extract_closes(bars);
        IndicatorSeries highs = extract_highs(bars);
        IndicatorSeries lows = extract_lows(bars);
        if (count_defined(closes) < pullback_config.minimum_valid_closes) {
            return EngineOutcome<PullbackSnapshot>::insufficient_data("Too few valid closes");
        }

        IndicatorSeries cci_values = cci(highs, lows, closes, indicator_config.cci_period, indicator_config.cci_constant);
        if (count_defined(cci_values) < 2) {
            return EngineOutcome<PullbackSnapshot>::insufficient_data("CCI warm-up incomplete");
        }

        PullbackSnapshot snapshot;
        snapshot.close = last_value(closes);
        snapshot.high = last_value(highs);
        snapshot.low = last_value(lows);
        snapshot.ema_short = last_value(ema(closes, indicator_config.ema_short_period));
        snapshot.ema_long = last_value(ema(closes, indicator_config.ema_long_period));
        snapshot.sma_long = last_value(sma(closes, indicator_config.sma_long_period));
        snapshot.atr = last_value(atr(highs, lows, closes, indicator_config.atr_period));
        snapshot.cci_today = value_from_end(cci_values, 0);
        snapshot.cci_yesterday = value_from_end(cci_values, 1);
        snapshot.volumes = extract_volumes(bars);

        for (double required_value : {snapshot.close, snapshot.high, snapshot.low, snapshot.ema_short, snapshot.ema_long,
                                      snapshot.sma_long, snapshot.atr, snapshot.cci_today, snapshot.cci_yesterday}) {
            if (!std::isfinite(required_value)) {
                return EngineOutcome<PullbackSnapshot>::insufficient_data("Indicator warm-up incomplete");
            }
        }

        if (!(snapshot.ema_short > snapshot.ema_long && snapshot.close > snapshot.sma_long)) {
            return EngineOutcome<PullbackSnapshot>::no_signal("Trend filter failed");
        }
        return EngineOutcome<PullbackSnapshot>::found(snapshot);
    }

    SetupOutcome build_pullback_setup(const PatternScanRequest& request, const PullbackSnapshot& snapshot,
                                      const PullbackMetadata& pullback_metadata, double stop_base_price,
                                      const Config::RiskConfig& risk_config) {
        std::optional<RiskLevels> risk_levels = calculate_risk_levels(RiskRequest(snapshot.high, stop_base_price, snapshot.atr), risk_config);
        if (!risk_levels) {
            return SetupOutcome::no_signal("Pullback rejected by risk limits");
        }

        Setup setup;
        setup.ticker = request.ticker;
        setup.setup_type = SetupType::PULLBACK;
        setup.entry = risk_levels->entry;
        setup.stop_loss = risk_levels->stop_loss;
        setup.take_profit = risk_levels->take_profit;
        setup.risk_reward = risk_levels->risk_reward;
        setup.setup_date = request.bars.back().date;
        setup.pullback = pullback_metadata;
        return SetupOutcome::found(setup);
    }

    PullbackMetadata make_metadata(const PullbackSnapshot& snapshot, double support_level, bool is_relaxed) {
        PullbackMetadata pullback_metadata;
        pullback_metadata.cci_today = snapshot.cci_today;
        pullback_metadata.cci_yesterday = snapshot.cci_yesterday;
        pullback_metadata.support_level = support_level;
        pullback_metadata.ema8 = snapshot.ema_short;
        pullback_metadata.ema20 = snapshot.ema_long;
        pullback_metadata.is_relaxed = is_relaxed;
        return pullback_metadata;
    }
}

SetupOutcome scan_pullback(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    const Config::PullbackConfig& pullback_config = strategy_config.pullback;

    try {
        EngineOutcome<PullbackSnapshot> prepared_snapshot = prepare_snapshot(request.bars, strategy_config);
        if (!prepared_snapshot.has_value()) {
            return SetupOutcome::rejected(prepared_snapshot.reason, prepared_snapshot.detail);
        }
        const PullbackSnapshot& snapshot = *prepared_snapshot.value;

        // Value zone retest
        if (!(snapshot.low <= snapshot.ema_short || snapshot.low <= snapshot.ema_long)) {
            return SetupOutcome::no_signal("Low did not reach EMA8 or EMA20");
        }

        const Zone* touched_support = nullptr;
        for (const Zone& zone : request.zones) {
            if (zone.type != ZoneType::SUPPORT) {
                continue;
            }
            bool low_in_zone = zone.lower * (1.0 - pullback_config.support_low_tolerance_pct) <= snapshot.low &&
                               snapshot.low <= zone.upper * (1.0 + pullback_config.support_low_tolerance_pct);
            bool close_in_zone = zone.lower <= snapshot.close && snapshot.close <= zone.upper;
            if (low_in_zone || close_in_zone) {
                touched_support = &zone;
                break;
            }
        }
        if (touched_support == nullptr) {
            return SetupOutcome::no_signal("No support zone touched");
        }

        if (snapshot.close < snapshot.ema_long) {
            return SetupOutcome::no_signal("Close below EMA20");
        }
        if (!(snapshot.cci_yesterday < pullback_config.cci_oversold_level && snapshot.cci_today > snapshot.cci_yesterday)) {
            return SetupOutcome::no_signal("No CCI hook from oversold");
        }

        return build_pullback_setup(request, snapshot, make_metadata(snapshot, touched_support->level, false),
                                    std::min(snapshot.low, touched_support->lower), strategy_config.risk);
    } catch (const std::exception& exception_error) {
        return SetupOutcome::computation_error(exception_error.what());
    }
}

SetupOutcome scan_relaxed_pullback(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config) {
    const Config::PullbackConfig& pullback_config = strategy_config.pullback;

    try {
        EngineOutcome<PullbackSnapshot> prepared_snapshot = prepare_snapshot(request.bars, strategy_config);
        if (!prepared_snapshot.has_value()) {
            return SetupOutcome::rejected(prepared_snapshot.reason, prepared_snapshot.detail);
        }
        const PullbackSnapshot& snapshot = *prepared_snapshot.value;

        bool near_short_ema = snapshot.ema_short > 0.0 &&
                              std::abs(snapshot.close - snapshot.ema_short) / snapshot.ema_short <= pullback_config.relaxed_ema_proximity_pct;
        bool near_long_ema = snapshot.ema_long > 0.0 &&
                             std::abs(snapshot.close - snapshot.ema_long) / snapshot.ema_long <= pullback_config.relaxed_ema_proximity_pct;
        if (!(near_short_ema || near_long_ema)) {
            return SetupOutcome::no_signal("Close not near EMA8 or EMA20");
        }

        if (!(snapshot.cci_today > snapshot.cci_yesterday && snapshot.cci_yesterday < pullback_config.relaxed_cci_level)) {
            return SetupOutcome::no_signal("No early CCI turn");
        }

        double volume_average = last_value(sma(snapshot.volumes, strategy_config.indicators.volume_sma_period));
        if (!is_defined(volume_average) || volume_average <= 0.0) {
            return SetupOutcome::insufficient_data("Volume average undefined");
        }
        double recent_volume = tail_mean(snapshot.volumes, pullback_config.relaxed_volume_bars);
        if (!is_defined(recent_volume) || recent_volume > volume_average) {
            return SetupOutcome::no_signal("Retracement volume above average");
        }

        // Lowest support level, else the 50 SMA
        double support_level = snapshot.sma_long;
        bool found_support = false;
        for (const Zone& zone : request.zones) {
            if (zone.type == ZoneType::SUPPORT && (!found_support || zone.level < support_level)) {
                support_level = zone.level;
                found_support = true;
            }
        }
        if (support_level >= snapshot.close) {
            return SetupOutcome::no_signal("Support level not below close");
        }

        return build_pullback_setup(request, snapshot, make_metadata(snapshot, support_level, true),
                                    std::min(snapshot.low, support_level), strategy_config.risk);
    } catch (const std::exception& exception_error) {
        return SetupOutcome::computation_error(exception_error.what());
    }
}

} // namespace Core
} // namespace SwingScanner
