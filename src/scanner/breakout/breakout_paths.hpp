#ifndef BREAKOUT_PATHS_HPP
#define BREAKOUT_PATHS_HPP

#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "configs/strategy_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

// Everything the five breakout paths read, computed once per ticker.
struct BreakoutInputs {
    std::string ticker;
    std::string setup_date;
    double close;
    double previous_close;             // Close of the bar before the signal bar
    double high;
    double low;
    double volume;
    double ema_short;
    double ema_long;
    double sma_long;
    double atr;
    double volume_average;             // 50-day volume SMA
    double volume_ratio;
    double stock_return;               // 63-day return, undefined on short history
    double benchmark_return;
    double rs_vs_benchmark;            // stock_return - benchmark_return
    IndicatorSeries closes;
    IndicatorSeries highs;
    IndicatorSeries lows;
    IndicatorSeries volumes;
    std::vector<Zone> zones;
    RSStats rs_stats;
    std::optional<TrendlineFit> trendline;

    BreakoutInputs()
        : ticker(""), setup_date(""), close(0.0), previous_close(UNDEFINED_VALUE), high(0.0), low(0.0), volume(0.0),
          ema_short(0.0), ema_long(0.0), sma_long(0.0), atr(0.0), volume_average(0.0), volume_ratio(0.0), stock_return(UNDEFINED_VALUE),
          benchmark_return(0.0), rs_vs_benchmark(UNDEFINED_VALUE) {}
};

// A path predicate hit: where the stop goes and what the setup records
struct BreakoutPathMatch {
    double stop_base_price;
    BreakoutMetadata metadata;

    BreakoutPathMatch() : stop_base_price(0.0), metadata() {}
};

using BreakoutPredicate = std::function<std::optional<BreakoutPathMatch>(const BreakoutInputs&, const Config::BreakoutConfig&)>;
using BreakoutBuilder = std::function<SetupOutcome(const BreakoutInputs&, const BreakoutPathMatch&, const Config::StrategyConfig&)>;

struct BreakoutPathRule {
    BreakoutPath path;
    BreakoutPredicate predicate;
    BreakoutBuilder builder;

    BreakoutPathRule(BreakoutPath rule_path, BreakoutPredicate rule_predicate, BreakoutBuilder rule_builder)
        : path(rule_path), predicate(std::move(rule_predicate)), builder(std::move(rule_builder)) {}
};

/**
 * Trend filter, indicator warm-up and volume average checks shared by every path.
 * Fails with INSUFFICIENT_DATA on short or undefined history and NO_SIGNAL when the trend filter fails.
 */
EngineOutcome<BreakoutInputs> prepare_breakout_inputs(const PatternScanRequest& request, const Config::StrategyConfig& strategy_config);

// Path predicates, usable in isolation
std::optional<BreakoutPathMatch> match_confirmed_breakout(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config);
std::optional<BreakoutPathMatch> match_trendline_breakout(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config);
std::optional<BreakoutPathMatch> match_level_breakout(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config);
std::optional<BreakoutPathMatch> match_rs_lead(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config);
std::optional<BreakoutPathMatch> match_dry_base(const BreakoutInputs& inputs, const Config::BreakoutConfig& breakout_config);

// Risk math shared by every path: entry above today's high, stop under min(low, stop base)
SetupOutcome build_breakout_setup(const BreakoutInputs& inputs, const BreakoutPathMatch& match, const Config::StrategyConfig& strategy_config);

// Rules in priority order
const std::vector<BreakoutPathRule>& get_breakout_path_rules();

} // namespace Core
} // namespace SwingScanner

#endif // BREAKOUT_PATHS_HPP
