#include "ticker_analyzer.hpp"
#include "scanner/base_pattern/base_pattern_engine.hpp"
#include "scanner/breakout/breakout_engine.hpp"
#include "scanner/breakout/trendline_fitter.hpp"
#include "scanner/breakout/watchlist_detector.hpp"
#include "scanner/indicators/indicators.hpp"
#include "scanner/pullback/pullback_engine.hpp"
#include "scanner/relative_strength/rs_engine.hpp"
#include "scanner/zones/zone_extractor.hpp"
#include <future>

namespace SwingScanner {
namespace Core {

void TickerAnalyzer::record_outcome(TickerScanResult& ticker_result, const std::string& engine_name, const SetupOutcome& outcome) const {
    if (outcome.has_value()) {
        ticker_result.setups.push_back(*outcome.value);
        return;
    }
    ticker_result.rejections.emplace_back(engine_name, outcome.reason, outcome.detail);
}

TickerScanResult TickerAnalyzer::analyze(const UniverseEntry& universe_entry, const std::vector<PriceBar>& bars,
                                         const ScanContext& scan_context) const {
    const Config::StrategyConfig& strategy_config = config.strategy;

    TickerScanResult ticker_result;
    ticker_result.ticker = universe_entry.symbol;
    ticker_result.sector = universe_entry.sector.empty() ? config.scanner.default_sector : universe_entry.sector;

    if (static_cast<int>(bars.size()) < config.scanner.minimum_ticker_bars) {
        ticker_result.skip_reason = "Insufficient data: " + std::to_string(bars.size()) + " bars";
        return ticker_result;
    }
    if (count_defined(extract_closes(bars)) == 0) {
        ticker_result.skip_reason = "No valid adjusted close";
        return ticker_result;
    }

    // ── Zones and RS line are independent of each other ──────────────────
    std::future<ZoneOutcome> zone_future = std::async(std::launch::async, [&bars, &strategy_config]() {
        return calculate_sr_zones(bars, strategy_config);
    });
    std::optional<RSLine> rs_line = calculate_rs_line(bars, scan_context.benchmark_bars, strategy_config.relative_strength);
    ticker_result.rs_stats = get_rs_stats(rs_line, strategy_config.relative_strength);

    ZoneOutcome zone_outcome = zone_future.get();
    if (zone_outcome.has_value()) {
        ticker_result.zones = *zone_outcome.value;
    } else {
        ticker_result.rejections.emplace_back("zones", zone_outcome.reason, zone_outcome.detail);
    }
    ticker_result.analyzed = true;

    PatternScanRequest scan_request(ticker_result.ticker, bars, ticker_result.zones, ticker_result.rs_stats,
                                    scan_context.benchmark_3m_return);

    // ── Breakout, else near-breakout watchlist ───────────────────────────
    SetupOutcome breakout_outcome = scan_breakout(scan_request, strategy_config);
    record_outcome(ticker_result, "breakout", breakout_outcome);
    if (!breakout_outcome.has_value()) {
        std::optional<TrendlineFit> trendline = fit_descending_trendline(bars, strategy_config.breakout);
        record_outcome(ticker_result, "watchlist", scan_near_breakout(scan_request, trendline, strategy_config));
    }

    // ── Pullback: strict first, relaxed only as fallback ─────────────────
    SetupOutcome pullback_outcome = scan_pullback(scan_request, strategy_config);
    if (pullback_outcome.has_value()) {
        record_outcome(ticker_result, "pullback", pullback_outcome);
    } else {
        ticker_result.rejections.emplace_back("pullback", pullback_outcome.reason, pullback_outcome.detail);
        record_outcome(ticker_result, "relaxed_pullback", scan_relaxed_pullback(scan_request, strategy_config));
    }

    record_outcome(ticker_result, "base", scan_base_pattern(scan_request, strategy_config));

    for (Setup& setup : ticker_result.setups) {
        setup = setup.with_sector(ticker_result.sector);
    }
    return ticker_result;
}

} // namespace Core
} // namespace SwingScanner
