#ifndef TICKER_ANALYZER_HPP
#define TICKER_ANALYZER_HPP

#include <vector>
#include "configs/system_config.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * Runs every engine on one ticker's bars against a prepared scan context.
 * Engine order: breakout (or trendline watchlist when no breakout), strict then relaxed pullback, base pattern.
 * Does not log; rejections are collected on the result for the caller.
 */
class TickerAnalyzer {
public:
    explicit TickerAnalyzer(const Config::SystemConfig& system_config) : config(system_config) {}

    TickerScanResult analyze(const UniverseEntry& universe_entry, const std::vector<PriceBar>& bars,
                             const ScanContext& scan_context) const;

private:
    const Config::SystemConfig& config;

    void record_outcome(TickerScanResult& ticker_result, const std::string& engine_name, const SetupOutcome& outcome) const;
};

} // namespace Core
} // namespace SwingScanner

#endif // TICKER_ANALYZER_HPP
