#ifndef SCAN_PIPELINE_HPP
#define SCAN_PIPELINE_HPP

#include <vector>
#include "api/general/market_data_provider_interface.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "scan_state.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace Core {

/**
 * One full scan: regime gate on the benchmark, then every universe ticker on a bounded worker pool.
 * A bearish or errored regime ends the scan with zero setups before any ticker is fetched.
 * Failures are isolated per ticker; results keep universe order.
 */
class ScanPipeline {
public:
    ScanPipeline(const Config::SystemConfig& system_config,
                 const API::MarketDataProviderInterface& market_data_provider,
                 Logging::LoggingContext& context)
        : config(system_config), provider(market_data_provider), logging_context(context) {}

    // Throws std::runtime_error when a scan is already in progress on scan_state
    ScanReport run_scan(const std::vector<UniverseEntry>& universe, ScanState& scan_state);

    // Per-type counts, descending sector counts and hot sectors from the aggregated setups
    static void summarize_setups(ScanReport& report, int sector_highlight_threshold);

private:
    const Config::SystemConfig& config;
    const API::MarketDataProviderInterface& provider;
    Logging::LoggingContext& logging_context;

    ScanContext build_scan_context(const std::string& scan_id) const;
    TickerScanResult scan_ticker(const UniverseEntry& universe_entry, const ScanContext& scan_context) const;
    void log_ticker_result(const std::string& scan_id, const TickerScanResult& ticker_result) const;
};

} // namespace Core
} // namespace SwingScanner

#endif // SCAN_PIPELINE_HPP
