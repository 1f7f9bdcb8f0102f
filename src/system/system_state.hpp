#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <memory>
#include <string>
#include <thread>
#include "configs/system_config.hpp"
#include "api/general/market_data_provider_interface.hpp"
#include "logging/logger/async_logger.hpp"
#include "scanner/pipeline/scan_state.hpp"

namespace SwingScanner {
namespace System {

/**
 * @brief Central system state container
 *
 * Owns the configuration, the logging context, the market data provider and the scan progress.
 */
struct SystemState {
    // =========================================================================
    // CONFIGURATION
    // =========================================================================
    SwingScanner::Config::SystemConfig config;       // Complete scanner configuration
    std::string config_directory;                    // Directory the configuration was read from

    // =========================================================================
    // MODULES
    // =========================================================================
    SwingScanner::API::MarketDataProviderPtr market_data_provider;
    std::shared_ptr<SwingScanner::Logging::LoggingContext> logging_context;

    // =========================================================================
    // SCAN PROGRESS AND THREADS
    // =========================================================================
    SwingScanner::Core::ScanState scan_state;        // Shared with the signal handler for cancellation
    std::thread logging_thread;

    explicit SystemState(const SwingScanner::Config::SystemConfig& initial, const std::string& directory)
        : config(initial), config_directory(directory) {}

    SystemState(const SystemState&) = delete;
    SystemState& operator=(const SystemState&) = delete;
};

} // namespace System
} // namespace SwingScanner

#endif // SYSTEM_STATE_HPP
