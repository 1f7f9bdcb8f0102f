#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "strategy_config.hpp"
#include "scanner_config.hpp"
#include "data_source_config.hpp"
#include "logging_config.hpp"

namespace SwingScanner {
namespace Config {

/**
 * Main scanner configuration.
 * Strategy config holds every engine threshold; scanner and data source configs drive the scan run.
 */
struct SystemConfig {
    // Default constructor - ensures nested structs are properly constructed
    SystemConfig() {}

    StrategyConfig strategy;           // Indicator periods and engine thresholds
    ScannerConfig scanner;             // Universe, benchmark and concurrency
    DataSourceConfig data_source;      // Market data provider selection and settings
    LoggingConfig logging;             // Logging configuration
};

} // namespace Config
} // namespace SwingScanner

#endif // SYSTEM_CONFIG_HPP
