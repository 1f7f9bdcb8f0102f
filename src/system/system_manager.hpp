#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "system/system_state.hpp"
#include "logging/logger/async_logger.hpp"
#include "scanner/data_structures/data_structures.hpp"

namespace SwingScanner {
namespace System {

constexpr const char* SCANNER_VERSION = "1.0.0";

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<SwingScanner::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// Configuration, run folder, async logger and setup CSV log
SystemInitializationResult initialize(const std::string& config_directory);

// Logging thread and market data provider
void startup(SystemState& system_state, std::shared_ptr<SwingScanner::Logging::AsyncLogger> logger);

// One scan over the configured universe; the JSON report is written before returning
SwingScanner::Core::ScanReport run(SystemState& system_state);

void shutdown(SystemState& system_state, std::shared_ptr<SwingScanner::Logging::AsyncLogger> logger);

} // namespace System
} // namespace SwingScanner

#endif // SYSTEM_MANAGER_HPP
