#include "system_manager.hpp"
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "configs/system_config.hpp"
#include "api/general/market_data_provider_factory.hpp"
#include "threads/logging_thread.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logs/scan_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "scanner/config_loader/config_loader.hpp"
#include "scanner/config_loader/universe_loader.hpp"
#include "scanner/output/scan_result_writer.hpp"
#include "scanner/pipeline/scan_pipeline.hpp"

using namespace SwingScanner::Logging;
using namespace SwingScanner::Threads;

namespace SwingScanner {
namespace System {

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    try {
        // Initialize minimal logging context early - required before any logging calls
        auto early_logging_context = std::make_shared<SwingScanner::Logging::LoggingContext>();
        SwingScanner::Logging::set_logging_context(*early_logging_context);

        SystemLogs::log_startup_banner(SCANNER_VERSION, config_directory);

        // Load system configuration (may call log_message during loading)
        SwingScanner::Config::SystemConfig initial_config;
        int config_load_result = load_system_config(initial_config, config_directory);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config, config_directory);
        initialization_result.system_state->logging_context = early_logging_context;

        // Run folder, async logger and final configuration check
        initialization_result.logger = SwingScanner::Logging::initialize_run_logging(initialization_result.system_state->config);

        auto setup_logger_instance = SwingScanner::Logging::initialize_csv_setup_logger(initialization_result.system_state->config.logging.setups_csv_file);
        if (!setup_logger_instance) {
            SystemLogs::log_fatal_error("CSV setup logger initialization returned null pointer");
            throw std::runtime_error("System initialization failed: CSV setup logger initialization failed");
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        throw;
    }

    return initialization_result;
}

void startup(SystemState& system_state, std::shared_ptr<SwingScanner::Logging::AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    logger->start();
    system_state.logging_thread = std::thread(LoggingThread(logger, *system_state.logging_context, system_state.config.logging));

    try {
        system_state.market_data_provider = SwingScanner::API::create_market_data_provider(system_state.config.data_source);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_system_startup_error(exception_error.what());
        throw;
    }

    SystemLogs::log_startup_complete(system_state.logging_context->run_folder,
                                     system_state.market_data_provider->get_provider_name());
}

SwingScanner::Core::ScanReport run(SystemState& system_state) {
    if (!system_state.market_data_provider) {
        throw std::runtime_error("Market data provider not initialized - call startup first");
    }

    std::vector<SwingScanner::Core::UniverseEntry> universe = SwingScanner::Core::load_universe(system_state.config.scanner.universe_file);

    SwingScanner::Core::ScanPipeline scan_pipeline(system_state.config, *system_state.market_data_provider, *system_state.logging_context);
    SwingScanner::Core::ScanReport scan_report = scan_pipeline.run_scan(universe, system_state.scan_state);

    std::string output_directory = system_state.config.scanner.output_directory.empty()
                                       ? system_state.logging_context->run_folder
                                       : system_state.config.scanner.output_directory;
    std::filesystem::create_directories(output_directory);
    std::string output_path = (std::filesystem::path(output_directory) / ("scan_" + scan_report.scan_id + ".json")).string();
    SwingScanner::Core::ScanResultWriter::write_json(scan_report, output_path);
    ScanLogs::log_results_written(output_path);

    return scan_report;
}

void shutdown(SystemState& system_state, std::shared_ptr<SwingScanner::Logging::AsyncLogger> logger) {
    try {
        SystemLogs::log_shutdown_complete();

        if (logger) {
            logger->stop();
        }
        if (system_state.logging_thread.joinable()) {
            system_state.logging_thread.join();
        }
    } catch (const std::exception& shutdown_exception_error) {
        SystemLogs::log_system_shutdown_error(std::string("Exception in shutdown: ") + shutdown_exception_error.what());
    }
}

} // namespace System
} // namespace SwingScanner
