#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <iostream>
#include <string>

namespace {

/**
 * Bridges SIGINT / SIGTERM to the scan's cancel flag.
 * The handler only performs atomic stores; workers stop picking up tickers once the flag is set.
 */
class ScanCancelHandler {
public:
    static ScanCancelHandler& instance() {
        static ScanCancelHandler cancel_handler;
        return cancel_handler;
    }

    void attach(SwingScanner::System::SystemState* state) { attached_state.store(state); }
    void detach() { attached_state.store(nullptr); }

    int get_received_signal() const { return received_signal.load(); }

    void handle_signal(int signal_number) {
        if (signal_number != SIGINT && signal_number != SIGTERM) {
            return;
        }
        received_signal.store(signal_number);
        SwingScanner::System::SystemState* state = attached_state.load();
        if (state) {
            state->scan_state.request_cancel();
        }
    }

private:
    ScanCancelHandler() : received_signal(0), attached_state(nullptr) {}
    ScanCancelHandler(const ScanCancelHandler&) = delete;
    ScanCancelHandler& operator=(const ScanCancelHandler&) = delete;

    std::atomic<int> received_signal;
    std::atomic<SwingScanner::System::SystemState*> attached_state;
};

void forward_signal(int signal_number) {
    ScanCancelHandler::instance().handle_signal(signal_number);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config_directory]\n"
              << "  Reads strategy_config.csv, scanner_config.csv and logging_config.csv from config_directory\n"
              << "  (default: config) and runs one scan over the configured universe." << std::endl;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc > 2 || (argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))) {
        print_usage(argv[0]);
        return argc > 2 ? 1 : 0;
    }
    const std::string config_directory = argc == 2 ? argv[1] : "config";

    try {
        std::signal(SIGINT, forward_signal);
        std::signal(SIGTERM, forward_signal);

        SwingScanner::System::SystemInitializationResult initialization_result = SwingScanner::System::initialize(config_directory);
        SwingScanner::System::SystemState& system_state = *initialization_result.system_state;
        ScanCancelHandler::instance().attach(&system_state);

        try {
            SwingScanner::System::startup(system_state, initialization_result.logger);
            SwingScanner::System::run(system_state);
        } catch (const std::exception&) {
            ScanCancelHandler::instance().detach();
            SwingScanner::System::shutdown(system_state, initialization_result.logger);
            throw;
        }

        ScanCancelHandler::instance().detach();
        if (ScanCancelHandler::instance().get_received_signal() != 0) {
            SwingScanner::Logging::SystemLogs::log_shutdown_requested(ScanCancelHandler::instance().get_received_signal());
        }
        SwingScanner::System::shutdown(system_state, initialization_result.logger);
        return 0;
    } catch (const std::exception& fatal_exception) {
        std::cerr << "Fatal error: " << fatal_exception.what() << std::endl;
        return 1;
    }
}
