#ifndef LOGGING_THREAD_HPP
#define LOGGING_THREAD_HPP

#include <memory>
#include "configs/logging_config.hpp"
#include "logging/logger/async_logger.hpp"

namespace SwingScanner {
namespace Threads {

// Owns the run log file; writes queued lines until the logger stops, then flushes the rest
class LoggingThread {
public:
    LoggingThread(std::shared_ptr<Logging::AsyncLogger> logger,
                  Logging::LoggingContext& context,
                  const Config::LoggingConfig& logging_config)
        : scan_logger(std::move(logger)), logging_context(context), poll_interval_ms(logging_config.logging_poll_interval_ms) {}

    void operator()();

private:
    std::shared_ptr<Logging::AsyncLogger> scan_logger;
    Logging::LoggingContext& logging_context;
    int poll_interval_ms;
};

} // namespace Threads
} // namespace SwingScanner

#endif // LOGGING_THREAD_HPP
