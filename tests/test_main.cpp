#include <gtest/gtest.h>
#include "logging/logger/async_logger.hpp"

int main(int argc, char** argv) {
    // Engines and loaders log through the thread's context; without an async logger lines go to the console
    static SwingScanner::Logging::LoggingContext test_logging_context;
    SwingScanner::Logging::set_logging_context(test_logging_context);
    SwingScanner::Logging::set_log_thread_tag("TEST");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
