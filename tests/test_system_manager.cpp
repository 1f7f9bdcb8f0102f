#include <gtest/gtest.h>
#include "system/system_manager.hpp"
#include "logging/logger/async_logger.hpp"
#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>

using SwingScanner::Config::SystemConfig;
using SwingScanner::System::SystemState;

TEST(SystemShutdownTest, NothingStarted) {
    SystemState system_state(SystemConfig(), "config");
    EXPECT_NO_THROW(SwingScanner::System::shutdown(system_state, nullptr));
    EXPECT_FALSE(system_state.logging_thread.joinable());
}

TEST(SystemShutdownTest, JoinFailureIsLoggedNotThrown) {
    SystemState system_state(SystemConfig(), "config");
    std::promise<void> thread_assigned;
    std::shared_future<void> assigned_future = thread_assigned.get_future().share();
    std::promise<void> shutdown_finished;
    std::future<void> finished_future = shutdown_finished.get_future();
    std::atomic<bool> shutdown_threw(false);

    // Shutting down from the logging thread itself makes its own join fail
    system_state.logging_thread = std::thread([&system_state, &shutdown_threw, &shutdown_finished, assigned_future]() {
        SwingScanner::Logging::LoggingContext thread_logging_context;
        SwingScanner::Logging::set_logging_context(thread_logging_context);
        assigned_future.wait();
        try {
            SwingScanner::System::shutdown(system_state, nullptr);
        } catch (const std::exception&) {
            shutdown_threw.store(true);
        }
        shutdown_finished.set_value();
    });
    thread_assigned.set_value();

    finished_future.wait();
    ASSERT_TRUE(system_state.logging_thread.joinable());
    system_state.logging_thread.join();
    EXPECT_FALSE(shutdown_threw.load());
}
