#include "scan_worker_pool.hpp"
#include "logging/logs/system_logs.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace SwingScanner {
namespace Threads {

ScanWorkerPool::ScanWorkerPool(int worker_count, Logging::LoggingContext& context)
    : logging_context(context), active_task_count(0), stopping(false) {
    if (worker_count < 1) {
        throw std::runtime_error("Scan worker pool needs at least one worker");
    }
    worker_threads.reserve(worker_count);
    for (int worker_index = 0; worker_index < worker_count; ++worker_index) {
        worker_threads.emplace_back(&ScanWorkerPool::run_worker, this, worker_index);
    }
}

ScanWorkerPool::~ScanWorkerPool() {
    shutdown();
}

void ScanWorkerPool::submit(std::function<void()> scan_task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping) {
            throw std::runtime_error("Scan worker pool is shut down");
        }
        pending_tasks.push(std::move(scan_task));
    }
    task_available.notify_one();
}

void ScanWorkerPool::wait_for_all() {
    std::unique_lock<std::mutex> lock(queue_mutex);
    all_tasks_done.wait(lock, [this] { return pending_tasks.empty() && active_task_count == 0; });
}

void ScanWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (stopping && worker_threads.empty()) {
            return;
        }
        stopping = true;
    }
    task_available.notify_all();
    for (std::thread& worker_thread : worker_threads) {
        if (worker_thread.joinable()) {
            worker_thread.join();
        }
    }
    worker_threads.clear();
}

void ScanWorkerPool::run_worker(int worker_index) {
    Logging::set_logging_context(logging_context);
    std::ostringstream tag_stream;
    tag_stream << "SCAN" << std::setw(2) << std::setfill('0') << (worker_index + 1);
    Logging::set_log_thread_tag(tag_stream.str());

    while (true) {
        std::function<void()> scan_task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            task_available.wait(lock, [this] { return stopping || !pending_tasks.empty(); });
            if (pending_tasks.empty()) {
                return;
            }
            scan_task = std::move(pending_tasks.front());
            pending_tasks.pop();
            active_task_count++;
        }

        try {
            scan_task();
        } catch (const std::exception& task_exception) {
            Logging::SystemLogs::log_worker_task_exception(task_exception.what());
        }

        {
            std::lock_guard<std::mutex> lock(queue_mutex);
            active_task_count--;
            if (pending_tasks.empty() && active_task_count == 0) {
                all_tasks_done.notify_all();
            }
        }
    }
}

} // namespace Threads
} // namespace SwingScanner
