#ifndef SCAN_WORKER_POOL_HPP
#define SCAN_WORKER_POOL_HPP

#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>
#include "logging/logger/async_logger.hpp"

namespace SwingScanner {
namespace Threads {

/**
 * Fixed-size pool of scan workers.
 * Every worker installs the shared logging context and tags itself SCANnn.
 * Tasks run in submission order; an exception escaping a task is logged and the worker continues.
 */
class ScanWorkerPool {
public:
    ScanWorkerPool(int worker_count, Logging::LoggingContext& context);
    ~ScanWorkerPool();

    ScanWorkerPool(const ScanWorkerPool&) = delete;
    ScanWorkerPool& operator=(const ScanWorkerPool&) = delete;

    void submit(std::function<void()> scan_task);

    // Blocks until the queue is empty and no task is running
    void wait_for_all();

    // Runs the queued tasks to completion and joins every worker
    void shutdown();

    int get_worker_count() const { return static_cast<int>(worker_threads.size()); }

private:
    Logging::LoggingContext& logging_context;
    std::vector<std::thread> worker_threads;
    std::queue<std::function<void()>> pending_tasks;
    std::mutex queue_mutex;
    std::condition_variable task_available;
    std::condition_variable all_tasks_done;
    int active_task_count;
    bool stopping;

    void run_worker(int worker_index);
};

} // namespace Threads
} // namespace SwingScanner

#endif // SCAN_WORKER_POOL_HPP
