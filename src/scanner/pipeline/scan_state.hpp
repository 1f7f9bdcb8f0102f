#ifndef SCAN_STATE_HPP
#define SCAN_STATE_HPP

#include <atomic>
#include <mutex>
#include <string>

namespace SwingScanner {
namespace Core {

// Immutable copy of the scan progress for readers
struct ScanStateSnapshot {
    bool in_progress;
    int progress;
    int total;
    std::string started_at;
    std::string last_completed;
    std::string last_error;
    bool cancel_requested;

    ScanStateSnapshot()
        : in_progress(false), progress(0), total(0), started_at(""), last_completed(""), last_error(""),
          cancel_requested(false) {}
};

/**
 * Progress of the current scan, shared between the pipeline, its workers and progress readers.
 * request_cancel only stores an atomic flag and is safe to call from a signal handler.
 */
class ScanState {
public:
    ScanState() : in_progress(false), progress(0), total(0), cancel_requested(false) {}

    ScanState(const ScanState&) = delete;
    ScanState& operator=(const ScanState&) = delete;

    // False when a scan is already running
    bool try_begin(int ticker_total, const std::string& started_timestamp);
    void set_total(int ticker_total);
    void record_ticker_completed();
    void finish(const std::string& completed_timestamp, const std::string& error_message);

    void request_cancel() { cancel_requested.store(true); }
    bool is_cancel_requested() const { return cancel_requested.load(); }

    ScanStateSnapshot snapshot() const;

private:
    mutable std::mutex state_mutex;
    bool in_progress;
    int progress;
    int total;
    std::string started_at;
    std::string last_completed;
    std::string last_error;
    std::atomic<bool> cancel_requested;
};

} // namespace Core
} // namespace SwingScanner

#endif // SCAN_STATE_HPP
