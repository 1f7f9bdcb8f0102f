#include "scan_state.hpp"

namespace SwingScanner {
namespace Core {

bool ScanState::try_begin(int ticker_total, const std::string& started_timestamp) {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    if (in_progress) {
        return false;
    }
    in_progress = true;
    progress = 0;
    total = ticker_total;
    started_at = started_timestamp;
    last_error.clear();
    return true;
}

void ScanState::set_total(int ticker_total) {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    total = ticker_total;
}

void ScanState::record_ticker_completed() {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    progress++;
}

void ScanState::finish(const std::string& completed_timestamp, const std::string& error_message) {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    in_progress = false;
    last_completed = completed_timestamp;
    last_error = error_message;
}

ScanStateSnapshot ScanState::snapshot() const {
    std::lock_guard<std::mutex> state_lock(state_mutex);
    ScanStateSnapshot state_snapshot;
    state_snapshot.in_progress = in_progress;
    state_snapshot.progress = progress;
    state_snapshot.total = total;
    state_snapshot.started_at = started_at;
    state_snapshot.last_completed = last_completed;
    state_snapshot.last_error = last_error;
    state_snapshot.cancel_requested = cancel_requested.load();
    return state_snapshot;
}

} // namespace Core
} // namespace SwingScanner
