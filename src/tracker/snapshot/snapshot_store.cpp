#include "snapshot_store.hpp"
#include <utility>

namespace FtseTracker {
namespace Core {

StoreReading SnapshotStore::read() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    StoreReading reading;
    reading.snapshot = current_snapshot;
    reading.last_write_time = last_write_time;
    return reading;
}

std::optional<Snapshot> SnapshotStore::read_snapshot() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return current_snapshot;
}

bool SnapshotStore::has_snapshot() const {
    std::lock_guard<std::mutex> lock(store_mutex);
    return current_snapshot.has_value();
}

void SnapshotStore::write(Snapshot snapshot, std::chrono::system_clock::time_point now) {
    std::lock_guard<std::mutex> lock(store_mutex);
    write_locked(std::move(snapshot), now);
}

bool SnapshotStore::annotate_if_within(std::chrono::seconds validity_window,
                                       std::chrono::system_clock::time_point now,
                                       const std::string& error_message) {
    std::lock_guard<std::mutex> lock(store_mutex);
    return annotate_locked(validity_window, now, error_message);
}

RefreshOutcome SnapshotStore::annotate_or_replace(std::chrono::seconds validity_window,
                                                  std::chrono::system_clock::time_point now,
                                                  Snapshot default_snapshot) {
    std::lock_guard<std::mutex> lock(store_mutex);
    if (annotate_locked(validity_window, now, default_snapshot.error.value_or(std::string()))) {
        return RefreshOutcome::REUSED_LAST_SNAPSHOT;
    }
    write_locked(std::move(default_snapshot), now);
    return RefreshOutcome::DEFAULT_FALLBACK;
}

bool SnapshotStore::annotate_locked(std::chrono::seconds validity_window,
                                    std::chrono::system_clock::time_point now,
                                    const std::string& error_message) {
    if (!current_snapshot) {
        return false;
    }
    if (now - current_snapshot->captured_at >= validity_window) {
        return false;
    }
    current_snapshot->error = error_message;
    advance_write_time(now);
    return true;
}

void SnapshotStore::write_locked(Snapshot snapshot, std::chrono::system_clock::time_point now) {
    // Racing refreshes may finish out of order
    if (current_snapshot && snapshot.captured_at < current_snapshot->captured_at) {
        snapshot.captured_at = current_snapshot->captured_at;
    }
    current_snapshot = std::move(snapshot);
    advance_write_time(now);
}

void SnapshotStore::advance_write_time(std::chrono::system_clock::time_point now) {
    if (now > last_write_time) {
        last_write_time = now;
    }
}

} // namespace Core
} // namespace FtseTracker
