#ifndef SNAPSHOT_STORE_HPP
#define SNAPSHOT_STORE_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>

namespace FtseTracker {
namespace Core {

/**
 * SnapshotStore - sole owner of the current snapshot.
 *
 * Callers only ever receive copies taken under the lock, so a reader sees
 * either the previous or the next snapshot, never a mix. The lock is held
 * for field copies only.
 *
 * Two clocks are kept apart: the snapshot's captured_at (validity window)
 * and last_write_time (scheduling of the next refresh). captured_at never
 * moves backwards.
 */
class SnapshotStore {
public:
    SnapshotStore() = default;
    SnapshotStore(const SnapshotStore&) = delete;
    SnapshotStore& operator=(const SnapshotStore&) = delete;

    StoreReading read() const;
    std::optional<Snapshot> read_snapshot() const;
    bool has_snapshot() const;

    // Replaces the current snapshot and advances the scheduling clock.
    void write(Snapshot snapshot, std::chrono::system_clock::time_point now);

    // Reuses the current snapshot when now - captured_at < validity_window:
    // stamps the error, keeps the numbers and captured_at, advances the
    // scheduling clock. Returns false (and changes nothing) otherwise.
    bool annotate_if_within(std::chrono::seconds validity_window,
                            std::chrono::system_clock::time_point now,
                            const std::string& error_message);

    // Fallback in a single critical section: annotate the current snapshot
    // when still within the window, otherwise install the default snapshot
    // (which carries the error). Returns the path taken.
    RefreshOutcome annotate_or_replace(std::chrono::seconds validity_window,
                                       std::chrono::system_clock::time_point now,
                                       Snapshot default_snapshot);

private:
    mutable std::mutex store_mutex;
    std::optional<Snapshot> current_snapshot;
    std::chrono::system_clock::time_point last_write_time;

    void advance_write_time(std::chrono::system_clock::time_point now);
    bool annotate_locked(std::chrono::seconds validity_window,
                         std::chrono::system_clock::time_point now,
                         const std::string& error_message);
    void write_locked(Snapshot snapshot, std::chrono::system_clock::time_point now);
};

} // namespace Core
} // namespace FtseTracker

#endif // SNAPSHOT_STORE_HPP
