#ifndef SNAPSHOT_COORDINATOR_HPP
#define SNAPSHOT_COORDINATOR_HPP

#include "configs/system_config.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include "tracker/market_data/derived_value_calculator.hpp"
#include "tracker/market_data/field_extractor.hpp"
#include "tracker/market_data/market_clock.hpp"
#include "tracker/market_data/page_source.hpp"
#include "tracker/snapshot/snapshot_store.hpp"
#include "utils/time_provider.hpp"
#include <chrono>
#include <string>

namespace FtseTracker {
namespace Threads {
class RefreshTaskPool;
}

namespace Core {

using Config::SystemConfig;

/**
 * SnapshotCoordinator - the refresh, fallback and read policy.
 *
 * refresh() is the single path every caller (startup, background updater,
 * pool workers, the endpoint) goes through. Network I/O and parsing happen
 * outside the store lock; every failure is caught here and turned into a
 * fallback, so refresh() itself does not throw for upstream problems.
 */
class SnapshotCoordinator {
public:
    SnapshotCoordinator(const SystemConfig& config, SnapshotStore& store,
                        PageSource& page_source, const TimeProvider& time_provider);

    void set_refresh_task_pool(Threads::RefreshTaskPool* pool) { refresh_task_pool = pool; }

    RefreshOutcome refresh();
    RefreshOutcome handle_failure(const std::string& error_message);

    // Current snapshot. A stale one is returned as is after queuing a
    // refresh; with no snapshot at all the caller blocks on a refresh.
    Snapshot get_current();

    // Endpoint read: also refreshes in the caller when forced or when the
    // snapshot's own capture time is past the threshold.
    Snapshot get_current_for_request(bool force_refresh);

    bool request_async_refresh();

    std::chrono::seconds get_staleness_threshold(bool market_open) const;
    bool is_market_open() const;
    bool is_stale(const StoreReading& reading, std::chrono::system_clock::time_point now) const;

    Snapshot build_live_snapshot(const RawQuoteFields& fields, std::chrono::system_clock::time_point now) const;
    Snapshot build_default_snapshot(std::chrono::system_clock::time_point now, const std::string& error_message) const;

    const MarketClock& get_market_clock() const { return market_clock; }
    const TimeProvider& get_time_provider() const { return time_provider; }

private:
    const SystemConfig& config;
    SnapshotStore& store;
    PageSource& page_source;
    const TimeProvider& time_provider;
    MarketClock market_clock;
    FieldExtractor field_extractor;
    DerivedValueCalculator derived_value_calculator;
    Threads::RefreshTaskPool* refresh_task_pool = nullptr;

    Snapshot build_snapshot(double raw_price, double change, double change_percent,
                            std::chrono::system_clock::time_point now) const;
};

} // namespace Core
} // namespace FtseTracker

#endif // SNAPSHOT_COORDINATOR_HPP
