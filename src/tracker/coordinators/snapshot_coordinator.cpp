#include "snapshot_coordinator.hpp"
#include "tracker/data_structures/tracker_errors.hpp"
#include "tracker/market_data/html_document.hpp"
#include "tracker/market_data/price_quantizer.hpp"
#include "threads/refresh_task_pool.hpp"
#include "logging/logs/snapshot_logs.hpp"
#include <stdexcept>
#include <utility>

using FtseTracker::Logging::SnapshotLogs;

namespace FtseTracker {
namespace Core {

namespace {

const char* const NETWORK_ERROR_PREFIX = "Network error: ";
const char* const DATA_FORMAT_ERROR_PREFIX = "Data format error: ";
const char* const SYSTEM_ERROR_PREFIX = "System error: ";

} // anonymous namespace

SnapshotCoordinator::SnapshotCoordinator(const SystemConfig& system_config, SnapshotStore& snapshot_store,
                                         PageSource& page_source_ref, const TimeProvider& time_provider_ref)
    : config(system_config), store(snapshot_store), page_source(page_source_ref),
      time_provider(time_provider_ref), market_clock(system_config.market.session),
      field_extractor(system_config.source.markup), derived_value_calculator(system_config.market.derived) {}

RefreshOutcome SnapshotCoordinator::refresh() {
    try {
        std::string page_text = page_source.fetch_page();
        HtmlDocument document = HtmlDocument::parse(page_text);
        RawQuoteFields fields = field_extractor.extract(document);

        auto now = time_provider.now();
        Snapshot snapshot = build_live_snapshot(fields, now);
        store.write(snapshot, now);
        SnapshotLogs::log_snapshot_updated(snapshot, fields.price);
        return RefreshOutcome::SUCCESS;
    } catch (const NetworkError& network_error) {
        return handle_failure(std::string(NETWORK_ERROR_PREFIX) + network_error.what());
    } catch (const PageParseError& parse_error) {
        return handle_failure(parse_error.what());
    } catch (const FieldValueError& value_error) {
        return handle_failure(std::string(DATA_FORMAT_ERROR_PREFIX) + value_error.what());
    } catch (const std::exception& unexpected_error) {
        return handle_failure(std::string(SYSTEM_ERROR_PREFIX) + unexpected_error.what());
    }
}

RefreshOutcome SnapshotCoordinator::handle_failure(const std::string& error_message) {
    auto now = time_provider.now();
    SnapshotLogs::log_refresh_failure(error_message);

    Snapshot default_snapshot = build_default_snapshot(now, error_message);
    RefreshOutcome outcome = store.annotate_or_replace(
        std::chrono::seconds(config.market.fallback.validity_window_seconds), now, std::move(default_snapshot));

    SnapshotLogs::log_fallback_applied(outcome, error_message);
    return outcome;
}

Snapshot SnapshotCoordinator::get_current() {
    StoreReading reading = store.read();
    if (!reading.snapshot) {
        refresh();
        std::optional<Snapshot> refreshed_snapshot = store.read_snapshot();
        if (!refreshed_snapshot) {
            throw std::runtime_error("No snapshot available after refresh");
        }
        return *refreshed_snapshot;
    }

    if (is_stale(reading, time_provider.now())) {
        request_async_refresh();
    }
    return *reading.snapshot;
}

Snapshot SnapshotCoordinator::get_current_for_request(bool force_refresh) {
    Snapshot snapshot = get_current();

    auto now = time_provider.now();
    bool capture_expired = now - snapshot.captured_at > get_staleness_threshold(market_clock.is_market_open(now));
    if (!force_refresh && !capture_expired) {
        return snapshot;
    }

    SnapshotLogs::log_request_refresh(force_refresh);
    refresh();
    std::optional<Snapshot> refreshed_snapshot = store.read_snapshot();
    if (!refreshed_snapshot) {
        throw std::runtime_error("No snapshot available after refresh");
    }
    return *refreshed_snapshot;
}

bool SnapshotCoordinator::request_async_refresh() {
    if (!refresh_task_pool) {
        SnapshotLogs::log_refresh_pool_unavailable();
        return false;
    }
    return refresh_task_pool->submit([this]() { refresh(); });
}

std::chrono::seconds SnapshotCoordinator::get_staleness_threshold(bool market_open) const {
    return std::chrono::seconds(market_open ? config.timing.market_open_staleness_threshold_sec
                                            : config.timing.market_closed_staleness_threshold_sec);
}

bool SnapshotCoordinator::is_market_open() const {
    return market_clock.is_market_open(time_provider.now());
}

bool SnapshotCoordinator::is_stale(const StoreReading& reading, std::chrono::system_clock::time_point now) const {
    if (!reading.snapshot) {
        return true;
    }
    return now - reading.last_write_time > get_staleness_threshold(market_clock.is_market_open(now));
}

Snapshot SnapshotCoordinator::build_live_snapshot(const RawQuoteFields& fields, std::chrono::system_clock::time_point now) const {
    Snapshot snapshot = build_snapshot(fields.price, fields.change, fields.change_percent, now);
    snapshot.source = SnapshotSource::LIVE_FETCH;
    snapshot.source_label = config.source.live_label;
    return snapshot;
}

Snapshot SnapshotCoordinator::build_default_snapshot(std::chrono::system_clock::time_point now, const std::string& error_message) const {
    const FallbackConfig& fallback = config.market.fallback;
    Snapshot snapshot = build_snapshot(fallback.price, fallback.change, fallback.change_percent, now);
    snapshot.source = SnapshotSource::DEFAULT_FALLBACK;
    snapshot.source_label = fallback.label;
    snapshot.error = error_message;
    return snapshot;
}

Snapshot SnapshotCoordinator::build_snapshot(double raw_price, double change, double change_percent,
                                             std::chrono::system_clock::time_point now) const {
    Snapshot snapshot;
    snapshot.code = config.source.index_code;
    snapshot.name = config.source.index_name;
    snapshot.price = round_to_quarter(raw_price);
    snapshot.change = change;
    snapshot.change_percent = change_percent;

    // Derived from the published (quantized) price, no further adjustment
    DerivedValues derived_values = derived_value_calculator.calculate(snapshot.price);
    snapshot.derived_price = derived_values.derived_price;
    snapshot.derived_offset = derived_values.derived_offset;

    snapshot.captured_at = now;
    snapshot.captured_at_local = market_clock.format_local_time(now);
    snapshot.market_open = market_clock.is_market_open(now);
    return snapshot;
}

} // namespace Core
} // namespace FtseTracker
