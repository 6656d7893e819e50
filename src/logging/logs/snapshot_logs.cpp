#include "snapshot_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

using namespace FtseTracker::Logging;

std::string SnapshotLogs::format_price(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

std::string SnapshotLogs::format_signed(double value, int precision) {
    std::ostringstream value_stream;
    value_stream << std::showpos << std::fixed << std::setprecision(precision) << value;
    return value_stream.str();
}

void SnapshotLogs::log_snapshot_updated(const Snapshot& snapshot, double raw_price) {
    LOG_THREAD_SNAPSHOT_HEADER();
    TABLE_HEADER_48("Snapshot", snapshot.code + " " + snapshot.name);
    TABLE_ROW_48("Price", format_price(snapshot.price, 2) + " (raw " + format_price(raw_price, 2) + ")");
    TABLE_ROW_48("Change", format_signed(snapshot.change, 2) + " (" + format_signed(snapshot.change_percent, 2) + "%)");
    TABLE_ROW_48("Derived", format_price(snapshot.derived_price, 0) + " (offset " + format_signed(snapshot.derived_offset, 0) + ")");
    TABLE_SEPARATOR_48();
    TABLE_ROW_48("Local Time", snapshot.captured_at_local);
    TABLE_ROW_48("Market", snapshot.market_open ? "OPEN" : "CLOSED");
    TABLE_ROW_48("Source", std::string(to_string(snapshot.source)));
    TABLE_FOOTER_48();
}

void SnapshotLogs::log_refresh_failure(const std::string& error_message) {
    log_message("Refresh failed: " + error_message, "");
}

void SnapshotLogs::log_fallback_applied(RefreshOutcome outcome, const std::string& error_message) {
    LOG_THREAD_FALLBACK_HEADER();
    if (outcome == RefreshOutcome::REUSED_LAST_SNAPSHOT) {
        LOG_THREAD_CONTENT("Keeping last snapshot (within validity window)");
    } else {
        LOG_THREAD_CONTENT("Default snapshot installed");
    }
    LOG_THREAD_CONTENT("Error: " + error_message);
    LOG_THREAD_SECTION_FOOTER();
}

void SnapshotLogs::log_request_refresh(bool forced) {
    if (forced) {
        log_message("Refresh requested by caller, fetching in request", "");
    } else {
        log_message("Snapshot capture time past threshold, fetching in request", "");
    }
}

void SnapshotLogs::log_unrecognized_direction(const std::string& field_name, const std::string& raw_text, const std::string& first_class) {
    log_message("WARNING: Unrecognized direction indicator for " + field_name +
                " (text '" + raw_text + "', class '" + first_class + "'), no sign correction applied", "");
}

void SnapshotLogs::log_quantizer_non_finite_input(double raw_price) {
    std::ostringstream value_stream;
    value_stream << raw_price;
    log_message("WARNING: Quarter rounding skipped for non-finite price: " + value_stream.str(), "");
}

void SnapshotLogs::log_refresh_submission_dropped(size_t pending_count, size_t queue_capacity, bool pool_running) {
    if (!pool_running) {
        log_message("Refresh request dropped: refresh pool stopped", "");
        return;
    }
    log_message("Refresh request dropped: queue full (" + std::to_string(pending_count) + "/" +
                std::to_string(queue_capacity) + ")", "");
}

void SnapshotLogs::log_refresh_pool_unavailable() {
    log_message("WARNING: Snapshot stale but no refresh pool attached", "");
}

void SnapshotLogs::log_refresh_worker_exception(const std::string& error_message) {
    log_message("ERROR: Refresh worker task exception: " + error_message, "");
}

void SnapshotLogs::log_initial_snapshot(const Snapshot& snapshot, RefreshOutcome outcome) {
    LOG_STARTUP_SECTION_HEADER("INITIAL SNAPSHOT");
    LOG_STARTUP_CONTENT("Outcome: " + std::string(to_string(outcome)));
    LOG_STARTUP_CONTENT("Price: " + format_price(snapshot.price, 2) + "  Source: " + snapshot.source_label);
    if (snapshot.error) {
        LOG_STARTUP_CONTENT("Error: " + *snapshot.error);
    }
    LOG_STARTUP_SEPARATOR();
}
