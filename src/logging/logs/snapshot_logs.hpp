#ifndef SNAPSHOT_LOGS_HPP
#define SNAPSHOT_LOGS_HPP

#include "tracker/data_structures/data_structures.hpp"
#include <string>

using FtseTracker::Core::Snapshot;
using FtseTracker::Core::RefreshOutcome;

namespace FtseTracker {
namespace Logging {

class SnapshotLogs {
public:
    // Refresh results
    static void log_snapshot_updated(const Snapshot& snapshot, double raw_price);
    static void log_refresh_failure(const std::string& error_message);
    static void log_fallback_applied(RefreshOutcome outcome, const std::string& error_message);
    static void log_request_refresh(bool forced);

    // Extraction and quantization
    static void log_unrecognized_direction(const std::string& field_name, const std::string& raw_text, const std::string& first_class);
    static void log_quantizer_non_finite_input(double raw_price);

    // Fire-and-forget refreshes
    static void log_refresh_submission_dropped(size_t pending_count, size_t queue_capacity, bool pool_running);
    static void log_refresh_pool_unavailable();
    static void log_refresh_worker_exception(const std::string& error_message);

    // Startup
    static void log_initial_snapshot(const Snapshot& snapshot, RefreshOutcome outcome);

    static std::string format_price(double value, int precision);
    static std::string format_signed(double value, int precision);
};

} // namespace Logging
} // namespace FtseTracker

#endif // SNAPSHOT_LOGS_HPP
