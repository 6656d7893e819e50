#include "startup_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"
#include "utils/time_utils.hpp"
#include <iomanip>
#include <sstream>

using FtseTracker::Logging::log_message;

void StartupLogs::log_application_header() {
    log_message("=== FTSE TAIWAN INDEX TRACKER ===", "");
}

void StartupLogs::log_source_configuration(const SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("SOURCE");
    LOG_STARTUP_CONTENT("Index: " + config.source.index_code + " " + config.source.index_name);
    LOG_STARTUP_CONTENT("URL: " + config.source.url);
    LOG_STARTUP_CONTENT("Timeout: " + std::to_string(config.source.timeout_seconds) + "s, SSL verification: " +
                        (config.source.enable_ssl_verification ? "ON" : "OFF"));
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_session_configuration(const SystemConfig& config) {
    std::ostringstream coefficient_stream;
    coefficient_stream << std::setprecision(16) << config.market.derived.coefficient;

    LOG_STARTUP_SECTION_HEADER("MARKET SESSION");
    LOG_STARTUP_CONTENT("Zone: " + config.market.session.time_zone_name + "  Window: " +
                        TimeUtils::format_time_of_day(config.market.session.open_seconds_of_day) + " - " +
                        TimeUtils::format_time_of_day(config.market.session.close_seconds_of_day) + " (Mon-Fri)");
    LOG_STARTUP_CONTENT("Derived: coefficient " + coefficient_stream.str() + ", baseline " +
                        std::to_string(static_cast<long long>(config.market.derived.baseline)));
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_refresh_configuration(const SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("REFRESH POLICY");
    LOG_STARTUP_CONTENT("Read staleness: " + std::to_string(config.timing.market_open_staleness_threshold_sec) + "s open / " +
                        std::to_string(config.timing.market_closed_staleness_threshold_sec) + "s closed");
    LOG_STARTUP_CONTENT("Updater interval: " + std::to_string(config.timing.updater_market_open_interval_sec) + "s open / " +
                        std::to_string(config.timing.updater_market_closed_interval_sec) + "s closed, backoff " +
                        std::to_string(config.timing.updater_error_backoff_sec) + "s");
    LOG_STARTUP_CONTENT("Validity window: " + std::to_string(config.market.fallback.validity_window_seconds) + "s");
    LOG_STARTUP_CONTENT("Refresh pool: " + std::to_string(config.timing.refresh_pool_worker_count) + " workers, queue " +
                        std::to_string(config.timing.refresh_pool_queue_capacity));
    LOG_STARTUP_SEPARATOR();
}

void StartupLogs::log_server_configuration(const SystemConfig& config) {
    LOG_STARTUP_SECTION_HEADER("READ ENDPOINT");
    LOG_STARTUP_CONTENT("Listening on " + config.server.bind_address + ":" + std::to_string(config.server.port));
    LOG_STARTUP_CONTENT("CORS origin: " + config.server.cors_allowed_origin);
    LOG_STARTUP_CONTENT("Sessions: up to " + std::to_string(config.server.max_concurrent_sessions) +
                        " concurrent, " + std::to_string(config.server.session_timeout_seconds) + "s deadline");
    LOG_STARTUP_SEPARATOR();
}
