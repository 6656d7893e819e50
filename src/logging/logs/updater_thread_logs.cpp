#include "updater_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

using namespace FtseTracker::Logging;

void UpdaterThreadLogs::log_thread_startup(const TimingConfig& timing) {
    LOG_THREAD_SECTION_HEADER("BACKGROUND UPDATER");
    LOG_THREAD_CONTENT("Interval: " + std::to_string(timing.updater_market_open_interval_sec) + "s open / " +
                       std::to_string(timing.updater_market_closed_interval_sec) + "s closed");
    LOG_THREAD_CONTENT("Error backoff: " + std::to_string(timing.updater_error_backoff_sec) + "s");
    LOG_THREAD_SECTION_FOOTER();
}

void UpdaterThreadLogs::log_thread_exception(const std::string& error_message) {
    log_message("ERROR: Background updater exception: " + error_message, "");
}

void UpdaterThreadLogs::log_thread_exited(unsigned long iterations) {
    log_message("Background updater exited after " + std::to_string(iterations) + " cycles", "");
}

void UpdaterThreadLogs::log_cycle(bool market_open, int interval_seconds, Core::RefreshOutcome outcome) {
    log_message("Updater cycle (" + std::string(market_open ? "market open" : "market closed") + ", " +
                std::to_string(interval_seconds) + "s): " + Core::to_string(outcome), "");
}

void UpdaterThreadLogs::log_cycle_exception(const std::string& error_message, int backoff_seconds) {
    log_message("ERROR: Updater cycle failed: " + error_message + ", pausing " + std::to_string(backoff_seconds) + "s", "");
}
