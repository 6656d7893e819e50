/**
 * Background updater thread.
 * Keeps the snapshot fresh independently of readers.
 */
#include "background_updater_thread.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/updater_thread_logs.hpp"
#include <chrono>

// Using declarations for cleaner code
using namespace FtseTracker::Threads;
using namespace FtseTracker::Logging;
using namespace FtseTracker::Core;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void BackgroundUpdaterThread::operator()() {
    set_log_thread_tag("UPDATE");

    try {
        UpdaterThreadLogs::log_thread_startup(timing);

        while (running.load()) {
            try {
                if (!run_cycle()) {
                    break;
                }
            } catch (const std::exception& exception_error) {
                UpdaterThreadLogs::log_cycle_exception(exception_error.what(), timing.updater_error_backoff_sec);
                wait_for(timing.updater_error_backoff_sec);
            } catch (...) {
                UpdaterThreadLogs::log_cycle_exception("Unknown exception", timing.updater_error_backoff_sec);
                wait_for(timing.updater_error_backoff_sec);
            }
        }
    } catch (const std::exception& exception_error) {
        UpdaterThreadLogs::log_thread_exception(exception_error.what());
    } catch (...) {
        UpdaterThreadLogs::log_thread_exception("Unknown exception");
    }

    UpdaterThreadLogs::log_thread_exited(iteration_counter ? iteration_counter->load() : 0);
}

bool BackgroundUpdaterThread::run_cycle() {
    bool market_open = market_state_query();
    int interval_seconds = get_update_interval_seconds(market_open);
    if (!wait_for(interval_seconds)) {
        return false;
    }

    RefreshOutcome outcome = refresh_attempt();
    UpdaterThreadLogs::log_cycle(market_open, interval_seconds, outcome);

    if (iteration_counter) {
        iteration_counter->fetch_add(1);
    }
    return true;
}

int BackgroundUpdaterThread::get_update_interval_seconds(bool market_open) const {
    return market_open ? timing.updater_market_open_interval_sec : timing.updater_market_closed_interval_sec;
}

bool BackgroundUpdaterThread::wait_for(int seconds) {
    std::unique_lock<std::mutex> lock(shutdown_mutex);
    bool stop_requested = shutdown_cv.wait_for(lock, std::chrono::seconds(seconds), [this]{ return !running.load(); });
    return !stop_requested;
}
