/**
 * Logging thread.
 * Drains the async logger queue to the console and the run's log file.
 */
#include "logging_thread.hpp"
#include "logging/logs/logging_thread_logs.hpp"
#include <fstream>
#include <chrono>

// Using declarations for cleaner code
using namespace FtseTracker::Threads;
using namespace FtseTracker::Logging;

// ========================================================================
// THREAD LIFECYCLE MANAGEMENT
// ========================================================================

void LoggingThread::operator()() {
    try {
        set_log_thread_tag("LOGGER");
        execute_logging_processing_loop();
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_thread_exception(exception.what());
    } catch (...) {
        LoggingThreadLogs::log_thread_exception("Unknown error");
    }
}

void LoggingThread::execute_logging_processing_loop() {
    try {
        std::ofstream log_file(logger_ptr->get_file_path(), std::ios::app);
        if (!log_file.is_open()) {
            LoggingThreadLogs::log_log_file_open_failure(logger_ptr->get_file_path());
        }

        // Wake at least every tenth of the poll interval to notice stop
        const std::chrono::milliseconds max_wait(timing.thread_logging_poll_interval_sec * 100);

        while (logger_ptr->is_running()) {
            try {
                logger_ptr->wait_and_drain(log_file, max_wait);
                logger_iterations->fetch_add(1);
            } catch (const std::exception& exception) {
                LoggingThreadLogs::log_loop_iteration_exception(exception.what());
            }
        }

        // Lines queued before stop; later ones go straight to the console
        logger_ptr->drain_remaining(log_file);
        LoggingThreadLogs::log_thread_exited();
    } catch (const std::exception& exception) {
        LoggingThreadLogs::log_logging_loop_exception(exception.what());
    }
}
