#include "system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logger/logging_macros.hpp"

using FtseTracker::Logging::log_message;

void SystemLogs::log_system_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: System startup error: ") + error_message, "");
}

void SystemLogs::log_system_shutdown_error(const std::string& error_message) {
    log_message(std::string("ERROR: System shutdown error: ") + error_message, "");
}

void SystemLogs::log_system_warning(const std::string& warning_message) {
    log_message(std::string("WARNING: ") + warning_message, "");
}

void SystemLogs::log_shutdown_requested(int signal_number) {
    log_message("SHUTDOWN: Signal " + std::to_string(signal_number) + " received, stopping", "");
}

void SystemLogs::log_shutdown_complete() {
    log_message("SHUTDOWN: All threads stopped", "");
}

void SystemLogs::log_thread_startup_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error starting threads: ") + error_message, "");
}

void SystemLogs::log_main_loop_error(const std::string& error_message) {
    log_message(std::string("ERROR: Error in main loop: ") + error_message, "");
}

void SystemLogs::log_fatal_error(const std::string& error_message) {
    log_message(std::string("FATAL: ") + error_message, "");
}

void SystemLogs::log_startup_complete() {
    log_message("SYSTEM_STARTUP: System startup completed successfully", "");
}

void SystemLogs::log_configuration_validated(bool valid) {
    if (valid) {
        log_message("CONFIG_VALIDATION: Configuration validated successfully", "");
    } else {
        log_message("CONFIG_VALIDATION: Configuration validation FAILED", "");
    }
}

void SystemLogs::log_threads_started(int expected_count, int actual_count) {
    if (actual_count == expected_count) {
        log_message("THREAD_STARTUP: All " + std::to_string(expected_count) + " threads started successfully", "");
    } else {
        log_message("THREAD_STARTUP: WARNING - Only " + std::to_string(actual_count) + 
                    " of " + std::to_string(expected_count) + " threads started", "");
    }
}

void SystemLogs::log_thread_status_table(unsigned long updater_iterations, unsigned long refresh_completed,
                                         unsigned long requests_served, unsigned long logger_iterations) {
    auto cell = [](unsigned long value) {
        std::string text = std::to_string(value);
        if (text.size() < 8) {
            text.append(8 - text.size(), ' ');
        }
        return text;
    };

    LOG_THREAD_STATUS_HEADER();
    LOG_THREAD_STATUS_TABLE_HEADER();
    LOG_THREAD_STATUS_TABLE_COLUMNS();
    LOG_THREAD_STATUS_TABLE_SEPARATOR();
    LOG_THREAD_CONTENT("| " + cell(updater_iterations) + " | " + cell(refresh_completed) + " | " +
                       cell(requests_served) + " | " + cell(logger_iterations) + " |");
    LOG_THREAD_STATUS_TABLE_FOOTER();
}
