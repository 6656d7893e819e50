#ifndef SYSTEM_LOGS_HPP
#define SYSTEM_LOGS_HPP

#include <string>

/**
 * Specialized logging for system management operations.
 * Handles all system-level logging in a consistent format.
 */
class SystemLogs {
public:
    // System startup and shutdown
    static void log_system_startup_error(const std::string& error_message);
    static void log_system_shutdown_error(const std::string& error_message);
    static void log_system_warning(const std::string& warning_message);
    static void log_shutdown_requested(int signal_number);
    static void log_shutdown_complete();
    
    // Thread management errors
    static void log_thread_startup_error(const std::string& error_message);
    static void log_main_loop_error(const std::string& error_message);
    static void log_fatal_error(const std::string& error_message);
    
    // System events
    static void log_startup_complete();
    static void log_configuration_validated(bool valid);
    static void log_threads_started(int expected_count, int actual_count);
    static void log_thread_status_table(unsigned long updater_iterations, unsigned long refresh_completed,
                                        unsigned long requests_served, unsigned long logger_iterations);
};

#endif // SYSTEM_LOGS_HPP
