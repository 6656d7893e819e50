#ifndef STARTUP_LOGS_HPP
#define STARTUP_LOGS_HPP

#include "configs/system_config.hpp"

using FtseTracker::Config::SystemConfig;

/**
 * Specialized logging for application startup sequence.
 * Handles all startup-related logging in a consistent format.
 */
class StartupLogs {
public:
    // Application header and branding
    static void log_application_header();

    // System configuration tables
    static void log_source_configuration(const SystemConfig& config);
    static void log_session_configuration(const SystemConfig& config);
    static void log_refresh_configuration(const SystemConfig& config);
    static void log_server_configuration(const SystemConfig& config);
};

#endif // STARTUP_LOGS_HPP
