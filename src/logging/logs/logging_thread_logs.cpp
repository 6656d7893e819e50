#include "logging_thread_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include <iostream>

using namespace FtseTracker::Logging;

// The logging thread cannot rely on its own queue while failing, so these go to stderr.

void LoggingThreadLogs::log_thread_exception(const std::string& error_message) {
    std::cerr << "LoggingThread exception: " << error_message << std::endl;
}

void LoggingThreadLogs::log_thread_exited() {
    log_message("LoggingThread exited", "");
}

void LoggingThreadLogs::log_log_file_open_failure(const std::string& file_path) {
    std::cerr << "LoggingThread could not open log file, console only: " << file_path << std::endl;
}

void LoggingThreadLogs::log_loop_iteration_exception(const std::string& error_message) {
    std::cerr << "LoggingThread loop iteration exception: " << error_message << std::endl;
}

void LoggingThreadLogs::log_logging_loop_exception(const std::string& error_message) {
    std::cerr << "LoggingThread logging_loop exception: " << error_message << std::endl;
}
