#include "server_logs.hpp"
#include "logging/logger/async_logger.hpp"

using namespace FtseTracker::Logging;

void ServerLogs::log_server_listening(const ServerConfig& server_config, unsigned short bound_port) {
    log_message("HTTP server listening on " + server_config.bind_address + ":" + std::to_string(bound_port), "");
}

void ServerLogs::log_server_stopped(unsigned long requests_served, std::size_t joined_sessions) {
    log_message("HTTP server stopped after " + std::to_string(requests_served) + " requests (" +
                std::to_string(joined_sessions) + " open sessions joined)", "");
}

void ServerLogs::log_session_rejected(std::size_t active_sessions) {
    log_message("WARNING: Connection closed unanswered, " + std::to_string(active_sessions) + " sessions already active", "");
}

void ServerLogs::log_server_exception(const std::string& error_message) {
    log_message("ERROR: HTTP server exception: " + error_message, "");
}

void ServerLogs::log_session_exception(const std::string& error_message) {
    log_message("WARNING: HTTP session ended with error: " + error_message, "");
}

void ServerLogs::log_request(const std::string& method, const std::string& target, unsigned status_code) {
    log_message(method + " " + target + " -> " + std::to_string(status_code), "");
}

void ServerLogs::log_handler_exception(const std::string& target, const std::string& error_message) {
    log_message("ERROR: Request handling failed for " + target + ": " + error_message, "");
}
