#ifndef SERVER_LOGS_HPP
#define SERVER_LOGS_HPP

#include "configs/server_config.hpp"
#include <cstddef>
#include <string>

namespace FtseTracker {
namespace Logging {

class ServerLogs {
public:
    static void log_server_listening(const ServerConfig& server_config, unsigned short bound_port);
    static void log_server_stopped(unsigned long requests_served, std::size_t joined_sessions);
    static void log_session_rejected(std::size_t active_sessions);
    static void log_server_exception(const std::string& error_message);
    static void log_session_exception(const std::string& error_message);
    static void log_request(const std::string& method, const std::string& target, unsigned status_code);
    static void log_handler_exception(const std::string& target, const std::string& error_message);
};

} // namespace Logging
} // namespace FtseTracker

#endif // SERVER_LOGS_HPP
