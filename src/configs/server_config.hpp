// ServerConfig.hpp
#ifndef SERVER_CONFIG_HPP
#define SERVER_CONFIG_HPP

#include <string>

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    int port = 5001;                                        // Overridden by the PORT environment variable
    std::string cors_allowed_origin = "*";                  // Access-Control-Allow-Origin for /api/* routes
    int accept_poll_interval_milliseconds = 50;             // Acceptor and session poll while waiting for shutdown
    int session_timeout_seconds = 10;                       // Deadline for reading a request and for writing the response
    int max_concurrent_sessions = 16;                       // Connections past this are closed unanswered
};

#endif // SERVER_CONFIG_HPP
