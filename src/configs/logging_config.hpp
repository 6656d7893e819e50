// LoggingConfig.hpp
#ifndef LOGGING_CONFIG_HPP
#define LOGGING_CONFIG_HPP

#include <string>

struct LoggingConfig {
    std::string log_file = "ftse_server.log";
};

#endif // LOGGING_CONFIG_HPP
