#ifndef HTTP_UTILS_HPP
#define HTTP_UTILS_HPP

#include <string>
#include <vector>
#include "connectivity_manager.hpp"

// HTTP request wrapper to avoid multi-parameter functions
struct HttpRequest {
    std::string url;
    std::vector<std::string> headers;      // Raw "Name: value" lines
    int timeout_seconds;
    bool enable_ssl_verification;

    HttpRequest(const std::string& u,
                std::vector<std::string> header_lines,
                int timeout = 10,
                bool ssl_verify = true)
        : url(u), headers(std::move(header_lines)),
          timeout_seconds(timeout), enable_ssl_verification(ssl_verify) {}
};

size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s);

// Single attempt GET. Transport failures, non-2xx statuses and empty bodies
// throw FtseTracker::Core::NetworkError; every outcome is reported to the
// connectivity manager.
std::string http_get(const HttpRequest& req, ConnectivityManager& connectivity_ref);

#endif // HTTP_UTILS_HPP
