// HttpUtils.cpp
#include "http_utils.hpp"
#include "tracker/data_structures/tracker_errors.hpp"
#include <curl/curl.h>
#include <memory>
#include <string>

using FtseTracker::Core::NetworkError;

namespace {

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

[[noreturn]] void fail_request(ConnectivityManager& connectivity_ref, const std::string& error_message) {
    connectivity_ref.report_failure(error_message);
    throw NetworkError(error_message);
}

} // anonymous namespace

// Implement write_callback
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* response_string) {
    response_string->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

// Implement http_get
std::string http_get(const HttpRequest& http_request, ConnectivityManager& connectivity_ref) {
    CurlHandle curl_handle(curl_easy_init());
    if (!curl_handle) {
        fail_request(connectivity_ref, "Failed to initialize CURL for HTTP GET request");
    }

    CurlHeaderList headers;
    for (const std::string& header_line : http_request.headers) {
        curl_slist* appended = curl_slist_append(headers.get(), header_line.c_str());
        if (!appended) {
            fail_request(connectivity_ref, "Failed to build request headers for URL: " + http_request.url);
        }
        headers.release();
        headers.reset(appended);
    }

    std::string response;
    long http_response_code = 0;

    curl_easy_setopt(curl_handle.get(), CURLOPT_URL, http_request.url.c_str());
    curl_easy_setopt(curl_handle.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl_handle.get(), CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl_handle.get(), CURLOPT_TIMEOUT, static_cast<long>(http_request.timeout_seconds));
    curl_easy_setopt(curl_handle.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYPEER, http_request.enable_ssl_verification ? 1L : 0L);
    curl_easy_setopt(curl_handle.get(), CURLOPT_SSL_VERIFYHOST, http_request.enable_ssl_verification ? 2L : 0L);

    CURLcode curl_result = curl_easy_perform(curl_handle.get());
    curl_easy_getinfo(curl_handle.get(), CURLINFO_RESPONSE_CODE, &http_response_code);

    if (curl_result != CURLE_OK) {
        fail_request(connectivity_ref, "HTTP GET failed: " + std::string(curl_easy_strerror(curl_result)) +
                                       " (HTTP " + std::to_string(http_response_code) + ") URL: " + http_request.url);
    }

    if (http_response_code < 200 || http_response_code >= 300) {
        fail_request(connectivity_ref, "HTTP GET returned status " + std::to_string(http_response_code) +
                                       " for URL: " + http_request.url);
    }

    // Check for empty response even on successful HTTP request
    if (response.empty()) {
        fail_request(connectivity_ref, "HTTP GET succeeded but returned empty response (HTTP " +
                                       std::to_string(http_response_code) + ") for URL: " + http_request.url);
    }

    connectivity_ref.report_success();
    return response;
}
