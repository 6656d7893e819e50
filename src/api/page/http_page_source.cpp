#include "http_page_source.hpp"
#include "utils/http_utils.hpp"
#include "utils/time_utils.hpp"

namespace FtseTracker {
namespace API {

HttpPageSource::HttpPageSource(const SourceConfig& source_config, ConnectivityManager& connectivity_mgr,
                               const TimeProvider& time_provider_ref)
    : config(source_config), connectivity_manager(connectivity_mgr), time_provider(time_provider_ref) {}

std::string HttpPageSource::build_request_url() const {
    std::string separator = config.url.find('?') == std::string::npos ? "?" : "&";
    return config.url + separator + "_nocache=" + std::to_string(TimeUtils::to_epoch_whole_seconds(time_provider.now()));
}

std::vector<std::string> HttpPageSource::build_request_headers() const {
    return {
        "User-Agent: " + config.user_agent,
        "Cache-Control: no-cache, no-store, must-revalidate",
        "Pragma: no-cache",
        "Expires: 0"
    };
}

std::string HttpPageSource::fetch_page() {
    HttpRequest page_request(build_request_url(), build_request_headers(),
                             config.timeout_seconds, config.enable_ssl_verification);
    return http_get(page_request, connectivity_manager);
}

} // namespace API
} // namespace FtseTracker
