#ifndef HTTP_PAGE_SOURCE_HPP
#define HTTP_PAGE_SOURCE_HPP

#include "configs/source_config.hpp"
#include "tracker/market_data/page_source.hpp"
#include "utils/connectivity_manager.hpp"
#include "utils/time_provider.hpp"
#include <string>
#include <vector>

namespace FtseTracker {
namespace API {

/**
 * Fetches the index page over HTTPS with every cache layer bypassed:
 * a per-request cache-busting query parameter plus no-cache headers.
 */
class HttpPageSource : public Core::PageSource {
private:
    const SourceConfig& config;
    ConnectivityManager& connectivity_manager;
    const TimeProvider& time_provider;

public:
    HttpPageSource(const SourceConfig& source_config, ConnectivityManager& connectivity_mgr,
                   const TimeProvider& time_provider_ref);

    std::string fetch_page() override;

    std::string build_request_url() const;
    std::vector<std::string> build_request_headers() const;
};

} // namespace API
} // namespace FtseTracker

#endif // HTTP_PAGE_SOURCE_HPP
