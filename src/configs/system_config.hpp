#ifndef SYSTEM_CONFIG_HPP
#define SYSTEM_CONFIG_HPP

#include "source_config.hpp"
#include "market_config.hpp"
#include "timing_config.hpp"
#include "logging_config.hpp"
#include "server_config.hpp"

namespace FtseTracker {
namespace Config {

/**
 * Index tracker configuration.
 * Source config includes: upstream page, request identity, markup structure
 * Market config includes: session window, derived instrument, fallback snapshot
 */
struct SystemConfig {
    SourceConfig source;               // Upstream page and markup layout
    MarketConfig market;               // Session, derived values and fallback policy
    TimingConfig timing;               // All refresh, updater and thread intervals
    LoggingConfig logging;             // Logging configuration
    ServerConfig server;               // Read endpoint configuration
};

} // namespace Config
} // namespace FtseTracker

#endif // SYSTEM_CONFIG_HPP
