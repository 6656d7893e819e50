#ifndef MARKET_CLOCK_HPP
#define MARKET_CLOCK_HPP

#include "configs/market_config.hpp"
#include <chrono>
#include <string>

namespace FtseTracker {
namespace Core {

/**
 * MarketClock - classifies instants against the trading session.
 *
 * The session is expressed in a named zone with a fixed UTC offset. The zone
 * is resolved once at construction, so an unknown name fails at startup.
 * Saturday and Sunday are always closed; on weekdays the window is inclusive
 * at both ends and compared at the clock's full precision.
 */
class MarketClock {
public:
    explicit MarketClock(const SessionConfig& session_config);

    bool is_market_open(std::chrono::system_clock::time_point instant) const;

    // "YYYY-MM-DD HH:MM:SS" in the session zone
    std::string format_local_time(std::chrono::system_clock::time_point instant) const;

    std::chrono::seconds get_utc_offset() const { return utc_offset; }
    const std::string& get_time_zone_name() const { return time_zone_name; }

    // Throws std::invalid_argument for names outside the supported table
    static std::chrono::seconds resolve_time_zone(const std::string& zone_name);

private:
    std::string time_zone_name;
    std::chrono::seconds utc_offset;
    std::chrono::seconds session_open;
    std::chrono::seconds session_close;
};

} // namespace Core
} // namespace FtseTracker

#endif // MARKET_CLOCK_HPP
