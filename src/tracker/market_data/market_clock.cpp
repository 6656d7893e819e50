#include "market_clock.hpp"
#include "utils/time_utils.hpp"
#include <stdexcept>
#include <utility>

namespace FtseTracker {
namespace Core {

namespace {

using Days = std::chrono::duration<long long, std::ratio<TimeUtils::SECONDS_PER_DAY>>;

// Fixed UTC offsets. Only zones without daylight saving belong here: a DST
// zone would need a tz database lookup, not a single offset.
const std::pair<const char*, int> SUPPORTED_TIME_ZONES[] = {
    {"Asia/Taipei", 8 * 3600},
    {"Asia/Shanghai", 8 * 3600},
    {"Asia/Hong_Kong", 8 * 3600},
    {"Asia/Singapore", 8 * 3600},
    {"Asia/Tokyo", 9 * 3600},
    {"Asia/Seoul", 9 * 3600},
    {"UTC", 0},
    {"Etc/UTC", 0}
};

constexpr int SUNDAY = 0;
constexpr int SATURDAY = 6;
constexpr long long EPOCH_WEEKDAY = 4;   // 1970-01-01 was a Thursday

} // anonymous namespace

MarketClock::MarketClock(const SessionConfig& session_config)
    : time_zone_name(session_config.time_zone_name),
      utc_offset(resolve_time_zone(session_config.time_zone_name)),
      session_open(session_config.open_seconds_of_day),
      session_close(session_config.close_seconds_of_day) {
    if (session_open >= session_close) {
        throw std::invalid_argument("Session open time must be before close time");
    }
}

std::chrono::seconds MarketClock::resolve_time_zone(const std::string& zone_name) {
    for (const auto& zone_entry : SUPPORTED_TIME_ZONES) {
        if (zone_name == zone_entry.first) {
            return std::chrono::seconds(zone_entry.second);
        }
    }
    throw std::invalid_argument("Unsupported time zone: '" + zone_name + "'");
}

bool MarketClock::is_market_open(std::chrono::system_clock::time_point instant) const {
    auto local_since_epoch = instant.time_since_epoch() + utc_offset;
    Days local_days = std::chrono::floor<Days>(local_since_epoch);
    auto time_of_day = local_since_epoch - local_days;

    int weekday = static_cast<int>(((local_days.count() + EPOCH_WEEKDAY) % 7 + 7) % 7);
    if (weekday == SATURDAY || weekday == SUNDAY) {
        return false;
    }

    return time_of_day >= session_open && time_of_day <= session_close;
}

std::string MarketClock::format_local_time(std::chrono::system_clock::time_point instant) const {
    return TimeUtils::format_human_readable_with_offset(instant, utc_offset);
}

} // namespace Core
} // namespace FtseTracker
