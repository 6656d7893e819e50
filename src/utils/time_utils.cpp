#include "time_utils.hpp"
#include <ctime>
#include <stdexcept>

namespace TimeUtils {

std::string get_current_human_readable_time() {
    return format_human_readable_local(std::chrono::system_clock::now());
}

std::string format_human_readable_local(std::chrono::system_clock::time_point instant) {
    auto in_time_t = std::chrono::system_clock::to_time_t(instant);
    std::stringstream ss;
    
    // Use thread-safe localtime_r instead of localtime
    struct tm timeinfo;
    localtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

std::string format_human_readable_with_offset(std::chrono::system_clock::time_point instant, std::chrono::seconds utc_offset) {
    auto in_time_t = std::chrono::system_clock::to_time_t(instant + utc_offset);
    std::stringstream ss;

    // The offset is already applied, so render the shifted instant as UTC
    struct tm timeinfo;
    gmtime_r(&in_time_t, &timeinfo);
    ss << std::put_time(&timeinfo, HUMAN_READABLE);
    return ss.str();
}

double to_epoch_seconds(std::chrono::system_clock::time_point instant) {
    return std::chrono::duration<double>(instant.time_since_epoch()).count();
}

long long to_epoch_whole_seconds(std::chrono::system_clock::time_point instant) {
    return static_cast<long long>(std::chrono::duration_cast<std::chrono::seconds>(instant.time_since_epoch()).count());
}

int parse_time_of_day(const std::string& time_of_day) {
    std::tm t = {};
    std::istringstream ss(time_of_day);
    ss >> std::get_time(&t, TIME_OF_DAY);
    if (ss.fail()) {
        throw std::invalid_argument("Invalid time of day (expected HH:MM:SS): '" + time_of_day + "'");
    }
    std::string trailing;
    if (ss >> trailing) {
        throw std::invalid_argument("Unexpected trailing characters in time of day: '" + time_of_day + "'");
    }
    if (t.tm_hour < 0 || t.tm_hour > 23 || t.tm_min < 0 || t.tm_min > 59 || t.tm_sec < 0 || t.tm_sec > 59) {
        throw std::invalid_argument("Time of day out of range: '" + time_of_day + "'");
    }
    return static_cast<int>(t.tm_hour * SECONDS_PER_HOUR + t.tm_min * SECONDS_PER_MINUTE + t.tm_sec);
}

std::string format_time_of_day(int seconds_of_day) {
    std::stringstream ss;
    ss << std::setfill('0')
       << std::setw(2) << seconds_of_day / SECONDS_PER_HOUR << ":"
       << std::setw(2) << (seconds_of_day % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE << ":"
       << std::setw(2) << seconds_of_day % SECONDS_PER_MINUTE;
    return ss.str();
}

} // namespace TimeUtils
