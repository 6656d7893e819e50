#ifndef TIME_UTILS_HPP
#define TIME_UTILS_HPP

#include <string>
#include <chrono>
#include <sstream>
#include <iomanip>

namespace TimeUtils {

// Time conversion constants
constexpr long long SECONDS_PER_MINUTE = 60;
constexpr long long MINUTES_PER_HOUR = 60;
constexpr long long HOURS_PER_DAY = 24;
constexpr long long SECONDS_PER_HOUR = SECONDS_PER_MINUTE * MINUTES_PER_HOUR;
constexpr long long SECONDS_PER_DAY = SECONDS_PER_HOUR * HOURS_PER_DAY;

// Time format constants
constexpr const char* HUMAN_READABLE = "%Y-%m-%d %H:%M:%S";
constexpr const char* TIME_OF_DAY = "%H:%M:%S";
constexpr const char* LOG_FILENAME = "%d-%H-%M";

// Common time utility functions
std::string get_current_human_readable_time();
std::string format_human_readable_local(std::chrono::system_clock::time_point instant);
std::string format_human_readable_with_offset(std::chrono::system_clock::time_point instant, std::chrono::seconds utc_offset);

// Epoch conversion (fractional seconds, as carried on the wire)
double to_epoch_seconds(std::chrono::system_clock::time_point instant);
long long to_epoch_whole_seconds(std::chrono::system_clock::time_point instant);

// "HH:MM:SS" -> seconds since midnight, throws std::invalid_argument when malformed
int parse_time_of_day(const std::string& time_of_day);
std::string format_time_of_day(int seconds_of_day);

} // namespace TimeUtils

#endif // TIME_UTILS_HPP
