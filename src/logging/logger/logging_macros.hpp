#ifndef LOGGING_MACROS_HPP
#define LOGGING_MACROS_HPP

#include "async_logger.hpp"
#include <string>

namespace FtseTracker {
namespace Logging {

constexpr std::size_t TABLE_LABEL_WIDTH = 17;
constexpr std::size_t TABLE_VALUE_WIDTH = 48;

// Clips to width and pads with spaces. Width is counted in bytes.
inline std::string fit_table_cell(const std::string& text, std::size_t width) {
    std::string cell = text.substr(0, width);
    cell.resize(width, ' ');
    return cell;
}

inline std::string make_table_row(const std::string& label, const std::string& value) {
    return "│ " + fit_table_cell(label, TABLE_LABEL_WIDTH) + " │ " + fit_table_cell(value, TABLE_VALUE_WIDTH) + " │";
}

} // namespace Logging
} // namespace FtseTracker

// Startup sections
#define LOG_STARTUP_SECTION_HEADER(title) log_message("+-- " title, "")
#define LOG_STARTUP_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_STARTUP_SEPARATOR() log_message("|", "")

// Sections written from any thread
#define LOG_THREAD_SECTION_HEADER(title) log_message("+-- " title, "")
#define LOG_THREAD_CONTENT(msg) log_message("|   " + std::string(msg), "")
#define LOG_THREAD_SECTION_FOOTER() log_message("+-- ", "")

#define LOG_THREAD_SNAPSHOT_HEADER() LOG_THREAD_SECTION_HEADER("INDEX SNAPSHOT")
#define LOG_THREAD_FALLBACK_HEADER() LOG_THREAD_SECTION_HEADER("FALLBACK")

// Thread status table
#define LOG_THREAD_STATUS_HEADER() LOG_THREAD_SECTION_HEADER("THREADS STATUS")
#define LOG_THREAD_STATUS_TABLE_HEADER() LOG_THREAD_CONTENT("+----------+----------+----------+----------+")
#define LOG_THREAD_STATUS_TABLE_COLUMNS() LOG_THREAD_CONTENT("| Updater  | Refresh  | Server   | Logger   |")
#define LOG_THREAD_STATUS_TABLE_SEPARATOR() LOG_THREAD_STATUS_TABLE_HEADER()
#define LOG_THREAD_STATUS_TABLE_FOOTER() LOG_THREAD_STATUS_TABLE_HEADER()

// Two-column label/value tables
#define TABLE_HEADER_48(title, subtitle) do { \
    LOG_THREAD_CONTENT("┌───────────────────┬──────────────────────────────────────────────────┐"); \
    LOG_THREAD_CONTENT(FtseTracker::Logging::make_table_row(title, subtitle)); \
    LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤"); \
} while (0)

#define TABLE_ROW_48(label, value) LOG_THREAD_CONTENT(FtseTracker::Logging::make_table_row(label, value))
#define TABLE_SEPARATOR_48() LOG_THREAD_CONTENT("├───────────────────┼──────────────────────────────────────────────────┤")
#define TABLE_FOOTER_48() LOG_THREAD_CONTENT("└───────────────────┴──────────────────────────────────────────────────┘")

#endif // LOGGING_MACROS_HPP
