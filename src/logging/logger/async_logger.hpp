#ifndef ASYNC_LOGGER_HPP
#define ASYNC_LOGGER_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include "configs/system_config.hpp"

namespace FtseTracker {
namespace Logging {

constexpr std::size_t LOG_TAG_WIDTH = 6;

/**
 * AsyncLogger - queue of formatted lines between the producing threads and
 * the logging thread. Producers only enqueue; the logging thread writes to
 * the console and the run's log file.
 */
class AsyncLogger {
public:
    explicit AsyncLogger(const std::string& log_file_path) : file_path(log_file_path) {}

    const std::string& get_file_path() const { return file_path; }
    bool is_running() const { return running.load(); }

    void start();
    void stop();
    void enqueue(const std::string& formatted_line);

    // Waits up to max_wait for lines (or stop) and writes what is queued.
    // Returns the number of lines written.
    std::size_t wait_and_drain(std::ofstream& log_file, std::chrono::milliseconds max_wait);
    // Writes whatever is left without waiting.
    std::size_t drain_remaining(std::ofstream& log_file);

private:
    std::string file_path;
    std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<std::string> pending_lines;
    std::atomic<bool> running{false};

    std::size_t write_lines(std::unique_lock<std::mutex>& lock, std::ofstream& log_file);
};

struct LoggingContext {
    std::shared_ptr<AsyncLogger> async_logger;
    std::mutex console_mutex;
    std::string run_folder;

    std::string get_thread_tag() const;
    void set_thread_tag(const std::string& tag_value);

private:
    mutable std::mutex thread_tag_mutex;
    std::unordered_map<std::thread::id, std::string> thread_tags;
};

// Pads or truncates to LOG_TAG_WIDTH
std::string format_thread_tag(const std::string& tag_value);

void set_log_thread_tag(const std::string& thread_tag_value);

// Main logging function. Without a logging context the line goes to the console only.
void log_message(const std::string& message, const std::string& log_file_path);

void shutdown_global_logger(AsyncLogger& logger);

// Validates the config, creates the run folder and the logger
std::shared_ptr<AsyncLogger> initialize_application_foundation(const FtseTracker::Config::SystemConfig& config);

// The thread's own context wins over the process-wide one.
void set_logging_context(LoggingContext& context);
void set_process_logging_context(LoggingContext* context);
// Detaches the calling thread and the process from any context
void clear_logging_context();

} // namespace Logging
} // namespace FtseTracker

#endif // ASYNC_LOGGER_HPP
