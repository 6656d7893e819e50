#include "async_logger.hpp"
#include "tracker/config_loader/config_loader.hpp"
#include "utils/time_utils.hpp"
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace FtseTracker {
namespace Logging {

namespace {

thread_local LoggingContext* thread_logging_context = nullptr;
std::atomic<LoggingContext*> process_logging_context{nullptr};

// Console writes when no context exists
std::mutex fallback_console_mutex;

LoggingContext* find_logging_context() {
    LoggingContext* context = thread_logging_context;
    return context ? context : process_logging_context.load();
}

void write_to_console(const std::string& line) {
    LoggingContext* context = find_logging_context();
    std::lock_guard<std::mutex> console_guard(context ? context->console_mutex : fallback_console_mutex);
    std::cout << line << std::flush;
}

std::string format_log_line(const std::string& message, const std::string& thread_tag) {
    std::string timestamp;
    try {
        timestamp = TimeUtils::get_current_human_readable_time();
    } catch (const std::exception& time_error) {
        std::cerr << "ERROR: log timestamp failed: " << time_error.what() << std::endl;
        timestamp = "ERROR-TIME";
    }
    return timestamp + " [" + thread_tag + "]   " + message + "\n";
}

std::string read_git_short_hash() {
    FILE* pipe = popen("git rev-parse --short HEAD 2>/dev/null", "r");
    if (!pipe) {
        return "unknown";
    }
    std::string hash;
    char chunk[64];
    while (fgets(chunk, sizeof(chunk), pipe) != nullptr) {
        hash += chunk;
    }
    pclose(pipe);
    while (!hash.empty() && (hash.back() == '\n' || hash.back() == '\r')) {
        hash.pop_back();
    }
    return hash.empty() ? "unknown" : hash;
}

// DD-HH-MM_<hash>, shared by the run folder and the log file name
std::string make_run_stamp() {
    std::time_t now = std::time(nullptr);
    std::tm local_tm;
    localtime_r(&now, &local_tm);
    std::ostringstream stamp;
    stamp << std::put_time(&local_tm, TimeUtils::LOG_FILENAME) << "_" << read_git_short_hash();
    return stamp.str();
}

std::string make_log_file_path(const std::string& run_folder, const std::string& configured_name,
                               const std::string& run_stamp) {
    std::filesystem::path file_name = std::filesystem::path(configured_name).filename();
    std::string stem = file_name.stem().string();
    std::string extension = file_name.extension().string();
    return run_folder + "/" + stem + "_" + run_stamp + extension;
}

} // anonymous namespace

// ========================================================================
// CONTEXT AND THREAD TAGS
// ========================================================================

std::string format_thread_tag(const std::string& tag_value) {
    std::string tag = tag_value.substr(0, LOG_TAG_WIDTH);
    tag.resize(LOG_TAG_WIDTH, ' ');
    return tag;
}

std::string LoggingContext::get_thread_tag() const {
    std::lock_guard<std::mutex> lock(thread_tag_mutex);
    auto tag_iterator = thread_tags.find(std::this_thread::get_id());
    return tag_iterator != thread_tags.end() ? tag_iterator->second : format_thread_tag("MAIN");
}

void LoggingContext::set_thread_tag(const std::string& tag_value) {
    std::lock_guard<std::mutex> lock(thread_tag_mutex);
    thread_tags[std::this_thread::get_id()] = format_thread_tag(tag_value);
}

void set_log_thread_tag(const std::string& thread_tag_value) {
    LoggingContext* context = find_logging_context();
    if (context) {
        context->set_thread_tag(thread_tag_value);
    }
}

void set_logging_context(LoggingContext& context) {
    thread_logging_context = &context;
}

void set_process_logging_context(LoggingContext* context) {
    process_logging_context.store(context);
}

void clear_logging_context() {
    thread_logging_context = nullptr;
    process_logging_context.store(nullptr);
}

// ========================================================================
// MESSAGE ENTRY POINT
// ========================================================================

void log_message(const std::string& message, const std::string& log_file_path) {
    try {
        LoggingContext* context = find_logging_context();
        std::string line = format_log_line(message, context ? context->get_thread_tag() : format_thread_tag("MAIN"));

        if (context && context->async_logger && context->async_logger->is_running()) {
            context->async_logger->enqueue(line);
            return;
        }

        write_to_console(line);
        if (!log_file_path.empty()) {
            std::ofstream log_file(log_file_path, std::ios::app);
            if (!log_file.is_open()) {
                std::cerr << "ERROR: Failed to open log file: " << log_file_path << std::endl;
                return;
            }
            log_file << line;
        }
    } catch (const std::exception& logging_error) {
        std::cerr << "CRITICAL ERROR: Logging system failure: " << logging_error.what() << "\n"
                  << message << std::endl;
    }
}

// ========================================================================
// ASYNC LOGGER
// ========================================================================

void AsyncLogger::start() {
    running.store(true);
}

void AsyncLogger::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        running.store(false);
    }
    queue_cv.notify_all();
}

void AsyncLogger::enqueue(const std::string& formatted_line) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        pending_lines.push_back(formatted_line);
    }
    queue_cv.notify_one();
}

std::size_t AsyncLogger::wait_and_drain(std::ofstream& log_file, std::chrono::milliseconds max_wait) {
    std::unique_lock<std::mutex> lock(queue_mutex);
    queue_cv.wait_for(lock, max_wait, [this] { return !pending_lines.empty() || !running.load(); });
    return write_lines(lock, log_file);
}

std::size_t AsyncLogger::drain_remaining(std::ofstream& log_file) {
    std::unique_lock<std::mutex> lock(queue_mutex);
    return write_lines(lock, log_file);
}

std::size_t AsyncLogger::write_lines(std::unique_lock<std::mutex>& lock, std::ofstream& log_file) {
    std::deque<std::string> batch;
    batch.swap(pending_lines);
    lock.unlock();

    for (const std::string& line : batch) {
        write_to_console(line);
        if (log_file.is_open()) {
            log_file << line;
        }
    }
    if (log_file.is_open()) {
        log_file.flush();
    }
    return batch.size();
}

void shutdown_global_logger(AsyncLogger& logger) {
    logger.stop();
}

// ========================================================================
// FOUNDATION
// ========================================================================

std::shared_ptr<AsyncLogger> initialize_application_foundation(const FtseTracker::Config::SystemConfig& config) {
    LoggingContext* context = find_logging_context();
    if (!context) {
        throw std::runtime_error("Logging context not initialized for current thread - system must fail without context");
    }

    std::string configuration_error_message;
    if (!validate_config(config, configuration_error_message)) {
        std::cerr << "ERROR: Config error: " << configuration_error_message << std::endl;
        throw std::runtime_error("Configuration validation failed: " + configuration_error_message);
    }

    // runtime_logs/run_DD-HH-MM_<hash>/
    std::string run_stamp = make_run_stamp();
    context->run_folder = "runtime_logs/run_" + run_stamp;
    try {
        std::filesystem::create_directories(context->run_folder);
    } catch (const std::exception& filesystem_error) {
        throw std::runtime_error("Failed to create run folder " + context->run_folder + ": " + filesystem_error.what());
    }

    auto logger = std::make_shared<AsyncLogger>(make_log_file_path(context->run_folder, config.logging.log_file, run_stamp));
    logger->start();
    context->async_logger = logger;
    set_log_thread_tag("MAIN");
    return logger;
}

} // namespace Logging
} // namespace FtseTracker
