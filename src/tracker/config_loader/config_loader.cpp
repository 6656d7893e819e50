#include "config_loader.hpp"
#include "configs/system_config.hpp"
#include "tracker/market_data/market_clock.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/time_utils.hpp"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <vector>

using FtseTracker::Logging::log_message;

namespace {
    inline std::string trim(const std::string& input_string) {
        const char* whitespace_chars = " \t\r\n";
        auto begin_position = input_string.find_first_not_of(whitespace_chars);
        auto end_position = input_string.find_last_not_of(whitespace_chars);
        if (begin_position == std::string::npos) return "";
        return input_string.substr(begin_position, end_position - begin_position + 1);
    }

    inline bool to_bool(const std::string& input_value) {
        std::string normalized_value = input_value; 
        std::transform(normalized_value.begin(), normalized_value.end(), normalized_value.begin(),
                       [](unsigned char character) { return static_cast<char>(std::tolower(character)); });
        if (normalized_value == "1" || normalized_value == "true" || normalized_value == "yes") return true;
        if (normalized_value == "0" || normalized_value == "false" || normalized_value == "no") return false;
        throw std::invalid_argument("Invalid boolean value: '" + input_value + "'");
    }

    // Whole value must be consumed; "10s" is rejected rather than read as 10
    inline int to_int(const std::string& input_value) {
        size_t consumed = 0;
        int parsed_value = std::stoi(input_value, &consumed);
        if (consumed != input_value.size()) {
            throw std::invalid_argument("Invalid integer value: '" + input_value + "'");
        }
        return parsed_value;
    }

    inline double to_double(const std::string& input_value) {
        size_t consumed = 0;
        double parsed_value = std::stod(input_value, &consumed);
        if (consumed != input_value.size()) {
            throw std::invalid_argument("Invalid decimal value: '" + input_value + "'");
        }
        return parsed_value;
    }

    // Returns false for keys this loader does not know
    bool apply_config_value(FtseTracker::Config::SystemConfig& cfg, const std::string& key, const std::string& value) {
        // Source configuration
        if (key == "source.url") cfg.source.url = value;
        else if (key == "source.user_agent") cfg.source.user_agent = value;
        else if (key == "source.timeout_seconds") cfg.source.timeout_seconds = to_int(value);
        else if (key == "source.enable_ssl_verification") cfg.source.enable_ssl_verification = to_bool(value);
        else if (key == "source.live_label") cfg.source.live_label = value;
        else if (key == "index.code") cfg.source.index_code = value;
        else if (key == "index.name") cfg.source.index_name = value;

        // Markup layout
        else if (key == "markup.region_tag") cfg.source.markup.region_tag = value;
        else if (key == "markup.region_class") cfg.source.markup.region_class = value;
        else if (key == "markup.price_element_id") cfg.source.markup.price_element_id = value;
        else if (key == "markup.change_element_id") cfg.source.markup.change_element_id = value;
        else if (key == "markup.percent_element_id") cfg.source.markup.percent_element_id = value;
        else if (key == "markup.up_class") cfg.source.markup.up_class = value;
        else if (key == "markup.down_class") cfg.source.markup.down_class = value;
        else if (key == "markup.up_glyph") cfg.source.markup.up_glyph = value;
        else if (key == "markup.down_glyph") cfg.source.markup.down_glyph = value;

        // Market session and derived instrument
        else if (key == "session.timezone") cfg.market.session.time_zone_name = value;
        else if (key == "session.open_time") cfg.market.session.open_seconds_of_day = TimeUtils::parse_time_of_day(value);
        else if (key == "session.close_time") cfg.market.session.close_seconds_of_day = TimeUtils::parse_time_of_day(value);
        else if (key == "derived.coefficient") cfg.market.derived.coefficient = to_double(value);
        else if (key == "derived.baseline") cfg.market.derived.baseline = to_double(value);

        // Fallback policy
        else if (key == "fallback.price") cfg.market.fallback.price = to_double(value);
        else if (key == "fallback.change") cfg.market.fallback.change = to_double(value);
        else if (key == "fallback.change_percent") cfg.market.fallback.change_percent = to_double(value);
        else if (key == "fallback.label") cfg.market.fallback.label = value;
        else if (key == "fallback.validity_window_seconds") cfg.market.fallback.validity_window_seconds = to_int(value);

        // Timing
        else if (key == "timing.market_open_staleness_threshold_sec") cfg.timing.market_open_staleness_threshold_sec = to_int(value);
        else if (key == "timing.market_closed_staleness_threshold_sec") cfg.timing.market_closed_staleness_threshold_sec = to_int(value);
        else if (key == "timing.updater_market_open_interval_sec") cfg.timing.updater_market_open_interval_sec = to_int(value);
        else if (key == "timing.updater_market_closed_interval_sec") cfg.timing.updater_market_closed_interval_sec = to_int(value);
        else if (key == "timing.updater_error_backoff_sec") cfg.timing.updater_error_backoff_sec = to_int(value);
        else if (key == "timing.refresh_pool_worker_count") cfg.timing.refresh_pool_worker_count = to_int(value);
        else if (key == "timing.refresh_pool_queue_capacity") cfg.timing.refresh_pool_queue_capacity = to_int(value);
        else if (key == "timing.connectivity_degraded_threshold") cfg.timing.connectivity_degraded_threshold = to_int(value);
        else if (key == "timing.connectivity_disconnected_threshold") cfg.timing.connectivity_disconnected_threshold = to_int(value);
        else if (key == "timing.thread_logging_poll_interval_sec") cfg.timing.thread_logging_poll_interval_sec = to_int(value);
        else if (key == "timing.thread_startup_sequence_delay_milliseconds") cfg.timing.thread_startup_sequence_delay_milliseconds = to_int(value);
        else if (key == "timing.thread_status_logging_interval_sec") cfg.timing.thread_status_logging_interval_sec = to_int(value);

        // Logging
        else if (key == "logging.log_file") cfg.logging.log_file = value;

        // Read endpoint
        else if (key == "server.bind_address") cfg.server.bind_address = value;
        else if (key == "server.port") cfg.server.port = to_int(value);
        else if (key == "server.cors_allowed_origin") cfg.server.cors_allowed_origin = value;
        else if (key == "server.accept_poll_interval_milliseconds") cfg.server.accept_poll_interval_milliseconds = to_int(value);
        else if (key == "server.session_timeout_seconds") cfg.server.session_timeout_seconds = to_int(value);
        else if (key == "server.max_concurrent_sessions") cfg.server.max_concurrent_sessions = to_int(value);

        else return false;
        return true;
    }

}

bool load_config_from_csv(FtseTracker::Config::SystemConfig& cfg, const std::string& csv_path) {
    std::ifstream config_file_stream(csv_path);
    if (!config_file_stream.is_open()) {
        log_message("ERROR: Could not open config file: " + csv_path, "");
        return false;
    }

    std::string config_line_string;
    int line_number = 0;
    while (std::getline(config_file_stream, config_line_string)) {
        ++line_number;
        config_line_string = trim(config_line_string);
        if (config_line_string.empty() || config_line_string[0] == '#') continue;

        std::stringstream config_line_stream(config_line_string);
        std::string config_key_string, config_value_string;
        if (!std::getline(config_line_stream, config_key_string, ',') ||
            !std::getline(config_line_stream, config_value_string)) {
            log_message("CRITICAL: Malformed config line " + csv_path + ":" + std::to_string(line_number) + ": " + config_line_string, "");
            return false;
        }
        config_key_string = trim(config_key_string);
        config_value_string = trim(config_value_string);

        try {
            if (!apply_config_value(cfg, config_key_string, config_value_string)) {
                log_message("WARNING: Unknown config key ignored: " + config_key_string + " (" + csv_path + ")", "");
            }
        } catch (const std::exception& line_exception_error) {
            // Fail hard on values that do not parse
            log_message("CRITICAL: Error parsing config line " + csv_path + ":" + std::to_string(line_number) +
                        ": " + config_line_string + " - " + std::string(line_exception_error.what()), "");
            return false;
        }
    }
    return true;
}

bool apply_environment_overrides(FtseTracker::Config::SystemConfig& config, std::string& error_message) {
    const char* port_value = std::getenv("PORT");
    if (!port_value || std::string(port_value).empty()) {
        return true;
    }
    try {
        config.server.port = to_int(trim(port_value));
    } catch (const std::exception&) {
        error_message = "Invalid PORT environment variable: '" + std::string(port_value) + "'";
        return false;
    }
    return true;
}

int load_system_config(FtseTracker::Config::SystemConfig& config, const std::string& config_directory) {
    // Load configuration from separate logical files
    std::vector<std::string> config_files = {
        config_directory + "/source_config.csv",
        config_directory + "/market_config.csv",
        config_directory + "/timing_config.csv",
        config_directory + "/logging_config.csv",
        config_directory + "/server_config.csv"
    };

    for (const auto& config_path : config_files) {
        if (!load_config_from_csv(config, config_path)) {
            log_message("ERROR: Failed to load config CSV from " + config_path, "");
            return 1;
        }
    }

    std::string override_error;
    if (!apply_environment_overrides(config, override_error)) {
        log_message("ERROR: " + override_error, "");
        return 1;
    }

    // Validate configuration completeness
    std::string validation_error;
    if (!validate_config(config, validation_error)) {
        log_message("ERROR: Configuration validation failed: " + validation_error, "");
        return 1;
    }

    return 0;
}

bool validate_config(const FtseTracker::Config::SystemConfig& config, std::string& error_message) {
    // Upstream source
    if (config.source.url.empty()) {
        error_message = "source.url cannot be empty";
        return false;
    }
    if (config.source.timeout_seconds <= 0) {
        error_message = "source.timeout_seconds must be > 0";
        return false;
    }
    if (config.source.index_code.empty()) {
        error_message = "index.code cannot be empty";
        return false;
    }

    // Markup names drive every query against the page
    const MarkupConfig& markup = config.source.markup;
    if (markup.region_tag.empty() || markup.region_class.empty()) {
        error_message = "markup.region_tag and markup.region_class cannot be empty";
        return false;
    }
    if (markup.price_element_id.empty() || markup.change_element_id.empty() || markup.percent_element_id.empty()) {
        error_message = "markup element ids cannot be empty";
        return false;
    }
    if (markup.up_class.empty() || markup.down_class.empty() || markup.up_class == markup.down_class) {
        error_message = "markup.up_class and markup.down_class must be non-empty and distinct";
        return false;
    }
    if (markup.up_glyph.empty() || markup.down_glyph.empty()) {
        error_message = "markup.up_glyph and markup.down_glyph cannot be empty";
        return false;
    }

    // Market session
    try {
        FtseTracker::Core::MarketClock::resolve_time_zone(config.market.session.time_zone_name);
    } catch (const std::exception& zone_exception_error) {
        error_message = "session.timezone: " + std::string(zone_exception_error.what());
        return false;
    }
    if (config.market.session.open_seconds_of_day >= config.market.session.close_seconds_of_day) {
        error_message = "session.open_time must be before session.close_time";
        return false;
    }
    if (config.market.derived.coefficient <= 0.0) {
        error_message = "derived.coefficient must be > 0";
        return false;
    }
    if (config.market.fallback.validity_window_seconds <= 0) {
        error_message = "fallback.validity_window_seconds must be > 0";
        return false;
    }
    if (config.market.fallback.label.empty() || config.source.live_label.empty()) {
        error_message = "fallback.label and source.live_label cannot be empty";
        return false;
    }

    // Timing
    const TimingConfig& timing = config.timing;
    if (timing.market_open_staleness_threshold_sec <= 0 || timing.market_closed_staleness_threshold_sec <= 0) {
        error_message = "staleness thresholds must be > 0";
        return false;
    }
    if (timing.updater_market_open_interval_sec <= 0 || timing.updater_market_closed_interval_sec <= 0) {
        error_message = "updater intervals must be > 0";
        return false;
    }
    if (timing.updater_error_backoff_sec <= 0) {
        error_message = "timing.updater_error_backoff_sec must be > 0";
        return false;
    }
    if (timing.refresh_pool_worker_count <= 0 || timing.refresh_pool_queue_capacity <= 0) {
        error_message = "refresh pool worker count and queue capacity must be > 0";
        return false;
    }
    if (timing.connectivity_degraded_threshold <= 0 ||
        timing.connectivity_disconnected_threshold <= timing.connectivity_degraded_threshold) {
        error_message = "connectivity thresholds must satisfy 0 < degraded < disconnected";
        return false;
    }
    if (timing.thread_logging_poll_interval_sec <= 0) {
        error_message = "timing.thread_logging_poll_interval_sec must be > 0";
        return false;
    }
    if (timing.thread_startup_sequence_delay_milliseconds < 0) {
        error_message = "timing.thread_startup_sequence_delay_milliseconds must be >= 0";
        return false;
    }
    if (timing.thread_status_logging_interval_sec < 0) {
        error_message = "timing.thread_status_logging_interval_sec must be >= 0";
        return false;
    }

    // Logging
    if (config.logging.log_file.empty()) {
        error_message = "logging.log_file cannot be empty";
        return false;
    }

    // Read endpoint
    if (config.server.port <= 0 || config.server.port > 65535) {
        error_message = "server.port must be within 1-65535";
        return false;
    }
    if (config.server.bind_address.empty()) {
        error_message = "server.bind_address cannot be empty";
        return false;
    }
    if (config.server.accept_poll_interval_milliseconds <= 0) {
        error_message = "server.accept_poll_interval_milliseconds must be > 0";
        return false;
    }
    if (config.server.session_timeout_seconds <= 0) {
        error_message = "server.session_timeout_seconds must be > 0";
        return false;
    }
    if (config.server.max_concurrent_sessions <= 0) {
        error_message = "server.max_concurrent_sessions must be > 0";
        return false;
    }

    return true;
}
