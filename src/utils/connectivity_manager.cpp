#include "connectivity_manager.hpp"
#include <stdexcept>

ConnectivityManager::ConnectivityManager(const TimingConfig& timing_config)
    : degraded_threshold(timing_config.connectivity_degraded_threshold),
      disconnected_threshold(timing_config.connectivity_disconnected_threshold) {
    if (degraded_threshold <= 0 || disconnected_threshold <= degraded_threshold) {
        throw std::runtime_error("Connectivity thresholds must satisfy 0 < degraded < disconnected (got " +
                                 std::to_string(degraded_threshold) + ", " + std::to_string(disconnected_threshold) + ")");
    }
}

void ConnectivityManager::report_success() {
    std::lock_guard<std::mutex> lock(state_mutex);
    ++state.total_successes;
    state.consecutive_failures = 0;
    state.last_error_message.clear();
    state.status = ConnectionStatus::CONNECTED;
}

void ConnectivityManager::report_failure(const std::string& error_message) {
    std::lock_guard<std::mutex> lock(state_mutex);
    ++state.total_failures;
    ++state.consecutive_failures;
    state.last_error_message = error_message;
    state.status = status_for_streak(state.consecutive_failures);
}

ConnectivityManager::ConnectionStatus ConnectivityManager::status_for_streak(int failure_streak) const {
    if (failure_streak >= disconnected_threshold) {
        return ConnectionStatus::DISCONNECTED;
    }
    return failure_streak >= degraded_threshold ? ConnectionStatus::DEGRADED : ConnectionStatus::CONNECTED;
}

ConnectivityManager::ConnectionStatus ConnectivityManager::get_status() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state.status;
}

ConnectivityManager::ConnectivityState ConnectivityManager::get_state() const {
    std::lock_guard<std::mutex> lock(state_mutex);
    return state;
}

std::string ConnectivityManager::get_status_string() const {
    return to_string(get_status());
}

const char* ConnectivityManager::to_string(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED:
            return "CONNECTED";
        case ConnectionStatus::DEGRADED:
            return "DEGRADED";
        case ConnectionStatus::DISCONNECTED:
            return "DISCONNECTED";
    }
    return "UNKNOWN";
}
