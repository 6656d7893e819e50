#ifndef CONNECTIVITY_MANAGER_HPP
#define CONNECTIVITY_MANAGER_HPP

#include <mutex>
#include <string>
#include "configs/timing_config.hpp"

/**
 * ConnectivityManager - outcome record of upstream page fetches.
 *
 * Feeds the health endpoint and the logs. Refresh attempts are never gated
 * or delayed on its status.
 */
class ConnectivityManager {
public:
    enum class ConnectionStatus {
        CONNECTED,          // Last fetch succeeded
        DEGRADED,           // Failure streak at or past the degraded threshold
        DISCONNECTED        // Failure streak at or past the disconnected threshold
    };

    struct ConnectivityState {
        ConnectionStatus status = ConnectionStatus::CONNECTED;
        int consecutive_failures = 0;
        long long total_successes = 0;
        long long total_failures = 0;
        std::string last_error_message;     // Cleared by the next success
    };

    explicit ConnectivityManager(const TimingConfig& timing_config);

    ConnectivityManager(const ConnectivityManager&) = delete;
    ConnectivityManager& operator=(const ConnectivityManager&) = delete;

    void report_success();
    void report_failure(const std::string& error_message);

    ConnectionStatus get_status() const;
    ConnectivityState get_state() const;
    std::string get_status_string() const;

    static const char* to_string(ConnectionStatus status);

private:
    const int degraded_threshold;
    const int disconnected_threshold;
    mutable std::mutex state_mutex;
    ConnectivityState state;

    ConnectionStatus status_for_streak(int failure_streak) const;
};

#endif // CONNECTIVITY_MANAGER_HPP
