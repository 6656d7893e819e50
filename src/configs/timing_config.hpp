// TimingConfig.hpp
#ifndef TIMING_CONFIG_HPP
#define TIMING_CONFIG_HPP

struct TimingConfig {
    // ========================================================================
    // READ PATH STALENESS
    // ========================================================================

    int market_open_staleness_threshold_sec = 20;           // Refresh trigger while the market is open
    int market_closed_staleness_threshold_sec = 300;        // Refresh trigger while the market is closed

    // ========================================================================
    // BACKGROUND UPDATER
    // ========================================================================

    int updater_market_open_interval_sec = 10;              // Updater sleep while the market is open
    int updater_market_closed_interval_sec = 60;            // Updater sleep while the market is closed
    int updater_error_backoff_sec = 5;                      // Pause after a fault escapes a refresh attempt

    // ========================================================================
    // REFRESH TASK POOL
    // ========================================================================

    int refresh_pool_worker_count = 2;                      // Workers running reader-triggered refreshes
    int refresh_pool_queue_capacity = 4;                    // Pending refreshes kept before dropping

    // ========================================================================
    // CONNECTIVITY TRACKING
    // ========================================================================

    int connectivity_degraded_threshold = 1;                // Consecutive failures before DEGRADED
    int connectivity_disconnected_threshold = 3;            // Consecutive failures before DISCONNECTED

    // ========================================================================
    // THREAD LIFECYCLE MANAGEMENT
    // ========================================================================

    int thread_logging_poll_interval_sec = 1;               // Logging thread flush interval in seconds
    int thread_startup_sequence_delay_milliseconds = 100;   // Delay before a thread enters its loop
    int thread_status_logging_interval_sec = 300;           // Main loop thread status table; 0 disables
};

#endif // TIMING_CONFIG_HPP
