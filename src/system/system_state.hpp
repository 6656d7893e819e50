#ifndef SYSTEM_STATE_HPP
#define SYSTEM_STATE_HPP

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include "system/system_modules.hpp"
#include "system/system_threads.hpp"
#include "configs/system_config.hpp"
#include "logging/logger/async_logger.hpp"
#include "utils/connectivity_manager.hpp"

/**
 * @brief Central system state container
 *
 * Configuration, module ownership and the shutdown synchronization shared
 * by the main loop and the background updater.
 */
struct SystemState {
    // =========================================================================
    // THREAD SYNCHRONIZATION
    // =========================================================================
    std::mutex mtx;                    // Guards the shutdown condition
    std::condition_variable cv;        // Wakes sleeping loops on shutdown

    // =========================================================================
    // SYSTEM CONTROL FLAGS
    // =========================================================================
    std::atomic<bool> running{true};              // Main system running flag
    std::atomic<bool> shutdown_requested{false};  // Set by the signal handler or a failed server
    std::atomic<int> shutdown_signal{0};          // Signal that requested shutdown, 0 if none

    // =========================================================================
    // CONFIGURATION AND MODULES
    // =========================================================================
    FtseTracker::Config::SystemConfig config;                                // Complete system configuration
    ConnectivityManager connectivity_manager;                                // Upstream connectivity state
    std::unique_ptr<SystemModules> tracker_modules;                          // All system modules
    SystemThreads threads;                                                   // Thread handles and counters
    std::shared_ptr<FtseTracker::Logging::LoggingContext> logging_context;   // Logging context

    explicit SystemState(const FtseTracker::Config::SystemConfig& initial)
        : config(initial), connectivity_manager(config.timing) {}
};

#endif // SYSTEM_STATE_HPP
