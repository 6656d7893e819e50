#ifndef SYSTEM_THREADS_HPP
#define SYSTEM_THREADS_HPP

#include <thread>
#include <atomic>
#include <chrono>

/**
 * @brief System thread handles and performance monitoring
 *
 * Lives inside SystemState for the whole run: the thread bodies hold
 * references to the iteration counters, so the struct is never moved.
 */
struct SystemThreads {
    // =========================================================================
    // THREAD HANDLES
    // =========================================================================
    std::thread updater_thread;   // Background snapshot updater
    std::thread server_thread;    // HTTP read endpoint
    std::thread logger_thread;    // Logging system thread

    // =========================================================================
    // PERFORMANCE MONITORING
    // =========================================================================
    std::chrono::steady_clock::time_point start_time;  // System startup timestamp

    std::atomic<unsigned long> updater_iterations{0};  // Completed updater cycles
    std::atomic<unsigned long> logger_iterations{0};   // Logger thread iteration count

    SystemThreads() : start_time(std::chrono::steady_clock::now()) {}

    SystemThreads(const SystemThreads&) = delete;
    SystemThreads& operator=(const SystemThreads&) = delete;
};

#endif // SYSTEM_THREADS_HPP
