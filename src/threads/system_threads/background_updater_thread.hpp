#ifndef BACKGROUND_UPDATER_THREAD_HPP
#define BACKGROUND_UPDATER_THREAD_HPP

#include "configs/timing_config.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <utility>

namespace FtseTracker {
namespace Threads {

/**
 * Supervised refresh loop: sleep an interval chosen by market state, then
 * refresh. A fault escaping the refresh is logged and followed by a fixed
 * backoff. The loop only ends when running is cleared; the sleep wakes on
 * the shutdown condition variable.
 */
struct BackgroundUpdaterThread {
    using MarketStateQuery = std::function<bool()>;
    using RefreshAttempt = std::function<Core::RefreshOutcome()>;

    const TimingConfig& timing;
    MarketStateQuery market_state_query;
    RefreshAttempt refresh_attempt;
    std::mutex& shutdown_mutex;
    std::condition_variable& shutdown_cv;
    std::atomic<bool>& running;
    std::atomic<unsigned long>* iteration_counter {nullptr};

    BackgroundUpdaterThread(const TimingConfig& timing_config,
                            MarketStateQuery market_query,
                            RefreshAttempt attempt,
                            std::mutex& mtx,
                            std::condition_variable& cv,
                            std::atomic<bool>& running_flag)
        : timing(timing_config), market_state_query(std::move(market_query)), refresh_attempt(std::move(attempt)),
          shutdown_mutex(mtx), shutdown_cv(cv), running(running_flag) {}

    // Set iteration counter for monitoring
    void set_iteration_counter(std::atomic<unsigned long>& counter) { iteration_counter = &counter; }

    // Thread entrypoint
    void operator()();

    // One sleep-then-refresh cycle. Returns false when shutdown interrupted the sleep.
    bool run_cycle();

    int get_update_interval_seconds(bool market_open) const;

private:
    // Returns false when shutdown was requested during the wait
    bool wait_for(int seconds);
};

} // namespace Threads
} // namespace FtseTracker

#endif // BACKGROUND_UPDATER_THREAD_HPP
