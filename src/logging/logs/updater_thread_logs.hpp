#ifndef UPDATER_THREAD_LOGS_HPP
#define UPDATER_THREAD_LOGS_HPP

#include "configs/timing_config.hpp"
#include "tracker/data_structures/data_structures.hpp"
#include <string>

namespace FtseTracker {
namespace Logging {

class UpdaterThreadLogs {
public:
    // Thread lifecycle logging
    static void log_thread_startup(const TimingConfig& timing);
    static void log_thread_exception(const std::string& error_message);
    static void log_thread_exited(unsigned long iterations);

    // Loop logging
    static void log_cycle(bool market_open, int interval_seconds, Core::RefreshOutcome outcome);
    static void log_cycle_exception(const std::string& error_message, int backoff_seconds);
};

} // namespace Logging
} // namespace FtseTracker

#endif // UPDATER_THREAD_LOGS_HPP
