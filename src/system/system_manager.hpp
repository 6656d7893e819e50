#ifndef SYSTEM_MANAGER_HPP
#define SYSTEM_MANAGER_HPP

#include <memory>
#include <string>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "logging/logger/async_logger.hpp"

namespace FtseTracker {
namespace System {

struct SystemInitializationResult {
    std::unique_ptr<SystemState> system_state;
    std::shared_ptr<FtseTracker::Logging::AsyncLogger> logger;

    SystemInitializationResult() = default;
    SystemInitializationResult(SystemInitializationResult&&) = default;
    SystemInitializationResult& operator=(SystemInitializationResult&&) = default;

    SystemInitializationResult(const SystemInitializationResult&) = delete;
    SystemInitializationResult& operator=(const SystemInitializationResult&) = delete;
};

// System initialization - configuration, logging foundation, libcurl
SystemInitializationResult initialize(const std::string& config_directory = "config");

// System lifecycle management
void startup(SystemState& system_state, std::shared_ptr<FtseTracker::Logging::AsyncLogger> logger);
void run(SystemState& system_state);
void shutdown(SystemState& system_state, std::shared_ptr<FtseTracker::Logging::AsyncLogger> logger);

// Wakes run() from any thread
void request_shutdown(SystemState& system_state);

} // namespace System
} // namespace FtseTracker

#endif // SYSTEM_MANAGER_HPP
