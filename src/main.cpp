// main.cpp
#include "system/system_manager.hpp"
#include "logging/logs/system_logs.hpp"
#include <iostream>
#include <csignal>
#include <atomic>
#include <memory>

using namespace FtseTracker::System;

// =============================================================================
// ENCAPSULATED SHUTDOWN HANDLER - NO GLOBAL VARIABLES
// =============================================================================
class ShutdownHandler {
private:
    std::atomic<bool> shutdown_requested_flag{false};
    std::atomic<SystemState*> system_state_pointer{nullptr};

public:
    static ShutdownHandler& get_instance() {
        static ShutdownHandler instance;
        return instance;
    }

    void set_system_state(SystemState* state) {
        system_state_pointer.store(state);
    }

    bool is_shutdown_requested() const {
        return shutdown_requested_flag.load();
    }

    // Only lock-free atomic stores here; the main loop polls the flags
    void signal_handler(int signal_number) {
        if (signal_number == SIGINT || signal_number == SIGTERM) {
            shutdown_requested_flag.store(true);
            SystemState* state = system_state_pointer.load();
            if (state) {
                state->shutdown_signal.store(signal_number);
                state->shutdown_requested.store(true);
            }
        }
    }

private:
    ShutdownHandler() = default;
    ShutdownHandler(const ShutdownHandler&) = delete;
    ShutdownHandler& operator=(const ShutdownHandler&) = delete;
};

// =============================================================================
// STATIC SIGNAL HANDLER FUNCTION
// =============================================================================
static void signal_handler(int signal_number) {
    ShutdownHandler::get_instance().signal_handler(signal_number);
}

// =============================================================================
// MAIN APPLICATION ENTRY POINT
// =============================================================================

int main() {
    // Register signal handlers for graceful shutdown
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // Initialize system - config loading, validation, logging foundation
    SystemInitializationResult initialization_result;
    try {
        initialization_result = initialize();
    } catch (const std::exception& exception_error) {
        std::cerr << "Fatal error: " << exception_error.what() << std::endl;
        return 1;
    }

    SystemState& system_state = *initialization_result.system_state;
    ShutdownHandler::get_instance().set_system_state(&system_state);
    if (ShutdownHandler::get_instance().is_shutdown_requested()) {
        system_state.shutdown_requested.store(true);
    }

    int exit_code = 0;
    try {
        // First snapshot, updater, refresh pool and read endpoint
        startup(system_state, initialization_result.logger);

        // Run until shutdown signal
        run(system_state);
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(exception_error.what());
        exit_code = 1;
    }

    // Joins whatever was started, also after a failed startup
    shutdown(system_state, initialization_result.logger);
    ShutdownHandler::get_instance().set_system_state(nullptr);

    return exit_code;
}
