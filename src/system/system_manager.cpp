#include "system_manager.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <thread>
#include <curl/curl.h>
#include "system/system_modules.hpp"
#include "system/system_state.hpp"
#include "system/system_threads.hpp"
#include "configs/system_config.hpp"
#include "logging/logs/server_logs.hpp"
#include "logging/logs/snapshot_logs.hpp"
#include "logging/logs/startup_logs.hpp"
#include "logging/logs/system_logs.hpp"
#include "logging/logger/async_logger.hpp"
#include "tracker/config_loader/config_loader.hpp"
#include "tracker/data_structures/data_structures.hpp"

using namespace FtseTracker::Logging;
using namespace FtseTracker::Threads;

namespace FtseTracker {
namespace System {

// Logger, updater and server; pool workers are counted by the pool
constexpr int TRACKER_THREAD_COUNT = 3;

SystemInitializationResult initialize(const std::string& config_directory) {
    SystemInitializationResult initialization_result;

    // Minimal logging context, required before any logging call. Worker
    // threads find it through the process-wide pointer.
    auto early_logging_context = std::make_shared<FtseTracker::Logging::LoggingContext>();
    FtseTracker::Logging::set_logging_context(*early_logging_context);
    FtseTracker::Logging::set_process_logging_context(early_logging_context.get());

    try {
        FtseTracker::Config::SystemConfig initial_config;
        int config_load_result = load_system_config(initial_config, config_directory);
        if (config_load_result != 0) {
            SystemLogs::log_fatal_error(std::string("Config load failed with result: ") + std::to_string(config_load_result));
            throw std::runtime_error("System initialization failed: configuration loading failed");
        }

        initialization_result.system_state = std::make_unique<SystemState>(initial_config);
        initialization_result.system_state->logging_context = early_logging_context;

        // Validates again, creates the run folder and the async logger
        initialization_result.logger = FtseTracker::Logging::initialize_application_foundation(initialization_result.system_state->config);
        SystemLogs::log_configuration_validated(true);

        CURLcode curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (curl_init_result != CURLE_OK) {
            throw std::runtime_error(std::string("libcurl initialization failed: ") + curl_easy_strerror(curl_init_result));
        }
    } catch (const std::exception& exception_error) {
        SystemLogs::log_fatal_error(std::string("System initialization exception: ") + exception_error.what());
        FtseTracker::Logging::clear_logging_context();
        throw;
    }

    return initialization_result;
}

static void create_tracker_modules(SystemState& state, std::shared_ptr<FtseTracker::Logging::AsyncLogger> logger) {
    auto modules = std::make_unique<SystemModules>();
    const auto& config = state.config;

    modules->time_provider = std::make_unique<SystemTimeProvider>();
    modules->snapshot_store = std::make_unique<FtseTracker::Core::SnapshotStore>();
    modules->page_source = std::make_unique<FtseTracker::API::HttpPageSource>(
        config.source, state.connectivity_manager, *modules->time_provider);
    modules->snapshot_coordinator = std::make_unique<FtseTracker::Core::SnapshotCoordinator>(
        config, *modules->snapshot_store, *modules->page_source, *modules->time_provider);
    modules->refresh_task_pool = std::make_unique<FtseTracker::Threads::RefreshTaskPool>(
        config.timing.refresh_pool_worker_count, config.timing.refresh_pool_queue_capacity);
    modules->http_server = std::make_unique<FtseTracker::API::SnapshotHttpServer>(
        config.server, *modules->snapshot_coordinator, state.connectivity_manager,
        *modules->time_provider, state.running);

    FtseTracker::Core::SnapshotCoordinator* coordinator = modules->snapshot_coordinator.get();
    modules->background_updater_thread = std::make_unique<FtseTracker::Threads::BackgroundUpdaterThread>(
        config.timing,
        [coordinator]() { return coordinator->is_market_open(); },
        [coordinator]() { return coordinator->refresh(); },
        state.mtx, state.cv, state.running);
    modules->background_updater_thread->set_iteration_counter(state.threads.updater_iterations);

    modules->logging_thread = std::make_unique<FtseTracker::Threads::LoggingThread>(
        logger, state.threads.logger_iterations, config.timing);

    state.tracker_modules = std::move(modules);
}

static void pause_between_thread_starts(const SystemState& state) {
    std::this_thread::sleep_for(std::chrono::milliseconds(state.config.timing.thread_startup_sequence_delay_milliseconds));
}

static void run_http_server(SystemState& state) {
    try {
        state.tracker_modules->http_server->run();
    } catch (const std::exception& exception_error) {
        // Bind or listen failure: nothing left to serve, stop the process
        ServerLogs::log_server_exception(exception_error.what());
        request_shutdown(state);
    }
}

void startup(SystemState& system_state, std::shared_ptr<FtseTracker::Logging::AsyncLogger> logger) {
    if (!logger) {
        throw std::runtime_error("System startup failed: Logger is required but not provided");
    }
    if (!system_state.logging_context) {
        throw std::runtime_error("Logging context not initialized - system must fail without context");
    }

    create_tracker_modules(system_state, logger);
    SystemModules& modules = *system_state.tracker_modules;

    StartupLogs::log_application_header();
    StartupLogs::log_source_configuration(system_state.config);
    StartupLogs::log_session_configuration(system_state.config);
    StartupLogs::log_refresh_configuration(system_state.config);
    StartupLogs::log_server_configuration(system_state.config);

    int started_thread_count = 0;
    try {
        system_state.threads.logger_thread = std::thread(std::ref(*modules.logging_thread));
        ++started_thread_count;
        pause_between_thread_starts(system_state);

        modules.refresh_task_pool->start();
        modules.snapshot_coordinator->set_refresh_task_pool(modules.refresh_task_pool.get());

        // The first snapshot is fetched before anything can read. A failure
        // here still leaves the default snapshot in the store.
        FtseTracker::Core::RefreshOutcome initial_outcome = modules.snapshot_coordinator->refresh();
        std::optional<FtseTracker::Core::Snapshot> initial_snapshot = modules.snapshot_store->read_snapshot();
        if (initial_snapshot) {
            SnapshotLogs::log_initial_snapshot(*initial_snapshot, initial_outcome);
        }

        system_state.threads.updater_thread = std::thread(std::ref(*modules.background_updater_thread));
        ++started_thread_count;
        pause_between_thread_starts(system_state);

        system_state.threads.server_thread = std::thread(run_http_server, std::ref(system_state));
        ++started_thread_count;
    } catch (const std::exception& exception_error) {
        SystemLogs::log_thread_startup_error(exception_error.what());
        throw;
    }

    SystemLogs::log_threads_started(TRACKER_THREAD_COUNT, started_thread_count);
    SystemLogs::log_startup_complete();
}

void request_shutdown(SystemState& system_state) {
    {
        std::lock_guard<std::mutex> lock(system_state.mtx);
        system_state.shutdown_requested.store(true);
    }
    system_state.cv.notify_all();
}

static void log_thread_status(const SystemState& state) {
    const SystemModules* modules = state.tracker_modules.get();
    unsigned long refresh_completed = modules && modules->refresh_task_pool ? modules->refresh_task_pool->get_completed_count() : 0;
    unsigned long requests_served = modules && modules->http_server ? modules->http_server->get_requests_served() : 0;
    SystemLogs::log_thread_status_table(state.threads.updater_iterations.load(), refresh_completed,
                                        requests_served, state.threads.logger_iterations.load());
}

static void run_until_shutdown(SystemState& state) {
    // The signal handler only flips atomics, so the wait polls once a second
    const std::chrono::seconds poll_interval(1);
    const int status_interval_seconds = state.config.timing.thread_status_logging_interval_sec;
    auto last_status_time = std::chrono::steady_clock::now();

    while (state.running.load() && !state.shutdown_requested.load()) {
        try {
            {
                std::unique_lock<std::mutex> lock(state.mtx);
                state.cv.wait_for(lock, poll_interval, [&state] {
                    return state.shutdown_requested.load() || !state.running.load();
                });
            }

            auto now = std::chrono::steady_clock::now();
            if (status_interval_seconds > 0 &&
                std::chrono::duration_cast<std::chrono::seconds>(now - last_status_time).count() >= status_interval_seconds) {
                log_thread_status(state);
                last_status_time = now;
            }
        } catch (const std::exception& exception_error) {
            SystemLogs::log_main_loop_error(exception_error.what());
        }
    }

    int signal_number = state.shutdown_signal.load();
    if (signal_number != 0) {
        SystemLogs::log_shutdown_requested(signal_number);
    }
}

void run(SystemState& system_state) {
    run_until_shutdown(system_state);
}

static void join_if_running(std::thread& thread_handle) {
    if (thread_handle.joinable()) {
        thread_handle.join();
    }
}

void shutdown(SystemState& system_state, std::shared_ptr<FtseTracker::Logging::AsyncLogger> logger) {
    try {
        // Signal all threads to stop
        {
            std::lock_guard<std::mutex> lock(system_state.mtx);
            system_state.running.store(false);
            system_state.shutdown_requested.store(true);
        }
        system_state.cv.notify_all();

        join_if_running(system_state.threads.server_thread);
        join_if_running(system_state.threads.updater_thread);

        if (system_state.tracker_modules) {
            SystemModules& modules = *system_state.tracker_modules;
            if (modules.snapshot_coordinator) {
                modules.snapshot_coordinator->set_refresh_task_pool(nullptr);
            }
            if (modules.refresh_task_pool) {
                modules.refresh_task_pool->stop();
            }
        }

        log_thread_status(system_state);
        SystemLogs::log_shutdown_complete();

        // Logger last so the lines above still reach the file
        if (logger) {
            FtseTracker::Logging::shutdown_global_logger(*logger);
        }
        join_if_running(system_state.threads.logger_thread);
        if (system_state.logging_context) {
            system_state.logging_context->async_logger.reset();
        }

        curl_global_cleanup();
    } catch (const std::exception& shutdown_exception_error) {
        SystemLogs::log_system_shutdown_error("Exception in shutdown: " + std::string(shutdown_exception_error.what()));
    }
}

} // namespace System
} // namespace FtseTracker
