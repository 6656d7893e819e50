#ifndef SYSTEM_MODULES_HPP
#define SYSTEM_MODULES_HPP

#include <memory>
#include "api/http/snapshot_http_server.hpp"
#include "api/page/http_page_source.hpp"
#include "threads/refresh_task_pool.hpp"
#include "threads/system_threads/background_updater_thread.hpp"
#include "threads/system_threads/logging_thread.hpp"
#include "tracker/coordinators/snapshot_coordinator.hpp"
#include "tracker/snapshot/snapshot_store.hpp"
#include "utils/time_provider.hpp"

/**
 * @brief Runtime module container
 *
 * Holds active system modules as smart pointers for centralized ownership.
 * Declaration order is construction order; references only point upwards.
 */
struct SystemModules {
    // =========================================================================
    // CORE TRACKER COMPONENTS
    // =========================================================================
    std::unique_ptr<SystemTimeProvider> time_provider;                              // Wall clock
    std::unique_ptr<FtseTracker::Core::SnapshotStore> snapshot_store;               // Current snapshot owner
    std::unique_ptr<FtseTracker::API::HttpPageSource> page_source;                  // Upstream page fetcher
    std::unique_ptr<FtseTracker::Core::SnapshotCoordinator> snapshot_coordinator;   // Refresh, fallback and read policy
    std::unique_ptr<FtseTracker::Threads::RefreshTaskPool> refresh_task_pool;       // Reader-triggered refreshes

    // =========================================================================
    // SERVING
    // =========================================================================
    std::unique_ptr<FtseTracker::API::SnapshotHttpServer> http_server;              // Read endpoint

    // =========================================================================
    // THREADING COMPONENTS
    // =========================================================================
    std::unique_ptr<FtseTracker::Threads::BackgroundUpdaterThread> background_updater_thread;  // Periodic refresh loop
    std::unique_ptr<FtseTracker::Threads::LoggingThread> logging_thread;                      // System logging thread
};

#endif // SYSTEM_MODULES_HPP
