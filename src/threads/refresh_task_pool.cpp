/**
 * Refresh task pool.
 * Runs the refreshes requested by readers who found the snapshot stale.
 */
#include "refresh_task_pool.hpp"
#include "logging/logger/async_logger.hpp"
#include "logging/logs/snapshot_logs.hpp"
#include <stdexcept>
#include <utility>

using namespace FtseTracker::Threads;
using namespace FtseTracker::Logging;

RefreshTaskPool::RefreshTaskPool(int worker_count_value, int queue_capacity_value)
    : worker_count(worker_count_value),
      queue_capacity(queue_capacity_value > 0 ? static_cast<size_t>(queue_capacity_value) : 0) {
    if (worker_count_value <= 0) {
        throw std::invalid_argument("refresh_pool_worker_count must be greater than 0");
    }
    if (queue_capacity_value <= 0) {
        throw std::invalid_argument("refresh_pool_queue_capacity must be greater than 0");
    }
}

RefreshTaskPool::~RefreshTaskPool() {
    stop();
}

void RefreshTaskPool::start() {
    std::lock_guard<std::mutex> lock(queue_mutex);
    if (running.load()) {
        return;
    }
    running.store(true);
    workers.reserve(static_cast<size_t>(worker_count));
    for (int worker_index = 0; worker_index < worker_count; ++worker_index) {
        workers.emplace_back(&RefreshTaskPool::worker_loop, this);
    }
}

bool RefreshTaskPool::submit(Task task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (!running.load() || pending_tasks.size() >= queue_capacity) {
            dropped_tasks.fetch_add(1);
            SnapshotLogs::log_refresh_submission_dropped(pending_tasks.size(), queue_capacity, running.load());
            return false;
        }
        pending_tasks.push_back(std::move(task));
    }
    queue_cv.notify_one();
    return true;
}

void RefreshTaskPool::stop() {
    std::vector<std::thread> workers_to_join;
    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        running.store(false);
        pending_tasks.clear();
        workers_to_join.swap(workers);
    }
    queue_cv.notify_all();
    for (std::thread& worker : workers_to_join) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

size_t RefreshTaskPool::get_pending_count() const {
    std::lock_guard<std::mutex> lock(queue_mutex);
    return pending_tasks.size();
}

void RefreshTaskPool::worker_loop() {
    set_log_thread_tag("REFRSH");

    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_cv.wait(lock, [this]{ return !pending_tasks.empty() || !running.load(); });
            if (!running.load()) {
                return;
            }
            task = std::move(pending_tasks.front());
            pending_tasks.pop_front();
        }

        try {
            task();
        } catch (const std::exception& exception_error) {
            SnapshotLogs::log_refresh_worker_exception(exception_error.what());
        } catch (...) {
            SnapshotLogs::log_refresh_worker_exception("Unknown exception");
        }
        completed_tasks.fetch_add(1);
    }
}
