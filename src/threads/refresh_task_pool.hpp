#ifndef REFRESH_TASK_POOL_HPP
#define REFRESH_TASK_POOL_HPP

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace FtseTracker {
namespace Threads {

/**
 * Fixed set of workers draining a bounded queue of fire-and-forget tasks.
 * A submission to a full queue is dropped: a refresh that cannot start soon
 * would be superseded by the next one anyway.
 */
class RefreshTaskPool {
public:
    using Task = std::function<void()>;

    RefreshTaskPool(int worker_count, int queue_capacity);
    ~RefreshTaskPool();

    RefreshTaskPool(const RefreshTaskPool&) = delete;
    RefreshTaskPool& operator=(const RefreshTaskPool&) = delete;

    void start();
    // Returns false when the task was dropped (queue full or pool stopped)
    bool submit(Task task);
    // Pending tasks are discarded, running ones finish, workers are joined
    void stop();

    size_t get_pending_count() const;
    unsigned long get_completed_count() const { return completed_tasks.load(); }
    unsigned long get_dropped_count() const { return dropped_tasks.load(); }
    bool is_running() const { return running.load(); }

private:
    const int worker_count;
    const size_t queue_capacity;

    mutable std::mutex queue_mutex;
    std::condition_variable queue_cv;
    std::deque<Task> pending_tasks;
    std::vector<std::thread> workers;
    std::atomic<bool> running{false};
    std::atomic<unsigned long> completed_tasks{0};
    std::atomic<unsigned long> dropped_tasks{0};

    void worker_loop();
};

} // namespace Threads
} // namespace FtseTracker

#endif // REFRESH_TASK_POOL_HPP
