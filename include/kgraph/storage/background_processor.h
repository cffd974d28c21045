#ifndef KGRAPH_STORAGE_BACKGROUND_PROCESSOR_H_
#define KGRAPH_STORAGE_BACKGROUND_PROCESSOR_H_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "kgraph/core/result.h"

namespace kgraph {
namespace storage {

/**
 * @brief Background task kinds
 */
enum class BackgroundTaskType {
    FLUSH,        // embedding queue batches
    EXPORT,       // export mirror replication
    INDEXING,     // vector index maintenance
    MAINTENANCE   // compaction, gc, trim
};

/**
 * @brief Background task structure
 *
 * on_dropped, when set, runs on the worker instead of task_func if the task
 * waited in the queue past task_timeout.
 */
struct BackgroundTask {
    BackgroundTaskType type;
    std::function<core::Result<void>()> task_func;
    std::function<void()> on_dropped;
    std::chrono::steady_clock::time_point created_time;
    uint32_t priority;  // Lower number = higher priority
    uint64_t task_id;

    BackgroundTask(BackgroundTaskType t, std::function<core::Result<void>()> func, uint32_t p = 5,
                   std::function<void()> dropped = nullptr)
        : type(t), task_func(std::move(func)), on_dropped(std::move(dropped)),
          created_time(std::chrono::steady_clock::now()), priority(p), task_id(0) {}
};

/**
 * @brief Background processor configuration
 */
struct BackgroundProcessorConfig {
    uint32_t num_workers = 2;
    uint32_t max_queue_size = 10000;
    std::chrono::milliseconds task_timeout{30000};  // queued longer than this = dropped
    std::chrono::milliseconds worker_wait_timeout{100};

    BackgroundProcessorConfig() = default;
};

struct BackgroundProcessorStats {
    uint64_t tasks_submitted = 0;
    uint64_t tasks_processed = 0;
    uint64_t tasks_failed = 0;
    uint64_t tasks_timeout = 0;
    uint64_t tasks_rejected = 0;
    uint64_t flush_tasks = 0;
    uint64_t export_tasks = 0;
    uint64_t indexing_tasks = 0;
    uint64_t maintenance_tasks = 0;
    uint64_t queue_size = 0;
};

/**
 * @brief Worker pool for work that must stay off the caller's path
 *
 * Embedding flushes, export replication and store maintenance are queued
 * here. Tasks run in priority order; equal priorities run FIFO.
 */
class BackgroundProcessor {
public:
    explicit BackgroundProcessor(const BackgroundProcessorConfig& config = BackgroundProcessorConfig{});
    ~BackgroundProcessor();

    BackgroundProcessor(const BackgroundProcessor&) = delete;
    BackgroundProcessor& operator=(const BackgroundProcessor&) = delete;

    /**
     * @brief Start the worker threads
     * @return Result indicating success or failure
     */
    core::Result<void> initialize();

    /**
     * @brief Drain queued tasks and join the workers
     */
    core::Result<void> shutdown();

    /**
     * @brief Submit a background task
     * @return Error when not running or the queue is full
     */
    core::Result<void> submitTask(BackgroundTask task);

    core::Result<void> submitFlushTask(std::function<core::Result<void>()> task_func, uint32_t priority = 1);
    core::Result<void> submitExportTask(std::function<core::Result<void>()> task_func, uint32_t priority = 3);
    core::Result<void> submitIndexingTask(std::function<core::Result<void>()> task_func, uint32_t priority = 2);
    core::Result<void> submitMaintenanceTask(std::function<core::Result<void>()> task_func, uint32_t priority = 4);

    /**
     * @brief Block until every submitted task has finished
     * @param timeout Maximum time to wait
     */
    core::Result<void> waitForCompletion(std::chrono::milliseconds timeout = std::chrono::milliseconds{5000});

    /// No queued and no running tasks.
    bool isIdle() const;
    bool isRunning() const { return initialized_.load() && !shutdown_requested_.load(); }

    BackgroundProcessorStats getStats() const;
    const BackgroundProcessorConfig& getConfig() const { return config_; }

private:
    void workerThread();
    void processTask(BackgroundTask& task);
    std::unique_ptr<BackgroundTask> getNextTask();
    void recordOutcome(const BackgroundTask& task, bool success, bool timeout);
    bool isTaskTimedOut(const BackgroundTask& task) const;

    static bool taskComparator(const std::unique_ptr<BackgroundTask>& a, const std::unique_ptr<BackgroundTask>& b) {
        if (a->priority != b->priority) {
            return a->priority > b->priority;
        }
        return a->task_id > b->task_id;
    }

    using TaskQueue = std::priority_queue<std::unique_ptr<BackgroundTask>,
                                          std::vector<std::unique_ptr<BackgroundTask>>,
                                          std::function<bool(const std::unique_ptr<BackgroundTask>&,
                                                             const std::unique_ptr<BackgroundTask>&)>>;

    BackgroundProcessorConfig config_;

    std::atomic<bool> initialized_{false};
    std::atomic<bool> shutdown_requested_{false};
    uint64_t next_task_id_ = 1;

    mutable std::mutex queue_mutex_;
    std::condition_variable queue_condition_;
    std::condition_variable idle_condition_;
    TaskQueue task_queue_;
    uint32_t running_tasks_ = 0;
    BackgroundProcessorStats stats_;

    std::vector<std::thread> workers_;
};

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_BACKGROUND_PROCESSOR_H_
