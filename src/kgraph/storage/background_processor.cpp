#include "kgraph/storage/background_processor.h"

#include "kgraph/common/logger.h"

namespace kgraph {
namespace storage {

namespace {

const char* TypeName(BackgroundTaskType type) {
    switch (type) {
        case BackgroundTaskType::FLUSH: return "flush";
        case BackgroundTaskType::EXPORT: return "export";
        case BackgroundTaskType::INDEXING: return "indexing";
        case BackgroundTaskType::MAINTENANCE: return "maintenance";
    }
    return "unknown";
}

} // namespace

BackgroundProcessor::BackgroundProcessor(const BackgroundProcessorConfig& config)
    : config_(config), task_queue_(taskComparator) {
}

BackgroundProcessor::~BackgroundProcessor() {
    if (initialized_.load()) {
        auto result = shutdown();
        if (!result.ok()) {
            KGRAPH_WARN("BackgroundProcessor shutdown failed: {}", result.error());
        }
    }
}

core::Result<void> BackgroundProcessor::initialize() {
    if (initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor already initialized");
    }
    if (config_.num_workers == 0) {
        return core::Result<void>::error("Invalid number of workers: 0", core::Error::Code::INVALID_ARGUMENT);
    }
    if (config_.max_queue_size == 0) {
        return core::Result<void>::error("Invalid max queue size: 0", core::Error::Code::INVALID_ARGUMENT);
    }

    shutdown_requested_.store(false);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stats_ = BackgroundProcessorStats();
    }

    workers_.reserve(config_.num_workers);
    for (uint32_t i = 0; i < config_.num_workers; ++i) {
        workers_.emplace_back(&BackgroundProcessor::workerThread, this);
    }
    initialized_.store(true);
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::shutdown() {
    if (!initialized_.load() || shutdown_requested_.load()) {
        return core::Result<void>();
    }

    // Workers keep draining the queue until it is empty, then exit.
    shutdown_requested_.store(true);
    queue_condition_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    workers_.clear();
    initialized_.store(false);
    idle_condition_.notify_all();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::submitTask(BackgroundTask task) {
    if (shutdown_requested_.load()) {
        return core::Result<void>::error("BackgroundProcessor is shutting down");
    }
    if (!initialized_.load()) {
        return core::Result<void>::error("BackgroundProcessor not initialized", core::Error::Code::NOT_INITIALIZED);
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (task_queue_.size() >= config_.max_queue_size) {
            ++stats_.tasks_rejected;
            return core::Result<void>::error("Queue is full");
        }
        task.task_id = next_task_id_++;
        task_queue_.push(std::make_unique<BackgroundTask>(std::move(task)));
        ++stats_.tasks_submitted;
    }
    queue_condition_.notify_one();
    return core::Result<void>();
}

core::Result<void> BackgroundProcessor::submitFlushTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::FLUSH, std::move(task_func), priority));
}

core::Result<void> BackgroundProcessor::submitExportTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::EXPORT, std::move(task_func), priority));
}

core::Result<void> BackgroundProcessor::submitIndexingTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::INDEXING, std::move(task_func), priority));
}

core::Result<void> BackgroundProcessor::submitMaintenanceTask(std::function<core::Result<void>()> task_func, uint32_t priority) {
    return submitTask(BackgroundTask(BackgroundTaskType::MAINTENANCE, std::move(task_func), priority));
}

core::Result<void> BackgroundProcessor::waitForCompletion(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool idle = idle_condition_.wait_for(lock, timeout, [this] {
        return task_queue_.empty() && running_tasks_ == 0;
    });
    if (!idle) {
        return core::Result<void>::error("Wait for completion timed out");
    }
    return core::Result<void>();
}

bool BackgroundProcessor::isIdle() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return task_queue_.empty() && running_tasks_ == 0;
}

BackgroundProcessorStats BackgroundProcessor::getStats() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    BackgroundProcessorStats snap = stats_;
    snap.queue_size = task_queue_.size();
    return snap;
}

void BackgroundProcessor::workerThread() {
    while (true) {
        auto task = getNextTask();
        if (!task) {
            if (shutdown_requested_.load()) {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                if (task_queue_.empty()) break;
            }
            continue;
        }
        processTask(*task);
    }
}

void BackgroundProcessor::processTask(BackgroundTask& task) {
    bool success = false;
    bool timeout = false;
    if (isTaskTimedOut(task)) {
        timeout = true;
        KGRAPH_WARN("Dropping {} task {}: queued past timeout", TypeName(task.type), task.task_id);
        if (task.on_dropped) {
            try {
                task.on_dropped();
            } catch (const std::exception& e) {
                KGRAPH_ERROR("{} task {} drop handler threw: {}", TypeName(task.type), task.task_id, e.what());
            }
        }
    } else {
        try {
            auto result = task.task_func();
            success = result.ok();
            if (!success) {
                KGRAPH_WARN("{} task {} failed: {}", TypeName(task.type), task.task_id, result.error());
            }
        } catch (const std::exception& e) {
            KGRAPH_ERROR("{} task {} threw: {}", TypeName(task.type), task.task_id, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        recordOutcome(task, success, timeout);
        --running_tasks_;
    }
    idle_condition_.notify_all();
}

std::unique_ptr<BackgroundTask> BackgroundProcessor::getNextTask() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_condition_.wait_for(lock, config_.worker_wait_timeout, [this] {
        return !task_queue_.empty() || shutdown_requested_.load();
    });
    if (task_queue_.empty()) {
        return nullptr;
    }

    auto task = std::move(const_cast<std::unique_ptr<BackgroundTask>&>(task_queue_.top()));
    task_queue_.pop();
    ++running_tasks_;
    return task;
}

void BackgroundProcessor::recordOutcome(const BackgroundTask& task, bool success, bool timeout) {
    ++stats_.tasks_processed;
    if (timeout) {
        ++stats_.tasks_timeout;
    } else if (!success) {
        ++stats_.tasks_failed;
    }

    switch (task.type) {
        case BackgroundTaskType::FLUSH:
            ++stats_.flush_tasks;
            break;
        case BackgroundTaskType::EXPORT:
            ++stats_.export_tasks;
            break;
        case BackgroundTaskType::INDEXING:
            ++stats_.indexing_tasks;
            break;
        case BackgroundTaskType::MAINTENANCE:
            ++stats_.maintenance_tasks;
            break;
    }
}

bool BackgroundProcessor::isTaskTimedOut(const BackgroundTask& task) const {
    return std::chrono::steady_clock::now() - task.created_time > config_.task_timeout;
}

} // namespace storage
} // namespace kgraph
