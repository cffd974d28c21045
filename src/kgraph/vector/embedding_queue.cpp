#include "kgraph/vector/embedding_queue.h"

#include <algorithm>
#include <chrono>
#include <vector>

#include "kgraph/common/logger.h"

namespace kgraph {
namespace vector {

EmbeddingQueue::EmbeddingQueue(std::shared_ptr<VectorStore> store,
                               std::shared_ptr<EmbeddingProvider> provider,
                               std::shared_ptr<storage::BackgroundProcessor> processor)
    : store_(std::move(store)), provider_(std::move(provider)), processor_(std::move(processor)) {}

EmbeddingQueue::~EmbeddingQueue() {
    // Scheduled flushes capture this; the processor drains or drops them.
    std::unique_lock<std::mutex> lock(mutex_);
    closing_ = true;
    tasks_done_.wait(lock, [this] { return tasks_in_flight_ == 0; });
}

void EmbeddingQueue::observe(core::TokenId id, const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = texts_.find(id);
    if (it == texts_.end()) {
        order_.push_back(id);
        texts_.emplace(id, text);
    } else {
        it->second = text;
    }
    consecutive_failures_ = 0;
}

core::Result<size_t> EmbeddingQueue::flush_batch() {
    const size_t batch_size = std::max<uint32_t>(1, store_->config().batch_size);
    std::vector<core::TokenId> ids;
    std::vector<std::string> texts;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < order_.size() && ids.size() < batch_size; ++i) {
            ids.push_back(order_[i]);
            texts.push_back(texts_[order_[i]]);
        }
    }
    if (ids.empty()) {
        return core::Result<size_t>(0);
    }

    auto started = std::chrono::steady_clock::now();
    auto embedded = provider_->embed(texts);
    if (!embedded.ok()) {
        return core::propagate<size_t>(embedded);
    }
    if (embedded.value().size() != ids.size()) {
        return core::Result<size_t>::error("Provider returned " + std::to_string(embedded.value().size()) +
                                               " vectors for " + std::to_string(ids.size()) + " texts",
                                           core::Error::Code::ORACLE_FAILURE);
    }

    // Items stored before a failing put leave the queue; the rest stay.
    size_t stored = 0;
    core::Result<void> put_error;
    for (size_t i = 0; i < ids.size(); ++i) {
        auto put = store_->put(ids[i], embedded.value()[i]);
        if (!put.ok()) {
            put_error = std::move(put);
            break;
        }
        ++stored;
    }

    const double elapsed_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - started).count();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (size_t i = 0; i < stored; ++i) {
            texts_.erase(ids[i]);
            auto pos = std::find(order_.begin(), order_.end(), ids[i]);
            if (pos != order_.end()) order_.erase(pos);
        }
        ++batches_;
        embedded_ += stored;
        last_batch_ms_ = elapsed_ms;
    }
    if (!put_error.ok()) {
        return core::propagate<size_t>(put_error);
    }
    return core::Result<size_t>(stored);
}

core::Result<size_t> EmbeddingQueue::flush_now() {
    if (!store_ || !store_->initialized()) {
        return core::Result<size_t>::error("Embedding queue flushed before the vector store was initialized",
                                           core::Error::Code::NOT_INITIALIZED);
    }
    std::lock_guard<std::mutex> flush_lock(flush_mutex_);
    size_t total = 0;
    while (true) {
        auto batch = flush_batch();
        if (!batch.ok()) {
            std::lock_guard<std::mutex> lock(mutex_);
            ++failures_;
            ++consecutive_failures_;
            KGRAPH_WARN("Embedding flush failed after {} tokens, {} left queued: {}",
                        total, order_.size(), batch.error());
            return batch;
        }
        if (batch.value() == 0) break;
        total += batch.value();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        consecutive_failures_ = 0;
    }
    return core::Result<size_t>(total);
}

core::Result<void> EmbeddingQueue::schedule_flush() {
    if (!processor_) {
        return core::Result<void>::error("No background processor for scheduled flushes",
                                         core::Error::Code::NOT_INITIALIZED);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return core::Result<void>::error("Embedding queue is shutting down", core::Error::Code::ABORTED);
        }
        if (flush_scheduled_ || order_.empty()) {
            return core::Result<void>();
        }
        flush_scheduled_ = true;
        ++tasks_in_flight_;
    }

    // Lowest priority: runs once the processor has nothing more urgent.
    storage::BackgroundTask task(storage::BackgroundTaskType::FLUSH, [this]() -> core::Result<void> {
        core::Result<void> result;
        try {
            result = run_scheduled_flush();
        } catch (...) {
            scheduled_task_done(false);
            throw;
        }
        scheduled_task_done(false);
        return result;
    }, 10, [this]() {
        KGRAPH_DEBUG("Scheduled embedding flush dropped; tokens stay queued");
        scheduled_task_done(true);
    });

    auto submitted = processor_->submitTask(std::move(task));
    if (!submitted.ok()) {
        scheduled_task_done(true);
    }
    return submitted;
}

core::Result<void> EmbeddingQueue::run_scheduled_flush() {
    // Cleared first so tokens observed during this flush schedule another.
    {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_scheduled_ = false;
    }
    auto flushed = flush_now();
    bool retry = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retry = !flushed.ok() && !closing_ && !order_.empty() && consecutive_failures_ < kMaxScheduledRetries;
    }
    if (retry) {
        auto rescheduled = schedule_flush();
        if (!rescheduled.ok()) {
            KGRAPH_WARN("Could not reschedule embedding flush: {}", rescheduled.error());
        }
    }
    if (!flushed.ok()) {
        return core::propagate<void>(flushed);
    }
    return core::Result<void>();
}

void EmbeddingQueue::scheduled_task_done(bool clear_scheduled) {
    // Notified under the lock: the destructor may run as soon as it is released.
    std::lock_guard<std::mutex> lock(mutex_);
    if (clear_scheduled) flush_scheduled_ = false;
    --tasks_in_flight_;
    tasks_done_.notify_all();
}

core::Result<core::Vector> EmbeddingQueue::ensure_embedding(core::TokenId id, const std::string& text) {
    auto existing = store_->get(id);
    if (!existing.ok()) {
        return core::propagate<core::Vector>(existing);
    }
    if (existing.value()) {
        return core::Result<core::Vector>(*existing.value());
    }

    auto embedded = provider_->embed(std::vector<std::string>{text});
    if (!embedded.ok()) {
        return core::propagate<core::Vector>(embedded);
    }
    if (embedded.value().empty()) {
        return core::Result<core::Vector>::error("Provider returned no vector", core::Error::Code::ORACLE_FAILURE);
    }
    auto put = store_->put(id, embedded.value().front());
    if (!put.ok()) {
        return core::propagate<core::Vector>(put);
    }
    auto stored = store_->get(id);
    if (!stored.ok()) {
        return core::propagate<core::Vector>(stored);
    }
    if (!stored.value()) {
        return core::Result<core::Vector>::error("Vector vanished after put", core::Error::Code::INTERNAL);
    }
    return core::Result<core::Vector>(*stored.value());
}

EmbeddingQueueStatus EmbeddingQueue::status() const {
    EmbeddingQueueStatus status;
    if (store_ && store_->initialized()) {
        status.configured = true;
        status.provider = store_->config().provider;
        status.dim = store_->config().dim;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    status.queue_size = order_.size();
    status.batches = batches_;
    status.embedded = embedded_;
    status.failures = failures_;
    status.last_batch_ms = last_batch_ms_;
    return status;
}

storage::StoreObservers EmbeddingQueue::observers() {
    storage::StoreObservers obs;
    obs.on_token_observed = [this](core::TokenId id, const std::string& text) {
        observe(id, text);
        if (processor_) {
            auto scheduled = schedule_flush();
            if (!scheduled.ok()) {
                KGRAPH_DEBUG("Embedding flush not scheduled: {}", scheduled.error());
            }
        }
    };
    return obs;
}

} // namespace vector
} // namespace kgraph
