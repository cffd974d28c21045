#include "kgraph/vector/embedding_channel.h"

#include "kgraph/common/logger.h"

namespace kgraph {
namespace vector {

EmbeddingChannel::EmbeddingChannel(std::shared_ptr<EmbeddingProvider> provider)
    : provider_(std::move(provider)) {}

EmbeddingChannel::~EmbeddingChannel() {
    shutdown();
}

core::Result<void> EmbeddingChannel::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!provider_) {
        return core::Result<void>::error("Embedding channel has no provider", core::Error::Code::INVALID_ARGUMENT);
    }
    if (running_) {
        return core::Result<void>();
    }
    stopping_ = false;
    running_ = true;
    thread_ = std::thread(&EmbeddingChannel::worker, this);
    return core::Result<void>();
}

void EmbeddingChannel::shutdown() {
    std::map<uint64_t, Pending> abandoned;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && pending_.empty()) return;
        stopping_ = true;
        abandoned.swap(pending_);
        order_.clear();
    }
    cond_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    for (auto& entry : abandoned) {
        entry.second.promise.set_value(EmbedResult::error(
            "Embedding request " + std::to_string(entry.first) + " abandoned: channel closed",
            core::Error::Code::ABORTED));
    }
}

std::future<EmbedResult> EmbeddingChannel::request(std::vector<std::string> texts) {
    std::future<EmbedResult> future;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_ && !stopping_) {
            const uint64_t id = next_id_++;
            Pending& slot = pending_[id];
            slot.texts = std::move(texts);
            future = slot.promise.get_future();
            order_.push_back(id);
            cond_.notify_one();
            return future;
        }
    }
    std::promise<EmbedResult> rejected;
    rejected.set_value(EmbedResult::error("Embedding channel is not running", core::Error::Code::NOT_INITIALIZED));
    return rejected.get_future();
}

void EmbeddingChannel::worker() {
    while (true) {
        uint64_t id = 0;
        std::vector<std::string> texts;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return stopping_ || !order_.empty(); });
            if (stopping_) return;
            id = order_.front();
            order_.pop_front();
            auto it = pending_.find(id);
            if (it == pending_.end()) continue;
            texts = it->second.texts;
        }

        EmbedResult result = EmbedResult::error("Embedding provider threw", core::Error::Code::ORACLE_FAILURE);
        try {
            result = provider_->embed(texts);
        } catch (const std::exception& e) {
            KGRAPH_WARN("Embedding request {} failed: {}", id, e.what());
            result = EmbedResult::error(e.what(), core::Error::Code::ORACLE_FAILURE);
        }

        std::promise<EmbedResult> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end()) continue;  // abandoned by shutdown
            promise = std::move(it->second.promise);
            pending_.erase(it);
        }
        promise.set_value(std::move(result));
    }
}

size_t EmbeddingChannel::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

uint64_t EmbeddingChannel::last_request_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_id_ - 1;
}

} // namespace vector
} // namespace kgraph
