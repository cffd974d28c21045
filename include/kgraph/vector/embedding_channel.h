#ifndef KGRAPH_VECTOR_EMBEDDING_CHANNEL_H_
#define KGRAPH_VECTOR_EMBEDDING_CHANNEL_H_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "kgraph/vector/embedding_provider.h"

namespace kgraph {
namespace vector {

using EmbedResult = core::Result<std::vector<core::Vector>>;

/**
 * @brief Request/response channel to a provider running on its own thread
 *
 * Each request gets the next correlation id; the pending map holds the
 * promise until the worker answers. Requests are served in id order.
 * shutdown() fails every unanswered request with ABORTED.
 */
class EmbeddingChannel {
public:
    explicit EmbeddingChannel(std::shared_ptr<EmbeddingProvider> provider);
    ~EmbeddingChannel();

    EmbeddingChannel(const EmbeddingChannel&) = delete;
    EmbeddingChannel& operator=(const EmbeddingChannel&) = delete;

    core::Result<void> start();
    void shutdown();

    std::future<EmbedResult> request(std::vector<std::string> texts);

    size_t pending() const;
    uint64_t last_request_id() const;

    const EmbeddingProvider& provider() const { return *provider_; }

private:
    struct Pending {
        std::vector<std::string> texts;
        std::promise<EmbedResult> promise;
    };

    void worker();

    std::shared_ptr<EmbeddingProvider> provider_;

    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::map<uint64_t, Pending> pending_;
    std::deque<uint64_t> order_;
    uint64_t next_id_ = 1;
    bool running_ = false;
    bool stopping_ = false;
    std::thread thread_;
};

/**
 * @brief EmbeddingProvider facade that forwards through a channel
 */
class ChannelEmbeddingProvider : public EmbeddingProvider {
public:
    explicit ChannelEmbeddingProvider(std::shared_ptr<EmbeddingChannel> channel)
        : channel_(std::move(channel)) {}

    std::string name() const override { return channel_->provider().name(); }
    uint32_t dim() const override { return channel_->provider().dim(); }

    core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) override {
        return channel_->request(texts).get();
    }

private:
    std::shared_ptr<EmbeddingChannel> channel_;
};

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_EMBEDDING_CHANNEL_H_
