#ifndef KGRAPH_VECTOR_EMBEDDING_QUEUE_H_
#define KGRAPH_VECTOR_EMBEDDING_QUEUE_H_

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "kgraph/core/result.h"
#include "kgraph/core/types.h"
#include "kgraph/storage/background_processor.h"
#include "kgraph/storage/shard_store.h"
#include "kgraph/vector/embedding_provider.h"
#include "kgraph/vector/vector_store.h"

namespace kgraph {
namespace vector {

struct EmbeddingQueueStatus {
    bool configured = false;
    std::string provider;
    uint32_t dim = 0;
    size_t queue_size = 0;
    uint64_t batches = 0;
    uint64_t embedded = 0;
    uint64_t failures = 0;
    double last_batch_ms = 0.0;
};

/**
 * @brief Batched ingestion of newly observed tokens into the vector store
 *
 * observe() only records the token. flush_now() embeds everything queued on
 * the caller's thread; schedule_flush() posts one flush to the background
 * processor instead. A batch that fails stays queued for the next flush.
 */
class EmbeddingQueue {
public:
    /// Background retries after this many failed flushes in a row stop until
    /// the next observe() or explicit flush.
    static constexpr uint32_t kMaxScheduledRetries = 3;

    EmbeddingQueue(std::shared_ptr<VectorStore> store,
                   std::shared_ptr<EmbeddingProvider> provider,
                   std::shared_ptr<storage::BackgroundProcessor> processor = nullptr);

    /// Waits for scheduled flushes that are still queued or running.
    ~EmbeddingQueue();

    EmbeddingQueue(const EmbeddingQueue&) = delete;
    EmbeddingQueue& operator=(const EmbeddingQueue&) = delete;

    /**
     * @brief Queue a token for embedding; a queued id keeps its latest text
     */
    void observe(core::TokenId id, const std::string& text);

    /**
     * @brief Embed and store every queued token now
     * @return Number of tokens stored, or the first batch error
     */
    core::Result<size_t> flush_now();

    /**
     * @brief Run a flush on the background processor when it gets to it
     *
     * At most one scheduled flush is outstanding at a time. A flush the
     * processor drops as stale frees the slot for the next schedule.
     */
    core::Result<void> schedule_flush();

    /**
     * @brief Stored vector for id, embedding and storing it first if missing
     */
    core::Result<core::Vector> ensure_embedding(core::TokenId id, const std::string& text);

    EmbeddingQueueStatus status() const;

    /**
     * @brief Store callbacks that queue new tokens and schedule a flush
     */
    storage::StoreObservers observers();

private:
    core::Result<size_t> flush_batch();
    core::Result<void> run_scheduled_flush();
    void scheduled_task_done(bool clear_scheduled);

    std::shared_ptr<VectorStore> store_;
    std::shared_ptr<EmbeddingProvider> provider_;
    std::shared_ptr<storage::BackgroundProcessor> processor_;

    mutable std::mutex mutex_;
    std::mutex flush_mutex_;
    std::deque<core::TokenId> order_;
    std::unordered_map<core::TokenId, std::string> texts_;
    bool flush_scheduled_ = false;
    bool closing_ = false;
    uint32_t tasks_in_flight_ = 0;
    std::condition_variable tasks_done_;
    uint32_t consecutive_failures_ = 0;

    uint64_t batches_ = 0;
    uint64_t embedded_ = 0;
    uint64_t failures_ = 0;
    double last_batch_ms_ = 0.0;
};

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_EMBEDDING_QUEUE_H_
