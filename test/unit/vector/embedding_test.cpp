#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "kgraph/storage/background_processor.h"
#include "kgraph/storage/memory_backend.h"
#include "kgraph/storage/shard_store.h"
#include "kgraph/vector/embedding_channel.h"
#include "kgraph/vector/embedding_provider.h"
#include "kgraph/vector/embedding_queue.h"
#include "kgraph/vector/quantization.h"
#include "kgraph/vector/vector_store.h"

namespace kgraph {
namespace vector {
namespace {

// Provider that can be told to fail and counts its calls.
class ScriptedProvider : public EmbeddingProvider {
public:
    explicit ScriptedProvider(uint32_t dim) : inner_(dim) {}

    std::string name() const override { return "scripted"; }
    uint32_t dim() const override { return inner_.dim(); }

    core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) override {
        calls.fetch_add(1);
        if (fail.load()) {
            return core::Result<std::vector<core::Vector>>::error("provider offline",
                                                                  core::Error::Code::ORACLE_FAILURE);
        }
        return inner_.embed(texts);
    }

    std::atomic<bool> fail{false};
    std::atomic<int> calls{0};

private:
    HashingEmbeddingProvider inner_;
};

// Provider whose calls block until released.
class GatedProvider : public EmbeddingProvider {
public:
    std::string name() const override { return "gated"; }
    uint32_t dim() const override { return 4; }

    core::Result<std::vector<core::Vector>> embed(const std::vector<std::string>& texts) override {
        entered.set_value();
        gate.wait();
        return core::Result<std::vector<core::Vector>>(std::vector<core::Vector>(texts.size(), core::Vector(4, 1.0f)));
    }

    std::promise<void> entered;
    std::shared_future<void> gate;
};

TEST(HashingEmbeddingProviderTest, DeterministicAndNormalized) {
    HashingEmbeddingProvider provider(64);
    auto first = provider.embed({"knowledge graph", "knowledge graphs", "banana"});
    auto again = provider.embed({"knowledge graph"});
    ASSERT_TRUE(first.ok());
    ASSERT_EQ(first.value().size(), 3u);
    EXPECT_EQ(first.value()[0], again.value()[0]);
    EXPECT_NEAR(Norm(first.value()[0]), 1.0, 1e-5);
    EXPECT_GT(Cosine(first.value()[0], first.value()[1]), Cosine(first.value()[0], first.value()[2]));
}

TEST(EmbeddingChannelTest, RequestsResolveInOrder) {
    auto channel = std::make_shared<EmbeddingChannel>(std::make_shared<HashingEmbeddingProvider>(16));
    ASSERT_TRUE(channel->start().ok());

    auto a = channel->request({"cat"});
    auto b = channel->request({"dog", "bird"});
    EXPECT_EQ(channel->last_request_id(), 2u);

    auto ra = a.get();
    auto rb = b.get();
    ASSERT_TRUE(ra.ok());
    ASSERT_TRUE(rb.ok());
    EXPECT_EQ(ra.value().size(), 1u);
    EXPECT_EQ(rb.value().size(), 2u);
    EXPECT_EQ(ra.value()[0], HashingEmbeddingProvider(16).embed_one("cat"));

    ChannelEmbeddingProvider facade(channel);
    EXPECT_EQ(facade.dim(), 16u);
    auto direct = facade.embed({"fish"});
    ASSERT_TRUE(direct.ok());
    EXPECT_EQ(direct.value().size(), 1u);
    channel->shutdown();
}

TEST(EmbeddingChannelTest, RequestWhenStoppedIsRejected) {
    EmbeddingChannel channel(std::make_shared<HashingEmbeddingProvider>(8));
    auto result = channel.request({"cat"}).get();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::NOT_INITIALIZED);
}

TEST(EmbeddingChannelTest, ShutdownAbandonsPendingRequests) {
    auto provider = std::make_shared<GatedProvider>();
    std::promise<void> release;
    provider->gate = release.get_future().share();
    auto entered = provider->entered.get_future();

    EmbeddingChannel channel(provider);
    ASSERT_TRUE(channel.start().ok());
    auto in_flight = channel.request({"a"});
    entered.wait();
    auto queued = channel.request({"b"});
    EXPECT_EQ(channel.pending(), 2u);

    std::thread closer([&channel] { channel.shutdown(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();
    closer.join();

    auto r1 = in_flight.get();
    auto r2 = queued.get();
    ASSERT_FALSE(r1.ok());
    ASSERT_FALSE(r2.ok());
    EXPECT_EQ(r1.code(), core::Error::Code::ABORTED);
    EXPECT_EQ(r2.code(), core::Error::Code::ABORTED);
}

class EmbeddingQueueTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<storage::MemoryBackend>();
        store_ = std::make_shared<VectorStore>(backend_);
        core::VectorConfig config = core::VectorConfig::Default();
        config.dim = 16;
        config.batch_size = 2;
        config.provider = "scripted";
        ASSERT_TRUE(store_->init(config).ok());
        provider_ = std::make_shared<ScriptedProvider>(16);
    }

    std::shared_ptr<storage::MemoryBackend> backend_;
    std::shared_ptr<VectorStore> store_;
    std::shared_ptr<ScriptedProvider> provider_;
};

TEST_F(EmbeddingQueueTest, FlushNowEmbedsInBatches) {
    EmbeddingQueue queue(store_, provider_);
    queue.observe(1, "cat");
    queue.observe(2, "dog");
    queue.observe(3, "bird");
    queue.observe(1, "cat");
    EXPECT_EQ(queue.status().queue_size, 3u);

    auto flushed = queue.flush_now();
    ASSERT_TRUE(flushed.ok()) << flushed.error();
    EXPECT_EQ(flushed.value(), 3u);
    EXPECT_EQ(provider_->calls.load(), 2);

    auto status = queue.status();
    EXPECT_TRUE(status.configured);
    EXPECT_EQ(status.queue_size, 0u);
    EXPECT_EQ(status.batches, 2u);
    EXPECT_EQ(status.embedded, 3u);
    EXPECT_TRUE(store_->get(3).value().has_value());
}

TEST_F(EmbeddingQueueTest, FailedBatchStaysQueued) {
    EmbeddingQueue queue(store_, provider_);
    queue.observe(1, "cat");
    provider_->fail = true;
    auto failed = queue.flush_now();
    ASSERT_FALSE(failed.ok());
    EXPECT_EQ(failed.code(), core::Error::Code::ORACLE_FAILURE);
    EXPECT_EQ(queue.status().queue_size, 1u);
    EXPECT_EQ(queue.status().failures, 1u);

    provider_->fail = false;
    ASSERT_TRUE(queue.flush_now().ok());
    EXPECT_EQ(queue.status().queue_size, 0u);
}

TEST_F(EmbeddingQueueTest, ScheduledFlushFromStoreObservers) {
    storage::BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.worker_wait_timeout = std::chrono::milliseconds(20);
    auto processor = std::make_shared<storage::BackgroundProcessor>(config);
    ASSERT_TRUE(processor->initialize().ok());

    auto queue = std::make_shared<EmbeddingQueue>(store_, provider_, processor);
    storage::ShardStore shards(backend_, nullptr, queue->observers());
    ASSERT_TRUE(shards.init().ok());
    core::TokenId cat = shards.ensure_token("cat").value();
    core::TokenId dog = shards.ensure_token("dog").value();

    ASSERT_TRUE(processor->waitForCompletion().ok());
    EXPECT_TRUE(store_->get(cat).value().has_value());
    EXPECT_TRUE(store_->get(dog).value().has_value());
    EXPECT_EQ(queue->status().queue_size, 0u);
    processor->shutdown();
}

TEST_F(EmbeddingQueueTest, DroppedScheduledFlushFreesTheSlot) {
    storage::BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.worker_wait_timeout = std::chrono::milliseconds(20);
    config.task_timeout = std::chrono::milliseconds(50);
    auto processor = std::make_shared<storage::BackgroundProcessor>(config);
    ASSERT_TRUE(processor->initialize().ok());
    EmbeddingQueue queue(store_, provider_, processor);

    // Keep the only worker busy past the timeout so the flush goes stale.
    ASSERT_TRUE(processor->submitMaintenanceTask([]() -> core::Result<void> {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        return core::Result<void>();
    }, 0).ok());
    queue.observe(1, "cat");
    ASSERT_TRUE(queue.schedule_flush().ok());
    ASSERT_TRUE(processor->waitForCompletion().ok());
    EXPECT_EQ(processor->getStats().tasks_timeout, 1u);
    EXPECT_EQ(provider_->calls.load(), 0);
    EXPECT_EQ(queue.status().queue_size, 1u);

    queue.observe(2, "dog");
    ASSERT_TRUE(queue.schedule_flush().ok());
    ASSERT_TRUE(processor->waitForCompletion().ok());
    EXPECT_EQ(queue.status().queue_size, 0u);
    EXPECT_TRUE(store_->get(1).value().has_value());
    EXPECT_TRUE(store_->get(2).value().has_value());
    processor->shutdown();
}

TEST_F(EmbeddingQueueTest, DestructionWaitsForScheduledFlush) {
    storage::BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.worker_wait_timeout = std::chrono::milliseconds(20);
    auto processor = std::make_shared<storage::BackgroundProcessor>(config);
    ASSERT_TRUE(processor->initialize().ok());

    ASSERT_TRUE(processor->submitMaintenanceTask([]() -> core::Result<void> {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return core::Result<void>();
    }, 0).ok());
    {
        EmbeddingQueue queue(store_, provider_, processor);
        queue.observe(7, "owl");
        ASSERT_TRUE(queue.schedule_flush().ok());
    }
    // The flush ran before the queue went away.
    EXPECT_EQ(provider_->calls.load(), 1);
    EXPECT_TRUE(store_->get(7).value().has_value());
    ASSERT_TRUE(processor->waitForCompletion().ok());
    processor->shutdown();
}

TEST_F(EmbeddingQueueTest, ScheduleWithoutProcessor) {
    EmbeddingQueue queue(store_, provider_);
    auto scheduled = queue.schedule_flush();
    ASSERT_FALSE(scheduled.ok());
    EXPECT_EQ(scheduled.code(), core::Error::Code::NOT_INITIALIZED);
}

TEST_F(EmbeddingQueueTest, EnsureEmbeddingReusesStoredVector) {
    EmbeddingQueue queue(store_, provider_);
    auto first = queue.ensure_embedding(5, "cat");
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(provider_->calls.load(), 1);
    auto second = queue.ensure_embedding(5, "cat");
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(provider_->calls.load(), 1);
    EXPECT_EQ(first.value(), second.value());
}

} // namespace
} // namespace vector
} // namespace kgraph
