#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>
#include <thread>

#include "kgraph/storage/export_mirror.h"
#include "kgraph/storage/memory_backend.h"
#include "kgraph/storage/shard_store.h"
#include "test_util/temp_dir.h"

namespace kgraph {
namespace storage {
namespace {

namespace fs = std::filesystem;

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

class ExportMirrorTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = testutil::MakeUniqueTestDir("kgraph_export");
        BackgroundProcessorConfig config;
        config.num_workers = 1;
        config.worker_wait_timeout = std::chrono::milliseconds(20);
        processor_ = std::make_shared<BackgroundProcessor>(config);
        ASSERT_TRUE(processor_->initialize().ok());
    }

    void TearDown() override {
        mirror_.reset();
        processor_->shutdown();
        std::error_code ec;
        fs::remove_all(root_, ec);
    }

    fs::path root_;
    std::shared_ptr<BackgroundProcessor> processor_;
    std::unique_ptr<ExportMirror> mirror_;
};

TEST_F(ExportMirrorTest, LayoutUsesHashPrefix) {
    mirror_ = std::make_unique<ExportMirror>(root_, nullptr, 3);
    EXPECT_EQ(mirror_->token_path(0x12345678), root_ / "tokens" / "123" / "305419896.txt");
    EXPECT_EQ(mirror_->block_path(7, 2), root_ / "blocks" / "000" / "7_2.bin");
}

TEST_F(ExportMirrorTest, FlushWithoutProcessorWritesSynchronously) {
    mirror_ = std::make_unique<ExportMirror>(root_, nullptr);
    mirror_->enqueue_token(5, "cat");
    mirror_->enqueue_block(5, 0, Bytes{1, 2, 3});
    EXPECT_EQ(mirror_->stats().pending, 2u);

    ASSERT_TRUE(mirror_->flush().ok());
    EXPECT_EQ(ReadFile(mirror_->token_path(5)), "cat");
    EXPECT_EQ(fs::file_size(mirror_->block_path(5, 0)), 3u);

    mirror_->enqueue_removal(5, 0);
    ASSERT_TRUE(mirror_->flush().ok());
    EXPECT_FALSE(fs::exists(mirror_->block_path(5, 0)));

    auto stats = mirror_->stats();
    EXPECT_EQ(stats.written, 2u);
    EXPECT_EQ(stats.removed, 1u);
    EXPECT_EQ(stats.pending, 0u);
}

TEST_F(ExportMirrorTest, MirrorsShardStoreWrites) {
    mirror_ = std::make_unique<ExportMirror>(root_, processor_);
    ShardStore store(std::make_shared<MemoryBackend>(), nullptr, mirror_->observers());
    ASSERT_TRUE(store.init().ok());

    core::TokenId cat = store.ensure_token("cat").value();
    ASSERT_TRUE(store.upsert_adj(cat, {core::EdgeRow(2, 0, 10)}).ok());
    ASSERT_TRUE(processor_->waitForCompletion().ok());
    ASSERT_TRUE(mirror_->flush().ok());

    EXPECT_EQ(ReadFile(mirror_->token_path(cat)), "cat");
    ASSERT_TRUE(fs::exists(mirror_->block_path(cat, 0)));

    // The mirrored block is byte-identical to the stored one.
    auto stored = store.backend().get(Bucket::EDGE_BLOCKS, core::BlockKey(cat, 0));
    ASSERT_TRUE(stored.ok());
    ASSERT_TRUE(stored.value().has_value());
    std::string mirrored = ReadFile(mirror_->block_path(cat, 0));
    EXPECT_EQ(Bytes(mirrored.begin(), mirrored.end()), *stored.value());
}

TEST(ExportMirrorSchedulingTest, DroppedDrainDoesNotBlockLaterDrains) {
    testutil::ScopedTestDir dir("kgraph_export_drop");
    BackgroundProcessorConfig config;
    config.num_workers = 1;
    config.worker_wait_timeout = std::chrono::milliseconds(20);
    config.task_timeout = std::chrono::milliseconds(50);
    auto processor = std::make_shared<BackgroundProcessor>(config);
    ASSERT_TRUE(processor->initialize().ok());
    {
        ExportMirror mirror(dir.path(), processor);

        ASSERT_TRUE(processor->submitMaintenanceTask([]() -> core::Result<void> {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
            return core::Result<void>();
        }, 0).ok());
        mirror.enqueue_token(1, "first");
        ASSERT_TRUE(processor->waitForCompletion().ok());
        EXPECT_EQ(processor->getStats().tasks_timeout, 1u);
        EXPECT_EQ(mirror.stats().written, 0u);

        mirror.enqueue_token(2, "second");
        ASSERT_TRUE(processor->waitForCompletion().ok());
        EXPECT_EQ(mirror.stats().written, 2u);
        EXPECT_EQ(ReadFile(mirror.token_path(1)), "first");
        EXPECT_EQ(ReadFile(mirror.token_path(2)), "second");
    }
    ASSERT_TRUE(processor->shutdown().ok());
}

TEST_F(ExportMirrorTest, FailedWritesReported) {
    fs::create_directories(root_);
    std::ofstream(root_ / "blocks") << "file in the way";
    mirror_ = std::make_unique<ExportMirror>(root_, nullptr);
    mirror_->enqueue_block(1, 0, Bytes{1});
    auto flushed = mirror_->flush();
    EXPECT_FALSE(flushed.ok());
    EXPECT_EQ(mirror_->stats().failed, 1u);
}

} // namespace
} // namespace storage
} // namespace kgraph
