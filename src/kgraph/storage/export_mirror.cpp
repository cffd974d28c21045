#include "kgraph/storage/export_mirror.h"

#include <fstream>

#include "kgraph/common/logger.h"

namespace fs = std::filesystem;

namespace kgraph {
namespace storage {

ExportMirror::ExportMirror(fs::path root, std::shared_ptr<BackgroundProcessor> processor,
                           int prefix_nibbles)
    : root_(std::move(root)), processor_(std::move(processor)), prefix_nibbles_(prefix_nibbles) {}

ExportMirror::~ExportMirror() {
    // Queued drains capture this; let them finish first.
    if (processor_ && processor_->isRunning()) {
        auto waited = processor_->waitForCompletion();
        if (!waited.ok()) {
            KGRAPH_WARN("Export mirror destroyed with work in flight: {}", waited.error());
        }
    }
}

fs::path ExportMirror::token_path(core::TokenId id) const {
    return root_ / "tokens" / core::HashPrefix(id, prefix_nibbles_) / (std::to_string(id) + ".txt");
}

fs::path ExportMirror::block_path(core::TokenId token_id, uint32_t part) const {
    return root_ / "blocks" / core::HashPrefix(token_id, prefix_nibbles_) /
           (std::to_string(token_id) + "_" + std::to_string(part) + ".bin");
}

void ExportMirror::enqueue_token(core::TokenId id, const std::string& text) {
    enqueue(Job{JobKind::TOKEN, id, 0, Bytes(text.begin(), text.end())});
}

void ExportMirror::enqueue_block(core::TokenId token_id, uint32_t part, const Bytes& bytes) {
    enqueue(Job{JobKind::BLOCK, token_id, part, bytes});
}

void ExportMirror::enqueue_removal(core::TokenId token_id, uint32_t part) {
    enqueue(Job{JobKind::REMOVE_BLOCK, token_id, part, Bytes()});
}

void ExportMirror::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.push_back(std::move(job));
        ++stats_.enqueued;
    }
    schedule_drain();
}

void ExportMirror::schedule_drain() {
    if (!processor_ || !processor_->isRunning()) {
        return;  // picked up by the next flush()
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (drain_scheduled_) return;
        drain_scheduled_ = true;
    }
    auto clear_scheduled = [this]() {
        std::lock_guard<std::mutex> lock(mutex_);
        drain_scheduled_ = false;
    };
    // A drain dropped by the processor leaves its records pending for the
    // next enqueue or flush().
    auto submitted = processor_->submitTask(BackgroundTask(BackgroundTaskType::EXPORT, [this, clear_scheduled]() {
        clear_scheduled();
        return drain();
    }, 3, clear_scheduled));
    if (!submitted.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        drain_scheduled_ = false;
        KGRAPH_DEBUG("Export drain not scheduled ({}); records stay pending", submitted.error());
    }
}

core::Result<void> ExportMirror::flush() {
    return drain();
}

core::Result<void> ExportMirror::drain() {
    std::lock_guard<std::mutex> drain_lock(drain_mutex_);
    std::deque<Job> jobs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.swap(pending_);
    }

    size_t failures = 0;
    std::string last_error;
    for (const auto& job : jobs) {
        auto result = run(job);
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.ok()) {
            if (job.kind == JobKind::REMOVE_BLOCK) {
                ++stats_.removed;
            } else {
                ++stats_.written;
            }
        } else {
            ++stats_.failed;
            ++failures;
            last_error = result.error();
        }
    }
    if (failures > 0) {
        KGRAPH_WARN("Export mirror: {} of {} records failed, last error: {}", failures, jobs.size(), last_error);
        return core::Result<void>::error(last_error, core::Error::Code::STORAGE_UNAVAILABLE);
    }
    return core::Result<void>();
}

core::Result<void> ExportMirror::run(const Job& job) {
    std::error_code ec;
    if (job.kind == JobKind::REMOVE_BLOCK) {
        fs::remove(block_path(job.token_id, job.part), ec);
        if (ec) {
            return core::Result<void>::error("Cannot remove mirrored block: " + ec.message());
        }
        return core::Result<void>();
    }

    fs::path target = job.kind == JobKind::TOKEN ? token_path(job.token_id)
                                                 : block_path(job.token_id, job.part);
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return core::Result<void>::error("Cannot create " + target.parent_path().string() + ": " + ec.message());
    }
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(reinterpret_cast<const char*>(job.payload.data()),
              static_cast<std::streamsize>(job.payload.size()));
    if (!out) {
        return core::Result<void>::error("Cannot write " + target.string());
    }
    return core::Result<void>();
}

StoreObservers ExportMirror::observers() {
    StoreObservers obs;
    obs.on_token_observed = [this](core::TokenId id, const std::string& text) {
        enqueue_token(id, text);
    };
    obs.on_block_written = [this](core::TokenId token_id, uint32_t part, const Bytes& bytes) {
        enqueue_block(token_id, part, bytes);
    };
    obs.on_block_removed = [this](core::TokenId token_id, uint32_t part) {
        enqueue_removal(token_id, part);
    };
    return obs;
}

ExportMirrorStats ExportMirror::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ExportMirrorStats snap = stats_;
    snap.pending = pending_.size();
    return snap;
}

} // namespace storage
} // namespace kgraph
