#ifndef KGRAPH_STORAGE_EXPORT_MIRROR_H_
#define KGRAPH_STORAGE_EXPORT_MIRROR_H_

#include <atomic>
#include <cstdint>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "kgraph/core/result.h"
#include "kgraph/core/types.h"
#include "kgraph/storage/background_processor.h"
#include "kgraph/storage/shard_store.h"

namespace kgraph {
namespace storage {

struct ExportMirrorStats {
    uint64_t enqueued = 0;
    uint64_t written = 0;
    uint64_t removed = 0;
    uint64_t failed = 0;
    uint64_t pending = 0;
};

/**
 * @brief Best-effort write-behind copy of store records into a file tree
 *
 * Layout under the root:
 *   tokens/<prefix>/<id>.txt          token text
 *   blocks/<prefix>/<id>_<part>.bin   encoded edge block, as stored
 *
 * Replication runs as export tasks on the background processor. Failures
 * are logged and counted and never reach the store's write path. The mirror
 * must outlive any store wired to observers().
 */
class ExportMirror {
public:
    ExportMirror(std::filesystem::path root, std::shared_ptr<BackgroundProcessor> processor,
                 int prefix_nibbles = 3);
    ~ExportMirror();

    ExportMirror(const ExportMirror&) = delete;
    ExportMirror& operator=(const ExportMirror&) = delete;

    void enqueue_token(core::TokenId id, const std::string& text);
    void enqueue_block(core::TokenId token_id, uint32_t part, const Bytes& bytes);
    void enqueue_removal(core::TokenId token_id, uint32_t part);

    /**
     * @brief Replicate everything pending on the calling thread
     * @return Error when at least one record could not be written
     */
    core::Result<void> flush();

    /**
     * @brief Store callbacks that feed this mirror
     */
    StoreObservers observers();

    ExportMirrorStats stats() const;
    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path token_path(core::TokenId id) const;
    std::filesystem::path block_path(core::TokenId token_id, uint32_t part) const;

private:
    enum class JobKind { TOKEN, BLOCK, REMOVE_BLOCK };

    struct Job {
        JobKind kind;
        core::TokenId token_id;
        uint32_t part;
        Bytes payload;
    };

    void enqueue(Job job);
    void schedule_drain();
    core::Result<void> drain();
    core::Result<void> run(const Job& job);

    std::filesystem::path root_;
    std::shared_ptr<BackgroundProcessor> processor_;
    int prefix_nibbles_;

    mutable std::mutex mutex_;
    std::mutex drain_mutex_;
    std::deque<Job> pending_;
    bool drain_scheduled_ = false;
    ExportMirrorStats stats_;
};

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_EXPORT_MIRROR_H_
