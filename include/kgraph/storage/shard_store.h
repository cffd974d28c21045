#ifndef KGRAPH_STORAGE_SHARD_STORE_H_
#define KGRAPH_STORAGE_SHARD_STORE_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "kgraph/core/config.h"
#include "kgraph/core/result.h"
#include "kgraph/core/types.h"
#include "kgraph/storage/backend.h"
#include "kgraph/storage/edge_codec.h"

namespace kgraph {
namespace storage {

/**
 * @brief Adjacency query
 *
 * Forward mode returns the token's own rows. Reverse mode answers "who
 * points at token_id" with a scan of every block; returned rows carry the
 * pointing token in neighbor_id.
 */
struct AdjQuery {
    core::TokenId token_id = 0;
    std::vector<uint16_t> types;          // empty = any type
    std::optional<uint32_t> min_weight;
    std::optional<size_t> limit;
    bool reverse = false;
};

struct UpsertOptions {
    bool merge = false;
};

/**
 * @brief One bulk import record; token_id wins over token when both are set
 */
struct ImportItem {
    std::optional<std::string> token;
    std::optional<core::TokenId> token_id;
    std::vector<core::EdgeRow> edges;
};

/**
 * @brief Pull-style import stream; returns nullopt at end of input
 */
using ImportSource = std::function<std::optional<ImportItem>()>;

struct ImportReport {
    size_t imported = 0;
    size_t skipped = 0;
};

struct StoreStats {
    size_t tokens = 0;
    size_t shards = 0;
    size_t edges = 0;
    size_t size_bytes = 0;
};

struct GcReport {
    size_t removed_empty = 0;
    size_t unreadable = 0;  // reported, never deleted
    size_t rewritten = 0;
};

struct TrimReport {
    size_t rows_removed = 0;
    size_t tokens_touched = 0;
    size_t tokens_skipped = 0;  // had unreadable blocks
};

/**
 * @brief Change callbacks supplied by the owner of the store
 *
 * Callbacks run on the calling thread after the mutation has been applied.
 * on_block_written / on_block_removed fire while the write lock is held and
 * must not call back into the store. Unset callbacks are skipped.
 */
struct StoreObservers {
    std::function<void(core::TokenId, const std::string&)> on_token_observed;
    std::function<void(const std::vector<core::TokenId>&)> on_graph_updated;
    std::function<void(core::TokenId, uint32_t part, const Bytes&)> on_block_written;
    std::function<void(core::TokenId, uint32_t part)> on_block_removed;
};

/**
 * @brief Fan every callback out to each observer set, in order
 */
StoreObservers CombineObservers(std::vector<StoreObservers> sets);

/**
 * @brief Token dictionary plus sharded, codec-encoded adjacency lists
 *
 * A single process-level writer is assumed per token; mutations within one
 * store are serialized by an internal mutex.
 */
class ShardStore {
public:
    ShardStore(std::shared_ptr<StorageBackend> backend,
               std::shared_ptr<const EdgeBlockCodec> codec,
               StoreObservers observers = StoreObservers());

    ShardStore(const ShardStore&) = delete;
    ShardStore& operator=(const ShardStore&) = delete;

    /**
     * @brief Open the backend and load the token dictionary
     */
    core::Result<void> init();
    bool initialized() const { return initialized_.load(); }

    /**
     * @brief Return the id of the trimmed token, allocating the next one if new
     * @return INVALID_ARGUMENT for empty or all-whitespace text
     */
    core::Result<core::TokenId> ensure_token(const std::string& text);

    /**
     * @brief Token text for an id; empty string when unknown
     */
    core::Result<std::string> get_token(core::TokenId id);

    /**
     * @brief Id of an already assigned token, without allocating
     */
    core::Result<std::optional<core::TokenId>> find_token(const std::string& text);

    /**
     * @brief Rows matching the query, sorted by weight descending
     *
     * Unreadable blocks are skipped and logged.
     */
    core::Result<std::vector<core::EdgeRow>> get_adj(const AdjQuery& query);

    /**
     * @brief Replace or merge a token's rows and re-shard them
     *
     * With merge, incoming rows overwrite existing rows with the same
     * (neighbor_id, type); an incoming row without flags keeps the old flags.
     * Block keys no longer needed are deleted in the same batch.
     * A merge into a token with unreadable blocks fails with ENCODING_ERROR
     * and writes nothing; a replace overwrites them.
     */
    core::Result<void> upsert_adj(core::TokenId token_id,
                                  const std::vector<core::EdgeRow>& edges,
                                  UpsertOptions options = UpsertOptions());

    /**
     * @brief Merge-upsert every item; items without a resolvable id are skipped
     */
    core::Result<ImportReport> bulk_import(const ImportSource& source);
    core::Result<ImportReport> bulk_import(const std::vector<ImportItem>& items);

    core::Result<StoreStats> stats();

    /**
     * @brief Rewrite every readable block through the current codec
     * @return Number of blocks rewritten
     */
    core::Result<size_t> compact();

    /**
     * @brief Delete empty blocks, rewrite the readable rest unchanged
     *
     * Blocks that fail to decode are counted and left in place.
     */
    core::Result<GcReport> gc();

    /**
     * @brief Drop decayed rows according to policy
     * @param now_seconds Current time, epoch seconds
     */
    core::Result<TrimReport> trim(const core::GcPolicy& policy, int64_t now_seconds);

    const EdgeBlockCodec& codec() const { return *codec_; }
    StorageBackend& backend() { return *backend_; }

    /**
     * @brief Split rows into ceil(N / kBlockMax) blocks, at least one
     */
    static std::vector<core::EdgeBlock> Reshard(core::TokenId token_id,
                                                const std::vector<core::EdgeRow>& rows);

    /**
     * @brief Decay test of a single row
     */
    static bool ShouldTrim(const core::EdgeRow& row, int64_t now_seconds,
                           const core::GcPolicy& policy);

private:
    struct StoredBlock {
        uint32_t part;
        Bytes bytes;
    };

    core::Result<void> check_initialized() const;
    core::Result<std::vector<StoredBlock>> read_blocks(core::TokenId token_id);
    core::Result<std::vector<core::EdgeRow>> load_rows(core::TokenId token_id,
                                                       std::vector<uint32_t>* parts,
                                                       size_t* unreadable);
    core::Result<void> write_rows(core::TokenId token_id,
                                  const std::vector<core::EdgeRow>& rows,
                                  const std::vector<uint32_t>& existing_parts);

    std::shared_ptr<StorageBackend> backend_;
    std::shared_ptr<const EdgeBlockCodec> codec_;
    StoreObservers observers_;

    std::atomic<bool> initialized_{false};

    mutable std::shared_mutex tokens_mutex_;
    std::unordered_map<std::string, core::TokenId> ids_by_text_;
    std::unordered_map<core::TokenId, std::string> text_by_id_;
    core::TokenId next_id_ = 1;

    std::mutex write_mutex_;
};

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_SHARD_STORE_H_
