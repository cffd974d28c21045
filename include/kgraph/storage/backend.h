#ifndef KGRAPH_STORAGE_BACKEND_H_
#define KGRAPH_STORAGE_BACKEND_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "kgraph/core/result.h"

namespace kgraph {
namespace storage {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Logical object stores of a backend
 */
enum class Bucket {
    TOKENS,
    EDGE_BLOCKS,
    EMBEDDINGS,
    META
};

const char* BucketName(Bucket bucket);

/// All buckets, in a stable order.
const std::vector<Bucket>& AllBuckets();

/**
 * @brief Group of puts and deletes applied together
 */
class WriteBatch {
public:
    struct Op {
        Bucket bucket;
        std::string key;
        std::optional<Bytes> value;  // nullopt means delete
    };

    void put(Bucket bucket, std::string key, Bytes value) {
        ops_.push_back(Op{bucket, std::move(key), std::move(value)});
    }

    void remove(Bucket bucket, std::string key) {
        ops_.push_back(Op{bucket, std::move(key), std::nullopt});
    }

    const std::vector<Op>& ops() const { return ops_; }
    bool empty() const { return ops_.empty(); }
    size_t size() const { return ops_.size(); }

private:
    std::vector<Op> ops_;
};

/**
 * @brief Scan callback; return false to stop the scan early
 */
using ScanVisitor = std::function<bool(const std::string& key, const Bytes& value)>;

/**
 * @brief Minimal transactional key-value object store
 *
 * The shard and vector stores depend only on this capability set. Keys are
 * visited in ascending byte order by scan().
 */
class StorageBackend {
public:
    virtual ~StorageBackend() = default;

    /**
     * @brief Open or create the store
     * @return STORAGE_UNAVAILABLE when the durable medium cannot be used
     */
    virtual core::Result<void> open() = 0;

    virtual core::Result<std::optional<Bytes>> get(Bucket bucket, const std::string& key) = 0;
    virtual core::Result<void> put(Bucket bucket, const std::string& key, const Bytes& value) = 0;
    virtual core::Result<void> remove(Bucket bucket, const std::string& key) = 0;

    /**
     * @brief Visit every record of a bucket whose key starts with prefix
     */
    virtual core::Result<void> scan(Bucket bucket, const std::string& prefix,
                                    const ScanVisitor& visitor) = 0;

    virtual core::Result<size_t> count(Bucket bucket) = 0;

    /**
     * @brief Apply a batch of mutations as one transaction
     */
    virtual core::Result<void> apply(const WriteBatch& batch) = 0;

    virtual std::string name() const = 0;

    /// True when records survive process restarts.
    virtual bool durable() const = 0;
};

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_BACKEND_H_
