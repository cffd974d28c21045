#ifndef KGRAPH_VECTOR_VECTOR_STORE_H_
#define KGRAPH_VECTOR_VECTOR_STORE_H_

#include <atomic>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "kgraph/core/config.h"
#include "kgraph/core/result.h"
#include "kgraph/core/types.h"
#include "kgraph/storage/backend.h"
#include "kgraph/vector/quantization.h"
#include "kgraph/vector/vector_index.h"

namespace kgraph {
namespace vector {

/**
 * @brief Persisted form of one embedding
 */
struct VectorRecord {
    std::string provider;
    uint32_t dim = 0;
    core::TokenId id = 0;
    bool quantized = false;
    core::Vector values;        // when !quantized
    QuantizedVector quantized_values;

    core::Vector decode() const {
        return quantized ? Dequantize8(quantized_values) : values;
    }
};

storage::Bytes EncodeVectorRecord(const VectorRecord& record);
core::Result<VectorRecord> DecodeVectorRecord(const storage::Bytes& bytes);

/**
 * @brief Per-token embeddings for one (provider, dim) pair
 *
 * Records live in the EMBEDDINGS bucket under "provider:dim:id". Reads go
 * through an in-process cache; concurrent readers may fill it redundantly.
 */
class VectorStore {
public:
    explicit VectorStore(std::shared_ptr<storage::StorageBackend> backend);

    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /**
     * @brief Configure provider/dim and open the backend; clears the cache
     */
    core::Result<void> init(const core::VectorConfig& config);
    bool initialized() const { return initialized_.load(); }

    /**
     * @brief Store a vector, normalized and quantized as configured
     * @return DIMENSION_MISMATCH when the length differs from dim
     */
    core::Result<void> put(core::TokenId id, const core::Vector& values);

    /**
     * @brief Cached or persisted vector, dequantized; nullopt when absent
     */
    core::Result<std::optional<core::Vector>> get(core::TokenId id);

    /**
     * @brief Nearest stored vectors to the vector of `id`
     *
     * Empty when `id` has no vector.
     */
    core::Result<std::vector<core::ScoredId>> similar(core::TokenId id, size_t top_k);

    /**
     * @brief Swap the similarity index; callers of similar() are unaffected
     */
    void set_index(std::unique_ptr<VectorIndex> index);
    const VectorIndex& index() const { return *index_; }

    /**
     * @brief Visit every stored vector of the configured provider/dim, then
     * cached vectors not yet persisted
     */
    core::Result<void> scan(const CandidateVisitor& visitor);

    std::string record_key(core::TokenId id) const;
    std::string key_prefix() const;
    const core::VectorConfig& config() const { return config_; }

    size_t cache_size() const;
    void clear_cache();

private:
    core::Result<void> check_initialized() const;

    std::shared_ptr<storage::StorageBackend> backend_;
    core::VectorConfig config_;
    std::atomic<bool> initialized_{false};
    std::unique_ptr<VectorIndex> index_;

    mutable std::shared_mutex cache_mutex_;
    std::unordered_map<std::string, std::pair<core::TokenId, core::Vector>> cache_;
};

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_VECTOR_STORE_H_
