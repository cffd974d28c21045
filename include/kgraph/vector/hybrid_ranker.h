#ifndef KGRAPH_VECTOR_HYBRID_RANKER_H_
#define KGRAPH_VECTOR_HYBRID_RANKER_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "kgraph/core/config.h"
#include "kgraph/core/result.h"
#include "kgraph/core/types.h"
#include "kgraph/storage/shard_store.h"
#include "kgraph/vector/vector_store.h"

namespace kgraph {
namespace vector {

struct HybridOptions {
    core::TokenId token_id = 0;
    size_t top_k = 10;
    double alpha = 0.6;  // edge weight share
    double beta = 0.4;   // cosine share
    std::optional<uint32_t> min_weight;
    std::vector<uint16_t> types;

    HybridOptions() = default;
    HybridOptions(core::TokenId id, size_t k, const core::HybridConfig& config = core::HybridConfig::Default())
        : token_id(id), top_k(k), alpha(config.alpha), beta(config.beta) {}
};

/**
 * @brief Suggest neighbors by blending stored edge weight with cosine similarity
 *
 * score = alpha * weight / max_weight + beta * cosine. Candidates come from
 * both sources (3 * top_k from each); a missing signal counts as 0.
 */
class HybridRanker {
public:
    HybridRanker(std::shared_ptr<storage::ShardStore> shards, std::shared_ptr<VectorStore> vectors);

    core::Result<std::vector<core::ScoredId>> hybrid(const HybridOptions& options);

private:
    std::shared_ptr<storage::ShardStore> shards_;
    std::shared_ptr<VectorStore> vectors_;
};

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_HYBRID_RANKER_H_
