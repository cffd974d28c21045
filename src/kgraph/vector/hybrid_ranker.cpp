#include "kgraph/vector/hybrid_ranker.h"

#include <algorithm>
#include <unordered_map>

#include "kgraph/common/logger.h"

namespace kgraph {
namespace vector {

HybridRanker::HybridRanker(std::shared_ptr<storage::ShardStore> shards, std::shared_ptr<VectorStore> vectors)
    : shards_(std::move(shards)), vectors_(std::move(vectors)) {}

core::Result<std::vector<core::ScoredId>> HybridRanker::hybrid(const HybridOptions& options) {
    using RankResult = core::Result<std::vector<core::ScoredId>>;
    const size_t top_k = std::max<size_t>(1, options.top_k);
    const size_t fetch = top_k * 3;

    struct Candidate {
        double weight = 0.0;
        double cosine = 0.0;
    };
    std::vector<core::TokenId> order;
    std::unordered_map<core::TokenId, Candidate> candidates;
    auto slot = [&](core::TokenId id) -> Candidate& {
        auto it = candidates.find(id);
        if (it == candidates.end()) {
            order.push_back(id);
            it = candidates.emplace(id, Candidate()).first;
        }
        return it->second;
    };

    if (shards_) {
        storage::AdjQuery query;
        query.token_id = options.token_id;
        query.types = options.types;
        query.min_weight = options.min_weight;
        query.limit = fetch;
        auto rows = shards_->get_adj(query);
        if (!rows.ok()) {
            return core::propagate<std::vector<core::ScoredId>>(rows);
        }
        for (const auto& row : rows.value()) {
            if (row.neighbor_id == options.token_id) continue;
            Candidate& c = slot(row.neighbor_id);
            c.weight = std::max(c.weight, static_cast<double>(row.weight));
        }
    }

    if (vectors_ && vectors_->initialized()) {
        auto similar = vectors_->similar(options.token_id, fetch);
        if (similar.ok()) {
            for (const auto& hit : similar.value()) {
                slot(hit.id).cosine = hit.score;
            }
        } else {
            KGRAPH_DEBUG("hybrid: no similarity signal for {}: {}", options.token_id, similar.error());
        }
    }

    double max_weight = 0.0;
    for (const auto& entry : candidates) {
        max_weight = std::max(max_weight, entry.second.weight);
    }
    if (max_weight <= 0.0) max_weight = 1.0;

    std::vector<core::ScoredId> ranked;
    ranked.reserve(order.size());
    for (core::TokenId id : order) {
        const Candidate& c = candidates[id];
        ranked.emplace_back(id, options.alpha * (c.weight / max_weight) + options.beta * c.cosine);
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const core::ScoredId& a, const core::ScoredId& b) { return a.score > b.score; });
    if (ranked.size() > top_k) {
        ranked.resize(top_k);
    }
    return RankResult(std::move(ranked));
}

} // namespace vector
} // namespace kgraph
