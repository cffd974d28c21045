#include "kgraph/vector/vector_index.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <unordered_set>

#include "kgraph/vector/quantization.h"

namespace kgraph {
namespace vector {

core::Result<std::vector<core::ScoredId>> FlatVectorIndex::search(const core::Vector& query,
                                                                  size_t top_k,
                                                                  core::TokenId exclude) {
    using SearchResult = core::Result<std::vector<core::ScoredId>>;
    std::vector<core::ScoredId> scored;
    if (top_k == 0 || query.empty()) {
        return SearchResult(std::move(scored));
    }

    std::unordered_set<core::TokenId> visited;
    visited.insert(exclude);
    auto scanned = scan_([&](core::TokenId id, const core::Vector& candidate) {
        if (candidate.size() != query.size()) return true;  // dimension mismatch
        if (!visited.insert(id).second) return true;
        const double norm = Norm(candidate);
        if (norm == 0.0 || !std::isfinite(norm)) return true;
        const double score = Dot(query, candidate) / norm;
        if (!std::isfinite(score)) return true;
        scored.emplace_back(id, score);
        return true;
    });
    if (!scanned.ok()) {
        return core::propagate<std::vector<core::ScoredId>>(scanned);
    }

    auto by_score = [](const core::ScoredId& a, const core::ScoredId& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.id < b.id;
    };
    if (scored.size() > top_k) {
        std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(top_k),
                          scored.end(), by_score);
        scored.resize(top_k);
    } else {
        std::sort(scored.begin(), scored.end(), by_score);
    }
    return SearchResult(std::move(scored));
}

} // namespace vector
} // namespace kgraph
