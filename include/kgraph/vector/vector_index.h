#ifndef KGRAPH_VECTOR_VECTOR_INDEX_H_
#define KGRAPH_VECTOR_VECTOR_INDEX_H_

#include <functional>
#include <string>
#include <vector>

#include "kgraph/core/result.h"
#include "kgraph/core/types.h"

namespace kgraph {
namespace vector {

/**
 * @brief Visitor over candidate vectors; return false to stop
 */
using CandidateVisitor = std::function<bool(core::TokenId, const core::Vector&)>;

/**
 * @brief Enumerates every candidate the index may consider
 */
using CandidateScan = std::function<core::Result<void>(const CandidateVisitor&)>;

/**
 * @brief Similarity search behind the vector store
 *
 * The store notifies the index of every write, so an approximate structure
 * can maintain itself; callers only see search().
 */
class VectorIndex {
public:
    virtual ~VectorIndex() = default;

    virtual void on_put(core::TokenId id, const core::Vector& stored) = 0;

    /**
     * @brief Best matches for an already-normalized query
     *
     * score = dot(query, c) / |c|. The excluded id, length mismatches, zero
     * norms and non-finite scores are skipped; ids are unique.
     */
    virtual core::Result<std::vector<core::ScoredId>> search(const core::Vector& query,
                                                             size_t top_k,
                                                             core::TokenId exclude) = 0;

    virtual std::string name() const = 0;
};

/**
 * @brief Brute-force index over a full candidate scan
 */
class FlatVectorIndex : public VectorIndex {
public:
    explicit FlatVectorIndex(CandidateScan scan) : scan_(std::move(scan)) {}

    void on_put(core::TokenId, const core::Vector&) override {}

    core::Result<std::vector<core::ScoredId>> search(const core::Vector& query,
                                                     size_t top_k,
                                                     core::TokenId exclude) override;

    std::string name() const override { return "flat"; }

private:
    CandidateScan scan_;
};

} // namespace vector
} // namespace kgraph

#endif // KGRAPH_VECTOR_VECTOR_INDEX_H_
