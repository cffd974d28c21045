#ifndef KGRAPH_ENGINE_ADJACENCY_ORACLE_H_
#define KGRAPH_ENGINE_ADJACENCY_ORACLE_H_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "kgraph/core/result.h"
#include "kgraph/engine/graph.h"

namespace kgraph {
namespace engine {

/**
 * @brief External source of candidate neighbors for a token
 *
 * The growth engine calls an oracle from several worker threads at once, so
 * implementations must be thread-safe. Failures are reported as
 * ORACLE_FAILURE; output is normalized by the engine before use.
 */
class AdjacencyOracle {
public:
    virtual ~AdjacencyOracle() = default;

    /// Initial neighborhood of the seed text.
    virtual core::Result<AdjacencyDelta> seed_adjacency(const std::string& token) = 0;

    /// Further neighbors of an existing node.
    virtual core::Result<AdjacencyDelta> expand_adjacency(const std::string& token) = 0;
};

/**
 * @brief Deterministic four-node neighborhood used when the oracle fails
 *
 * Nodes `<slug>-core`, `-context`, `-analogy`, `-role` with weights 0.82,
 * 0.64, 0.58, 0.52, each linked from `origin_id` (Slugify(token) if empty).
 */
AdjacencyDelta SyntheticDelta(const std::string& token, const std::string& origin_id = "");

/**
 * @brief Memoizes successful oracle answers per (call kind, lowercased token)
 */
class CachingOracle : public AdjacencyOracle {
public:
    explicit CachingOracle(std::shared_ptr<AdjacencyOracle> inner);

    core::Result<AdjacencyDelta> seed_adjacency(const std::string& token) override;
    core::Result<AdjacencyDelta> expand_adjacency(const std::string& token) override;

    size_t size() const;
    uint64_t hits() const;

private:
    core::Result<AdjacencyDelta> lookup(const std::string& kind, const std::string& token, bool seed);

    std::shared_ptr<AdjacencyOracle> inner_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AdjacencyDelta> cache_;
    uint64_t hits_ = 0;
};

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_ADJACENCY_ORACLE_H_
