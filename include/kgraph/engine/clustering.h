#ifndef KGRAPH_ENGINE_CLUSTERING_H_
#define KGRAPH_ENGINE_CLUSTERING_H_

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "kgraph/core/types.h"
#include "kgraph/engine/graph.h"

namespace kgraph {
namespace engine {

constexpr double kSpectralPlaceholder = 0.5;

struct Cluster {
    std::vector<std::string> members;   // graph insertion order
    double semantic = 0.0;
    double structural = 0.0;
    double spectral = kSpectralPlaceholder;
    std::string narration;              // set when a thought sink answered
};

/**
 * @brief Connected components over edges with weight >= threshold
 *
 * Every node belongs to exactly one component; isolated nodes form
 * singletons. Components are ordered by their first member.
 */
std::vector<std::vector<std::string>> ConnectedComponents(const Graph& graph, double threshold);

/**
 * @brief Mean pairwise cosine of the embedded members, clamped to [0, 1]
 *
 * 0.5 when fewer than two members carry an embedding.
 */
double SemanticCoherence(const Graph& graph, const std::vector<std::string>& members);

/// min(1, 0.6 + 0.05 * size)
double StructuralScore(size_t size);

/**
 * @brief Components of at least min_size members with their scores filled in
 */
std::vector<Cluster> ClusterGraph(const Graph& graph, double threshold, size_t min_size = 2);

/**
 * @brief Optional collaborator that turns a cluster into prose
 */
class ThoughtSink {
public:
    virtual ~ThoughtSink() = default;

    /**
     * @param embeddings one entry per cluster member, empty when unembedded
     * @return narration, or nullopt to leave the cluster without one
     */
    virtual std::optional<std::string> narrate(const Cluster& cluster,
                                               const std::vector<core::Vector>& embeddings) = 0;
};

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_CLUSTERING_H_
