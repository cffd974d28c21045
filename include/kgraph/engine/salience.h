#ifndef KGRAPH_ENGINE_SALIENCE_H_
#define KGRAPH_ENGINE_SALIENCE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "kgraph/core/config.h"
#include "kgraph/engine/context_basis.h"
#include "kgraph/engine/graph.h"

namespace kgraph {
namespace engine {

struct SalienceScore {
    std::string id;
    double score = 0.0;
};

/**
 * @brief degree, incident weight sum and appearance frequency blended per node
 *
 * Degree counts incident edges. Scores come back in graph insertion order.
 */
std::vector<SalienceScore> ComputeSalience(const Graph& graph,
                                           const core::SalienceWeights& weights);

/**
 * @brief Baseline blended with context intertwining and projection peakiness
 *
 * Baseline is divided by its maximum; intertwining is the number of contexts
 * that contain the node (as anchor or member) divided by the maximum such
 * count; peakiness is the best Peakiness() of the node embedding over the
 * contexts that contain it.
 */
std::vector<SalienceScore> ComputeContextSalience(const Graph& graph,
                                                  const std::vector<SalienceScore>& baseline,
                                                  const std::vector<NeighborhoodContext>& contexts,
                                                  const core::ContextSalienceWeights& weights);

/**
 * @brief Ids of the k highest scores, stable on ties
 *
 * With prefer_real, oracle-backed nodes rank ahead of synthetic ones.
 */
std::vector<std::string> TopSalienceTokens(const Graph& graph,
                                           const std::vector<SalienceScore>& scores,
                                           size_t k, bool prefer_real = true);

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_SALIENCE_H_
