#ifndef KGRAPH_ENGINE_CONTEXT_BASIS_H_
#define KGRAPH_ENGINE_CONTEXT_BASIS_H_

#include <cstddef>
#include <string>
#include <vector>

#include "kgraph/core/types.h"
#include "kgraph/engine/graph.h"

namespace kgraph {
namespace engine {

/**
 * @brief Orthonormal axes spanning a token neighborhood in embedding space
 */
struct ContextBasis {
    std::vector<core::Vector> axes;
    size_t dim = 0;

    size_t rank() const { return axes.size(); }
    bool empty() const { return axes.empty(); }
};

struct Projection {
    std::vector<double> coords;   // coordinate per axis
    std::vector<double> probs;    // squared coordinates
    core::Vector projected;       // reconstruction in the original space
};

/**
 * @brief Gram-Schmidt over anchor then members
 *
 * Vectors whose dimension differs from the anchor are ignored, as are
 * residuals with norm below 1e-6. At most min(max_axes, dim) axes.
 */
ContextBasis BuildContextBasis(const core::Vector& anchor,
                               const std::vector<core::Vector>& members,
                               size_t max_axes);

/**
 * @brief Project v onto the basis; empty projection on dimension mismatch
 */
Projection ProjectToBasis(const ContextBasis& basis, const core::Vector& v);

/**
 * @brief max(prob) / sum(prob), 0 when the projection carries no energy
 */
double Peakiness(const Projection& projection);

/**
 * @brief Neighborhood of one anchor node: the anchor plus embedded neighbors
 */
struct NeighborhoodContext {
    std::string anchor;
    std::vector<std::string> members;
    ContextBasis basis;
};

/**
 * @brief One context per embedded anchor; anchors without embeddings are skipped
 */
std::vector<NeighborhoodContext> BuildNeighborhoodContexts(const Graph& graph,
                                                           const std::vector<std::string>& anchors,
                                                           size_t max_axes);

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_CONTEXT_BASIS_H_
