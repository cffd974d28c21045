#ifndef KGRAPH_ENGINE_COLLAPSE_H_
#define KGRAPH_ENGINE_COLLAPSE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "kgraph/engine/graph.h"

namespace kgraph {
namespace engine {

constexpr size_t kDefaultFanOut = 9;

/**
 * @brief Prune the graph to the neighborhoods of the given centers
 *
 * Keeps each center that exists, its top weighted direct neighbors (at most
 * min(fan_out, node count)), and every node within `radius` undirected hops of
 * a center. Edges survive when both endpoints do. If fewer than two nodes
 * would remain the input is returned unchanged.
 */
Graph Collapse(const Graph& graph, const std::vector<std::string>& centers,
               size_t radius, size_t fan_out = kDefaultFanOut);

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_COLLAPSE_H_
