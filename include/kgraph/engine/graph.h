#ifndef KGRAPH_ENGINE_GRAPH_H_
#define KGRAPH_ENGINE_GRAPH_H_

#include <cstddef>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "kgraph/core/types.h"

namespace kgraph {
namespace engine {

enum class Layer {
    VISIBLE,  // breadth frontier
    HIDDEN    // salience-triggered deep dive
};

const char* LayerName(Layer layer);

struct GraphNode {
    std::string id;
    std::string label;
    double weight = 0.0;
    Layer layer = Layer::VISIBLE;
    double appearance_frequency = 0.0;
    core::Vector embedding;     // empty until embedded
    bool synthetic = false;     // produced by the fallback, not the oracle
};

struct GraphEdge {
    std::string src;
    std::string dst;
    double weight = 0.1;
    Layer layer = Layer::VISIBLE;
    std::string role;
};

/**
 * @brief Working graph of one exploration run
 *
 * Nodes keep insertion order, which is the tie-break order for salience.
 * There is at most one edge per (src, dst); adding it again keeps the larger
 * weight.
 */
class Graph {
public:
    /**
     * @brief Insert a node
     * @return false if the id is already present (existing node untouched)
     */
    bool add_node(GraphNode node);

    /**
     * @brief Insert or strengthen an edge; both endpoints must exist
     * @return true when a new edge was created
     */
    bool add_edge(GraphEdge edge);

    bool has_node(const std::string& id) const { return nodes_.count(id) > 0; }
    const GraphNode* find(const std::string& id) const;
    GraphNode* find(const std::string& id);

    const std::vector<std::string>& order() const { return order_; }
    const std::vector<GraphEdge>& edges() const { return edges_; }

    size_t node_count() const { return order_.size(); }
    size_t edge_count() const { return edges_.size(); }
    bool empty() const { return order_.empty(); }

    /**
     * @brief Distinct neighbor ids over an undirected view, first-seen order
     */
    std::vector<std::string> neighbors(const std::string& id) const;

    /**
     * @brief Copy keeping the given nodes and the edges between them
     */
    Graph subgraph(const std::unordered_set<std::string>& keep) const;

    /// Same node ids in the same order and the same edges.
    bool operator==(const Graph& other) const;
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    static std::string EdgeKey(const std::string& src, const std::string& dst) {
        return src + '\x1f' + dst;
    }

    std::unordered_map<std::string, GraphNode> nodes_;
    std::vector<std::string> order_;
    std::vector<GraphEdge> edges_;
    std::unordered_map<std::string, size_t> edge_index_;
};

/**
 * @brief The single shape of oracle output accepted by the engine
 */
struct AdjacencyDelta {
    std::vector<GraphNode> nodes;
    std::vector<GraphEdge> edges;
};

/**
 * @brief Lowercase, non-alphanumerics to '-', trimmed, at most 80 chars
 */
std::string Slugify(const std::string& text);

/**
 * @brief Canonicalize oracle output
 *
 * Ids are slugified, labels default to the original id, duplicate nodes and
 * self loops are dropped, non-finite weights are repaired, and endpoints
 * that only appear in edges become nodes.
 */
AdjacencyDelta NormalizeDelta(const AdjacencyDelta& raw);

struct ApplyOutcome {
    std::vector<std::string> added_nodes;
    size_t added_edges = 0;
};

/**
 * @brief Merge a normalized delta into the graph under node/edge budgets
 *
 * New nodes and new edges take `layer`. Nodes already present only get their
 * appearance frequency bumped.
 */
ApplyOutcome ApplyDelta(Graph& graph, const AdjacencyDelta& delta, Layer layer,
                        size_t max_nodes, size_t max_edges);

/**
 * @brief First max_nodes nodes and first max_edges surviving edges
 */
Graph LimitGraph(const Graph& graph, size_t max_nodes, size_t max_edges);

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_GRAPH_H_
