#include "kgraph/engine/clustering.h"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>

#include "kgraph/vector/quantization.h"

namespace kgraph {
namespace engine {

std::vector<std::vector<std::string>> ConnectedComponents(const Graph& graph, double threshold) {
    std::unordered_map<std::string, std::vector<std::string>> adjacency;
    for (const auto& edge : graph.edges()) {
        if (edge.weight < threshold) continue;
        adjacency[edge.src].push_back(edge.dst);
        adjacency[edge.dst].push_back(edge.src);
    }

    std::unordered_map<std::string, size_t> rank;
    for (size_t i = 0; i < graph.order().size(); ++i) rank[graph.order()[i]] = i;

    std::vector<std::vector<std::string>> components;
    std::unordered_set<std::string> visited;
    for (const auto& start : graph.order()) {
        if (visited.count(start)) continue;
        std::vector<std::string> component;
        std::deque<std::string> queue{start};
        visited.insert(start);
        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop_front();
            component.push_back(current);
            for (const auto& next : adjacency[current]) {
                if (visited.insert(next).second) queue.push_back(next);
            }
        }
        std::sort(component.begin(), component.end(),
                  [&rank](const std::string& a, const std::string& b) { return rank[a] < rank[b]; });
        components.push_back(std::move(component));
    }
    return components;
}

double SemanticCoherence(const Graph& graph, const std::vector<std::string>& members) {
    std::vector<const core::Vector*> vectors;
    for (const auto& id : members) {
        const GraphNode* node = graph.find(id);
        if (node && !node->embedding.empty()) vectors.push_back(&node->embedding);
    }
    if (vectors.size() < 2) {
        return 0.5;
    }
    double sum = 0.0;
    size_t pairs = 0;
    for (size_t i = 0; i < vectors.size(); ++i) {
        for (size_t j = i + 1; j < vectors.size(); ++j) {
            if (vectors[i]->size() != vectors[j]->size()) continue;
            sum += vector::Cosine(*vectors[i], *vectors[j]);
            ++pairs;
        }
    }
    if (pairs == 0) {
        return 0.5;
    }
    return std::min(1.0, std::max(0.0, sum / static_cast<double>(pairs)));
}

double StructuralScore(size_t size) {
    return std::min(1.0, 0.6 + 0.05 * static_cast<double>(size));
}

std::vector<Cluster> ClusterGraph(const Graph& graph, double threshold, size_t min_size) {
    std::vector<Cluster> clusters;
    for (auto& members : ConnectedComponents(graph, threshold)) {
        if (members.size() < min_size) continue;
        Cluster cluster;
        cluster.semantic = SemanticCoherence(graph, members);
        cluster.structural = StructuralScore(members.size());
        cluster.members = std::move(members);
        clusters.push_back(std::move(cluster));
    }
    return clusters;
}

} // namespace engine
} // namespace kgraph
