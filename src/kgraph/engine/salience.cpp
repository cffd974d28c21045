#include "kgraph/engine/salience.h"

#include <algorithm>
#include <unordered_map>

namespace kgraph {
namespace engine {

std::vector<SalienceScore> ComputeSalience(const Graph& graph,
                                           const core::SalienceWeights& weights) {
    std::unordered_map<std::string, double> degree;
    std::unordered_map<std::string, double> weight_sum;
    for (const auto& edge : graph.edges()) {
        degree[edge.src] += 1.0;
        degree[edge.dst] += 1.0;
        weight_sum[edge.src] += edge.weight;
        weight_sum[edge.dst] += edge.weight;
    }

    std::vector<SalienceScore> scores;
    scores.reserve(graph.node_count());
    for (const auto& id : graph.order()) {
        const GraphNode* node = graph.find(id);
        SalienceScore s;
        s.id = id;
        s.score = weights.degree * degree[id] +
                  weights.weight_sum * weight_sum[id] +
                  weights.frequency * node->appearance_frequency;
        scores.push_back(std::move(s));
    }
    return scores;
}

std::vector<SalienceScore> ComputeContextSalience(const Graph& graph,
                                                  const std::vector<SalienceScore>& baseline,
                                                  const std::vector<NeighborhoodContext>& contexts,
                                                  const core::ContextSalienceWeights& weights) {
    double max_base = 0.0;
    for (const auto& s : baseline) max_base = std::max(max_base, s.score);

    std::unordered_map<std::string, double> intertwining;
    std::unordered_map<std::string, double> peakiness;
    for (const auto& context : contexts) {
        std::vector<std::string> ids = context.members;
        ids.push_back(context.anchor);
        for (const auto& id : ids) {
            intertwining[id] += 1.0;
            const GraphNode* node = graph.find(id);
            if (!node || node->embedding.empty()) continue;
            double peak = Peakiness(ProjectToBasis(context.basis, node->embedding));
            double& best = peakiness[id];
            best = std::max(best, peak);
        }
    }
    double max_inter = 0.0;
    for (const auto& kv : intertwining) max_inter = std::max(max_inter, kv.second);

    std::vector<SalienceScore> out;
    out.reserve(baseline.size());
    for (const auto& s : baseline) {
        double base = max_base > 0.0 ? s.score / max_base : 0.0;
        auto it = intertwining.find(s.id);
        double inter = (it != intertwining.end() && max_inter > 0.0) ? it->second / max_inter : 0.0;
        auto pk = peakiness.find(s.id);
        double peak = pk != peakiness.end() ? pk->second : 0.0;
        out.push_back({s.id, weights.base * base + weights.intertwining * inter +
                                 weights.peakiness * peak});
    }
    return out;
}

std::vector<std::string> TopSalienceTokens(const Graph& graph,
                                           const std::vector<SalienceScore>& scores,
                                           size_t k, bool prefer_real) {
    std::vector<SalienceScore> ranked = scores;
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const SalienceScore& a, const SalienceScore& b) { return a.score > b.score; });
    if (prefer_real) {
        std::stable_partition(ranked.begin(), ranked.end(), [&graph](const SalienceScore& s) {
            const GraphNode* node = graph.find(s.id);
            return node && !node->synthetic;
        });
    }
    std::vector<std::string> out;
    for (const auto& s : ranked) {
        if (out.size() >= k) break;
        out.push_back(s.id);
    }
    return out;
}

} // namespace engine
} // namespace kgraph
