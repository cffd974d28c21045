#include "kgraph/engine/collapse.h"

#include <algorithm>
#include <deque>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace kgraph {
namespace engine {

Graph Collapse(const Graph& graph, const std::vector<std::string>& centers,
               size_t radius, size_t fan_out) {
    std::unordered_map<std::string, std::vector<std::pair<std::string, double>>> adjacency;
    for (const auto& edge : graph.edges()) {
        adjacency[edge.src].emplace_back(edge.dst, edge.weight);
        adjacency[edge.dst].emplace_back(edge.src, edge.weight);
    }

    std::unordered_set<std::string> keep;
    size_t cap = std::min(fan_out, graph.node_count());
    for (const auto& center : centers) {
        if (!graph.has_node(center)) continue;
        keep.insert(center);

        // An edge pair a->b, b->a names the same neighbor twice; keep its heavier weight.
        std::vector<std::pair<std::string, double>> neighbors;
        std::unordered_map<std::string, size_t> slot;
        for (const auto& n : adjacency[center]) {
            if (n.first == center) continue;
            auto it = slot.find(n.first);
            if (it == slot.end()) {
                slot.emplace(n.first, neighbors.size());
                neighbors.push_back(n);
            } else {
                neighbors[it->second].second = std::max(neighbors[it->second].second, n.second);
            }
        }
        std::stable_sort(neighbors.begin(), neighbors.end(),
                         [](const std::pair<std::string, double>& a,
                            const std::pair<std::string, double>& b) { return a.second > b.second; });
        size_t taken = 0;
        for (const auto& n : neighbors) {
            if (taken >= cap) break;
            keep.insert(n.first);
            ++taken;
        }

        std::unordered_map<std::string, size_t> depth;
        std::deque<std::string> queue;
        depth[center] = 0;
        queue.push_back(center);
        while (!queue.empty()) {
            std::string current = queue.front();
            queue.pop_front();
            size_t d = depth[current];
            if (d >= radius) continue;
            for (const auto& n : adjacency[current]) {
                if (depth.count(n.first)) continue;
                depth[n.first] = d + 1;
                keep.insert(n.first);
                queue.push_back(n.first);
            }
        }
    }

    if (keep.size() < 2) {
        return graph;
    }
    return graph.subgraph(keep);
}

} // namespace engine
} // namespace kgraph
