#include "kgraph/engine/graph.h"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace kgraph {
namespace engine {

namespace {

constexpr size_t kMaxSlugLength = 80;
constexpr double kDefaultEdgeWeight = 0.1;

} // namespace

const char* LayerName(Layer layer) {
    return layer == Layer::HIDDEN ? "hidden" : "visible";
}

bool Graph::add_node(GraphNode node) {
    if (node.id.empty() || nodes_.count(node.id)) {
        return false;
    }
    order_.push_back(node.id);
    std::string id = node.id;
    nodes_.emplace(std::move(id), std::move(node));
    return true;
}

bool Graph::add_edge(GraphEdge edge) {
    if (!has_node(edge.src) || !has_node(edge.dst)) {
        return false;
    }
    std::string key = EdgeKey(edge.src, edge.dst);
    auto it = edge_index_.find(key);
    if (it != edge_index_.end()) {
        GraphEdge& existing = edges_[it->second];
        existing.weight = std::max(existing.weight, edge.weight);
        return false;
    }
    edge_index_.emplace(std::move(key), edges_.size());
    edges_.push_back(std::move(edge));
    return true;
}

const GraphNode* Graph::find(const std::string& id) const {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

GraphNode* Graph::find(const std::string& id) {
    auto it = nodes_.find(id);
    return it == nodes_.end() ? nullptr : &it->second;
}

std::vector<std::string> Graph::neighbors(const std::string& id) const {
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;
    for (const auto& edge : edges_) {
        const std::string* other = nullptr;
        if (edge.src == id) other = &edge.dst;
        else if (edge.dst == id) other = &edge.src;
        if (other && seen.insert(*other).second) {
            out.push_back(*other);
        }
    }
    return out;
}

Graph Graph::subgraph(const std::unordered_set<std::string>& keep) const {
    Graph out;
    for (const auto& id : order_) {
        if (keep.count(id)) out.add_node(nodes_.at(id));
    }
    for (const auto& edge : edges_) {
        if (keep.count(edge.src) && keep.count(edge.dst)) out.add_edge(edge);
    }
    return out;
}

bool Graph::operator==(const Graph& other) const {
    if (order_ != other.order_ || edges_.size() != other.edges_.size()) {
        return false;
    }
    for (size_t i = 0; i < edges_.size(); ++i) {
        const GraphEdge& a = edges_[i];
        const GraphEdge& b = other.edges_[i];
        if (a.src != b.src || a.dst != b.dst || a.weight != b.weight || a.layer != b.layer) {
            return false;
        }
    }
    return true;
}

std::string Slugify(const std::string& text) {
    std::string slug;
    slug.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c)) {
            slug.push_back(static_cast<char>(std::tolower(c)));
        } else if (slug.empty() || slug.back() != '-') {
            slug.push_back('-');
        }
    }
    size_t begin = slug.find_first_not_of('-');
    if (begin == std::string::npos) {
        return std::string();
    }
    size_t end = slug.find_last_not_of('-');
    slug = slug.substr(begin, end - begin + 1);
    if (slug.size() > kMaxSlugLength) {
        slug.resize(kMaxSlugLength);
        while (!slug.empty() && slug.back() == '-') slug.pop_back();
    }
    return slug;
}

AdjacencyDelta NormalizeDelta(const AdjacencyDelta& raw) {
    AdjacencyDelta out;
    std::unordered_set<std::string> ids;

    for (const auto& node : raw.nodes) {
        std::string id = Slugify(node.id.empty() ? node.label : node.id);
        if (id.empty() || !ids.insert(id).second) continue;
        GraphNode clean = node;
        clean.id = id;
        if (clean.label.empty()) clean.label = node.id.empty() ? id : node.id;
        if (!std::isfinite(clean.weight) || clean.weight < 0.0) clean.weight = 0.0;
        if (!std::isfinite(clean.appearance_frequency) || clean.appearance_frequency < 0.0) {
            clean.appearance_frequency = 0.0;
        }
        out.nodes.push_back(std::move(clean));
    }

    for (const auto& edge : raw.edges) {
        GraphEdge clean = edge;
        clean.src = Slugify(edge.src);
        clean.dst = Slugify(edge.dst);
        if (clean.src.empty() || clean.dst.empty() || clean.src == clean.dst) continue;
        if (!std::isfinite(clean.weight)) clean.weight = kDefaultEdgeWeight;
        if (clean.weight < 0.0) clean.weight = 0.0;
        if (clean.role.empty()) clean.role = "instance";
        for (const auto* endpoint : {&edge.src, &edge.dst}) {
            std::string id = Slugify(*endpoint);
            if (ids.insert(id).second) {
                GraphNode implied;
                implied.id = id;
                implied.label = *endpoint;
                out.nodes.push_back(std::move(implied));
            }
        }
        out.edges.push_back(std::move(clean));
    }
    return out;
}

ApplyOutcome ApplyDelta(Graph& graph, const AdjacencyDelta& delta, Layer layer,
                        size_t max_nodes, size_t max_edges) {
    ApplyOutcome outcome;
    for (const auto& node : delta.nodes) {
        if (GraphNode* existing = graph.find(node.id)) {
            existing->appearance_frequency += 1.0;
            continue;
        }
        if (graph.node_count() >= max_nodes) continue;
        GraphNode added = node;
        added.layer = layer;
        added.appearance_frequency = std::max(1.0, node.appearance_frequency);
        if (graph.add_node(std::move(added))) {
            outcome.added_nodes.push_back(node.id);
        }
    }
    for (const auto& edge : delta.edges) {
        if (graph.edge_count() >= max_edges) break;
        GraphEdge added = edge;
        added.layer = layer;
        if (graph.add_edge(std::move(added))) {
            ++outcome.added_edges;
        }
    }
    return outcome;
}

Graph LimitGraph(const Graph& graph, size_t max_nodes, size_t max_edges) {
    if (graph.node_count() <= max_nodes && graph.edge_count() <= max_edges) {
        return graph;
    }
    Graph out;
    for (const auto& id : graph.order()) {
        if (out.node_count() >= max_nodes) break;
        out.add_node(*graph.find(id));
    }
    for (const auto& edge : graph.edges()) {
        if (out.edge_count() >= max_edges) break;
        out.add_edge(edge);
    }
    return out;
}

} // namespace engine
} // namespace kgraph
