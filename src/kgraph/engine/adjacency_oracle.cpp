#include "kgraph/engine/adjacency_oracle.h"

#include <algorithm>
#include <cctype>
#include <utility>

namespace kgraph {
namespace engine {

namespace {

struct SyntheticFacet {
    const char* suffix;
    const char* role;
    double weight;
};

constexpr SyntheticFacet kFacets[] = {
    {"core", "core", 0.82},
    {"context", "context", 0.64},
    {"analogy", "analogy", 0.58},
    {"role", "role", 0.52},
};

std::string Lower(const std::string& text) {
    std::string out = text;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

AdjacencyDelta SyntheticDelta(const std::string& token, const std::string& origin_id) {
    AdjacencyDelta delta;
    std::string slug = Slugify(token);
    if (slug.empty()) slug = "token";
    std::string origin = origin_id.empty() ? slug : origin_id;

    for (const auto& facet : kFacets) {
        GraphNode node;
        node.id = slug + "-" + facet.suffix;
        node.label = token + " (" + facet.suffix + ")";
        node.weight = facet.weight;
        node.synthetic = true;
        delta.nodes.push_back(node);

        GraphEdge edge;
        edge.src = origin;
        edge.dst = node.id;
        edge.weight = facet.weight;
        edge.role = facet.role;
        delta.edges.push_back(std::move(edge));
    }
    return delta;
}

CachingOracle::CachingOracle(std::shared_ptr<AdjacencyOracle> inner)
    : inner_(std::move(inner)) {}

core::Result<AdjacencyDelta> CachingOracle::seed_adjacency(const std::string& token) {
    return lookup("seed", token, true);
}

core::Result<AdjacencyDelta> CachingOracle::expand_adjacency(const std::string& token) {
    return lookup("expand", token, false);
}

core::Result<AdjacencyDelta> CachingOracle::lookup(const std::string& kind,
                                                   const std::string& token, bool seed) {
    if (!inner_) {
        return core::Result<AdjacencyDelta>::error("no oracle configured",
                                                   core::Error::Code::NOT_INITIALIZED);
    }
    std::string key = kind + ":" + Lower(token);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            ++hits_;
            return core::Result<AdjacencyDelta>(it->second);
        }
    }
    // Two threads may miss on the same key; the later answer wins.
    auto result = seed ? inner_->seed_adjacency(token) : inner_->expand_adjacency(token);
    if (result.ok()) {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_[key] = result.value();
    }
    return result;
}

size_t CachingOracle::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

uint64_t CachingOracle::hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
}

} // namespace engine
} // namespace kgraph
