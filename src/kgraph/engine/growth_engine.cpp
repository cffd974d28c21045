#include "kgraph/engine/growth_engine.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "kgraph/common/logger.h"
#include "kgraph/engine/collapse.h"

namespace kgraph {
namespace engine {

namespace {

constexpr size_t kContextAxes = 8;

std::string LowerTrim(const std::string& text) {
    std::string out = core::TrimToken(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Strongest distinct neighbors of the sources, excluding the sources.
std::vector<std::string> PickFrontier(const Graph& graph, const std::vector<std::string>& sources,
                                      size_t limit) {
    std::unordered_set<std::string> source_set(sources.begin(), sources.end());
    std::vector<std::pair<std::string, double>> candidates;
    std::unordered_map<std::string, size_t> index;
    for (const auto& edge : graph.edges()) {
        const std::string* other = nullptr;
        if (source_set.count(edge.src)) other = &edge.dst;
        else if (source_set.count(edge.dst)) other = &edge.src;
        if (!other || source_set.count(*other)) continue;
        auto it = index.find(*other);
        if (it == index.end()) {
            index.emplace(*other, candidates.size());
            candidates.emplace_back(*other, edge.weight);
        } else {
            candidates[it->second].second = std::max(candidates[it->second].second, edge.weight);
        }
    }
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const std::pair<std::string, double>& a,
                        const std::pair<std::string, double>& b) { return a.second > b.second; });
    std::vector<std::string> out;
    for (const auto& c : candidates) {
        if (out.size() >= limit) break;
        out.push_back(c.first);
    }
    return out;
}

void TrimBranches(AdjacencyDelta& delta, const std::string& origin, size_t cap) {
    if (cap == 0) {
        return;
    }
    std::vector<GraphNode> others;
    std::vector<GraphNode> kept;
    for (auto& node : delta.nodes) {
        if (node.id == origin) kept.push_back(std::move(node));
        else others.push_back(std::move(node));
    }
    std::stable_sort(others.begin(), others.end(),
                     [](const GraphNode& a, const GraphNode& b) { return a.weight > b.weight; });
    if (others.size() > cap) others.resize(cap);
    for (auto& node : others) kept.push_back(std::move(node));
    delta.nodes = std::move(kept);
}

} // namespace

const char* GrowthStateName(GrowthState state) {
    switch (state) {
        case GrowthState::SEEDED: return "seeded";
        case GrowthState::EXPAND_RING: return "expand_ring";
        case GrowthState::EXPAND_CHILDREN: return "expand_children";
        case GrowthState::LIMIT_CHECK: return "limit_check";
        case GrowthState::COLLAPSE: return "collapse";
        case GrowthState::HUB_SELECT: return "hub_select";
        case GrowthState::STABILITY_CHECK: return "stability_check";
        case GrowthState::TERMINATE: return "terminate";
        case GrowthState::FINALIZE: return "finalize";
    }
    return "unknown";
}

struct GrowthEngine::RunState {
    Graph graph;
    std::mutex apply_mutex;
    std::unordered_set<std::string> expanded;
    std::vector<ExpansionError> errors;
    size_t synthetic_fallbacks = 0;
    std::atomic<bool> aborted{false};
};

GrowthEngine::GrowthEngine(core::GrowthConfig config, GrowthDependencies deps)
    : config_(std::move(config)), deps_(std::move(deps)) {}

bool GrowthEngine::abort_requested() const {
    return deps_.should_abort && deps_.should_abort();
}

void GrowthEngine::enter(GrowthState state, uint32_t iteration) const {
    KGRAPH_TRACE("growth: iteration {} -> {}", iteration, GrowthStateName(state));
    if (deps_.on_state) {
        deps_.on_state(state, iteration);
    }
}

core::Result<AdjacencyDelta> GrowthEngine::fetch(const WorkItem& item, RunState& state) {
    core::Result<AdjacencyDelta> answer = core::Result<AdjacencyDelta>::error(
        "oracle returned nothing", core::Error::Code::ORACLE_FAILURE);
    try {
        answer = item.seed ? deps_.oracle->seed_adjacency(item.label)
                           : deps_.oracle->expand_adjacency(item.label);
    } catch (const std::exception& e) {
        answer = core::Result<AdjacencyDelta>::error(e.what(), core::Error::Code::ORACLE_FAILURE);
    }
    if (answer.ok()) {
        return core::Result<AdjacencyDelta>(NormalizeDelta(answer.value()));
    }
    if (!config_.allow_synthetic_fallback) {
        return core::Result<AdjacencyDelta>::error(answer.error(), core::Error::Code::ORACLE_FAILURE);
    }
    KGRAPH_WARN("growth: oracle failed for '{}' ({}), using synthetic neighborhood",
                item.label, answer.error());
    {
        std::lock_guard<std::mutex> lock(state.apply_mutex);
        ++state.synthetic_fallbacks;
    }
    return core::Result<AdjacencyDelta>(NormalizeDelta(SyntheticDelta(item.label, item.node_id)));
}

void GrowthEngine::embed_nodes(std::vector<GraphNode*>& nodes) {
    if (nodes.empty()) {
        return;
    }
    if (deps_.shards && deps_.embeddings) {
        for (GraphNode* node : nodes) {
            auto id = deps_.shards->ensure_token(node->label);
            if (!id.ok()) {
                KGRAPH_DEBUG("growth: no token id for '{}': {}", node->label, id.error());
                continue;
            }
            auto vec = deps_.embeddings->ensure_embedding(id.value(), node->label);
            if (vec.ok()) {
                node->embedding = vec.take_value();
            } else {
                KGRAPH_DEBUG("growth: embedding failed for '{}': {}", node->label, vec.error());
            }
        }
        return;
    }
    if (!deps_.embedder) {
        return;
    }
    std::vector<std::string> texts;
    texts.reserve(nodes.size());
    for (const GraphNode* node : nodes) texts.push_back(node->label);
    auto vectors = deps_.embedder->embed(texts);
    if (!vectors.ok()) {
        KGRAPH_DEBUG("growth: embedding batch of {} failed: {}", texts.size(), vectors.error());
        return;
    }
    if (vectors.value().size() != nodes.size()) {
        KGRAPH_WARN("growth: embedder returned {} vectors for {} texts",
                    vectors.value().size(), nodes.size());
        return;
    }
    for (size_t i = 0; i < nodes.size(); ++i) {
        nodes[i]->embedding = std::move(vectors.value()[i]);
    }
}

void GrowthEngine::embed_new_nodes(AdjacencyDelta& delta, RunState& state) {
    std::vector<GraphNode*> pending;
    {
        std::lock_guard<std::mutex> lock(state.apply_mutex);
        for (auto& node : delta.nodes) {
            if (node.embedding.empty() && !state.graph.has_node(node.id)) {
                pending.push_back(&node);
            }
        }
    }
    embed_nodes(pending);
}

void GrowthEngine::expand(RunState& state, std::vector<WorkItem> items, Layer layer) {
    std::deque<WorkItem> queue;
    {
        std::lock_guard<std::mutex> lock(state.apply_mutex);
        for (auto& item : items) {
            if (!item.seed && !state.expanded.insert(item.node_id).second) continue;
            queue.push_back(std::move(item));
        }
    }
    if (queue.empty()) {
        return;
    }

    std::mutex queue_mutex;
    auto worker = [&]() {
        while (true) {
            WorkItem item;
            {
                std::lock_guard<std::mutex> lock(queue_mutex);
                if (queue.empty() || state.aborted.load()) {
                    return;
                }
                if (abort_requested()) {
                    state.aborted.store(true);
                    return;
                }
                {
                    std::lock_guard<std::mutex> apply(state.apply_mutex);
                    if (state.graph.node_count() >= config_.max_nodes ||
                        state.graph.edge_count() >= config_.max_edges) {
                        return;
                    }
                }
                item = std::move(queue.front());
                queue.pop_front();
            }

            auto delta = fetch(item, state);
            if (!delta.ok()) {
                KGRAPH_WARN("growth: expansion of '{}' abandoned: {}", item.label, delta.error());
                std::lock_guard<std::mutex> lock(state.apply_mutex);
                state.errors.push_back({item.label, delta.code(), delta.error()});
                continue;
            }
            AdjacencyDelta d = delta.take_value();
            TrimBranches(d, item.node_id, item.branch_cap);
            embed_new_nodes(d, state);

            if (state.aborted.load() || abort_requested()) {
                state.aborted.store(true);
                return;
            }
            std::lock_guard<std::mutex> lock(state.apply_mutex);
            ApplyOutcome outcome = ApplyDelta(state.graph, d, layer,
                                              config_.max_nodes, config_.max_edges);
            KGRAPH_DEBUG("growth: '{}' added {} nodes, {} edges ({})", item.label,
                         outcome.added_nodes.size(), outcome.added_edges, LayerName(layer));
        }
    };

    size_t workers = std::min<size_t>(std::max<uint32_t>(1, config_.concurrency), queue.size());
    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }
}

std::vector<SalienceScore> GrowthEngine::salience(const Graph& graph) const {
    std::vector<SalienceScore> base = ComputeSalience(graph, config_.salience);
    if (!config_.use_context_salience) {
        return base;
    }
    std::vector<std::string> anchors =
        TopSalienceTokens(graph, base, std::max<uint32_t>(1, config_.ring_size));
    auto contexts = BuildNeighborhoodContexts(graph, anchors, kContextAxes);
    return ComputeContextSalience(graph, base, contexts, config_.context_salience);
}

std::string GrowthEngine::select_hub(const Graph& graph, const std::string& previous) const {
    std::unordered_set<std::string> stopwords;
    for (const auto& w : config_.stopwords) stopwords.insert(LowerTrim(w));

    std::string best;
    double best_score = 0.0;
    for (const auto& s : salience(graph)) {
        const GraphNode* node = graph.find(s.id);
        if (!node || stopwords.count(LowerTrim(node->label))) continue;
        if (best.empty() || s.score > best_score) {
            best = s.id;
            best_score = s.score;
        }
    }
    return best.empty() ? previous : best;
}

std::string GrowthEngine::trace_line(const Graph& graph, const std::string& hub) const {
    const GraphNode* hub_node = graph.find(hub);
    std::string line = "Hub: " + (hub_node ? hub_node->label : hub) + " | ring:";
    bool first = true;
    for (const auto& id : PickFrontier(graph, {hub}, config_.ring_size)) {
        const GraphNode* node = graph.find(id);
        line += first ? " " : ", ";
        line += node ? node->label : id;
        first = false;
    }
    return line;
}

core::Result<RunResult> GrowthEngine::run(const std::string& seed) {
    std::string label = core::TrimToken(seed);
    if (label.empty()) {
        return core::Result<RunResult>::error("seed must not be empty",
                                              core::Error::Code::INVALID_ARGUMENT);
    }
    if (!deps_.oracle) {
        return core::Result<RunResult>::error("growth engine has no adjacency oracle",
                                              core::Error::Code::NOT_INITIALIZED);
    }
    std::string seed_id = Slugify(label);
    if (seed_id.empty()) {
        seed_id = "seed";
    }

    KGRAPH_INFO("growth: run from '{}' (iterations={}, concurrency={})",
                label, config_.max_iterations, config_.concurrency);

    RunState state;
    RunResult result;

    enter(GrowthState::SEEDED, 0);
    {
        GraphNode root;
        root.id = seed_id;
        root.label = label;
        root.weight = 1.0;
        root.appearance_frequency = 1.0;
        std::vector<GraphNode*> pending{&root};
        embed_nodes(pending);
        state.graph.add_node(std::move(root));
    }
    WorkItem seed_item;
    seed_item.node_id = seed_id;
    seed_item.label = label;
    seed_item.seed = true;
    expand(state, {seed_item}, Layer::VISIBLE);

    std::string hub = seed_id;
    uint32_t stable_count = 0;

    for (uint32_t i = 0; i < config_.max_iterations; ++i) {
        if (state.aborted.load() || abort_requested()) {
            state.aborted.store(true);
            break;
        }

        enter(GrowthState::EXPAND_RING, i);
        const GraphNode* hub_node = state.graph.find(hub);
        WorkItem hub_item;
        hub_item.node_id = hub;
        hub_item.label = hub_node ? hub_node->label : hub;
        expand(state, {hub_item}, Layer::VISIBLE);

        enter(GrowthState::EXPAND_CHILDREN, i);
        std::vector<WorkItem> children;
        for (const auto& id : PickFrontier(state.graph, {hub}, config_.ring_size)) {
            WorkItem child;
            child.node_id = id;
            child.label = state.graph.find(id)->label;
            child.branch_cap = config_.child_branches;
            children.push_back(std::move(child));
        }
        expand(state, std::move(children), Layer::HIDDEN);

        for (uint32_t depth = 0; depth < config_.hidden_depth && !state.aborted.load(); ++depth) {
            std::vector<WorkItem> dives;
            auto top = TopSalienceTokens(state.graph, salience(state.graph),
                                         std::max<uint32_t>(1, config_.child_branches));
            for (const auto& id : top) {
                if (state.expanded.count(id)) continue;
                WorkItem dive;
                dive.node_id = id;
                dive.label = state.graph.find(id)->label;
                dive.branch_cap = config_.child_branches;
                dives.push_back(std::move(dive));
            }
            if (dives.empty()) break;
            expand(state, std::move(dives), Layer::HIDDEN);
        }
        if (state.aborted.load()) {
            break;
        }

        enter(GrowthState::LIMIT_CHECK, i);
        state.graph = LimitGraph(state.graph, config_.max_nodes, config_.max_edges);

        enter(GrowthState::COLLAPSE, i);
        state.graph = Collapse(state.graph, {hub}, config_.collapse_radius, config_.fan_out);

        enter(GrowthState::HUB_SELECT, i);
        std::string next = select_hub(state.graph, hub);
        result.trace.push_back(trace_line(state.graph, next));

        enter(GrowthState::STABILITY_CHECK, i);
        stable_count = next == hub ? stable_count + 1 : 0;
        hub = next;
        result.iterations = i + 1;
        KGRAPH_DEBUG("growth: {}", result.trace.back());
        if (stable_count >= 2 && i >= 2) {
            result.stable = true;
            enter(GrowthState::TERMINATE, i);
            break;
        }
    }

    enter(GrowthState::FINALIZE, result.iterations);
    result.aborted = state.aborted.load();
    result.hub = hub;
    auto scores = salience(state.graph);
    auto centers = TopSalienceTokens(state.graph, scores,
                                     std::max<uint32_t>(1, config_.child_branches));
    result.collapsed = Collapse(state.graph, centers, config_.collapse_radius, config_.fan_out);
    result.clusters = ClusterGraph(state.graph, config_.affinity_threshold);
    if (deps_.thought_sink && !result.aborted) {
        for (auto& cluster : result.clusters) {
            std::vector<core::Vector> embeddings;
            for (const auto& id : cluster.members) {
                embeddings.push_back(state.graph.find(id)->embedding);
            }
            auto narration = deps_.thought_sink->narrate(cluster, embeddings);
            if (narration) cluster.narration = *narration;
        }
    }
    result.synthetic_fallbacks = state.synthetic_fallbacks;
    result.errors = std::move(state.errors);
    result.graph = std::move(state.graph);

    KGRAPH_INFO("growth: finished at hub '{}' after {} iterations ({} nodes, {} edges{})",
                result.hub, result.iterations, result.graph.node_count(),
                result.graph.edge_count(), result.aborted ? ", aborted" : "");
    return core::Result<RunResult>(std::move(result));
}

} // namespace engine
} // namespace kgraph
