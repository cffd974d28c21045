#ifndef KGRAPH_ENGINE_GROWTH_ENGINE_H_
#define KGRAPH_ENGINE_GROWTH_ENGINE_H_

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "kgraph/core/config.h"
#include "kgraph/core/result.h"
#include "kgraph/engine/adjacency_oracle.h"
#include "kgraph/engine/clustering.h"
#include "kgraph/engine/graph.h"
#include "kgraph/engine/salience.h"
#include "kgraph/storage/shard_store.h"
#include "kgraph/vector/embedding_provider.h"
#include "kgraph/vector/embedding_queue.h"

namespace kgraph {
namespace engine {

enum class GrowthState {
    SEEDED,
    EXPAND_RING,
    EXPAND_CHILDREN,
    LIMIT_CHECK,
    COLLAPSE,
    HUB_SELECT,
    STABILITY_CHECK,
    TERMINATE,
    FINALIZE
};

const char* GrowthStateName(GrowthState state);

struct ExpansionError {
    std::string token;
    core::Error::Code code = core::Error::Code::UNKNOWN;
    std::string message;
};

struct RunResult {
    Graph graph;                 // working graph after the last iteration
    Graph collapsed;             // graph collapsed around the top salience tokens
    std::string hub;
    uint32_t iterations = 0;
    std::vector<std::string> trace;
    std::vector<Cluster> clusters;
    bool aborted = false;
    bool stable = false;         // ended on a repeated hub rather than the budget
    size_t synthetic_fallbacks = 0;
    std::vector<ExpansionError> errors;
};

/**
 * @brief Collaborators of a growth run; only the oracle is required
 *
 * With both `shards` and `embeddings` set, node vectors go through the
 * embedding queue (stored vectors reused, new ones persisted). Otherwise
 * `embedder` is called directly, and without either nodes stay unembedded.
 * `should_abort` is polled from worker threads.
 */
struct GrowthDependencies {
    std::shared_ptr<AdjacencyOracle> oracle;
    std::shared_ptr<vector::EmbeddingProvider> embedder;
    std::shared_ptr<storage::ShardStore> shards;
    std::shared_ptr<vector::EmbeddingQueue> embeddings;
    std::shared_ptr<ThoughtSink> thought_sink;
    std::function<bool()> should_abort;
    std::function<void(GrowthState, uint32_t)> on_state;
};

/**
 * @brief Iterative "breathing" exploration from a seed text
 *
 * Each iteration expands the current hub, its ring of strongest neighbors and
 * a few salience-picked deep dives, enforces the node/edge budget, collapses
 * around the hub and picks the next hub. The run ends on the iteration
 * budget, on abort, or when hub selection has kept the current hub on two
 * consecutive iterations (stable_count >= 2) and the zero-based iteration
 * index is at least 2, so no earlier than the third iteration.
 *
 * Oracle and embedding calls run on up to `concurrency` worker threads; all
 * graph mutation happens under one apply lock.
 */
class GrowthEngine {
public:
    GrowthEngine(core::GrowthConfig config, GrowthDependencies deps);

    GrowthEngine(const GrowthEngine&) = delete;
    GrowthEngine& operator=(const GrowthEngine&) = delete;

    /**
     * @brief Grow a graph from seed
     *
     * Oracle failures do not fail the run; they are listed in
     * RunResult::errors. Abort yields the partial graph with aborted=true.
     */
    core::Result<RunResult> run(const std::string& seed);

    const core::GrowthConfig& config() const { return config_; }

private:
    struct WorkItem {
        std::string node_id;
        std::string label;
        bool seed = false;
        size_t branch_cap = 0;   // 0 keeps every returned node
    };
    struct RunState;

    void expand(RunState& state, std::vector<WorkItem> items, Layer layer);
    core::Result<AdjacencyDelta> fetch(const WorkItem& item, RunState& state);
    void embed_new_nodes(AdjacencyDelta& delta, RunState& state);
    void embed_nodes(std::vector<GraphNode*>& nodes);

    std::vector<SalienceScore> salience(const Graph& graph) const;
    std::string select_hub(const Graph& graph, const std::string& previous) const;
    std::string trace_line(const Graph& graph, const std::string& hub) const;
    bool abort_requested() const;
    void enter(GrowthState state, uint32_t iteration) const;

    core::GrowthConfig config_;
    GrowthDependencies deps_;
};

} // namespace engine
} // namespace kgraph

#endif // KGRAPH_ENGINE_GROWTH_ENGINE_H_
