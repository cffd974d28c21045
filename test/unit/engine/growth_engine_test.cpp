#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

#include "kgraph/engine/growth_engine.h"
#include "kgraph/storage/memory_backend.h"
#include "kgraph/vector/vector_store.h"

namespace kgraph {
namespace engine {
namespace {

GraphNode Node(const std::string& id, double weight) {
    GraphNode node;
    node.id = id;
    node.label = id;
    node.weight = weight;
    return node;
}

GraphEdge Edge(const std::string& src, const std::string& dst, double weight) {
    GraphEdge edge;
    edge.src = src;
    edge.dst = dst;
    edge.weight = weight;
    return edge;
}

// Answers every token with the same neighborhood.
class FixedOracle : public AdjacencyOracle {
public:
    explicit FixedOracle(AdjacencyDelta delta) : delta_(std::move(delta)) {}

    core::Result<AdjacencyDelta> seed_adjacency(const std::string& token) override {
        return answer(token);
    }
    core::Result<AdjacencyDelta> expand_adjacency(const std::string& token) override {
        return answer(token);
    }

    std::vector<std::string> asked() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return asked_;
    }

private:
    core::Result<AdjacencyDelta> answer(const std::string& token) {
        std::lock_guard<std::mutex> lock(mutex_);
        asked_.push_back(token);
        return core::Result<AdjacencyDelta>(delta_);
    }

    AdjacencyDelta delta_;
    mutable std::mutex mutex_;
    std::vector<std::string> asked_;
};

class FailingOracle : public AdjacencyOracle {
public:
    explicit FailingOracle(bool throws) : throws_(throws) {}

    core::Result<AdjacencyDelta> seed_adjacency(const std::string& token) override {
        return fail(token);
    }
    core::Result<AdjacencyDelta> expand_adjacency(const std::string& token) override {
        return fail(token);
    }

    std::atomic<int> calls{0};

private:
    core::Result<AdjacencyDelta> fail(const std::string& token) {
        calls.fetch_add(1);
        if (throws_) {
            throw std::runtime_error("connection reset while asking about " + token);
        }
        return core::Result<AdjacencyDelta>::error("model unavailable",
                                                   core::Error::Code::ORACLE_FAILURE);
    }

    bool throws_;
};

class RecordingSink : public ThoughtSink {
public:
    std::optional<std::string> narrate(const Cluster& cluster,
                                       const std::vector<core::Vector>& embeddings) override {
        ++calls;
        sizes.push_back(embeddings.size());
        return "cluster of " + std::to_string(cluster.members.size());
    }

    int calls = 0;
    std::vector<size_t> sizes;
};

class GrowthEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_ = core::GrowthConfig::Default();
        AdjacencyDelta delta;
        delta.nodes = {Node("alpha", 0.9), Node("beta", 0.7), Node("gamma", 0.6)};
        delta.edges = {Edge("cat", "alpha", 0.9), Edge("alpha", "beta", 0.8),
                       Edge("alpha", "gamma", 0.7)};
        oracle_ = std::make_shared<FixedOracle>(delta);
    }

    GrowthDependencies deps(std::shared_ptr<AdjacencyOracle> oracle) {
        GrowthDependencies d;
        d.oracle = std::move(oracle);
        return d;
    }

    core::GrowthConfig config_;
    std::shared_ptr<FixedOracle> oracle_;
};

TEST_F(GrowthEngineTest, RejectsBadInput) {
    GrowthEngine engine(config_, deps(oracle_));
    auto empty = engine.run("   ");
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.code(), core::Error::Code::INVALID_ARGUMENT);

    GrowthEngine no_oracle(config_, GrowthDependencies());
    auto r = no_oracle.run("cat");
    ASSERT_FALSE(r.ok());
    EXPECT_EQ(r.code(), core::Error::Code::NOT_INITIALIZED);
}

TEST_F(GrowthEngineTest, RepeatedNeighborhoodSettlesOnStableHub) {
    std::vector<GrowthState> states;
    std::mutex states_mutex;
    GrowthDependencies d = deps(oracle_);
    d.on_state = [&](GrowthState s, uint32_t) {
        std::lock_guard<std::mutex> lock(states_mutex);
        states.push_back(s);
    };
    GrowthEngine engine(config_, d);

    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok()) << result.error();
    const RunResult& run = result.value();
    EXPECT_TRUE(run.stable);
    EXPECT_FALSE(run.aborted);
    // Stability needs two repeats of the hub and never ends before the third iteration.
    EXPECT_GE(run.iterations, 3u);
    EXPECT_LE(run.iterations, 4u);
    EXPECT_EQ(run.hub, "alpha");
    EXPECT_EQ(run.trace.size(), run.iterations);
    EXPECT_EQ(run.trace.back().rfind("Hub: alpha | ring:", 0), 0u);
    EXPECT_EQ(run.graph.node_count(), 4u);
    EXPECT_EQ(run.graph.find("cat")->layer, Layer::VISIBLE);
    EXPECT_EQ(run.synthetic_fallbacks, 0u);
    EXPECT_TRUE(run.errors.empty());

    ASSERT_FALSE(states.empty());
    EXPECT_EQ(states.front(), GrowthState::SEEDED);
    EXPECT_EQ(states.back(), GrowthState::FINALIZE);
    EXPECT_NE(std::find(states.begin(), states.end(), GrowthState::TERMINATE), states.end());
}

TEST_F(GrowthEngineTest, NodesAreExpandedOncePerRun) {
    GrowthEngine engine(config_, deps(oracle_));
    ASSERT_TRUE(engine.run("cat").ok());
    auto asked = oracle_->asked();
    for (const char* label : {"alpha", "beta", "gamma"}) {
        EXPECT_EQ(std::count(asked.begin(), asked.end(), label), 1) << label;
    }
}

TEST_F(GrowthEngineTest, ClustersAreNarrated) {
    auto sink = std::make_shared<RecordingSink>();
    GrowthDependencies d = deps(oracle_);
    d.thought_sink = sink;
    d.embedder = std::make_shared<vector::HashingEmbeddingProvider>(16);
    GrowthEngine engine(config_, d);

    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok());
    ASSERT_EQ(result.value().clusters.size(), 1u);
    const Cluster& cluster = result.value().clusters[0];
    EXPECT_EQ(cluster.members.size(), 4u);
    EXPECT_EQ(cluster.narration, "cluster of 4");
    EXPECT_NEAR(cluster.structural, 0.8, 1e-9);
    EXPECT_EQ(sink->calls, 1);
    EXPECT_EQ(sink->sizes, std::vector<size_t>{4});
    EXPECT_EQ(result.value().graph.find("beta")->embedding.size(), 16u);
    EXPECT_EQ(result.value().graph.find("cat")->embedding.size(), 16u);
}

TEST_F(GrowthEngineTest, AbortReturnsPartialGraph) {
    auto sink = std::make_shared<RecordingSink>();
    GrowthDependencies d = deps(oracle_);
    d.thought_sink = sink;
    d.should_abort = [] { return true; };
    GrowthEngine engine(config_, d);

    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok());
    EXPECT_TRUE(result.value().aborted);
    EXPECT_FALSE(result.value().stable);
    EXPECT_EQ(result.value().iterations, 0u);
    EXPECT_EQ(result.value().graph.node_count(), 1u);
    EXPECT_EQ(sink->calls, 0);
}

TEST_F(GrowthEngineTest, FailingOracleFallsBackToSyntheticNeighborhood) {
    auto failing = std::make_shared<FailingOracle>(false);
    GrowthEngine engine(config_, deps(failing));

    auto result = engine.run("Black Hole");
    ASSERT_TRUE(result.ok());
    const RunResult& run = result.value();
    EXPECT_GT(run.synthetic_fallbacks, 0u);
    EXPECT_TRUE(run.errors.empty());
    const GraphNode* core_node = run.graph.find("black-hole-core");
    ASSERT_NE(core_node, nullptr);
    EXPECT_TRUE(core_node->synthetic);
    EXPECT_FALSE(run.graph.find("black-hole")->synthetic);
}

TEST_F(GrowthEngineTest, FailuresAreRecordedWithoutFallback) {
    config_.allow_synthetic_fallback = false;
    auto throwing = std::make_shared<FailingOracle>(true);
    GrowthEngine engine(config_, deps(throwing));

    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok());
    const RunResult& run = result.value();
    EXPECT_EQ(run.graph.node_count(), 1u);
    EXPECT_EQ(run.synthetic_fallbacks, 0u);
    ASSERT_FALSE(run.errors.empty());
    EXPECT_EQ(run.errors[0].token, "cat");
    EXPECT_EQ(run.errors[0].code, core::Error::Code::ORACLE_FAILURE);
    EXPECT_NE(run.errors[0].message.find("connection reset"), std::string::npos);
    EXPECT_EQ(run.hub, "cat");
}

TEST_F(GrowthEngineTest, StopwordsNeverBecomeHub) {
    AdjacencyDelta delta;
    delta.nodes = {Node("The", 0.9), Node("feline", 0.5)};
    delta.edges = {Edge("cat", "the", 0.95), Edge("the", "feline", 0.9),
                   Edge("cat", "feline", 0.2)};
    auto oracle = std::make_shared<FixedOracle>(delta);
    GrowthEngine engine(config_, deps(oracle));

    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok());
    EXPECT_NE(result.value().hub, "the");
    for (const auto& line : result.value().trace) {
        EXPECT_NE(line.rfind("Hub: The |", 0), 0u) << line;
    }
}

TEST_F(GrowthEngineTest, NodeBudgetIsRespected) {
    config_.max_nodes = 2;
    GrowthEngine engine(config_, deps(oracle_));
    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok());
    EXPECT_LE(result.value().graph.node_count(), 2u);
}

TEST_F(GrowthEngineTest, EmbeddingsPersistThroughShardsAndQueue) {
    auto backend = std::make_shared<storage::MemoryBackend>();
    auto shards = std::make_shared<storage::ShardStore>(backend, nullptr);
    ASSERT_TRUE(shards->init().ok());
    auto store = std::make_shared<vector::VectorStore>(backend);
    core::VectorConfig vconfig = core::VectorConfig::Default();
    vconfig.dim = 16;
    ASSERT_TRUE(store->init(vconfig).ok());

    GrowthDependencies d = deps(oracle_);
    d.shards = shards;
    d.embeddings = std::make_shared<vector::EmbeddingQueue>(
        store, std::make_shared<vector::HashingEmbeddingProvider>(16));
    GrowthEngine engine(config_, d);

    auto result = engine.run("cat");
    ASSERT_TRUE(result.ok());
    auto alpha = shards->find_token("alpha");
    ASSERT_TRUE(alpha.ok());
    ASSERT_TRUE(alpha.value().has_value());
    auto stored = store->get(*alpha.value());
    ASSERT_TRUE(stored.ok());
    EXPECT_TRUE(stored.value().has_value());
    EXPECT_EQ(result.value().graph.find("alpha")->embedding.size(), 16u);
}

TEST(GrowthStateNameTest, Names) {
    EXPECT_STREQ(GrowthStateName(GrowthState::SEEDED), "seeded");
    EXPECT_STREQ(GrowthStateName(GrowthState::HUB_SELECT), "hub_select");
    EXPECT_STREQ(GrowthStateName(GrowthState::FINALIZE), "finalize");
}

} // namespace
} // namespace engine
} // namespace kgraph
