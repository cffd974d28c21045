#include "kgraph/common/logger.h"
#include "kgraph/core/config.h"
#include "kgraph/engine/growth_engine.h"
#include "kgraph/storage/backend_factory.h"
#include "kgraph/storage/shard_store.h"
#include "kgraph/vector/embedding_provider.h"
#include "kgraph/vector/embedding_queue.h"
#include "kgraph/vector/hybrid_ranker.h"
#include "kgraph/vector/vector_store.h"
#include <algorithm>
#include <ctime>
#include <iostream>

using namespace kgraph;

namespace {

// Answers adjacency questions from the edges already in the shard store.
class ShardOracle : public engine::AdjacencyOracle {
public:
    explicit ShardOracle(std::shared_ptr<storage::ShardStore> shards) : shards_(std::move(shards)) {}

    core::Result<engine::AdjacencyDelta> seed_adjacency(const std::string& token) override {
        return expand_adjacency(token);
    }

    core::Result<engine::AdjacencyDelta> expand_adjacency(const std::string& token) override {
        auto id = shards_->find_token(token);
        if (!id.ok()) {
            return core::propagate<engine::AdjacencyDelta>(id);
        }
        if (!id.value()) {
            return core::Result<engine::AdjacencyDelta>::error("unknown token: " + token,
                                                               core::Error::Code::ORACLE_FAILURE);
        }
        storage::AdjQuery query;
        query.token_id = *id.value();
        query.limit = 16;
        auto rows = shards_->get_adj(query);
        if (!rows.ok()) {
            return core::propagate<engine::AdjacencyDelta>(rows);
        }

        double max_weight = 1.0;
        for (const auto& row : rows.value()) {
            max_weight = std::max(max_weight, static_cast<double>(row.weight));
        }
        engine::AdjacencyDelta delta;
        for (const auto& row : rows.value()) {
            auto label = shards_->get_token(row.neighbor_id);
            if (!label.ok() || label.value().empty()) continue;
            engine::GraphNode node;
            node.id = label.value();
            node.label = label.value();
            node.weight = row.weight / max_weight;
            delta.nodes.push_back(node);

            engine::GraphEdge edge;
            edge.src = token;
            edge.dst = label.value();
            edge.weight = node.weight;
            delta.edges.push_back(edge);
        }
        return core::Result<engine::AdjacencyDelta>(std::move(delta));
    }

private:
    std::shared_ptr<storage::ShardStore> shards_;
};

} // namespace

int main(int argc, char** argv) {
    common::Logger::Init();
    std::cout << "=== kgraph Quick Start Example ===" << std::endl;

    core::Config config = core::Config::Default();
    if (argc > 1) {
        auto loaded = core::config_utils::load_from_file(argv[1]);
        if (!loaded.ok()) {
            std::cerr << "Config load failed: " << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.take_value();
    }
    for (const auto& warning : core::config_utils::validate(config)) {
        std::cerr << "Config warning: " << warning << std::endl;
    }
    if (!common::Logger::SetLevel(config.logging.level)) {
        std::cerr << "Unknown log level '" << config.logging.level << "'" << std::endl;
    }

    auto backend = storage::CreateBackend(config.storage);
    if (!backend.ok()) {
        std::cerr << "Backend failed: " << backend.error() << std::endl;
        return 1;
    }
    auto shards = std::make_shared<storage::ShardStore>(
        backend.value(), storage::CreateEdgeCodec(config.codec));
    auto init_result = shards->init();
    if (!init_result.ok()) {
        std::cerr << "Init failed: " << init_result.error() << std::endl;
        return 1;
    }
    auto vectors = std::make_shared<vector::VectorStore>(backend.value());
    auto vector_init = vectors->init(config.vector);
    if (!vector_init.ok()) {
        std::cerr << "Vector store init failed: " << vector_init.error() << std::endl;
        return 1;
    }
    auto embeddings = std::make_shared<vector::EmbeddingQueue>(
        vectors, std::make_shared<vector::HashingEmbeddingProvider>(config.vector.dim, config.vector.provider));

    // A tiny hand-made neighborhood
    const std::vector<std::pair<std::string, std::vector<std::pair<std::string, uint32_t>>>> facts = {
        {"cat", {{"feline", 900}, {"pet", 700}, {"whiskers", 400}}},
        {"feline", {{"lion", 800}, {"tiger", 750}, {"cat", 600}}},
        {"pet", {{"dog", 850}, {"cat", 800}}},
    };
    uint32_t now = static_cast<uint32_t>(std::time(nullptr));
    for (const auto& fact : facts) {
        auto id = shards->ensure_token(fact.first);
        if (!id.ok()) {
            std::cerr << "Token failed: " << id.error() << std::endl;
            return 1;
        }
        std::vector<core::EdgeRow> rows;
        for (const auto& n : fact.second) {
            auto neighbor = shards->ensure_token(n.first);
            if (!neighbor.ok()) {
                std::cerr << "Token failed: " << neighbor.error() << std::endl;
                return 1;
            }
            rows.emplace_back(neighbor.value(), 0, n.second, now);
            auto vec = embeddings->ensure_embedding(neighbor.value(), n.first);
            if (!vec.ok()) {
                std::cerr << "Embedding failed: " << vec.error() << std::endl;
            }
        }
        auto written = shards->upsert_adj(id.value(), rows);
        if (!written.ok()) {
            std::cerr << "Upsert failed: " << written.error() << std::endl;
            return 1;
        }
    }
    auto stats = shards->stats();
    if (stats.ok()) {
        std::cout << "✅ Stored " << stats.value().tokens << " tokens, "
                  << stats.value().edges << " edges in " << stats.value().shards << " shards" << std::endl;
    }

    vector::HybridRanker ranker(shards, vectors);
    auto cat = shards->find_token("cat");
    if (cat.ok() && cat.value()) {
        auto ranked = ranker.hybrid(vector::HybridOptions(*cat.value(), 5, config.hybrid));
        if (ranked.ok()) {
            std::cout << "Hybrid neighbors of 'cat':" << std::endl;
            for (const auto& scored : ranked.value()) {
                std::cout << "  " << shards->get_token(scored.id).value()
                          << "  " << scored.score << std::endl;
            }
        } else {
            std::cerr << "Ranking failed: " << ranked.error() << std::endl;
        }
    }

    engine::GrowthDependencies deps;
    deps.oracle = std::make_shared<engine::CachingOracle>(std::make_shared<ShardOracle>(shards));
    deps.shards = shards;
    deps.embeddings = embeddings;
    engine::GrowthEngine growth(config.growth, deps);
    auto run = growth.run("cat");
    if (!run.ok()) {
        std::cerr << "Growth failed: " << run.error() << std::endl;
        return 1;
    }
    for (const auto& line : run.value().trace) {
        std::cout << "  " << line << std::endl;
    }
    std::cout << "✅ Settled on '" << run.value().hub << "' after " << run.value().iterations
              << " iterations, " << run.value().clusters.size() << " clusters" << std::endl;
    return 0;
}
