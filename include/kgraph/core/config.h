#ifndef KGRAPH_CORE_CONFIG_H_
#define KGRAPH_CORE_CONFIG_H_

#include <cstdint>
#include <string>
#include <vector>

#include "kgraph/core/result.h"

namespace kgraph {
namespace core {

/**
 * @brief Which storage backend the factory should build
 */
enum class BackendType {
    MEMORY,
    FILE
};

/**
 * @brief Configuration for the persistent backend
 */
struct StorageConfig {
    BackendType backend;
    std::string data_dir;
    bool degrade_to_memory;   // fall back to memory once if the durable backend cannot open
    int hash_prefix_nibbles;  // directory fan-out of the file backend

    StorageConfig()
        : backend(BackendType::MEMORY), degrade_to_memory(true), hash_prefix_nibbles(3) {}

    static StorageConfig Default() { return StorageConfig(); }

    static StorageConfig File(const std::string& dir) {
        StorageConfig config;
        config.backend = BackendType::FILE;
        config.data_dir = dir;
        return config;
    }
};

/**
 * @brief Edge block codec selection
 */
struct CodecConfig {
    bool prefer_compression;

    CodecConfig() : prefer_compression(true) {}

    static CodecConfig Default() { return CodecConfig(); }
};

/**
 * @brief Decay trim policy applied by ShardStore::trim
 *
 * A row is trimmed when w * exp(-lambda * age_days) < w_min, or when it is
 * older than age_max_days and its raw weight is below w_old_min.
 */
struct GcPolicy {
    double lambda_per_day;
    double w_min;
    double age_max_days;
    double w_old_min;

    GcPolicy() : lambda_per_day(0.0), w_min(0.0), age_max_days(0.0), w_old_min(0.0) {}

    static GcPolicy Default() {
        GcPolicy policy;
        policy.lambda_per_day = 0.05;
        policy.w_min = 1.0;
        policy.age_max_days = 180.0;
        policy.w_old_min = 10.0;
        return policy;
    }
};

/**
 * @brief Vector store and embedding ingestion settings
 */
struct VectorConfig {
    std::string provider;
    uint32_t dim;
    bool quantize8;
    bool normalize;
    uint32_t batch_size;

    VectorConfig() : dim(0), quantize8(false), normalize(false), batch_size(0) {}

    static VectorConfig Default() {
        VectorConfig config;
        config.provider = "hashing";
        config.dim = 384;
        config.quantize8 = true;
        config.normalize = true;
        config.batch_size = 64;
        return config;
    }
};

/**
 * @brief Blend weights of the hybrid ranker
 */
struct HybridConfig {
    double alpha;
    double beta;

    HybridConfig() : alpha(0.6), beta(0.4) {}

    static HybridConfig Default() { return HybridConfig(); }
};

/**
 * @brief Baseline salience coefficients
 */
struct SalienceWeights {
    double degree;
    double weight_sum;
    double frequency;

    SalienceWeights() : degree(0.6), weight_sum(0.3), frequency(0.1) {}
};

/**
 * @brief Blend coefficients of context-aware salience
 */
struct ContextSalienceWeights {
    double base;
    double intertwining;
    double peakiness;

    ContextSalienceWeights() : base(0.55), intertwining(0.30), peakiness(0.15) {}
};

/**
 * @brief Graph growth ("breathing") run parameters
 */
struct GrowthConfig {
    uint32_t max_iterations;     // iteration budget
    uint32_t concurrency;        // oracle/embedding worker bound
    uint32_t ring_size;          // visible neighbors expanded per iteration
    uint32_t child_branches;     // hidden children kept per ring member
    uint32_t hidden_depth;       // salience-triggered deep dives per iteration
    uint32_t max_nodes;
    uint32_t max_edges;
    uint32_t collapse_radius;
    uint32_t fan_out;
    double affinity_threshold;
    bool allow_synthetic_fallback;
    bool use_context_salience;
    std::vector<std::string> stopwords;
    SalienceWeights salience;
    ContextSalienceWeights context_salience;

    GrowthConfig()
        : max_iterations(0), concurrency(1), ring_size(0), child_branches(0),
          hidden_depth(0), max_nodes(0), max_edges(0), collapse_radius(0),
          fan_out(0), affinity_threshold(0.0), allow_synthetic_fallback(false),
          use_context_salience(false) {}

    static GrowthConfig Default() {
        GrowthConfig config;
        config.max_iterations = 6;
        config.concurrency = 4;
        config.ring_size = 10;
        config.child_branches = 3;
        config.hidden_depth = 2;
        config.max_nodes = 400;
        config.max_edges = 2000;
        config.collapse_radius = 2;
        config.fan_out = 9;
        config.affinity_threshold = 0.35;
        config.allow_synthetic_fallback = true;
        config.use_context_salience = false;
        config.stopwords = {"the", "a", "an", "of", "and", "or", "to", "i", "my", "me", "it", "you"};
        return config;
    }
};

struct LoggingConfig {
    std::string level;

    LoggingConfig() : level("info") {}
};

/**
 * @brief Aggregate configuration of an engine instance
 */
struct Config {
    StorageConfig storage;
    CodecConfig codec;
    GcPolicy gc;
    VectorConfig vector;
    HybridConfig hybrid;
    GrowthConfig growth;
    LoggingConfig logging;

    Config() = default;

    static Config Default() {
        Config config;
        config.storage = StorageConfig::Default();
        config.codec = CodecConfig::Default();
        config.gc = GcPolicy::Default();
        config.vector = VectorConfig::Default();
        config.hybrid = HybridConfig::Default();
        config.growth = GrowthConfig::Default();
        return config;
    }
};

namespace config_utils {

/**
 * @brief Parse a JSON document into a Config
 *
 * Missing sections and keys keep their Config::Default() values; keys with
 * the wrong JSON type are rejected.
 */
Result<Config> load_from_json(const std::string& json);

/**
 * @brief Read and parse a JSON config file
 */
Result<Config> load_from_file(const std::string& path);

/**
 * @brief Check a configuration for contradictions
 * @return Human readable problems; empty when the config is usable
 */
std::vector<std::string> validate(const Config& config);

} // namespace config_utils

} // namespace core
} // namespace kgraph

#endif // KGRAPH_CORE_CONFIG_H_
