#include <gtest/gtest.h>
#include "kgraph/core/config.h"

#include <fstream>
#include <string>

#include "test_util/temp_dir.h"

namespace kgraph {
namespace core {
namespace {

TEST(ConfigDefaultsTest, GrowthDefaults) {
    GrowthConfig g = GrowthConfig::Default();
    EXPECT_EQ(g.max_iterations, 6u);
    EXPECT_EQ(g.concurrency, 4u);
    EXPECT_EQ(g.fan_out, 9u);
    EXPECT_DOUBLE_EQ(g.salience.degree, 0.6);
    EXPECT_DOUBLE_EQ(g.salience.weight_sum, 0.3);
    EXPECT_DOUBLE_EQ(g.salience.frequency, 0.1);
    EXPECT_DOUBLE_EQ(g.context_salience.base, 0.55);
    EXPECT_TRUE(g.allow_synthetic_fallback);
}

TEST(ConfigDefaultsTest, DefaultConfigValidates) {
    Config config = Config::Default();
    EXPECT_TRUE(config_utils::validate(config).empty());
    EXPECT_EQ(config.storage.backend, BackendType::MEMORY);
    EXPECT_DOUBLE_EQ(config.hybrid.alpha, 0.6);
    EXPECT_DOUBLE_EQ(config.gc.lambda_per_day, 0.05);
}

TEST(ConfigJsonTest, EmptyObjectKeepsDefaults) {
    auto loaded = config_utils::load_from_json("{}");
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value().vector.dim, 384u);
    EXPECT_EQ(loaded.value().logging.level, "info");
}

TEST(ConfigJsonTest, OverridesSections) {
    const std::string json = R"({
        "storage": {"backend": "file", "data_dir": "/var/lib/kgraph", "hash_prefix_nibbles": 2},
        "codec": {"prefer_compression": false},
        "vector": {"dim": 8, "quantize8": false},
        "hybrid": {"alpha": 0.7, "beta": 0.3},
        "growth": {
            "max_iterations": 3,
            "stopwords": ["the", "of"],
            "salience": {"degree": 1.0}
        },
        "logging": {"level": "debug"}
    })";
    auto loaded = config_utils::load_from_json(json);
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    const Config& c = loaded.value();
    EXPECT_EQ(c.storage.backend, BackendType::FILE);
    EXPECT_EQ(c.storage.data_dir, "/var/lib/kgraph");
    EXPECT_EQ(c.storage.hash_prefix_nibbles, 2);
    EXPECT_FALSE(c.codec.prefer_compression);
    EXPECT_EQ(c.vector.dim, 8u);
    EXPECT_FALSE(c.vector.quantize8);
    EXPECT_DOUBLE_EQ(c.hybrid.alpha, 0.7);
    EXPECT_EQ(c.growth.max_iterations, 3u);
    ASSERT_EQ(c.growth.stopwords.size(), 2u);
    EXPECT_EQ(c.growth.stopwords[1], "of");
    EXPECT_DOUBLE_EQ(c.growth.salience.degree, 1.0);
    EXPECT_DOUBLE_EQ(c.growth.salience.weight_sum, 0.3);
    EXPECT_EQ(c.logging.level, "debug");
}

TEST(ConfigJsonTest, RejectsWrongType) {
    auto loaded = config_utils::load_from_json(R"({"vector": {"dim": "wide"}})");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(loaded.error().find("vector.dim"), std::string::npos);
}

TEST(ConfigJsonTest, RejectsUnknownBackend) {
    auto loaded = config_utils::load_from_json(R"({"storage": {"backend": "tape"}})");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ConfigJsonTest, RejectsMalformedJson) {
    auto loaded = config_utils::load_from_json("{\"storage\": ");
    ASSERT_FALSE(loaded.ok());
    EXPECT_EQ(loaded.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(ConfigJsonTest, LoadFromFile) {
    testutil::ScopedTestDir dir("kgraph_config");
    std::filesystem::create_directories(dir.path());
    auto path = dir.path() / "kgraph.json";
    {
        std::ofstream out(path);
        out << R"({"growth": {"concurrency": 2}})";
    }
    auto loaded = config_utils::load_from_file(path.string());
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value().growth.concurrency, 2u);

    auto missing = config_utils::load_from_file((dir.path() / "absent.json").string());
    EXPECT_FALSE(missing.ok());
}

TEST(ConfigValidateTest, ReportsProblems) {
    Config config = Config::Default();
    config.storage = StorageConfig::File("");
    config.vector.dim = 0;
    config.growth.concurrency = 0;
    auto problems = config_utils::validate(config);
    EXPECT_EQ(problems.size(), 3u);
}

} // namespace
} // namespace core
} // namespace kgraph
