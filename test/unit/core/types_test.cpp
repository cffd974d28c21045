#include <gtest/gtest.h>
#include "kgraph/core/types.h"

namespace kgraph {
namespace core {
namespace {

TEST(TypesTest, BlockKeyRoundTrip) {
    EXPECT_EQ(BlockKey(42, 3), "42:3");
    auto parsed = ParseBlockKey("42:3");
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->first, 42u);
    EXPECT_EQ(parsed->second, 3u);
}

TEST(TypesTest, ParseBlockKeyRejectsMalformed) {
    EXPECT_FALSE(ParseBlockKey("").has_value());
    EXPECT_FALSE(ParseBlockKey("42").has_value());
    EXPECT_FALSE(ParseBlockKey(":1").has_value());
    EXPECT_FALSE(ParseBlockKey("4x:1").has_value());
    EXPECT_FALSE(ParseBlockKey("42:").has_value());
}

TEST(TypesTest, HashPrefix) {
    EXPECT_EQ(HashPrefix(0x1234abcd), "123");
    EXPECT_EQ(HashPrefix(7, 4), "0000");
    EXPECT_EQ(HashPrefix(0xffffffffu, 8), "ffffffff");
    EXPECT_EQ(HashPrefix(1, 0), "");
}

TEST(TypesTest, TrimToken) {
    EXPECT_EQ(TrimToken("  cat \n"), "cat");
    EXPECT_EQ(TrimToken("   "), "");
    EXPECT_EQ(TrimToken("a b"), "a b");
}

TEST(TypesTest, EdgeBlockFlags) {
    EdgeBlock block;
    block.rows.emplace_back(1, 0, 10);
    EXPECT_FALSE(block.has_flags());
    block.rows.emplace_back(2, 0, 10, 0, std::optional<uint8_t>(3));
    EXPECT_TRUE(block.has_flags());
    EXPECT_EQ(block.count(), 2u);
}

} // namespace
} // namespace core
} // namespace kgraph
