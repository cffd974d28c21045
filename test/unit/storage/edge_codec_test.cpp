#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "kgraph/storage/edge_codec.h"

namespace kgraph {
namespace storage {
namespace {

core::EdgeBlock MakeBlock(core::TokenId token, uint32_t part, size_t rows, bool flags) {
    core::EdgeBlock block;
    block.token_id = token;
    block.part = part;
    for (size_t i = 0; i < rows; ++i) {
        std::optional<uint8_t> f;
        if (flags) f = static_cast<uint8_t>(i % 7);
        block.rows.emplace_back(static_cast<core::TokenId>(1000 + i), static_cast<uint16_t>(i % 3),
                                static_cast<uint32_t>(i * 13), static_cast<uint32_t>(1700000000 + i), f);
    }
    return block;
}

class EdgeCodecTest : public ::testing::Test {
protected:
    void SetUp() override {
        codec_ = CreateEdgeCodec();
    }

    std::unique_ptr<EdgeBlockCodec> codec_;
};

TEST_F(EdgeCodecTest, RoundTripWithoutFlags) {
    auto block = MakeBlock(7, 0, 250, false);
    auto encoded = codec_->encode(block);
    ASSERT_TRUE(encoded.ok()) << encoded.error();
    auto decoded = codec_->decode(encoded.value());
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), block);
    EXPECT_FALSE(decoded.value().has_flags());
}

TEST_F(EdgeCodecTest, RoundTripWithFlags) {
    auto block = MakeBlock(7, 2, 31, true);
    auto encoded = codec_->encode(block);
    ASSERT_TRUE(encoded.ok());
    auto decoded = codec_->decode(encoded.value());
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), block);
}

TEST_F(EdgeCodecTest, EmptyAndFullBlocks) {
    for (size_t n : {size_t{0}, size_t{1}, static_cast<size_t>(core::kBlockMax)}) {
        auto block = MakeBlock(3, 1, n, false);
        auto encoded = codec_->encode(block);
        ASSERT_TRUE(encoded.ok()) << "rows=" << n;
        auto decoded = codec_->decode(encoded.value());
        ASSERT_TRUE(decoded.ok()) << "rows=" << n << ": " << decoded.error();
        EXPECT_EQ(decoded.value().count(), n);
        EXPECT_EQ(decoded.value(), block);
    }
}

TEST_F(EdgeCodecTest, MixedFlagsStoredAsZero) {
    core::EdgeBlock block;
    block.token_id = 1;
    block.rows.emplace_back(2, 0, 5, 0, std::optional<uint8_t>(4));
    block.rows.emplace_back(3, 0, 6);
    auto decoded = RawCodec().decode(EncodeEdgeBlock(block).value());
    ASSERT_TRUE(decoded.ok());
    ASSERT_TRUE(decoded.value().rows[1].flags.has_value());
    EXPECT_EQ(*decoded.value().rows[1].flags, 0);
}

TEST_F(EdgeCodecTest, OversizedBlockRejected) {
    auto block = MakeBlock(1, 0, core::kBlockMax + 1, false);
    auto encoded = EncodeEdgeBlock(block);
    ASSERT_FALSE(encoded.ok());
    EXPECT_EQ(encoded.code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST(EdgeBlockFormatTest, HeaderIsJsonAfterLengthPrefix) {
    auto block = MakeBlock(12, 4, 2, false);
    auto bytes = EncodeEdgeBlock(block).value();
    uint32_t len = bytes[0] | (bytes[1] << 8) | (bytes[2] << 16) | (static_cast<uint32_t>(bytes[3]) << 24);
    std::string header(bytes.begin() + 4, bytes.begin() + 4 + len);
    EXPECT_NE(header.find("\"v\":1"), std::string::npos);
    EXPECT_NE(header.find("\"tokenId\":12"), std::string::npos);
    EXPECT_NE(header.find("\"count\":2"), std::string::npos);
    EXPECT_EQ(bytes.size(), 4 + len + ColumnBytes(2, false));
}

TEST(EdgeBlockFormatTest, TruncatedColumnsRejected) {
    auto bytes = EncodeEdgeBlock(MakeBlock(1, 0, 10, false)).value();
    bytes.pop_back();
    auto decoded = DecodeEdgeBlock(bytes.data(), bytes.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), core::Error::Code::ENCODING_ERROR);
}

TEST(EdgeBlockFormatTest, TrailingBytesRejected) {
    auto bytes = EncodeEdgeBlock(MakeBlock(1, 0, 10, false)).value();
    bytes.push_back(0);
    EXPECT_FALSE(DecodeEdgeBlock(bytes.data(), bytes.size()).ok());
}

TEST(EdgeBlockFormatTest, GarbageRejected) {
    std::vector<uint8_t> garbage = {0xff, 0xff, 0xff, 0x7f, 'x'};
    auto decoded = DecodeEdgeBlock(garbage.data(), garbage.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_EQ(decoded.code(), core::Error::Code::ENCODING_ERROR);
    EXPECT_FALSE(DecodeEdgeBlock(nullptr, 0).ok());
}

TEST(EdgeBlockFormatTest, WrongVersionRejected) {
    const std::string header = R"({"v":2,"tokenId":1,"part":0,"count":0,"cols":["neighbor","type","weight","lastSeen"]})";
    std::vector<uint8_t> bytes = {static_cast<uint8_t>(header.size()), 0, 0, 0};
    bytes.insert(bytes.end(), header.begin(), header.end());
    auto decoded = DecodeEdgeBlock(bytes.data(), bytes.size());
    ASSERT_FALSE(decoded.ok());
    EXPECT_NE(decoded.error().find("version"), std::string::npos);
}

TEST(EdgeBlockFormatTest, CountAboveLimitRejected) {
    const std::string header = R"({"v":1,"tokenId":1,"part":0,"count":50001,"cols":["neighbor","type","weight","lastSeen"]})";
    std::vector<uint8_t> bytes = {static_cast<uint8_t>(header.size()), 0, 0, 0};
    bytes.insert(bytes.end(), header.begin(), header.end());
    bytes.resize(bytes.size() + ColumnBytes(50001, false));
    EXPECT_FALSE(DecodeEdgeBlock(bytes.data(), bytes.size()).ok());
}

TEST(EdgeCodecFactoryTest, PreferenceHonoredWhenAvailable) {
    core::CodecConfig raw;
    raw.prefer_compression = false;
    EXPECT_FALSE(CreateEdgeCodec(raw)->is_compressed());
    EXPECT_EQ(CreateEdgeCodec()->is_compressed(), CompressionAvailable());
}

TEST(EdgeCodecSizeTest, HintBoundsPlainEncoding) {
    for (bool flags : {false, true}) {
        auto block = MakeBlock(4000000000u, 12, 300, flags);
        auto encoded = EncodeEdgeBlock(block);
        ASSERT_TRUE(encoded.ok());
        EXPECT_GE(EncodedSizeHint(300, flags), encoded.value().size());
        EXPECT_LE(EncodedSizeHint(300, flags), encoded.value().size() + 16);
    }
    EXPECT_EQ(EncodedSizeHint(11, true) - EncodedSizeHint(10, true), 15u);
}

TEST(EdgeCodecFactoryTest, CompressedCodecReadsRawBlocks) {
    auto block = MakeBlock(9, 0, 40, false);
    auto raw_bytes = RawCodec().encode(block).value();
    auto decoded = CreateEdgeCodec()->decode(raw_bytes);
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), block);
}

TEST(EdgeCodecFactoryTest, UncompressedCodecReadsBlocksFromEitherCodec) {
    core::CodecConfig raw;
    raw.prefer_compression = false;
    auto reader = CreateEdgeCodec(raw);
    auto block = MakeBlock(11, 2, 120, true);
    // Whatever the default writer produces must stay readable with compression off.
    auto written = CreateEdgeCodec()->encode(block);
    ASSERT_TRUE(written.ok());
    auto decoded = reader->decode(written.value());
    ASSERT_TRUE(decoded.ok()) << decoded.error();
    EXPECT_EQ(decoded.value(), block);
}

} // namespace
} // namespace storage
} // namespace kgraph
