#ifndef KGRAPH_STORAGE_EDGE_CODEC_H_
#define KGRAPH_STORAGE_EDGE_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "kgraph/core/config.h"
#include "kgraph/core/result.h"
#include "kgraph/core/types.h"

namespace kgraph {
namespace storage {

/**
 * @brief Encodes and decodes one EdgeBlock
 *
 * Plain layout:
 *   u32 LE header length H
 *   H bytes of JSON {"v":1,"tokenId":..,"part":..,"count":..,"cols":[..]}
 *   neighbor u32[count] | type u16[count] | weight u32[count] |
 *   lastSeen u32[count] | flags u8[count] (only when "flags" is listed)
 * All integers little-endian.
 */
class EdgeBlockCodec {
public:
    virtual ~EdgeBlockCodec() = default;

    virtual core::Result<std::vector<uint8_t>> encode(const core::EdgeBlock& block) const = 0;

    /**
     * @brief Decode bytes into a block
     * @return ENCODING_ERROR for malformed or truncated input
     */
    virtual core::Result<core::EdgeBlock> decode(const std::vector<uint8_t>& bytes) const = 0;

    virtual std::string name() const = 0;
    virtual bool is_compressed() const = 0;
};

/**
 * @brief Uncompressed layout
 *
 * When snappy is compiled in, decode() also accepts compressed blocks, so a
 * store written with compression stays readable after it is turned off.
 */
class RawCodec : public EdgeBlockCodec {
public:
    core::Result<std::vector<uint8_t>> encode(const core::EdgeBlock& block) const override;
    core::Result<core::EdgeBlock> decode(const std::vector<uint8_t>& bytes) const override;
    std::string name() const override { return "raw"; }
    bool is_compressed() const override { return false; }
};

#ifdef HAVE_SNAPPY
/**
 * @brief Plain layout passed through snappy
 *
 * decode() tries decompression first and falls back to the plain layout, so
 * blocks written before compression was available stay readable.
 */
class CompressedCodec : public EdgeBlockCodec {
public:
    core::Result<std::vector<uint8_t>> encode(const core::EdgeBlock& block) const override;
    core::Result<core::EdgeBlock> decode(const std::vector<uint8_t>& bytes) const override;
    std::string name() const override { return "snappy"; }
    bool is_compressed() const override { return true; }
};
#endif

/**
 * @brief Serialize a block in the plain layout
 */
core::Result<std::vector<uint8_t>> EncodeEdgeBlock(const core::EdgeBlock& block);

/**
 * @brief Parse the plain layout; never reads past data + size
 */
core::Result<core::EdgeBlock> DecodeEdgeBlock(const uint8_t* data, size_t size);

/// Bytes taken by the columns of a block of `count` rows.
size_t ColumnBytes(size_t count, bool has_flags);

/// Upper bound of the plain encoding of a block of `count` rows.
size_t EncodedSizeHint(size_t count, bool has_flags);

/// True when this build can produce compressed blocks.
bool CompressionAvailable();

/**
 * @brief Pick a codec once, by capability probe
 *
 * Returns the compressed codec only when preferred, compiled in, and a probe
 * block survives a round trip through it; otherwise RawCodec.
 */
std::unique_ptr<EdgeBlockCodec> CreateEdgeCodec(const core::CodecConfig& config = core::CodecConfig::Default());

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_EDGE_CODEC_H_
