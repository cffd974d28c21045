#include "kgraph/storage/edge_codec.h"

#include <cstring>
#include <limits>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#ifdef HAVE_SNAPPY
#include <snappy.h>
#endif

#include "kgraph/common/logger.h"

namespace kgraph {
namespace storage {

namespace {

const char* const kColumns[] = {"neighbor", "type", "weight", "lastSeen"};
const char* const kFlagsColumn = "flags";

using BlockResult = core::Result<core::EdgeBlock>;

BlockResult Malformed(const std::string& why) {
    return BlockResult::error("Malformed edge block: " + why, core::Error::Code::ENCODING_ERROR);
}

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
}

void PutU32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xff));
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xff));
}

uint16_t GetU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t GetU32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

std::string BuildHeader(uint32_t token_id, uint32_t part, size_t count, bool has_flags) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    writer.StartObject();
    writer.Key("v");
    writer.Uint(core::kBlockVersion);
    writer.Key("tokenId");
    writer.Uint(token_id);
    writer.Key("part");
    writer.Uint(part);
    writer.Key("count");
    writer.Uint(static_cast<unsigned>(count));
    writer.Key("cols");
    writer.StartArray();
    for (const char* col : kColumns) {
        writer.String(col);
    }
    if (has_flags) {
        writer.String(kFlagsColumn);
    }
    writer.EndArray();
    writer.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

} // namespace

size_t ColumnBytes(size_t count, bool has_flags) {
    return count * (4 + 2 + 4 + 4) + (has_flags ? count : 0);
}

size_t EncodedSizeHint(size_t count, bool has_flags) {
    const uint32_t widest = std::numeric_limits<uint32_t>::max();
    return 4 + BuildHeader(widest, widest, count, has_flags).size() + ColumnBytes(count, has_flags);
}

core::Result<std::vector<uint8_t>> EncodeEdgeBlock(const core::EdgeBlock& block) {
    const size_t count = block.rows.size();
    if (count > core::kBlockMax) {
        return core::Result<std::vector<uint8_t>>::error(
            "Edge block of " + std::to_string(count) + " rows exceeds the block limit",
            core::Error::Code::INVALID_ARGUMENT);
    }

    // A flags column is all-or-nothing; rows without flags are stored as 0.
    const bool has_flags = block.has_flags();
    const std::string header = BuildHeader(block.token_id, block.part, count, has_flags);

    std::vector<uint8_t> out;
    out.reserve(4 + header.size() + ColumnBytes(count, has_flags));
    PutU32(out, static_cast<uint32_t>(header.size()));
    out.insert(out.end(), header.begin(), header.end());

    for (const auto& row : block.rows) PutU32(out, row.neighbor_id);
    for (const auto& row : block.rows) PutU16(out, row.type);
    for (const auto& row : block.rows) PutU32(out, row.weight);
    for (const auto& row : block.rows) PutU32(out, row.last_seen);
    if (has_flags) {
        for (const auto& row : block.rows) out.push_back(row.flags.value_or(0));
    }
    return core::Result<std::vector<uint8_t>>(std::move(out));
}

core::Result<core::EdgeBlock> DecodeEdgeBlock(const uint8_t* data, size_t size) {
    if (data == nullptr || size < 4) {
        return Malformed("missing header length");
    }
    const uint32_t header_len = GetU32(data);
    if (header_len == 0 || header_len > size - 4) {
        return Malformed("header length " + std::to_string(header_len) + " exceeds buffer");
    }

    rapidjson::Document header;
    header.Parse(reinterpret_cast<const char*>(data + 4), header_len);
    if (header.HasParseError() || !header.IsObject()) {
        return Malformed("header is not a JSON object");
    }

    auto uint_field = [&header](const char* key, uint32_t* out) {
        auto it = header.FindMember(key);
        if (it == header.MemberEnd() || !it->value.IsUint()) return false;
        *out = it->value.GetUint();
        return true;
    };

    uint32_t version = 0;
    uint32_t token_id = 0;
    uint32_t part = 0;
    uint32_t count = 0;
    if (!uint_field("v", &version) || !uint_field("tokenId", &token_id) ||
        !uint_field("part", &part) || !uint_field("count", &count)) {
        return Malformed("header is missing v/tokenId/part/count");
    }
    if (version != core::kBlockVersion) {
        return Malformed("unsupported version " + std::to_string(version));
    }
    if (count > core::kBlockMax) {
        return Malformed("count " + std::to_string(count) + " exceeds block limit");
    }

    auto cols = header.FindMember("cols");
    if (cols == header.MemberEnd() || !cols->value.IsArray()) {
        return Malformed("header is missing cols");
    }
    const auto& col_list = cols->value;
    const size_t n_base = sizeof(kColumns) / sizeof(kColumns[0]);
    if (col_list.Size() != n_base && col_list.Size() != n_base + 1) {
        return Malformed("unexpected column list");
    }
    for (rapidjson::SizeType i = 0; i < col_list.Size(); ++i) {
        const char* expected = i < n_base ? kColumns[i] : kFlagsColumn;
        if (!col_list[i].IsString() || std::strcmp(col_list[i].GetString(), expected) != 0) {
            return Malformed("unexpected column list");
        }
    }
    const bool has_flags = col_list.Size() == n_base + 1;

    const size_t remaining = size - 4 - header_len;
    const size_t needed = ColumnBytes(count, has_flags);
    if (remaining != needed) {
        return Malformed("declared count " + std::to_string(count) + " needs " +
                         std::to_string(needed) + " bytes, found " + std::to_string(remaining));
    }

    core::EdgeBlock block;
    block.token_id = token_id;
    block.part = part;
    block.rows.resize(count);

    const uint8_t* p = data + 4 + header_len;
    for (auto& row : block.rows) { row.neighbor_id = GetU32(p); p += 4; }
    for (auto& row : block.rows) { row.type = GetU16(p); p += 2; }
    for (auto& row : block.rows) { row.weight = GetU32(p); p += 4; }
    for (auto& row : block.rows) { row.last_seen = GetU32(p); p += 4; }
    if (has_flags) {
        for (auto& row : block.rows) { row.flags = *p; p += 1; }
    }
    return BlockResult(std::move(block));
}

core::Result<std::vector<uint8_t>> RawCodec::encode(const core::EdgeBlock& block) const {
    return EncodeEdgeBlock(block);
}

core::Result<core::EdgeBlock> RawCodec::decode(const std::vector<uint8_t>& bytes) const {
    auto block = DecodeEdgeBlock(bytes.data(), bytes.size());
#ifdef HAVE_SNAPPY
    if (!block.ok()) {
        // Written by CompressedCodec before compression was turned off.
        std::string uncompressed;
        if (snappy::Uncompress(reinterpret_cast<const char*>(bytes.data()), bytes.size(), &uncompressed)) {
            auto unpacked = DecodeEdgeBlock(reinterpret_cast<const uint8_t*>(uncompressed.data()),
                                            uncompressed.size());
            if (unpacked.ok()) {
                return unpacked;
            }
        }
    }
#endif
    return block;
}

#ifdef HAVE_SNAPPY
core::Result<std::vector<uint8_t>> CompressedCodec::encode(const core::EdgeBlock& block) const {
    auto plain = EncodeEdgeBlock(block);
    if (!plain.ok()) {
        return plain;
    }
    const auto& raw = plain.value();
    std::string compressed;
    snappy::Compress(reinterpret_cast<const char*>(raw.data()), raw.size(), &compressed);
    return core::Result<std::vector<uint8_t>>(std::vector<uint8_t>(compressed.begin(), compressed.end()));
}

core::Result<core::EdgeBlock> CompressedCodec::decode(const std::vector<uint8_t>& bytes) const {
    std::string uncompressed;
    const char* src = reinterpret_cast<const char*>(bytes.data());
    if (snappy::Uncompress(src, bytes.size(), &uncompressed)) {
        auto block = DecodeEdgeBlock(reinterpret_cast<const uint8_t*>(uncompressed.data()),
                                     uncompressed.size());
        if (block.ok()) {
            return block;
        }
    }
    return DecodeEdgeBlock(bytes.data(), bytes.size());
}
#endif

bool CompressionAvailable() {
#ifdef HAVE_SNAPPY
    return true;
#else
    return false;
#endif
}

std::unique_ptr<EdgeBlockCodec> CreateEdgeCodec(const core::CodecConfig& config) {
#ifdef HAVE_SNAPPY
    if (config.prefer_compression) {
        auto codec = std::make_unique<CompressedCodec>();
        core::EdgeBlock probe;
        probe.token_id = 1;
        probe.rows.emplace_back(2, 0, 500, 100);
        auto encoded = codec->encode(probe);
        if (encoded.ok()) {
            auto decoded = codec->decode(encoded.value());
            if (decoded.ok() && decoded.value() == probe) {
                KGRAPH_DEBUG("Edge blocks will be written with {}", codec->name());
                return codec;
            }
        }
        KGRAPH_WARN("Compression probe failed; edge blocks will be written uncompressed");
    }
#else
    if (config.prefer_compression) {
        KGRAPH_DEBUG("Built without snappy; edge blocks will be written uncompressed");
    }
#endif
    return std::make_unique<RawCodec>();
}

} // namespace storage
} // namespace kgraph
