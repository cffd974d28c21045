#ifndef KGRAPH_CORE_TYPES_H_
#define KGRAPH_CORE_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kgraph {
namespace core {

/**
 * @brief Dense, stable id assigned once per distinct normalized token
 */
using TokenId = uint32_t;

/// Maximum number of rows stored in a single edge block.
constexpr uint32_t kBlockMax = 50000;

/// Persisted block format version.
constexpr uint32_t kBlockVersion = 1;

/**
 * @brief One weighted, typed adjacency entry
 *
 * Rows are identified for merge purposes by (neighbor_id, type).
 */
struct EdgeRow {
    TokenId neighbor_id = 0;
    uint16_t type = 0;
    uint32_t weight = 0;     // fixed-point weight scale
    uint32_t last_seen = 0;  // epoch seconds
    std::optional<uint8_t> flags;

    EdgeRow() = default;
    EdgeRow(TokenId neighbor, uint16_t t, uint32_t w, uint32_t seen = 0,
            std::optional<uint8_t> f = std::nullopt)
        : neighbor_id(neighbor), type(t), weight(w), last_seen(seen), flags(f) {}

    bool operator==(const EdgeRow& other) const {
        return neighbor_id == other.neighbor_id && type == other.type &&
               weight == other.weight && last_seen == other.last_seen &&
               flags == other.flags;
    }
    bool operator!=(const EdgeRow& other) const { return !(*this == other); }
};

/**
 * @brief A shard of at most kBlockMax rows for one (token_id, part) key
 */
struct EdgeBlock {
    TokenId token_id = 0;
    uint32_t part = 0;
    std::vector<EdgeRow> rows;

    size_t count() const { return rows.size(); }

    /// True when any row carries a flags byte; the flags column is written then.
    bool has_flags() const {
        for (const auto& row : rows) {
            if (row.flags.has_value()) return true;
        }
        return false;
    }

    bool operator==(const EdgeBlock& other) const {
        return token_id == other.token_id && part == other.part && rows == other.rows;
    }
};

/**
 * @brief Storage key of a block: "<tokenId>:<part>"
 */
std::string BlockKey(TokenId token_id, uint32_t part);

/**
 * @brief Parse a block key; nullopt if malformed
 */
std::optional<std::pair<TokenId, uint32_t>> ParseBlockKey(const std::string& key);

/**
 * @brief First `nibbles` hex characters of the 8-digit zero padded id
 *
 * Used to fan out file-tree storage so no single directory grows unbounded.
 */
std::string HashPrefix(uint32_t id, int nibbles = 3);

/**
 * @brief Trim leading and trailing whitespace
 */
std::string TrimToken(const std::string& text);

using Vector = std::vector<float>;

struct ScoredId {
    TokenId id = 0;
    double score = 0.0;

    ScoredId() = default;
    ScoredId(TokenId i, double s) : id(i), score(s) {}
};

} // namespace core
} // namespace kgraph

#endif // KGRAPH_CORE_TYPES_H_
