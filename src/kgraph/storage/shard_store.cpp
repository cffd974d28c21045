#include "kgraph/storage/shard_store.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdlib>
#include <map>

#include "kgraph/common/logger.h"

namespace kgraph {
namespace storage {

namespace {

const char* const kSchemaVersionKey = "schemaVersion";

Bytes ToBytes(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string BlockPrefix(core::TokenId token_id) {
    return std::to_string(token_id) + ":";
}

bool TypeMatches(const AdjQuery& query, uint16_t type) {
    return query.types.empty() ||
           std::find(query.types.begin(), query.types.end(), type) != query.types.end();
}

bool RowMatches(const AdjQuery& query, const core::EdgeRow& row) {
    if (!TypeMatches(query, row.type)) return false;
    if (query.min_weight && row.weight < *query.min_weight) return false;
    return true;
}

void SortByWeight(std::vector<core::EdgeRow>& rows) {
    std::stable_sort(rows.begin(), rows.end(),
                     [](const core::EdgeRow& a, const core::EdgeRow& b) { return a.weight > b.weight; });
}

uint64_t MergeKey(const core::EdgeRow& row) {
    return (static_cast<uint64_t>(row.neighbor_id) << 16) | row.type;
}

} // namespace

StoreObservers CombineObservers(std::vector<StoreObservers> sets) {
    auto shared = std::make_shared<std::vector<StoreObservers>>(std::move(sets));
    StoreObservers combined;
    combined.on_token_observed = [shared](core::TokenId id, const std::string& text) {
        for (const auto& obs : *shared) {
            if (obs.on_token_observed) obs.on_token_observed(id, text);
        }
    };
    combined.on_graph_updated = [shared](const std::vector<core::TokenId>& ids) {
        for (const auto& obs : *shared) {
            if (obs.on_graph_updated) obs.on_graph_updated(ids);
        }
    };
    combined.on_block_written = [shared](core::TokenId id, uint32_t part, const Bytes& bytes) {
        for (const auto& obs : *shared) {
            if (obs.on_block_written) obs.on_block_written(id, part, bytes);
        }
    };
    combined.on_block_removed = [shared](core::TokenId id, uint32_t part) {
        for (const auto& obs : *shared) {
            if (obs.on_block_removed) obs.on_block_removed(id, part);
        }
    };
    return combined;
}

ShardStore::ShardStore(std::shared_ptr<StorageBackend> backend,
                       std::shared_ptr<const EdgeBlockCodec> codec,
                       StoreObservers observers)
    : backend_(std::move(backend)),
      codec_(codec ? std::move(codec) : std::shared_ptr<const EdgeBlockCodec>(CreateEdgeCodec())),
      observers_(std::move(observers)) {}

core::Result<void> ShardStore::init() {
    if (initialized_.load()) {
        return core::Result<void>();
    }
    if (!backend_) {
        return core::Result<void>::error("ShardStore has no backend", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    auto opened = backend_->open();
    if (!opened.ok()) {
        return opened;
    }

    std::unordered_map<std::string, core::TokenId> ids;
    std::unordered_map<core::TokenId, std::string> texts;
    core::TokenId max_id = 0;
    auto scanned = backend_->scan(Bucket::TOKENS, "", [&](const std::string& key, const Bytes& value) {
        char* end = nullptr;
        unsigned long id = std::strtoul(key.c_str(), &end, 10);
        if (key.empty() || *end != '\0' || id == 0) {
            KGRAPH_WARN("Ignoring malformed token key '{}'", key);
            return true;
        }
        std::string text(value.begin(), value.end());
        ids[text] = static_cast<core::TokenId>(id);
        texts[static_cast<core::TokenId>(id)] = std::move(text);
        max_id = std::max(max_id, static_cast<core::TokenId>(id));
        return true;
    });
    if (!scanned.ok()) {
        return scanned;
    }

    auto version = backend_->put(Bucket::META, kSchemaVersionKey, ToBytes(std::to_string(core::kBlockVersion)));
    if (!version.ok()) {
        return version;
    }

    {
        std::unique_lock<std::shared_mutex> lock(tokens_mutex_);
        ids_by_text_ = std::move(ids);
        text_by_id_ = std::move(texts);
        next_id_ = max_id + 1;
    }
    initialized_.store(true);
    KGRAPH_INFO("Shard store ready: backend={} codec={} tokens={}",
                backend_->name(), codec_->name(), text_by_id_.size());
    return core::Result<void>();
}

core::Result<void> ShardStore::check_initialized() const {
    if (!initialized_.load()) {
        return core::Result<void>::error("ShardStore used before init()", core::Error::Code::NOT_INITIALIZED);
    }
    return core::Result<void>();
}

core::Result<core::TokenId> ShardStore::ensure_token(const std::string& text) {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<core::TokenId>(ready);

    std::string token = core::TrimToken(text);
    if (token.empty()) {
        return core::Result<core::TokenId>::error("Token text is empty", core::Error::Code::INVALID_ARGUMENT);
    }

    {
        std::shared_lock<std::shared_mutex> lock(tokens_mutex_);
        auto it = ids_by_text_.find(token);
        if (it != ids_by_text_.end()) {
            return core::Result<core::TokenId>(it->second);
        }
    }

    core::TokenId id = 0;
    {
        std::unique_lock<std::shared_mutex> lock(tokens_mutex_);
        auto it = ids_by_text_.find(token);
        if (it != ids_by_text_.end()) {
            return core::Result<core::TokenId>(it->second);
        }
        id = next_id_;
        auto stored = backend_->put(Bucket::TOKENS, std::to_string(id), ToBytes(token));
        if (!stored.ok()) {
            return core::propagate<core::TokenId>(stored);
        }
        ++next_id_;
        ids_by_text_[token] = id;
        text_by_id_[id] = token;
    }

    if (observers_.on_token_observed) {
        observers_.on_token_observed(id, token);
    }
    return core::Result<core::TokenId>(id);
}

core::Result<std::string> ShardStore::get_token(core::TokenId id) {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<std::string>(ready);

    std::shared_lock<std::shared_mutex> lock(tokens_mutex_);
    auto it = text_by_id_.find(id);
    return core::Result<std::string>(it == text_by_id_.end() ? std::string() : it->second);
}

core::Result<std::optional<core::TokenId>> ShardStore::find_token(const std::string& text) {
    using FindResult = core::Result<std::optional<core::TokenId>>;
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<std::optional<core::TokenId>>(ready);

    std::shared_lock<std::shared_mutex> lock(tokens_mutex_);
    auto it = ids_by_text_.find(core::TrimToken(text));
    if (it == ids_by_text_.end()) {
        return FindResult(std::nullopt);
    }
    return FindResult(std::make_optional(it->second));
}

core::Result<std::vector<ShardStore::StoredBlock>> ShardStore::read_blocks(core::TokenId token_id) {
    std::vector<StoredBlock> blocks;
    auto scanned = backend_->scan(Bucket::EDGE_BLOCKS, BlockPrefix(token_id),
                                  [&blocks](const std::string& key, const Bytes& value) {
        auto parsed = core::ParseBlockKey(key);
        if (parsed) {
            blocks.push_back(StoredBlock{parsed->second, value});
        }
        return true;
    });
    if (!scanned.ok()) {
        return core::propagate<std::vector<StoredBlock>>(scanned);
    }
    std::sort(blocks.begin(), blocks.end(),
              [](const StoredBlock& a, const StoredBlock& b) { return a.part < b.part; });
    return core::Result<std::vector<StoredBlock>>(std::move(blocks));
}

core::Result<std::vector<core::EdgeRow>> ShardStore::load_rows(core::TokenId token_id,
                                                              std::vector<uint32_t>* parts,
                                                              size_t* unreadable) {
    auto blocks = read_blocks(token_id);
    if (!blocks.ok()) {
        return core::propagate<std::vector<core::EdgeRow>>(blocks);
    }
    std::vector<core::EdgeRow> rows;
    for (const auto& stored : blocks.value()) {
        if (parts) parts->push_back(stored.part);
        auto block = codec_->decode(stored.bytes);
        if (!block.ok()) {
            KGRAPH_WARN("Skipping unreadable block {}: {} (recreate the token to replace it)",
                        core::BlockKey(token_id, stored.part), block.error());
            if (unreadable) ++*unreadable;
            continue;
        }
        auto& block_rows = block.value().rows;
        rows.insert(rows.end(), block_rows.begin(), block_rows.end());
    }
    return core::Result<std::vector<core::EdgeRow>>(std::move(rows));
}

core::Result<std::vector<core::EdgeRow>> ShardStore::get_adj(const AdjQuery& query) {
    using RowsResult = core::Result<std::vector<core::EdgeRow>>;
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<std::vector<core::EdgeRow>>(ready);

    if (query.limit && *query.limit == 0) {
        return RowsResult(std::vector<core::EdgeRow>());
    }

    std::vector<core::EdgeRow> out;
    if (!query.reverse) {
        auto rows = load_rows(query.token_id, nullptr, nullptr);
        if (!rows.ok()) return rows;
        for (const auto& row : rows.value()) {
            if (RowMatches(query, row)) out.push_back(row);
        }
        SortByWeight(out);
        if (query.limit && out.size() > *query.limit) {
            out.resize(*query.limit);
        }
        return RowsResult(std::move(out));
    }

    // Reverse lookup: no secondary index, every block is visited until the
    // limit is met.
    auto scanned = backend_->scan(Bucket::EDGE_BLOCKS, "", [&](const std::string& key, const Bytes& value) {
        auto block = codec_->decode(value);
        if (!block.ok()) {
            KGRAPH_WARN("Skipping unreadable block {}: {}", key, block.error());
            return true;
        }
        for (const auto& row : block.value().rows) {
            if (row.neighbor_id != query.token_id || !RowMatches(query, row)) continue;
            out.emplace_back(block.value().token_id, row.type, row.weight, row.last_seen, row.flags);
            if (query.limit && out.size() >= *query.limit) {
                return false;
            }
        }
        return true;
    });
    if (!scanned.ok()) {
        return core::propagate<std::vector<core::EdgeRow>>(scanned);
    }
    SortByWeight(out);
    return RowsResult(std::move(out));
}

std::vector<core::EdgeBlock> ShardStore::Reshard(core::TokenId token_id,
                                                 const std::vector<core::EdgeRow>& rows) {
    const size_t n = rows.size();
    const size_t parts = std::max<size_t>(1, (n + core::kBlockMax - 1) / core::kBlockMax);
    std::vector<core::EdgeBlock> blocks(parts);
    for (size_t part = 0; part < parts; ++part) {
        auto& block = blocks[part];
        block.token_id = token_id;
        block.part = static_cast<uint32_t>(part);
        const size_t begin = part * core::kBlockMax;
        const size_t end = std::min(n, begin + core::kBlockMax);
        if (begin < end) {
            block.rows.assign(rows.begin() + static_cast<std::ptrdiff_t>(begin),
                              rows.begin() + static_cast<std::ptrdiff_t>(end));
        }
    }
    return blocks;
}

core::Result<void> ShardStore::write_rows(core::TokenId token_id,
                                          const std::vector<core::EdgeRow>& rows,
                                          const std::vector<uint32_t>& existing_parts) {
    auto blocks = Reshard(token_id, rows);

    WriteBatch batch;
    std::vector<std::pair<uint32_t, Bytes>> written;
    written.reserve(blocks.size());
    for (const auto& block : blocks) {
        auto encoded = codec_->encode(block);
        if (!encoded.ok()) {
            return core::propagate<void>(encoded);
        }
        batch.put(Bucket::EDGE_BLOCKS, core::BlockKey(token_id, block.part), encoded.value());
        written.emplace_back(block.part, encoded.take_value());
    }
    std::vector<uint32_t> removed;
    for (uint32_t part : existing_parts) {
        if (part >= blocks.size()) {
            batch.remove(Bucket::EDGE_BLOCKS, core::BlockKey(token_id, part));
            removed.push_back(part);
        }
    }

    auto applied = backend_->apply(batch);
    if (!applied.ok()) {
        return applied;
    }

    if (observers_.on_block_written) {
        for (const auto& entry : written) observers_.on_block_written(token_id, entry.first, entry.second);
    }
    if (observers_.on_block_removed) {
        for (uint32_t part : removed) observers_.on_block_removed(token_id, part);
    }
    return core::Result<void>();
}

core::Result<void> ShardStore::upsert_adj(core::TokenId token_id,
                                          const std::vector<core::EdgeRow>& edges,
                                          UpsertOptions options) {
    auto ready = check_initialized();
    if (!ready.ok()) return ready;

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        std::vector<uint32_t> existing_parts;
        size_t unreadable = 0;
        auto existing = load_rows(token_id, &existing_parts, &unreadable);
        if (!existing.ok()) {
            return core::propagate<void>(existing);
        }
        // Merging would rewrite the parts that failed to decode and lose their rows.
        if (options.merge && unreadable > 0) {
            return core::Result<void>::error(
                "Token " + std::to_string(token_id) + " has " + std::to_string(unreadable) +
                    " unreadable blocks; merge refused",
                core::Error::Code::ENCODING_ERROR);
        }

        std::vector<core::EdgeRow> rows;
        if (options.merge) {
            rows = existing.take_value();
            std::unordered_map<uint64_t, size_t> index;
            index.reserve(rows.size() + edges.size());
            for (size_t i = 0; i < rows.size(); ++i) {
                index[MergeKey(rows[i])] = i;
            }
            for (const auto& incoming : edges) {
                auto it = index.find(MergeKey(incoming));
                if (it == index.end()) {
                    index[MergeKey(incoming)] = rows.size();
                    rows.push_back(incoming);
                    continue;
                }
                core::EdgeRow& target = rows[it->second];
                std::optional<uint8_t> kept_flags = target.flags;
                target = incoming;
                if (!incoming.flags) target.flags = kept_flags;
            }
        } else {
            rows = edges;
        }

        auto written = write_rows(token_id, rows, existing_parts);
        if (!written.ok()) {
            return written;
        }
    }

    if (observers_.on_graph_updated) {
        observers_.on_graph_updated(std::vector<core::TokenId>{token_id});
    }
    return core::Result<void>();
}

core::Result<ImportReport> ShardStore::bulk_import(const ImportSource& source) {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<ImportReport>(ready);

    ImportReport report;
    while (true) {
        std::optional<ImportItem> item = source();
        if (!item) break;

        std::optional<core::TokenId> id = item->token_id;
        if (!id && item->token) {
            auto ensured = ensure_token(*item->token);
            if (ensured.ok()) {
                id = ensured.value();
            } else if (ensured.code() != core::Error::Code::INVALID_ARGUMENT) {
                return core::propagate<ImportReport>(ensured);
            }
        }
        if (!id || *id == 0) {
            ++report.skipped;
            continue;
        }

        UpsertOptions options;
        options.merge = true;
        auto upserted = upsert_adj(*id, item->edges, options);
        if (!upserted.ok()) {
            return core::propagate<ImportReport>(upserted);
        }
        ++report.imported;
    }
    KGRAPH_INFO("Bulk import finished: {} imported, {} skipped", report.imported, report.skipped);
    return core::Result<ImportReport>(report);
}

core::Result<ImportReport> ShardStore::bulk_import(const std::vector<ImportItem>& items) {
    size_t next = 0;
    return bulk_import([&items, &next]() -> std::optional<ImportItem> {
        if (next >= items.size()) return std::nullopt;
        return items[next++];
    });
}

core::Result<StoreStats> ShardStore::stats() {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<StoreStats>(ready);

    StoreStats stats;
    {
        std::shared_lock<std::shared_mutex> lock(tokens_mutex_);
        stats.tokens = text_by_id_.size();
    }
    auto scanned = backend_->scan(Bucket::EDGE_BLOCKS, "", [&](const std::string& key, const Bytes& value) {
        ++stats.shards;
        stats.size_bytes += value.size();
        auto block = codec_->decode(value);
        if (block.ok()) {
            stats.edges += block.value().count();
        } else {
            KGRAPH_DEBUG("stats: unreadable block {}", key);
        }
        return true;
    });
    if (!scanned.ok()) {
        return core::propagate<StoreStats>(scanned);
    }
    return core::Result<StoreStats>(stats);
}

core::Result<size_t> ShardStore::compact() {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<size_t>(ready);

    std::lock_guard<std::mutex> lock(write_mutex_);
    WriteBatch batch;
    size_t unreadable = 0;
    auto scanned = backend_->scan(Bucket::EDGE_BLOCKS, "", [&](const std::string& key, const Bytes& value) {
        auto block = codec_->decode(value);
        if (!block.ok()) {
            ++unreadable;
            KGRAPH_WARN("compact: leaving unreadable block {} in place", key);
            return true;
        }
        auto encoded = codec_->encode(block.value());
        if (encoded.ok()) {
            batch.put(Bucket::EDGE_BLOCKS, key, encoded.take_value());
        }
        return true;
    });
    if (!scanned.ok()) {
        return core::propagate<size_t>(scanned);
    }
    auto applied = backend_->apply(batch);
    if (!applied.ok()) {
        return core::propagate<size_t>(applied);
    }
    KGRAPH_INFO("Compacted {} blocks with codec {} ({} unreadable)", batch.size(), codec_->name(), unreadable);
    return core::Result<size_t>(batch.size());
}

core::Result<GcReport> ShardStore::gc() {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<GcReport>(ready);

    GcReport report;
    std::vector<std::pair<core::TokenId, uint32_t>> removed;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        WriteBatch batch;
        auto scanned = backend_->scan(Bucket::EDGE_BLOCKS, "", [&](const std::string& key, const Bytes& value) {
            auto block = codec_->decode(value);
            if (!block.ok()) {
                KGRAPH_WARN("gc: leaving unreadable block {} in place: {}", key, block.error());
                ++report.unreadable;
                return true;
            }
            if (block.value().count() == 0) {
                batch.remove(Bucket::EDGE_BLOCKS, key);
                ++report.removed_empty;
                removed.emplace_back(block.value().token_id, block.value().part);
                return true;
            }
            auto encoded = codec_->encode(block.value());
            if (encoded.ok()) {
                batch.put(Bucket::EDGE_BLOCKS, key, encoded.take_value());
                ++report.rewritten;
            }
            return true;
        });
        if (!scanned.ok()) {
            return core::propagate<GcReport>(scanned);
        }
        auto applied = backend_->apply(batch);
        if (!applied.ok()) {
            return core::propagate<GcReport>(applied);
        }
    }

    if (observers_.on_block_removed) {
        for (const auto& key : removed) observers_.on_block_removed(key.first, key.second);
    }
    KGRAPH_INFO("gc: removed {} empty blocks, rewrote {}, {} unreadable",
                report.removed_empty, report.rewritten, report.unreadable);
    return core::Result<GcReport>(report);
}

bool ShardStore::ShouldTrim(const core::EdgeRow& row, int64_t now_seconds,
                            const core::GcPolicy& policy) {
    const double age_seconds = std::max<double>(0.0, static_cast<double>(now_seconds) - row.last_seen);
    const double age_days = age_seconds / 86400.0;
    const double effective = row.weight * std::exp(-policy.lambda_per_day * age_days);
    return effective < policy.w_min ||
           (age_days > policy.age_max_days && row.weight < policy.w_old_min);
}

core::Result<TrimReport> ShardStore::trim(const core::GcPolicy& policy, int64_t now_seconds) {
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<TrimReport>(ready);

    std::map<core::TokenId, std::vector<uint32_t>> tokens;
    auto scanned = backend_->scan(Bucket::EDGE_BLOCKS, "", [&tokens](const std::string& key, const Bytes&) {
        if (auto parsed = core::ParseBlockKey(key)) {
            tokens[parsed->first].push_back(parsed->second);
        }
        return true;
    });
    if (!scanned.ok()) {
        return core::propagate<TrimReport>(scanned);
    }

    TrimReport report;
    std::vector<core::TokenId> touched;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        for (const auto& entry : tokens) {
            std::vector<uint32_t> parts;
            size_t unreadable = 0;
            auto rows = load_rows(entry.first, &parts, &unreadable);
            if (!rows.ok()) {
                return core::propagate<TrimReport>(rows);
            }
            if (unreadable > 0) {
                KGRAPH_WARN("trim: skipping token {} with {} unreadable blocks", entry.first, unreadable);
                ++report.tokens_skipped;
                continue;
            }
            std::vector<core::EdgeRow> kept;
            kept.reserve(rows.value().size());
            for (const auto& row : rows.value()) {
                if (!ShouldTrim(row, now_seconds, policy)) kept.push_back(row);
            }
            if (kept.size() == rows.value().size()) continue;

            report.rows_removed += rows.value().size() - kept.size();
            ++report.tokens_touched;
            auto written = write_rows(entry.first, kept, parts);
            if (!written.ok()) {
                return core::propagate<TrimReport>(written);
            }
            touched.push_back(entry.first);
        }
    }

    if (!touched.empty() && observers_.on_graph_updated) {
        observers_.on_graph_updated(touched);
    }
    KGRAPH_INFO("trim: removed {} rows across {} tokens", report.rows_removed, report.tokens_touched);
    return core::Result<TrimReport>(report);
}

} // namespace storage
} // namespace kgraph
