#include "kgraph/vector/vector_store.h"

#include <algorithm>
#include <cstring>
#include <mutex>
#include <unordered_set>

#include "kgraph/common/logger.h"

namespace kgraph {
namespace vector {

namespace {

constexpr uint8_t kRecordMagic0 = 'K';
constexpr uint8_t kRecordMagic1 = 'V';
constexpr uint8_t kRecordVersion = 1;
constexpr uint8_t kKindRaw = 0;
constexpr uint8_t kKindQuantized = 1;
constexpr uint8_t kKindQuantizedOffset = 2;  // quantized with a non-zero offset

void PutU32(storage::Bytes& out, uint32_t v) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((v >> shift) & 0xff));
    }
}

void PutF32(storage::Bytes& out, float f) {
    uint32_t bits;
    std::memcpy(&bits, &f, sizeof(bits));
    PutU32(out, bits);
}

// Bounds-checked little-endian reader.
class Reader {
public:
    explicit Reader(const storage::Bytes& bytes) : data_(bytes) {}

    bool u8(uint8_t* out) {
        if (pos_ + 1 > data_.size()) return false;
        *out = data_[pos_++];
        return true;
    }

    bool u16(uint16_t* out) {
        if (pos_ + 2 > data_.size()) return false;
        *out = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return true;
    }

    bool u32(uint32_t* out) {
        if (pos_ + 4 > data_.size()) return false;
        *out = static_cast<uint32_t>(data_[pos_]) | (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
               (static_cast<uint32_t>(data_[pos_ + 2]) << 16) | (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return true;
    }

    bool f32(float* out) {
        uint32_t bits;
        if (!u32(&bits)) return false;
        std::memcpy(out, &bits, sizeof(bits));
        return true;
    }

    bool bytes(size_t n, std::string* out) {
        if (pos_ + n > data_.size()) return false;
        out->assign(reinterpret_cast<const char*>(data_.data() + pos_), n);
        pos_ += n;
        return true;
    }

    size_t remaining() const { return data_.size() - pos_; }
    const uint8_t* cursor() const { return data_.data() + pos_; }
    void skip(size_t n) { pos_ += n; }

private:
    const storage::Bytes& data_;
    size_t pos_ = 0;
};

core::Result<VectorRecord> Corrupt(const std::string& why) {
    return core::Result<VectorRecord>::error("Malformed vector record: " + why, core::Error::Code::ENCODING_ERROR);
}

} // namespace

storage::Bytes EncodeVectorRecord(const VectorRecord& record) {
    storage::Bytes out;
    out.push_back(kRecordMagic0);
    out.push_back(kRecordMagic1);
    out.push_back(kRecordVersion);
    const bool has_offset = record.quantized && record.quantized_values.offset != 0.0f;
    out.push_back(record.quantized ? (has_offset ? kKindQuantizedOffset : kKindQuantized) : kKindRaw);
    PutU32(out, record.dim);
    PutU32(out, record.id);
    const uint16_t provider_len = static_cast<uint16_t>(std::min<size_t>(record.provider.size(), 0xffff));
    out.push_back(static_cast<uint8_t>(provider_len & 0xff));
    out.push_back(static_cast<uint8_t>(provider_len >> 8));
    out.insert(out.end(), record.provider.begin(), record.provider.begin() + provider_len);

    if (record.quantized) {
        PutF32(out, record.quantized_values.scale);
        PutU32(out, static_cast<uint32_t>(record.quantized_values.zero));
        if (has_offset) {
            PutF32(out, record.quantized_values.offset);
        }
        PutU32(out, static_cast<uint32_t>(record.quantized_values.q.size()));
        out.insert(out.end(), record.quantized_values.q.begin(), record.quantized_values.q.end());
    } else {
        PutU32(out, static_cast<uint32_t>(record.values.size()));
        for (float v : record.values) PutF32(out, v);
    }
    return out;
}

core::Result<VectorRecord> DecodeVectorRecord(const storage::Bytes& bytes) {
    Reader in(bytes);
    uint8_t m0 = 0, m1 = 0, version = 0, kind = 0;
    if (!in.u8(&m0) || !in.u8(&m1) || m0 != kRecordMagic0 || m1 != kRecordMagic1) {
        return Corrupt("bad magic");
    }
    if (!in.u8(&version) || version != kRecordVersion) {
        return Corrupt("unsupported version");
    }
    if (!in.u8(&kind) || (kind != kKindRaw && kind != kKindQuantized && kind != kKindQuantizedOffset)) {
        return Corrupt("unknown kind");
    }

    VectorRecord record;
    uint16_t provider_len = 0;
    if (!in.u32(&record.dim) || !in.u32(&record.id) || !in.u16(&provider_len) ||
        !in.bytes(provider_len, &record.provider)) {
        return Corrupt("truncated header");
    }

    uint32_t count = 0;
    record.quantized = kind != kKindRaw;
    if (record.quantized) {
        uint32_t zero = 0;
        if (!in.f32(&record.quantized_values.scale) || !in.u32(&zero)) {
            return Corrupt("truncated quantization header");
        }
        if (kind == kKindQuantizedOffset && !in.f32(&record.quantized_values.offset)) {
            return Corrupt("truncated quantization header");
        }
        if (!in.u32(&count)) {
            return Corrupt("truncated quantization header");
        }
        record.quantized_values.zero = static_cast<int32_t>(zero);
        if (in.remaining() != count) {
            return Corrupt("declared length does not match payload");
        }
        record.quantized_values.q.assign(in.cursor(), in.cursor() + count);
        in.skip(count);
    } else {
        if (!in.u32(&count) || in.remaining() != static_cast<size_t>(count) * 4) {
            return Corrupt("declared length does not match payload");
        }
        record.values.resize(count);
        for (auto& v : record.values) in.f32(&v);
    }
    return core::Result<VectorRecord>(std::move(record));
}

VectorStore::VectorStore(std::shared_ptr<storage::StorageBackend> backend)
    : backend_(std::move(backend)) {
    index_ = std::make_unique<FlatVectorIndex>([this](const CandidateVisitor& visitor) {
        return scan(visitor);
    });
}

core::Result<void> VectorStore::init(const core::VectorConfig& config) {
    if (config.provider.empty()) {
        return core::Result<void>::error("Vector provider name is empty", core::Error::Code::INVALID_ARGUMENT);
    }
    if (config.dim == 0) {
        return core::Result<void>::error("Vector dimension must be positive", core::Error::Code::INVALID_ARGUMENT);
    }
    if (!backend_) {
        return core::Result<void>::error("VectorStore has no backend", core::Error::Code::STORAGE_UNAVAILABLE);
    }
    auto opened = backend_->open();
    if (!opened.ok()) {
        return opened;
    }
    config_ = config;
    clear_cache();
    initialized_.store(true);
    KGRAPH_INFO("Vector store ready: provider={} dim={} quantize8={} normalize={} index={}",
                config_.provider, config_.dim, config_.quantize8, config_.normalize, index_->name());
    return core::Result<void>();
}

core::Result<void> VectorStore::check_initialized() const {
    if (!initialized_.load()) {
        return core::Result<void>::error("VectorStore used before init()", core::Error::Code::NOT_INITIALIZED);
    }
    return core::Result<void>();
}

std::string VectorStore::key_prefix() const {
    return config_.provider + ":" + std::to_string(config_.dim) + ":";
}

std::string VectorStore::record_key(core::TokenId id) const {
    return key_prefix() + std::to_string(id);
}

core::Result<void> VectorStore::put(core::TokenId id, const core::Vector& values) {
    auto ready = check_initialized();
    if (!ready.ok()) return ready;

    if (values.size() != config_.dim) {
        return core::Result<void>::error(
            "Vector for token " + std::to_string(id) + " has " + std::to_string(values.size()) +
                " components, expected " + std::to_string(config_.dim),
            core::Error::Code::DIMENSION_MISMATCH);
    }

    VectorRecord record;
    record.provider = config_.provider;
    record.dim = config_.dim;
    record.id = id;
    core::Vector prepared = config_.normalize ? L2Normalize(values) : values;
    if (config_.quantize8) {
        record.quantized = true;
        record.quantized_values = Quantize8(prepared);
    } else {
        record.values = prepared;
    }

    const std::string key = record_key(id);
    auto stored = backend_->put(storage::Bucket::EMBEDDINGS, key, EncodeVectorRecord(record));
    if (!stored.ok()) {
        return stored;
    }

    // Cache what a later get() would read back.
    core::Vector cached = record.decode();
    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        cache_[key] = std::make_pair(id, cached);
    }
    index_->on_put(id, cached);
    return core::Result<void>();
}

core::Result<std::optional<core::Vector>> VectorStore::get(core::TokenId id) {
    using GetResult = core::Result<std::optional<core::Vector>>;
    auto ready = check_initialized();
    if (!ready.ok()) return core::propagate<std::optional<core::Vector>>(ready);

    const std::string key = record_key(id);
    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            return GetResult(std::make_optional(it->second.second));
        }
    }

    auto loaded = backend_->get(storage::Bucket::EMBEDDINGS, key);
    if (!loaded.ok()) {
        return core::propagate<std::optional<core::Vector>>(loaded);
    }
    if (!loaded.value()) {
        return GetResult(std::nullopt);
    }
    auto record = DecodeVectorRecord(*loaded.value());
    if (!record.ok()) {
        KGRAPH_WARN("Unreadable vector record {}: {}", key, record.error());
        return core::propagate<std::optional<core::Vector>>(record);
    }
    core::Vector values = record.value().decode();
    {
        std::unique_lock<std::shared_mutex> lock(cache_mutex_);
        cache_[key] = std::make_pair(id, values);
    }
    return GetResult(std::make_optional(std::move(values)));
}

core::Result<void> VectorStore::scan(const CandidateVisitor& visitor) {
    auto ready = check_initialized();
    if (!ready.ok()) return ready;

    std::unordered_set<std::string> seen;
    bool stopped = false;
    auto scanned = backend_->scan(storage::Bucket::EMBEDDINGS, key_prefix(),
                                  [&](const std::string& key, const storage::Bytes& bytes) {
        auto record = DecodeVectorRecord(bytes);
        if (!record.ok()) {
            KGRAPH_DEBUG("Skipping unreadable vector record {}", key);
            return true;
        }
        seen.insert(key);
        if (!visitor(record.value().id, record.value().decode())) {
            stopped = true;
            return false;
        }
        return true;
    });
    if (!scanned.ok() || stopped) {
        return scanned;
    }

    std::vector<std::pair<core::TokenId, core::Vector>> extra;
    {
        std::shared_lock<std::shared_mutex> lock(cache_mutex_);
        const std::string prefix = key_prefix();
        for (const auto& entry : cache_) {
            if (entry.first.compare(0, prefix.size(), prefix) == 0 && !seen.count(entry.first)) {
                extra.push_back(entry.second);
            }
        }
    }
    for (const auto& entry : extra) {
        if (!visitor(entry.first, entry.second)) break;
    }
    return core::Result<void>();
}

core::Result<std::vector<core::ScoredId>> VectorStore::similar(core::TokenId id, size_t top_k) {
    auto origin = get(id);
    if (!origin.ok()) {
        return core::propagate<std::vector<core::ScoredId>>(origin);
    }
    if (!origin.value()) {
        return core::Result<std::vector<core::ScoredId>>(std::vector<core::ScoredId>());
    }
    return index_->search(*origin.value(), top_k, id);
}

void VectorStore::set_index(std::unique_ptr<VectorIndex> index) {
    if (index) {
        index_ = std::move(index);
    }
}

size_t VectorStore::cache_size() const {
    std::shared_lock<std::shared_mutex> lock(cache_mutex_);
    return cache_.size();
}

void VectorStore::clear_cache() {
    std::unique_lock<std::shared_mutex> lock(cache_mutex_);
    cache_.clear();
}

} // namespace vector
} // namespace kgraph
