#include "kgraph/storage/memory_backend.h"

#include <mutex>
#include <vector>

namespace kgraph {
namespace storage {

core::Result<void> MemoryBackend::open() {
    return core::Result<void>();
}

core::Result<std::optional<Bytes>> MemoryBackend::get(Bucket bucket, const std::string& key) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const Table& t = table(bucket);
    auto it = t.find(key);
    if (it == t.end()) {
        return core::Result<std::optional<Bytes>>(std::nullopt);
    }
    return core::Result<std::optional<Bytes>>(std::make_optional(it->second));
}

core::Result<void> MemoryBackend::put(Bucket bucket, const std::string& key, const Bytes& value) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    table(bucket)[key] = value;
    return core::Result<void>();
}

core::Result<void> MemoryBackend::remove(Bucket bucket, const std::string& key) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    table(bucket).erase(key);
    return core::Result<void>();
}

core::Result<void> MemoryBackend::scan(Bucket bucket, const std::string& prefix,
                                       const ScanVisitor& visitor) {
    // Snapshot matching records so the visitor may call back into the backend.
    std::vector<std::pair<std::string, Bytes>> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        const Table& t = table(bucket);
        for (auto it = t.lower_bound(prefix); it != t.end(); ++it) {
            if (it->first.compare(0, prefix.size(), prefix) != 0) break;
            snapshot.emplace_back(it->first, it->second);
        }
    }
    for (const auto& entry : snapshot) {
        if (!visitor(entry.first, entry.second)) break;
    }
    return core::Result<void>();
}

core::Result<size_t> MemoryBackend::count(Bucket bucket) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return core::Result<size_t>(table(bucket).size());
}

core::Result<void> MemoryBackend::apply(const WriteBatch& batch) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& op : batch.ops()) {
        if (op.value) {
            table(op.bucket)[op.key] = *op.value;
        } else {
            table(op.bucket).erase(op.key);
        }
    }
    return core::Result<void>();
}

} // namespace storage
} // namespace kgraph
