#ifndef KGRAPH_STORAGE_MEMORY_BACKEND_H_
#define KGRAPH_STORAGE_MEMORY_BACKEND_H_

#include <map>
#include <shared_mutex>
#include <string>

#include "kgraph/storage/backend.h"

namespace kgraph {
namespace storage {

/**
 * @brief Process-lifetime backend with the full StorageBackend contract
 */
class MemoryBackend : public StorageBackend {
public:
    MemoryBackend() = default;

    core::Result<void> open() override;
    core::Result<std::optional<Bytes>> get(Bucket bucket, const std::string& key) override;
    core::Result<void> put(Bucket bucket, const std::string& key, const Bytes& value) override;
    core::Result<void> remove(Bucket bucket, const std::string& key) override;
    core::Result<void> scan(Bucket bucket, const std::string& prefix,
                            const ScanVisitor& visitor) override;
    core::Result<size_t> count(Bucket bucket) override;
    core::Result<void> apply(const WriteBatch& batch) override;

    std::string name() const override { return "memory"; }
    bool durable() const override { return false; }

private:
    using Table = std::map<std::string, Bytes>;

    Table& table(Bucket bucket) { return tables_[static_cast<size_t>(bucket)]; }

    mutable std::shared_mutex mutex_;
    Table tables_[4];
};

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_MEMORY_BACKEND_H_
