#include "kgraph/storage/backend_factory.h"

#include "kgraph/common/logger.h"
#include "kgraph/storage/file_backend.h"
#include "kgraph/storage/memory_backend.h"

namespace kgraph {
namespace storage {

using BackendResult = core::Result<std::shared_ptr<StorageBackend>>;

namespace {

BackendResult OpenMemory() {
    auto backend = std::make_shared<MemoryBackend>();
    auto result = backend->open();
    if (!result.ok()) {
        return core::propagate<std::shared_ptr<StorageBackend>>(result);
    }
    return BackendResult(std::shared_ptr<StorageBackend>(std::move(backend)));
}

} // namespace

BackendResult CreateBackend(const core::StorageConfig& config) {
    if (config.backend == core::BackendType::MEMORY) {
        return OpenMemory();
    }

    auto backend = std::make_shared<FileBackend>(config.data_dir, config.hash_prefix_nibbles);
    auto result = backend->open();
    if (result.ok()) {
        KGRAPH_INFO("Using file backend at {}", config.data_dir);
        return BackendResult(std::shared_ptr<StorageBackend>(std::move(backend)));
    }

    if (result.code() == core::Error::Code::STORAGE_UNAVAILABLE && config.degrade_to_memory) {
        KGRAPH_WARN("Durable storage unavailable ({}); continuing with in-memory storage, "
                    "data will not survive restart", result.error());
        return OpenMemory();
    }
    return core::propagate<std::shared_ptr<StorageBackend>>(result);
}

} // namespace storage
} // namespace kgraph
