#ifndef KGRAPH_STORAGE_BACKEND_FACTORY_H_
#define KGRAPH_STORAGE_BACKEND_FACTORY_H_

#include <memory>

#include "kgraph/core/config.h"
#include "kgraph/storage/backend.h"

namespace kgraph {
namespace storage {

/**
 * @brief Build and open the configured backend
 *
 * When a durable backend reports STORAGE_UNAVAILABLE and the config allows
 * it, a MemoryBackend is returned instead and a warning logged. The choice is
 * made here, once; a backend is never swapped after it is handed out.
 */
core::Result<std::shared_ptr<StorageBackend>> CreateBackend(const core::StorageConfig& config);

} // namespace storage
} // namespace kgraph

#endif // KGRAPH_STORAGE_BACKEND_FACTORY_H_
